#include "io.hpp"
#include "log.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace ewas {

// ------------------ text helpers ------------------

bool ieq(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}

std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
  std::string out = s.substr(i, j - i);
  if (out.size() >= 2 && out.front() == '"' && out.back() == '"') out = out.substr(1, out.size() - 2);
  return out;
}

std::vector<std::string> split_simple(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim)   { out.push_back(cur); cur.clear(); }
    else if (c != '\r') cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

char detect_delimiter(const std::string& header_line) {
  return header_line.find('\t') != std::string::npos ? '\t' : ',';
}

bool is_missing(const std::string& s) {
  return s.empty() || s == "NA" || s == "NaN" || s == "nan" || s == "NULL";
}

bool looks_numeric(const std::string& s) {
  if (is_missing(s)) return true;
  char* e = nullptr;
  std::strtod(s.c_str(), &e);
  return e && *e == '\0';
}

double parse_double(const std::string& s) {
  if (is_missing(s)) return std::numeric_limits<double>::quiet_NaN();
  char* e = nullptr;
  const double v = std::strtod(s.c_str(), &e);
  if (!e || *e != '\0') throw std::runtime_error("Not a number: '" + s + "'");
  return v;
}

void ensure_parent_dir(const std::string& path) {
  fs::path p(path);
  auto dir = p.parent_path();
  if (!dir.empty()) fs::create_directories(dir);
}

// ------------------ methylation matrix ------------------

MethylationMatrix read_methylation_matrix(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open methylation matrix: " + path);

  std::string line;
  if (!std::getline(in, line)) throw std::runtime_error("Empty methylation matrix: " + path);
  const char delim = detect_delimiter(line);
  std::vector<std::string> header = split_simple(line, delim);
  for (auto& h : header) h = trim(h);

  std::vector<std::vector<double>> rows;
  MethylationMatrix m;
  size_t lineno = 1;
  bool corner = false;
  while (std::getline(in, line)) {
    ++lineno;
    if (trim(line).empty()) continue;
    auto toks = split_simple(line, delim);
    if (rows.empty()) {
      if (toks.size() == header.size()) corner = true;
      else if (toks.size() != header.size() + 1)
        throw std::runtime_error("Row " + std::to_string(lineno) + " of " + path +
                                 " does not match the header width");
    }
    const size_t want = corner ? header.size() : header.size() + 1;
    if (toks.size() != want)
      throw std::runtime_error("Malformed row " + std::to_string(lineno) + " in " + path);
    m.sites.push_back(trim(toks[0]));
    std::vector<double> vals(want - 1);
    for (size_t j = 1; j < want; ++j) {
      try {
        vals[j - 1] = parse_double(trim(toks[j]));
      } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string(e.what()) + " at row " + std::to_string(lineno) + " of " + path);
      }
    }
    rows.push_back(std::move(vals));
  }

  m.samples.assign(header.begin() + (corner ? 1 : 0), header.end());
  m.values.resize((Eigen::Index)rows.size(), (Eigen::Index)m.samples.size());
  for (size_t i = 0; i < rows.size(); ++i)
    for (size_t j = 0; j < rows[i].size(); ++j) m.values((Eigen::Index)i, (Eigen::Index)j) = rows[i][j];
  return m;
}

// ------------------ sample sheet ------------------

static VariableValues column_values(const std::vector<std::string>& cells,
                                    const std::vector<std::string>& ordered_levels)
{
  bool numeric = ordered_levels.empty();
  for (const auto& s : cells) if (numeric && !looks_numeric(s)) numeric = false;
  if (numeric) {
    NumericValues v;
    v.values.reserve(cells.size());
    for (const auto& s : cells) v.values.push_back(parse_double(s));
    return v;
  }
  CategoricalValues c;
  c.values = cells;
  for (auto& s : c.values) if (is_missing(s)) s = "NA";
  c.levels = ordered_levels;
  c.ordered = !ordered_levels.empty();
  return c;
}

EwasInput read_sample_sheet(const std::string& path,
                            const SampleColumns& cols,
                            MethylationMatrix beta)
{
  if (cols.variable.empty()) throw std::invalid_argument("Sample sheet: no variable column named");

  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open sample sheet: " + path);
  std::string line;
  if (!std::getline(in, line)) throw std::runtime_error("Empty sample sheet: " + path);
  const char delim = detect_delimiter(line);
  auto header = split_simple(line, delim);
  for (auto& h : header) h = trim(h);

  auto col = [&](const std::string& name) {
    for (int i = 0; i < (int)header.size(); ++i) if (header[i] == name) return i;
    throw std::invalid_argument("Sample sheet lacks column '" + name + "': " + path);
  };

  std::unordered_map<std::string, std::vector<std::string>> by_id;
  const int i_id = col(cols.id);
  while (std::getline(in, line)) {
    if (trim(line).empty()) continue;
    auto toks = split_simple(line, delim);
    for (auto& t : toks) t = trim(t);
    toks.resize(header.size());
    if (!by_id.emplace(toks[i_id], toks).second)
      throw std::invalid_argument("Duplicate sample id in sample sheet: " + toks[i_id]);
  }

  // rows in matrix column order
  std::vector<const std::vector<std::string>*> rows;
  rows.reserve(beta.samples.size());
  for (const auto& s : beta.samples) {
    auto it = by_id.find(s);
    if (it == by_id.end()) throw std::invalid_argument("Sample '" + s + "' is missing from the sample sheet");
    rows.push_back(&it->second);
  }
  auto cells_of = [&](const std::string& name) {
    const int k = col(name);
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto* r : rows) out.push_back((*r)[k]);
    return out;
  };
  auto numeric_of = [&](const std::string& name) {
    Eigen::VectorXd v(rows.size());
    const auto cells = cells_of(name);
    for (size_t i = 0; i < cells.size(); ++i) v[(Eigen::Index)i] = parse_double(cells[i]);
    return v;
  };

  EwasInput in_out;
  in_out.variable = column_values(cells_of(cols.variable), cols.variable_levels);
  for (const auto& name : cols.covariates) {
    auto lv = cols.ordered_levels.find(name);
    in_out.covariates.push_back({name, column_values(cells_of(name),
        lv == cols.ordered_levels.end() ? std::vector<std::string>{} : lv->second)});
  }
  if (!cols.batch.empty()) in_out.batch = cells_of(cols.batch);
  if (!cols.cell_counts.empty()) {
    const Eigen::VectorXd cc = numeric_of(cols.cell_counts);
    in_out.cell_counts = std::vector<double>(cc.data(), cc.data() + cc.size());
  }
  if (!cols.weights.empty()) in_out.weights = SampleWeights{numeric_of(cols.weights)};
  in_out.beta = std::move(beta);
  return in_out;
}

// ------------------ outputs ------------------

static std::string num(double v) {
  if (std::isnan(v)) return "NA";
  std::ostringstream oss;
  oss << std::setprecision(10) << v;
  return oss.str();
}

static std::string json_escape(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '"' || c == '\\') { out.push_back('\\'); out.push_back(c); }
    else if (c == '\n') out += "\\n";
    else out.push_back(c);
  }
  return out;
}

static const char* batch_model_name(BatchModel m) {
  switch (m) {
    case BatchModel::None:                 return "none";
    case BatchModel::RandomEffect:         return "random_effect";
    case BatchModel::FixedEffectsFallback: return "fixed_effects_fallback";
  }
  return "unknown";
}

static std::ofstream open_out(const std::string& path) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("Cannot write " + path);
  return f;
}

std::vector<std::string> write_results(const EwasResult& res, const std::string& out_prefix) {
  ensure_parent_dir(out_prefix + ".summary.json");
  std::vector<std::string> written;

  for (const auto& a : res.analyses) {
    const std::string path = out_prefix + "." + covariate_set_name(a.kind) + ".tsv";
    auto f = open_out(path);
    f << "site\tchromosome\tposition\tp.value\tfdr\tp.holm\tt.statistic\tcoefficient"
         "\tcoefficient.ci.high\tcoefficient.ci.low\tcoefficient.se\tn\n";
    const SiteTable& t = a.table;
    for (size_t g = 0; g < t.sites.size(); ++g) {
      const Eigen::Index i = (Eigen::Index)g;
      f << t.sites[g] << '\t'
        << (g < t.chromosome.size() ? t.chromosome[g] : "NA") << '\t'
        << (g < t.position.size() ? std::to_string(t.position[g]) : "NA") << '\t'
        << num(t.p_value[i]) << '\t' << num(t.fdr[i]) << '\t' << num(t.p_holm[i]) << '\t'
        << num(t.t_statistic[i]) << '\t' << num(t.coefficient[i]) << '\t'
        << num(t.ci_high[i]) << '\t' << num(t.ci_low[i]) << '\t' << num(t.se[i]) << '\t'
        << t.n[g] << '\n';
    }
    written.push_back(path);
  }

  auto write_matrix = [&](const Eigen::MatrixXd& m, const std::string& suffix) {
    const std::string path = out_prefix + suffix;
    auto f = open_out(path);
    f << "site";
    for (auto k : res.set_kinds) f << '\t' << covariate_set_name(k);
    f << '\n';
    for (size_t g = 0; g < res.sites.size(); ++g) {
      f << res.sites[g];
      for (Eigen::Index s = 0; s < m.cols(); ++s) f << '\t' << num(m((Eigen::Index)g, s));
      f << '\n';
    }
    written.push_back(path);
  };
  write_matrix(res.p_value, ".p_value.tsv");
  write_matrix(res.coefficient, ".coefficient.tsv");

  {
    const std::string path = out_prefix + ".outliers.tsv";
    auto f = open_out(path);
    f << "site\tsample\tdirection\n";
    for (const auto& c : res.too_hi)
      f << res.sites[c.site] << '\t' << res.sample_ids[c.sample] << "\thigh\n";
    for (const auto& c : res.too_lo)
      f << res.sites[c.site] << '\t' << res.sample_ids[c.sample] << "\tlow\n";
    written.push_back(path);
  }

  {
    const std::string path = out_prefix + ".summary.json";
    auto js = open_out(path);
    const EwasConfig& p = res.params;
    // JSON has no NA: non-finite numbers become null.
    auto opt_num = [](const auto& o) {
      return o && std::isfinite((double)*o) ? num((double)*o) : std::string("null");
    };
    js << "{\n";
    js << "  \"featureset\": \"" << json_escape(res.featureset) << "\",\n";
    js << "  \"n_sites\": " << res.sites.size() << ",\n";
    js << "  \"n_samples\": " << res.sample_ids.size() << ",\n";
    js << "  \"samples\": [";
    for (size_t i = 0; i < res.sample_ids.size(); ++i)
      js << (i ? ", " : "") << "\"" << json_escape(res.sample_ids[i]) << "\"";
    js << "],\n";
    js << "  \"parameters\": {\n";
    js << "    \"isva\": " << (p.isva ? "true" : "false") << ",\n";
    js << "    \"sva\": " << (p.sva ? "true" : "false") << ",\n";
    js << "    \"smartsva\": " << (p.smartsva ? "true" : "false") << ",\n";
    js << "    \"n_sv\": " << opt_num(p.n_sv) << ",\n";
    js << "    \"winsorize_pct\": " << opt_num(p.winsorize_pct) << ",\n";
    js << "    \"outlier_iqr_factor\": " << opt_num(p.outlier_iqr_factor) << ",\n";
    js << "    \"robust\": " << (p.robust ? "true" : "false") << ",\n";
    js << "    \"rlm\": " << (p.rlm ? "true" : "false") << ",\n";
    js << "    \"lmfit_safer\": " << (p.lmfit_safer ? "true" : "false") << ",\n";
    js << "    \"most_variable\": " << opt_num(p.most_variable) << ",\n";
    js << "    \"random_seed\": " << p.random_seed << "\n";
    js << "  },\n";
    js << "  \"surrogate\": ";
    if (res.surrogate)
      js << "{\"method\": \"" << covariate_set_name(res.surrogate->kind)
         << "\", \"n_sv\": " << res.surrogate->n_sv << "},\n";
    else
      js << "null,\n";
    js << "  \"outliers\": {\"high\": " << res.too_hi.size() << ", \"low\": " << res.too_lo.size() << "},\n";
    js << "  \"analyses\": [\n";
    for (size_t k = 0; k < res.analyses.size(); ++k) {
      const auto& a = res.analyses[k];
      js << "    {\"covariate_set\": \"" << covariate_set_name(a.kind) << "\", \"design\": [";
      for (size_t j = 0; j < a.design.colnames.size(); ++j)
        js << (j ? ", " : "") << "\"" << json_escape(a.design.colnames[j]) << "\"";
      js << "], \"batch_model\": \"" << batch_model_name(a.batch_model) << "\"";
      js << ", \"batch_cor\": " << opt_num(a.batch_cor);
      if (!a.batch_error.empty()) js << ", \"batch_error\": \"" << json_escape(a.batch_error) << "\"";
      js << ", \"cell_type_interaction\": " << (a.cell_type_interaction ? "true" : "false") << "}"
         << (k + 1 < res.analyses.size() ? "," : "") << "\n";
    }
    js << "  ]\n";
    js << "}\n";
    written.push_back(path);
  }
  return written;
}

} // namespace ewas
