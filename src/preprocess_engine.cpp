#include "preprocess_engine.hpp"
#include "io.hpp"
#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace ewas {

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

PreprocessEngine::PreprocessEngine(const EwasConfig& cfg, const FeatureRegistry& features)
  : cfg_(cfg), features_(features) {}

// --------- subsetting helpers ----------
void apply_column_subset(MethylationMatrix& m, const std::vector<int>& keep) {
  Eigen::MatrixXd v(m.values.rows(), (Eigen::Index)keep.size());
  std::vector<std::string> ids;
  ids.reserve(keep.size());
  for (size_t k = 0; k < keep.size(); ++k) {
    v.col((Eigen::Index)k) = m.values.col(keep[k]);
    ids.push_back(m.samples[keep[k]]);
  }
  m.values.swap(v);
  m.samples.swap(ids);
}

VariableValues subset_values(const VariableValues& v, const std::vector<int>& keep) {
  if (auto num = std::get_if<NumericValues>(&v)) {
    NumericValues out;
    out.values.reserve(keep.size());
    for (int i : keep) out.values.push_back(num->values[i]);
    return out;
  }
  const auto& cat = std::get<CategoricalValues>(v);
  CategoricalValues out;
  out.levels  = cat.levels;
  out.ordered = cat.ordered;
  out.values.reserve(keep.size());
  for (int i : keep) out.values.push_back(cat.values[i]);
  return out;
}

size_t value_count(const VariableValues& v) {
  if (auto num = std::get_if<NumericValues>(&v)) return num->values.size();
  return std::get<CategoricalValues>(v).values.size();
}

// --------- simplification ----------
std::vector<std::string> resolve_levels(const CategoricalValues& c) {
  if (!c.levels.empty()) return c.levels;
  std::set<std::string> lv;
  for (const auto& s : c.values) if (!is_missing(s)) lv.insert(s);
  return std::vector<std::string>(lv.begin(), lv.end());
}

static std::unordered_map<std::string, int> level_index(const std::vector<std::string>& levels) {
  std::unordered_map<std::string, int> pos;
  for (int i = 0; i < (int)levels.size(); ++i) pos.emplace(levels[i], i);
  return pos;
}

// Level code per value, -1 when missing. Values outside `levels` are rejected.
static std::vector<int> encode_levels(const CategoricalValues& c,
                                      const std::vector<std::string>& levels) {
  auto pos = level_index(levels);
  std::vector<int> code(c.values.size(), -1);
  for (size_t i = 0; i < c.values.size(); ++i) {
    if (is_missing(c.values[i])) continue;
    auto it = pos.find(c.values[i]);
    if (it == pos.end())
      throw std::invalid_argument("Value '" + c.values[i] + "' is not one of the declared levels");
    code[i] = it->second;
  }
  return code;
}

static Eigen::VectorXd numeric_codes(const CategoricalValues& c,
                                     const std::vector<std::string>& levels) {
  auto code = encode_levels(c, levels);
  Eigen::VectorXd out(code.size());
  // ordered: rank 1..L; binary: 0/1
  const double base = c.ordered ? 1.0 : 0.0;
  for (size_t i = 0; i < code.size(); ++i)
    out[(Eigen::Index)i] = code[i] < 0 ? NaN : base + code[i];
  return out;
}

Eigen::VectorXd simplify_variable(const VariableValues& v) {
  if (auto num = std::get_if<NumericValues>(&v))
    return Eigen::Map<const Eigen::VectorXd>(num->values.data(), (Eigen::Index)num->values.size());

  const auto& cat = std::get<CategoricalValues>(v);
  const auto levels = resolve_levels(cat);
  if (!cat.ordered && levels.size() != 2)
    throw std::invalid_argument("Categorical variable must have exactly two levels unless ordered (found " +
                                std::to_string(levels.size()) + ")");
  return numeric_codes(cat, levels);
}

Design simplify_covariates(const std::vector<Covariate>& covs) {
  const int n = covs.empty() ? 0 : (int)value_count(covs.front().values);

  std::vector<Eigen::VectorXd> cols;
  Design d;
  for (const auto& cv : covs) {
    if ((int)value_count(cv.values) != n)
      throw std::invalid_argument("Covariate '" + cv.name + "' has inconsistent length");
    if (std::holds_alternative<NumericValues>(cv.values)) {
      cols.push_back(simplify_variable(cv.values));
      d.colnames.push_back(cv.name);
      continue;
    }
    const auto& cat = std::get<CategoricalValues>(cv.values);
    const auto levels = resolve_levels(cat);
    if (cat.ordered || levels.size() <= 2) {
      cols.push_back(numeric_codes(cat, levels));
      d.colnames.push_back(cv.name);
      continue;
    }
    // one indicator per non-reference level; reference is levels[0]
    auto code = encode_levels(cat, levels);
    for (int l = 1; l < (int)levels.size(); ++l) {
      Eigen::VectorXd ind(n);
      for (int i = 0; i < n; ++i) ind[i] = code[i] < 0 ? NaN : (code[i] == l ? 1.0 : 0.0);
      cols.push_back(std::move(ind));
      d.colnames.push_back(cv.name + levels[l]);
    }
  }
  d.X.resize(n, (Eigen::Index)cols.size());
  for (size_t j = 0; j < cols.size(); ++j) d.X.col((Eigen::Index)j) = cols[j];
  return d;
}

int drop_zero_variance_columns(Design& d) {
  std::vector<int> keep;
  for (int j = 0; j < d.p(); ++j) {
    double s = 0.0, ss = 0.0;
    int cnt = 0;
    for (int i = 0; i < d.n(); ++i) {
      const double v = d.X(i, j);
      if (std::isnan(v)) continue;
      s += v; ++cnt;
    }
    if (cnt < 2) continue;
    const double mean = s / cnt;
    for (int i = 0; i < d.n(); ++i) {
      const double v = d.X(i, j);
      if (!std::isnan(v)) ss += (v - mean) * (v - mean);
    }
    if (ss / (cnt - 1) > 0.0) keep.push_back(j);
  }
  const int dropped = d.p() - (int)keep.size();
  if (dropped == 0) return 0;

  Eigen::MatrixXd X(d.n(), (Eigen::Index)keep.size());
  std::vector<std::string> names;
  for (size_t k = 0; k < keep.size(); ++k) {
    X.col((Eigen::Index)k) = d.X.col(keep[k]);
    names.push_back(d.colnames[keep[k]]);
  }
  d.X.swap(X);
  d.colnames.swap(names);
  return dropped;
}

// --------- validation ----------
std::string PreprocessEngine::validate_(const EwasInput& in) const {
  if (cfg_.isva0 || cfg_.isva1)
    throw std::invalid_argument("isva0 and isva1 are deprecated and superseded by isva and sva");

  const auto& beta = in.beta;
  const int n_sites = beta.n_sites();
  const int n = beta.n_samples();
  if (n_sites == 0 || (int)beta.sites.size() != n_sites)
    throw std::invalid_argument("Methylation matrix needs one identifier per site and at least one site");
  if ((int)beta.samples.size() != n)
    throw std::invalid_argument("Methylation matrix needs one identifier per sample");

  std::string featureset = cfg_.featureset.empty() ? features_.guess(beta.sites) : cfg_.featureset;
  const auto& cat = features_.get(featureset);
  for (const auto& s : beta.sites)
    if (!cat.contains(s))
      throw std::invalid_argument("Site '" + s + "' is not in featureset " + featureset);

  if ((int)value_count(in.variable) != n)
    throw std::invalid_argument("Variable length (" + std::to_string(value_count(in.variable)) +
                                ") must equal the number of samples (" + std::to_string(n) + ")");
  for (const auto& cv : in.covariates)
    if ((int)value_count(cv.values) != n)
      throw std::invalid_argument("Covariate '" + cv.name + "' must have one value per sample");
  if (in.batch && (int)in.batch->size() != n)
    throw std::invalid_argument("Batch must have one value per sample");
  if (in.cell_counts && (int)in.cell_counts->size() != n)
    throw std::invalid_argument("Cell counts must have one value per sample");

  if (auto mw = std::get_if<MatrixWeights>(&in.weights)) {
    if (mw->w.rows() != n_sites || mw->w.cols() != n)
      throw std::invalid_argument("Weight matrix must have the dimensions of the methylation matrix");
  } else if (auto sw = std::get_if<SampleWeights>(&in.weights)) {
    if (sw->w.size() != n) throw std::invalid_argument("Sample weights must have one value per sample");
  } else if (auto tw = std::get_if<SiteWeights>(&in.weights)) {
    if (tw->w.size() != n_sites) throw std::invalid_argument("Site weights must have one value per site");
  }

  if (cfg_.most_variable && (*cfg_.most_variable <= 1 || *cfg_.most_variable > n_sites))
    throw std::invalid_argument("most_variable must be in (1, " + std::to_string(n_sites) + "]");
  if (cfg_.winsorize_pct && !(*cfg_.winsorize_pct > 0.0 && *cfg_.winsorize_pct < 0.5))
    throw std::invalid_argument("winsorize_pct must be in (0, 0.5)");
  if (cfg_.outlier_iqr_factor && !(std::isfinite(*cfg_.outlier_iqr_factor) && *cfg_.outlier_iqr_factor >= 0.0))
    throw std::invalid_argument("outlier_iqr_factor must be a non-negative number");
  if (cfg_.n_sv && *cfg_.n_sv < 0)
    throw std::invalid_argument("n_sv must be non-negative");
  if (cfg_.n_partitions < 1)
    throw std::invalid_argument("n_partitions must be at least 1");

  return featureset;
}

std::optional<Eigen::MatrixXd>
PreprocessEngine::canonical_weights_(const Weights& w, const std::vector<int>& keep, int n_sites) {
  const Eigen::Index n = (Eigen::Index)keep.size();
  if (auto mw = std::get_if<MatrixWeights>(&w)) {
    Eigen::MatrixXd out(n_sites, n);
    for (Eigen::Index k = 0; k < n; ++k) out.col(k) = mw->w.col(keep[k]);
    return out;
  }
  if (auto sw = std::get_if<SampleWeights>(&w)) {
    Eigen::MatrixXd out(n_sites, n);
    for (Eigen::Index k = 0; k < n; ++k) out.col(k).setConstant(sw->w[keep[k]]);
    return out;
  }
  if (auto tw = std::get_if<SiteWeights>(&w)) {
    Eigen::MatrixXd out(n_sites, n);
    for (Eigen::Index k = 0; k < n; ++k) out.col(k) = tw->w;
    return out;
  }
  return std::nullopt;
}

// --------- public entry ----------
PreOut PreprocessEngine::run(const EwasInput& in) const {
  PreOut out;
  out.featureset = validate_(in);

  const int n = in.beta.n_samples();

  msg(cfg_.verbose, "preprocess", "Simplifying any categorical variables.");
  Eigen::VectorXd variable = simplify_variable(in.variable);
  Design covs = simplify_covariates(in.covariates);

  for (int i = 0; i < n; ++i) {
    if (std::isnan(variable[i])) continue;
    bool complete = true;
    for (int j = 0; j < covs.p() && complete; ++j) complete = !std::isnan(covs.X(i, j));
    if (complete) out.samples.push_back(i);
  }
  out.n_removed_samples = n - (int)out.samples.size();
  msg(cfg_.verbose, "preprocess", "Removing", out.n_removed_samples, "missing case(s).");
  if (out.samples.empty())
    throw std::invalid_argument("No samples remain after removing missing variable/covariate values");

  const auto& keep = out.samples;
  const Eigen::Index m = (Eigen::Index)keep.size();

  out.beta = in.beta;
  apply_column_subset(out.beta, keep);

  out.variable.resize(m);
  for (Eigen::Index k = 0; k < m; ++k) out.variable[k] = variable[keep[k]];

  out.covariates.colnames = covs.colnames;
  out.covariates.X.resize(m, covs.p());
  if (covs.p() > 0)
    for (Eigen::Index k = 0; k < m; ++k) out.covariates.X.row(k) = covs.X.row(keep[k]);

  if (in.batch) {
    std::vector<std::string> b;
    b.reserve(keep.size());
    for (int i : keep) b.push_back((*in.batch)[i]);
    out.batch = std::move(b);
  }
  if (in.cell_counts) {
    Eigen::VectorXd cc(m);
    for (Eigen::Index k = 0; k < m; ++k) cc[k] = (*in.cell_counts)[keep[k]];
    out.cell_counts = std::move(cc);
  }
  out.weights = canonical_weights_(in.weights, keep, in.beta.n_sites());

  out.original_variable = subset_values(in.variable, keep);
  for (const auto& cv : in.covariates)
    out.original_covariates.push_back(Covariate{cv.name, subset_values(cv.values, keep)});

  if (out.covariates.p() > 0) {
    out.n_removed_covariates = drop_zero_variance_columns(out.covariates);
    msg(cfg_.verbose, "preprocess", "Removing", out.n_removed_covariates, "covariates with no variance.");
  }
  return out;
}

} // namespace ewas
