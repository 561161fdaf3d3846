// main.cpp
// ------------------------------------------------------------------
// CLI orchestration for one epigenome-wide association study:
// methylation matrix + sample sheet + featureset manifests in,
// per-covariate-set tables and a JSON summary out.
//
// Build:
//   - yaml-cpp, cxxopts, Eigen3, Armadillo, Boost.Math
//
// Usage:
//   ewas-assoc -c config.yaml
//   ewas-assoc -c config.yaml -o ewas.nthreads=8 -o paths.out_prefix=out/run2
// ------------------------------------------------------------------

#include "ewas.hpp"
#include "feature_catalogue.hpp"
#include "io.hpp"
#include "log.hpp"
#include "surrogate.hpp"      // register_default_estimators()

#include <yaml-cpp/yaml.h>
#include <cxxopts.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using ewas::EwasConfig;
using ewas::Paths;
using ewas::SampleColumns;

// ------------------ Overrides ------------------

// "-o ewas.n_sv=3": the value is read as YAML, so numbers, booleans and
// null keep their type.
static void apply_override(YAML::Node root, const std::string& key, const std::string& value) {
  const std::vector<std::string> path = ewas::split_simple(key, '.');
  YAML::Node node = root;
  for (size_t i = 0; i + 1 < path.size(); ++i) {
    YAML::Node child = node[path[i]];
    if (!child || child.IsNull()) node[path[i]] = YAML::Node(YAML::NodeType::Map);
    else if (!child.IsMap())
      throw std::invalid_argument("override '" + key + "': '" + path[i] + "' is not a section");
    node.reset(node[path[i]]);
  }
  if (node[path.back()].IsMap())
    throw std::invalid_argument("override '" + key + "' would replace a whole section");
  node[path.back()] = YAML::Load(value);
}

// ------------------ YAML loaders ------------------

// Keys absent from the file keep the library defaults; an explicit null
// clears an optional setting.
static EwasConfig load_cfg(const YAML::Node& y, bool& most_variable_given) {
  EwasConfig c;
  most_variable_given = false;
  const auto e = y["ewas"];
  if (!e) return c;

  auto get = [&](const char* k) { return e[k]; };
  auto opt_double = [&](const char* k, std::optional<double>& dst) {
    if (!get(k)) return;
    if (get(k).IsNull()) dst.reset(); else dst = get(k).as<double>();
  };
  auto opt_int = [&](const char* k, std::optional<int>& dst) {
    if (!get(k)) return;
    if (get(k).IsNull()) dst.reset(); else dst = get(k).as<int>();
  };

  if (get("isva")) c.isva = get("isva").as<bool>();
  if (get("sva")) c.sva = get("sva").as<bool>();
  if (get("smartsva")) c.smartsva = get("smartsva").as<bool>();
  if (get("isva0")) c.isva0 = get("isva0").as<bool>();
  if (get("isva1")) c.isva1 = get("isva1").as<bool>();
  opt_int("n_sv", c.n_sv);
  opt_double("winsorize_pct", c.winsorize_pct);
  opt_double("outlier_iqr_factor", c.outlier_iqr_factor);
  if (get("robust")) c.robust = get("robust").as<bool>();
  if (get("rlm")) c.rlm = get("rlm").as<bool>();
  if (get("lmfit_safer")) c.lmfit_safer = get("lmfit_safer").as<bool>();
  if (get("n_partitions")) c.n_partitions = get("n_partitions").as<int>();
  if (get("most_variable")) {
    most_variable_given = true;
    opt_int("most_variable", c.most_variable);
  }
  if (get("featureset") && !get("featureset").IsNull()) c.featureset = get("featureset").as<std::string>();
  if (get("random_seed")) c.random_seed = get("random_seed").as<std::uint64_t>();
  if (get("nthreads")) c.nthreads = get("nthreads").as<int>();
  if (get("verbose")) c.verbose = get("verbose").as<bool>();
  return c;
}

// Relative paths are taken from the config file's directory.
static Paths load_paths(const YAML::Node& y, const fs::path& base) {
  Paths p;
  const auto r = y["paths"];
  if (!r) return p;
  if (!r.IsMap()) throw std::runtime_error("'paths' must be a map");
  auto rebased = [&](const YAML::Node& n) {
    const fs::path v = n.as<std::string>();
    return (v.is_absolute() ? v : base / v).string();
  };
  if (r["beta"]) p.beta = rebased(r["beta"]);
  if (r["samples"]) p.samples = rebased(r["samples"]);
  if (r["out_prefix"]) p.out_prefix = rebased(r["out_prefix"]);
  for (auto it : r["featuresets"])
    p.featuresets[it.first.as<std::string>()] = rebased(it.second);
  return p;
}

static std::vector<std::string> as_string_list(const YAML::Node& n) {
  std::vector<std::string> out;
  if (!n || n.IsNull()) return out;
  if (n.IsScalar()) { out.push_back(n.as<std::string>()); return out; }
  for (auto v : n) out.push_back(v.as<std::string>());
  return out;
}

static SampleColumns load_sample_columns(const YAML::Node& y) {
  SampleColumns s;
  const auto n = y["samples"];
  if (!n) return s;
  auto str = [&](const char* k, std::string& dst) {
    if (n[k] && !n[k].IsNull()) dst = n[k].as<std::string>();
  };
  str("id", s.id);
  str("variable", s.variable);
  str("batch", s.batch);
  str("cell_counts", s.cell_counts);
  str("weights", s.weights);
  s.covariates = as_string_list(n["covariates"]);
  s.variable_levels = as_string_list(n["variable_levels"]);
  if (n["ordered_levels"])
    for (auto it : n["ordered_levels"])
      s.ordered_levels[it.first.as<std::string>()] = as_string_list(it.second);
  return s;
}

// ------------------ main ------------------
static int run(int argc, char** argv) {
  cxxopts::Options opts("ewas-assoc", "Epigenome-wide association study with surrogate variables");
  opts.add_options()
    ("c,config",   "YAML config path", cxxopts::value<std::string>())
    ("b,beta",     "Override methylation matrix path", cxxopts::value<std::string>()->default_value(""))
    ("s,samples",  "Override sample sheet path", cxxopts::value<std::string>()->default_value(""))
    ("o,override", "YAML dot-override, e.g., ewas.nthreads=8", cxxopts::value<std::vector<std::string>>()->default_value({}))
    ("v,verbose",  "Verbose", cxxopts::value<bool>()->default_value("false"))
    ("h,help",     "Show help");

  auto res = opts.parse(argc, argv);
  if (res.count("help") || !res.count("config")) {
    std::cout << opts.help() << "\n";
    return 0;
  }

  const std::string cfg_path = res["config"].as<std::string>();
  YAML::Node y = YAML::LoadFile(cfg_path);

  if (res.count("override")) {
    for (const auto& kv : res["override"].as<std::vector<std::string>>()) {
      auto pos = kv.find('=');
      if (pos == std::string::npos) {
        ewas::warn("cli", "ignoring override without '=': " + kv);
        continue;
      }
      apply_override(y, kv.substr(0, pos), kv.substr(pos + 1));
    }
  }

  bool most_variable_given = false;
  EwasConfig cfg = load_cfg(y, most_variable_given);
  if (res["verbose"].as<bool>()) cfg.verbose = true;

  Paths paths = load_paths(y, fs::path(cfg_path).parent_path());
  if (!res["beta"].as<std::string>().empty()) paths.beta = res["beta"].as<std::string>();
  if (!res["samples"].as<std::string>().empty()) paths.samples = res["samples"].as<std::string>();
  if (paths.beta.empty())       throw std::invalid_argument("paths.beta is required");
  if (paths.samples.empty())    throw std::invalid_argument("paths.samples is required");
  if (paths.out_prefix.empty()) throw std::invalid_argument("paths.out_prefix is required");
  if (paths.featuresets.empty()) throw std::invalid_argument("paths.featuresets needs at least one manifest");

  const SampleColumns cols = load_sample_columns(y);

  ewas::register_default_estimators();

  // ------------------ Load inputs ------------------
  ewas::msg(cfg.verbose, "io", "Reading", paths.beta);
  ewas::MethylationMatrix beta = ewas::read_methylation_matrix(paths.beta);
  ewas::msg(cfg.verbose, "io", "Methylation matrix:", beta.n_sites(), "sites x", beta.n_samples(), "samples.");
  if (!most_variable_given) cfg.most_variable = std::min(beta.n_sites(), 50000);

  ewas::EwasInput input = ewas::read_sample_sheet(paths.samples, cols, std::move(beta));
  ewas::FeatureRegistry features = ewas::FeatureRegistry::load(
      std::vector<std::pair<std::string, std::string>>(paths.featuresets.begin(), paths.featuresets.end()));

  // ------------------ Run ------------------
  const ewas::EwasResult out = ewas::run_ewas(cfg, input, features);
  const auto written = ewas::write_results(out, paths.out_prefix);

  // ------------------ Report artifacts ------------------
  std::cout << "== EWAS Completed ==\n";
  std::cout << "Featureset: " << out.featureset << "\n";
  std::cout << "Samples: " << out.samples.size() << "  Sites: " << out.sites.size() << "\n";
  std::cout << "Covariate sets:";
  for (auto k : out.set_kinds) std::cout << ' ' << ewas::covariate_set_name(k);
  std::cout << "\n";
  if (out.surrogate)
    std::cout << "Surrogate variables: " << out.surrogate->n_sv
              << " (" << ewas::covariate_set_name(out.surrogate->kind) << ")\n";
  for (const auto& p : written) std::cout << "Wrote: " << p << "\n";
  return 0;
}

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
