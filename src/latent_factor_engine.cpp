#include "latent_factor_engine.hpp"
#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace ewas {

// ======= Hook registry =======

static SurrogateEstimatorFn g_isva_estimator     = nullptr;
static SurrogateEstimatorFn g_sva_estimator      = nullptr;
static SurrogateEstimatorFn g_smartsva_estimator = nullptr;

void register_surrogate_estimator(CovariateSetKind kind, SurrogateEstimatorFn fn) {
  switch (kind) {
    case CovariateSetKind::Isva:     g_isva_estimator = fn; break;
    case CovariateSetKind::Sva:      g_sva_estimator = fn; break;
    case CovariateSetKind::SmartSva: g_smartsva_estimator = fn; break;
    default:
      throw std::invalid_argument(std::string("No estimator hook for covariate set ") +
                                  covariate_set_name(kind));
  }
}

static SurrogateEstimatorFn estimator_for(CovariateSetKind kind) {
  SurrogateEstimatorFn fn = nullptr;
  if (kind == CovariateSetKind::Isva)     fn = g_isva_estimator;
  if (kind == CovariateSetKind::Sva)      fn = g_sva_estimator;
  if (kind == CovariateSetKind::SmartSva) fn = g_smartsva_estimator;
  if (!fn)
    throw std::runtime_error(std::string(covariate_set_name(kind)) +
                             " estimator not registered. Call register_default_estimators().");
  return fn;
}

// ======= Site selection =======

std::vector<int> select_variable_sites(const MethylationMatrix& beta,
                                       const FeatureCatalogue& features,
                                       std::optional<int> most_variable)
{
  std::unordered_map<std::string, int> row_of;
  row_of.reserve(beta.sites.size() * 2);
  for (int i = 0; i < (int)beta.sites.size(); ++i) row_of.emplace(beta.sites[i], i);

  std::vector<int> rows;
  std::vector<double> var;
  for (const auto& site : features.autosomal_sites()) {
    auto it = row_of.find(site);
    if (it == row_of.end()) continue;
    const int g = it->second;
    double sum = 0.0, ss = 0.0;
    int n = 0;
    for (Eigen::Index j = 0; j < beta.values.cols(); ++j) {
      const double v = beta.values(g, j);
      if (std::isnan(v)) continue;
      sum += v; ss += v * v; ++n;
    }
    if (n < 2) continue;
    const double mean = sum / n;
    rows.push_back(g);
    var.push_back(std::max(0.0, (ss - n * mean * mean) / (n - 1)));
  }

  std::vector<size_t> order(rows.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return var[a] > var[b]; });

  size_t take = rows.size();
  if (most_variable) {
    if (*most_variable > (int)rows.size())
      throw std::invalid_argument("most_variable (" + std::to_string(*most_variable) +
                                  ") exceeds the " + std::to_string(rows.size()) +
                                  " autosomal sites available");
    take = (size_t)*most_variable;
  }
  std::vector<int> out;
  out.reserve(take);
  for (size_t k = 0; k < take; ++k) out.push_back(rows[order[k]]);
  return out;
}

void mean_impute(Eigen::MatrixXd& m) {
  for (Eigen::Index g = 0; g < m.rows(); ++g) {
    double sum = 0.0;
    int n = 0;
    for (Eigen::Index j = 0; j < m.cols(); ++j)
      if (!std::isnan(m(g, j))) { sum += m(g, j); ++n; }
    if (n == 0 || n == m.cols()) continue;
    const double mean = sum / n;
    for (Eigen::Index j = 0; j < m.cols(); ++j)
      if (std::isnan(m(g, j))) m(g, j) = mean;
  }
}

// ======= Engine =======

LatentFactorEngine::LatentFactorEngine(const EwasConfig& cfg, const FeatureCatalogue& features)
  : cfg_(cfg), features_(features) {}

static const char* factor_prefix(CovariateSetKind kind) {
  switch (kind) {
    case CovariateSetKind::Isva:     return "isv";
    case CovariateSetKind::Sva:      return "sv";
    case CovariateSetKind::SmartSva: return "smartsv";
    default:                         return "factor";
  }
}

CovariateSet LatentFactorEngine::with_factors_(const Design& covariates, const SurrogateFit& fit) const {
  const int n = (int)fit.factors.rows();
  const int p = covariates.p(), k = (int)fit.factors.cols();
  CovariateSet set;
  set.kind = fit.kind;
  set.covariates.X.resize(n, p + k);
  if (p > 0) set.covariates.X.leftCols(p) = covariates.X;
  if (k > 0) set.covariates.X.rightCols(k) = fit.factors;
  set.covariates.colnames = covariates.colnames;
  for (int j = 0; j < k; ++j)
    set.covariates.colnames.push_back(factor_prefix(fit.kind) + std::to_string(j + 1));
  return set;
}

LatentOut LatentFactorEngine::run(const MethylationMatrix& beta,
                                  const Eigen::VectorXd& variable,
                                  const Design& covariates) const
{
  const int n = beta.n_samples();
  LatentOut out;

  CovariateSet none;
  none.kind = CovariateSetKind::None;
  none.covariates.X.resize(n, 0);
  out.sets.push_back(none);
  if (covariates.p() > 0) out.sets.push_back({CovariateSetKind::All, covariates});

  std::vector<CovariateSetKind> kinds;
  if (cfg_.isva)     kinds.push_back(CovariateSetKind::Isva);
  if (cfg_.sva)      kinds.push_back(CovariateSetKind::Sva);
  if (cfg_.smartsva) kinds.push_back(CovariateSetKind::SmartSva);
  if (kinds.empty()) return out;

  // ---- reduced, fully observed matrix ----
  out.selected_sites = select_variable_sites(beta, features_, cfg_.most_variable);
  if (out.selected_sites.empty())
    throw std::invalid_argument("No autosomal sites available for surrogate variable estimation");
  Eigen::MatrixXd dat(out.selected_sites.size(), n);
  for (size_t r = 0; r < out.selected_sites.size(); ++r)
    dat.row((Eigen::Index)r) = beta.values.row(out.selected_sites[r]);
  mean_impute(dat);
  msg(cfg_.verbose, "latent", "Using", dat.rows(), "most variable autosomal site(s).");

  // ---- null and full model matrices ----
  Eigen::MatrixXd mod0(n, 1 + covariates.p());
  mod0.col(0).setOnes();
  if (covariates.p() > 0) mod0.rightCols(covariates.p()) = covariates.X;
  Eigen::MatrixXd mod(n, mod0.cols() + 1);
  mod.leftCols(mod0.cols()) = mod0;
  mod.col(mod0.cols()) = variable;

  for (CovariateSetKind kind : kinds) {
    msg(cfg_.verbose, "latent", covariate_set_name(kind));
    std::mt19937_64 rng(cfg_.random_seed);
    SurrogateFit fit = estimator_for(kind)(dat, mod, mod0, cfg_.n_sv, rng);
    if (fit.factors.rows() != n)
      throw std::runtime_error(std::string(covariate_set_name(kind)) +
                               " estimator returned factors for the wrong number of samples");
    msg(cfg_.verbose, "latent", covariate_set_name(kind), "estimated", fit.n_sv, "factor(s).");
    out.sets.push_back(with_factors_(covariates, fit));
    out.surrogate = std::move(fit);
  }
  return out;
}

} // namespace ewas
