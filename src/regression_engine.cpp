// regression_engine.cpp
// ------------------------------------------------------------
// RegressionEngine: design construction (optionally the cell-type
// interaction form), site-wise fit with an optional random batch
// block, empirical Bayes moderation and the per-site table.
//
// Depends: Eigen3, Boost.Math (t quantile).
// ------------------------------------------------------------

#include "regression_engine.hpp"
#include "ebayes.hpp"
#include "log.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace ewas {

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

Design build_design(const Eigen::VectorXd& variable,
                    const Design& covariates,
                    const std::optional<Eigen::VectorXd>& cell_counts)
{
  const int n = (int)variable.size();
  const int p = covariates.p();

  Design base;
  base.X.resize(n, 2 + p);
  base.X.col(0).setOnes();
  base.X.col(1) = variable;
  if (p > 0) base.X.rightCols(p) = covariates.X;
  base.colnames = {"intercept", "variable"};
  base.colnames.insert(base.colnames.end(), covariates.colnames.begin(), covariates.colnames.end());
  if (!cell_counts) return base;

  // Mi = A Xi pi + B Xi (1 - pi) + e
  const Eigen::MatrixXd Xa = base.X.rightCols(1 + p);
  const Eigen::VectorXd& cc = *cell_counts;
  Design d;
  d.X.resize(n, 2 * (1 + p));
  d.X.leftCols(1 + p)  = Xa.array().colwise() * cc.array();
  d.X.rightCols(1 + p) = Xa.array().colwise() * (1.0 - cc.array());
  for (int j = 1; j < (int)base.colnames.size(); ++j) d.colnames.push_back(base.colnames[j]);
  for (int j = 1; j < (int)base.colnames.size(); ++j) d.colnames.push_back("typeB." + base.colnames[j]);
  return d;
}

RegressionEngine::RegressionEngine(const EwasConfig& cfg) : cfg_(cfg) {}

void RegressionEngine::check_inputs_(const MethylationMatrix& beta,
                                     const Eigen::VectorXd& variable,
                                     const CovariateSet& set,
                                     const std::optional<std::vector<std::string>>& batch,
                                     const std::optional<Eigen::MatrixXd>& weights,
                                     const std::optional<Eigen::VectorXd>& cell_counts) const
{
  const int n = beta.n_samples();
  if (variable.hasNaN())
    throw std::invalid_argument("Variable of interest contains missing values");
  if (variable.size() != n)
    throw std::invalid_argument("Variable length (" + std::to_string(variable.size()) +
                                ") must equal the number of samples (" + std::to_string(n) + ")");
  if (set.covariates.p() > 0 && set.covariates.n() != n)
    throw std::invalid_argument("Covariate rows must equal the number of samples");
  if (batch && (int)batch->size() != n)
    throw std::invalid_argument("Batch length must equal the number of samples");
  if (weights && (weights->rows() != beta.n_sites() || weights->cols() != n))
    throw std::invalid_argument("Weights must have the dimensions of the methylation matrix");
  if (cell_counts) {
    if (cell_counts->size() != n)
      throw std::invalid_argument("Cell counts length must equal the number of samples");
    for (Eigen::Index i = 0; i < cell_counts->size(); ++i) {
      const double c = (*cell_counts)[i];
      if (!(c >= 0.0 && c <= 1.0))
        throw std::invalid_argument("Cell counts must lie in [0, 1]");
    }
  }
}

LinearModelFit RegressionEngine::fixed_effects_fit_(const MethylationMatrix& beta,
                                                    const Design& design,
                                                    const std::optional<Eigen::MatrixXd>& weights) const
{
  const FitMethod method = cfg_.rlm ? FitMethod::Robust : FitMethod::LeastSquares;
  if (!cfg_.lmfit_safer) return lm_fit(beta.values, design, method, weights);
  std::mt19937_64 rng(cfg_.random_seed);
  return lm_fit_partitioned(beta.values, design, method, weights, cfg_.n_partitions, rng, cfg_.verbose);
}

AnalysisResult RegressionEngine::run(const MethylationMatrix& beta,
                                     const Eigen::VectorXd& variable,
                                     const CovariateSet& set,
                                     const std::optional<std::vector<std::string>>& batch,
                                     const std::optional<Eigen::MatrixXd>& weights,
                                     const std::optional<Eigen::VectorXd>& cell_counts) const
{
  check_inputs_(beta, variable, set, batch, weights, cell_counts);

  AnalysisResult res;
  res.kind = set.kind;
  res.design = build_design(variable, set.covariates, cell_counts);
  res.cell_type_interaction = cell_counts.has_value();
  const FitMethod method = cfg_.rlm ? FitMethod::Robust : FitMethod::LeastSquares;

  msg(cfg_.verbose, "regression", "Linear regression,", res.design.p(), "design column(s).");
  std::optional<LinearModelFit> fit;
  if (batch) {
    msg(cfg_.verbose, "regression", "Adjusting for batch effect.");
    BlockCorrelation block;
    block.block = encode_blocks(*batch);
    block.cor = duplicate_correlation(beta.values, res.design, block.block).consensus;
    if (std::isfinite(block.cor)) res.batch_cor = block.cor;
    msg(cfg_.verbose, "regression", "Batch as random effect, correlation", block.cor);
    try {
      fit = lm_fit(beta.values, res.design, method, weights, block);
      res.batch_model = BatchModel::RandomEffect;
    } catch (const std::exception& e) {
      warn("regression", std::string("random-effect fit failed, omitting batch: ") + e.what());
      res.batch_model = BatchModel::FixedEffectsFallback;
      res.batch_error = e.what();
    }
  }
  if (!fit) {
    msg(cfg_.verbose, "regression", "Linear regression with only fixed effects.");
    fit = fixed_effects_fit_(beta, res.design, weights);
  }

  msg(cfg_.verbose, "regression", "Empirical Bayes.");
  const int coef = fit->coef_index("variable");
  std::optional<double> tail_p;
  if (cfg_.robust && cfg_.winsorize_pct) tail_p = *cfg_.winsorize_pct;
  const EBayesFit eb = ebayes(*fit, coef, cfg_.robust, tail_p);

  const int G = beta.n_sites();
  SiteTable& t = res.table;
  t.sites = beta.sites;
  t.p_value = eb.p_value;
  t.fdr = p_adjust(eb.p_value, AdjustMethod::Bh);
  t.p_holm = p_adjust(eb.p_value, AdjustMethod::Holm);
  t.t_statistic = eb.t;
  t.coefficient = fit->coefficients.col(coef);
  t.se.resize(G);
  t.ci_high.resize(G);
  t.ci_low.resize(G);
  t.n.resize(G);
  for (int g = 0; g < G; ++g) {
    const double se = std::sqrt(eb.s2_post[g]) * fit->stdev_unscaled(g, coef);
    double margin = NaN;
    if (eb.df_total[g] > 0.0 && std::isfinite(se)) {
      boost::math::students_t_distribution<double> td(eb.df_total[g]);
      margin = se * boost::math::quantile(td, 0.975);
    }
    t.se[g] = se;
    t.ci_high[g] = t.coefficient[g] + margin;
    t.ci_low[g]  = t.coefficient[g] - margin;
    int cnt = 0;
    for (Eigen::Index j = 0; j < beta.values.cols(); ++j) cnt += std::isnan(beta.values(g, j)) ? 0 : 1;
    t.n[g] = cnt;
  }
  return res;
}

} // namespace ewas
