#pragma once
#include "ewas.hpp"
#include "feature_catalogue.hpp"
#include <optional>
#include <random>
#include <vector>

namespace ewas {

// ======= Estimator hook signature =======

// Surrogate variable estimator.
// dat: sites x samples without missing values; mod: intercept, covariates,
// variable; mod0: intercept, covariates. An unset n_sv asks the estimator
// to choose the factor count. Register via register_surrogate_estimator().
using SurrogateEstimatorFn = SurrogateFit (*)(const Eigen::MatrixXd& /*dat*/,
                                              const Eigen::MatrixXd& /*mod*/,
                                              const Eigen::MatrixXd& /*mod0*/,
                                              std::optional<int> /*n_sv*/,
                                              std::mt19937_64& /*rng*/);

// kind must be Isva, Sva or SmartSva.
void register_surrogate_estimator(CovariateSetKind kind, SurrogateEstimatorFn fn);

struct LatentOut {
  std::vector<CovariateSet> sets;          // catalogue order
  std::optional<SurrogateFit> surrogate;   // last estimator run
  std::vector<int> selected_sites;         // matrix rows given to the estimators
};

// Autosomal rows of the matrix ordered by decreasing variance (ties keep
// catalogue order), truncated to `most_variable` when set. Sites with fewer
// than two observed values are not candidates.
std::vector<int> select_variable_sites(const MethylationMatrix& beta,
                                       const FeatureCatalogue& features,
                                       std::optional<int> most_variable);

// Replaces missing values by the mean of their row.
void mean_impute(Eigen::MatrixXd& m);

class LatentFactorEngine {
public:
  LatentFactorEngine(const EwasConfig& cfg, const FeatureCatalogue& features);

  // Builds the covariate-set catalogue:
  //  - "none", then "all" when covariates are present
  //  - one set per enabled estimator (isva, sva, smartsva), each run with
  //    a generator freshly seeded from random_seed
  LatentOut run(const MethylationMatrix& beta,
                const Eigen::VectorXd& variable,
                const Design& covariates) const;

private:
  const EwasConfig cfg_;
  const FeatureCatalogue& features_;

  CovariateSet with_factors_(const Design& covariates, const SurrogateFit& fit) const;
};

} // namespace ewas
