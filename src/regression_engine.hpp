#pragma once
#include "ewas.hpp"
#include "lm_fit.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ewas {

// Columns: intercept, variable, covariates. With cell counts the intercept
// is dropped and the remaining columns appear twice: scaled by the counts,
// then scaled by (1 - counts) with a "typeB." name prefix.
Design build_design(const Eigen::VectorXd& variable,
                    const Design& covariates,
                    const std::optional<Eigen::VectorXd>& cell_counts);

class RegressionEngine {
public:
  explicit RegressionEngine(const EwasConfig& cfg);

  // One site-wise association analysis for a single covariate set.
  // Throws std::invalid_argument on precondition violations. A failed
  // random-effect fit is retried with fixed effects only.
  AnalysisResult run(const MethylationMatrix& beta,
                     const Eigen::VectorXd& variable,
                     const CovariateSet& set,
                     const std::optional<std::vector<std::string>>& batch,
                     const std::optional<Eigen::MatrixXd>& weights,
                     const std::optional<Eigen::VectorXd>& cell_counts) const;

private:
  const EwasConfig cfg_;

  void check_inputs_(const MethylationMatrix& beta,
                     const Eigen::VectorXd& variable,
                     const CovariateSet& set,
                     const std::optional<std::vector<std::string>>& batch,
                     const std::optional<Eigen::MatrixXd>& weights,
                     const std::optional<Eigen::VectorXd>& cell_counts) const;

  LinearModelFit fixed_effects_fit_(const MethylationMatrix& beta,
                                    const Design& design,
                                    const std::optional<Eigen::MatrixXd>& weights) const;
};

} // namespace ewas
