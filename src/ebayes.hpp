#pragma once
#include "lm_fit.hpp"
#include <optional>

namespace ewas {

// Scaled-F prior for the residual variances. With robust fitting df_prior
// differs per site (variance outliers get less prior weight).
struct VariancePrior {
  double s2_prior{0.0};
  Eigen::VectorXd df_prior;
};

// Moment estimate of the prior from log variances. `winsor_tail_p`
// (lower, upper) switches on the robust estimator.
VariancePrior fit_f_dist(const Eigen::VectorXd& s2,
                         const Eigen::VectorXd& df,
                         std::optional<std::pair<double, double>> winsor_tail_p = std::nullopt);

// Solves trigamma(y) = x for y > 0 by Newton iteration.
double trigamma_inverse(double x);

struct EBayesFit {
  VariancePrior prior;
  Eigen::VectorXd s2_post;
  Eigen::VectorXd t;
  Eigen::VectorXd p_value;
  Eigen::VectorXd df_total;
};

// Moderated t statistics for one coefficient of the fit.
// `winsor_tail_p` applies only with `robust`; unset uses (0.05, 0.1).
EBayesFit ebayes(const LinearModelFit& fit,
                 int coef,
                 bool robust,
                 std::optional<double> winsor_tail_p = std::nullopt);

enum class AdjustMethod { Bh, Holm };

// Multiple-testing adjustment over the non-missing entries; NaN stays NaN.
Eigen::VectorXd p_adjust(const Eigen::VectorXd& p, AdjustMethod method);

} // namespace ewas
