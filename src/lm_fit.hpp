#pragma once
#include "ewas.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ewas {

enum class FitMethod { LeastSquares, Robust };

// Per-site linear model fit of every row of a sites x samples matrix.
struct LinearModelFit {
  Eigen::MatrixXd coefficients;       // sites x p, NaN where not estimable
  Eigen::MatrixXd stdev_unscaled;     // sites x p
  Eigen::VectorXd df_residual;        // sites
  Eigen::VectorXd sigma;              // residual scale
  Eigen::VectorXd amean;              // mean of the non-missing values
  std::vector<std::string> coef_names;

  int n_sites() const { return static_cast<int>(coefficients.rows()); }

  // Throws std::invalid_argument when the design has no such column.
  int coef_index(const std::string& name) const;
};

// Random-effect block structure: a block code per sample plus the
// intra-block correlation shared by all sites.
struct BlockCorrelation {
  std::vector<int> block;
  double cor{0.0};
};

// Block codes 0..B-1 in order of first appearance.
std::vector<int> encode_blocks(const std::vector<std::string>& labels);

// Fits every site on its non-missing samples (and positive weights).
// With a block, observations are whitened by the inverse square root of the
// compound-symmetric correlation; a non positive-definite structure throws
// std::runtime_error.
LinearModelFit lm_fit(const Eigen::MatrixXd& beta,
                      const Design& design,
                      FitMethod method,
                      const std::optional<Eigen::MatrixXd>& weights = std::nullopt,
                      const std::optional<BlockCorrelation>& block = std::nullopt);

// Same result as lm_fit without a block, computed one random site
// partition at a time and reassembled in the original site order.
LinearModelFit lm_fit_partitioned(const Eigen::MatrixXd& beta,
                                  const Design& design,
                                  FitMethod method,
                                  const std::optional<Eigen::MatrixXd>& weights,
                                  int n_partitions,
                                  std::mt19937_64& rng,
                                  bool verbose = false);

struct DuplicateCorrelation {
  double consensus{0.0};              // tanh(trimmed mean of atanh(rho))
  Eigen::VectorXd per_site;           // REML estimate per site, NaN if not estimable
};

// Pooled intra-block correlation across all sites.
DuplicateCorrelation duplicate_correlation(const Eigen::MatrixXd& beta,
                                           const Design& design,
                                           const std::vector<int>& block,
                                           const std::optional<Eigen::MatrixXd>& weights = std::nullopt,
                                           double trim = 0.15);

} // namespace ewas
