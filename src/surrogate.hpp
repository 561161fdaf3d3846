#pragma once

#include <armadillo>
#include <optional>
#include <random>
#include "ewas.hpp"   // SurrogateFit

namespace ewas {

// Register isva / sva / smartsva with the LatentFactorEngine hooks.
void register_default_estimators();

// Estimators behind the hooks. dat: sites x samples, fully observed.
// mod: full model (intercept, covariates, variable); mod0: null model.
SurrogateFit isva_estimator(const Eigen::MatrixXd& dat, const Eigen::MatrixXd& mod,
                            const Eigen::MatrixXd& mod0, std::optional<int> n_sv,
                            std::mt19937_64& rng);
SurrogateFit sva_estimator(const Eigen::MatrixXd& dat, const Eigen::MatrixXd& mod,
                           const Eigen::MatrixXd& mod0, std::optional<int> n_sv,
                           std::mt19937_64& rng);
SurrogateFit smartsva_estimator(const Eigen::MatrixXd& dat, const Eigen::MatrixXd& mod,
                                const Eigen::MatrixXd& mod0, std::optional<int> n_sv,
                                std::mt19937_64& rng);

// ---- building blocks (exported for unit tests) ----

// dat minus its least-squares projection on the columns of mod.
arma::mat residualize(const arma::mat& dat, const arma::mat& mod);

// Per-site p-value of the F test of mod0 nested in mod.
arma::vec f_pvalue(const arma::mat& dat, const arma::mat& mod, const arma::mat& mod0);

// Local false discovery rate of each p-value (probit scale, kernel density,
// pi0 at lambda = 0.8, monotone in p, at most 1).
arma::vec edge_lfdr(const arma::vec& p, double lambda = 0.8);

// Number of significant residual components by row permutation.
int num_sv_be(const arma::mat& dat, const arma::mat& mod, std::mt19937_64& rng,
              int B = 20, double sv_sig = 0.10);

// Eigenvalues of the sample correlation matrix above the Marchenko-Pastur edge.
int est_dim_rmt(const arma::mat& dat);

struct IcaResult {
  arma::mat W;   // k x k unmixing in the whitened space
  arma::mat A;   // k x columns(X), mixing matrix
  arma::mat S;   // rows(X) x k, source estimates
};

// Parallel FastICA with the logcosh contrast on the columns of X.
IcaResult fast_ica(const arma::mat& X, int k, std::mt19937_64& rng,
                   int maxit = 200, double tol = 1e-4);

} // namespace ewas
