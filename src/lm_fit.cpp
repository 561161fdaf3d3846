// lm_fit.cpp
// ------------------------------------------------------------
// Site-wise linear models: ordinary / robust (Huber) least squares,
// observation weights, and a compound-symmetric random block with a
// fixed intra-block correlation. Plus the REML block-correlation
// estimator and the partitioned (memory-bounded) fit.
//
// Depends: Eigen3, (optional) OpenMP across sites.
// ------------------------------------------------------------

#include "lm_fit.hpp"
#include "log.hpp"

#include <Eigen/QR>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <unordered_map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ewas {

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

static constexpr double kRankTol     = 1e-7;
static constexpr double kHuberK      = 1.345;
static constexpr int    kRobustMaxit = 20;
static constexpr double kRobustAcc   = 1e-4;

int LinearModelFit::coef_index(const std::string& name) const {
  for (int j = 0; j < (int)coef_names.size(); ++j) if (coef_names[j] == name) return j;
  throw std::invalid_argument("No coefficient named '" + name + "' in the fit");
}

std::vector<int> encode_blocks(const std::vector<std::string>& labels) {
  std::unordered_map<std::string, int> code;
  std::vector<int> out;
  out.reserve(labels.size());
  for (const auto& s : labels) {
    auto it = code.emplace(s, (int)code.size()).first;
    out.push_back(it->second);
  }
  return out;
}

// ======= Whitening =======
// Rows of Z are scaled by sqrt(w), then each block is multiplied by the
// inverse symmetric square root of (1-rho) I + rho J.
struct Whitener {
  const Eigen::VectorXd* w{nullptr};      // observation weights, or null
  const std::vector<int>* block{nullptr}; // block code per observation, or null
  double rho{0.0};
  int n_blocks{0};
};

static void check_block_pd(const std::vector<int>& sizes, double rho) {
  int mmax = 0;
  for (int m : sizes) mmax = std::max(mmax, m);
  if (!std::isfinite(rho) || 1.0 - rho <= 0.0 || 1.0 + (mmax - 1) * rho <= 0.0)
    throw std::runtime_error("Block correlation " + std::to_string(rho) +
                             " does not give a positive-definite covariance");
}

static void whiten_inplace(Eigen::MatrixXd& Z, const Whitener& wh) {
  if (wh.w) Z.array().colwise() *= wh.w->array().sqrt();
  if (!wh.block) return;

  const std::vector<int>& blk = *wh.block;
  std::vector<int> size(wh.n_blocks, 0);
  for (int b : blk) ++size[b];
  check_block_pd(size, wh.rho);

  Eigen::MatrixXd mean = Eigen::MatrixXd::Zero(wh.n_blocks, Z.cols());
  for (Eigen::Index i = 0; i < Z.rows(); ++i) mean.row(blk[i]) += Z.row(i);
  const double a = 1.0 / std::sqrt(1.0 - wh.rho);
  for (Eigen::Index i = 0; i < Z.rows(); ++i) {
    const int b = blk[i];
    const double m = size[b];
    const double c = 1.0 / std::sqrt(1.0 + (m - 1.0) * wh.rho) - a;
    Z.row(i) = a * Z.row(i) + (c / m) * mean.row(b);
  }
}

// ======= Per-site least squares =======
struct SiteFit {
  Eigen::VectorXd coef;
  Eigen::VectorXd stdev_unscaled;
  double df{0.0};
  double sigma{NaN};
  int rank{0};
};

static SiteFit ls_site(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
  const int n = (int)X.rows(), p = (int)X.cols();
  SiteFit out;
  out.coef = Eigen::VectorXd::Constant(p, NaN);
  out.stdev_unscaled = Eigen::VectorXd::Constant(p, NaN);
  if (n == 0 || p == 0) return out;

  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
  qr.setThreshold(kRankTol);
  const int r = (int)qr.rank();
  out.rank = r;
  out.df = n - r;
  if (r == 0) return out;

  Eigen::VectorXd qty = qr.householderQ().adjoint() * y;
  Eigen::MatrixXd R = qr.matrixR().topLeftCorner(r, r).triangularView<Eigen::Upper>();
  Eigen::VectorXd b = R.triangularView<Eigen::Upper>().solve(qty.head(r));
  Eigen::MatrixXd Rinv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(r, r));

  const auto& perm = qr.colsPermutation().indices();
  for (int k = 0; k < r; ++k) {
    out.coef[perm[k]] = b[k];
    out.stdev_unscaled[perm[k]] = Rinv.row(k).norm();
  }
  if (n > r) out.sigma = std::sqrt(qty.tail(n - r).squaredNorm() / (n - r));
  return out;
}

static double median_abs(const Eigen::VectorXd& r) {
  std::vector<double> a(r.size());
  for (Eigen::Index i = 0; i < r.size(); ++i) a[i] = std::fabs(r[i]);
  if (a.empty()) return 0.0;
  const size_t h = a.size() / 2;
  std::nth_element(a.begin(), a.begin() + h, a.end());
  if (a.size() % 2 == 1) return a[h];
  const double upper = a[h];
  return 0.5 * (upper + *std::max_element(a.begin(), a.begin() + h));
}

static Eigen::VectorXd fitted_coef(const SiteFit& f) {
  return f.coef.unaryExpr([](double v) { return std::isnan(v) ? 0.0 : v; });
}

// Huber M-estimation by IRLS, MAD scale, least-squares start.
static SiteFit huber_site(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
  SiteFit fit = ls_site(X, y);
  if (fit.df <= 0) return fit;

  Eigen::VectorXd resid = y - X * fitted_coef(fit);
  double scale = 0.0;
  for (int it = 0; it < kRobustMaxit; ++it) {
    scale = median_abs(resid) / 0.6745;
    if (scale <= 0.0) break;
    Eigen::VectorXd sw(y.size());
    for (Eigen::Index i = 0; i < y.size(); ++i) {
      const double u = std::fabs(resid[i] / scale);
      sw[i] = std::sqrt(u <= kHuberK ? 1.0 : kHuberK / u);
    }
    Eigen::MatrixXd Xw = X.array().colwise() * sw.array();
    Eigen::VectorXd yw = y.cwiseProduct(sw);
    fit = ls_site(Xw, yw);
    Eigen::VectorXd next = y - X * fitted_coef(fit);
    const double conv = std::sqrt((resid - next).squaredNorm() /
                                  std::max(1e-20, resid.squaredNorm()));
    resid.swap(next);
    if (conv <= kRobustAcc) break;
  }
  fit.sigma = scale;
  return fit;
}

// Shared QR for sites with every sample observed and no weights.
struct SharedQR {
  Eigen::MatrixXd Q;       // n x r, orthonormal columns
  Eigen::MatrixXd Rinv;    // r x r
  std::vector<int> perm;   // first r pivots
  int rank{0};
};

static SharedQR shared_qr(const Eigen::MatrixXd& Xw) {
  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(Xw);
  qr.setThreshold(kRankTol);
  SharedQR s;
  s.rank = (int)qr.rank();
  const int r = s.rank;
  s.Q = qr.householderQ() * Eigen::MatrixXd::Identity(Xw.rows(), r);
  Eigen::MatrixXd R = qr.matrixR().topLeftCorner(r, r).triangularView<Eigen::Upper>();
  s.Rinv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(r, r));
  for (int k = 0; k < r; ++k) s.perm.push_back(qr.colsPermutation().indices()[k]);
  return s;
}

static SiteFit ls_shared(const SharedQR& s, const Eigen::VectorXd& yw, int p) {
  SiteFit out;
  out.coef = Eigen::VectorXd::Constant(p, NaN);
  out.stdev_unscaled = Eigen::VectorXd::Constant(p, NaN);
  const int n = (int)yw.size(), r = s.rank;
  out.rank = r;
  out.df = n - r;
  if (r == 0) return out;
  Eigen::VectorXd qty = s.Q.transpose() * yw;
  Eigen::VectorXd b = s.Rinv * qty;
  for (int k = 0; k < r; ++k) {
    out.coef[s.perm[k]] = b[k];
    out.stdev_unscaled[s.perm[k]] = s.Rinv.row(k).norm();
  }
  if (n > r) out.sigma = std::sqrt((yw - s.Q * qty).squaredNorm() / (n - r));
  return out;
}

// ======= lm_fit =======
LinearModelFit lm_fit(const Eigen::MatrixXd& beta,
                      const Design& design,
                      FitMethod method,
                      const std::optional<Eigen::MatrixXd>& weights,
                      const std::optional<BlockCorrelation>& block)
{
  const int G = (int)beta.rows(), n = (int)beta.cols(), p = design.p();
  if (design.n() != n)
    throw std::invalid_argument("Design rows (" + std::to_string(design.n()) +
                                ") must equal the number of samples (" + std::to_string(n) + ")");
  if (weights && (weights->rows() != G || weights->cols() != n))
    throw std::invalid_argument("Weights must have the dimensions of the methylation matrix");
  int n_blocks = 0;
  if (block) {
    if ((int)block->block.size() != n)
      throw std::invalid_argument("Block must have one code per sample");
    for (int b : block->block) n_blocks = std::max(n_blocks, b + 1);
    if (!std::isfinite(block->cor))
      throw std::runtime_error("Block correlation is not finite");
  }

  LinearModelFit fit;
  fit.coefficients.resize(G, p);
  fit.stdev_unscaled.resize(G, p);
  fit.df_residual.resize(G);
  fit.sigma.resize(G);
  fit.amean.resize(G);
  fit.coef_names = design.colnames;

  // Complete rows share one decomposition.
  std::optional<SharedQR> shared;
  if (method == FitMethod::LeastSquares && !weights) {
    Eigen::MatrixXd Xw = design.X;
    Whitener wh;
    if (block) { wh.block = &block->block; wh.rho = block->cor; wh.n_blocks = n_blocks; }
    whiten_inplace(Xw, wh);
    shared = shared_qr(Xw);
  }

  std::string error;
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 256)
#endif
  for (int g = 0; g < G; ++g) {
    try {
      std::vector<int> obs;
      obs.reserve(n);
      double sum = 0.0;
      int cnt = 0;
      for (int j = 0; j < n; ++j) {
        const double v = beta(g, j);
        if (std::isnan(v)) continue;
        sum += v; ++cnt;
        if (weights) {
          const double w = (*weights)(g, j);
          if (!(w > 0.0)) continue;
        }
        obs.push_back(j);
      }
      fit.amean[g] = cnt > 0 ? sum / cnt : NaN;

      SiteFit sf;
      if (shared && (int)obs.size() == n) {
        Eigen::MatrixXd yw = beta.row(g).transpose();
        Whitener wh;
        if (block) { wh.block = &block->block; wh.rho = block->cor; wh.n_blocks = n_blocks; }
        whiten_inplace(yw, wh);
        sf = ls_shared(*shared, yw.col(0), p);
      } else {
        const int m = (int)obs.size();
        Eigen::MatrixXd Z(m, p + 1);
        Eigen::VectorXd w_obs;
        std::vector<int> blk_obs;
        for (int k = 0; k < m; ++k) {
          Z.row(k).head(p) = design.X.row(obs[k]);
          Z(k, p) = beta(g, obs[k]);
        }
        Whitener wh;
        if (weights) {
          w_obs.resize(m);
          for (int k = 0; k < m; ++k) w_obs[k] = (*weights)(g, obs[k]);
          wh.w = &w_obs;
        }
        if (block) {
          blk_obs.reserve(m);
          for (int k = 0; k < m; ++k) blk_obs.push_back(block->block[obs[k]]);
          wh.block = &blk_obs; wh.rho = block->cor; wh.n_blocks = n_blocks;
        }
        whiten_inplace(Z, wh);
        const Eigen::MatrixXd Xs = Z.leftCols(p);
        const Eigen::VectorXd ys = Z.col(p);
        sf = method == FitMethod::Robust ? huber_site(Xs, ys) : ls_site(Xs, ys);
      }
      fit.coefficients.row(g) = sf.coef.transpose();
      fit.stdev_unscaled.row(g) = sf.stdev_unscaled.transpose();
      fit.df_residual[g] = sf.df;
      fit.sigma[g] = sf.sigma;
    } catch (const std::exception& e) {
#ifdef _OPENMP
#pragma omp critical(lm_fit_error)
#endif
      { if (error.empty()) error = e.what(); }
    }
  }
  if (!error.empty()) throw std::runtime_error("lm_fit: " + error);
  return fit;
}

// ======= Partitioned fit =======
LinearModelFit lm_fit_partitioned(const Eigen::MatrixXd& beta,
                                  const Design& design,
                                  FitMethod method,
                                  const std::optional<Eigen::MatrixXd>& weights,
                                  int n_partitions,
                                  std::mt19937_64& rng,
                                  bool verbose)
{
  if (n_partitions < 1) throw std::invalid_argument("n_partitions must be at least 1");
  const int G = (int)beta.rows(), p = design.p();

  std::uniform_int_distribution<int> pick(0, n_partitions - 1);
  std::vector<std::vector<int>> members(n_partitions);
  for (int g = 0; g < G; ++g) members[pick(rng)].push_back(g);

  // map: one independent fit per partition
  std::vector<LinearModelFit> parts(n_partitions);
  for (int k = 0; k < n_partitions; ++k) {
    msg(verbose, "regression", "Fitting partition", k + 1, "of", n_partitions, "(" +
        std::to_string(members[k].size()) + " sites).");
    if (members[k].empty()) continue;
    const auto& idx = members[k];
    Eigen::MatrixXd sub(idx.size(), beta.cols());
    for (size_t r = 0; r < idx.size(); ++r) sub.row((Eigen::Index)r) = beta.row(idx[r]);
    std::optional<Eigen::MatrixXd> wsub;
    if (weights) {
      wsub.emplace(idx.size(), beta.cols());
      for (size_t r = 0; r < idx.size(); ++r) wsub->row((Eigen::Index)r) = weights->row(idx[r]);
    }
    parts[k] = lm_fit(sub, design, method, wsub);
  }

  // reduce: scatter every partition back to its original site rows
  LinearModelFit fit;
  fit.coefficients.resize(G, p);
  fit.stdev_unscaled.resize(G, p);
  fit.df_residual.resize(G);
  fit.sigma.resize(G);
  fit.amean.resize(G);
  fit.coef_names = design.colnames;
  for (int k = 0; k < n_partitions; ++k) {
    const auto& idx = members[k];
    for (size_t r = 0; r < idx.size(); ++r) {
      const int g = idx[r];
      const Eigen::Index s = (Eigen::Index)r;
      fit.coefficients.row(g)   = parts[k].coefficients.row(s);
      fit.stdev_unscaled.row(g) = parts[k].stdev_unscaled.row(s);
      fit.df_residual[g] = parts[k].df_residual[s];
      fit.sigma[g]       = parts[k].sigma[s];
      fit.amean[g]       = parts[k].amean[s];
    }
  }
  return fit;
}

// ======= Block correlation (REML) =======
// Profile restricted log-likelihood (constants dropped) of a single
// compound-symmetric correlation; X and y already weight-scaled.
static double reml_profile(const Eigen::MatrixXd& X, const Eigen::VectorXd& y,
                           const std::vector<int>& blk, int n_blocks, double rho)
{
  const int n = (int)X.rows(), p = (int)X.cols();
  Eigen::MatrixXd Z(n, p + 1);
  Z.leftCols(p) = X;
  Z.col(p) = y;
  Whitener wh;
  wh.block = &blk; wh.rho = rho; wh.n_blocks = n_blocks;
  whiten_inplace(Z, wh);

  std::vector<int> size(n_blocks, 0);
  for (int b : blk) ++size[b];
  double logdetV = 0.0;
  for (int m : size) {
    if (m == 0) continue;
    logdetV += (m - 1) * std::log(1.0 - rho) + std::log(1.0 + (m - 1) * rho);
  }

  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(Z.leftCols(p));
  qr.setThreshold(kRankTol);
  const int r = (int)qr.rank();
  double logdetXVX = 0.0;
  for (int k = 0; k < r; ++k) logdetXVX += 2.0 * std::log(std::fabs(qr.matrixR()(k, k)));
  Eigen::VectorXd qty = qr.householderQ().adjoint() * Z.col(p);
  const double rss = qty.tail(n - r).squaredNorm();
  if (!(rss > 0.0)) return -std::numeric_limits<double>::infinity();
  return -0.5 * (logdetV + logdetXVX + (n - r) * std::log(rss));
}

static double golden_max(const std::function<double(double)>& f, double lo, double hi, double tol) {
  const double phi = 0.5 * (std::sqrt(5.0) - 1.0);
  double a = lo, b = hi;
  double c = b - phi * (b - a), d = a + phi * (b - a);
  double fc = f(c), fd = f(d);
  while (b - a > tol) {
    if (fc >= fd) { b = d; d = c; fd = fc; c = b - phi * (b - a); fc = f(c); }
    else          { a = c; c = d; fc = fd; d = a + phi * (b - a); fd = f(d); }
  }
  return 0.5 * (a + b);
}

static double trimmed_mean(std::vector<double> x, double trim) {
  x.erase(std::remove_if(x.begin(), x.end(), [](double v){ return !std::isfinite(v); }), x.end());
  if (x.empty()) return NaN;
  std::sort(x.begin(), x.end());
  const size_t lo = (size_t)std::floor(x.size() * trim);
  if (2 * lo >= x.size()) {
    const size_t h = x.size() / 2;
    return x.size() % 2 ? x[h] : 0.5 * (x[h - 1] + x[h]);
  }
  double s = 0.0;
  for (size_t i = lo; i < x.size() - lo; ++i) s += x[i];
  return s / (double)(x.size() - 2 * lo);
}

DuplicateCorrelation duplicate_correlation(const Eigen::MatrixXd& beta,
                                           const Design& design,
                                           const std::vector<int>& block,
                                           const std::optional<Eigen::MatrixXd>& weights,
                                           double trim)
{
  const int G = (int)beta.rows(), n = (int)beta.cols(), p = design.p();
  if ((int)block.size() != n || design.n() != n)
    throw std::invalid_argument("duplicate_correlation: block and design must have one row per sample");
  int n_blocks = 0;
  for (int b : block) n_blocks = std::max(n_blocks, b + 1);

  DuplicateCorrelation out;
  out.per_site = Eigen::VectorXd::Constant(G, NaN);

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 64)
#endif
  for (int g = 0; g < G; ++g) {
    std::vector<int> obs;
    for (int j = 0; j < n; ++j) {
      if (std::isnan(beta(g, j))) continue;
      if (weights && !((*weights)(g, j) > 0.0)) continue;
      obs.push_back(j);
    }
    const int m = (int)obs.size();
    if (m <= p + 1) continue;

    Eigen::MatrixXd X(m, p);
    Eigen::VectorXd y(m);
    std::vector<int> blk(m);
    std::vector<int> size(n_blocks, 0);
    for (int k = 0; k < m; ++k) {
      X.row(k) = design.X.row(obs[k]);
      y[k] = beta(g, obs[k]);
      blk[k] = block[obs[k]];
      ++size[blk[k]];
    }
    if (weights) {
      Eigen::VectorXd sw(m);
      for (int k = 0; k < m; ++k) sw[k] = std::sqrt((*weights)(g, obs[k]));
      X.array().colwise() *= sw.array();
      y.array() *= sw.array();
    }
    const int mmax = *std::max_element(size.begin(), size.end());
    if (mmax < 2) continue;

    const double lo = std::max(-0.99, -1.0 / (mmax - 1) + 1e-3);
    const double hi = 0.99;
    auto f = [&](double rho) { return reml_profile(X, y, blk, n_blocks, rho); };
    out.per_site[g] = golden_max(f, lo, hi, 1e-5);
  }

  std::vector<double> arho;
  arho.reserve(G);
  for (int g = 0; g < G; ++g)
    if (std::isfinite(out.per_site[g])) arho.push_back(std::atanh(std::max(-1.0, out.per_site[g])));
  out.consensus = std::tanh(trimmed_mean(arho, trim));
  return out;
}

} // namespace ewas
