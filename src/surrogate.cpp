// surrogate.cpp
// ------------------------------------------------------------
// Surrogate variable estimators (ISVA, iteratively re-weighted SVA,
// SmartSVA) and their building blocks: nested F test, local FDR,
// permutation and random-matrix dimension estimates, FastICA.
//
// Depends: Armadillo, Boost.Math.
// ------------------------------------------------------------

#include "surrogate.hpp"
#include "latent_factor_engine.hpp"
#include "ebayes.hpp"   // p_adjust
#include "log.hpp"

#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace ewas {

// ---------- small helpers ----------

static inline arma::mat to_arma(const Eigen::MatrixXd& m) {
  return arma::mat(m.data(), (arma::uword)m.rows(), (arma::uword)m.cols());
}

static inline Eigen::MatrixXd to_eigen(const arma::mat& m) {
  return Eigen::Map<const Eigen::MatrixXd>(m.memptr(), (Eigen::Index)m.n_rows, (Eigen::Index)m.n_cols);
}

// Leading k eigenvectors of a symmetric matrix, largest eigenvalue first.
static arma::mat top_eigvecs(const arma::mat& G, int k, arma::vec* values = nullptr) {
  arma::vec eval;
  arma::mat evec;
  if (!arma::eig_sym(eval, evec, G))
    throw std::runtime_error("Eigendecomposition failed");
  const arma::uword n = eval.n_elem;
  arma::mat out(G.n_rows, (arma::uword)k);
  for (int j = 0; j < k; ++j) out.col(j) = evec.col(n - 1 - j);
  if (values) *values = arma::reverse(eval);
  return out;
}

static inline arma::mat center_rows(arma::mat X) {
  X.each_col() -= arma::mean(X, 1);
  return X;
}

static SurrogateFit empty_fit(CovariateSetKind kind, arma::uword n) {
  SurrogateFit out;
  out.kind = kind;
  out.factors = Eigen::MatrixXd(n, 0);
  out.n_sv = 0;
  return out;
}

static void check_factor_count(int k, const arma::mat& dat, const arma::mat& mod, const char* who) {
  if (k < 0) throw std::invalid_argument(std::string(who) + ": negative factor count");
  const int room = (int)dat.n_cols - (int)arma::rank(mod);
  if (k > room)
    throw std::runtime_error(std::string(who) + ": " + std::to_string(k) +
                             " factors requested but only " + std::to_string(room) +
                             " residual dimensions are available");
}

// ---------- building blocks ----------

arma::mat residualize(const arma::mat& dat, const arma::mat& mod) {
  const arma::mat P = mod * arma::pinv(mod.t() * mod) * mod.t();
  return dat - dat * P;
}

arma::vec f_pvalue(const arma::mat& dat, const arma::mat& mod, const arma::mat& mod0) {
  const double n = (double)dat.n_cols;
  const double df1 = (double)mod.n_cols, df0 = (double)mod0.n_cols;
  if (df1 <= df0 || n <= df1)
    throw std::runtime_error("f_pvalue: models are not nested with residual degrees of freedom");

  const arma::vec rss1 = arma::sum(arma::square(residualize(dat, mod)), 1);
  const arma::vec rss0 = arma::sum(arma::square(residualize(dat, mod0)), 1);

  boost::math::fisher_f_distribution<double> fd(df1 - df0, n - df1);
  arma::vec p(dat.n_rows);
  for (arma::uword i = 0; i < dat.n_rows; ++i) {
    const double f = ((rss0[i] - rss1[i]) / (df1 - df0)) / (rss1[i] / (n - df1));
    if (std::isnan(f))      p[i] = 1.0;        // constant site
    else if (std::isinf(f)) p[i] = 0.0;
    else p[i] = boost::math::cdf(boost::math::complement(fd, std::max(f, 0.0)));
  }
  return p;
}

static double bw_nrd0(const arma::vec& x) {
  const double hi = arma::stddev(x);
  arma::vec s = arma::sort(x);
  auto q = [&](double prob) {
    const double h = (double)(s.n_elem - 1) * prob;
    const arma::uword j = (arma::uword)std::floor(h);
    if (j + 1 >= s.n_elem) return s[s.n_elem - 1];
    return s[j] + (h - (double)j) * (s[j + 1] - s[j]);
  };
  double lo = std::min(hi, (q(0.75) - q(0.25)) / 1.34);
  if (!(lo > 0.0)) lo = hi > 0.0 ? hi : (std::fabs(s[0]) > 0.0 ? std::fabs(s[0]) : 1.0);
  return 0.9 * lo * std::pow((double)x.n_elem, -0.2);
}

arma::vec edge_lfdr(const arma::vec& p_in, double lambda) {
  const arma::uword m = p_in.n_elem;
  if (m == 0) return arma::vec();
  const double eps = 1e-8;

  double pi0 = (double)arma::accu(p_in >= lambda) / (double)m / (1.0 - lambda);
  pi0 = std::min(pi0, 1.0);

  boost::math::normal_distribution<double> nd;
  arma::vec x(m);
  for (arma::uword i = 0; i < m; ++i)
    x[i] = boost::math::quantile(nd, std::min(std::max(p_in[i], eps), 1.0 - eps));

  // Gaussian kernel density on a regular grid, interpolated at x.
  const double bw = 1.5 * bw_nrd0(x);
  const int ng = 512;
  const double from = x.min() - 3.0 * bw, to = x.max() + 3.0 * bw;
  const double step = (to - from) / (ng - 1);
  arma::vec dens(ng, arma::fill::zeros);
  const double norm = 1.0 / ((double)m * bw * boost::math::constants::root_two_pi<double>());
  for (int g = 0; g < ng; ++g) {
    const double gx = from + step * g;
    double acc = 0.0;
    for (arma::uword i = 0; i < m; ++i) {
      const double u = (gx - x[i]) / bw;
      acc += std::exp(-0.5 * u * u);
    }
    dens[g] = acc * norm;
  }

  arma::vec lfdr(m);
  for (arma::uword i = 0; i < m; ++i) {
    const double pos = (x[i] - from) / step;
    const int g = std::min(ng - 2, std::max(0, (int)std::floor(pos)));
    const double f = pos - g;
    const double y = (1.0 - f) * dens[g] + f * dens[g + 1];
    lfdr[i] = std::min(1.0, pi0 * boost::math::pdf(nd, x[i]) / y);
  }

  // monotone in p
  arma::uvec o = arma::stable_sort_index(p_in);
  double run = 0.0;
  for (arma::uword k = 0; k < m; ++k) {
    run = std::max(run, lfdr[o[k]]);
    lfdr[o[k]] = run;
  }
  return lfdr;
}

int num_sv_be(const arma::mat& dat, const arma::mat& mod, std::mt19937_64& rng,
              int B, double sv_sig)
{
  const arma::uword n = dat.n_cols;
  const arma::mat H = mod * arma::pinv(mod.t() * mod) * mod.t();
  const arma::mat res = dat - dat * H;
  const int ndf = (int)n - (int)std::ceil(arma::trace(H) - 1e-8);
  if (ndf <= 0) return 0;

  auto dstat_of = [&](const arma::mat& r) {
    arma::vec ev;
    top_eigvecs(r.t() * r, 0, &ev);
    arma::vec d = arma::clamp(ev.head((arma::uword)ndf), 0.0, arma::datum::inf);
    return arma::vec(d / arma::accu(d));
  };
  const arma::vec dstat = dstat_of(res);

  arma::mat dstat0((arma::uword)B, (arma::uword)ndf);
  std::vector<arma::uword> perm(n);
  for (int b = 0; b < B; ++b) {
    arma::mat res0(res.n_rows, n);
    for (arma::uword i = 0; i < res.n_rows; ++i) {
      std::iota(perm.begin(), perm.end(), 0);
      for (arma::uword j = n - 1; j > 0; --j) {
        std::uniform_int_distribution<arma::uword> pick(0, j);
        std::swap(perm[j], perm[pick(rng)]);
      }
      for (arma::uword j = 0; j < n; ++j) res0(i, j) = res(i, perm[j]);
    }
    res0 -= res0 * H;
    dstat0.row((arma::uword)b) = dstat_of(res0).t();
  }

  arma::vec psv(ndf);
  for (int i = 0; i < ndf; ++i)
    psv[i] = (double)arma::accu(dstat0.col(i) >= dstat[i]) / (double)B;
  for (int i = 1; i < ndf; ++i) psv[i] = std::max(psv[i - 1], psv[i]);
  return (int)arma::accu(psv <= sv_sig);
}

int est_dim_rmt(const arma::mat& dat) {
  const double m = (double)dat.n_rows, n = (double)dat.n_cols;
  if (m < 2 || n < 2) return 0;
  arma::mat M = dat;
  for (arma::uword j = 0; j < M.n_cols; ++j) {
    const double mu = arma::mean(M.col(j));
    const double sd = arma::stddev(M.col(j));
    if (sd > 0.0) M.col(j) = (M.col(j) - mu) / sd;
    else          M.col(j).zeros();
  }
  const double sigma2 = arma::var(arma::vectorise(M));
  const double Q = m / n;
  const double lambda_max = sigma2 * (1.0 + 1.0 / Q + 2.0 * std::sqrt(1.0 / Q));

  arma::vec ev;
  if (!arma::eig_sym(ev, arma::mat(M.t() * M / m)))
    throw std::runtime_error("est_dim_rmt: eigendecomposition failed");
  return (int)arma::accu(ev > lambda_max);
}

// (W W')^{-1/2} W
static arma::mat sym_decorrelate(const arma::mat& W) {
  arma::mat U, V;
  arma::vec s;
  if (!arma::svd(U, s, V, W)) throw std::runtime_error("fast_ica: SVD failed");
  return U * V.t();
}

IcaResult fast_ica(const arma::mat& X_in, int k, std::mt19937_64& rng, int maxit, double tol) {
  if (k < 1) throw std::invalid_argument("fast_ica: need at least one component");
  if ((arma::uword)k > X_in.n_cols)
    throw std::invalid_argument("fast_ica: more components than columns");

  // center columns, then whiten to k dimensions
  arma::mat X = X_in;
  X.each_row() -= arma::mean(X, 0);
  X = X.t();                                      // p x n
  const double nobs = (double)X.n_cols;

  arma::vec d;
  const arma::mat U = top_eigvecs(X * X.t() / nobs, k, &d);
  if (d[(arma::uword)k - 1] <= 0.0)
    throw std::runtime_error("fast_ica: data has fewer than " + std::to_string(k) + " non-degenerate dimensions");
  arma::mat K = arma::diagmat(1.0 / arma::sqrt(d.head((arma::uword)k))) * U.t();   // k x p
  const arma::mat X1 = K * X;                      // k x n

  std::normal_distribution<double> rnorm(0.0, 1.0);
  arma::mat W((arma::uword)k, (arma::uword)k);
  for (arma::uword j = 0; j < W.n_cols; ++j)
    for (arma::uword i = 0; i < W.n_rows; ++i) W(i, j) = rnorm(rng);
  W = sym_decorrelate(W);

  double lim = 1000.0;
  for (int it = 1; lim > tol && it < maxit; ++it) {
    const arma::mat gwx = arma::tanh(W * X1);
    const arma::mat v1 = gwx * X1.t() / nobs;
    const arma::vec gprime = arma::mean(1.0 - arma::square(gwx), 1);
    const arma::mat W1 = sym_decorrelate(v1 - arma::diagmat(gprime) * W);
    lim = arma::max(arma::abs(arma::abs(arma::diagvec(W1 * W.t())) - 1.0));
    W = W1;
  }

  const arma::mat w = W * K;                       // k x p
  IcaResult out;
  out.W = W.t();
  out.S = (w * X).t();
  out.A = (w.t() * arma::inv(w * w.t())).t();
  return out;
}

// Pearson correlation of every row of D with y.
static arma::vec row_cor(const arma::mat& D, const arma::vec& y) {
  const arma::mat Dc = center_rows(D);
  const arma::vec yc = y - arma::mean(y);
  const arma::vec num = Dc * yc;
  const arma::vec den = arma::sqrt(arma::sum(arma::square(Dc), 1)) * arma::norm(yc);
  return num / den;
}

// ---------- estimators ----------

SurrogateFit isva_estimator(const Eigen::MatrixXd& dat_e, const Eigen::MatrixXd& mod_e,
                            const Eigen::MatrixXd& /*mod0*/, std::optional<int> n_sv,
                            std::mt19937_64& rng)
{
  const arma::mat D = to_arma(dat_e), M = to_arma(mod_e);
  const arma::mat res = residualize(D, M);
  const int k = n_sv ? *n_sv : est_dim_rmt(res);
  check_factor_count(k, D, M, "isva");
  if (k == 0) return empty_fit(CovariateSetKind::Isva, D.n_cols);

  const arma::uword m = D.n_rows, n = D.n_cols;
  const IcaResult ica = fast_ica(res, k, rng);
  const arma::mat comps = ica.A.t();               // samples x k
  arma::mat isv = comps;

  boost::math::normal_distribution<double> nd(0.0, 1.0 / std::sqrt((double)n - 3.0));
  for (int c = 0; c < k; ++c) {
    const arma::vec r = row_cor(D, comps.col(c));
    Eigen::VectorXd pv(m);
    for (arma::uword i = 0; i < m; ++i) {
      const double z = std::atanh(std::min(std::max(r[i], -1.0 + 1e-15), 1.0 - 1e-15));
      pv[i] = std::isfinite(z) ? 2.0 * boost::math::cdf(boost::math::complement(nd, std::fabs(z))) : 1.0;
    }
    const Eigen::VectorXd q = p_adjust(pv, AdjustMethod::Bh);
    arma::uword nsig = 0;
    for (Eigen::Index i = 0; i < q.size(); ++i) if (q[i] < 0.05) ++nsig;
    nsig = std::min<arma::uword>(std::max<arma::uword>(nsig, 500), m);

    std::vector<arma::uword> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](arma::uword a, arma::uword b) { return pv[a] < pv[b]; });
    const arma::uvec top(std::vector<arma::uword>(order.begin(), order.begin() + nsig));

    const IcaResult sub = fast_ica(D.rows(top), k, rng);
    arma::uword best = 0;
    double best_cor = -1.0;
    for (int j = 0; j < k; ++j) {
      const arma::vec a = sub.A.row(j).t();
      const double cr = std::fabs(arma::as_scalar(arma::cor(comps.col(c), a)));
      if (cr > best_cor) { best_cor = cr; best = (arma::uword)j; }
    }
    isv.col(c) = sub.A.row(best).t();
  }

  SurrogateFit out;
  out.kind = CovariateSetKind::Isva;
  out.factors = to_eigen(isv);
  out.n_sv = k;
  return out;
}

// Posterior probability that a site is affected by the latent factors but
// not by the variable of interest.
static arma::vec latent_only_prob(const arma::mat& D, const arma::mat& M, const arma::mat& M0,
                                  const arma::mat& U)
{
  const arma::vec pb = 1.0 - edge_lfdr(f_pvalue(D, arma::join_rows(M, U), arma::join_rows(M0, U)));
  const arma::vec pg = 1.0 - edge_lfdr(f_pvalue(D, arma::join_rows(M0, U), M0));
  return pg % (1.0 - pb);
}

SurrogateFit sva_estimator(const Eigen::MatrixXd& dat_e, const Eigen::MatrixXd& mod_e,
                           const Eigen::MatrixXd& mod0_e, std::optional<int> n_sv,
                           std::mt19937_64& rng)
{
  const arma::mat D = to_arma(dat_e), M = to_arma(mod_e), M0 = to_arma(mod0_e);
  const int k = n_sv ? *n_sv : num_sv_be(D, M, rng);
  check_factor_count(k, D, M, "sva");
  if (k == 0) return empty_fit(CovariateSetKind::Sva, D.n_cols);

  const arma::mat res = residualize(D, M);
  arma::mat U = top_eigvecs(res.t() * res, k);
  for (int it = 0; it < 5; ++it) {
    const arma::vec pprob = latent_only_prob(D, M, M0, U);
    arma::mat dats = D.each_col() % pprob;
    dats = center_rows(dats);
    U = top_eigvecs(dats.t() * dats, k);
  }

  SurrogateFit out;
  out.kind = CovariateSetKind::Sva;
  out.factors = to_eigen(U);
  out.n_sv = k;
  return out;
}

SurrogateFit smartsva_estimator(const Eigen::MatrixXd& dat_e, const Eigen::MatrixXd& mod_e,
                                const Eigen::MatrixXd& mod0_e, std::optional<int> n_sv,
                                std::mt19937_64& /*rng*/)
{
  static constexpr double kAlpha = 0.25;
  static constexpr double kEpsilon = 1e-3;
  static constexpr int kMaxIter = 100;

  const arma::mat D = to_arma(dat_e), M = to_arma(mod_e), M0 = to_arma(mod0_e);
  const arma::mat res = residualize(D, M);
  const int k = n_sv ? *n_sv : est_dim_rmt(res) + 1;
  check_factor_count(k, D, M, "smartsva");
  if (k == 0) return empty_fit(CovariateSetKind::SmartSva, D.n_cols);

  arma::mat U = top_eigvecs(res.t() * res, k);
  int it = 0;
  for (; it < kMaxIter; ++it) {
    const arma::vec w = arma::pow(latent_only_prob(D, M, M0, U), kAlpha);
    arma::mat dats = D.each_col() % w;
    dats = center_rows(dats);
    const arma::mat next = top_eigvecs(dats.t() * dats, k);
    // cosines of the principal angles between successive subspaces
    const arma::vec cosines = arma::svd(arma::mat(next.t() * U));
    U = next;
    if (1.0 - arma::mean(cosines) < kEpsilon) break;
  }
  if (it == kMaxIter) warn("latent", "SmartSVA did not converge in " + std::to_string(kMaxIter) + " iterations");

  SurrogateFit out;
  out.kind = CovariateSetKind::SmartSva;
  out.factors = to_eigen(U);
  out.n_sv = k;
  return out;
}

// ---------- registration ----------

void register_default_estimators() {
  register_surrogate_estimator(CovariateSetKind::Isva,     &isva_estimator);
  register_surrogate_estimator(CovariateSetKind::Sva,      &sva_estimator);
  register_surrogate_estimator(CovariateSetKind::SmartSva, &smartsva_estimator);
}

} // namespace ewas
