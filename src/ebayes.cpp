#include "ebayes.hpp"
#include "log.hpp"
#include "outlier_filter.hpp"

#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/polygamma.hpp>
#include <boost/math/special_functions/trigamma.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace ewas {

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
static constexpr double Inf = std::numeric_limits<double>::infinity();

double trigamma_inverse(double x) {
  if (!(x > 0.0)) throw std::invalid_argument("trigamma_inverse: argument must be positive");
  if (x > 1e7) return 1.0 / std::sqrt(x);
  if (x < 1e-6) return 1.0 / x;

  double y = 0.5 + 1.0 / x;
  for (int iter = 0; iter < 50; ++iter) {
    const double tri = boost::math::trigamma(y);
    const double dif = tri * (1.0 - tri / x) / boost::math::polygamma(2, y);
    y += dif;
    if (-dif / y < 1e-8) return y;
  }
  warn("regression", "trigamma_inverse: iteration limit exceeded");
  return y;
}

static double median_of(std::vector<double> v) {
  if (v.empty()) return NaN;
  std::sort(v.begin(), v.end());
  const size_t h = v.size() / 2;
  return v.size() % 2 ? v[h] : 0.5 * (v[h - 1] + v[h]);
}

// Moment step on log variances already floored and filtered.
static void moments(const std::vector<double>& z, const std::vector<double>& d,
                    double& emean, double& evar) {
  const size_t n = z.size();
  std::vector<double> e(n);
  double mean_tri = 0.0;
  for (size_t i = 0; i < n; ++i) {
    e[i] = z[i] - boost::math::digamma(d[i] / 2.0) + std::log(d[i] / 2.0);
    mean_tri += boost::math::trigamma(d[i] / 2.0);
  }
  mean_tri /= (double)n;
  emean = std::accumulate(e.begin(), e.end(), 0.0) / (double)n;
  double ss = 0.0;
  for (double v : e) ss += (v - emean) * (v - emean);
  evar = (n > 1 ? ss / (double)(n - 1) : 0.0) - mean_tri;
}

// Mean and variance of log F(d1, d2) winsorized at probabilities (pl, 1 - ph).
static std::pair<double, double> winsorized_logf_moments(double d1, double d2, double pl, double ph) {
  boost::math::fisher_f_distribution<double> fd(d1, d2);
  const double zlo = std::log(boost::math::quantile(fd, pl));
  const double zhi = std::log(boost::math::quantile(boost::math::complement(fd, ph)));
  auto dens = [&](double z) {
    const double f = std::exp(z);
    return boost::math::pdf(fd, f) * f;
  };
  using quad = boost::math::quadrature::gauss_kronrod<double, 61>;
  const double m1 = pl * zlo + ph * zhi +
                    quad::integrate([&](double z) { return z * dens(z); }, zlo, zhi);
  const double m2 = pl * zlo * zlo + ph * zhi * zhi +
                    quad::integrate([&](double z) { return z * z * dens(z); }, zlo, zhi);
  return {m1, m2 - m1 * m1};
}

static constexpr double kMinPriorDf = 0.2;
static constexpr double kMaxPriorDf = 1e6;   // stands in for infinity

// Prior df whose winsorized log F variance equals the observed one.
// The winsorized variance decreases in d2.
static double winsorized_df_prior(double d1, double zwvar, double pl, double ph) {
  if (!(zwvar > winsorized_logf_moments(d1, kMaxPriorDf, pl, ph).second)) return Inf;
  if (zwvar >= winsorized_logf_moments(d1, kMinPriorDf, pl, ph).second) return kMinPriorDf;
  double lo = std::log(kMinPriorDf), hi = std::log(kMaxPriorDf);
  for (int iter = 0; iter < 60 && hi - lo > 1e-6; ++iter) {
    const double mid = 0.5 * (lo + hi);
    if (winsorized_logf_moments(d1, std::exp(mid), pl, ph).second > zwvar) lo = mid;
    else hi = mid;
  }
  return std::exp(0.5 * (lo + hi));
}

VariancePrior fit_f_dist(const Eigen::VectorXd& s2,
                         const Eigen::VectorXd& df,
                         std::optional<std::pair<double, double>> winsor_tail_p)
{
  const Eigen::Index G = s2.size();
  VariancePrior prior;
  prior.df_prior = Eigen::VectorXd::Zero(G);

  std::vector<Eigen::Index> ok;
  for (Eigen::Index g = 0; g < G; ++g)
    if (std::isfinite(s2[g]) && df[g] > 1e-15 && s2[g] > -1e-15) ok.push_back(g);
  if (ok.empty()) {
    prior.s2_prior = NaN;
    return prior;
  }
  // A single site carries no information about the prior: ordinary t.
  if (ok.size() == 1) {
    prior.s2_prior = std::max(s2[ok[0]], 0.0);
    return prior;
  }

  std::vector<double> x(ok.size()), d(ok.size());
  for (size_t i = 0; i < ok.size(); ++i) { x[i] = std::max(s2[ok[i]], 0.0); d[i] = df[ok[i]]; }
  double m = median_of(x);
  if (m == 0.0) {
    warn("regression", "More than half of residual variances are exactly zero");
    m = 1.0;
  }
  std::vector<double> z(x.size());
  for (size_t i = 0; i < x.size(); ++i) {
    x[i] = std::max(x[i], 1e-5 * m);
    z[i] = std::log(x[i]);
  }

  double d0 = Inf;
  if (!winsor_tail_p) {
    double emean = 0.0, evar = 0.0;
    moments(z, d, emean, evar);
    if (evar > 0.0) {
      d0 = 2.0 * trigamma_inverse(evar);
      prior.s2_prior = std::exp(emean + boost::math::digamma(d0 / 2.0) - std::log(d0 / 2.0));
    } else {
      prior.s2_prior = std::accumulate(x.begin(), x.end(), 0.0) / (double)x.size();
    }
    prior.df_prior.setConstant(d0);
    return prior;
  }

  // Robust: match the winsorized mean and variance of log s2 to those of a
  // winsorized log F(d1, d0), d1 the median residual df.
  const double pl = winsor_tail_p->first, ph = winsor_tail_p->second;
  if (!(pl > 0.0 && pl < 0.5 && ph > 0.0 && ph < 0.5))
    throw std::invalid_argument("fit_f_dist: winsor tail probabilities must be in (0, 0.5)");
  const double zlo = quantile_interp(z, pl);
  const double zhi = quantile_interp(z, 1.0 - ph);
  std::vector<double> zw = z;
  for (double& v : zw) v = std::min(std::max(v, zlo), zhi);
  const double n = (double)zw.size();
  const double zwmean = std::accumulate(zw.begin(), zw.end(), 0.0) / n;
  double ss = 0.0;
  for (double v : zw) ss += (v - zwmean) * (v - zwmean);
  const double zwvar = ss / (n - 1.0);
  const double d1 = median_of(d);

  d0 = winsorized_df_prior(d1, zwvar, pl, ph);
  const double d0_eval = std::isfinite(d0) ? d0 : kMaxPriorDf;
  prior.s2_prior = std::exp(zwmean - winsorized_logf_moments(d1, d0_eval, pl, ph).first);
  prior.df_prior.setConstant(d0);
  if (!std::isfinite(d0)) return prior;

  // Sites further in the upper tail than their rank suggests are blended
  // towards an outlier prior df.
  const size_t nk = x.size();
  std::vector<double> F(nk), tail(nk), not_outlier(nk);
  for (size_t i = 0; i < nk; ++i) {
    F[i] = x[i] / prior.s2_prior;
    boost::math::fisher_f_distribution<double> fd(d[i], d0);
    tail[i] = boost::math::cdf(boost::math::complement(fd, F[i]));
  }
  std::vector<size_t> order(nk);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return F[a] < F[b]; });
  std::vector<double> rank(nk);
  for (size_t i = 0; i < nk;) {
    size_t j = i;
    while (j + 1 < nk && F[order[j + 1]] == F[order[i]]) ++j;
    const double avg = 0.5 * (double)(i + j) + 1.0;
    for (size_t k = i; k <= j; ++k) rank[order[k]] = avg;
    i = j + 1;
  }
  bool any_outlier = false;
  for (size_t i = 0; i < nk; ++i) {
    const double emp = ((double)nk - rank[i] + 0.5) / (double)nk;
    not_outlier[i] = std::min(tail[i] / emp, 1.0);
    any_outlier = any_outlier || not_outlier[i] < 1.0;
  }
  if (!any_outlier) return prior;

  // Outlier df: the prior df whose log-variance spread explains the largest
  // residual log variance on top of its sampling variance.
  const double expected = std::log(prior.s2_prior) - boost::math::digamma(d0 / 2.0) + std::log(d0 / 2.0);
  double zmax = 0.0;
  for (size_t i = 0; i < nk; ++i)
    zmax = std::max(zmax, z[i] - boost::math::digamma(d[i] / 2.0) + std::log(d[i] / 2.0) - expected);
  const double var_outlier = zmax * zmax - boost::math::trigamma(d1 / 2.0);
  if (!(var_outlier > 0.0)) return prior;
  const double df_outlier = 2.0 * trigamma_inverse(var_outlier);
  if (!(df_outlier < d0)) return prior;

  std::vector<double> shrunk(nk);
  for (size_t i = 0; i < nk; ++i)
    shrunk[i] = not_outlier[i] * d0 + (1.0 - not_outlier[i]) * df_outlier;

  // monotone in the tail probability: most outlying sites first
  std::vector<size_t> by_tail(nk);
  std::iota(by_tail.begin(), by_tail.end(), 0);
  std::stable_sort(by_tail.begin(), by_tail.end(), [&](size_t a, size_t b) { return tail[a] < tail[b]; });
  std::vector<double> ordered(nk);
  for (size_t k = 0; k < nk; ++k) ordered[k] = shrunk[by_tail[k]];
  double run = 0.0, best = Inf;
  size_t imin = 0;
  for (size_t k = 0; k < nk; ++k) {
    run += ordered[k];
    const double mean = run / (double)(k + 1);
    if (mean < best) { best = mean; imin = k; }
  }
  for (size_t k = 0; k <= imin; ++k) ordered[k] = best;
  for (size_t k = 1; k < nk; ++k) ordered[k] = std::max(ordered[k], ordered[k - 1]);
  for (size_t k = 0; k < nk; ++k) prior.df_prior[ok[by_tail[k]]] = ordered[k];
  return prior;
}

EBayesFit ebayes(const LinearModelFit& fit,
                 int coef,
                 bool robust,
                 std::optional<double> winsor_tail_p)
{
  if (coef < 0 || coef >= fit.coefficients.cols())
    throw std::invalid_argument("ebayes: coefficient index out of range");
  const Eigen::Index G = fit.coefficients.rows();

  Eigen::VectorXd s2 = fit.sigma.array().square();
  const Eigen::VectorXd& d = fit.df_residual;

  std::optional<std::pair<double, double>> tail;
  if (robust) tail = winsor_tail_p ? std::make_pair(*winsor_tail_p, *winsor_tail_p)
                                   : std::make_pair(0.05, 0.1);
  EBayesFit out;
  out.prior = fit_f_dist(s2, d, tail);
  if (!std::isfinite(out.prior.s2_prior))
    throw std::runtime_error("ebayes: no site has residual degrees of freedom");

  double df_pooled = 0.0;
  for (Eigen::Index g = 0; g < G; ++g)
    if (std::isfinite(s2[g]) && d[g] > 0.0) df_pooled += d[g];

  out.s2_post.resize(G);
  out.t.resize(G);
  out.p_value.resize(G);
  out.df_total.resize(G);
  for (Eigen::Index g = 0; g < G; ++g) {
    const double d0 = out.prior.df_prior[g];
    double post = NaN;
    if (std::isfinite(s2[g])) {
      post = std::isfinite(d0) ? (d0 * out.prior.s2_prior + d[g] * s2[g]) / (d0 + d[g])
                               : out.prior.s2_prior;
    }
    const double dt = std::min(d[g] + d0, df_pooled);
    out.s2_post[g] = post;
    out.df_total[g] = dt;
    const double t = fit.coefficients(g, coef) / (fit.stdev_unscaled(g, coef) * std::sqrt(post));
    out.t[g] = t;
    if (std::isfinite(t) && dt > 0.0) {
      boost::math::students_t_distribution<double> td(dt);
      out.p_value[g] = 2.0 * boost::math::cdf(td, -std::fabs(t));
    } else {
      out.p_value[g] = NaN;
    }
  }
  return out;
}

Eigen::VectorXd p_adjust(const Eigen::VectorXd& p, AdjustMethod method) {
  std::vector<Eigen::Index> idx;
  for (Eigen::Index i = 0; i < p.size(); ++i) if (!std::isnan(p[i])) idx.push_back(i);
  Eigen::VectorXd out = Eigen::VectorXd::Constant(p.size(), NaN);
  const double n = (double)idx.size();
  if (idx.empty()) return out;

  if (method == AdjustMethod::Bh) {
    std::stable_sort(idx.begin(), idx.end(), [&](Eigen::Index a, Eigen::Index b) { return p[a] > p[b]; });
    double run = 1.0;
    for (size_t k = 0; k < idx.size(); ++k) {
      const double rank = n - (double)k;              // 1-based ascending rank
      run = std::min(run, n / rank * p[idx[k]]);
      out[idx[k]] = run;
    }
  } else {
    std::stable_sort(idx.begin(), idx.end(), [&](Eigen::Index a, Eigen::Index b) { return p[a] < p[b]; });
    double run = 0.0;
    for (size_t k = 0; k < idx.size(); ++k) {
      run = std::max(run, (n - (double)k) * p[idx[k]]);
      out[idx[k]] = std::min(1.0, run);
    }
  }
  return out;
}

} // namespace ewas
