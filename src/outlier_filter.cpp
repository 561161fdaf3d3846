#include "outlier_filter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ewas {

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

static std::vector<double> finite_sorted(const Eigen::MatrixXd& m, Eigen::Index row) {
  std::vector<double> x;
  x.reserve((size_t)m.cols());
  for (Eigen::Index j = 0; j < m.cols(); ++j) {
    const double v = m(row, j);
    if (!std::isnan(v)) x.push_back(v);
  }
  std::sort(x.begin(), x.end());
  return x;
}

// x sorted, non-empty
static double q_interp_sorted(const std::vector<double>& x, double prob) {
  const double h = (double)(x.size() - 1) * prob;
  const size_t j = (size_t)std::floor(h);
  if (j + 1 >= x.size()) return x.back();
  return x[j] + (h - (double)j) * (x[j + 1] - x[j]);
}

static double q_ecdf_sorted(const std::vector<double>& x, double prob) {
  const double np = (double)x.size() * prob;
  long k = (long)std::ceil(np - 1e-12) - 1;
  k = std::max(0L, std::min<long>(k, (long)x.size() - 1));
  return x[(size_t)k];
}

double quantile_interp(std::vector<double> x, double prob) {
  x.erase(std::remove_if(x.begin(), x.end(), [](double v){ return std::isnan(v); }), x.end());
  if (x.empty()) return NaN;
  std::sort(x.begin(), x.end());
  return q_interp_sorted(x, prob);
}

double quantile_ecdf(std::vector<double> x, double prob) {
  x.erase(std::remove_if(x.begin(), x.end(), [](double v){ return std::isnan(v); }), x.end());
  if (x.empty()) return NaN;
  std::sort(x.begin(), x.end());
  return q_ecdf_sorted(x, prob);
}

void winsorize(Eigen::MatrixXd& beta, double pct) {
  const Eigen::Index G = beta.rows();
#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (Eigen::Index g = 0; g < G; ++g) {
    auto x = finite_sorted(beta, g);
    if (x.empty()) continue;
    const double lo = q_ecdf_sorted(x, pct);
    const double hi = q_ecdf_sorted(x, 1.0 - pct);
    for (Eigen::Index j = 0; j < beta.cols(); ++j) {
      double& v = beta(g, j);
      if (std::isnan(v)) continue;
      if (v < lo) v = lo;
      else if (v > hi) v = hi;
    }
  }
}

IqrMask mask_iqr_outliers(Eigen::MatrixXd& beta, double k) {
  const Eigen::Index G = beta.rows();
  Eigen::VectorXd lower(G), upper(G);
#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (Eigen::Index g = 0; g < G; ++g) {
    auto x = finite_sorted(beta, g);
    if (x.empty()) { lower[g] = upper[g] = NaN; continue; }
    const double q1 = q_interp_sorted(x, 0.25);
    const double q3 = q_interp_sorted(x, 0.75);
    const double iqr = q3 - q1;
    lower[g] = q1 - k * iqr;
    upper[g] = q3 + k * iqr;
  }

  IqrMask out;
  for (Eigen::Index j = 0; j < beta.cols(); ++j) {
    for (Eigen::Index g = 0; g < G; ++g) {
      double& v = beta(g, j);
      if (std::isnan(v) || std::isnan(lower[g])) continue;
      if (v > upper[g])      { out.too_hi.push_back({(int)g, (int)j}); v = NaN; }
      else if (v < lower[g]) { out.too_lo.push_back({(int)g, (int)j}); v = NaN; }
    }
  }
  return out;
}

} // namespace ewas
