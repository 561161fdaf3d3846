#pragma once
#include "ewas.hpp"
#include <vector>

namespace ewas {

// Linear interpolation between order statistics of the non-missing values
// (the usual "type 7" sample quantile). NaN when no value is present.
double quantile_interp(std::vector<double> x, double prob);

// Order statistic at the inverse empirical CDF (the "type 1" sample quantile).
double quantile_ecdf(std::vector<double> x, double prob);

// Per site, clamps values below the pct-quantile and above the
// (1-pct)-quantile to those quantiles. Missing values stay missing.
// Thresholds are order statistics, so a second pass leaves the matrix unchanged.
void winsorize(Eigen::MatrixXd& beta, double pct);

struct IqrMask {
  std::vector<OutlierCoord> too_hi;
  std::vector<OutlierCoord> too_lo;
};

// Per site, sets values outside [Q1 - k*IQR, Q3 + k*IQR] to missing.
// Coordinates are listed sample by sample, site order within a sample.
IqrMask mask_iqr_outliers(Eigen::MatrixXd& beta, double k);

} // namespace ewas
