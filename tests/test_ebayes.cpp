#include <gtest/gtest.h>

#include "ebayes.hpp"
#include "test_data.hpp"

#include <boost/math/distributions/students_t.hpp>
#include <boost/math/special_functions/trigamma.hpp>
#include <algorithm>
#include <limits>

using namespace ewas;

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

namespace {

// Residual variances from the hierarchical model: s2 / s0^2 ~ F(d, d0).
Eigen::VectorXd simulate_s2(int G, double d, double d0, double s0sq, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::chi_squared_distribution<double> chi_d(d), chi_d0(d0);
  Eigen::VectorXd s2(G);
  for (int g = 0; g < G; ++g) {
    const double sigma2 = d0 * s0sq / chi_d0(rng);
    s2[g] = sigma2 * chi_d(rng) / d;
  }
  return s2;
}

LinearModelFit fit_from(const Eigen::VectorXd& s2, double df, std::uint64_t seed) {
  const Eigen::Index G = s2.size();
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> z(0.0, 1.0);
  LinearModelFit fit;
  fit.coefficients.resize(G, 2);
  fit.stdev_unscaled = Eigen::MatrixXd::Constant(G, 2, 0.4);
  for (Eigen::Index g = 0; g < G; ++g) {
    fit.coefficients(g, 0) = 0.5;
    fit.coefficients(g, 1) = 0.4 * std::sqrt(s2[g]) * z(rng);
  }
  fit.df_residual = Eigen::VectorXd::Constant(G, df);
  fit.sigma = s2.cwiseSqrt();
  fit.amean = Eigen::VectorXd::Constant(G, 0.5);
  fit.coef_names = {"intercept", "variable"};
  return fit;
}

} // namespace

TEST(TrigammaInverse, InvertsTrigamma) {
  for (double y : {0.05, 0.7, 3.7, 42.0, 1500.0})
    EXPECT_NEAR(trigamma_inverse(boost::math::trigamma(y)), y, 1e-6 * y);
  EXPECT_THROW(trigamma_inverse(0.0), std::invalid_argument);
}

TEST(PAdjust, BenjaminiHochberg) {
  Eigen::VectorXd p(4);
  p << 0.01, 0.04, 0.03, 0.005;
  auto q = p_adjust(p, AdjustMethod::Bh);
  EXPECT_NEAR(q[0], 0.02, 1e-12);
  EXPECT_NEAR(q[1], 0.04, 1e-12);
  EXPECT_NEAR(q[2], 0.04, 1e-12);
  EXPECT_NEAR(q[3], 0.02, 1e-12);
}

TEST(PAdjust, Holm) {
  Eigen::VectorXd p(4);
  p << 0.01, 0.04, 0.03, 0.005;
  auto h = p_adjust(p, AdjustMethod::Holm);
  EXPECT_NEAR(h[0], 0.03, 1e-12);
  EXPECT_NEAR(h[1], 0.06, 1e-12);
  EXPECT_NEAR(h[2], 0.06, 1e-12);
  EXPECT_NEAR(h[3], 0.02, 1e-12);
}

TEST(PAdjust, MissingValuesStayMissingAndAreNotCounted) {
  Eigen::VectorXd p(3);
  p << 0.02, NaN, 0.04;
  auto q = p_adjust(p, AdjustMethod::Bh);
  EXPECT_TRUE(std::isnan(q[1]));
  EXPECT_NEAR(q[0], 0.04, 1e-12);
  EXPECT_NEAR(q[2], 0.04, 1e-12);
  auto h = p_adjust(p, AdjustMethod::Holm);
  EXPECT_TRUE(std::isnan(h[1]));
  EXPECT_NEAR(h[0], 0.04, 1e-12);
}

TEST(PAdjust, AdjustedValuesNeverFallBelowRaw) {
  std::mt19937_64 rng(31);
  std::uniform_real_distribution<double> u(0.0, 1.0);
  Eigen::VectorXd p(500);
  for (int i = 0; i < 500; ++i) p[i] = i < 50 ? u(rng) * 1e-4 : u(rng);
  auto q = p_adjust(p, AdjustMethod::Bh);
  auto h = p_adjust(p, AdjustMethod::Holm);
  for (int i = 0; i < 500; ++i) {
    EXPECT_GE(q[i], p[i]);
    EXPECT_GE(h[i], p[i]);
    EXPECT_GE(h[i], q[i] - 1e-15);
    EXPECT_LE(h[i], 1.0);
  }
}

TEST(FitFDist, RecoversHyperparameters) {
  auto s2 = simulate_s2(5000, 10.0, 6.0, 0.01, 32);
  auto prior = fit_f_dist(s2, Eigen::VectorXd::Constant(5000, 10.0));
  EXPECT_NEAR(prior.s2_prior, 0.01, 0.002);
  EXPECT_GT(prior.df_prior[0], 4.0);
  EXPECT_LT(prior.df_prior[0], 9.0);
}

TEST(FitFDist, RobustPriorDownweightsVarianceOutliers) {
  auto s2 = simulate_s2(2000, 8.0, 10.0, 0.01, 33);
  s2[0] = 5.0;
  auto prior = fit_f_dist(s2, Eigen::VectorXd::Constant(2000, 8.0), std::make_pair(0.05, 0.1));
  std::vector<double> df(prior.df_prior.data(), prior.df_prior.data() + prior.df_prior.size());
  std::sort(df.begin(), df.end());
  EXPECT_LT(prior.df_prior[0], 0.5 * df[df.size() / 2]);
}

TEST(FitFDist, RobustPriorRecoversHyperparameters) {
  auto s2 = simulate_s2(5000, 10.0, 6.0, 0.01, 36);
  auto prior = fit_f_dist(s2, Eigen::VectorXd::Constant(5000, 10.0), std::make_pair(0.05, 0.1));
  EXPECT_NEAR(prior.s2_prior, 0.01, 0.002);
  std::vector<double> df(prior.df_prior.data(), prior.df_prior.data() + prior.df_prior.size());
  std::sort(df.begin(), df.end());
  EXPECT_GT(df[df.size() / 2], 4.0);
  EXPECT_LT(df[df.size() / 2], 9.0);
}

TEST(FitFDist, SingleSiteGivesUnmoderatedPrior) {
  Eigen::VectorXd s2(3);
  s2 << 0.1, NaN, NaN;
  auto prior = fit_f_dist(s2, Eigen::VectorXd::Constant(3, 4.0));
  EXPECT_DOUBLE_EQ(prior.s2_prior, 0.1);
  EXPECT_EQ(prior.df_prior[0], 0.0);

  Eigen::VectorXd none = Eigen::VectorXd::Constant(2, NaN);
  EXPECT_TRUE(std::isnan(fit_f_dist(none, Eigen::VectorXd::Constant(2, 4.0)).s2_prior));
}

TEST(EBayes, PosteriorVarianceShrinksTowardsPrior) {
  auto s2 = simulate_s2(1000, 6.0, 8.0, 0.02, 34);
  auto fit = fit_from(s2, 6.0, 35);
  auto eb = ebayes(fit, 1, false);
  const double d0 = eb.prior.df_prior[0];
  ASSERT_TRUE(std::isfinite(d0));
  for (int g = 0; g < 1000; ++g) {
    const double lo = std::min(s2[g], eb.prior.s2_prior), hi = std::max(s2[g], eb.prior.s2_prior);
    EXPECT_GE(eb.s2_post[g], lo - 1e-15);
    EXPECT_LE(eb.s2_post[g], hi + 1e-15);
    EXPECT_NEAR(eb.df_total[g], 6.0 + d0, 1e-9);
    EXPECT_GE(eb.p_value[g], 0.0);
    EXPECT_LE(eb.p_value[g], 1.0);
    EXPECT_NEAR(eb.t[g], fit.coefficients(g, 1) / (0.4 * std::sqrt(eb.s2_post[g])), 1e-9);
  }
}

TEST(EBayes, TotalDegreesOfFreedomAreCappedByPooledDf) {
  Eigen::VectorXd s2(3);
  s2 << 0.010, 0.011, 0.0105;
  auto fit = fit_from(s2, 2.0, 36);
  auto eb = ebayes(fit, 1, false);
  for (int g = 0; g < 3; ++g) EXPECT_LE(eb.df_total[g], 6.0 + 1e-12);
}

TEST(EBayes, MissingSiteGivesMissingStatistics) {
  auto s2 = simulate_s2(50, 6.0, 8.0, 0.02, 37);
  auto fit = fit_from(s2, 6.0, 38);
  fit.sigma[4] = NaN;
  fit.coefficients(4, 1) = NaN;
  auto eb = ebayes(fit, 1, true);
  EXPECT_TRUE(std::isnan(eb.p_value[4]));
  EXPECT_FALSE(std::isnan(eb.p_value[5]));
}

TEST(EBayes, SingleSiteGivesOrdinaryT) {
  Eigen::VectorXd s2(1);
  s2 << 0.01;
  auto fit = fit_from(s2, 4.0, 39);
  for (bool robust : {false, true}) {
    auto eb = ebayes(fit, 1, robust);
    EXPECT_NEAR(eb.s2_post[0], 0.01, 1e-15);
    EXPECT_EQ(eb.df_total[0], 4.0);
    const double t = fit.coefficients(0, 1) / (0.4 * 0.1);
    EXPECT_NEAR(eb.t[0], t, 1e-9);
    boost::math::students_t_distribution<double> td(4.0);
    EXPECT_NEAR(eb.p_value[0], 2.0 * boost::math::cdf(td, -std::fabs(t)), 1e-12);
  }
}

TEST(EBayes, FailsWithoutUsableSites) {
  Eigen::VectorXd s2 = Eigen::VectorXd::Constant(2, NaN);
  auto fit = fit_from(s2, 4.0, 40);
  EXPECT_THROW(ebayes(fit, 1, false), std::runtime_error);
  EXPECT_THROW(ebayes(fit, 2, false), std::invalid_argument);
}
