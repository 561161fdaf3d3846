#include <gtest/gtest.h>

#include "preprocess_engine.hpp"
#include "test_data.hpp"

#include <limits>

using namespace ewas;
using ewas_test::as_numeric;

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

namespace {

EwasInput basic_input(int G, int n) {
  EwasInput in;
  in.beta = ewas_test::random_matrix(G, n, 3);
  in.variable = as_numeric(ewas_test::alternating(n));
  return in;
}

} // namespace

TEST(SimplifyVariable, BinaryBecomesZeroOne) {
  CategoricalValues c{{"case", "control", "case", "NA"}, {}, false};
  auto v = simplify_variable(c);
  ASSERT_EQ(v.size(), 4);
  EXPECT_EQ(v[0], 0.0);   // "case" sorts first
  EXPECT_EQ(v[1], 1.0);
  EXPECT_EQ(v[2], 0.0);
  EXPECT_TRUE(std::isnan(v[3]));
}

TEST(SimplifyVariable, ExplicitLevelsFixTheReference) {
  CategoricalValues c{{"case", "control", "case"}, {"control", "case"}, false};
  auto v = simplify_variable(c);
  EXPECT_EQ(v[0], 1.0);
  EXPECT_EQ(v[1], 0.0);
}

TEST(SimplifyVariable, OrderedBecomesRanks) {
  CategoricalValues c{{"low", "high", "mid", ""}, {"low", "mid", "high"}, true};
  auto v = simplify_variable(c);
  EXPECT_EQ(v[0], 1.0);
  EXPECT_EQ(v[1], 3.0);
  EXPECT_EQ(v[2], 2.0);
  EXPECT_TRUE(std::isnan(v[3]));
}

TEST(SimplifyVariable, RejectsUnorderedWithThreeLevels) {
  CategoricalValues c{{"a", "b", "c", "a"}, {}, false};
  EXPECT_THROW(simplify_variable(c), std::invalid_argument);
}

TEST(SimplifyVariable, RejectsUndeclaredLevel) {
  CategoricalValues c{{"a", "b", "z"}, {"a", "b"}, false};
  EXPECT_THROW(simplify_variable(c), std::invalid_argument);
}

TEST(SimplifyCovariates, ExpandsUnorderedFactorsIntoIndicators) {
  std::vector<Covariate> covs{
    {"age", NumericValues{{30, 40, 50, 60}}},
    {"site", CategoricalValues{{"A", "B", "C", "B"}, {}, false}},
  };
  auto d = simplify_covariates(covs);
  ASSERT_EQ(d.p(), 3);
  EXPECT_EQ(d.colnames[0], "age");
  EXPECT_EQ(d.colnames[1], "siteB");
  EXPECT_EQ(d.colnames[2], "siteC");
  EXPECT_EQ(d.X(0, 1), 0.0);
  EXPECT_EQ(d.X(1, 1), 1.0);
  EXPECT_EQ(d.X(2, 2), 1.0);
  EXPECT_EQ(d.X(3, 2), 0.0);
}

TEST(SimplifyCovariates, MissingFactorValueMarksEveryIndicator) {
  std::vector<Covariate> covs{{"site", CategoricalValues{{"A", "NA", "C", "B"}, {}, false}}};
  auto d = simplify_covariates(covs);
  ASSERT_EQ(d.p(), 2);
  EXPECT_TRUE(std::isnan(d.X(1, 0)));
  EXPECT_TRUE(std::isnan(d.X(1, 1)));
}

TEST(DropZeroVariance, RemovesConstantColumns) {
  Design d;
  d.X.resize(4, 3);
  d.X << 1, 2, NaN,
         1, 3, 5,
         1, 4, NaN,
         1, 5, NaN;
  d.colnames = {"const", "ok", "single"};
  EXPECT_EQ(drop_zero_variance_columns(d), 2);
  ASSERT_EQ(d.p(), 1);
  EXPECT_EQ(d.colnames[0], "ok");
  EXPECT_EQ(d.X(3, 0), 5.0);
}

TEST(PreprocessEngine, RemovesSamplesWithMissingVariable) {
  auto reg = ewas_test::make_registry(10);
  EwasInput in = basic_input(10, 6);
  in.variable = NumericValues{{0, NaN, 1, 0, NaN, 1}};
  in.batch = std::vector<std::string>{"a", "a", "b", "b", "c", "c"};
  in.cell_counts = std::vector<double>{0.1, 0.2, 0.3, 0.4, 0.5, 0.6};

  PreprocessEngine pre(ewas_test::plain_config(), reg);
  auto out = pre.run(in);

  EXPECT_EQ(out.samples, (std::vector<int>{0, 2, 3, 5}));
  EXPECT_EQ(out.n_removed_samples, 2);
  EXPECT_EQ(out.beta.n_samples(), 4);
  EXPECT_EQ(out.beta.samples[1], "S3");
  EXPECT_EQ(out.beta.values(4, 3), in.beta.values(4, 5));
  EXPECT_EQ(out.variable.size(), 4);
  EXPECT_EQ(*out.batch, (std::vector<std::string>{"a", "b", "b", "c"}));
  EXPECT_DOUBLE_EQ((*out.cell_counts)[3], 0.6);
  EXPECT_EQ(out.featureset, "test");
}

TEST(PreprocessEngine, RemovesSamplesWithMissingCovariate) {
  auto reg = ewas_test::make_registry(10);
  EwasInput in = basic_input(10, 6);
  in.covariates.push_back({"age", NumericValues{{30, 41, NaN, 52, 38, 45}}});

  auto out = PreprocessEngine(ewas_test::plain_config(), reg).run(in);
  EXPECT_EQ(out.samples, (std::vector<int>{0, 1, 3, 4, 5}));
  ASSERT_EQ(out.covariates.p(), 1);
  EXPECT_EQ(out.covariates.X(2, 0), 52.0);
  const auto& orig = std::get<NumericValues>(out.original_covariates[0].values);
  EXPECT_EQ(orig.values.size(), 5u);
}

TEST(PreprocessEngine, DropsZeroVarianceCovariates) {
  auto reg = ewas_test::make_registry(10);
  EwasInput in = basic_input(10, 6);
  in.covariates.push_back({"sex", NumericValues{{1, 1, 1, 1, 1, 1}}});
  in.covariates.push_back({"age", NumericValues{{30, 41, 29, 52, 38, 45}}});

  auto out = PreprocessEngine(ewas_test::plain_config(), reg).run(in);
  EXPECT_EQ(out.n_removed_covariates, 1);
  ASSERT_EQ(out.covariates.p(), 1);
  EXPECT_EQ(out.covariates.colnames[0], "age");
}

TEST(PreprocessEngine, ExpandsSampleWeights) {
  auto reg = ewas_test::make_registry(10);
  EwasInput in = basic_input(10, 4);
  Eigen::VectorXd w(4);
  w << 1, 2, 3, 4;
  in.weights = SampleWeights{w};

  auto out = PreprocessEngine(ewas_test::plain_config(), reg).run(in);
  ASSERT_TRUE(out.weights.has_value());
  EXPECT_EQ(out.weights->rows(), 10);
  EXPECT_EQ(out.weights->cols(), 4);
  EXPECT_EQ((*out.weights)(7, 2), 3.0);
}

TEST(PreprocessEngine, RejectsDeprecatedSwitches) {
  auto reg = ewas_test::make_registry(10);
  EwasConfig cfg = ewas_test::plain_config();
  cfg.isva0 = true;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(basic_input(10, 6)), std::invalid_argument);
  cfg.isva0 = false;
  cfg.isva1 = true;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(basic_input(10, 6)), std::invalid_argument);
}

TEST(PreprocessEngine, RejectsOutOfRangeSettings) {
  auto reg = ewas_test::make_registry(10);
  auto in = basic_input(10, 6);

  EwasConfig cfg = ewas_test::plain_config();
  cfg.most_variable = 1;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);
  cfg.most_variable = 11;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);
  cfg.most_variable = 10;
  EXPECT_NO_THROW(PreprocessEngine(cfg, reg).run(in));

  cfg = ewas_test::plain_config();
  cfg.winsorize_pct = 0.5;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);
  cfg.winsorize_pct = 0.0;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);

  cfg = ewas_test::plain_config();
  cfg.outlier_iqr_factor = -1.0;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);

  cfg = ewas_test::plain_config();
  cfg.n_sv = -2;
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);
}

TEST(PreprocessEngine, RejectsMismatchedLengths) {
  auto reg = ewas_test::make_registry(10);
  auto in = basic_input(10, 6);
  in.variable = NumericValues{{0, 1, 0}};
  EXPECT_THROW(PreprocessEngine(ewas_test::plain_config(), reg).run(in), std::invalid_argument);

  in = basic_input(10, 6);
  in.weights = SiteWeights{Eigen::VectorXd::Ones(3)};
  EXPECT_THROW(PreprocessEngine(ewas_test::plain_config(), reg).run(in), std::invalid_argument);
}

TEST(PreprocessEngine, RejectsSiteOutsideFeatureset) {
  auto reg = ewas_test::make_registry(5);
  auto in = basic_input(10, 6);
  EwasConfig cfg = ewas_test::plain_config();
  cfg.featureset = "test";
  EXPECT_THROW(PreprocessEngine(cfg, reg).run(in), std::invalid_argument);
}

TEST(PreprocessEngine, RejectsWhenNoSampleRemains) {
  auto reg = ewas_test::make_registry(10);
  auto in = basic_input(10, 3);
  in.variable = NumericValues{{NaN, NaN, NaN}};
  EXPECT_THROW(PreprocessEngine(ewas_test::plain_config(), reg).run(in), std::invalid_argument);
}
