#include <gtest/gtest.h>

#include "io.hpp"
#include "log.hpp"
#include "test_data.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace ewas;
namespace fs = std::filesystem;

namespace {

class IoTest : public ::testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("ewas_io_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(dir);
  }
  void TearDown() override { fs::remove_all(dir); }

  std::string write(const std::string& name, const std::string& body) const {
    const fs::path p = dir / name;
    std::ofstream(p) << body;
    return p.string();
  }

  static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
};

} // namespace

TEST(TextHelpers, Basics) {
  EXPECT_TRUE(ieq("Chromosome", "chromosome"));
  EXPECT_FALSE(ieq("chr", "chrom"));
  EXPECT_EQ(trim("  \"S1\" \r"), "S1");
  EXPECT_EQ(split_simple("a,b,,c\r", ','), (std::vector<std::string>{"a", "b", "", "c"}));
  EXPECT_EQ(detect_delimiter("a\tb,c"), '\t');
  EXPECT_EQ(detect_delimiter("a,b"), ',');
  EXPECT_TRUE(is_missing("NA"));
  EXPECT_TRUE(is_missing(""));
  EXPECT_FALSE(is_missing("0"));
  EXPECT_TRUE(looks_numeric("1e-3"));
  EXPECT_TRUE(looks_numeric("NA"));
  EXPECT_FALSE(looks_numeric("case"));
  EXPECT_TRUE(std::isnan(parse_double("NaN")));
  EXPECT_DOUBLE_EQ(parse_double("0.25"), 0.25);
  EXPECT_THROW(parse_double("0.2x"), std::runtime_error);
}

TEST_F(IoTest, ReadsMatrixWithCornerCell) {
  auto path = write("beta.tsv",
                    "site\tS1\tS2\tS3\n"
                    "cg1\t0.1\t0.2\t0.3\n"
                    "cg2\t0.4\tNA\t0.6\n");
  auto m = read_methylation_matrix(path);
  EXPECT_EQ(m.sites, (std::vector<std::string>{"cg1", "cg2"}));
  EXPECT_EQ(m.samples, (std::vector<std::string>{"S1", "S2", "S3"}));
  EXPECT_DOUBLE_EQ(m.values(1, 2), 0.6);
  EXPECT_TRUE(std::isnan(m.values(1, 1)));
}

TEST_F(IoTest, ReadsMatrixWithoutCornerCell) {
  auto path = write("beta.csv",
                    "S1,S2\n"
                    "cg1,0.1,0.2\n"
                    "cg2,0.3,0.4\n");
  auto m = read_methylation_matrix(path);
  EXPECT_EQ(m.samples, (std::vector<std::string>{"S1", "S2"}));
  EXPECT_EQ(m.n_sites(), 2);
  EXPECT_DOUBLE_EQ(m.values(0, 1), 0.2);
}

TEST_F(IoTest, RejectsRaggedMatrix) {
  auto path = write("beta.tsv",
                    "site\tS1\tS2\n"
                    "cg1\t0.1\t0.2\n"
                    "cg2\t0.3\n");
  EXPECT_THROW(read_methylation_matrix(path), std::runtime_error);
  EXPECT_THROW(read_methylation_matrix((dir / "absent.tsv").string()), std::runtime_error);
}

TEST_F(IoTest, SampleSheetIsAlignedToMatrixColumns) {
  auto beta = read_methylation_matrix(write("beta.tsv",
                                            "site\tS1\tS2\tS3\n"
                                            "cg1\t0.1\t0.2\t0.3\n"));
  auto sheet = write("samples.tsv",
                     "id\tstatus\tage\tsmoking\tplate\tw\n"
                     "S3\tcase\t50\tnever\tp2\t1\n"
                     "S1\tcontrol\t40\tcurrent\tp1\t2\n"
                     "S2\tcase\tNA\tformer\tp1\t0.5\n"
                     "S9\tcontrol\t33\tnever\tp3\t1\n");
  SampleColumns cols;
  cols.variable = "status";
  cols.covariates = {"age", "smoking"};
  cols.batch = "plate";
  cols.weights = "w";
  cols.ordered_levels["smoking"] = {"never", "former", "current"};

  auto in = read_sample_sheet(sheet, cols, beta);
  const auto& status = std::get<CategoricalValues>(in.variable);
  EXPECT_EQ(status.values, (std::vector<std::string>{"control", "case", "case"}));
  EXPECT_FALSE(status.ordered);

  ASSERT_EQ(in.covariates.size(), 2u);
  const auto& age = std::get<NumericValues>(in.covariates[0].values);
  EXPECT_EQ(age.values[0], 40.0);
  EXPECT_TRUE(std::isnan(age.values[1]));
  const auto& smoking = std::get<CategoricalValues>(in.covariates[1].values);
  EXPECT_TRUE(smoking.ordered);
  EXPECT_EQ(smoking.values[2], "never");

  EXPECT_EQ(*in.batch, (std::vector<std::string>{"p1", "p1", "p2"}));
  const auto& w = std::get<SampleWeights>(in.weights);
  EXPECT_DOUBLE_EQ(w.w[1], 0.5);
  EXPECT_EQ(in.beta.samples, beta.samples);
}

TEST_F(IoTest, SampleSheetErrors) {
  auto beta = read_methylation_matrix(write("beta.tsv",
                                            "site\tS1\tS2\n"
                                            "cg1\t0.1\t0.2\n"));
  SampleColumns cols;
  cols.variable = "status";

  auto missing = write("missing.tsv", "id\tstatus\nS1\tcase\n");
  EXPECT_THROW(read_sample_sheet(missing, cols, beta), std::invalid_argument);

  auto dup = write("dup.tsv", "id\tstatus\nS1\tcase\nS2\tcase\nS1\tcontrol\n");
  EXPECT_THROW(read_sample_sheet(dup, cols, beta), std::invalid_argument);

  auto ok = write("ok.tsv", "id\tstatus\nS1\tcase\nS2\tcontrol\n");
  cols.covariates = {"age"};
  EXPECT_THROW(read_sample_sheet(ok, cols, beta), std::invalid_argument);
}

TEST_F(IoTest, WritesTablesAndSummary) {
  EwasResult res;
  res.sites = {"cg1", "cg2"};
  res.sample_ids = {"S1", "S2", "S3"};
  res.featureset = "test";
  res.set_kinds = {CovariateSetKind::None};
  res.p_value = Eigen::MatrixXd::Constant(2, 1, 0.5);
  res.coefficient = Eigen::MatrixXd::Constant(2, 1, 0.1);
  res.coefficient(1, 0) = std::numeric_limits<double>::quiet_NaN();
  res.too_hi.push_back({1, 2});

  AnalysisResult a;
  a.kind = CovariateSetKind::None;
  a.design.colnames = {"intercept", "variable"};
  auto& t = a.table;
  t.sites = res.sites;
  t.chromosome = {"1", "X"};
  t.position = {100, 200};
  for (Eigen::VectorXd* v : {&t.p_value, &t.fdr, &t.p_holm, &t.t_statistic, &t.coefficient,
                             &t.ci_high, &t.ci_low, &t.se})
    *v = Eigen::VectorXd::Constant(2, 0.5);
  t.n = {3, 2};
  res.analyses.push_back(a);

  const std::string prefix = (dir / "out" / "run").string();
  auto files = write_results(res, prefix);
  ASSERT_EQ(files.size(), 5u);
  for (const auto& f : files) EXPECT_TRUE(fs::exists(f)) << f;

  const std::string table = slurp(prefix + ".none.tsv");
  EXPECT_EQ(table.rfind("site\tchromosome\tposition\tp.value", 0), 0u);
  EXPECT_NE(table.find("cg2\tX\t200\t0.5"), std::string::npos);

  const std::string coef = slurp(prefix + ".coefficient.tsv");
  EXPECT_NE(coef.find("cg2\tNA"), std::string::npos);

  const std::string outliers = slurp(prefix + ".outliers.tsv");
  EXPECT_NE(outliers.find("cg2\tS3\thigh"), std::string::npos);

  const std::string summary = slurp(prefix + ".summary.json");
  EXPECT_NE(summary.find("\"featureset\": \"test\""), std::string::npos);
  EXPECT_NE(summary.find("\"surrogate\": null"), std::string::npos);
  EXPECT_NE(summary.find("\"covariate_set\": \"none\""), std::string::npos);
}

TEST_F(IoTest, SummaryStaysValidJsonAfterBatchFallback) {
  EwasResult res;
  res.sites = {"cg1"};
  res.sample_ids = {"S1", "S2", "S3"};
  res.featureset = "test";
  res.set_kinds = {CovariateSetKind::None};
  res.p_value = Eigen::MatrixXd::Constant(1, 1, 0.5);
  res.coefficient = Eigen::MatrixXd::Constant(1, 1, 0.1);

  AnalysisResult a;
  a.kind = CovariateSetKind::None;
  a.design.colnames = {"intercept", "variable"};
  a.batch_model = BatchModel::FixedEffectsFallback;
  a.batch_cor = std::numeric_limits<double>::quiet_NaN();
  a.batch_error = "matrix not positive definite";
  auto& t = a.table;
  t.sites = res.sites;
  t.chromosome = {"1"};
  t.position = {100};
  for (Eigen::VectorXd* v : {&t.p_value, &t.fdr, &t.p_holm, &t.t_statistic, &t.coefficient,
                             &t.ci_high, &t.ci_low, &t.se})
    *v = Eigen::VectorXd::Constant(1, 0.5);
  t.n = {3};
  res.analyses.push_back(a);

  const std::string prefix = (dir / "fallback").string();
  write_results(res, prefix);
  const std::string summary = slurp(prefix + ".summary.json");
  EXPECT_NE(summary.find("\"batch_model\": \"fixed_effects_fallback\""), std::string::npos);
  EXPECT_NE(summary.find("\"batch_cor\": null"), std::string::npos);
  EXPECT_NE(summary.find("\"batch_error\": \"matrix not positive definite\""), std::string::npos);
  EXPECT_EQ(summary.find(": NA"), std::string::npos);
  EXPECT_EQ(summary.find("nan"), std::string::npos);
}

TEST(Log, NarrationAndWarningsGoToStderr) {
  testing::internal::CaptureStderr();
  msg(true, "io", "Reading", 3, "files.");
  msg(false, "io", "hidden");
  warn("cli", "ignoring override without '=': x");
  const std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(err, "[io] Reading 3 files.\n[cli] warning: ignoring override without '=': x\n");
}
