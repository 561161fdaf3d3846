#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ewas {

class FeatureRegistry;

// -------- Configuration --------

struct EwasConfig {
  // Latent factor estimators
  bool isva{true};
  bool sva{true};
  bool smartsva{false};
  std::optional<int> n_sv;               // unset: estimated per algorithm

  // Deprecated switches; setting either is rejected
  bool isva0{false};
  bool isva1{false};

  // Outlier suppression
  std::optional<double> winsorize_pct{0.05};  // unset: no winsorizing
  std::optional<double> outlier_iqr_factor;   // unset: no IQR masking (3 is typical)

  // Regression
  bool robust{true};                     // robust empirical Bayes prior
  bool rlm{false};                       // robust (Huber) per-site regression
  bool lmfit_safer{false};               // partitioned fit to bound memory
  int  n_partitions{8};

  // Surrogate variable site selection
  std::optional<int> most_variable;      // unset: all autosomal sites
  std::string featureset;                // empty: guessed from site ids

  std::uint64_t random_seed{20161123};
  int  nthreads{1};
  bool verbose{false};
};

struct Paths {
  std::string beta;                                   // sites x samples TSV
  std::string samples;                                // sample sheet
  std::map<std::string, std::string> featuresets;     // name -> manifest TSV
  std::string out_prefix;
};

// -------- Inputs --------

// Rows = sites, columns = samples. NaN marks a missing value.
struct MethylationMatrix {
  std::vector<std::string> sites;
  std::vector<std::string> samples;
  Eigen::MatrixXd values;

  int n_sites() const { return static_cast<int>(values.rows()); }
  int n_samples() const { return static_cast<int>(values.cols()); }
};

// NaN = missing
struct NumericValues {
  std::vector<double> values;
};

// "" or "NA" = missing. `levels` fixes the level order; empty means sorted
// distinct values. Only an ordered variable may have more than two levels.
struct CategoricalValues {
  std::vector<std::string> values;
  std::vector<std::string> levels;
  bool ordered{false};
};

using VariableValues = std::variant<NumericValues, CategoricalValues>;

struct Covariate {
  std::string name;
  VariableValues values;
};

struct MatrixWeights { Eigen::MatrixXd w; };   // sites x samples
struct SampleWeights { Eigen::VectorXd w; };   // one per sample
struct SiteWeights   { Eigen::VectorXd w; };   // one per site

using Weights = std::variant<std::monostate, MatrixWeights, SampleWeights, SiteWeights>;

struct EwasInput {
  MethylationMatrix beta;
  VariableValues variable;
  std::vector<Covariate> covariates;                 // empty: none
  std::optional<std::vector<std::string>> batch;     // random-effect block
  Weights weights;
  std::optional<std::vector<double>> cell_counts;    // target cell type proportion
};

// -------- Intermediate forms --------

// Numeric design, row-aligned with samples.
struct Design {
  Eigen::MatrixXd X;                  // n x p
  std::vector<std::string> colnames;  // length p

  int n() const { return static_cast<int>(X.rows()); }
  int p() const { return static_cast<int>(X.cols()); }
};

// Catalogue iteration order is the enumeration order.
enum class CovariateSetKind { None = 0, All, Isva, Sva, SmartSva };

const char* covariate_set_name(CovariateSetKind kind);

struct CovariateSet {
  CovariateSetKind kind{CovariateSetKind::None};
  Design covariates;                  // no intercept; p == 0 for "none"
};

// Raw output of one surrogate variable estimator.
struct SurrogateFit {
  CovariateSetKind kind{CovariateSetKind::Sva};
  Eigen::MatrixXd factors;            // samples x n_sv
  int n_sv{0};
};

// -------- Outputs --------

enum class BatchModel {
  None,                  // no batch supplied
  RandomEffect,          // fitted with the consensus block correlation
  FixedEffectsFallback   // random-effect fit failed; batch dropped
};

struct SiteTable {
  std::vector<std::string> sites;
  Eigen::VectorXd p_value;
  Eigen::VectorXd fdr;
  Eigen::VectorXd p_holm;
  Eigen::VectorXd t_statistic;
  Eigen::VectorXd coefficient;
  Eigen::VectorXd ci_high;
  Eigen::VectorXd ci_low;
  Eigen::VectorXd se;
  std::vector<int> n;                  // non-missing observations per site

  // filled during result assembly
  std::vector<std::string> chromosome;
  std::vector<long> position;
};

struct AnalysisResult {
  CovariateSetKind kind{CovariateSetKind::None};
  Design design;
  BatchModel batch_model{BatchModel::None};
  std::string batch_error;             // set on FixedEffectsFallback
  std::optional<double> batch_cor;     // consensus intra-block correlation
  bool cell_type_interaction{false};
  SiteTable table;
};

struct OutlierCoord {
  int site;
  int sample;                          // index into retained samples
};

struct EwasResult {
  std::vector<int> samples;            // retained column indices of the input
  std::vector<std::string> sample_ids;
  VariableValues variable;             // original values, retained samples
  std::vector<Covariate> covariates;   // original values, retained samples
  EwasConfig params;
  std::string featureset;

  std::vector<std::string> sites;
  std::vector<CovariateSetKind> set_kinds;
  Eigen::MatrixXd p_value;             // sites x sets
  Eigen::MatrixXd coefficient;         // sites x sets
  std::vector<AnalysisResult> analyses;

  std::optional<SurrogateFit> surrogate;   // last estimator that ran
  std::vector<OutlierCoord> too_hi;
  std::vector<OutlierCoord> too_lo;
};

// Full pipeline: preprocessing, outlier suppression, latent factors,
// one regression per covariate set, result assembly.
EwasResult run_ewas(const EwasConfig& cfg,
                    const EwasInput& input,
                    const FeatureRegistry& features);

} // namespace ewas
