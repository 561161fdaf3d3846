#pragma once
#include "ewas.hpp"
#include "feature_catalogue.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ewas {

struct PreOut {
  std::vector<int> samples;           // retained column indices of the input matrix
  MethylationMatrix beta;             // retained columns only
  Eigen::VectorXd variable;           // canonical numeric form
  Design covariates;                  // simplified, zero-variance columns dropped
  std::optional<std::vector<std::string>> batch;
  std::optional<Eigen::MatrixXd> weights;   // canonical sites x samples
  std::optional<Eigen::VectorXd> cell_counts;

  VariableValues original_variable;   // retained samples, pre-simplification
  std::vector<Covariate> original_covariates;
  std::string featureset;

  int n_removed_samples{0};
  int n_removed_covariates{0};
};

// Keep the listed columns of the matrix, in order.
void apply_column_subset(MethylationMatrix& m, const std::vector<int>& keep);

VariableValues subset_values(const VariableValues& v, const std::vector<int>& keep);

size_t value_count(const VariableValues& v);

// Level order used for a categorical column (explicit levels, else sorted distinct).
std::vector<std::string> resolve_levels(const CategoricalValues& c);

// Binary -> {0,1}; ordered -> rank 1..L; numeric unchanged; missing -> NaN.
// Unordered categoricals with a level count other than two are rejected.
Eigen::VectorXd simplify_variable(const VariableValues& v);

// As simplify_variable, except unordered categoricals with more than two
// levels expand into one indicator column per non-reference level.
Design simplify_covariates(const std::vector<Covariate>& covs);

// Drops columns whose variance over the non-missing values is not positive.
// Returns the number of columns removed.
int drop_zero_variance_columns(Design& d);

class PreprocessEngine {
public:
  PreprocessEngine(const EwasConfig& cfg, const FeatureRegistry& features);

  // Validates the inputs, then:
  //  - simplifies the variable and covariates to numeric
  //  - keeps samples with no missing variable or covariate value
  //  - subsets matrix, batch, weights and cell counts consistently
  //  - drops zero-variance covariates
  PreOut run(const EwasInput& in) const;

private:
  const EwasConfig cfg_;
  const FeatureRegistry& features_;

  std::string validate_(const EwasInput& in) const;
  static std::optional<Eigen::MatrixXd> canonical_weights_(const Weights& w,
                                                           const std::vector<int>& keep,
                                                           int n_sites);
};

} // namespace ewas
