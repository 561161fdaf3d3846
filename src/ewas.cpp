// ewas.cpp
// ------------------------------------------------------------------
// High-level orchestration of one association study. This implements
// ewas::run_ewas(): preprocessing, outlier suppression, latent factors,
// one regression per covariate set and result assembly.
// ------------------------------------------------------------------

#include "ewas.hpp"
#include "feature_catalogue.hpp"
#include "latent_factor_engine.hpp"
#include "log.hpp"
#include "outlier_filter.hpp"
#include "preprocess_engine.hpp"
#include "regression_engine.hpp"

#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ewas {

const char* covariate_set_name(CovariateSetKind kind) {
  switch (kind) {
    case CovariateSetKind::None:     return "none";
    case CovariateSetKind::All:      return "all";
    case CovariateSetKind::Isva:     return "isva";
    case CovariateSetKind::Sva:      return "sva";
    case CovariateSetKind::SmartSva: return "smartsva";
  }
  return "unknown";
}

static void annotate_(SiteTable& t, const FeatureCatalogue& cat) {
  t.chromosome.clear();
  t.position.clear();
  t.chromosome.reserve(t.sites.size());
  t.position.reserve(t.sites.size());
  for (const auto& s : t.sites) {
    const Feature& f = cat.lookup(s);
    t.chromosome.push_back(f.chromosome);
    t.position.push_back(f.position);
  }
}

EwasResult run_ewas(const EwasConfig& cfg,
                    const EwasInput& input,
                    const FeatureRegistry& features)
{
#ifdef _OPENMP
  if (cfg.nthreads > 0) omp_set_num_threads(cfg.nthreads);
#endif

  // --- Preprocess: validate, simplify, drop incomplete samples ---
  PreprocessEngine pre(cfg, features);
  PreOut prep = pre.run(input);
  const FeatureCatalogue& cat = features.get(prep.featureset);
  MethylationMatrix& beta = prep.beta;

  // --- Outlier suppression ---
  if (cfg.winsorize_pct) {
    msg(cfg.verbose, "outlier", "Winsorizing the methylation matrix at", *cfg.winsorize_pct);
    winsorize(beta.values, *cfg.winsorize_pct);
  }
  IqrMask mask;
  if (cfg.outlier_iqr_factor) {
    mask = mask_iqr_outliers(beta.values, *cfg.outlier_iqr_factor);
    msg(cfg.verbose, "outlier", "Set", mask.too_hi.size(), "high and", mask.too_lo.size(),
        "low outlier value(s) to missing.");
  }

  // --- Latent factors: covariate-set catalogue ---
  LatentFactorEngine lfe(cfg, cat);
  LatentOut lat = lfe.run(beta, prep.variable, prep.covariates);

  // --- One regression per covariate set ---
  RegressionEngine reg(cfg);
  EwasResult out;
  for (const CovariateSet& set : lat.sets) {
    msg(cfg.verbose, "ewas", "EWAS for covariate set", covariate_set_name(set.kind));
    AnalysisResult a = reg.run(beta, prep.variable, set, prep.batch, prep.weights, prep.cell_counts);
    annotate_(a.table, cat);
    out.set_kinds.push_back(set.kind);
    out.analyses.push_back(std::move(a));
  }

  // --- Assembly ---
  const int G = beta.n_sites(), S = (int)out.analyses.size();
  out.p_value.resize(G, S);
  out.coefficient.resize(G, S);
  for (int s = 0; s < S; ++s) {
    out.p_value.col(s) = out.analyses[s].table.p_value;
    out.coefficient.col(s) = out.analyses[s].table.coefficient;
  }
  out.samples = prep.samples;
  out.sample_ids = beta.samples;
  out.variable = prep.original_variable;
  out.covariates = prep.original_covariates;
  out.params = cfg;
  out.featureset = prep.featureset;
  out.sites = beta.sites;
  out.surrogate = std::move(lat.surrogate);
  out.too_hi = std::move(mask.too_hi);
  out.too_lo = std::move(mask.too_lo);
  return out;
}

} // namespace ewas
