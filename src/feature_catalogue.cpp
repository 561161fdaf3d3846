#include "feature_catalogue.hpp"
#include "io.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace ewas {

FeatureCatalogue::FeatureCatalogue(std::string name, std::vector<Feature> features)
  : name_(std::move(name)), features_(std::move(features)) {
  index_.reserve(features_.size() * 2);
  for (size_t i = 0; i < features_.size(); ++i) {
    if (!index_.emplace(features_[i].name, i).second)
      throw std::invalid_argument("Duplicate site '" + features_[i].name +
                                  "' in featureset " + name_);
  }
}

FeatureCatalogue FeatureCatalogue::load(const std::string& name, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open featureset manifest: " + path);

  std::string line;
  if (!std::getline(in, line)) throw std::runtime_error("Empty featureset manifest: " + path);
  const char delim = detect_delimiter(line);
  auto header = split_simple(line, delim);
  for (auto& h : header) h = trim(h);

  auto col = [&](const char* key) {
    for (int i = 0; i < (int)header.size(); ++i) if (ieq(header[i], key)) return i;
    throw std::runtime_error(std::string("Featureset manifest lacks column '") + key + "': " + path);
  };
  const int i_name = col("name");
  const int i_chr  = col("chromosome");
  const int i_pos  = col("position");
  const int need   = std::max(i_name, std::max(i_chr, i_pos));

  std::vector<Feature> feats;
  feats.reserve(1 << 16);
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    auto toks = split_simple(line, delim);
    if ((int)toks.size() <= need)
      throw std::runtime_error("Malformed featureset row in " + path + ": " + line);
    Feature f;
    f.name       = trim(toks[i_name]);
    f.chromosome = trim(toks[i_chr]);
    const std::string pos = trim(toks[i_pos]);
    f.position   = is_missing(pos) ? 0L : std::stol(pos);
    feats.push_back(std::move(f));
  }
  return FeatureCatalogue(name, std::move(feats));
}

const Feature& FeatureCatalogue::lookup(const std::string& site) const {
  auto it = index_.find(site);
  if (it == index_.end())
    throw std::invalid_argument("Site '" + site + "' not in featureset " + name_);
  return features_[it->second];
}

bool FeatureCatalogue::is_autosome(const std::string& chromosome) {
  std::string c = chromosome;
  if (c.size() > 3 && ieq(c.substr(0, 3), "chr")) c = c.substr(3);
  if (c.empty() || c.size() > 2) return false;
  for (char ch : c) if (ch < '0' || ch > '9') return false;
  const int k = std::stoi(c);
  return k >= 1 && k <= 22;
}

std::vector<std::string> FeatureCatalogue::autosomal_sites() const {
  std::vector<std::string> out;
  out.reserve(features_.size());
  for (const auto& f : features_) if (is_autosome(f.chromosome)) out.push_back(f.name);
  return out;
}

void FeatureRegistry::add(FeatureCatalogue catalogue) {
  for (const auto& c : catalogues_)
    if (c.name() == catalogue.name())
      throw std::invalid_argument("Featureset registered twice: " + c.name());
  catalogues_.push_back(std::move(catalogue));
}

FeatureRegistry FeatureRegistry::load(const std::vector<std::pair<std::string, std::string>>& manifests) {
  FeatureRegistry reg;
  for (const auto& kv : manifests) reg.add(FeatureCatalogue::load(kv.first, kv.second));
  return reg;
}

const FeatureCatalogue& FeatureRegistry::get(const std::string& name) const {
  for (const auto& c : catalogues_) if (c.name() == name) return c;
  throw std::invalid_argument("Unknown featureset: " + name);
}

std::string FeatureRegistry::guess(const std::vector<std::string>& sites) const {
  if (catalogues_.empty()) throw std::invalid_argument("No featuresets registered");
  size_t best = 0, best_hits = 0;
  for (size_t k = 0; k < catalogues_.size(); ++k) {
    size_t hits = 0;
    for (const auto& s : sites) if (catalogues_[k].contains(s)) ++hits;
    if (hits > best_hits) { best_hits = hits; best = k; }
  }
  return catalogues_[best].name();
}

} // namespace ewas
