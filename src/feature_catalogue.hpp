#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace ewas {

struct Feature {
  std::string name;
  std::string chromosome;
  long position{0};
};

// Site annotation for one featureset (array platform).
class FeatureCatalogue {
public:
  FeatureCatalogue() = default;
  FeatureCatalogue(std::string name, std::vector<Feature> features);

  // Manifest TSV with a header naming at least: name, chromosome, position.
  static FeatureCatalogue load(const std::string& name, const std::string& path);

  const std::string& name() const { return name_; }
  size_t size() const { return features_.size(); }
  bool contains(const std::string& site) const { return index_.count(site) > 0; }

  // Throws std::invalid_argument for an unknown site.
  const Feature& lookup(const std::string& site) const;

  // Sites on chromosomes 1..22, in catalogue order.
  std::vector<std::string> autosomal_sites() const;

  static bool is_autosome(const std::string& chromosome);

private:
  std::string name_;
  std::vector<Feature> features_;
  std::unordered_map<std::string, size_t> index_;
};

class FeatureRegistry {
public:
  void add(FeatureCatalogue catalogue);

  // Loads every name -> manifest path pair.
  static FeatureRegistry load(const std::vector<std::pair<std::string, std::string>>& manifests);

  bool empty() const { return catalogues_.empty(); }
  const FeatureCatalogue& get(const std::string& name) const;

  // Name of the catalogue holding the most of `sites` (first registered on ties).
  std::string guess(const std::vector<std::string>& sites) const;

private:
  std::vector<FeatureCatalogue> catalogues_;
};

} // namespace ewas
