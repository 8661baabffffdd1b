#pragma once

#include "types.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ingest {

/**
 * Lower-cased view of a relative path plus its extension (without the dot).
 * Rules only ever look at this, never at the filesystem.
 */
struct PathTraits {
  std::string lower;
  std::string extension;

  static PathTraits of(const std::string &relativePath);
};

struct ClassificationRule {
  FileCategory category;
  bool shouldIngest;
  std::string reason;
  std::function<bool(const PathTraits &)> matches;
};

// Individual predicates, in the order the default rule list applies them.
bool isWebsiteScaffolding(const PathTraits &traits);
bool isConfigFile(const PathTraits &traits);
bool isUserMedia(const PathTraits &traits);
bool isPersonalData(const PathTraits &traits);

/**
 * Classifier maps a path to an ingest/skip recommendation by walking an
 * ordered rule list. The first matching rule wins; no match means Unknown.
 */
class Classifier {
public:
  Classifier();
  explicit Classifier(std::vector<ClassificationRule> rules);

  static std::vector<ClassificationRule> defaultRules();

  FileRecommendation classify(const std::string &relativePath,
                              const std::filesystem::path &root = {}) const;

  // Never throws: a path outside root is reported as Unknown.
  FileRecommendation
  classifySingle(const std::filesystem::path &root,
                 const std::filesystem::path &absolutePath) const;

  const std::vector<ClassificationRule> &rules() const { return m_rules; }

private:
  std::vector<ClassificationRule> m_rules;
};

} // namespace ingest
