#include "Classifier.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

namespace fs = std::filesystem;

namespace ingest {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

bool oneOf(const std::string &ext, std::initializer_list<const char *> set) {
  return std::any_of(set.begin(), set.end(),
                     [&ext](const char *candidate) { return ext == candidate; });
}

bool anySegmentHidden(const std::string &lower) {
  std::stringstream ss(lower);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (segment.size() > 1 && segment[0] == '.' && segment != "..")
      return true;
  }
  return false;
}

} // namespace

PathTraits PathTraits::of(const std::string &relativePath) {
  PathTraits traits;
  traits.lower = relativePath;
  std::replace(traits.lower.begin(), traits.lower.end(), '\\', '/');
  std::transform(traits.lower.begin(), traits.lower.end(),
                 traits.lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto ext = fs::path(traits.lower).extension().string();
  if (!ext.empty() && ext[0] == '.')
    ext.erase(0, 1);
  traits.extension = ext;
  return traits;
}

bool isWebsiteScaffolding(const PathTraits &t) {
  return contains(t.lower, "node_modules") || contains(t.lower, "twemoji") ||
         contains(t.lower, "/assets/") || contains(t.lower, "runtime.") ||
         contains(t.lower, "modules.") ||
         oneOf(t.extension, {"woff", "woff2", "eot", "ttf"}) ||
         (t.extension == "svg" && contains(t.lower, "emoji"));
}

bool isConfigFile(const PathTraits &t) {
  return anySegmentHidden(t.lower) || contains(t.lower, ".config") ||
         contains(t.lower, "config/") ||
         oneOf(t.extension, {"env", "ini", "yaml", "yml"});
}

bool isUserMedia(const PathTraits &t) {
  return oneOf(t.extension, {"jpg", "jpeg", "png", "gif", "mp4", "mp3", "wav"}) &&
         !contains(t.lower, "twemoji") && !contains(t.lower, "/assets/");
}

bool isPersonalData(const PathTraits &t) {
  return oneOf(t.extension,
               {"json", "csv", "txt", "md", "doc", "docx", "pdf", "js"}) ||
         contains(t.lower, "data/") || contains(t.lower, "export") ||
         contains(t.lower, "backup");
}

std::vector<ClassificationRule> Classifier::defaultRules() {
  return {
      {FileCategory::WebsiteScaffolding, false,
       "Appears to be website/app scaffolding", isWebsiteScaffolding},
      {FileCategory::Config, false, "Appears to be configuration file",
       isConfigFile},
      {FileCategory::Media, true, "User media file", isUserMedia},
      {FileCategory::PersonalData, true, "Potential personal data file",
       isPersonalData},
  };
}

Classifier::Classifier() : m_rules(defaultRules()) {}

Classifier::Classifier(std::vector<ClassificationRule> rules)
    : m_rules(std::move(rules)) {}

FileRecommendation Classifier::classify(const std::string &relativePath,
                                        const fs::path &root) const {
  FileRecommendation rec;
  rec.path = relativePath;
  rec.absolutePath = root.empty() ? fs::path(relativePath) : root / relativePath;
  rec.shouldIngest = false;
  rec.category = FileCategory::Unknown;
  rec.reason = "Unknown file type";

  const auto traits = PathTraits::of(relativePath);
  for (const auto &rule : m_rules) {
    if (rule.matches && rule.matches(traits)) {
      rec.category = rule.category;
      rec.shouldIngest = rule.shouldIngest;
      rec.reason = rule.reason;
      break;
    }
  }
  return rec;
}

FileRecommendation Classifier::classifySingle(const fs::path &root,
                                              const fs::path &absolutePath) const {
  auto rel = absolutePath.lexically_normal().lexically_relative(
      root.lexically_normal());
  auto relStr = rel.generic_string();
  bool outside = rel.empty() || relStr == "." || relStr.rfind("..", 0) == 0;

  if (outside) {
    FileRecommendation rec;
    rec.path = absolutePath.filename().generic_string();
    if (rec.path.empty())
      rec.path = "unknown";
    rec.absolutePath = absolutePath;
    rec.shouldIngest = false;
    rec.category = FileCategory::Unknown;
    rec.reason = "Could not classify: path is outside " + root.generic_string();
    return rec;
  }

  auto rec = classify(relStr, root);
  rec.absolutePath = absolutePath;
  return rec;
}

} // namespace ingest
