#ifndef FILESYSTEMSCANNER_HPP
#define FILESYSTEMSCANNER_HPP

#include "Classifier.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ingest {

struct ScanLimits {
  std::size_t maxDepth = 10;
  std::size_t maxFiles = 5000;
};

class FileSystemScanner {
public:
  explicit FileSystemScanner(ScanLimits limits = {},
                             Classifier classifier = Classifier());
  ~FileSystemScanner();

  // Throws IoError when root itself cannot be listed. Hitting a limit is not
  // an error; the result is simply partial.
  ScanResult scanAndClassify(const std::filesystem::path &root) const;

  // Relative, '/'-separated paths of every collected file.
  std::vector<std::string> collectFiles(const std::filesystem::path &root) const;

  static ScanSummary summarize(const std::vector<FileRecommendation> &recs);
  static bool isSkippedDirectory(const std::string &name);
  static std::size_t countFiles(const std::filesystem::path &folder);

  const ScanLimits &limits() const { return m_limits; }

private:
  ScanLimits m_limits;
  Classifier m_classifier;

  void scanRecursive(const std::filesystem::path &root,
                     const std::filesystem::path &current, std::size_t depth,
                     std::vector<std::string> &files) const;
  std::string normalizePathSeparators(const std::string &path) const;
};

} // namespace ingest

#endif // FILESYSTEMSCANNER_HPP
