#include "FileSystemScanner.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest {

namespace {

// Build outputs, dependency caches and VCS metadata.
const std::array<const char *, 10> kSkipDirs = {
    "node_modules", "__pycache__", ".git",   ".svn", "target",
    "build",        "dist",        ".cache", "venv", ".venv"};

} // namespace

FileSystemScanner::FileSystemScanner(ScanLimits limits, Classifier classifier)
    : m_limits(limits), m_classifier(std::move(classifier)) {}

FileSystemScanner::~FileSystemScanner() = default;

std::string
FileSystemScanner::normalizePathSeparators(const std::string &path) const {
  std::string result = path;
#ifdef _WIN32
  std::replace(result.begin(), result.end(), '\\', '/');
#endif
  return result;
}

bool FileSystemScanner::isSkippedDirectory(const std::string &name) {
  return std::find_if(kSkipDirs.begin(), kSkipDirs.end(),
                      [&name](const char *dir) { return name == dir; }) !=
         kSkipDirs.end();
}

void FileSystemScanner::scanRecursive(const fs::path &root,
                                      const fs::path &current, std::size_t depth,
                                      std::vector<std::string> &files) const {
  if (depth > m_limits.maxDepth || files.size() >= m_limits.maxFiles)
    return;

  std::error_code ec;
  fs::directory_iterator it(current, ec);
  if (ec) {
    if (depth == 0)
      throw IoError("Failed to read directory " + current.string() + ": " +
                    ec.message());
    std::cerr << "[Scanner] Skipping unreadable directory " << current << ": "
              << ec.message() << std::endl;
    return;
  }

  for (auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      std::cerr << "[Scanner] Stopped listing " << current << ": "
                << ec.message() << std::endl;
      break;
    }
    if (files.size() >= m_limits.maxFiles)
      break;

    const auto &entry = *it;

    std::string name = entry.path().filename().string();
    if (name.empty() || name[0] == '.')
      continue;

    std::error_code typeEc;
    if (entry.is_directory(typeEc)) {
      if (isSkippedDirectory(name))
        continue;
      scanRecursive(root, entry.path(), depth + 1, files);
    } else if (entry.is_regular_file(typeEc)) {
      files.push_back(normalizePathSeparators(
          entry.path().lexically_relative(root).generic_string()));
    }
  }
}

std::vector<std::string>
FileSystemScanner::collectFiles(const fs::path &root) const {
  std::vector<std::string> files;
  scanRecursive(root, root, 0, files);
  return files;
}

ScanSummary
FileSystemScanner::summarize(const std::vector<FileRecommendation> &recs) {
  ScanSummary summary;
  for (const auto &rec : recs) {
    switch (rec.category) {
    case FileCategory::PersonalData:
      ++summary.personalData;
      break;
    case FileCategory::Media:
      ++summary.media;
      break;
    case FileCategory::Config:
      ++summary.config;
      break;
    case FileCategory::WebsiteScaffolding:
      ++summary.websiteScaffolding;
      break;
    case FileCategory::Work:
      ++summary.work;
      break;
    case FileCategory::Unknown:
      ++summary.unknown;
      break;
    }
  }
  return summary;
}

ScanResult FileSystemScanner::scanAndClassify(const fs::path &root) const {
  auto files = collectFiles(root);

  std::vector<FileRecommendation> recommendations;
  recommendations.reserve(files.size());
  for (const auto &file : files)
    recommendations.push_back(m_classifier.classify(file, root));

  ScanResult result;
  result.totalFiles = files.size();
  for (const auto &rec : recommendations) {
    if (rec.shouldIngest)
      result.recommended.push_back(rec);
    else
      result.skipped.push_back(rec);
  }
  result.summary = summarize(recommendations);

  std::cout << "[Scanner] Scanned " << result.totalFiles << " files under "
            << root << ": " << result.recommended.size() << " recommended, "
            << result.skipped.size() << " skipped" << std::endl;
  return result;
}

std::size_t FileSystemScanner::countFiles(const fs::path &folder) {
  std::size_t count = 0;
  std::error_code ec;
  if (!fs::is_directory(folder, ec))
    return 0;

  fs::recursive_directory_iterator it(
      folder, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    return 0;
  for (auto end = fs::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec)
      break;
    std::error_code typeEc;
    if (it->is_regular_file(typeEc))
      ++count;
  }
  return count;
}

} // namespace ingest
