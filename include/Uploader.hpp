#pragma once

#include "AppConfig.hpp"
#include "IngestionApi.hpp"
#include "PermitPool.hpp"
#include "RetryPolicy.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>

namespace ingest {

struct UploaderOptions {
  std::size_t maxConcurrentUploads = 3;
  RetryPolicy retry;
};

/**
 * Uploader runs the three-step transfer (upload slot, object PUT, ingest
 * trigger). Each step is retried on its own. At most
 * maxConcurrentUploads calls to uploadAndIngest do work at the same time;
 * the rest block waiting for a permit.
 */
class Uploader {
public:
  Uploader(IngestionApi &api, UploaderOptions options = {});
  ~Uploader();

  // Never throws. Failures come back as status == Error with a message.
  UploadResult uploadAndIngest(const std::filesystem::path &path,
                               const AppConfig &config);

  const PermitPool &permits() const { return m_permits; }

private:
  IngestionApi &m_api;
  UploaderOptions m_options;
  PermitPool m_permits;

  UploadResult tryUploadAndIngest(const std::filesystem::path &path,
                                  const AppConfig &config,
                                  const std::string &filename);
  std::string readFile(const std::filesystem::path &path) const;
};

} // namespace ingest
