#include "Uploader.hpp"
#include "Errors.hpp"
#include "MimeTypes.hpp"
#include "UuidUtils.hpp"
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include "picosha2.h"

namespace fs = std::filesystem;

namespace ingest {

Uploader::Uploader(IngestionApi &api, UploaderOptions options)
    : m_api(api), m_options(options),
      m_permits(options.maxConcurrentUploads) {}

Uploader::~Uploader() = default;

std::string Uploader::readFile(const fs::path &path) const {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw IoError("Failed to read file: " + path.string());

  std::string content((std::istreambuf_iterator<char>(ifs)),
                      (std::istreambuf_iterator<char>()));
  if (ifs.bad())
    throw IoError("Failed to read file: " + path.string());
  return content;
}

UploadResult Uploader::uploadAndIngest(const fs::path &path,
                                       const AppConfig &config) {
  std::string filename = path.filename().string();
  if (filename.empty())
    filename = "unknown";

  auto permit = m_permits.acquire();

  try {
    return tryUploadAndIngest(path, config, filename);
  } catch (const TransferError &e) {
    std::cerr << "[Uploader] " << filename << ": " << e.what() << std::endl;
    return UploadResult{filename, "", std::nullopt, UploadStatus::Error,
                        std::string(e.what()), ""};
  } catch (const IoError &e) {
    std::cerr << "[Uploader] " << filename << ": " << e.what() << std::endl;
    return UploadResult{filename, "", std::nullopt, UploadStatus::Error,
                        std::string(e.what()), ""};
  } catch (const std::exception &e) {
    // bad_alloc on an oversized file, or anything else from the remote seam.
    std::cerr << "[Uploader] " << filename << ": unexpected error: " << e.what()
              << std::endl;
    return UploadResult{filename, "", std::nullopt, UploadStatus::Error,
                        std::string(e.what()), ""};
  }
}

UploadResult Uploader::tryUploadAndIngest(const fs::path &path,
                                          const AppConfig &config,
                                          const std::string &filename) {
  // The slot is signed for this exact type; the PUT must send the same one.
  const std::string contentType = contentTypeFor(path);

  auto slot = withRetry(m_options.retry, "upload slot", [&] {
    return m_api.requestUploadSlot(config, filename, contentType);
  });

  const std::string bytes = readFile(path);
  const std::string checksum = picosha2::hash256_hex_string(bytes);

  withRetry(m_options.retry, "object upload", [&] {
    m_api.uploadObject(slot.uploadUrl, bytes, contentType);
  });
  std::cout << "[Uploader] Uploaded " << filename << " (" << bytes.size()
            << " bytes) as " << slot.s3Key << std::endl;

  UploadResult result;
  result.filename = filename;
  result.remoteKey = slot.s3Key;
  result.checksum = checksum;

  if (!config.autoIngest) {
    result.status = UploadStatus::Uploaded;
    return result;
  }

  const std::string jobId = UuidUtils::generate();
  const std::string bucket = slot.s3Bucket.value_or(config.defaultBucket);
  auto ticket = withRetry(m_options.retry, "ingest trigger", [&] {
    return m_api.triggerIngest(config, slot.s3Key, bucket, jobId);
  });

  result.progressId = ticket.progressId;
  result.status = UploadStatus::Ingesting;
  std::cout << "[Uploader] Ingestion triggered for " << filename
            << " (progress " << ticket.progressId << ")" << std::endl;
  return result;
}

} // namespace ingest
