#pragma once

#include "AppConfig.hpp"
#include <optional>
#include <string>

namespace ingest {

struct UploadSlot {
  std::string uploadUrl;
  std::string s3Key;
  std::optional<std::string> s3Bucket;
};

struct IngestTicket {
  std::string progressId;
};

struct ProgressReport {
  std::string progressId;
  std::string status;
  std::optional<double> percent;
  std::optional<std::string> message;
};

/**
 * The remote ingestion service. Every call throws NetworkError on transport
 * failure and RemoteProtocolError on a non-2xx status or unparseable body.
 * Implementations must be safe to call from several threads at once.
 */
class IngestionApi {
public:
  virtual ~IngestionApi() = default;

  // POST /api/ingestion/upload-url
  virtual UploadSlot requestUploadSlot(const AppConfig &config,
                                       const std::string &filename,
                                       const std::string &contentType) = 0;

  // PUT <upload_url>, no auth headers
  virtual void uploadObject(const std::string &uploadUrl,
                            const std::string &bytes,
                            const std::string &contentType) = 0;

  // POST /api/ingestion/ingest-s3
  virtual IngestTicket triggerIngest(const AppConfig &config,
                                     const std::string &s3Key,
                                     const std::string &s3Bucket,
                                     const std::string &progressId) = 0;

  // GET /api/ingestion/progress/{id}
  virtual ProgressReport fetchProgress(const AppConfig &config,
                                       const std::string &progressId) = 0;
};

} // namespace ingest
