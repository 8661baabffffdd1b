#pragma once

#include "IngestionApi.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace ingest {

    /**
     * ApiClient talks to the ingestion service and the presigned object store.
     * Uses cpp-httplib for networking and nlohmann/json for serialization.
     * A fresh httplib::Client is built per call, so one ApiClient can be shared
     * by every transfer thread.
     */
    class ApiClient : public IngestionApi {
    public:
        explicit ApiClient(std::chrono::seconds timeout = std::chrono::seconds(120));
        ~ApiClient() override;

        UploadSlot requestUploadSlot(const AppConfig& config, const std::string& filename,
                                     const std::string& contentType) override;
        void uploadObject(const std::string& uploadUrl, const std::string& bytes,
                          const std::string& contentType) override;
        IngestTicket triggerIngest(const AppConfig& config, const std::string& s3Key,
                                   const std::string& s3Bucket,
                                   const std::string& progressId) override;
        ProgressReport fetchProgress(const AppConfig& config,
                                     const std::string& progressId) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

    // Splits an absolute URL into "scheme://host[:port]" and "/path?query".
    struct UrlParts {
        std::string origin;
        std::string target;
    };
    UrlParts splitUrl(const std::string& url);

    // Endpoint path under the configured API base, which may carry a path
    // prefix ("https://host/prod").
    UrlParts apiEndpoint(const std::string& apiUrl, const std::string& path);

    std::string urlEncode(const std::string& value);

    // Response body parsers; throw RemoteProtocolError on malformed input.
    UploadSlot parseUploadSlot(const std::string& body);
    IngestTicket parseIngestTicket(const std::string& body);
    ProgressReport parseProgressReport(const std::string& body);

} // namespace ingest
