#include "ApiClient.hpp"
#include "Errors.hpp"
#include "httplib.h"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace ingest {

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

UrlParts splitUrl(const std::string &url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    throw RemoteProtocolError("Invalid URL (no scheme): " + url);

  auto hostStart = schemeEnd + 3;
  auto pathStart = url.find_first_of("/?", hostStart);
  if (pathStart == hostStart)
    throw RemoteProtocolError("Invalid URL (no host): " + url);

  if (pathStart == std::string::npos)
    return {url, "/"};

  std::string target = url.substr(pathStart);
  if (target[0] == '?')
    target = "/" + target;
  return {url.substr(0, pathStart), target};
}

UrlParts apiEndpoint(const std::string &apiUrl, const std::string &path) {
  auto parts = splitUrl(apiUrl);
  std::string prefix = parts.target;
  while (!prefix.empty() && prefix.back() == '/')
    prefix.pop_back();
  return {parts.origin, prefix + path};
}

UploadSlot parseUploadSlot(const std::string &body) {
  try {
    auto data = json::parse(body);
    UploadSlot slot;
    slot.uploadUrl = data.at("upload_url").get<std::string>();
    slot.s3Key = data.at("s3_key").get<std::string>();
    if (data.contains("s3_bucket") && !data["s3_bucket"].is_null())
      slot.s3Bucket = data["s3_bucket"].get<std::string>();
    return slot;
  } catch (const json::exception &e) {
    throw RemoteProtocolError(
        std::string("Failed to parse presigned URL response: ") + e.what());
  }
}

IngestTicket parseIngestTicket(const std::string &body) {
  try {
    auto data = json::parse(body);
    return IngestTicket{data.at("progress_id").get<std::string>()};
  } catch (const json::exception &e) {
    throw RemoteProtocolError(
        std::string("Failed to parse ingestion response: ") + e.what());
  }
}

ProgressReport parseProgressReport(const std::string &body) {
  try {
    auto data = json::parse(body);
    ProgressReport report;
    report.progressId = data.at("progress_id").get<std::string>();
    report.status = data.at("status").get<std::string>();
    if (data.contains("percent") && data["percent"].is_number())
      report.percent = data["percent"].get<double>();
    if (data.contains("message") && data["message"].is_string())
      report.message = data["message"].get<std::string>();
    return report;
  } catch (const json::exception &e) {
    throw RemoteProtocolError(
        std::string("Failed to parse progress response: ") + e.what());
  }
}

struct ApiClient::Impl {
  std::chrono::seconds timeout;

  explicit Impl(std::chrono::seconds t) : timeout(t) {}

  std::unique_ptr<httplib::Client> connect(const std::string &origin) const {
    auto client = std::make_unique<httplib::Client>(origin);
    client->set_connection_timeout(30, 0);
    client->set_read_timeout(timeout.count(), 0);
    client->set_write_timeout(timeout.count(), 0);
    client->set_follow_location(true);
    return client;
  }

  static httplib::Headers authHeaders(const AppConfig &config) {
    httplib::Headers headers{{"X-API-Key", config.apiKey}};
    if (config.userHash)
      headers.emplace("X-User-Hash", *config.userHash);
    return headers;
  }

  // Throws unless the call produced a 2xx response.
  static const httplib::Response &expectSuccess(const httplib::Result &res,
                                                const std::string &what) {
    if (!res) {
      throw NetworkError("Failed to " + what + ": " +
                         httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
      throw RemoteProtocolError(what + " failed (" +
                                    std::to_string(res->status) +
                                    "): " + res->body,
                                res->status);
    }
    return *res;
  }
};

ApiClient::ApiClient(std::chrono::seconds timeout)
    : m_impl(std::make_unique<Impl>(timeout)) {}

ApiClient::~ApiClient() = default;

UploadSlot ApiClient::requestUploadSlot(const AppConfig &config,
                                        const std::string &filename,
                                        const std::string &contentType) {
  json body;
  body["filename"] = filename;
  body["file_type"] = contentType;

  auto endpoint = apiEndpoint(config.apiUrl(), "/api/ingestion/upload-url");
  auto client = m_impl->connect(endpoint.origin);
  auto res = client->Post(endpoint.target, Impl::authHeaders(config),
                          body.dump(), "application/json");
  const auto &response = Impl::expectSuccess(res, "request presigned URL");
  return parseUploadSlot(response.body);
}

void ApiClient::uploadObject(const std::string &uploadUrl,
                             const std::string &bytes,
                             const std::string &contentType) {
  auto parts = splitUrl(uploadUrl);
  auto client = m_impl->connect(parts.origin);
  auto res = client->Put(parts.target, httplib::Headers{}, bytes, contentType);
  Impl::expectSuccess(res, "upload to object store");
}

IngestTicket ApiClient::triggerIngest(const AppConfig &config,
                                      const std::string &s3Key,
                                      const std::string &s3Bucket,
                                      const std::string &progressId) {
  json body;
  body["s3_key"] = s3Key;
  body["s3_bucket"] = s3Bucket;
  body["progress_id"] = progressId;

  auto endpoint = apiEndpoint(config.apiUrl(), "/api/ingestion/ingest-s3");
  auto client = m_impl->connect(endpoint.origin);
  auto res = client->Post(endpoint.target, Impl::authHeaders(config),
                          body.dump(), "application/json");
  const auto &response = Impl::expectSuccess(res, "trigger ingestion");
  return parseIngestTicket(response.body);
}

ProgressReport ApiClient::fetchProgress(const AppConfig &config,
                                        const std::string &progressId) {
  auto endpoint = apiEndpoint(config.apiUrl(),
                              "/api/ingestion/progress/" + urlEncode(progressId));
  auto client = m_impl->connect(endpoint.origin);
  auto res = client->Get(endpoint.target, Impl::authHeaders(config));
  const auto &response = Impl::expectSuccess(res, "poll progress");
  return parseProgressReport(response.body);
}

} // namespace ingest
