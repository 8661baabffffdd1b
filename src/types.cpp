#include "types.hpp"

namespace ingest {

std::string toString(FileCategory category) {
  switch (category) {
  case FileCategory::PersonalData:
    return "personal_data";
  case FileCategory::Media:
    return "media";
  case FileCategory::Config:
    return "config";
  case FileCategory::WebsiteScaffolding:
    return "website_scaffolding";
  case FileCategory::Work:
    return "work";
  case FileCategory::Unknown:
    break;
  }
  return "unknown";
}

std::string toString(UploadStatus status) {
  switch (status) {
  case UploadStatus::Uploading:
    return "Uploading";
  case UploadStatus::Uploaded:
    return "Uploaded";
  case UploadStatus::Ingesting:
    return "Ingesting";
  case UploadStatus::Done:
    return "Done";
  case UploadStatus::Error:
    break;
  }
  return "Error";
}

std::string toString(WatchEventKind kind) {
  return kind == WatchEventKind::Created ? "Created" : "Modified";
}

} // namespace ingest
