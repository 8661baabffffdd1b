#include "MimeTypes.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace ingest {

namespace {

const std::unordered_map<std::string, std::string> &mimeTable() {
  static const std::unordered_map<std::string, std::string> table = {
      {"json", "application/json"},
      {"csv", "text/csv"},
      {"txt", "text/plain"},
      {"log", "text/plain"},
      {"md", "text/markdown"},
      {"html", "text/html"},
      {"htm", "text/html"},
      {"xml", "text/xml"},
      {"yaml", "application/yaml"},
      {"yml", "application/yaml"},
      {"toml", "application/toml"},
      {"js", "text/javascript"},
      {"jsx", "text/javascript"},
      {"ts", "text/typescript"},
      {"tsx", "text/tsx"},
      {"pdf", "application/pdf"},
      {"rtf", "application/rtf"},
      {"doc", "application/msword"},
      {"docx", "application/"
               "vnd.openxmlformats-officedocument.wordprocessingml.document"},
      {"xls", "application/vnd.ms-excel"},
      {"xlsx",
       "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
      {"ppt", "application/vnd.ms-powerpoint"},
      {"pptx", "application/"
               "vnd.openxmlformats-officedocument.presentationml.presentation"},
      {"png", "image/png"},
      {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},
      {"gif", "image/gif"},
      {"svg", "image/svg+xml"},
      {"webp", "image/webp"},
      {"mp3", "audio/mpeg"},
      {"wav", "audio/wav"},
      {"mp4", "video/mp4"},
  };
  return table;
}

} // namespace

std::string contentTypeFor(const std::filesystem::path &path) {
  auto ext = path.extension().string();
  if (!ext.empty() && ext[0] == '.')
    ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  const auto &table = mimeTable();
  auto it = table.find(ext);
  return it != table.end() ? it->second : "application/octet-stream";
}

} // namespace ingest
