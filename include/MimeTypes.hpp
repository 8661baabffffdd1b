#pragma once

#include <filesystem>
#include <string>

namespace ingest {

// Guess a Content-Type from the file extension; application/octet-stream if
// unknown.
std::string contentTypeFor(const std::filesystem::path &path);

} // namespace ingest
