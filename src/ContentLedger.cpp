#include "ContentLedger.hpp"
#include <fstream>
#include "picosha2.h"
#include <vector>

namespace fs = std::filesystem;

namespace ingest {

std::optional<std::string> ContentLedger::hashFile(const fs::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open())
    return std::nullopt;

  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(f, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool ContentLedger::isUnchanged(const fs::path &path,
                                const std::string &checksum) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_checksums.find(path.lexically_normal().generic_string());
  return it != m_checksums.end() && it->second == checksum;
}

void ContentLedger::remember(const fs::path &path, const std::string &checksum) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_checksums[path.lexically_normal().generic_string()] = checksum;
}

} // namespace ingest
