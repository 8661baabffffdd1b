#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ingest {

struct UuidUtils {
  // Random (version 4) UUID in canonical 8-4-4-4-12 form.
  static std::string generate() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t hi = rng();
    std::uint64_t lo = rng();

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4)
        << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return out.str();
  }
};

} // namespace ingest
