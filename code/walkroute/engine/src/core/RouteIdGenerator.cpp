// Route identifiers come from OpenSSL's CSPRNG so ids from concurrently running
// variants never collide.

#include "core/RouteIdGenerator.hpp"
#include <array>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <random>
#include <sstream>

static void fill_fallback(std::array<uint8_t, 16> &bytes) {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  for (auto &b : bytes)
    b = static_cast<uint8_t>(rng() & 0xff);
}

std::string make_route_id() {
  std::array<uint8_t, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    std::cerr << "[route_id] RAND_bytes failed: "
              << ERR_error_string(ERR_get_error(), nullptr)
              << ", using std::random_device\n";
    fill_fallback(bytes);
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80); // RFC 4122

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      oss << '-';
    oss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return oss.str();
}
