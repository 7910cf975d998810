// -----------------------------------------------------------------------------
// @file uuid.cpp
// @brief Implementation of the version-1 UUID used as the beacon correlation key.
//
// Implemented here:
// - generation from an explicit Unix time (tests) or the system clock
// - canonical text form and strict parsing
// - timestamp recovery back to Unix milliseconds
// -----------------------------------------------------------------------------
#include "netbeacon/uuid.hpp"

#include <chrono>
#include <random>

namespace netbeacon {

namespace {

// One generator per thread; seeded once from the OS.
std::mt19937_64& rng() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

// =============================================================================
// Generation
// =============================================================================

Uuid Uuid::generate(uint64_t unix_ms) {
  // 100 ns ticks since the Gregorian epoch; add a random sub-millisecond part so
  // UUIDs minted within the same millisecond stay distinct in the time fields too.
  const uint64_t sub_ms = rng()() % 10000;
  const uint64_t ts = unix_ms * 10000ULL + sub_ms + GREGORIAN_OFFSET;

  const uint32_t time_low = static_cast<uint32_t>(ts & 0xFFFFFFFFULL);
  const uint16_t time_mid = static_cast<uint16_t>((ts >> 32) & 0xFFFF);
  const uint16_t time_hi  = static_cast<uint16_t>((ts >> 48) & 0x0FFF);

  Uuid u;
  u.bytes[0] = static_cast<uint8_t>(time_low >> 24);
  u.bytes[1] = static_cast<uint8_t>(time_low >> 16);
  u.bytes[2] = static_cast<uint8_t>(time_low >> 8);
  u.bytes[3] = static_cast<uint8_t>(time_low);
  u.bytes[4] = static_cast<uint8_t>(time_mid >> 8);
  u.bytes[5] = static_cast<uint8_t>(time_mid);
  u.bytes[6] = static_cast<uint8_t>(0x10 | (time_hi >> 8));   // version 1
  u.bytes[7] = static_cast<uint8_t>(time_hi);

  const uint64_t rnd = rng()();
  const uint16_t clock_seq = static_cast<uint16_t>(rnd & 0x3FFF);
  u.bytes[8] = static_cast<uint8_t>(0x80 | (clock_seq >> 8)); // RFC 4122 variant
  u.bytes[9] = static_cast<uint8_t>(clock_seq);

  // Random node id; the multicast bit marks it as not derived from a MAC.
  for (int i = 0; i < 6; ++i) {
    u.bytes[10 + i] = static_cast<uint8_t>(rnd >> (16 + 8 * i));
  }
  u.bytes[10] |= 0x01;
  return u;
}

Uuid Uuid::generate() {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return generate(static_cast<uint64_t>(ms));
}

// =============================================================================
// Text form
// =============================================================================

std::string Uuid::to_string() const {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) s += '-';
    s += HEX[bytes[i] >> 4];
    s += HEX[bytes[i] & 0x0F];
  }
  return s;
}

bool Uuid::parse(const std::string& text, Uuid& out) {
  if (text.size() != 36) return false;
  Uuid tmp;
  size_t b = 0;
  for (size_t i = 0; i < text.size(); ) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') return false;          // separators at fixed offsets only
      ++i;
      continue;
    }
    const int hi = hex_value(text[i]);
    const int lo = hex_value(text[i + 1]);
    if (hi < 0 || lo < 0) return false;
    tmp.bytes[b++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }
  if (tmp.version() != 1) return false;          // no recoverable time otherwise
  out = tmp;
  return true;
}

// =============================================================================
// Timestamp recovery
// =============================================================================

uint64_t Uuid::timestamp_100ns() const {
  const uint64_t time_low = (uint64_t(bytes[0]) << 24) | (uint64_t(bytes[1]) << 16) |
                            (uint64_t(bytes[2]) << 8)  |  uint64_t(bytes[3]);
  const uint64_t time_mid = (uint64_t(bytes[4]) << 8) | uint64_t(bytes[5]);
  const uint64_t time_hi  = (uint64_t(bytes[6] & 0x0F) << 8) | uint64_t(bytes[7]);
  return (time_hi << 48) | (time_mid << 32) | time_low;
}

int64_t Uuid::timestamp_ms() const {
  const int64_t ticks = static_cast<int64_t>(timestamp_100ns()) -
                        static_cast<int64_t>(GREGORIAN_OFFSET);
  return ticks / 10000;
}

bool uuid_to_timestamp(const std::string& text, int64_t& out_ms) {
  Uuid u;
  if (!Uuid::parse(text, u)) return false;
  out_ms = u.timestamp_ms();
  return true;
}

} // namespace netbeacon
