/**
 * @file uuid.hpp
 * @brief Time-based (version 1) UUIDs used as beacon correlation keys.
 *
 * @details
 * Every beacon carries a UUID. The UUID is the only key the engine uses to tie a
 * transmitted solicitation to the advertisements that answer it, to spot the same
 * beacon arriving on two interfaces, and to age protocol state out. Because the UUID
 * is time-based, its creation time travels with it; no separate "sent at" field is
 * needed on the wire.
 *
 * ### Layout (RFC 4122, version 1)
 *
 * | Field           | Bits | Notes                                        |
 * |-----------------|------|----------------------------------------------|
 * | time_low        | 32   | low bits of the 60-bit timestamp             |
 * | time_mid        | 16   | middle bits                                  |
 * | time_hi+version | 16   | high 12 bits of timestamp, version nibble = 1|
 * | clock_seq       | 16   | variant bits (10xx) + 14-bit sequence         |
 * | node            | 48   | random, multicast bit set                    |
 *
 * The timestamp counts 100 ns intervals since 1582-10-15 00:00:00 UTC (the
 * Gregorian epoch). timestamp_ms() converts it back to Unix milliseconds.
 *
 * ### Text form
 * Canonical lowercase `xxxxxxxx-xxxx-1xxx-yyyy-zzzzzzzzzzzz`. parse() accepts upper
 * or lower case hex and rejects anything that is not a version-1 UUID, since a UUID
 * without a recoverable time cannot be aged.
 */
#ifndef NETBEACON_UUID_HPP
#define NETBEACON_UUID_HPP

#include <array>
#include <cstdint>
#include <string>

namespace netbeacon {

/**
 * @struct Uuid
 * @brief 128-bit version-1 UUID with timestamp recovery.
 */
struct Uuid {
  /// Offset between the Gregorian epoch and the Unix epoch, in 100 ns intervals.
  static constexpr uint64_t GREGORIAN_OFFSET = 0x01B21DD213814000ULL;

  std::array<uint8_t, 16> bytes{};   ///< Big-endian field order, as on the wire.

  Uuid() = default;

  /**
   * @brief Generate a fresh UUID stamped with the given Unix time.
   *
   * @param unix_ms Creation time in milliseconds since the Unix epoch.
   *
   * @note The clock sequence and node are random per call. Two UUIDs generated in
   *       the same millisecond still differ.
   */
  static Uuid generate(uint64_t unix_ms);

  /// Generate a fresh UUID stamped with the current system time.
  static Uuid generate();

  /**
   * @brief Parse the canonical text form.
   *
   * @param text Candidate UUID string.
   * @param out  Filled on success; untouched on failure.
   *
   * @retval true  `text` is a well-formed version-1 UUID.
   * @retval false Wrong length, bad separators, non-hex digits, or wrong version.
   */
  static bool parse(const std::string& text, Uuid& out);

  /// Canonical lowercase text form.
  std::string to_string() const;

  /// Version nibble (1 for everything this module produces or accepts).
  uint8_t version() const { return static_cast<uint8_t>(bytes[6] >> 4); }

  /// Raw 60-bit timestamp (100 ns intervals since 1582-10-15).
  uint64_t timestamp_100ns() const;

  /**
   * @brief Creation time in Unix milliseconds.
   *
   * @note UUIDs created before 1970 (e.g. the all-zero time) map to a negative
   *       value; the return type is signed so such keys age out instead of wrapping.
   */
  int64_t timestamp_ms() const;

  bool operator==(const Uuid& o) const { return bytes == o.bytes; }
  bool operator!=(const Uuid& o) const { return bytes != o.bytes; }
  bool operator<(const Uuid& o) const  { return bytes < o.bytes; }
};

/**
 * @brief Recover the creation time (Unix ms) of a UUID given as text.
 *
 * @param text   UUID string.
 * @param out_ms Filled with the creation time on success.
 * @return false if `text` is not a version-1 UUID.
 */
bool uuid_to_timestamp(const std::string& text, int64_t& out_ms);

} // namespace netbeacon

#endif // NETBEACON_UUID_HPP
