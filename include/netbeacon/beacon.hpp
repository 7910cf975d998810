/**
 * @file beacon.hpp
 * @brief Beacon wire format: header, typed payload, encode/decode.
 *
 * @details
 * PURPOSE
 * -------
 * A beacon is a small UDP datagram that probes a link and carries a reduced
 * description of the interface that sent it. This header defines the typed beacon
 * value and the codec that moves it to and from bytes.
 *
 * WIRE LAYOUT
 * -----------
 * @code
 *   0        1        2                 4
 *   +--------+--------+-----------------+---------------------------+
 *   | version|  type  | payload length  | payload (BSON document)   |
 *   |  u8    |  u8    | u16 big-endian  | `length` bytes            |
 *   +--------+--------+-----------------+---------------------------+
 * @endcode
 *
 * The payload document holds:
 * - `uuid`   correlation key (version-1 UUID string, see uuid.hpp)
 * - `type`   the header type code again, checked on decode
 * - `remote` optional sender interface descriptor (RemoteInterface)
 * - `acks`   optional UUID being acknowledged (advertisements)
 * Any other top-level key is kept in BeaconPayload::extra and written back out.
 *
 * FAILURE MODEL
 * -------------
 * decode_beacon() never throws. Malformed or unsupported datagrams return false
 * with a one-line reason; callers drop the packet and move on.
 */
#ifndef NETBEACON_BEACON_HPP
#define NETBEACON_BEACON_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace netbeacon {

using json = nlohmann::json;

/// @name Protocol constants
///@{
static constexpr uint16_t BEACON_PORT           = 5240;
static constexpr const char* BEACON_IPV4_MULTICAST = "224.0.0.118";
static constexpr const char* BEACON_IPV6_MULTICAST = "ff02::15a";
static constexpr uint8_t  BEACON_VERSION        = 1;
static constexpr size_t   BEACON_HEADER_LEN     = 4;
///@}

/// Beacon kinds. Values are the on-wire type codes.
enum class BeaconType : uint8_t {
  Solicitation  = 1,   ///< asks every listener for an advertisement
  Advertisement = 2,   ///< a reply, or an unsolicited announcement
};

/// "solicitation" / "advertisement".
const char* to_string(BeaconType t);

/// Parse a type name. Returns false for anything else.
bool beacon_type_from_string(const std::string& s, BeaconType& out);

/// Map a wire code to a type. Returns false for unknown codes.
bool beacon_type_from_code(uint8_t code, BeaconType& out);

/**
 * @struct RemoteInterface
 * @brief Reduced description of the interface a beacon was sent from.
 *
 * Only `name` is required. The rest is filled in when the sender knows it.
 */
struct RemoteInterface {
  std::string name;
  std::optional<std::string> mac_address;
  std::optional<int>         vid;              ///< 802.1Q VLAN id of the sending interface
  std::optional<std::string> vendor;
  std::optional<std::string> product;
  std::optional<bool>        link_connected;
  std::optional<std::string> subnet;           ///< CIDR of the link this beacon was sent for

  json to_json() const;

  /// Lenient parse: unknown keys ignored, wrong-typed known keys dropped.
  static RemoteInterface from_json(const json& j);

  bool operator==(const RemoteInterface& o) const;
};

/**
 * @struct BeaconPayload
 * @brief One beacon, as sent or as received. Immutable once built.
 */
struct BeaconPayload {
  uint8_t     version{BEACON_VERSION};
  BeaconType  type{BeaconType::Solicitation};

  bool        has_payload{true};               ///< false for a zero-length wire payload
  std::string uuid;                            ///< empty if the payload carried none
  std::optional<RemoteInterface> remote;
  std::optional<std::string>     acks;
  json        extra = json::object();          ///< unknown top-level payload keys

  /// Payload document (uuid, type code, remote, acks, extras).
  json payload_json() const;
};

/**
 * @brief Build a fresh beacon and its datagram.
 *
 * Generates a new UUID stamped with `now_ms`, sets the current protocol version, and
 * serializes header + BSON payload.
 *
 * @param type   Beacon kind.
 * @param remote Sender descriptor, or std::nullopt.
 * @param acks   UUID being acknowledged, or std::nullopt.
 * @param now_ms Unix time in ms used for the UUID.
 * @param out_bytes Filled with the encoded datagram.
 * @return The beacon that was encoded.
 */
BeaconPayload create_beacon(BeaconType type,
                            const std::optional<RemoteInterface>& remote,
                            const std::optional<std::string>& acks,
                            uint64_t now_ms,
                            std::vector<uint8_t>& out_bytes);

/**
 * @brief Serialize an existing beacon.
 *
 * @retval false The payload could not be represented (payload larger than 65535 bytes).
 */
bool encode_beacon(const BeaconPayload& beacon, std::vector<uint8_t>& out, std::string& err);

/**
 * @brief Parse a datagram.
 *
 * @param data Datagram bytes.
 * @param len  Datagram length.
 * @param out  Filled on success.
 * @param err  One-line reason on failure.
 */
bool decode_beacon(const uint8_t* data, size_t len, BeaconPayload& out, std::string& err);

/// Convenience overload for byte vectors.
bool decode_beacon(const std::vector<uint8_t>& data, BeaconPayload& out, std::string& err);

/**
 * @brief Normalized JSON form: `{version, type, payload}` with the type as its name.
 *
 * This is the shape the engine consumes; the socket path adds `source_ip`,
 * `source_port`, `destination_ip` and `interface` on top of it.
 */
json beacon_to_json(const BeaconPayload& beacon);

/**
 * @brief Rebuild a beacon from its normalized JSON form.
 *
 * Accepts what beacon_to_json() produces, plus whatever an observer process adds
 * around it. `version` defaults to the current version when absent.
 *
 * @retval false Missing or unknown `type`, unsupported `version`, or a `payload`
 *               that is not an object.
 */
bool beacon_from_json(const json& j, BeaconPayload& out, std::string& err);

} // namespace netbeacon

#endif // NETBEACON_BEACON_HPP
