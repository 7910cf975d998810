#include <doctest/doctest.h>
#include "netbeacon/beacon.hpp"
#include "netbeacon/uuid.hpp"

using namespace netbeacon;

static constexpr uint64_t NOW = 1700000000000ULL;

// Header + body, with the length field taken from the body unless overridden.
static std::vector<uint8_t> frame(uint8_t version, uint8_t type, const std::vector<uint8_t>& body,
                                  int declared_len = -1) {
    const size_t n = declared_len < 0 ? body.size() : static_cast<size_t>(declared_len);
    std::vector<uint8_t> out{version, type, static_cast<uint8_t>(n >> 8), static_cast<uint8_t>(n & 0xFF)};
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

static RemoteInterface eth0_remote() {
    RemoteInterface r;
    r.name           = "eth0";
    r.mac_address    = "00:11:22:33:44:55";
    r.vid            = 100;
    r.link_connected = true;
    return r;
}

TEST_CASE("create_beacon encodes header and BSON payload that decode back") {
    std::vector<uint8_t> bytes;
    BeaconPayload b = create_beacon(BeaconType::Solicitation, eth0_remote(), std::nullopt, NOW, bytes);

    REQUIRE(bytes.size() > BEACON_HEADER_LEN);
    CHECK(bytes[0] == BEACON_VERSION);
    CHECK(bytes[1] == 1);
    CHECK(((bytes[2] << 8) | bytes[3]) == static_cast<int>(bytes.size() - BEACON_HEADER_LEN));

    int64_t created = 0;
    REQUIRE(uuid_to_timestamp(b.uuid, created));
    CHECK(created == static_cast<int64_t>(NOW));

    BeaconPayload d;
    std::string err;
    REQUIRE(decode_beacon(bytes, d, err));
    CHECK(d.type == BeaconType::Solicitation);
    CHECK(d.uuid == b.uuid);
    REQUIRE(d.remote.has_value());
    CHECK(*d.remote == eth0_remote());
    CHECK_FALSE(d.acks.has_value());
}

TEST_CASE("Advertisement carries acks") {
    std::vector<uint8_t> bytes;
    const std::string acked = Uuid::generate(NOW).to_string();
    create_beacon(BeaconType::Advertisement, std::nullopt, acked, NOW, bytes);

    BeaconPayload d;
    std::string err;
    REQUIRE(decode_beacon(bytes, d, err));
    CHECK(d.type == BeaconType::Advertisement);
    REQUIRE(d.acks.has_value());
    CHECK(*d.acks == acked);
    CHECK_FALSE(d.remote.has_value());
}

TEST_CASE("Decode errors are distinct") {
    BeaconPayload d;
    std::string err;

    const std::vector<uint8_t> short_pkt{1, 1, 0};
    CHECK_FALSE(decode_beacon(short_pkt, d, err));
    CHECK(err == "packet must be at least 4 bytes");

    CHECK_FALSE(decode_beacon(frame(1, 1, {}, 10), d, err));
    CHECK(err == "expected 10 bytes, got 0 bytes");

    CHECK_FALSE(decode_beacon(frame(2, 1, {}), d, err));
    CHECK(err == "unknown beacon version: 2");

    CHECK_FALSE(decode_beacon(frame(1, 9, {}), d, err));
    CHECK(err == "unknown beacon type: 9");

    CHECK_FALSE(decode_beacon(frame(1, 1, {0xde, 0xad, 0xbe}), d, err));
    CHECK(err.rfind("beacon payload is not BSON", 0) == 0);

    const auto body = json::to_bson(json{{"type", 2}, {"uuid", Uuid::generate(NOW).to_string()}});
    CHECK_FALSE(decode_beacon(frame(1, 1, body), d, err));
    CHECK(err == "beacon payload type does not match header");
}

TEST_CASE("Zero-length payload is legal on the wire") {
    BeaconPayload d;
    std::string err;
    REQUIRE(decode_beacon(frame(1, 2, {}), d, err));
    CHECK(d.type == BeaconType::Advertisement);
    CHECK_FALSE(d.has_payload);
    CHECK(d.uuid.empty());
}

TEST_CASE("Unknown payload fields survive decode and re-encode") {
    const std::string uuid = Uuid::generate(NOW).to_string();
    const auto body = json::to_bson(json{{"type", 1}, {"uuid", uuid}, {"hostname", "rack-1"}});

    BeaconPayload d;
    std::string err;
    REQUIRE(decode_beacon(frame(1, 1, body), d, err));
    CHECK(d.extra["hostname"] == "rack-1");

    std::vector<uint8_t> again;
    REQUIRE(encode_beacon(d, again, err));
    BeaconPayload d2;
    REQUIRE(decode_beacon(again, d2, err));
    CHECK(d2.extra["hostname"] == "rack-1");
    CHECK(d2.uuid == uuid);
}

TEST_CASE("Oversized payload is refused by the encoder") {
    BeaconPayload b;
    b.uuid = Uuid::generate(NOW).to_string();
    RemoteInterface r;
    r.name   = "eth0";
    r.vendor = std::string(70000, 'x');
    b.remote = r;

    std::vector<uint8_t> out;
    std::string err;
    CHECK_FALSE(encode_beacon(b, out, err));
    CHECK(err.rfind("payload too large", 0) == 0);
}

TEST_CASE("Normalized JSON form names the type") {
    std::vector<uint8_t> bytes;
    BeaconPayload b = create_beacon(BeaconType::Advertisement, eth0_remote(), std::nullopt, NOW, bytes);

    json j = beacon_to_json(b);
    CHECK(j["version"] == 1);
    CHECK(j["type"] == "advertisement");
    CHECK(j["payload"]["uuid"] == b.uuid);
    CHECK(j["payload"]["remote"]["name"] == "eth0");
    CHECK(j["payload"]["remote"]["vid"] == 100);

    BeaconPayload back;
    std::string err;
    REQUIRE(beacon_from_json(j, back, err));
    CHECK(back.type == BeaconType::Advertisement);
    CHECK(back.uuid == b.uuid);
    REQUIRE(back.remote.has_value());
    CHECK(*back.remote == eth0_remote());
}

TEST_CASE("beacon_from_json rejects what it cannot interpret") {
    BeaconPayload out;
    std::string err;

    CHECK_FALSE(beacon_from_json(json::array(), out, err));
    CHECK_FALSE(beacon_from_json(json{{"payload", json::object()}}, out, err));
    CHECK(err == "missing or unknown beacon type");
    CHECK_FALSE(beacon_from_json(json{{"type", "greeting"}}, out, err));
    CHECK_FALSE(beacon_from_json(json{{"type", "solicitation"}, {"version", 2}}, out, err));
    CHECK_FALSE(beacon_from_json(json{{"type", "solicitation"}, {"payload", "x"}}, out, err));

    REQUIRE(beacon_from_json(json{{"type", "solicitation"}, {"payload", nullptr}}, out, err));
    CHECK_FALSE(out.has_payload);
}

TEST_CASE("RemoteInterface parsing is lenient about types") {
    json j{{"name", "eth1"}, {"vid", "100"}, {"mac_address", 5}, {"link_connected", false}, {"extra", 1}};
    RemoteInterface r = RemoteInterface::from_json(j);
    CHECK(r.name == "eth1");
    CHECK_FALSE(r.vid.has_value());
    CHECK_FALSE(r.mac_address.has_value());
    REQUIRE(r.link_connected.has_value());
    CHECK(*r.link_connected == false);
}
