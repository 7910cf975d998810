// ============================================================================
// beacon.cpp - implementation for beacon.hpp
// For the wire layout see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netbeacon/beacon.hpp"
#include "netbeacon/uuid.hpp"

namespace netbeacon {

// ---------------------------------------------------------------------------
// Type names and codes
// ---------------------------------------------------------------------------

const char* to_string(BeaconType t) {
  switch (t) {
    case BeaconType::Solicitation:  return "solicitation";
    case BeaconType::Advertisement: return "advertisement";
  }
  return "unknown";
}

bool beacon_type_from_string(const std::string& s, BeaconType& out) {
  if (s == "solicitation")  { out = BeaconType::Solicitation;  return true; }
  if (s == "advertisement") { out = BeaconType::Advertisement; return true; }
  return false;
}

bool beacon_type_from_code(uint8_t code, BeaconType& out) {
  if (code == static_cast<uint8_t>(BeaconType::Solicitation))  { out = BeaconType::Solicitation;  return true; }
  if (code == static_cast<uint8_t>(BeaconType::Advertisement)) { out = BeaconType::Advertisement; return true; }
  return false;
}

// ---------------------------------------------------------------------------
// RemoteInterface
// ---------------------------------------------------------------------------

json RemoteInterface::to_json() const {
  json j = json::object();
  j["name"] = name;
  if (mac_address)    j["mac_address"]    = *mac_address;
  if (vid)            j["vid"]            = *vid;
  if (vendor)         j["vendor"]         = *vendor;
  if (product)        j["product"]        = *product;
  if (link_connected) j["link_connected"] = *link_connected;
  if (subnet)         j["subnet"]         = *subnet;
  return j;
}

RemoteInterface RemoteInterface::from_json(const json& j) {
  RemoteInterface r;
  if (!j.is_object()) return r;
  // Peers may run other versions; take what is well-typed and ignore the rest.
  auto str = [&j](const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) return it->get<std::string>();
    return std::nullopt;
  };
  if (auto n = str("name")) r.name = *n;
  r.mac_address = str("mac_address");
  r.vendor      = str("vendor");
  r.product     = str("product");
  r.subnet      = str("subnet");
  auto v = j.find("vid");
  if (v != j.end() && v->is_number_integer()) r.vid = v->get<int>();
  auto lc = j.find("link_connected");
  if (lc != j.end() && lc->is_boolean()) r.link_connected = lc->get<bool>();
  return r;
}

bool RemoteInterface::operator==(const RemoteInterface& o) const {
  return name == o.name && mac_address == o.mac_address && vid == o.vid &&
         vendor == o.vendor && product == o.product &&
         link_connected == o.link_connected && subnet == o.subnet;
}

// ---------------------------------------------------------------------------
// BeaconPayload
// ---------------------------------------------------------------------------

json BeaconPayload::payload_json() const {
  json j = extra.is_object() ? extra : json::object();
  j["type"] = static_cast<uint8_t>(type);    // replicated so decode can cross-check
  if (!uuid.empty()) j["uuid"]   = uuid;
  if (remote)        j["remote"] = remote->to_json();
  if (acks)          j["acks"]   = *acks;
  return j;
}

// ---------------------------------------------------------------------------
// create_beacon()
// ---------------
// Mint a UUID for `now_ms`, assemble the payload and encode it.
// The UUID is generated here and nowhere else, so every outbound beacon is fresh.
// ---------------------------------------------------------------------------
BeaconPayload create_beacon(BeaconType type,
                            const std::optional<RemoteInterface>& remote,
                            const std::optional<std::string>& acks,
                            uint64_t now_ms,
                            std::vector<uint8_t>& out_bytes) {
  BeaconPayload b;
  b.version = BEACON_VERSION;
  b.type    = type;
  b.uuid    = Uuid::generate(now_ms).to_string();
  b.remote  = remote;
  b.acks    = acks;

  std::string err;
  if (!encode_beacon(b, out_bytes, err)) {
    // Only reachable with an absurdly large remote descriptor; send nothing.
    out_bytes.clear();
  }
  return b;
}

// ---------------------------------------------------------------------------
// encode_beacon()
// ---------------
// Header (version, type, length) + BSON payload. A beacon without payload is
// written with length 0.
// ---------------------------------------------------------------------------
bool encode_beacon(const BeaconPayload& beacon, std::vector<uint8_t>& out, std::string& err) {
  std::vector<uint8_t> body;
  if (beacon.has_payload) body = json::to_bson(beacon.payload_json());

  if (body.size() > 0xFFFF) {
    err = "payload too large: " + std::to_string(body.size()) + " bytes";
    return false;
  }

  out.clear();
  out.reserve(BEACON_HEADER_LEN + body.size());
  out.push_back(beacon.version);
  out.push_back(static_cast<uint8_t>(beacon.type));
  out.push_back(static_cast<uint8_t>((body.size() >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(body.size() & 0xFF));
  out.insert(out.end(), body.begin(), body.end());
  return true;
}

// ---------------------------------------------------------------------------
// decode_beacon()
// ---------------
// Checks, in order: header present, length matches, version known, type known,
// payload is a BSON document, payload type agrees with the header.
// ---------------------------------------------------------------------------
bool decode_beacon(const uint8_t* data, size_t len, BeaconPayload& out, std::string& err) {
  if (!data || len < BEACON_HEADER_LEN) {
    err = "packet must be at least 4 bytes";
    return false;
  }

  const uint8_t  version = data[0];
  const uint8_t  code    = data[1];
  const uint16_t plen    = static_cast<uint16_t>((data[2] << 8) | data[3]);
  const size_t   have    = len - BEACON_HEADER_LEN;

  if (have != plen) {
    err = "expected " + std::to_string(plen) + " bytes, got " + std::to_string(have) + " bytes";
    return false;
  }
  if (version != BEACON_VERSION) {
    err = "unknown beacon version: " + std::to_string(version);
    return false;
  }

  BeaconPayload b;
  b.version = version;
  if (!beacon_type_from_code(code, b.type)) {
    err = "unknown beacon type: " + std::to_string(code);
    return false;
  }

  if (plen == 0) {
    b.has_payload = false;
    out = std::move(b);
    return true;
  }

  json doc;
  try {
    doc = json::from_bson(data + BEACON_HEADER_LEN, data + len);
  } catch (const json::parse_error& e) {
    err = std::string("beacon payload is not BSON: ") + e.what();
    return false;
  }
  if (!doc.is_object()) {
    err = "beacon payload is not a document";
    return false;
  }

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const std::string& key = it.key();
    const json& val = it.value();
    if (key == "type") {
      // BSON integers come back signed.
      if (!val.is_number_integer() || val.get<int64_t>() != code) {
        err = "beacon payload type does not match header";
        return false;
      }
    } else if (key == "uuid") {
      if (val.is_string()) b.uuid = val.get<std::string>();
    } else if (key == "remote") {
      if (val.is_object()) b.remote = RemoteInterface::from_json(val);
    } else if (key == "acks") {
      if (val.is_string()) b.acks = val.get<std::string>();
    } else {
      b.extra[key] = val;
    }
  }

  out = std::move(b);
  return true;
}

bool decode_beacon(const std::vector<uint8_t>& data, BeaconPayload& out, std::string& err) {
  return decode_beacon(data.data(), data.size(), out, err);
}

json beacon_to_json(const BeaconPayload& beacon) {
  json j = json::object();
  j["version"] = beacon.version;
  j["type"]    = to_string(beacon.type);
  j["payload"] = beacon.has_payload ? beacon.payload_json() : json::object();
  return j;
}

bool beacon_from_json(const json& j, BeaconPayload& out, std::string& err) {
  if (!j.is_object()) {
    err = "beacon is not a JSON object";
    return false;
  }

  BeaconPayload b;
  auto v = j.find("version");
  if (v != j.end()) {
    if (!v->is_number_integer() || v->get<int64_t>() != BEACON_VERSION) {
      err = "unknown beacon version: " + v->dump();
      return false;
    }
  }

  auto t = j.find("type");
  if (t == j.end() || !t->is_string() || !beacon_type_from_string(t->get<std::string>(), b.type)) {
    err = "missing or unknown beacon type";
    return false;
  }

  auto p = j.find("payload");
  if (p == j.end() || p->is_null()) {
    b.has_payload = false;
    out = std::move(b);
    return true;
  }
  if (!p->is_object()) {
    err = "beacon payload is not an object";
    return false;
  }

  // Same field split as decode_beacon(); the JSON form carries the type by name,
  // so a numeric `type` inside the payload is informational here.
  for (auto it = p->begin(); it != p->end(); ++it) {
    const std::string& key = it.key();
    const json& val = it.value();
    if (key == "type") {
      continue;
    } else if (key == "uuid") {
      if (val.is_string()) b.uuid = val.get<std::string>();
    } else if (key == "remote") {
      if (val.is_object()) b.remote = RemoteInterface::from_json(val);
    } else if (key == "acks") {
      if (val.is_string()) b.acks = val.get<std::string>();
    } else {
      b.extra[key] = val;
    }
  }

  out = std::move(b);
  return true;
}

} // namespace netbeacon
