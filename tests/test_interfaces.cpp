#include <doctest/doctest.h>
#include "netbeacon/interfaces.hpp"
#include "netbeacon/transport/transport_base.hpp"

using namespace netbeacon;

static const char* INVENTORY = R"({
  "eth0": {
    "index": 2, "enabled": true, "mac_address": "00:11:22:33:44:55",
    "links": [ {"address": "192.168.1.5/24"}, {"address": "10.0.0.5/8"},
               {"mode": "dhcp"}, {"address": "2001:db8::5/64"} ]
  },
  "eth0.100": {
    "index": 5, "vid": 100, "parents": ["eth0"], "link_connected": true,
    "vendor": "Intel", "product": "I350"
  },
  "eth9": { "enabled": false }
})";

TEST_CASE("Inventory JSON is parsed with names from the keys") {
    InterfaceMap m;
    std::string err;
    REQUIRE(interfaces_from_json(json::parse(INVENTORY), m, err));
    REQUIRE(m.size() == 3);

    const InterfaceInfo& eth0 = m.at("eth0");
    CHECK(eth0.name == "eth0");
    CHECK(eth0.index == 2);
    CHECK(eth0.mac_address == "00:11:22:33:44:55");
    REQUIRE(eth0.links.size() == 3);               // the address-less link is skipped
    CHECK(eth0.links[0].family == AddressFamily::IPv4);
    CHECK(eth0.links[2].family == AddressFamily::IPv6);

    const InterfaceInfo& vlan = m.at("eth0.100");
    CHECK(vlan.vid == std::optional<int>(100));
    CHECK(vlan.parent == std::optional<std::string>("eth0"));
    CHECK(vlan.link_connected == std::optional<bool>(true));
    CHECK(vlan.vendor == std::optional<std::string>("Intel"));
    CHECK(vlan.enabled);

    CHECK_FALSE(m.at("eth9").enabled);
}

TEST_CASE("Inventory JSON round-trips") {
    InterfaceMap m, back;
    std::string err;
    REQUIRE(interfaces_from_json(json::parse(INVENTORY), m, err));
    REQUIRE(interfaces_from_json(interfaces_to_json(m), back, err));
    CHECK(back == m);
}

TEST_CASE("Malformed inventory is an error") {
    InterfaceMap m;
    std::string err;
    CHECK_FALSE(interfaces_from_json(json::array(), m, err));
    CHECK_FALSE(interfaces_from_json(json{{"eth0", 5}}, m, err));
    CHECK_FALSE(interfaces_from_json(json{{"eth0", {{"vid", "one hundred"}}}}, m, err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("Link subnet masks the host bits") {
    CHECK(InterfaceLink{"192.168.1.5/24", AddressFamily::IPv4}.subnet() == "192.168.1.0/24");
    CHECK(InterfaceLink{"10.1.2.3/8", AddressFamily::IPv4}.subnet() == "10.0.0.0/8");
    CHECK(InterfaceLink{"172.16.5.9/32", AddressFamily::IPv4}.subnet() == "172.16.5.9/32");
    CHECK(InterfaceLink{"2001:db8::5/64", AddressFamily::IPv6}.subnet() == "2001:db8::/64");
    CHECK(InterfaceLink{"10.1.2.3", AddressFamily::IPv4}.subnet() == "10.1.2.3");
    CHECK(InterfaceLink{"192.168.1.5/24", AddressFamily::IPv4}.ip() == "192.168.1.5");
    CHECK(family_of("fe80::1") == AddressFamily::IPv6);
    CHECK(family_of("10.0.0.1") == AddressFamily::IPv4);
}

TEST_CASE("Remote descriptor omits an unknown MAC") {
    InterfaceInfo i;
    i.name = "eth3";
    i.vid  = 7;
    RemoteInterface r = i.to_remote();
    CHECK(r.name == "eth3");
    CHECK(r.vid == std::optional<int>(7));
    CHECK_FALSE(r.mac_address.has_value());

    i.mac_address = "aa:bb:cc:dd:ee:ff";
    CHECK(i.to_remote().mac_address == std::optional<std::string>("aa:bb:cc:dd:ee:ff"));
}

TEST_CASE("Membership plan: IPv6 per index, IPv4 on the first address only") {
    InterfaceMap m;
    std::string err;
    REQUIRE(interfaces_from_json(json::parse(INVENTORY), m, err));

    const auto plan = transport::plan_memberships(m);
    // eth0: IPv6 + IPv4(192.168.1.5); eth0.100: IPv6 only; eth9 disabled.
    REQUIRE(plan.size() == 3);

    int v4 = 0;
    for (const auto& mm : plan) {
        CHECK(mm.ifname != "eth9");
        if (mm.family == AddressFamily::IPv4) {
            ++v4;
            CHECK(mm.ipv4_address == "192.168.1.5");
            CHECK(mm.ifindex == 2);
        }
    }
    CHECK(v4 == 1);

    InterfaceMap no_index;
    InterfaceInfo x;
    x.name = "x";
    no_index["x"] = x;
    CHECK(transport::plan_memberships(no_index).empty());
}

TEST_CASE("Live inventory can be read and never lists loopback") {
    InterfaceMap m;
    std::string err;
    REQUIRE(read_system_interfaces(m, err));
    CHECK(m.count("lo") == 0);
    for (const auto& kv : m) CHECK(kv.first == kv.second.name);
}
