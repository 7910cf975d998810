#include <doctest/doctest.h>
#include "netbeacon/config.hpp"

#include <unistd.h> // getpid()

#include <filesystem>
#include <fstream>
#include <string>

using namespace netbeacon;
namespace fs = std::filesystem;

static fs::path scratch_dir() {
    const fs::path d = fs::temp_directory_path() / ("netbeacon-config-test-" + std::to_string(::getpid()));
    fs::create_directories(d);
    return d;
}

TEST_CASE("Defaults match the protocol constants") {
    Config c;
    CHECK(c.port == 5240);
    CHECK(c.bind_address == "::");
    CHECK(c.ipv4_group == "224.0.0.118");
    CHECK(c.ipv6_group == "ff02::15a");
    CHECK(c.aging_window_ms == 120000);
    CHECK(c.min_broadcast_interval_ms == 5000);
    CHECK(c.solicitation_interval_ms == 60000);
    CHECK(c.interface_refresh_ms == 30000);
    CHECK(c.observer_restart_ms == 60000);
    CHECK(c.observer_command == "netbeacon-observe-beacons {ifname}");
    CHECK_FALSE(c.loopback);
    CHECK_FALSE(c.process_socket_beacons);
    CHECK(c.lock_path == "/run/netbeacon/networks-monitoring.lock");
    CHECK(c.hints_path.empty());
    CHECK(c.log_level == "info");
}

TEST_CASE("JSON keys override defaults; seconds become milliseconds") {
    Config c;
    std::string err;
    json j = {
        {"port", 15240},
        {"loopback", true},
        {"aging_window_seconds", 60},
        {"min_broadcast_interval_seconds", 2.5},
        {"solicitation_interval_seconds", 0},
        {"monitor_interfaces", {"eth0", "eth1"}},
        {"hints_path", "/tmp/hints.json"},
        {"log_level", "debug"},
    };
    REQUIRE(apply_config_json(j, c, err));
    CHECK(c.port == 15240);
    CHECK(c.loopback);
    CHECK(c.aging_window_ms == 60000);
    CHECK(c.min_broadcast_interval_ms == 2500);
    CHECK(c.solicitation_interval_ms == 0);
    CHECK(c.monitor_interfaces == std::vector<std::string>{"eth0", "eth1"});
    CHECK(c.hints_path == "/tmp/hints.json");
    CHECK(c.log_level == "debug");

    auto eo = c.engine_options();
    CHECK(eo.aging_window_ms == 60000);
    CHECK(eo.min_broadcast_interval_ms == 2500);
    CHECK(eo.solicitation_interval_ms == 0);

    auto to = c.transport_config();
    CHECK(to.port == 15240);
    CHECK(to.loopback);

    auto mo = c.monitor_options();
    CHECK(mo.monitor_interfaces.size() == 2);
    CHECK(mo.lock_path == c.lock_path);
}

TEST_CASE("Unknown keys are ignored") {
    Config c;
    std::string err;
    CHECK(apply_config_json(json{{"colour", "blue"}, {"port", 1}}, c, err));
    CHECK(c.port == 1);
}

TEST_CASE("Wrong types and bad values are errors and leave the config untouched") {
    std::string err;

    Config c;
    CHECK_FALSE(apply_config_json(json{{"loopback", true}, {"port", "5240"}}, c, err));
    CHECK_FALSE(c.loopback);
    CHECK(c.port == 5240);

    CHECK_FALSE(apply_config_json(json{{"port", 70000}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"port", -1}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"loopback", "yes"}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"aging_window_seconds", -5}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"aging_window_seconds", 0}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"aging_window_seconds", 1e300}}, c, err));
    CHECK(err.find("aging_window_seconds") != std::string::npos);
    CHECK_FALSE(apply_config_json(json{{"solicitation_interval_seconds", MAX_DURATION_SECONDS + 1}}, c, err));
    CHECK(c.aging_window_ms == DEFAULT_AGING_WINDOW_MS);
    CHECK(c.solicitation_interval_ms == 60000);
    CHECK_FALSE(apply_config_json(json{{"monitor_interfaces", "eth0"}}, c, err));
    CHECK_FALSE(apply_config_json(json{{"log_level", "chatty"}}, c, err));
    CHECK_FALSE(apply_config_json(json::array(), c, err));
    CHECK(c.log_level == "info");
}

TEST_CASE("load_config reads a file and reports parse errors") {
    const fs::path dir = scratch_dir();
    const std::string good = (dir / "good.json").string();
    const std::string bad  = (dir / "bad.json").string();
    {
        std::ofstream(good) << R"({"port": 6000, "observer_command": ""})";
        std::ofstream(bad) << "{ not json";
    }

    Config c;
    std::string err;
    REQUIRE(load_config(good, c, err));
    CHECK(c.port == 6000);
    CHECK(c.observer_command.empty());

    CHECK_FALSE(load_config(bad, c, err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(load_config((dir / "missing.json").string(), c, err));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Atomic JSON write replaces the target and leaves no temp file") {
    const fs::path dir = scratch_dir() / "nested";
    const std::string path = (dir / "hints.json").string();
    std::string err;

    REQUIRE(write_json_atomic(path, json::array({1, 2}), err));
    REQUIRE(write_json_atomic(path, json::array({3}), err));
    CHECK_FALSE(fs::exists(path + ".tmp"));

    json back;
    REQUIRE(read_json_file(path, back, err));
    CHECK(back == json::array({3}));

    std::error_code ec;
    fs::remove_all(dir.parent_path(), ec);
}

TEST_CASE("Config round-trips through its file form") {
    Config a;
    a.port = 7000;
    a.monitor_interfaces = {"br0"};
    a.min_broadcast_interval_ms = 1500;

    Config b;
    std::string err;
    REQUIRE(apply_config_json(config_to_json(a), b, err));
    CHECK(b.port == 7000);
    CHECK(b.monitor_interfaces == a.monitor_interfaces);
    CHECK(b.min_broadcast_interval_ms == 1500);
}
