#include <doctest/doctest.h>
#include "netbeacon/interface_monitor.hpp"

#include <unistd.h> // getpid()

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace netbeacon;

static constexpr uint64_t NOW = 1700000000000ULL;

namespace {

struct ObserverLog {
    std::map<std::string, int> starts;
    std::map<std::string, int> stops;
    std::map<std::string, int> services;
    std::map<std::string, int> linger;      // services a stopped observer needs to exit
};

class FakeObserver : public IObserver {
public:
    FakeObserver(std::string ifname, ObserverLog& log) : ifname_(std::move(ifname)), log_(log) {}
    bool start(uint64_t) override { running_ = true; ++log_.starts[ifname_]; return true; }
    void stop() override {
        stopped_ = true;
        ++log_.stops[ifname_];
        if (log_.linger[ifname_] <= 0) running_ = false;
    }
    void service(uint64_t) override {
        ++log_.services[ifname_];
        if (stopped_ && running_ && --log_.linger[ifname_] <= 0) running_ = false;
    }
    bool running() const override { return running_; }
    const std::string& ifname() const override { return ifname_; }

private:
    std::string  ifname_;
    ObserverLog& log_;
    bool         running_{false};
    bool         stopped_{false};
};

InterfaceInfo iface(const std::string& name, bool enabled = true) {
    InterfaceInfo i;
    i.name    = name;
    i.enabled = enabled;
    return i;
}

// Monitor wired to an in-memory inventory, a fake observer factory and a recording sink.
struct Harness {
    InterfaceMap       inventory;
    int                reads{0};
    bool               inventory_ok{true};
    bool               accept_events{true};
    std::vector<Event> events;
    ObserverLog        log;
    InterfaceMonitor   monitor;

    explicit Harness(InterfaceMonitor::Options opts = InterfaceMonitor::Options{})
    : monitor(
          [this](InterfaceMap& out, std::string& err) {
              ++reads;
              if (!inventory_ok) { err = "boom"; return false; }
              out = inventory;
              return true;
          },
          [this](const std::string& ifname) -> std::unique_ptr<IObserver> {
              return std::make_unique<FakeObserver>(ifname, log);
          },
          [this](Event ev) {
              if (!accept_events) return false;
              events.push_back(std::move(ev));
              return true;
          },
          opts) {}
};

} // namespace

TEST_CASE("First refresh pushes the inventory and starts observers on enabled interfaces") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    h.inventory["eth1"] = iface("eth1");
    h.inventory["eth2"] = iface("eth2", false);

    REQUIRE(h.monitor.refresh(NOW));
    REQUIRE(h.events.size() == 1);
    CHECK(h.events[0].kind == Event::Kind::InterfacesUpdated);
    CHECK(h.events[0].interfaces.size() == 3);
    CHECK(h.monitor.monitored() == std::set<std::string>{"eth0", "eth1"});
    CHECK(h.log.starts["eth0"] == 1);
    CHECK(h.log.starts.count("eth2") == 0);
}

TEST_CASE("Unchanged inventory is not pushed again") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    REQUIRE(h.monitor.refresh(NOW));
    REQUIRE(h.monitor.refresh(NOW + 30000));
    CHECK(h.events.size() == 1);
    CHECK(h.log.starts["eth0"] == 1);
}

TEST_CASE("Observers follow interfaces coming and going") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    h.inventory["eth1"] = iface("eth1");
    REQUIRE(h.monitor.refresh(NOW));

    h.inventory.erase("eth1");
    h.inventory["eth3"] = iface("eth3");
    REQUIRE(h.monitor.refresh(NOW + 30000));

    CHECK(h.events.size() == 2);
    CHECK(h.log.stops["eth1"] == 1);
    CHECK(h.log.starts["eth3"] == 1);
    CHECK(h.log.starts["eth0"] == 1);
    CHECK(h.log.stops.count("eth0") == 0);
    CHECK(h.monitor.monitored() == std::set<std::string>{"eth0", "eth3"});
}

TEST_CASE("A removed observer that is slow to exit is serviced until it does") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    h.inventory["eth1"] = iface("eth1");
    REQUIRE(h.monitor.refresh(NOW));

    h.log.linger["eth1"] = 2;
    h.inventory.erase("eth1");
    h.monitor.service(NOW + 30000);             // refresh is due: eth1 is stopped
    CHECK(h.log.stops["eth1"] == 1);
    CHECK(h.monitor.monitored() == std::set<std::string>{"eth0"});
    CHECK(h.monitor.retiring() == 1);

    h.monitor.service(NOW + 30001);
    CHECK(h.monitor.retiring() == 0);
    CHECK(h.log.services["eth1"] == 2);
    CHECK(h.log.services["eth0"] == 2);

    h.monitor.service(NOW + 30002);
    CHECK(h.log.services["eth1"] == 2);
}

TEST_CASE("Disabling an interface stops its observer") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    REQUIRE(h.monitor.refresh(NOW));

    h.inventory["eth0"].enabled = false;
    REQUIRE(h.monitor.refresh(NOW + 1));
    CHECK(h.log.stops["eth0"] == 1);
    CHECK(h.monitor.monitored().empty());
    CHECK(h.events.size() == 2);
}

TEST_CASE("Explicit interface list narrows the monitored set") {
    InterfaceMonitor::Options opts;
    opts.monitor_interfaces = {"eth1"};
    Harness h(opts);
    h.inventory["eth0"] = iface("eth0");
    h.inventory["eth1"] = iface("eth1");

    REQUIRE(h.monitor.refresh(NOW));
    CHECK(h.monitor.monitored() == std::set<std::string>{"eth1"});
    CHECK(h.events.at(0).interfaces.size() == 2);   // the engine still sees everything
}

TEST_CASE("A refused update is retried on the next refresh") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    h.accept_events = false;
    REQUIRE(h.monitor.refresh(NOW));
    CHECK(h.events.empty());
    CHECK(h.monitor.inventory().empty());

    h.accept_events = true;
    REQUIRE(h.monitor.refresh(NOW + 30000));
    CHECK(h.events.size() == 1);
    CHECK(h.monitor.inventory().size() == 1);
}

TEST_CASE("Inventory read failure leaves everything as it was") {
    Harness h;
    h.inventory_ok = false;
    CHECK_FALSE(h.monitor.refresh(NOW));
    CHECK(h.events.empty());
    CHECK(h.monitor.monitored().empty());
}

TEST_CASE("service() refreshes on the interval and services observers every time") {
    InterfaceMonitor::Options opts;
    opts.refresh_interval_ms = 30000;
    Harness h(opts);
    h.inventory["eth0"] = iface("eth0");

    h.monitor.service(NOW);
    CHECK(h.reads == 1);
    CHECK(h.monitor.next_refresh_ms() == NOW + 30000);
    h.monitor.service(NOW + 1000);
    CHECK(h.reads == 1);
    h.monitor.service(NOW + 30000);
    CHECK(h.reads == 2);
    CHECK(h.log.services["eth0"] == 3);
}

TEST_CASE("stop() tears down observers, pushes an empty inventory, and is idempotent") {
    Harness h;
    h.inventory["eth0"] = iface("eth0");
    h.inventory["eth1"] = iface("eth1");
    REQUIRE(h.monitor.refresh(NOW));

    h.monitor.stop();
    CHECK(h.log.stops["eth0"] == 1);
    CHECK(h.log.stops["eth1"] == 1);
    REQUIRE(h.events.size() == 2);
    CHECK(h.events.back().kind == Event::Kind::InterfacesUpdated);
    CHECK(h.events.back().interfaces.empty());
    CHECK(h.monitor.monitored().empty());

    h.monitor.stop();
    CHECK(h.events.size() == 2);
    CHECK(h.log.stops["eth0"] == 1);

    h.monitor.service(NOW + 60000);
    CHECK(h.reads == 1);
}

TEST_CASE("Host lock is exclusive and gates interface monitoring") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / ("netbeacon-lock-test-" + std::to_string(::getpid()));
    const std::string path = (dir / "monitor.lock").string();

    HostLock other;
    std::string err;
    REQUIRE(other.try_acquire(path, err));
    CHECK(other.held());

    InterfaceMonitor::Options opts;
    opts.lock_path = path;
    Harness h(opts);
    h.inventory["eth0"] = iface("eth0");

    CHECK_FALSE(h.monitor.refresh(NOW));
    CHECK_FALSE(h.monitor.lock_held());
    CHECK(h.reads == 0);
    CHECK(h.monitor.monitored().empty());

    other.release();
    REQUIRE(h.monitor.refresh(NOW + 30000));
    CHECK(h.monitor.lock_held());
    CHECK(h.monitor.monitored() == std::set<std::string>{"eth0"});

    HostLock late;
    CHECK_FALSE(late.try_acquire(path, err));
    CHECK(err == "held by another process");

    h.monitor.stop();
    CHECK(late.try_acquire(path, err));
    late.release();

    std::error_code ec;
    fs::remove_all(dir, ec);
}
