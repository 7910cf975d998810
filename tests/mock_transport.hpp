#pragma once
/**
 * @file mock_transport.hpp
 * @brief Recording IMulticastTransport for engine tests.
 *
 * The engine takes ownership of its transport, so everything the mock records lives
 * in a shared MockState the test keeps a handle to.
 */

#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "netbeacon/transport/transport_base.hpp"

namespace netbeacon::test {

struct SentDatagram {
    bool                       multicast{false};
    transport::MulticastSource source;      // multicast only
    std::string                ip;          // unicast only
    uint16_t                   port{0};     // unicast only
    std::vector<uint8_t>       bytes;
};

struct MockState {
    bool open{true};
    bool fail_sends{false};
    bool fail_joins{false};

    std::vector<transport::Membership> joins;
    std::vector<transport::Membership> leaves;
    std::vector<SentDatagram>          sent;
    std::deque<transport::Datagram>    inbound;
    int                                end_calls{0};
    std::string                        error;

    std::vector<SentDatagram> unicasts() const {
        std::vector<SentDatagram> out;
        for (const auto& s : sent) if (!s.multicast) out.push_back(s);
        return out;
    }
    std::vector<SentDatagram> multicasts() const {
        std::vector<SentDatagram> out;
        for (const auto& s : sent) if (s.multicast) out.push_back(s);
        return out;
    }
};

class MockTransport : public transport::IMulticastTransport {
public:
    explicit MockTransport(std::shared_ptr<MockState> st) : st_(std::move(st)) {}

    bool begin(const transport::Config&) override { st_->open = true; return true; }
    void end() override { st_->open = false; ++st_->end_calls; }
    bool is_open() const override { return st_->open; }

    bool join_group(const transport::Membership& m) override {
        if (st_->fail_joins) { st_->error = "join refused"; return false; }
        st_->joins.push_back(m);
        return true;
    }
    bool leave_group(const transport::Membership& m) override {
        st_->leaves.push_back(m);
        return true;
    }

    transport::TxResult send_multicast(const transport::MulticastSource& src,
                                       const uint8_t* data, std::size_t len) override {
        if (st_->fail_sends) { st_->error = "send refused"; return transport::TxResult::Error; }
        SentDatagram s;
        s.multicast = true;
        s.source    = src;
        s.bytes.assign(data, data + len);
        st_->sent.push_back(std::move(s));
        return transport::TxResult::Ok;
    }

    transport::TxResult send_unicast(const std::string& ip, uint16_t port,
                                     const uint8_t* data, std::size_t len) override {
        if (st_->fail_sends) { st_->error = "send refused"; return transport::TxResult::Error; }
        SentDatagram s;
        s.ip   = ip;
        s.port = port;
        s.bytes.assign(data, data + len);
        st_->sent.push_back(std::move(s));
        return transport::TxResult::Ok;
    }

    transport::RxResult recv(transport::Datagram& out) override {
        if (st_->inbound.empty()) return transport::RxResult::None;
        out = std::move(st_->inbound.front());
        st_->inbound.pop_front();
        return transport::RxResult::Ok;
    }

    int fd() const override { return -1; }
    uint16_t local_port() const override { return 5240; }
    const std::string& last_error() const override { return st_->error; }
    const char* name() const override { return "mock"; }

private:
    std::shared_ptr<MockState> st_;
};

} // namespace netbeacon::test
