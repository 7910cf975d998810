#pragma once
/**
 * @file transport_udp_multicast.hpp
 * @brief Linux dual-stack UDP multicast transport (header-only, non-blocking).
 *
 * One AF_INET6 socket serves both families: IPv4 peers appear as IPv4-mapped
 * addresses, and IPv4 group membership is managed with IPPROTO_IP options on the
 * same socket. recvmsg() pktinfo recovers the destination address and receiving
 * interface index of each datagram.
 *
 * Depends on: sys/socket.h, netinet/in.h, arpa/inet.h, unistd.h.
 */

#if !defined(__linux__)
#  error "transport_udp_multicast.hpp is Linux-only."
#endif

#include "netbeacon/transport/transport_base.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace netbeacon::transport {

class UdpMulticast : public IMulticastTransport {
public:
  static constexpr std::size_t MAX_DATAGRAM = 65535;

  UdpMulticast() = default;
  ~UdpMulticast() override { end(); }

  UdpMulticast(const UdpMulticast&) = delete;
  UdpMulticast& operator=(const UdpMulticast&) = delete;

  bool begin(const Config& cfg) override {
    end();
    cfg_ = cfg;

    if (::inet_pton(AF_INET6, cfg_.ipv6_group.c_str(), &group6_) != 1 ||
        ::inet_pton(AF_INET, cfg_.ipv4_group.c_str(), &group4_) != 1) {
      return fail("invalid multicast group address");
    }

    fd_ = ::socket(AF_INET6, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return fail_errno("socket");

    const int off = 0, on = 1;
    if (!setopt(IPPROTO_IPV6, IPV6_V6ONLY, off, "IPV6_V6ONLY")) return close_fail();
    if (!setopt(SOL_SOCKET, SO_REUSEADDR, on, "SO_REUSEADDR")) return close_fail();
    if (!setopt(SOL_SOCKET, SO_REUSEPORT, on, "SO_REUSEPORT")) return close_fail();
    if (!setopt(IPPROTO_IPV6, IPV6_RECVPKTINFO, on, "IPV6_RECVPKTINFO")) return close_fail();
    if (!setopt(IPPROTO_IP, IP_PKTINFO, on, "IP_PKTINFO")) return close_fail();

    sockaddr_in6 sa{};
    sa.sin6_family = AF_INET6;
    sa.sin6_port   = htons(cfg_.port);
    if (!parse_ip(cfg_.bind_address, sa.sin6_addr)) {
      fail("invalid bind address: " + cfg_.bind_address);
      return close_fail();
    }
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
      fail_errno("bind");
      return close_fail();
    }

    sockaddr_in6 bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
      local_port_ = ntohs(bound.sin6_port);

    const int loop = cfg_.loopback ? 1 : 0;
    if (!setopt(IPPROTO_IPV6, IPV6_MULTICAST_LOOP, loop, "IPV6_MULTICAST_LOOP")) return close_fail();
    if (!setopt(IPPROTO_IP, IP_MULTICAST_LOOP, loop, "IP_MULTICAST_LOOP")) return close_fail();
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    local_port_ = 0;
  }

  bool is_open() const override { return fd_ >= 0; }

  bool join_group(const Membership& m) override {
    return membership(m, true);
  }

  bool leave_group(const Membership& m) override {
    return membership(m, false);
  }

  TxResult send_multicast(const MulticastSource& src, const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;

    sockaddr_in6 dst{};
    dst.sin6_family = AF_INET6;
    dst.sin6_port   = htons(dest_port());

    // Link scope only: TTL / hop limit pinned to 1 before every write.
    const int hops = 1;
    if (src.family == AddressFamily::IPv4) {
      in_addr ifaddr{};
      if (::inet_pton(AF_INET, src.ipv4_address.c_str(), &ifaddr) != 1) {
        fail("invalid IPv4 source: " + src.ipv4_address);
        return TxResult::Error;
      }
      if (!setopt(IPPROTO_IP, IP_MULTICAST_TTL, hops, "IP_MULTICAST_TTL")) return TxResult::Error;
      if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &ifaddr, sizeof(ifaddr)) != 0) {
        fail_errno("IP_MULTICAST_IF");
        return TxResult::Error;
      }
      map_v4(group4_, dst.sin6_addr);
    } else {
      const int idx = static_cast<int>(src.ifindex);
      if (!setopt(IPPROTO_IPV6, IPV6_MULTICAST_HOPS, hops, "IPV6_MULTICAST_HOPS")) return TxResult::Error;
      if (!setopt(IPPROTO_IPV6, IPV6_MULTICAST_IF, idx, "IPV6_MULTICAST_IF")) return TxResult::Error;
      dst.sin6_addr     = group6_;
      dst.sin6_scope_id = src.ifindex;
    }
    return write_to(dst, data, len);
  }

  TxResult send_unicast(const std::string& ip, uint16_t port, const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    sockaddr_in6 dst{};
    dst.sin6_family = AF_INET6;
    dst.sin6_port   = htons(port);
    if (!parse_ip(ip, dst.sin6_addr)) {
      fail("invalid unicast destination: " + ip);
      return TxResult::Error;
    }
    return write_to(dst, data, len);
  }

  RxResult recv(Datagram& out) override {
    if (fd_ < 0) return RxResult::Error;

    buf_.resize(MAX_DATAGRAM);
    sockaddr_in6 from{};
    iovec iov{buf_.data(), buf_.size()};
    alignas(cmsghdr) char control[256];
    msghdr msg{};
    msg.msg_name       = &from;
    msg.msg_namelen    = sizeof(from);
    msg.msg_iov        = &iov;
    msg.msg_iovlen     = 1;
    msg.msg_control    = control;
    msg.msg_controllen = sizeof(control);

    const ssize_t r = ::recvmsg(fd_, &msg, 0);
    if (r < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
      fail_errno("recvmsg");
      return RxResult::Error;
    }

    out = Datagram{};
    out.bytes.assign(buf_.begin(), buf_.begin() + r);
    out.source_ip   = render(from.sin6_addr);
    out.source_port = ntohs(from.sin6_port);

    for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c)) {
      if (c->cmsg_level == IPPROTO_IPV6 && c->cmsg_type == IPV6_PKTINFO) {
        in6_pktinfo pi{};
        std::memcpy(&pi, CMSG_DATA(c), sizeof(pi));
        out.destination_ip = render(pi.ipi6_addr);
        out.ifindex        = static_cast<unsigned>(pi.ipi6_ifindex);
      } else if (c->cmsg_level == IPPROTO_IP && c->cmsg_type == IP_PKTINFO) {
        in_pktinfo pi{};
        std::memcpy(&pi, CMSG_DATA(c), sizeof(pi));
        char tmp[INET_ADDRSTRLEN] = {0};
        if (::inet_ntop(AF_INET, &pi.ipi_addr, tmp, sizeof(tmp))) out.destination_ip = tmp;
        out.ifindex = static_cast<unsigned>(pi.ipi_ifindex);
      }
    }
    return RxResult::Ok;
  }

  int fd() const override { return fd_; }
  uint16_t local_port() const override { return local_port_; }
  const std::string& last_error() const override { return last_error_; }
  const char* name() const override { return "udp-multicast"; }

private:
  bool membership(const Membership& m, bool join) {
    if (fd_ < 0) return fail("socket not open");
    int rc = 0;
    if (m.family == AddressFamily::IPv6) {
      ipv6_mreq mreq{};
      mreq.ipv6mr_multiaddr = group6_;
      mreq.ipv6mr_interface = m.ifindex;
      rc = ::setsockopt(fd_, IPPROTO_IPV6, join ? IPV6_ADD_MEMBERSHIP : IPV6_DROP_MEMBERSHIP,
                        &mreq, sizeof(mreq));
    } else {
      ip_mreq mreq{};
      mreq.imr_multiaddr = group4_;
      if (::inet_pton(AF_INET, m.ipv4_address.c_str(), &mreq.imr_interface) != 1)
        return fail("invalid IPv4 membership address: " + m.ipv4_address);
      rc = ::setsockopt(fd_, IPPROTO_IP, join ? IP_ADD_MEMBERSHIP : IP_DROP_MEMBERSHIP,
                        &mreq, sizeof(mreq));
    }
    if (rc == 0) return true;
    if (join && errno == EADDRINUSE) return true;        // already a member
    if (!join && errno == EADDRNOTAVAIL) return true;    // was not a member
    return fail_errno(join ? "join group" : "leave group");
  }

  TxResult write_to(const sockaddr_in6& dst, const uint8_t* data, std::size_t len) {
    const ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (w >= 0) return TxResult::Ok;
    if (errno == EAGAIN || errno == EWOULDBLOCK) { fail_errno("sendto"); return TxResult::Busy; }
    fail_errno("sendto");
    return TxResult::Error;
  }

  uint16_t dest_port() const {
    if (cfg_.group_port != 0) return cfg_.group_port;
    return cfg_.port != 0 ? cfg_.port : local_port_;
  }

  static void map_v4(const in_addr& v4, in6_addr& out) {
    std::memset(&out, 0, sizeof(out));
    out.s6_addr[10] = 0xFF;
    out.s6_addr[11] = 0xFF;
    std::memcpy(&out.s6_addr[12], &v4, 4);
  }

  // Accepts IPv6 text or an IPv4 dotted quad (mapped).
  static bool parse_ip(const std::string& ip, in6_addr& out) {
    if (::inet_pton(AF_INET6, ip.c_str(), &out) == 1) return true;
    in_addr v4{};
    if (::inet_pton(AF_INET, ip.c_str(), &v4) != 1) return false;
    map_v4(v4, out);
    return true;
  }

  // IPv4-mapped addresses come back as dotted quads.
  static std::string render(const in6_addr& a) {
    char tmp[INET6_ADDRSTRLEN] = {0};
    if (IN6_IS_ADDR_V4MAPPED(&a)) {
      if (::inet_ntop(AF_INET, &a.s6_addr[12], tmp, sizeof(tmp))) return tmp;
      return {};
    }
    if (::inet_ntop(AF_INET6, &a, tmp, sizeof(tmp))) return tmp;
    return {};
  }

  bool setopt(int level, int opt, int value, const char* what) {
    if (::setsockopt(fd_, level, opt, &value, sizeof(value)) == 0) return true;
    return fail_errno(what);
  }

  bool fail(const std::string& why) { last_error_ = why; return false; }
  bool fail_errno(const char* what) { return fail(std::string(what) + ": " + std::strerror(errno)); }
  bool close_fail() { ::close(fd_); fd_ = -1; return false; }

  Config      cfg_{};
  int         fd_{-1};
  uint16_t    local_port_{0};
  in6_addr    group6_{};
  in_addr     group4_{};
  std::string last_error_;
  std::vector<uint8_t> buf_;
};

} // namespace netbeacon::transport
