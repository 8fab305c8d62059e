// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace raftwire {
namespace network {

/**
 * Address - transport endpoint as the consensus layer names it
 *
 * host is an IP literal or a DNS name; port 0 asks the runtime for an
 * ephemeral port. Resolution to a socket endpoint is deferred to bind time.
 */
class Address {
public:
  Address() = default;
  Address(std::string host, uint16_t port);

  // Parse "host:port" or "[v6]:port"; std::nullopt if malformed
  static std::optional<Address> Parse(const std::string &host_port);

  const std::string &host() const { return host_; }
  uint16_t port() const { return port_; }

  /**
   * Resolve to a TCP endpoint. IP literals resolve without I/O; names go
   * through the system resolver (first result wins).
   * @throws boost::system::system_error if the host cannot be resolved
   */
  boost::asio::ip::tcp::endpoint socket_address() const;

  // True for 0.0.0.0 / :: (bind on every interface)
  bool is_wildcard() const;

  // "host:port", IPv6 literals bracketed
  std::string to_string() const;

  bool operator==(const Address &other) const = default;

private:
  std::string host_;
  uint16_t port_ = 0;
};

} // namespace network
} // namespace raftwire
