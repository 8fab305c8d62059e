// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/address.hpp"
#include "util/netaddress.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>

namespace raftwire {
namespace network {

Address::Address(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {
  if (auto normalized = util::ValidateAndNormalizeIP(host_)) {
    host_ = *normalized;
  }
}

std::optional<Address> Address::Parse(const std::string &host_port) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(host_port, host, port)) {
    return std::nullopt;
  }
  return Address(host, port);
}

boost::asio::ip::tcp::endpoint Address::socket_address() const {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(host_, ec);
  if (!ec) {
    return boost::asio::ip::tcp::endpoint(ip, port_);
  }

  boost::asio::io_context io_context;
  boost::asio::ip::tcp::resolver resolver(io_context);
  // Throws on failure
  auto results = resolver.resolve(host_, std::to_string(port_));
  if (results.empty()) {
    throw boost::system::system_error(boost::asio::error::host_not_found, host_);
  }
  return results.begin()->endpoint();
}

bool Address::is_wildcard() const {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(host_, ec);
  return !ec && ip.is_unspecified();
}

std::string Address::to_string() const {
  if (host_.find(':') != std::string::npos) {
    return "[" + host_ + "]:" + std::to_string(port_);
  }
  return host_ + ":" + std::to_string(port_);
}

} // namespace network
} // namespace raftwire
