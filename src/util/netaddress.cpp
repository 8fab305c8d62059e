// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>
#include <cctype>

namespace raftwire {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

namespace {

// Split on the last ':' honouring "[v6]:port" brackets. Rejects unbracketed
// IPv6 (more than one colon) so "::1:80" is never misread.
bool SplitHostPort(const std::string& input, std::string& host, std::string& port) {
  if (input.empty()) {
    return false;
  }

  if (input[0] == '[') {
    size_t bracket_end = input.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= input.length() || input[bracket_end + 1] != ':') {
      return false;
    }
    host = input.substr(1, bracket_end - 1);
    port = input.substr(bracket_end + 2);
    return true;
  }

  size_t first_colon = input.find(':');
  if (first_colon == std::string::npos) {
    return false;
  }
  if (input.find(':', first_colon + 1) != std::string::npos) {
    return false;
  }
  host = input.substr(0, first_colon);
  port = input.substr(first_colon + 1);
  return !host.empty();
}

bool IsValidHostName(const std::string& host) {
  if (host.empty() || host.size() > 253) {
    return false;
  }
  for (char c : host) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '-' && c != '.') {
      return false;
    }
  }
  return host.front() != '-' && host.front() != '.';
}

} // namespace

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  std::string host;
  std::string port_str;
  if (!SplitHostPort(host_port, host, port_str)) {
    return false;
  }

  auto port_opt = SafeParseInt(port_str, 0, 65535);
  if (!port_opt) {
    return false;
  }

  if (auto normalized = ValidateAndNormalizeIP(host)) {
    out_host = *normalized;
  } else if (IsValidHostName(host)) {
    out_host = host;
  } else {
    return false;
  }

  out_port = static_cast<uint16_t>(*port_opt);
  return true;
}

} // namespace util
} // namespace raftwire
