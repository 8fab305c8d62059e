#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split "host:port" strings used on the command line and in configs

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseHostPort: "host:port" / "[IPv6]:port", host an IP literal or a DNS name
*/

#include <cstdint>
#include <optional>
#include <string>

namespace raftwire {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 format, so "::ffff:10.0.0.1" and "10.0.0.1" compare equal.
 * Host names are rejected.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Parse "host:port" where host is an IP literal or a DNS name
 * ("localhost:19200", "journal-0.internal:19200", "[::1]:19200").
 * IP literals are normalized; names are returned as given. Port 0 is
 * accepted so callers can request an ephemeral port.
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

} // namespace util
} // namespace raftwire
