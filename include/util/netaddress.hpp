#pragma once

/*
 Device Address Utilities

 Purpose:
 - Classify the free-form --address argument (IP literal, hostname, BLE MAC)
 - Split "host:port" strings for the TCP transport

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseHostPort: host[:port] / [IPv6][:port] with a default port
 - IsIPv4Literal / IsMacAddress / IsHostnameLike: syntax checks used for interface auto-detection
*/

#include <cstdint>
#include <optional>
#include <string>

namespace meshprobe {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address(), returning the canonical form and mapping
 * IPv4-mapped IPv6 addresses to plain IPv4 (::ffff:1.2.3.4 -> 1.2.3.4).
 * Hostnames are not accepted.
 *
 * @return Normalized IP address string, or std::nullopt if invalid
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// Parse a decimal port (1-65535). Rejects signs, whitespace and trailing characters.
std::optional<uint16_t> SafeParsePort(const std::string& port_str);

struct HostPort {
  std::string host;
  uint16_t port{0};
};

/**
 * Split a TCP device address into host and port
 *
 * Accepted forms:
 *   "meshtastic.local"      -> host, default_port
 *   "192.168.1.20:4403"     -> host, 4403
 *   "[fe80::1]:4403"        -> "fe80::1", 4403
 *   "fe80::1"               -> bare IPv6 literal, default_port
 *
 * @return std::nullopt on empty host, bad port, or unbalanced brackets
 */
std::optional<HostPort> ParseHostPort(const std::string& address, uint16_t default_port);

// Dotted-quad IPv4 literal (four 1-3 digit groups)
bool IsIPv4Literal(const std::string& address);

// Bluetooth MAC address: six hex pairs separated by ':' or '-'
bool IsMacAddress(const std::string& address);

// Only letters, digits, '-' and '.'
bool IsHostnameLike(const std::string& address);

}  // namespace util
}  // namespace meshprobe
