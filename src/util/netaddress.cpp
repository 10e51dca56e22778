// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <cctype>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace meshprobe {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()).to_string();
    }
    return ip.to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<uint16_t> SafeParsePort(const std::string& port_str) {
  if (port_str.empty() || port_str.size() > 5) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (char c : port_str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

std::optional<HostPort> ParseHostPort(const std::string& address, uint16_t default_port) {
  if (address.empty()) {
    return std::nullopt;
  }

  HostPort result;
  result.port = default_port;

  // "[IPv6]" or "[IPv6]:port"
  if (address[0] == '[') {
    const size_t bracket_end = address.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return std::nullopt;
    }
    result.host = address.substr(1, bracket_end - 1);
    if (bracket_end + 1 < address.size()) {
      if (address[bracket_end + 1] != ':') {
        return std::nullopt;
      }
      auto port = SafeParsePort(address.substr(bracket_end + 2));
      if (!port) {
        return std::nullopt;
      }
      result.port = *port;
    }
    return result;
  }

  const size_t first_colon = address.find(':');
  if (first_colon == std::string::npos) {
    result.host = address;
    return result;
  }

  // More than one colon: only valid as a bare IPv6 literal
  if (address.find(':', first_colon + 1) != std::string::npos) {
    if (!IsValidIPAddress(address)) {
      return std::nullopt;
    }
    result.host = address;
    return result;
  }

  result.host = address.substr(0, first_colon);
  if (result.host.empty()) {
    return std::nullopt;
  }
  auto port = SafeParsePort(address.substr(first_colon + 1));
  if (!port) {
    return std::nullopt;
  }
  result.port = *port;
  return result;
}

bool IsIPv4Literal(const std::string& address) {
  int groups = 0;
  size_t digits = 0;
  for (char c : address) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      if (++digits > 3) {
        return false;
      }
    } else if (c == '.') {
      if (digits == 0) {
        return false;
      }
      ++groups;
      digits = 0;
    } else {
      return false;
    }
  }
  return groups == 3 && digits > 0;
}

bool IsMacAddress(const std::string& address) {
  // XX:XX:XX:XX:XX:XX
  if (address.size() != 17) {
    return false;
  }
  const char sep = address[2];
  if (sep != ':' && sep != '-') {
    return false;
  }
  for (size_t i = 0; i < address.size(); ++i) {
    if (i % 3 == 2) {
      if (address[i] != sep) {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(address[i]))) {
      return false;
    }
  }
  return true;
}

bool IsHostnameLike(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  for (char c : address) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace util
}  // namespace meshprobe
