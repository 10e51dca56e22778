// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/ble_interface.hpp"

#include <simpleble/SimpleBLE.h>

#include <optional>
#include <string>

namespace meshprobe {
namespace network {

// SimpleBleLink - GattLink on the SimpleBLE client library
//
// Address is a device name, a MAC address or the platform identifier. An
// empty address or "any" selects the first radio advertising the Meshtastic
// service.
class SimpleBleLink : public GattLink {
public:
  explicit SimpleBleLink(std::string address);
  ~SimpleBleLink() override;

  std::optional<std::string> open(NotifyCallback on_from_num, CancelCheck cancelled) override;
  void close() override;
  bool write_to_radio(const std::vector<uint8_t>& data) override;
  std::optional<std::vector<uint8_t>> read_from_radio() override;
  std::string description() const override;

private:
  bool any_device() const;
  bool matches(SimpleBLE::Peripheral& peripheral) const;

  std::string address_;
  std::optional<SimpleBLE::Adapter> adapter_;
  std::optional<SimpleBLE::Peripheral> peripheral_;
  bool subscribed_{false};

  static constexpr std::chrono::milliseconds SCAN_POLL_INTERVAL{250};
};

}  // namespace network
}  // namespace meshprobe
