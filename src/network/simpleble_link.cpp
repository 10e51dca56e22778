// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/simpleble_link.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace meshprobe {
namespace network {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

SimpleBleLink::SimpleBleLink(std::string address) : address_(std::move(address)) {}

SimpleBleLink::~SimpleBleLink() {
  close();
}

std::string SimpleBleLink::description() const {
  return any_device() ? std::string("ble any") : "ble " + address_;
}

bool SimpleBleLink::any_device() const {
  return address_.empty() || ToLower(address_) == "any";
}

bool SimpleBleLink::matches(SimpleBLE::Peripheral& peripheral) const {
  if (!any_device()) {
    const std::string wanted = ToLower(address_);
    return ToLower(peripheral.identifier()) == wanted || ToLower(peripheral.address()) == wanted;
  }
  for (auto& service : peripheral.services()) {
    if (ToLower(service.uuid()) == protocol::ble::SERVICE_UUID) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> SimpleBleLink::open(NotifyCallback on_from_num, CancelCheck cancelled) {
  try {
    if (!SimpleBLE::Adapter::bluetooth_enabled()) {
      return std::string("Bluetooth is not enabled");
    }
    auto adapters = SimpleBLE::Adapter::get_adapters();
    if (adapters.empty()) {
      return std::string("No Bluetooth adapter found");
    }
    adapter_ = adapters.front();
    LOG_NET_DEBUG("Scanning for {} on adapter {}", description(), adapter_->identifier());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(protocol::ble::SCAN_TIMEOUT_SEC);
    adapter_->scan_start();
    while (!peripheral_ && !cancelled() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(SCAN_POLL_INTERVAL);
      for (auto& peripheral : adapter_->scan_get_results()) {
        if (matches(peripheral)) {
          peripheral_ = peripheral;
          break;
        }
      }
    }
    adapter_->scan_stop();

    if (cancelled()) {
      peripheral_.reset();
      return std::string("Connection attempt cancelled");
    }
    if (!peripheral_) {
      return "No Meshtastic radio found for " + description() + " after " +
             std::to_string(protocol::ble::SCAN_TIMEOUT_SEC) + " seconds";
    }

    LOG_NET_DEBUG("Connecting to {} [{}]", peripheral_->identifier(), peripheral_->address());
    peripheral_->connect();
    peripheral_->notify(protocol::ble::SERVICE_UUID, protocol::ble::FROMNUM_UUID,
                        [on_from_num](SimpleBLE::ByteArray) { on_from_num(); });
    subscribed_ = true;
    return std::nullopt;
  } catch (const std::exception& e) {
    close();
    return std::string("Bluetooth error: ") + e.what();
  }
}

void SimpleBleLink::close() {
  if (!peripheral_) {
    return;
  }
  try {
    if (subscribed_) {
      subscribed_ = false;
      peripheral_->unsubscribe(protocol::ble::SERVICE_UUID, protocol::ble::FROMNUM_UUID);
    }
    if (peripheral_->is_connected()) {
      peripheral_->disconnect();
    }
  } catch (const std::exception& e) {
    LOG_NET_DEBUG("Error disconnecting {}: {}", description(), e.what());
  }
  peripheral_.reset();
}

bool SimpleBleLink::write_to_radio(const std::vector<uint8_t>& data) {
  if (!peripheral_) {
    return false;
  }
  try {
    peripheral_->write_request(protocol::ble::SERVICE_UUID, protocol::ble::TORADIO_UUID,
                               SimpleBLE::ByteArray(std::string(data.begin(), data.end())));
    return true;
  } catch (const std::exception& e) {
    LOG_NET_DEBUG("ToRadio write on {} failed: {}", description(), e.what());
    return false;
  }
}

std::optional<std::vector<uint8_t>> SimpleBleLink::read_from_radio() {
  if (!peripheral_) {
    return std::nullopt;
  }
  try {
    SimpleBLE::ByteArray bytes = peripheral_->read(protocol::ble::SERVICE_UUID, protocol::ble::FROMRADIO_UUID);
    const auto* begin = reinterpret_cast<const uint8_t*>(bytes.data());
    return std::vector<uint8_t>(begin, begin + bytes.size());
  } catch (const std::exception& e) {
    LOG_NET_DEBUG("FromRadio read on {} failed: {}", description(), e.what());
    return std::nullopt;
  }
}

}  // namespace network
}  // namespace meshprobe
