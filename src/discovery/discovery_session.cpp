// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "discovery/discovery_session.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace discovery {

namespace {

// Releases everything the listening phase acquired, in order: stop
// correlating, unregister the handler, close the link.
class ListenGuard {
public:
  ListenGuard(ResponseCorrelator& correlator, network::MeshInterface& iface)
      : correlator_(correlator), iface_(iface) {}

  ~ListenGuard() {
    correlator_.Disarm();
    try {
      iface_.clear_packet_handler();
      iface_.close();
    } catch (const std::exception& e) {
      LOG_DISC_ERROR("Error while closing {}: {}", iface_.description(), e.what());
    }
  }

  ListenGuard(const ListenGuard&) = delete;
  ListenGuard& operator=(const ListenGuard&) = delete;

private:
  ResponseCorrelator& correlator_;
  network::MeshInterface& iface_;
};

}  // namespace

std::string SessionStateAsString(SessionState state) {
  switch (state) {
  case SessionState::IDLE:
    return "idle";
  case SessionState::CONNECTING:
    return "connecting";
  case SessionState::LISTENING:
    return "listening";
  case SessionState::COMPLETED:
    return "completed";
  case SessionState::FAILED:
    return "failed";
  }
  return "unknown";
}

DiscoverySession::DiscoverySession(InterfaceFactory factory) : factory_(std::move(factory)) {}

void DiscoverySession::SetRecordObserver(ResponseCorrelator::RecordObserver observer) {
  correlator_.SetRecordObserver(std::move(observer));
}

DiscoveryResult DiscoverySession::Run(std::chrono::seconds duration) {
  DiscoveryResult result;
  state_ = SessionState::CONNECTING;

  // The pending stop request, if any, belongs to this run
  struct StopReset {
    DiscoverySession& session;
    ~StopReset() {
      std::lock_guard<std::mutex> lock(session.stop_mutex_);
      session.stop_requested_ = false;
    }
  } stop_reset{*this};

  auto fail = [&](const std::string& message) {
    LOG_DISC_ERROR("{}", message);
    result.error = message;
    result.final_state = SessionState::FAILED;
    state_ = SessionState::FAILED;
    return result;
  };

  network::MeshInterfacePtr iface;
  try {
    iface = factory_();
  } catch (const std::exception& e) {
    return fail(std::string("Failed to connect: ") + e.what());
  }
  if (!iface) {
    return fail("Failed to connect: no interface available");
  }
  result.interface_description = iface->description();

  auto close_unconnected = [&]() {
    try {
      iface->close();
    } catch (const std::exception& e) {
      LOG_DISC_DEBUG("Error closing {} after failed connect: {}", result.interface_description, e.what());
    }
  };

  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    result.interrupted = stop_requested_;
    if (!result.interrupted) {
      connecting_iface_ = iface.get();
    }
  }
  if (result.interrupted) {
    close_unconnected();
    return fail("Interrupted before connecting to " + result.interface_description);
  }

  std::optional<std::string> connect_error;
  try {
    connect_error = iface->connect();
  } catch (const std::exception& e) {
    connect_error = e.what();
  }
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    connecting_iface_ = nullptr;
    result.interrupted = stop_requested_;
  }
  if (result.interrupted) {
    close_unconnected();
    return fail("Interrupted while connecting to " + result.interface_description);
  }
  if (connect_error) {
    close_unconnected();
    return fail("Failed to connect to " + result.interface_description + ": " + *connect_error);
  }

  // Uncorrelated discovery is still useful, so a bad node table is not fatal
  PeerRegistry registry;
  try {
    registry = PeerRegistry::BuildSnapshot(iface->nodes(), iface->local_node_num());
  } catch (const std::exception& e) {
    LOG_DISC_WARN("Cannot read node table, continuing without known peers: {}", e.what());
  }
  LOG_DISC_DEBUG("Peer registry holds {} known nodes", registry.size());

  {
    ListenGuard guard(correlator_, *iface);

    // Armed before the probe leaves so an immediate reply is not lost
    correlator_.Arm(std::move(registry));
    iface->set_packet_handler([this](const network::ReceivedPacket& packet) { correlator_.OnPacket(packet); });
    state_ = SessionState::LISTENING;

    try {
      network::OutboundPacket probe;
      probe.destination = protocol::BROADCAST_ADDR;
      probe.portnum = protocol::PortNum::TRACEROUTE_APP;
      probe.payload = message::Encode(meshtastic::RouteDiscovery());
      probe.want_response = true;
      probe.hop_limit = protocol::NEARBY_PROBE_HOP_LIMIT;

      result.probe_id = iface->send_data(probe);
      if (!result.probe_id) {
        result.error = "Failed to send discovery probe on " + result.interface_description;
        LOG_DISC_ERROR("{}", *result.error);
      } else {
        LOG_DISC_INFO("Sent zero-hop traceroute id={} on {}, listening for {}s", *result.probe_id,
                      result.interface_description, duration.count());
        if (listening_callback_) {
          listening_callback_(*result.probe_id, duration);
        }
        result.interrupted = WaitForWindow(duration);
      }
    } catch (const std::exception& e) {
      result.error = std::string("Error during discovery: ") + e.what();
      LOG_DISC_ERROR("{}", *result.error);
    }
  }

  result.records = correlator_.Records();
  result.final_state = SessionState::COMPLETED;
  state_ = SessionState::COMPLETED;
  LOG_DISC_INFO("Discovery complete: {} replies{}", result.records.size(),
                result.interrupted ? " (interrupted)" : "");
  return result;
}

bool DiscoverySession::WaitForWindow(std::chrono::seconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return stop_cv_.wait_until(lock, deadline, [this]() { return stop_requested_; });
}

void DiscoverySession::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
    if (connecting_iface_) {
      LOG_DISC_DEBUG("Stop requested while connecting, closing {}", connecting_iface_->description());
      try {
        connecting_iface_->close();
      } catch (const std::exception& e) {
        LOG_DISC_DEBUG("Error cancelling connect: {}", e.what());
      }
    }
  }
  stop_cv_.notify_all();
}

}  // namespace discovery
}  // namespace meshprobe
