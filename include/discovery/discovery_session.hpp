// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

/*
 DiscoverySession - one nearby-node discovery pass

 Sequence
   IDLE -> CONNECTING -> LISTENING -> COMPLETED
                      \-> FAILED (interface could not be created or connected)

 1. Create and connect the MeshInterface
 2. Snapshot the node table into a PeerRegistry (empty if unreadable)
 3. Arm the ResponseCorrelator and register it as the packet handler
 4. Broadcast an empty RouteDiscovery on TRACEROUTE_APP with hop limit 0
    and want_response set; only nodes in direct radio range can answer
 5. Wait until the window ends or RequestStop() is called
 6. Disarm, unregister, close; return the records in arrival order

 Step 6 runs on every exit path. Connection failures and errors during the
 window are reported through DiscoveryResult, never thrown. The probe is
 sent once; there are no retries.

 A stop request stays pending until a Run() consumes it. Made before or
 during step 1 it closes the interface, which cancels the connect, and the
 run ends FAILED with interrupted set.
*/

#include "discovery/correlator.hpp"
#include "network/mesh_interface.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace discovery {

enum class SessionState {
  IDLE,
  CONNECTING,
  LISTENING,
  COMPLETED,
  FAILED,
};

std::string SessionStateAsString(SessionState state);

struct DiscoveryResult {
  std::vector<DiscoveryRecord> records;
  SessionState final_state{SessionState::IDLE};
  std::optional<std::string> error;  // Connection failure, or error during the window
  bool interrupted{false};           // Window cut short by RequestStop()
  std::optional<uint32_t> probe_id;
  std::string interface_description;
};

class DiscoverySession {
public:
  using InterfaceFactory = std::function<network::MeshInterfacePtr()>;
  using ListeningCallback = std::function<void(uint32_t probe_id, std::chrono::seconds duration)>;

  explicit DiscoverySession(InterfaceFactory factory);

  DiscoverySession(const DiscoverySession&) = delete;
  DiscoverySession& operator=(const DiscoverySession&) = delete;

  // Run a full pass. Blocks for up to `duration` plus connect time.
  DiscoveryResult Run(std::chrono::seconds duration);

  // End the current (or next) run early. Safe from any thread.
  void RequestStop();

  SessionState state() const { return state_.load(); }

  // The record observer runs on the interface's I/O thread. The listening
  // callback runs on the Run() thread once the probe is sent.
  void SetRecordObserver(ResponseCorrelator::RecordObserver observer);
  void SetListeningCallback(ListeningCallback callback) { listening_callback_ = std::move(callback); }

private:
  // Returns true if the window was cut short
  bool WaitForWindow(std::chrono::seconds duration);

  InterfaceFactory factory_;
  ResponseCorrelator correlator_;
  ListeningCallback listening_callback_;
  std::atomic<SessionState> state_{SessionState::IDLE};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  network::MeshInterface* connecting_iface_{nullptr};  // Set only while connect() runs
};

}  // namespace discovery
}  // namespace meshprobe
