// Fuzz target for the radio stream codec
// Tests FrameReader resynchronisation, FromRadio decoding and the
// MeshPacket -> ReceivedPacket conversion used by the discovery handler
//
// Every byte here comes straight off a serial line, TCP socket or BLE
// characteristic, and a serial port also carries the firmware's debug
// console. Bugs in this code can:
// - Crash the client on console noise (out-of-bounds reads in frame lengths)
// - Stall discovery (a bad header that never resyncs)
// - Leak exceptions from the I/O thread
//
// Target code:
// - src/mesh/stream_framer.cpp (FrameReader::feed)
// - src/mesh/message.cpp (Decode into the generated FromRadio)
// - src/network/mesh_interface.cpp (DecodeReceivedPacket)

#include "discovery/correlator.hpp"
#include "mesh/message.hpp"
#include "mesh/stream_framer.hpp"
#include "network/mesh_interface.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

using namespace meshprobe;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    // First byte picks the split size, so frames are fed in arbitrary chunks
    const size_t chunk = static_cast<size_t>(data[0] % 64) + 1;
    data += 1;
    size -= 1;

    message::FrameReader reader;
    std::vector<std::vector<uint8_t>> payloads;
    for (size_t offset = 0; offset < size; offset += chunk) {
        const size_t n = (size - offset < chunk) ? size - offset : chunk;
        auto frames = reader.feed(data + offset, n);
        payloads.insert(payloads.end(), frames.begin(), frames.end());
    }

    // Buffered bytes must never exceed one header plus a maximum payload
    if (reader.buffered() > protocol::framing::HEADER_SIZE + protocol::framing::MAX_PAYLOAD_SIZE) {
        __builtin_trap();
    }

    for (const auto &payload : payloads) {
        if (payload.size() > protocol::framing::MAX_PAYLOAD_SIZE) {
            __builtin_trap();
        }

        meshtastic::FromRadio msg;
        if (!message::Decode(payload, msg)) continue;

        if (msg.has_packet()) {
            network::ReceivedPacket rx = network::DecodeReceivedPacket(msg.packet());
            if (rx.route_discovery) {
                (void)discovery::DeriveSnrTowardsDb(rx.route_discovery->snr_towards);
            }
        }
    }

    // Whole input as a bare FromRadio, as BLE delivers it (no framing)
    meshtastic::FromRadio direct;
    if (message::Decode(data, size, direct) && direct.has_packet()) {
        (void)network::DecodeReceivedPacket(direct.packet());
    }

    return 0;
}
