// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/protocol.hpp"

#include "meshtastic/mesh.pb.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshprobe {
namespace message {

// Wire encoding of a generated message. Empty if the message does not fit
// a protobuf size field.
std::vector<uint8_t> Encode(const google::protobuf::MessageLite& msg);

// Parse protobuf bytes into msg. Returns false on malformed input; unknown
// fields are kept and ignored.
bool Decode(const uint8_t* data, size_t size, google::protobuf::MessageLite& msg);
bool Decode(const std::vector<uint8_t>& data, google::protobuf::MessageLite& msg);

// Conversions between the generated PortNum and protocol::PortNum. Values
// the schema does not list are carried through unchanged.
protocol::PortNum ToPortNum(meshtastic::PortNum port);
meshtastic::PortNum FromPortNum(protocol::PortNum port);

// ToRadio carrying one outbound application packet
meshtastic::ToRadio MakeDataPacket(protocol::NodeNum destination, protocol::PortNum portnum,
                                   const std::vector<uint8_t>& payload, bool want_response, bool want_ack,
                                   uint32_t hop_limit, uint32_t packet_id);

meshtastic::ToRadio MakeWantConfig(uint32_t nonce);
meshtastic::ToRadio MakeDisconnect();

}  // namespace message
}  // namespace meshprobe
