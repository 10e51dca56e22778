// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "mesh/message.hpp"

#include <limits>
#include <string>

namespace meshprobe {
namespace message {

std::vector<uint8_t> Encode(const google::protobuf::MessageLite& msg) {
  const size_t size = msg.ByteSizeLong();
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return {};
  }
  std::vector<uint8_t> out(size);
  if (size > 0 && !msg.SerializeToArray(out.data(), static_cast<int>(size))) {
    return {};
  }
  return out;
}

bool Decode(const uint8_t* data, size_t size, google::protobuf::MessageLite& msg) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return false;
  }
  return msg.ParseFromArray(data, static_cast<int>(size));
}

bool Decode(const std::vector<uint8_t>& data, google::protobuf::MessageLite& msg) {
  return Decode(data.data(), data.size(), msg);
}

protocol::PortNum ToPortNum(meshtastic::PortNum port) {
  return static_cast<protocol::PortNum>(static_cast<uint32_t>(port));
}

meshtastic::PortNum FromPortNum(protocol::PortNum port) {
  return static_cast<meshtastic::PortNum>(static_cast<uint32_t>(port));
}

meshtastic::ToRadio MakeDataPacket(protocol::NodeNum destination, protocol::PortNum portnum,
                                   const std::vector<uint8_t>& payload, bool want_response, bool want_ack,
                                   uint32_t hop_limit, uint32_t packet_id) {
  meshtastic::ToRadio msg;
  meshtastic::MeshPacket* packet = msg.mutable_packet();
  packet->set_to(destination);
  packet->set_id(packet_id);
  packet->set_hop_limit(hop_limit);
  packet->set_want_ack(want_ack);

  meshtastic::Data* data = packet->mutable_decoded();
  data->set_portnum(FromPortNum(portnum));
  data->set_payload(std::string(payload.begin(), payload.end()));
  data->set_want_response(want_response);
  return msg;
}

meshtastic::ToRadio MakeWantConfig(uint32_t nonce) {
  meshtastic::ToRadio msg;
  msg.set_want_config_id(nonce);
  return msg;
}

meshtastic::ToRadio MakeDisconnect() {
  meshtastic::ToRadio msg;
  msg.set_disconnect(true);
  return msg;
}

}  // namespace message
}  // namespace meshprobe
