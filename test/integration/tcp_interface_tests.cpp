// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "discovery/discovery_session.hpp"
#include "mesh/message.hpp"
#include "mesh/stream_framer.hpp"
#include "network/tcp_interface.hpp"

#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace meshprobe;
using namespace meshprobe::network;

namespace {

constexpr protocol::NodeNum LOCAL_NODE = 0x11111111;
constexpr protocol::NodeNum NEIGHBOUR = 0x0a0b0c0d;

// Minimal radio speaking the TCP stream API on 127.0.0.1. Runs its own
// io_context so it can be torn down independently of the interface under test.
class FakeRadio {
public:
    enum class Mode { NORMAL, SILENT_CONFIG, DROP_ON_ACCEPT };

    explicit FakeRadio(Mode mode = Mode::NORMAL)
        : mode_(mode),
          acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        accept();
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~FakeRadio() {
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::atomic<int> probes_seen{0};
    std::atomic<uint32_t> probe_hop_limit{99};
    std::atomic<bool> probe_wanted_response{false};
    std::atomic<bool> disconnect_seen{false};

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            socket_ = std::make_unique<asio::ip::tcp::socket>(std::move(socket));
            if (mode_ == Mode::DROP_ON_ACCEPT) {
                asio::error_code ignored;
                socket_->close(ignored);
                return;
            }
            read();
        });
    }

    void read() {
        socket_->async_read_some(asio::buffer(buffer_), [this](const asio::error_code& ec, size_t n) {
            if (ec) {
                return;
            }
            for (const auto& payload : reader_.feed(buffer_.data(), n)) {
                handle(payload);
            }
            read();
        });
    }

    void handle(const std::vector<uint8_t>& payload) {
        meshtastic::ToRadio msg;
        if (!message::Decode(payload, msg)) {
            return;
        }

        if (msg.has_want_config_id() && mode_ == Mode::NORMAL) {
            meshtastic::FromRadio my_info;
            my_info.mutable_my_info()->set_my_node_num(LOCAL_NODE);
            send(my_info);

            send(NodeInfoFrame(LOCAL_NODE, "!11111111", "ME", "Local", std::nullopt));
            send(NodeInfoFrame(NEIGHBOUR, "!0a0b0c0d", "AB", "Alpha Base", 0u));

            meshtastic::FromRadio done;
            done.set_config_complete_id(msg.want_config_id());
            send(done);
        }

        if (msg.has_disconnect() && msg.disconnect()) {
            disconnect_seen = true;
        }

        if (msg.has_packet() && msg.packet().has_decoded() &&
            msg.packet().decoded().portnum() == meshtastic::TRACEROUTE_APP) {
            ++probes_seen;
            probe_hop_limit = msg.packet().hop_limit();
            probe_wanted_response = msg.packet().decoded().want_response();

            // Unrelated chatter first, then the reply
            meshtastic::FromRadio chatter;
            chatter.mutable_packet()->set_from(0x22222222);
            chatter.mutable_packet()->mutable_decoded()->set_portnum(meshtastic::TEXT_MESSAGE_APP);
            chatter.mutable_packet()->mutable_decoded()->set_payload("hi");
            send(chatter);

            meshtastic::RouteDiscovery route;
            route.add_snr_towards(0);
            route.add_snr_towards(48);

            meshtastic::FromRadio reply;
            meshtastic::MeshPacket* packet = reply.mutable_packet();
            packet->set_from(NEIGHBOUR);
            packet->set_to(LOCAL_NODE);
            packet->set_id(777);
            packet->set_rx_snr(7.25f);
            packet->set_rx_rssi(-42);
            packet->mutable_decoded()->set_portnum(meshtastic::TRACEROUTE_APP);
            packet->mutable_decoded()->set_payload(route.SerializeAsString());
            packet->mutable_decoded()->set_request_id(msg.packet().id());
            send(reply);
        }
    }

    static meshtastic::FromRadio NodeInfoFrame(protocol::NodeNum num, const std::string& id,
                                               const std::string& short_name, const std::string& long_name,
                                               std::optional<uint32_t> hops_away) {
        meshtastic::FromRadio msg;
        meshtastic::NodeInfo* info = msg.mutable_node_info();
        info->set_num(num);
        if (hops_away) {
            info->set_hops_away(*hops_away);
        }
        info->mutable_user()->set_id(id);
        info->mutable_user()->set_short_name(short_name);
        info->mutable_user()->set_long_name(long_name);
        return msg;
    }

    void send(const meshtastic::FromRadio& msg) {
        write_queue_.push_back(std::make_shared<std::vector<uint8_t>>(message::EncodeFrame(message::Encode(msg))));
        if (write_queue_.size() == 1) {
            write_next();
        }
    }

    void write_next() {
        auto data = write_queue_.front();
        asio::async_write(*socket_, asio::buffer(*data), [this, data](const asio::error_code& ec, size_t) {
            if (ec) {
                write_queue_.clear();
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                write_next();
            }
        });
    }

    Mode mode_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::unique_ptr<asio::ip::tcp::socket> socket_;
    std::array<uint8_t, 512> buffer_{};
    message::FrameReader reader_;
    std::deque<std::shared_ptr<std::vector<uint8_t>>> write_queue_;
    std::thread thread_;
};

// Port that nothing listens on
uint16_t ClosedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

std::string LocalAddress(uint16_t port) {
    return "127.0.0.1:" + std::to_string(port);
}

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

}  // namespace

TEST_CASE("TcpInterface: handshake loads the node database", "[network][tcp][integration]") {
    FakeRadio radio;
    TcpInterface iface(LocalAddress(radio.port()));

    auto error = iface.connect();
    REQUIRE_FALSE(error.has_value());
    REQUIRE(iface.is_open());
    REQUIRE(iface.local_node_num() == LOCAL_NODE);

    auto nodes = iface.nodes();
    REQUIRE(nodes.size() == 2);
    REQUIRE(nodes[1].num == NEIGHBOUR);
    REQUIRE(nodes[1].user_id == std::string("!0a0b0c0d"));
    REQUIRE(nodes[1].short_name == std::string("AB"));
    REQUIRE(nodes[1].hops_away == 0u);

    SECTION("Second connect is refused") {
        REQUIRE(iface.connect().has_value());
    }

    SECTION("close() sends a disconnect notice and is idempotent") {
        iface.close();
        REQUIRE_FALSE(iface.is_open());
        REQUIRE(WaitFor([&]() { return radio.disconnect_seen.load(); }));
        iface.close();
        REQUIRE_FALSE(iface.send_data(OutboundPacket{}).has_value());
    }
}

TEST_CASE("TcpInterface: packets reach the handler", "[network][tcp][integration]") {
    FakeRadio radio;
    TcpInterface iface(LocalAddress(radio.port()));
    REQUIRE_FALSE(iface.connect().has_value());

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ReceivedPacket> received;
    iface.set_packet_handler([&](const ReceivedPacket& packet) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(packet);
        cv.notify_all();
    });
    REQUIRE(iface.has_packet_handler());

    OutboundPacket probe;
    probe.portnum = protocol::PortNum::TRACEROUTE_APP;
    probe.payload = message::Encode(meshtastic::RouteDiscovery());
    probe.want_response = true;
    probe.hop_limit = 0;
    auto id = iface.send_data(probe);
    REQUIRE(id.has_value());
    REQUIRE(*id != 0u);

    {
        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(3), [&]() { return received.size() >= 2; }));
    }

    REQUIRE(radio.probes_seen.load() == 1);
    REQUIRE(radio.probe_hop_limit.load() == 0u);
    REQUIRE(radio.probe_wanted_response.load());

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(received[0].portnum == protocol::PortNum::TEXT_MESSAGE_APP);
    REQUIRE(received[0].from_id == std::string("!22222222"));

    const auto& reply = received[1];
    REQUIRE(reply.portnum == protocol::PortNum::TRACEROUTE_APP);
    REQUIRE(reply.from == NEIGHBOUR);
    REQUIRE(reply.from_id == std::string("!0a0b0c0d"));
    REQUIRE(reply.rx_snr == 7.25f);
    REQUIRE(reply.rx_rssi == -42);
    REQUIRE(reply.request_id == *id);
    REQUIRE(reply.route_discovery.has_value());
    REQUIRE(reply.route_discovery->snr_towards == std::vector<int32_t>{0, 48});

    iface.clear_packet_handler();
    REQUIRE_FALSE(iface.has_packet_handler());
    iface.close();
}

TEST_CASE("TcpInterface: connection failures", "[network][tcp][integration]") {
    SECTION("Nothing listening") {
        TcpInterface iface(LocalAddress(ClosedPort()));
        auto error = iface.connect();
        REQUIRE(error.has_value());
        REQUIRE_FALSE(iface.is_open());
    }

    SECTION("Radio hangs up during the handshake") {
        FakeRadio radio(FakeRadio::Mode::DROP_ON_ACCEPT);
        TcpInterface iface(LocalAddress(radio.port()));
        auto error = iface.connect();
        REQUIRE(error.has_value());
        REQUIRE(error->find("Connection lost") != std::string::npos);
        REQUIRE_FALSE(iface.is_open());
    }

    SECTION("close() from another thread ends the configuration wait") {
        FakeRadio radio(FakeRadio::Mode::SILENT_CONFIG);
        TcpInterface iface(LocalAddress(radio.port()));

        std::optional<std::string> error;
        const auto start = std::chrono::steady_clock::now();
        std::thread connector([&]() { error = iface.connect(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        iface.close();
        connector.join();

        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(protocol::CONFIG_TIMEOUT_SEC));
        REQUIRE(error.has_value());
        REQUIRE_FALSE(iface.is_open());
    }

    SECTION("Unparseable address") {
        TcpInterface iface("host:notaport");
        REQUIRE(iface.connect().has_value());
    }
}

TEST_CASE("DiscoverySession: end to end over TCP", "[discovery_session][tcp][integration]") {
    FakeRadio radio;
    const std::string address = LocalAddress(radio.port());
    discovery::DiscoverySession session([address]() -> MeshInterfacePtr { return std::make_unique<TcpInterface>(address); });

    auto result = session.Run(std::chrono::seconds(2));

    REQUIRE(result.final_state == discovery::SessionState::COMPLETED);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.interface_description == "tcp " + address);
    REQUIRE(result.records.size() == 1);

    const auto& record = result.records[0];
    REQUIRE(record.sender_id == "!0a0b0c0d");
    REQUIRE(record.display_name == "[AB] Alpha Base");
    REQUIRE(record.snr == 7.25f);
    REQUIRE(record.rssi == -42);
    REQUIRE(record.snr_towards_db == Catch::Approx(12.0));
    REQUIRE(radio.probes_seen.load() == 1);
    REQUIRE(radio.probe_hop_limit.load() == 0u);
    REQUIRE(WaitFor([&]() { return radio.disconnect_seen.load(); }));
}
