// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/known_nodes.hpp"
#include "infra/mock_interface.hpp"

using namespace meshprobe;
using namespace meshprobe::discovery;
using meshprobe::test::MakeNode;
using meshprobe::test::MockFactory;
using meshprobe::test::MockRadio;

namespace {

network::NodeEntry HeardNode(protocol::NodeNum num, std::optional<uint32_t> last_heard) {
    auto entry = MakeNode(num);
    entry.last_heard = last_heard;
    return entry;
}

}  // namespace

TEST_CASE("CollectKnownNodes: ordering and naming", "[known_nodes]") {
    SECTION("Most recently heard first, never-heard last") {
        std::vector<network::NodeEntry> table{
            HeardNode(1, 100),
            HeardNode(2, std::nullopt),
            HeardNode(3, 300),
            HeardNode(4, 200),
            HeardNode(5, std::nullopt),
        };
        auto nodes = CollectKnownNodes(table, std::nullopt);
        REQUIRE(nodes.size() == 5);
        REQUIRE(nodes[0].num == 3u);
        REQUIRE(nodes[1].num == 4u);
        REQUIRE(nodes[2].num == 1u);
        // Ties keep table order
        REQUIRE(nodes[3].num == 2u);
        REQUIRE(nodes[4].num == 5u);
    }

    SECTION("Local node is excluded") {
        std::vector<network::NodeEntry> table{HeardNode(1, 100), HeardNode(2, 50)};
        auto nodes = CollectKnownNodes(table, 1u);
        REQUIRE(nodes.size() == 1);
        REQUIRE(nodes[0].num == 2u);
    }

    SECTION("Identifier and name fallbacks") {
        std::vector<network::NodeEntry> table{
            MakeNode(0x0a0b0c0d, std::string("!0a0b0c0d"), std::string("AB"), std::string("Alpha Base")),
            MakeNode(0x000000ff),
        };
        auto nodes = CollectKnownNodes(table, std::nullopt);
        REQUIRE(nodes[0].id == "!0a0b0c0d");
        REQUIRE(nodes[0].name == "Alpha Base");
        REQUIRE(nodes[1].id == "!000000ff");
        REQUIRE(nodes[1].name == "Unknown");
    }
}

TEST_CASE("FetchKnownNodes: through a mock radio", "[known_nodes]") {
    auto radio = std::make_shared<MockRadio>();

    SECTION("Reads the database and closes") {
        radio->local_node_num = 1;
        radio->nodes = {HeardNode(1, 500), HeardNode(2, 100), HeardNode(3, 200)};
        auto result = FetchKnownNodes(MockFactory(radio));

        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(result.database_size == 3);
        REQUIRE(result.nodes.size() == 2);
        REQUIRE(result.nodes[0].num == 3u);
        REQUIRE(result.interface_description == "mock radio");
        REQUIRE(radio->close_calls.load() == 1);
        REQUIRE_FALSE(radio->open.load());
        REQUIRE(radio->Sent().empty());
    }

    SECTION("Empty database") {
        auto result = FetchKnownNodes(MockFactory(radio));
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(result.database_size == 0);
        REQUIRE(result.nodes.empty());
    }

    SECTION("Connect failure is reported") {
        radio->connect_error = "timed out";
        auto result = FetchKnownNodes(MockFactory(radio));
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("timed out") != std::string::npos);
        REQUIRE(radio->close_calls.load() == 1);
    }

    SECTION("Node table read failure is reported") {
        radio->throw_on_nodes = true;
        auto result = FetchKnownNodes(MockFactory(radio));
        REQUIRE(result.error.has_value());
        REQUIRE(result.nodes.empty());
        REQUIRE(radio->close_calls.load() == 1);
    }

    SECTION("Factory failure is reported") {
        auto result = FetchKnownNodes([]() -> network::MeshInterfacePtr { throw std::runtime_error("no ports"); });
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("no ports") != std::string::npos);
    }
}
