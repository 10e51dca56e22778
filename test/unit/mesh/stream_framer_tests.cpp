// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license
// Unit tests for radio stream framing

#include <catch2/catch_test_macros.hpp>
#include "mesh/protocol.hpp"
#include "mesh/stream_framer.hpp"

using namespace meshprobe;
using namespace meshprobe::message;

TEST_CASE("EncodeFrame: header layout", "[framing]") {
    SECTION("Short payload") {
        auto frame = EncodeFrame({0x18, 0x01});
        REQUIRE(frame == std::vector<uint8_t>{0x94, 0xC3, 0x00, 0x02, 0x18, 0x01});
    }

    SECTION("Length is big endian") {
        std::vector<uint8_t> payload(300, 0xAA);
        auto frame = EncodeFrame(payload);
        REQUIRE(frame.size() == 304);
        REQUIRE(frame[2] == 0x01);
        REQUIRE(frame[3] == 0x2C);
    }

    SECTION("Maximum payload accepted, larger rejected") {
        REQUIRE(EncodeFrame(std::vector<uint8_t>(protocol::framing::MAX_PAYLOAD_SIZE)).size() ==
                protocol::framing::MAX_PAYLOAD_SIZE + 4);
        REQUIRE(EncodeFrame(std::vector<uint8_t>(protocol::framing::MAX_PAYLOAD_SIZE + 1)).empty());
    }
}

TEST_CASE("FrameReader: reassembly", "[framing]") {
    FrameReader reader;

    SECTION("Single frame in one read") {
        auto frames = reader.feed(EncodeFrame({1, 2, 3}));
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0] == std::vector<uint8_t>{1, 2, 3});
        REQUIRE(reader.buffered() == 0);
    }

    SECTION("Frame split byte by byte") {
        auto frame = EncodeFrame({9, 8, 7, 6});
        std::vector<std::vector<uint8_t>> frames;
        for (uint8_t b : frame) {
            auto out = reader.feed(&b, 1);
            frames.insert(frames.end(), out.begin(), out.end());
        }
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0] == std::vector<uint8_t>{9, 8, 7, 6});
    }

    SECTION("Several frames in one read keep their order") {
        auto a = EncodeFrame({0xA});
        auto b = EncodeFrame({0xB, 0xB});
        auto c = EncodeFrame({});
        std::vector<uint8_t> stream;
        stream.insert(stream.end(), a.begin(), a.end());
        stream.insert(stream.end(), b.begin(), b.end());
        stream.insert(stream.end(), c.begin(), c.end());

        auto frames = reader.feed(stream);
        REQUIRE(frames.size() == 3);
        REQUIRE(frames[0] == std::vector<uint8_t>{0xA});
        REQUIRE(frames[1] == std::vector<uint8_t>{0xB, 0xB});
        REQUIRE(frames[2].empty());
    }

    SECTION("Partial frame stays buffered") {
        auto frame = EncodeFrame({1, 2, 3, 4, 5});
        auto frames = reader.feed(frame.data(), 6);
        REQUIRE(frames.empty());
        REQUIRE(reader.buffered() == 6);

        frames = reader.feed(frame.data() + 6, frame.size() - 6);
        REQUIRE(frames.size() == 1);
        REQUIRE(reader.buffered() == 0);
    }

    SECTION("reset drops a partial frame") {
        auto frame = EncodeFrame({1, 2, 3});
        (void)reader.feed(frame.data(), 5);
        reader.reset();
        REQUIRE(reader.buffered() == 0);
        REQUIRE(reader.feed(EncodeFrame({4})).size() == 1);
    }
}

TEST_CASE("FrameReader: resynchronisation", "[framing]") {
    FrameReader reader;

    SECTION("Console text before a frame is skipped") {
        std::string text = "INFO | ??:??:?? 3 [Router] Boot\r\n";
        std::vector<uint8_t> stream(text.begin(), text.end());
        auto frame = EncodeFrame({0x42});
        stream.insert(stream.end(), frame.begin(), frame.end());

        auto frames = reader.feed(stream);
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0] == std::vector<uint8_t>{0x42});
        REQUIRE(reader.dropped_bytes() == text.size());
    }

    SECTION("START1 without START2 is dropped") {
        std::vector<uint8_t> stream{0x94, 0x00};
        auto frame = EncodeFrame({0x01});
        stream.insert(stream.end(), frame.begin(), frame.end());

        auto frames = reader.feed(stream);
        REQUIRE(frames.size() == 1);
        REQUIRE(reader.dropped_bytes() == 2);
    }

    SECTION("Oversized length is treated as noise") {
        // Claims 0x0300 = 768 bytes
        std::vector<uint8_t> stream{0x94, 0xC3, 0x03, 0x00};
        auto frame = EncodeFrame({0x07});
        stream.insert(stream.end(), frame.begin(), frame.end());

        auto frames = reader.feed(stream);
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0] == std::vector<uint8_t>{0x07});
    }

    SECTION("Serial wake bytes are ignored") {
        std::vector<uint8_t> stream(protocol::SERIAL_WAKE_BYTES, protocol::framing::START2);
        auto frame = EncodeFrame({0x05});
        stream.insert(stream.end(), frame.begin(), frame.end());

        auto frames = reader.feed(stream);
        REQUIRE(frames.size() == 1);
        REQUIRE(reader.dropped_bytes() == protocol::SERIAL_WAKE_BYTES);
    }

    SECTION("Buffer never holds more than one frame's worth") {
        std::vector<uint8_t> noise(4096, 0x94);
        (void)reader.feed(noise);
        REQUIRE(reader.buffered() <= protocol::framing::HEADER_SIZE + protocol::framing::MAX_PAYLOAD_SIZE);
    }
}
