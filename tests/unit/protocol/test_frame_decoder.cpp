/**
 * @file test_frame_decoder.cpp
 * @brief Unit tests for the stream deframer
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/protocol/frame_decoder.h>

#include <vector>

namespace kcenon::serial_transfer::test {

class FrameDecoderTest : public ::testing::Test {
protected:
    // Payload bytes never contain the first magic byte, so a damaged
    // frame cannot leave a phantom frame start behind
    static auto payload(std::size_t size, uint8_t seed) -> std::vector<std::byte> {
        std::vector<std::byte> out(size);
        for (std::size_t i = 0; i < size; ++i) {
            auto v = static_cast<uint8_t>(seed + i);
            if (v == 0x53) v = 0x00;
            out[i] = static_cast<std::byte>(v);
        }
        return out;
    }

    auto wire(frame_type type, uint16_t seq, std::vector<std::byte> p = {})
        -> std::vector<std::byte> {
        return codec_.encode(frame(type, seq, std::move(p))).value();
    }

    static void append(std::vector<std::byte>& out, const std::vector<std::byte>& more) {
        out.insert(out.end(), more.begin(), more.end());
    }

    // Pull frames until the decoder reports incomplete
    static auto drain(frame_decoder& decoder, std::size_t* corrupt = nullptr)
        -> std::vector<frame> {
        std::vector<frame> frames;
        for (;;) {
            auto next = decoder.next();
            if (next) {
                frames.push_back(std::move(next.value()));
                continue;
            }
            if (next.error().code == error_code::frame_corrupt) {
                if (corrupt) ++*corrupt;
                continue;
            }
            break;
        }
        return frames;
    }

    frame_codec codec_;
};

TEST_F(FrameDecoderTest, EmptyBufferIsIncomplete) {
    frame_decoder decoder;
    auto next = decoder.next();
    ASSERT_FALSE(next.has_value());
    EXPECT_EQ(next.error().code, error_code::frame_incomplete);
}

TEST_F(FrameDecoderTest, DecodesBackToBackFrames) {
    frame_decoder decoder;
    std::vector<std::byte> stream;
    append(stream, wire(frame_type::hello, 0, payload(9, 1)));
    append(stream, wire(frame_type::data, 1, payload(100, 2)));
    append(stream, wire(frame_type::session_end, 2));

    decoder.feed(stream);
    auto frames = drain(decoder);

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].type, frame_type::hello);
    EXPECT_EQ(frames[1].sequence, 1);
    EXPECT_EQ(frames[1].payload, payload(100, 2));
    EXPECT_EQ(frames[2].type, frame_type::session_end);
    EXPECT_EQ(decoder.pending_bytes(), 0u);
    EXPECT_EQ(decoder.get_statistics().frames_decoded, 3u);
}

TEST_F(FrameDecoderTest, ReassemblesByteAtATime) {
    frame_decoder decoder;
    auto bytes = wire(frame_type::data, 42, payload(64, 9));

    for (std::size_t i = 0; i + 1 < bytes.size(); ++i) {
        decoder.feed(std::span<const std::byte>(&bytes[i], 1));
        auto next = decoder.next();
        ASSERT_FALSE(next.has_value());
        EXPECT_EQ(next.error().code, error_code::frame_incomplete);
    }

    decoder.feed(std::span<const std::byte>(&bytes.back(), 1));
    auto next = decoder.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value().sequence, 42);
}

TEST_F(FrameDecoderTest, SkipsNoiseBeforeFrame) {
    frame_decoder decoder;
    std::vector<std::byte> stream = {std::byte{0x00}, std::byte{0xFF}, std::byte{0x42},
                                     std::byte{0x53}, std::byte{0x00}, std::byte{0x10}};
    append(stream, wire(frame_type::ack, 5, {std::byte{0x20}}));

    decoder.feed(stream);
    std::size_t corrupt = 0;
    auto frames = drain(decoder, &corrupt);

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].type, frame_type::ack);
    EXPECT_EQ(corrupt, 0u);
    EXPECT_EQ(decoder.get_statistics().noise_bytes, 6u);
}

TEST_F(FrameDecoderTest, ResynchronisesAfterCorruptFrame) {
    frame_decoder decoder;
    auto first = wire(frame_type::data, 1, payload(50, 3));
    first[20] ^= std::byte{0x04};

    std::vector<std::byte> stream = first;
    append(stream, wire(frame_type::data, 2, payload(50, 4)));

    decoder.feed(stream);
    std::size_t corrupt = 0;
    auto frames = drain(decoder, &corrupt);

    EXPECT_EQ(corrupt, 1u);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].sequence, 2);
    EXPECT_EQ(decoder.get_statistics().corrupt_frames, 1u);
}

TEST_F(FrameDecoderTest, CorruptionAtEveryPositionNeverLosesNextFrame) {
    auto victim = wire(frame_type::data, 7, payload(16, 0x60));
    auto follower = wire(frame_type::file_end, 8, payload(48, 0x70));

    for (std::size_t pos = 0; pos < victim.size(); ++pos) {
        frame_decoder decoder;
        auto damaged = victim;
        damaged[pos] ^= std::byte{0x81};
        append(damaged, follower);

        decoder.feed(damaged);
        auto frames = drain(decoder);

        ASSERT_FALSE(frames.empty()) << "pos " << pos;
        EXPECT_EQ(frames.back().sequence, 8) << "pos " << pos;
        for (const auto& f : frames) {
            EXPECT_NE(f.sequence, 7) << "damaged frame accepted at pos " << pos;
        }
    }
}

TEST_F(FrameDecoderTest, TruncatedFrameFollowedByCompleteOne) {
    frame_decoder decoder;
    auto cut = wire(frame_type::data, 1, payload(30, 5));
    cut.resize(cut.size() - 10);

    decoder.feed(cut);
    EXPECT_TRUE(drain(decoder).empty());
    EXPECT_EQ(decoder.pending_bytes(), cut.size());

    // Lost tail: the partial frame stopped arriving
    EXPECT_EQ(decoder.discard_pending(), cut.size());
    EXPECT_EQ(decoder.get_statistics().discarded_bytes, cut.size());

    decoder.feed(wire(frame_type::data, 2, payload(30, 6)));
    auto frames = drain(decoder);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].sequence, 2);
}

TEST_F(FrameDecoderTest, LoneMagicByteIsKept) {
    frame_decoder decoder;
    auto bytes = wire(frame_type::hello, 0, payload(9, 1));

    decoder.feed(std::span<const std::byte>(bytes.data(), 1));
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.pending_bytes(), 1u);

    decoder.feed(std::span<const std::byte>(bytes).subspan(1));
    EXPECT_TRUE(decoder.next().has_value());
}

TEST_F(FrameDecoderTest, ManySmallFeedsCompactBuffer) {
    frame_decoder decoder;
    std::size_t decoded = 0;

    for (uint16_t seq = 0; seq < 2000; ++seq) {
        decoder.feed(wire(frame_type::data, seq, payload(32, static_cast<uint8_t>(seq))));
        auto frames = drain(decoder);
        ASSERT_EQ(frames.size(), 1u);
        EXPECT_EQ(frames[0].sequence, seq);
        ++decoded;
    }

    EXPECT_EQ(decoded, 2000u);
    EXPECT_EQ(decoder.pending_bytes(), 0u);
}

TEST_F(FrameDecoderTest, ResetClearsEverything) {
    frame_decoder decoder;
    decoder.feed(wire(frame_type::hello, 0));
    (void)decoder.next();
    decoder.feed(std::vector<std::byte>(5, std::byte{0x53}));

    decoder.reset();

    EXPECT_EQ(decoder.pending_bytes(), 0u);
    EXPECT_EQ(decoder.get_statistics().frames_decoded, 0u);
}

}  // namespace kcenon::serial_transfer::test
