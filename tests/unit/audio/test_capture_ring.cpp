/**
 * @file test_capture_ring.cpp
 * @brief Unit tests for the capture ring buffer (mixdown, padding, wrap)
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pulsenet/audio/dsp/capture_ring.h>

#include <vector>

using namespace pulsenet::audio::dsp;
using Catch::Matchers::WithinAbs;

TEST_CASE("CaptureRing zero-pads until enough frames arrive", "[audio][dsp][capture]") {
    CaptureRing ring(8);
    const float block[] = {1.0f, 2.0f, 3.0f};
    ring.write(block, 3, 1);

    REQUIRE(ring.available() == 3);

    std::vector<float> out(5, -1.0f);
    REQUIRE(ring.latest(out.data(), 5) == 3);
    REQUIRE(out == std::vector<float>{0.0f, 0.0f, 1.0f, 2.0f, 3.0f});

    SECTION("nothing written yet") {
        CaptureRing empty(8);
        std::vector<float> zeros(4, -1.0f);
        REQUIRE(empty.latest(zeros.data(), 4) == 0);
        REQUIRE(zeros == std::vector<float>(4, 0.0f));
    }
}

TEST_CASE("CaptureRing wraps around and keeps the newest frames", "[audio][dsp][capture]") {
    CaptureRing ring(4);
    const float first[] = {1.0f, 2.0f, 3.0f};
    const float second[] = {4.0f, 5.0f, 6.0f};
    ring.write(first, 3, 1);
    ring.write(second, 3, 1);

    REQUIRE(ring.available() == 4);

    SECTION("full read is oldest first") {
        std::vector<float> out(4);
        REQUIRE(ring.latest(out.data(), 4) == 4);
        REQUIRE(out == std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f});
    }

    SECTION("short read returns only the newest") {
        std::vector<float> out(2);
        REQUIRE(ring.latest(out.data(), 2) == 2);
        REQUIRE(out == std::vector<float>{5.0f, 6.0f});
    }

    SECTION("read longer than capacity pads the front") {
        std::vector<float> out(6, -1.0f);
        REQUIRE(ring.latest(out.data(), 6) == 4);
        REQUIRE(out == std::vector<float>{0.0f, 0.0f, 3.0f, 4.0f, 5.0f, 6.0f});
    }

    SECTION("block larger than the ring") {
        std::vector<float> big;
        for (int i = 7; i <= 16; i++) big.push_back(static_cast<float>(i));
        ring.write(big.data(), static_cast<uint32_t>(big.size()), 1);

        std::vector<float> out(4);
        REQUIRE(ring.available() == 4);
        REQUIRE(ring.latest(out.data(), 4) == 4);
        REQUIRE(out == std::vector<float>{13.0f, 14.0f, 15.0f, 16.0f});
    }
}

TEST_CASE("CaptureRing mixes interleaved input to mono", "[audio][dsp][capture]") {
    CaptureRing ring(16);

    // Two stereo frames: (1, -1) cancels, (0.5, 0.5) stays
    const float stereo[] = {1.0f, -1.0f, 0.5f, 0.5f};
    BlockLevels levels = ring.write(stereo, 2, 2);

    std::vector<float> out(2);
    REQUIRE(ring.latest(out.data(), 2) == 2);
    REQUIRE_THAT(out[0], WithinAbs(0.0f, 0.0001f));
    REQUIRE_THAT(out[1], WithinAbs(0.5f, 0.0001f));

    REQUIRE_THAT(levels.peak, WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(levels.rms, WithinAbs(0.35355f, 0.0001f));

    SECTION("empty blocks write nothing") {
        BlockLevels none = ring.write(stereo, 0, 2);
        REQUIRE(none.rms == 0.0f);
        REQUIRE(ring.write(nullptr, 2, 2).peak == 0.0f);
        REQUIRE(ring.available() == 2);
    }
}
