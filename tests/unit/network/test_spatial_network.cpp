/**
 * @file test_spatial_network.cpp
 * @brief Unit tests for Node, Edge and SpatialNetwork
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pulsenet/network/spatial_network.h>

#include <cmath>
#include <limits>
#include <set>
#include <vector>

using namespace pulsenet::network;
using pulsenet::audio::AudioDescription;
using Catch::Matchers::WithinAbs;

namespace {

AudioDescription bands(float bass, float mids, float highs) {
    AudioDescription d;
    d.bass = bass;
    d.mids = mids;
    d.highs = highs;
    d.totalEnergy = (bass + mids + highs) / 3.0f;
    return d;
}

AudioDescription beat(float confidence) {
    AudioDescription d;
    d.isBeat = true;
    d.beatConfidence = confidence;
    return d;
}

void requireEdgeInvariants(const SpatialNetwork& net) {
    const auto& nodes = net.nodes();
    std::set<std::pair<uint32_t, uint32_t>> seen;

    for (const Edge& e : net.edges()) {
        REQUIRE(e.a < e.b);
        REQUIRE(e.b < nodes.size());
        REQUIRE(nodes[e.a].active);
        REQUIRE(nodes[e.b].active);

        float d = nodes[e.a].distanceTo(nodes[e.b]);
        REQUIRE(d < net.dynamicThreshold());
        REQUIRE_THAT(e.distance, WithinAbs(d, 0.001f));

        REQUIRE(seen.insert({e.a, e.b}).second);
    }
}

} // namespace

// =============================================================================
// Node / Edge
// =============================================================================

TEST_CASE("Node visual hints follow the bands", "[network][node]") {
    std::mt19937 rng(1);
    Node node(0, glm::vec2(100.0f, 100.0f));

    AudioDrive drive;
    drive.bass = 0.5f;
    drive.highs = 0.0f;
    drive.total = 0.4f;
    node.update(drive, glm::vec2(800.0f, 600.0f), rng);

    REQUIRE_THAT(node.size, WithinAbs(13.0f, 0.001f));
    REQUIRE_THAT(node.glow, WithinAbs(0.0f, 0.001f));
    REQUIRE_THAT(node.energy, WithinAbs(0.4f, 0.001f));

    // No high-band energy, no jumps
    REQUIRE_THAT(node.position.x, WithinAbs(100.0f, 0.001f));
    REQUIRE_THAT(node.position.y, WithinAbs(100.0f, 0.001f));
}

TEST_CASE("Node jumps stay on the canvas", "[network][node]") {
    std::mt19937 rng(5);
    const glm::vec2 canvas(200.0f, 100.0f);
    Node node(0, glm::vec2(199.0f, 1.0f));

    AudioDrive drive;
    drive.highs = 1.0f;

    bool moved = false;
    for (int i = 0; i < 2000; i++) {
        node.update(drive, canvas, rng);
        moved = moved || node.position != glm::vec2(199.0f, 1.0f);
        REQUIRE(node.position.x >= 0.0f);
        REQUIRE(node.position.x <= canvas.x);
        REQUIRE(node.position.y >= 0.0f);
        REQUIRE(node.position.y <= canvas.y);
    }
    REQUIRE(moved);
    REQUIRE_THAT(node.glow, WithinAbs(30.0f, 0.001f));
}

TEST_CASE("Edge visuals", "[network][edge]") {
    std::mt19937 rng(3);
    Edge edge(0, 1, 50.0f);

    AudioDrive drive;
    drive.bass = 1.0f;

    SECTION("thickness follows bass, opacity steady without highs") {
        edge.update(drive, rng);
        REQUIRE_THAT(edge.thickness, WithinAbs(4.0f, 0.001f));
        REQUIRE_THAT(edge.opacity, WithinAbs(0.6f, 0.001f));
    }

    SECTION("opacity flickers within bounds with highs") {
        drive.highs = 1.0f;
        for (int i = 0; i < 200; i++) {
            edge.update(drive, rng);
            REQUIRE(edge.opacity >= 0.2f);
            REQUIRE(edge.opacity <= 1.0f);
        }
    }

    SECTION("midpoint") {
        std::vector<Node> nodes;
        nodes.emplace_back(0, glm::vec2(0.0f, 0.0f));
        nodes.emplace_back(1, glm::vec2(10.0f, 20.0f));
        glm::vec2 m = edge.midpoint(nodes);
        REQUIRE_THAT(m.x, WithinAbs(5.0f, 0.001f));
        REQUIRE_THAT(m.y, WithinAbs(10.0f, 0.001f));
    }
}

TEST_CASE("AudioDrive sanitizes input", "[network]") {
    AudioDescription d;
    d.bass = std::numeric_limits<float>::quiet_NaN();
    d.mids = -1.0f;
    d.highs = 4.0f;
    d.totalEnergy = std::numeric_limits<float>::infinity();

    AudioDrive drive = AudioDrive::from(d);
    REQUIRE(drive.bass == 0.0f);
    REQUIRE(drive.mids == 0.0f);
    REQUIRE(drive.highs == 1.0f);
    REQUIRE(drive.total == 0.0f);
}

// =============================================================================
// SpatialNetwork
// =============================================================================

TEST_CASE("SpatialNetwork initialize", "[network]") {
    SpatialNetwork net(1280.0f, 720.0f);
    net.initialize(500);

    REQUIRE(net.nodes().size() == 500);
    REQUIRE(net.nodeCount() == 500);
    REQUIRE(net.edges().empty());

    std::set<uint32_t> ids;
    for (const Node& n : net.nodes()) {
        ids.insert(n.id);
        REQUIRE(n.position.x >= 0.0f);
        REQUIRE(n.position.x <= 1280.0f);
        REQUIRE(n.position.y >= 0.0f);
        REQUIRE(n.position.y <= 720.0f);
    }
    REQUIRE(ids.size() == 500);

    SECTION("negative counts create nothing") {
        net.initialize(-5);
        REQUIRE(net.nodes().empty());
    }
}

TEST_CASE("SpatialNetwork seeding is deterministic", "[network]") {
    SpatialNetwork a;
    SpatialNetwork b;
    a.seed(99);
    b.seed(99);
    a.initialize(50);
    b.initialize(50);

    for (int tick = 0; tick < 10; tick++) {
        a.update(bands(0.5f, 0.5f, 0.8f));
        b.update(bands(0.5f, 0.5f, 0.8f));
    }

    REQUIRE(a.edges().size() == b.edges().size());
    for (size_t i = 0; i < a.nodes().size(); i++) {
        REQUIRE(a.nodes()[i].position == b.nodes()[i].position);
    }
}

TEST_CASE("SpatialNetwork edges satisfy the link invariants", "[network]") {
    SpatialNetwork net(1280.0f, 720.0f);
    net.initialize(500);

    const AudioDescription inputs[] = {
        bands(0.0f, 0.0f, 0.0f),
        bands(0.8f, 1.0f, 0.5f),
        bands(0.2f, 0.3f, 1.0f),
    };

    for (const AudioDescription& d : inputs) {
        for (int tick = 0; tick < 5; tick++) {
            net.update(d);
            requireEdgeInvariants(net);
        }
    }
}

TEST_CASE("SpatialNetwork edges match a brute-force search", "[network]") {
    SpatialNetwork net(1280.0f, 720.0f);
    net.initialize(400);
    net.update(bands(0.3f, 0.7f, 0.2f));

    std::vector<NodePair> expected;
    findPairsBruteForce(net.nodes(), net.dynamicThreshold(), expected);

    REQUIRE(net.edges().size() == expected.size());
    for (size_t i = 0; i < expected.size(); i++) {
        REQUIRE(net.edges()[i].a == expected[i].first);
        REQUIRE(net.edges()[i].b == expected[i].second);
    }
}

TEST_CASE("SpatialNetwork dynamic threshold", "[network]") {
    SpatialNetwork net;
    net.initialize(100);

    SECTION("mids widen the threshold") {
        net.update(bands(0.0f, 1.0f, 0.0f));
        REQUIRE_THAT(net.dynamicThreshold(), WithinAbs(250.0f, 0.001f));
    }

    SECTION("threshold is never negative") {
        net.setConnectionThreshold(-100.0f);
        REQUIRE_THAT(static_cast<float>(net.connectionThreshold), WithinAbs(0.0f, 0.001f));
        net.update(bands(0.0f, 0.0f, 0.0f));
        REQUIRE_THAT(net.dynamicThreshold(), WithinAbs(0.0f, 0.001f));
        REQUIRE(net.edges().empty());
    }

    SECTION("non-finite threshold is treated as zero") {
        net.setConnectionThreshold(std::numeric_limits<float>::quiet_NaN());
        REQUIRE_THAT(static_cast<float>(net.connectionThreshold), WithinAbs(0.0f, 0.001f));
    }
}

TEST_CASE("SpatialNetwork tolerates garbage audio", "[network]") {
    SpatialNetwork net;
    net.initialize(200);

    AudioDescription d;
    d.bass = std::numeric_limits<float>::quiet_NaN();
    d.mids = std::numeric_limits<float>::quiet_NaN();
    d.highs = -3.0f;
    d.isBeat = true;
    d.beatConfidence = std::numeric_limits<float>::quiet_NaN();

    REQUIRE_NOTHROW(net.update(d));
    REQUIRE_THAT(net.pulseScale(), WithinAbs(1.0f, 0.001f));
    REQUIRE_THAT(net.dynamicThreshold(), WithinAbs(150.0f, 0.001f));
    REQUIRE(net.nodes().size() == 200);

    for (const Node& n : net.nodes()) {
        REQUIRE(std::isfinite(n.position.x));
        REQUIRE(std::isfinite(n.position.y));
        REQUIRE(std::isfinite(n.size));
    }
    requireEdgeInvariants(net);
}

TEST_CASE("SpatialNetwork beats rewire and spawn bursts", "[network]") {
    SpatialNetwork net(1280.0f, 720.0f);
    net.initialize(500);

    SECTION("strong beat: 20% rewired, 25% of that spawned") {
        std::vector<glm::vec2> before;
        for (const Node& n : net.nodes()) before.push_back(n.position);

        net.update(beat(1.0f));

        // floor(500 * 0.2) = 100 rewires -> 25 burst nodes
        REQUIRE(net.nodes().size() == 525);
        for (size_t i = 500; i < 525; i++) {
            REQUIRE_THAT(net.nodes()[i].baseSize, WithinAbs(5.0f, 0.001f));
        }

        int moved = 0;
        for (size_t i = 0; i < 500; i++) {
            if (net.nodes()[i].position != before[i]) moved++;
        }
        REQUIRE(moved > 0);
        REQUIRE(moved <= 100);
        requireEdgeInvariants(net);
    }

    SECTION("weak beats are ignored") {
        net.update(beat(0.5f));
        REQUIRE(net.nodes().size() == 500);
    }

    SECTION("bursts are capped at 1.5x the target count") {
        for (int i = 0; i < 100; i++) {
            net.update(beat(1.0f));
            REQUIRE(net.nodes().size() <= 750);
        }
        REQUIRE(net.nodes().size() == 750);
    }
}

TEST_CASE("SpatialNetwork setNodeCount", "[network]") {
    SpatialNetwork net;
    net.initialize(500);
    net.update(bands(0.2f, 0.5f, 0.1f));

    SECTION("shrinking trims to 1.2x the new count") {
        REQUIRE_NOTHROW(net.setNodeCount(250));
        REQUIRE(net.nodeCount() == 250);
        REQUIRE(net.getStats().nodeCount <= 300);
        REQUIRE(net.nodes().size() == 300);

        // Existing edges never point past the trimmed set
        for (const Edge& e : net.edges()) {
            REQUIRE(e.b < net.nodes().size());
        }

        net.update(bands(0.2f, 0.5f, 0.1f));
        requireEdgeInvariants(net);
        REQUIRE(net.getStats().nodeCount <= 300);
    }

    SECTION("small reductions keep the headroom") {
        net.setNodeCount(450);
        REQUIRE(net.nodes().size() == 500);
    }

    SECTION("growing adds nodes immediately") {
        net.setNodeCount(800);
        REQUIRE(net.nodes().size() == 800);
        REQUIRE(net.nodes().back().id == 799);
    }
}

TEST_CASE("SpatialNetwork stats", "[network]") {
    SpatialNetwork net;

    NetworkStats empty = net.getStats();
    REQUIRE(empty.nodeCount == 0);
    REQUIRE(empty.edgeCount == 0);
    REQUIRE(empty.density == 0.0f);

    net.initialize(300);
    net.update(bands(0.0f, 0.5f, 0.0f));

    NetworkStats stats = net.getStats();
    REQUIRE(stats.nodeCount == 300);
    REQUIRE(stats.edgeCount == net.edges().size());
    REQUIRE_THAT(stats.density, WithinAbs(stats.edgeCount / (300.0f * 299.0f * 0.5f), 0.0001f));
}

TEST_CASE("SpatialNetwork resize and pulse", "[network]") {
    SpatialNetwork net(1000.0f, 500.0f);
    net.initialize(20);
    glm::vec2 p0 = net.nodes()[0].position;

    SECTION("resize scales positions") {
        net.resize(2000.0f, 250.0f);
        REQUIRE_THAT(net.nodes()[0].position.x, WithinAbs(p0.x * 2.0f, 0.01f));
        REQUIRE_THAT(net.nodes()[0].position.y, WithinAbs(p0.y * 0.5f, 0.01f));
        REQUIRE_THAT(net.canvasSize().x, WithinAbs(2000.0f, 0.001f));
    }

    SECTION("pulse scales about the center") {
        net.update(bands(1.0f, 0.0f, 0.0f));
        REQUIRE_THAT(net.pulseScale(), WithinAbs(1.3f, 0.001f));

        glm::vec2 before = net.nodes()[0].position;
        net.applyPulse();
        glm::vec2 center(500.0f, 250.0f);
        glm::vec2 expected = center + (before - center) * 1.3f;
        REQUIRE_THAT(net.nodes()[0].position.x, WithinAbs(expected.x, 0.01f));
        REQUIRE_THAT(net.nodes()[0].position.y, WithinAbs(expected.y, 0.01f));
    }
}

TEST_CASE("SpatialNetwork on an oversized canvas", "[network]") {
    SpatialNetwork net(1280.0f, 720.0f);
    net.initialize(300);

    net.resize(9830550.0f, 9830550.0f);
    net.update(bands(0.2f, 0.5f, 0.1f));

    REQUIRE(net.grid().columns() <= SpatialGrid::MAX_AXIS_CELLS);
    REQUIRE(net.grid().rows() <= SpatialGrid::MAX_AXIS_CELLS);

    std::vector<NodePair> expected;
    findPairsBruteForce(net.nodes(), net.dynamicThreshold(), expected);
    REQUIRE(net.edges().size() == expected.size());
    requireEdgeInvariants(net);

    SECTION("non-finite sizes are ignored") {
        net.resize(std::numeric_limits<float>::quiet_NaN(), 500.0f);
        net.resize(std::numeric_limits<float>::infinity(), 500.0f);
        REQUIRE_THAT(net.canvasSize().x, WithinAbs(9830550.0f, 1.0f));
    }
}
