#include <pulsenet/network/node.h>

#include <cmath>

namespace pulsenet::network {

namespace {

float wrap(float v, float extent) {
    if (extent <= 0.0f) return 0.0f;
    float r = std::fmod(v, extent);
    return r < 0.0f ? r + extent : r;
}

} // namespace

void Node::update(const AudioDrive& drive, const glm::vec2& canvas, std::mt19937& rng) {
    if (!active) return;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    // Occasional random jump, more likely with bright high end
    if (unit(rng) < drive.highs * 0.02f) {
        float jumpDistance = 20.0f + drive.highs * 30.0f;
        float angle = unit(rng) * 6.28318531f;
        target = position + glm::vec2(std::cos(angle), std::sin(angle)) * jumpDistance;
        target.x = wrap(target.x, canvas.x);
        target.y = wrap(target.y, canvas.y);
    }

    // Snap, no easing
    if (std::abs(position.x - target.x) > 1.0f || std::abs(position.y - target.y) > 1.0f) {
        position = target;
    }

    size = baseSize + drive.bass * 20.0f;
    glow = drive.highs * 30.0f;
    energy = drive.total;
}

void Node::resetPosition(const glm::vec2& canvas, std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    position = glm::vec2(unit(rng) * canvas.x, unit(rng) * canvas.y);
    target = position;
}

} // namespace pulsenet::network
