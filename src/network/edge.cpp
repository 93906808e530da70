#include <pulsenet/network/edge.h>

namespace pulsenet::network {

void Edge::update(const AudioDrive& drive, std::mt19937& rng) {
    if (!active) return;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    thickness = 1.0f + drive.bass * 3.0f;

    if (unit(rng) < drive.highs * 0.3f) {
        opacity = 0.2f + unit(rng) * 0.6f;
    } else {
        opacity = 0.6f + drive.highs * 0.4f;
    }
}

} // namespace pulsenet::network
