#include "bytepath/core/shake.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Resources {

ShakeGenerator::ShakeGenerator(const ShakeConfig& config)
    : config(config)
{
}

void ShakeGenerator::start(std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    auto const count = static_cast<std::size_t>(
        std::max(0.0f, std::floor(config.duration * config.frequency)));

    std::vector<float> xs(count);
    std::vector<float> ys(count);
    for (std::size_t i = 0; i < count; ++i) {
        xs[i] = dist(rng);
        ys[i] = dist(rng);
    }
    startWithSamples(std::move(xs), std::move(ys));
}

void ShakeGenerator::startWithSamples(std::vector<float> xs, std::vector<float> ys) {
    samplesX = std::move(xs);
    samplesY = std::move(ys);
    shakeTime = 0.0f;
    shaking = true;
}

Vector ShakeGenerator::advance(float rawDelta) {
    if (!shaking) {
        return {};
    }

    shakeTime += rawDelta;
    if (shakeTime > config.duration) {
        shaking = false;
        return {};
    }
    return offsetAt(shakeTime);
}

Vector ShakeGenerator::offsetAt(float t) const {
    if (config.duration <= 0.0f) {
        return {};
    }
    float const decay = (config.duration - t) / config.duration;
    float const scale = decay * config.amplitude;
    return {sampleAxis(samplesX, t) * scale, sampleAxis(samplesY, t) * scale};
}

float ShakeGenerator::sampleAxis(const std::vector<float>& samples, float t) const {
    float const s = t * config.frequency;
    float const s0f = std::floor(s);
    float const fraction = s - s0f;

    auto sampleAt = [&samples](float index) {
        if (index < 0.0f || index >= static_cast<float>(samples.size())) {
            return 0.0f;
        }
        return samples[static_cast<std::size_t>(index)];
    };

    float const a = sampleAt(s0f);
    float const b = sampleAt(s0f + 1.0f);
    return a + (b - a) * fraction;
}

} // namespace Resources
