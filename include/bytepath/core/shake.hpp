/**
 * @file shake.hpp
 * @brief Noise-based camera shake
 *
 * On start the generator draws duration * frequency uniform samples in
 * [-1,1] per axis. While shaking, the offset at shake-time t is the linear
 * blend of samples floor(t*f) and floor(t*f)+1, scaled by a linear decay
 * (duration - t) / duration and by the amplitude. Samples past either end
 * of the arrays count as 0.
 */

#pragma once

#include <random>
#include <vector>
#include "bytepath/math/vector_math.hpp"

namespace Resources {

/**
 * @struct ShakeConfig
 * @brief Shape of a shake
 */
struct ShakeConfig {
    float duration = 0.4f;    // seconds
    float frequency = 60.0f;  // samples per second
    float amplitude = 4.0f;   // pixels
};

class ShakeGenerator {
public:
    ShakeGenerator() = default;
    explicit ShakeGenerator(const ShakeConfig& config);

    /**
     * @brief Starts (or restarts) a shake with fresh random samples
     */
    void start(std::mt19937& rng);

    /**
     * @brief Starts a shake with caller-supplied samples
     */
    void startWithSamples(std::vector<float> xs, std::vector<float> ys);

    /**
     * @brief Advances shake-time and returns the camera offset
     * @param rawDelta Unscaled step duration; the shake is never slowed down
     * @return (0,0) when inactive or once the duration has elapsed
     */
    Vector advance(float rawDelta);

    /**
     * @brief Offset at the current shake-time without advancing it
     */
    Vector offsetAt(float shakeTime) const;

    bool isShaking() const { return shaking; }
    float time() const { return shakeTime; }
    const ShakeConfig& getConfig() const { return config; }
    void setConfig(const ShakeConfig& cfg) { config = cfg; }

    const std::vector<float>& getSamplesX() const { return samplesX; }
    const std::vector<float>& getSamplesY() const { return samplesY; }

private:
    float sampleAxis(const std::vector<float>& samples, float shakeTime) const;

    ShakeConfig config;
    bool shaking = false;
    float shakeTime = 0.0f;
    std::vector<float> samplesX;
    std::vector<float> samplesY;
};

} // namespace Resources
