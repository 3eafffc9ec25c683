/**
 * @file resources.hpp
 * @brief Process-wide singletons shared by the systems
 */

#pragma once

#include <random>
#include <unordered_set>
#include <SFML/Window/Keyboard.hpp>
#include "bytepath/core/timer.hpp"

namespace Resources {

    /**
     * @brief Step duration as seen by the systems.
     *
     * raw is the wall-clock slice for this step. scaled is raw after time
     * dilation. Camera shake and flash read raw; gameplay reads scaled.
     */
    struct FrameTime {
        float raw = 0.0f;
        float scaled = 0.0f;
    };

    // Snapshot of the keys held this frame, supplied by the input collaborator
    using Keycodes = std::unordered_set<sf::Keyboard::Key>;

    /**
     * @brief One repeating timer per periodic spawner, ticked on scaled time
     *        by the frame loop before the systems run.
     */
    struct SpawnTimers {
        Timer projectile;
        Timer tickEffect;
        Timer ammoPickup;
        Timer boostPickup;

        void tick(float scaledDelta) {
            projectile.tick(scaledDelta);
            tickEffect.tick(scaledDelta);
            ammoPickup.tick(scaledDelta);
            boostPickup.tick(scaledDelta);
        }
    };

    // View offset applied by the rendering collaborator
    struct Camera {
        float x = 0.0f;
        float y = 0.0f;
    };

    struct Flash {
        int framesLeft = 0;
        bool visible = false;
    };

    struct Random {
        std::mt19937 engine;

        float uniform(float lo, float hi) {
            std::uniform_real_distribution<float> dist(lo, hi);
            return dist(engine);
        }

        int uniformInt(int lo, int hi) {
            std::uniform_int_distribution<int> dist(lo, hi);
            return dist(engine);
        }

        bool chance(float p) { return uniform(0.0f, 1.0f) < p; }
    };

} // namespace Resources
