/**
 * @file i_system.hpp
 * @brief Interface for all per-step systems
 */

#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include <entt/entt.hpp>
#include "bytepath/core/game_config.hpp"
#include "bytepath/core/game_context.hpp"

namespace Systems {

/**
 * @struct SystemAccess
 * @brief Component and resource types a system reads or writes
 *
 * The scheduler never places two systems with conflicting access in the
 * same batch. Batches are conflict-free for component and resource data
 * only: every system appends to the one CommandBuffer without locking, so
 * the systems of a batch run one after another. Queued commands are applied
 * at the stage's sync point.
 */
struct SystemAccess {
    std::vector<entt::id_type> reads;
    std::vector<entt::id_type> writes;

    template <typename... Types>
    SystemAccess& read() {
        (reads.push_back(entt::type_hash<Types>::value()), ...);
        return *this;
    }

    template <typename... Types>
    SystemAccess& write() {
        (writes.push_back(entt::type_hash<Types>::value()), ...);
        return *this;
    }

    /**
     * @brief True if either side writes something the other reads or writes
     */
    bool conflictsWith(const SystemAccess& other) const {
        auto overlaps = [](const std::vector<entt::id_type>& a, const std::vector<entt::id_type>& b) {
            return std::any_of(a.begin(), a.end(), [&b](entt::id_type id) {
                return std::find(b.begin(), b.end(), id) != b.end();
            });
        };
        return overlaps(writes, other.writes)
            || overlaps(writes, other.reads)
            || overlaps(reads, other.writes);
    }
};

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * update() runs once per simulation step (or once at startup for startup
 * systems). setup() runs once before the first step and is where a system
 * registers its event readers.
 */
class ISystem {
protected:
    GameConfig gameConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Label used for ordering (`after`) and profiling
     */
    virtual std::string name() const = 0;

    /**
     * @brief One-time initialization before the first step
     */
    virtual void setup(entt::registry& registry, GameContext& ctx) {
        (void)registry;
        (void)ctx;
    }

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     * @param ctx Shared resources and the deferred command buffer
     */
    virtual void update(entt::registry& registry, GameContext& ctx) = 0;

    /**
     * @brief Declared read/write set
     */
    virtual SystemAccess access() const { return {}; }

    virtual void setGameConfig(const GameConfig& config) {
        gameConfig = config;
    }

    virtual const GameConfig& getGameConfig() const {
        return gameConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * Derived systems that need tunables beyond GameConfig keep them in a
 * SpecificConfig struct with defaults.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
