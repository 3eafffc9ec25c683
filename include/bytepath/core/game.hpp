/**
 * @fileoverview game.hpp
 * @brief Fixed-step frame loop over the entity registry
 *
 * Game owns the registry, the shared GameContext and the Scheduler. The
 * default schedule is:
 *  - startup: player_spawn_system
 *  - events:  event_update_system (clears last step's events)
 *  - game:    every gameplay system, ordered by their `after` edges
 *
 * advanceFrame() slices the wall-clock time of one rendered frame into
 * steps of at most GameConfig::MaxStepSeconds. For each step it reads any
 * PlayerDeath left by the previous step, derives the scaled step time
 * through TimeDilation, ticks the spawn timers and runs the schedule.
 */

#ifndef BYTEPATH_GAME_HPP
#define BYTEPATH_GAME_HPP

#include <entt/entt.hpp>
#include "bytepath/core/game_config.hpp"
#include "bytepath/core/game_context.hpp"
#include "bytepath/core/scheduler.hpp"

class Game {
public:
    Game();
    explicit Game(const GameConfig& config);
    ~Game();

    /**
     * @brief Builds batches, runs system setup and the startup stage
     * @throws std::invalid_argument / std::logic_error for a broken schedule
     *         or a non-positive MaxStepSeconds
     */
    void startup();

    /**
     * @brief Replaces the set of keys held during the next frame
     */
    void setPressedKeys(const Resources::Keycodes& keys);

    /**
     * @brief Advances the simulation by one rendered frame
     * @param seconds Wall-clock duration of the frame
     * @return Number of fixed steps run
     *
     * The frame is counted in whole nanoseconds; the last slice takes
     * whatever is left, never a rounding residue.
     * @throws std::invalid_argument if MaxStepSeconds is not positive
     */
    int advanceFrame(float seconds);

    /**
     * @brief Runs exactly one step of the given raw duration
     */
    void step(float rawDelta);

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;

    GameContext& context() { return ctx; }
    const GameContext& context() const { return ctx; }

    Scheduler& scheduler() { return schedule; }

private:
    void createSystems();

    entt::registry registry;
    GameContext ctx;
    Scheduler schedule;
    ReaderId deathReader;
};

#endif
