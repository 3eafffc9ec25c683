/**
 * @file scheduler.hpp
 * @brief Orders systems into stages and conflict-free batches
 *
 * A schedule is a list of named stages run in order, plus a startup stage
 * run exactly once. Inside a stage each system may name other systems of
 * the same stage it must run `after`. initialize() resolves those edges,
 * then packs the systems into batches: a system lands in the first batch
 * that comes after all of its dependencies and after every earlier system
 * whose declared access conflicts with its own. Systems in one batch touch
 * disjoint component and resource data, but they all append to the shared
 * CommandBuffer, so the scheduler runs them in sequence.
 *
 * Deferred commands are applied after every stage (the sync point).
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <entt/entt.hpp>
#include "bytepath/core/game_context.hpp"
#include "bytepath/systems/i_system.hpp"

class Scheduler {
public:
    static const char* const StartupStage;

    /**
     * @brief Appends a stage at the end of the per-step schedule
     * @throws std::invalid_argument if the name is already used
     */
    void addStage(const std::string& name);

    /**
     * @brief Inserts a stage right after an existing one
     * @throws std::invalid_argument if `after` does not exist or name is taken
     */
    void addStageAfter(const std::string& after, const std::string& name);

    /**
     * @brief Adds a system to a per-step stage
     * @param stage Stage name
     * @param system The system; its name() is its label
     * @param after Labels of systems in the same stage that must run first
     * @throws std::invalid_argument for an unknown stage or a duplicate label
     */
    void addSystem(const std::string& stage,
                   std::unique_ptr<Systems::ISystem> system,
                   std::vector<std::string> after = {});

    /**
     * @brief Adds a system to the run-once startup stage
     */
    void addStartupSystem(std::unique_ptr<Systems::ISystem> system,
                          std::vector<std::string> after = {});

    /**
     * @brief Validates ordering, builds batches and runs every system's setup()
     *
     * Must be called once before runStartup()/run().
     * @throws std::invalid_argument for an `after` label that names no system
     *         in the stage
     * @throws std::logic_error for a dependency cycle
     */
    void initialize(entt::registry& registry, GameContext& ctx);

    /**
     * @brief Runs the startup stage; later calls do nothing
     * @throws std::logic_error if initialize() was not called
     */
    void runStartup(entt::registry& registry, GameContext& ctx);

    /**
     * @brief Runs every per-step stage once, in order
     * @throws std::logic_error if initialize() was not called
     */
    void run(entt::registry& registry, GameContext& ctx);

    bool isInitialized() const { return initialized; }
    bool hasRunStartup() const { return startupDone; }

    std::vector<std::string> stageNames() const;

    /**
     * @brief System labels of a stage in execution order
     */
    std::vector<std::string> executionOrder(const std::string& stage) const;

    /**
     * @brief System labels of a stage grouped by batch
     */
    std::vector<std::vector<std::string>> batches(const std::string& stage) const;

    /**
     * @brief Looks a system up by label in any stage
     * @return nullptr if absent
     */
    Systems::ISystem* findSystem(const std::string& label);

private:
    struct SystemEntry {
        std::unique_ptr<Systems::ISystem> system;
        std::string label;
        std::vector<std::string> after;
        Systems::SystemAccess access;
    };

    struct Stage {
        std::string name;
        std::vector<SystemEntry> systems;
        std::vector<std::vector<std::size_t>> batches;  // indices into systems
    };

    Stage* findStage(const std::string& name);
    const Stage* findStage(const std::string& name) const;

    static void addToStage(Stage& stage,
                           std::unique_ptr<Systems::ISystem> system,
                           std::vector<std::string> after);
    static void buildBatches(Stage& stage);
    static void runStage(Stage& stage, entt::registry& registry, GameContext& ctx);

    Stage startup{StartupStage, {}, {}};
    std::vector<Stage> stages;
    bool initialized = false;
    bool startupDone = false;
};
