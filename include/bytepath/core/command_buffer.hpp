/**
 * @file command_buffer.hpp
 * @brief Deferred structural changes (spawn / despawn / attach)
 *
 * Systems never create or destroy entities while iterating a view. They
 * record commands here instead, and the scheduler applies the log at the
 * sync point that closes every stage, in the order commands were recorded.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <vector>
#include <entt/entt.hpp>

class CommandBuffer {
public:
    using SpawnFn = std::function<void(entt::registry&, entt::entity)>;
    using EditFn = std::function<void(entt::registry&)>;

    /**
     * @brief Queues creation of an entity; fn attaches its components
     */
    void spawn(SpawnFn fn);

    /**
     * @brief Queues destruction of an entity. Destroying an entity that is
     *        already gone (e.g. despawned twice in one stage) is a no-op.
     */
    void despawn(entt::entity entity);

    /**
     * @brief Queues an arbitrary registry edit, e.g. attaching a component
     *        to an entity that is part of a view being iterated
     */
    void edit(EditFn fn);

    /**
     * @brief Queues attaching (or replacing) a component on a live entity
     */
    template <typename Component, typename... Args>
    void insert(entt::entity entity, Args... args) {
        edit([entity, args...](entt::registry& registry) {
            if (registry.valid(entity)) {
                registry.emplace_or_replace<Component>(entity, args...);
            }
        });
    }

    /**
     * @brief Applies every queued command in recording order and clears the log
     * @return Number of commands applied
     */
    std::size_t apply(entt::registry& registry);

    std::size_t pending() const { return commands.size(); }
    std::size_t pendingSpawns() const { return spawnCount; }
    std::size_t pendingDespawns() const { return despawnCount; }
    bool empty() const { return commands.empty(); }

private:
    std::vector<EditFn> commands;
    std::size_t spawnCount = 0;
    std::size_t despawnCount = 0;
};
