#include "bytepath/core/command_buffer.hpp"
#include "bytepath/core/debug.hpp"
#include <utility>

void CommandBuffer::spawn(SpawnFn fn) {
    ++spawnCount;
    commands.emplace_back([fn = std::move(fn)](entt::registry& registry) {
        auto const entity = registry.create();
        fn(registry, entity);
    });
}

void CommandBuffer::despawn(entt::entity entity) {
    ++despawnCount;
    commands.emplace_back([entity](entt::registry& registry) {
        if (registry.valid(entity)) {
            registry.destroy(entity);
        }
    });
}

void CommandBuffer::edit(EditFn fn) {
    commands.push_back(std::move(fn));
}

std::size_t CommandBuffer::apply(entt::registry& registry) {
    // Commands may queue further commands; those run at the next sync point
    std::vector<EditFn> batch;
    batch.swap(commands);

    DebugStats::recordSpawns(spawnCount);
    DebugStats::recordDespawns(despawnCount);
    spawnCount = 0;
    despawnCount = 0;

    for (auto& command : batch) {
        command(registry);
    }
    return batch.size();
}
