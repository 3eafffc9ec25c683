#include "bytepath/core/scheduler.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

const char* const Scheduler::StartupStage = "startup";

void Scheduler::addStage(const std::string& name) {
    if (findStage(name)) {
        throw std::invalid_argument("Scheduler: duplicate stage '" + name + "'");
    }
    stages.push_back(Stage{name, {}, {}});
}

void Scheduler::addStageAfter(const std::string& after, const std::string& name) {
    if (findStage(name)) {
        throw std::invalid_argument("Scheduler: duplicate stage '" + name + "'");
    }
    auto it = std::find_if(stages.begin(), stages.end(),
                           [&after](const Stage& s) { return s.name == after; });
    if (it == stages.end()) {
        throw std::invalid_argument("Scheduler: unknown stage '" + after + "'");
    }
    stages.insert(it + 1, Stage{name, {}, {}});
}

void Scheduler::addSystem(const std::string& stage,
                          std::unique_ptr<Systems::ISystem> system,
                          std::vector<std::string> after)
{
    Stage* target = findStage(stage);
    if (!target || target == &startup) {
        throw std::invalid_argument("Scheduler: unknown stage '" + stage + "'");
    }
    addToStage(*target, std::move(system), std::move(after));
    initialized = false;
}

void Scheduler::addStartupSystem(std::unique_ptr<Systems::ISystem> system,
                                 std::vector<std::string> after)
{
    addToStage(startup, std::move(system), std::move(after));
    initialized = false;
}

void Scheduler::addToStage(Stage& stage,
                           std::unique_ptr<Systems::ISystem> system,
                           std::vector<std::string> after)
{
    std::string label = system->name();
    for (const auto& entry : stage.systems) {
        if (entry.label == label) {
            throw std::invalid_argument("Scheduler: duplicate system '" + label +
                                        "' in stage '" + stage.name + "'");
        }
    }
    SystemEntry entry;
    entry.access = system->access();
    entry.system = std::move(system);
    entry.label = std::move(label);
    entry.after = std::move(after);
    stage.systems.push_back(std::move(entry));
}

void Scheduler::initialize(entt::registry& registry, GameContext& ctx) {
    buildBatches(startup);
    for (auto& stage : stages) {
        buildBatches(stage);
    }

    std::size_t systemCount = startup.systems.size();
    for (auto& entry : startup.systems) {
        entry.system->setGameConfig(ctx.config);
        entry.system->setup(registry, ctx);
    }
    for (auto& stage : stages) {
        systemCount += stage.systems.size();
        for (auto& entry : stage.systems) {
            entry.system->setGameConfig(ctx.config);
            entry.system->setup(registry, ctx);
        }
    }

    std::cout << "Scheduler::initialize() " << stages.size() << " stages, "
              << systemCount << " systems" << std::endl;
    for (const auto& stage : stages) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "  stage '" << stage.name << "': "
                  << stage.systems.size() << " systems in "
                  << stage.batches.size() << " batches\n");
    }

    initialized = true;
}

void Scheduler::buildBatches(Stage& stage) {
    const std::size_t count = stage.systems.size();

    std::unordered_map<std::string, std::size_t> indexByLabel;
    for (std::size_t i = 0; i < count; ++i) {
        indexByLabel[stage.systems[i].label] = i;
    }

    std::vector<std::vector<std::size_t>> deps(count);
    for (std::size_t i = 0; i < count; ++i) {
        for (const auto& label : stage.systems[i].after) {
            auto it = indexByLabel.find(label);
            if (it == indexByLabel.end()) {
                throw std::invalid_argument("Scheduler: system '" + stage.systems[i].label +
                                            "' runs after unknown system '" + label +
                                            "' in stage '" + stage.name + "'");
            }
            deps[i].push_back(it->second);
        }
    }

    // Stable topological sort: among ready systems, the earliest added goes first
    std::vector<std::size_t> order;
    order.reserve(count);
    std::vector<bool> placed(count, false);
    while (order.size() < count) {
        bool progressed = false;
        for (std::size_t i = 0; i < count; ++i) {
            if (placed[i]) {
                continue;
            }
            bool ready = std::all_of(deps[i].begin(), deps[i].end(),
                                     [&placed](std::size_t d) { return placed[d]; });
            if (ready) {
                placed[i] = true;
                order.push_back(i);
                progressed = true;
                break;
            }
        }
        if (!progressed) {
            throw std::logic_error("Scheduler: dependency cycle in stage '" + stage.name + "'");
        }
    }

    std::vector<std::size_t> batchOf(count, 0);
    stage.batches.clear();
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        std::size_t const i = order[pos];
        std::size_t batch = 0;
        for (std::size_t d : deps[i]) {
            batch = std::max(batch, batchOf[d] + 1);
        }
        for (std::size_t prev = 0; prev < pos; ++prev) {
            std::size_t const j = order[prev];
            if (stage.systems[i].access.conflictsWith(stage.systems[j].access)) {
                batch = std::max(batch, batchOf[j] + 1);
            }
        }
        batchOf[i] = batch;
        if (stage.batches.size() <= batch) {
            stage.batches.resize(batch + 1);
        }
        stage.batches[batch].push_back(i);
    }
}

void Scheduler::runStartup(entt::registry& registry, GameContext& ctx) {
    if (!initialized) {
        throw std::logic_error("Scheduler: runStartup() before initialize()");
    }
    if (startupDone) {
        return;
    }
    runStage(startup, registry, ctx);
    startupDone = true;
}

void Scheduler::run(entt::registry& registry, GameContext& ctx) {
    if (!initialized) {
        throw std::logic_error("Scheduler: run() before initialize()");
    }
    for (auto& stage : stages) {
        runStage(stage, registry, ctx);
    }
}

void Scheduler::runStage(Stage& stage, entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("Stage:" + stage.name);
    for (const auto& batch : stage.batches) {
        for (std::size_t index : batch) {
            stage.systems[index].system->update(registry, ctx);
        }
    }
    // Sync point
    ctx.commands.apply(registry);
}

std::vector<std::string> Scheduler::stageNames() const {
    std::vector<std::string> names;
    names.reserve(stages.size());
    for (const auto& stage : stages) {
        names.push_back(stage.name);
    }
    return names;
}

std::vector<std::string> Scheduler::executionOrder(const std::string& stage) const {
    std::vector<std::string> order;
    for (const auto& batch : batches(stage)) {
        order.insert(order.end(), batch.begin(), batch.end());
    }
    return order;
}

std::vector<std::vector<std::string>> Scheduler::batches(const std::string& stage) const {
    const Stage* found = findStage(stage);
    if (!found) {
        throw std::invalid_argument("Scheduler: unknown stage '" + stage + "'");
    }
    std::vector<std::vector<std::string>> result;
    for (const auto& batch : found->batches) {
        std::vector<std::string> labels;
        for (std::size_t index : batch) {
            labels.push_back(found->systems[index].label);
        }
        result.push_back(std::move(labels));
    }
    return result;
}

Systems::ISystem* Scheduler::findSystem(const std::string& label) {
    for (auto& entry : startup.systems) {
        if (entry.label == label) {
            return entry.system.get();
        }
    }
    for (auto& stage : stages) {
        for (auto& entry : stage.systems) {
            if (entry.label == label) {
                return entry.system.get();
            }
        }
    }
    return nullptr;
}

Scheduler::Stage* Scheduler::findStage(const std::string& name) {
    if (name == startup.name) {
        return &startup;
    }
    for (auto& stage : stages) {
        if (stage.name == name) {
            return &stage;
        }
    }
    return nullptr;
}

const Scheduler::Stage* Scheduler::findStage(const std::string& name) const {
    if (name == startup.name) {
        return &startup;
    }
    for (const auto& stage : stages) {
        if (stage.name == name) {
            return &stage;
        }
    }
    return nullptr;
}
