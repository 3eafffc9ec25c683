#pragma once

#include <cstdint>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef BYTEPATH_ENABLE_DEBUG
#define BYTEPATH_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (BYTEPATH_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting per-step structural statistics
class DebugStats {
public:
    static void reset() {
        spawns = 0;
        despawns = 0;
        events = 0;
        steps = 0;
    }

    static void recordSpawns(std::uint64_t count) { spawns += count; }
    static void recordDespawns(std::uint64_t count) { despawns += count; }
    static void recordEvents(std::uint64_t count) { events += count; }
    static void recordStep() { ++steps; }

    static std::uint64_t spawnCount() { return spawns; }
    static std::uint64_t despawnCount() { return despawns; }
    static std::uint64_t eventCount() { return events; }
    static std::uint64_t stepCount() { return steps; }

    static void printStepStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Step stats:\n"
            "  Steps: " << steps << "\n"
            "  Spawned: " << spawns << "\n"
            "  Despawned: " << despawns << "\n"
            "  Events: " << events << "\n"
        );
    }

private:
    static std::uint64_t spawns;
    static std::uint64_t despawns;
    static std::uint64_t events;
    static std::uint64_t steps;
};
