#include "bytepath/core/debug.hpp"

// Initialize static members
std::uint64_t DebugStats::spawns = 0;
std::uint64_t DebugStats::despawns = 0;
std::uint64_t DebugStats::events = 0;
std::uint64_t DebugStats::steps = 0;
