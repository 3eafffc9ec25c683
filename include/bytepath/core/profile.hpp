/**
 * @file profile.hpp
 * @brief Scope timing for systems, stages and frames
 *
 * Every system update, scheduler stage and game frame opens a PROFILE_SCOPE.
 * The profiler keeps the scopes as a tree (a system scope is a child of the
 * stage that ran it) and aggregates:
 * - total time and self time (total minus children)
 * - call count and min/max duration
 *
 * Example usage:
 * @code
 * void PlayerSystem::update(entt::registry &registry, GameContext &ctx) {
 *     PROFILE_SCOPE("PlayerSystem");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing registry.
 *
 * The simulation is single-threaded, so one instance serves every Game in the
 * process. Scope names are the labels passed to PROFILE_SCOPE: "Game::step",
 * "Stage:<stage name>" and one per system (e.g. "PlayerSystem").
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing for one named scope
     *
     * For a system scope, call_count is the number of steps it ran and
     * parent_name is the stage that ran it.
     */
    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};
        std::uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    /**
     * @brief Opens a named section under whatever scope is currently open.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes a named section. A name that does not match the innermost
     * open scope is reported on stderr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Aggregated data for a scope; nullopt if it never ran
     * (e.g. a system whose stage was not scheduled yet).
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Prints the Game::advanceFrame / stage / system tree with call
     * counts and time percentages to stdout.
     */
    static void printStats();

    /**
     * @brief Drops all recorded data, e.g. between two measured runs.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::stack<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief Times one system update, stage or step for the lifetime of the guard.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define BYTEPATH_PROFILE_CONCAT_INNER(a, b) a##b
#define BYTEPATH_PROFILE_CONCAT(a, b) BYTEPATH_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler BYTEPATH_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
