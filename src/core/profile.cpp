/**
 * @file profile.cpp
 * @brief Scope profiler behind PROFILE_SCOPE in systems, stages and Game
 */

#include "bytepath/core/profile.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];

    section.start_time = Clock::now();

    if (!instance.scope_stack.empty()) {
        const std::string parentName = instance.scope_stack.top();

        // A system added to a second stage moves under that stage
        if (!section.profile_data.parent_name.empty() &&
            section.profile_data.parent_name != parentName)
        {
            auto& oldSiblings =
                instance.sections[section.profile_data.parent_name].profile_data.children;
            oldSiblings.erase(
                std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                oldSiblings.end()
            );
        }

        section.profile_data.parent_name = parentName;

        auto& siblings = instance.sections[parentName].profile_data.children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    } else {
        section.profile_data.parent_name.clear();
    }

    instance.scope_stack.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") but scope stack empty.\n";
        return;
    }
    if (instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but top of stack is \"" << instance.scope_stack.top() << "\".\n";
        return;
    }

    auto endTime = Clock::now();
    auto& data = instance.sections[name].profile_data;
    Duration const duration = endTime - instance.sections[name].start_time;

    data.total_time += duration;
    data.self_time  += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= duration;
    }

    instance.scope_stack.pop();
}

std::optional<Profiler::ProfileData> Profiler::getStats(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return std::nullopt;
    }
    return it->second.profile_data;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::cout << "\nStep profile (frame > stage > system):\n";

    std::vector<std::string> roots;
    roots.reserve(instance.sections.size());
    for (auto& [name, sdata] : instance.sections) {
        if (sdata.profile_data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    Duration totalTime{0};
    for (auto& r : roots) {
        totalTime += instance.sections[r].profile_data.total_time;
    }

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& instance = getInstance();
    const auto& pd       = instance.sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto totalUs = std::chrono::duration_cast<std::chrono::microseconds>(pd.total_time).count();

    std::cout << prefix << (isLast ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls] "
              << totalUs << "us (total: "
              << std::fixed << std::setprecision(2) << totalPercent << "%, "
              << "self: " << selfPercent << "%)\n";

    for (size_t i = 0; i < pd.children.size(); ++i) {
        bool const childLast = (i == pd.children.size() - 1);
        std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
        printNode(pd.children[i], childPrefix, childLast, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    while (!instance.scope_stack.empty()) {
        instance.scope_stack.pop();
    }
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
