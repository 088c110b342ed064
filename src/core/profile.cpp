/**
 * @file profile.cpp
 * @brief Implementation of the section profiler
 */

#include "relativity/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>

#include "relativity/core/debug.hpp"

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::attachToParent(const std::string& name) {
    auto& data = sections[name].profile_data;

    if (open_sections.empty()) {
        data.parent_name.clear();
        return;
    }

    const std::string parentName = open_sections.back();
    if (data.parent_name == parentName) {
        return;
    }

    // Re-parent: a section called from a new place moves in the tree
    if (!data.parent_name.empty()) {
        auto& oldKids = sections[data.parent_name].profile_data.children;
        oldKids.erase(std::remove(oldKids.begin(), oldKids.end(), name), oldKids.end());
    }
    data.parent_name = parentName;

    auto& kids = sections[parentName].profile_data.children;
    if (std::find(kids.begin(), kids.end(), name) == kids.end()) {
        kids.push_back(name);
    }
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    instance.attachToParent(name);
    instance.sections[name].start_time = Clock::now();
    instance.open_sections.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open_sections.empty() || instance.open_sections.back() != name) {
        WARN_MSG("[Profiler] endSection(\"" << name << "\") does not match the open section");
        return;
    }

    auto& pd = instance.sections[name].profile_data;
    Duration const duration = Clock::now() - instance.sections[name].start_time;

    pd.total_time += duration;
    pd.self_time  += duration;
    pd.call_count += 1;
    pd.min_time = std::min(pd.min_time, duration);
    pd.max_time = std::max(pd.max_time, duration);

    if (!pd.parent_name.empty()) {
        instance.sections[pd.parent_name].profile_data.self_time -= duration;
    }

    instance.open_sections.pop_back();
}

uint64_t Profiler::callCount(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.profile_data.call_count;
}

void Profiler::printStats(std::ostream& out) {
    auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (const auto& [name, sdata] : instance.sections) {
        if (sdata.profile_data.parent_name.empty()) {
            roots.push_back(name);
            totalTime += sdata.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(out, roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(std::ostream& out,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto const totalUs = std::chrono::duration_cast<std::chrono::microseconds>(pd.total_time).count();

    out << prefix << (isLast ? "└── " : "├── ")
        << name << " [" << pd.call_count << " calls] "
        << totalUs << "us (total: "
        << std::fixed << std::setprecision(2) << totalPercent << "%, "
        << "self: " << selfPercent << "%)\n";

    for (size_t i = 0; i < pd.children.size(); ++i) {
        std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
        printNode(out, pd.children[i], childPrefix, i == pd.children.size() - 1, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();

    // Open sections survive with their start times so their scopes still close
    std::unordered_map<std::string, SectionData> kept;
    for (size_t i = 0; i < instance.open_sections.size(); ++i) {
        const std::string& name = instance.open_sections[i];
        kept[name].start_time = instance.sections[name].start_time;

        if (i > 0) {
            const std::string& parentName = instance.open_sections[i - 1];
            if (parentName == name) {
                continue;
            }
            kept[name].profile_data.parent_name = parentName;
            auto& kids = kept[parentName].profile_data.children;
            if (std::find(kids.begin(), kids.end(), name) == kids.end()) {
                kids.push_back(name);
            }
        }
    }
    instance.sections = std::move(kept);
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
