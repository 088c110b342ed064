/**
 * @file profile.hpp
 * @brief Scoped timing of the tick pipeline and its systems
 *
 * Sections nest: a section started while another is open becomes its child,
 * and the parent's self time excludes the child's time. Stats are kept per
 * section name for the lifetime of the process (or until reset()).
 *
 * @code
 * void GravitySystem::update(...) {
 *     PROFILE_SCOPE("GravitySystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide section timer. Use the static interface.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration self_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);

    /**
     * @brief Close a section. Mismatched names are reported and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Number of completed calls recorded for a section (0 if unknown)
     */
    static uint64_t callCount(const std::string& name);

    /**
     * @brief Print the section tree with call counts and time shares
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Drop collected stats. Sections still open keep running.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> open_sections;

    Profiler() = default;

    static Profiler& getInstance();

    void attachToParent(const std::string& name);

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: starts a section on construction, ends it on destruction
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

#define RELATIVITY_PROFILE_CONCAT_INNER(a, b) a##b
#define RELATIVITY_PROFILE_CONCAT(a, b) RELATIVITY_PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler RELATIVITY_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
