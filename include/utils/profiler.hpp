#ifndef KAOS9_PROFILER_HPP
#define KAOS9_PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Disabled unless KAOS9_ENABLE_PROFILING is defined.
// Enable via: cmake -DKAOS9_ENABLE_PROFILING=ON

#ifdef KAOS9_ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace utils {

// ============================================================================
// Profiler - Accumulates wall time per named section
// ============================================================================

class Profiler {
public:
    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const std::string& section, double durationNs) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
    }

    void printReport() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::cout << "\n=== Profiler Report ===\n";
        if (sections_.empty()) {
            std::cout << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(),
            [](const auto& a, const auto& b) {
                return a.second.totalTimeNs > b.second.totalTimeNs;
            });

        std::cout << std::left << std::setw(32) << "Section"
                  << std::right << std::setw(14) << "Total Time"
                  << std::setw(12) << "Calls"
                  << std::setw(14) << "Avg/Call"
                  << "\n";
        std::cout << std::string(72, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            double avgUs = stats.callCount > 0 ? stats.totalTimeNs / stats.callCount / 1e3 : 0.0;
            std::cout << std::left << std::setw(32) << name
                      << std::right << std::setw(11) << std::fixed << std::setprecision(2)
                      << stats.totalTimeNs / 1e6 << " ms"
                      << std::setw(12) << stats.callCount
                      << std::setw(11) << std::fixed << std::setprecision(1) << avgUs << " us"
                      << "\n";
        }
        std::cout << std::string(72, '-') << "\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SectionStats> sections_;
};

// RAII helper that records timing when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        Profiler::instance().record(section_, std::chrono::duration<double, std::nano>(end - start_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace utils

#define KAOS9_PROFILE_CONCAT_INNER(a, b) a##b
#define KAOS9_PROFILE_CONCAT(a, b) KAOS9_PROFILE_CONCAT_INNER(a, b)
#define KAOS9_PROFILE_FUNCTION() ::utils::ScopedTimer KAOS9_PROFILE_CONCAT(kaos9_timer_, __LINE__)(__func__)
#define KAOS9_PROFILE_SCOPE(name) ::utils::ScopedTimer KAOS9_PROFILE_CONCAT(kaos9_timer_, __LINE__)(name)

#else // KAOS9_ENABLE_PROFILING not defined

namespace utils {

// No-op stand-in so call sites need no #ifdef
class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}
    void reset() {}
};

} // namespace utils

#define KAOS9_PROFILE_FUNCTION() ((void)0)
#define KAOS9_PROFILE_SCOPE(name) ((void)0)

#endif // KAOS9_ENABLE_PROFILING

#endif // KAOS9_PROFILER_HPP
