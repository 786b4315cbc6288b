/**
 * @file PerformanceProfiler.hpp
 * @brief Compile-time optional timing for render calls.
 */

#ifndef VOICEGRAPH_PERFORMANCE_PROFILER_HPP
#define VOICEGRAPH_PERFORMANCE_PROFILER_HPP

#include <chrono>
#include <cstddef>

#ifndef VOICEGRAPH_ENABLE_PROFILING
#define VOICEGRAPH_ENABLE_PROFILING 0
#endif

namespace voicegraph {

/**
 * @brief Timing snapshot reported by nodes and the engine.
 *
 * All fields stay zero when VOICEGRAPH_ENABLE_PROFILING is off.
 */
struct PerformanceMetrics {
    std::chrono::nanoseconds last_execution_time{0};
    std::chrono::nanoseconds max_execution_time{0};
    size_t total_blocks_processed{0};
};

/**
 * @brief Measures the wall time of a render call.
 *
 * When profiling is disabled every method is an empty inline, so the
 * render path pays nothing.
 */
class PerformanceProfiler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Nanoseconds = std::chrono::nanoseconds;

    PerformanceProfiler() = default;

    PerformanceMetrics metrics() const {
        return PerformanceMetrics{elapsed(), max_execution_time(), total_blocks_processed()};
    }

#if VOICEGRAPH_ENABLE_PROFILING
    void start() {
        start_time_ = Clock::now();
    }

    void stop() {
        const auto end_time = Clock::now();
        execution_time_ = std::chrono::duration_cast<Nanoseconds>(end_time - start_time_);
        if (execution_time_ > max_execution_time_) {
            max_execution_time_ = execution_time_;
        }
        total_blocks_processed_++;
    }

    Nanoseconds elapsed() const { return execution_time_; }
    Nanoseconds max_execution_time() const { return max_execution_time_; }
    size_t total_blocks_processed() const { return total_blocks_processed_; }

    void reset() {
        execution_time_ = Nanoseconds::zero();
        max_execution_time_ = Nanoseconds::zero();
        total_blocks_processed_ = 0;
    }

private:
    TimePoint start_time_;
    Nanoseconds execution_time_{0};
    Nanoseconds max_execution_time_{0};
    size_t total_blocks_processed_{0};
#else
    void start() {}
    void stop() {}
    Nanoseconds elapsed() const { return Nanoseconds::zero(); }
    Nanoseconds max_execution_time() const { return Nanoseconds::zero(); }
    size_t total_blocks_processed() const { return 0; }
    void reset() {}
#endif
};

} // namespace voicegraph

#endif // VOICEGRAPH_PERFORMANCE_PROFILER_HPP
