/**
 * @file debug.h
 * @brief Debug tracing for the unicsv reader, inference and writer.
 */

#ifndef UNICSV_DEBUG_H
#define UNICSV_DEBUG_H

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace unicsv {

struct DebugConfig {
    bool verbose = false;
    bool timing = false;
    FILE* output = nullptr;

    DebugConfig() = default;

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        config.timing = true;
        return config;
    }

    bool enabled() const {
        return verbose || timing;
    }
};

struct PhaseTime {
    std::string name;
    std::chrono::nanoseconds duration;
    size_t scalars_processed = 0;

    double seconds() const {
        return duration.count() / 1e9;
    }

    double throughput_mscalars() const {
        if (scalars_processed == 0 || duration.count() == 0) return 0.0;
        return (scalars_processed / 1e6) / seconds();
    }
};

/**
 * @class DebugTrace
 * @brief Provides debug logging and phase timing.
 *
 * @note Thread Safety: This class is NOT thread-safe. unicsv sessions are
 *       single-threaded; share a trace only between sessions on one thread.
 */
class DebugTrace {
public:
    explicit DebugTrace(const DebugConfig& config = DebugConfig())
        : config_(config) {}

    bool enabled() const { return config_.enabled(); }
    bool verbose() const { return config_.verbose; }
    bool timing() const { return config_.timing; }

    // Note: The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
    #if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
    #endif
    void log(const char* fmt, ...) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[unicsv] ");
        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

    // Safe string logging without format string interpretation.
    // Use this when logging field text or other untrusted strings.
    void log_str(const char* msg) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[unicsv] %s\n", msg);
        fflush(out);
    }

    void log_decision(const char* decision, const char* reason) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[unicsv] DECISION: %s | Reason: %s\n", decision, reason);
        fflush(out);
    }

    // Delimiters are expected already escaped (see escape_scalars in utf8.h)
    void log_delimiters(const std::string& field, const std::string& row,
                        bool has_header) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[unicsv] CONFIG: field='%s', row='%s', header=%s\n",
                field.c_str(), row.c_str(), has_header ? "yes" : "no");
        fflush(out);
    }

    void log_state_transition(const char* from_state, const char* to_state,
                              char32_t trigger, size_t offset) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[unicsv] STATE @ %zu: %s -> %s (trigger: U+%04X)\n",
                offset, from_state, to_state, static_cast<unsigned>(trigger));
        fflush(out);
    }

    void start_phase(const char* phase_name) {
        if (!config_.timing) return;
        current_phase_ = phase_name;
        phase_start_ = std::chrono::steady_clock::now();
    }

    void end_phase(size_t scalars_processed = 0) {
        if (!config_.timing) return;
        auto end = std::chrono::steady_clock::now();
        PhaseTime pt;
        pt.name = current_phase_;
        pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
        pt.scalars_processed = scalars_processed;
        phase_times_.push_back(pt);
    }

    void print_timing_summary() const {
        if (!config_.timing || phase_times_.empty()) return;
        FILE* out = stream();
        fprintf(out, "\n[unicsv] TIMING SUMMARY:\n");
        fprintf(out, "  %-30s %12s %12s %14s\n",
                "Phase", "Time (ms)", "Scalars", "Throughput");
        fprintf(out, "  %s\n", std::string(72, '-').c_str());

        for (const auto& pt : phase_times_) {
            double ms = pt.duration.count() / 1e6;
            fprintf(out, "  %-30s %12.3f %12zu",
                    pt.name.c_str(), ms, pt.scalars_processed);
            if (pt.scalars_processed > 0) {
                fprintf(out, " %9.2f M/s", pt.throughput_mscalars());
            }
            fprintf(out, "\n");
        }
        fprintf(out, "\n");
        fflush(out);
    }

    const std::vector<PhaseTime>& get_phase_times() const {
        return phase_times_;
    }

    void clear_timing() {
        phase_times_.clear();
    }

private:
    DebugConfig config_;
    std::string current_phase_;
    std::chrono::steady_clock::time_point phase_start_;
    std::vector<PhaseTime> phase_times_;

    FILE* stream() const {
        return config_.output ? config_.output : stderr;
    }
};

class ScopedPhaseTimer {
public:
    ScopedPhaseTimer(DebugTrace& trace, const char* phase_name, size_t scalars = 0)
        : trace_(trace), scalars_(scalars) {
        trace_.start_phase(phase_name);
    }

    ~ScopedPhaseTimer() {
        trace_.end_phase(scalars_);
    }

    void set_scalars(size_t scalars) { scalars_ = scalars; }

private:
    DebugTrace& trace_;
    size_t scalars_;
};

namespace debug {

inline DebugConfig& global_config() {
    static DebugConfig config;
    return config;
}

inline DebugTrace& global_trace() {
    static DebugTrace trace(global_config());
    return trace;
}

inline void set_config(const DebugConfig& config) {
    global_config() = config;
    global_trace() = DebugTrace(config);
}

inline bool enabled() {
    return global_config().enabled();
}

}  // namespace debug

}  // namespace unicsv

#endif  // UNICSV_DEBUG_H
