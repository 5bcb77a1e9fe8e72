#pragma once
// Verbose progress output on stderr.

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace evbkit {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }
    return std::to_string(total_minutes / 60) + "h " +
           std::to_string(total_minutes % 60) + "m " + std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Prints "<label>... done (<elapsed>)" when verbose.
class StageTimer {
public:
    StageTimer(bool verbose, std::string label)
        : verbose_(verbose)
        , label_(std::move(label))
        , start_(std::chrono::steady_clock::now()) {
        if (verbose_) std::cerr << "  " << label_ << "...\n";
    }

    void done(const std::string& detail = std::string()) {
        if (!verbose_) return;
        std::cerr << "  " << label_ << " done";
        if (!detail.empty()) std::cerr << ": " << detail;
        std::cerr << " (" << format_elapsed(start_, std::chrono::steady_clock::now()) << ")\n";
    }

private:
    bool verbose_;
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace log_utils
}  // namespace evbkit
