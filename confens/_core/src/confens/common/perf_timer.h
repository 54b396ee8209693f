#pragma once

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace confens::perf {

/**
 * Wall-clock timer for a scope.
 *
 * elapsed()/elapsed_text() feed the observer's info lines. When the
 * CONFENS_PERF_REPORT environment variable is set, the destructor also prints
 * a [CONFENS_PERF] line to stdout.
 */
class ScopedTimer {
    using clock = std::chrono::steady_clock;

public:
    explicit ScopedTimer(std::string label)
        : report_(should_report()), label_(std::move(label)), start_(clock::now()) {}

    ~ScopedTimer() {
        if (!report_) {
            return;
        }
        std::cout << "[CONFENS_PERF] " << label_ << " " << std::fixed << std::setprecision(3)
                  << elapsed() << "s" << std::endl;
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    /// Seconds since construction.
    double elapsed() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

    /// Elapsed time formatted with two decimals, e.g. "0.42s".
    std::string elapsed_text() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << elapsed() << "s";
        return oss.str();
    }

private:
    static bool should_report() {
        const char* env = std::getenv("CONFENS_PERF_REPORT");
        return env != nullptr && env[0] != '\0' && env[0] != '0';
    }

    bool report_ = false;
    std::string label_;
    clock::time_point start_{};
};

}  // namespace confens::perf
