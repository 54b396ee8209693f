#pragma once

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace confens {
namespace common {

/**
 * APT-style progress bar for CLI operations
 *
 * Renders progress like:
 *   [########........] 40% (2/5) Mapping 1abc to the reference...
 *
 * Not thread-safe; the ensemble pipeline is single-threaded.
 */
class ProgressBar {
public:
    /**
     * @param total Total number of items to process
     * @param description Text shown after the counter
     * @param out Stream the bar is drawn on (stderr by default)
     * @param width Width of the bar in characters
     */
    explicit ProgressBar(int total,
                         const std::string& description = "",
                         std::ostream& out = std::cerr,
                         int width = 20)
        : total_(total > 0 ? total : 1),
          current_(0),
          description_(description),
          out_(&out),
          width_(width),
          finished_(false),
          start_time_(std::chrono::steady_clock::now()) {}

    void update(int current) {
        if (finished_) return;

        current_ = current;
        if (current_ > total_) {
            current_ = total_;
        }

        render();
    }

    void update(int current, const std::string& description) {
        description_ = description;
        update(current);
    }

    void tick() { update(current_ + 1); }

    /**
     * Mark progress as complete and move to the next line
     */
    void finish() {
        if (finished_) return;

        current_ = total_;
        render();
        *out_ << "\n";
        finished_ = true;
    }

    int current() const { return current_; }
    int total() const { return total_; }
    bool is_finished() const { return finished_; }

    double fraction() const {
        return static_cast<double>(current_) / static_cast<double>(total_);
    }

    void set_description(const std::string& description) { description_ = description; }

private:
    void render() {
        double frac = fraction();
        int filled = static_cast<int>(std::round(frac * width_));

        std::string bar = "[";
        for (int i = 0; i < width_; ++i) {
            bar += (i < filled) ? "#" : ".";
        }
        bar += "]";

        std::ostringstream line;
        line << "\r" << bar << " " << std::fixed << std::setprecision(0) << (frac * 100.0)
             << "% (" << current_ << "/" << total_ << ")";

        if (!description_.empty()) {
            line << " " << description_;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time_;
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
        if (seconds > 5 && current_ > 0) {
            double rate = static_cast<double>(current_) / seconds;
            int eta_seconds = static_cast<int>((total_ - current_) / rate);

            if (eta_seconds < 60) {
                line << " [ETA: " << eta_seconds << "s]";
            } else {
                line << " [ETA: " << eta_seconds / 60 << "m]";
            }
        }

        line << "   ";  // Clear leftovers from a longer previous line
        *out_ << line.str() << std::flush;
    }

    int total_;
    int current_;
    std::string description_;
    std::ostream* out_;
    int width_;
    bool finished_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace common
}  // namespace confens
