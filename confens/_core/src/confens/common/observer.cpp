#include "observer.h"

namespace confens {
namespace common {

ConsoleObserver::ConsoleObserver(bool quiet, std::ostream& out) : quiet_(quiet), out_(&out) {}

void ConsoleObserver::progress(int current, int total, const std::string& message,
                               const std::string& key) {
    if (quiet_) return;

    auto it = bars_.find(key);
    if (it == bars_.end()) {
        it = bars_.emplace(key, std::make_unique<ProgressBar>(total, message, *out_)).first;
    }
    it->second->update(current, message);
}

void ConsoleObserver::progress_done(const std::string& key) {
    auto it = bars_.find(key);
    if (it == bars_.end()) return;

    it->second->finish();
    bars_.erase(it);
}

void ConsoleObserver::info(const std::string& message) {
    if (quiet_) return;
    close_open_bars();
    *out_ << "[INFO] " << message << std::endl;
}

void ConsoleObserver::warning(const std::string& message) {
    close_open_bars();
    *out_ << "[WARNING] " << message << std::endl;
}

void ConsoleObserver::error(const std::string& message) {
    close_open_bars();
    *out_ << "[ERROR] " << message << std::endl;
}

// A message printed over a half-drawn bar would be garbled; end the bar line
// first. The bar itself stays registered and redraws on the next update.
void ConsoleObserver::close_open_bars() {
    bool any_open = false;
    for (const auto& entry : bars_) {
        if (!entry.second->is_finished() && entry.second->current() > 0) {
            any_open = true;
        }
    }
    if (any_open) {
        *out_ << "\n";
    }
}

Observer& null_observer() {
    static NullObserver observer;
    return observer;
}

}  // namespace common
}  // namespace confens
