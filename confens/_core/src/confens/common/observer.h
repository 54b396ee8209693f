/**
 * Progress and log side channel.
 *
 * Long-running operations (ensemble building, refinement, alignment export)
 * report through an Observer passed in by the caller. Nothing reported here
 * affects return values.
 */

#pragma once

#include "progress_bar.h"

#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace confens {
namespace common {

class Observer {
public:
    virtual ~Observer() = default;

    /**
     * Incremental progress.
     *
     * @param current Number of items processed so far
     * @param total Total number of items
     * @param message Status line for the current item
     * @param key Correlates updates belonging to the same operation
     */
    virtual void progress(int current, int total, const std::string& message,
                          const std::string& key) = 0;

    /// The operation identified by key has finished.
    virtual void progress_done(const std::string& key) = 0;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/**
 * Discards every event.
 */
class NullObserver : public Observer {
public:
    void progress(int, int, const std::string&, const std::string&) override {}
    void progress_done(const std::string&) override {}
    void info(const std::string&) override {}
    void warning(const std::string&) override {}
    void error(const std::string&) override {}
};

/**
 * Writes events to a stream (stderr by default) and draws one progress bar
 * per correlation key.
 *
 * quiet suppresses progress and info; warnings and errors are always shown.
 */
class ConsoleObserver : public Observer {
public:
    explicit ConsoleObserver(bool quiet = false, std::ostream& out = std::cerr);

    void progress(int current, int total, const std::string& message,
                  const std::string& key) override;
    void progress_done(const std::string& key) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;

private:
    void close_open_bars();

    bool quiet_;
    std::ostream* out_;
    std::map<std::string, std::unique_ptr<ProgressBar>> bars_;
};

/// Shared do-nothing observer for callers that do not care about progress.
Observer& null_observer();

}  // namespace common
}  // namespace confens
