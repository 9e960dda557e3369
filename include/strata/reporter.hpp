#pragma once

#include <cstddef>
#include <string>

namespace strata {

// Progress sink for long-running steps. Called from worker threads, so
// implementations synchronize themselves.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void on_step_start(const std::string& message) = 0;
    virtual void on_step_finish(const std::string& message) = 0;

    // One transaction operation finished: kind is install, remove or change
    virtual void on_operation(const std::string& kind, const std::string& package) = 0;
};

// Forwards everything to strata::log
class LogReporter : public Reporter {
public:
    void on_step_start(const std::string& message) override;
    void on_step_finish(const std::string& message) override;
    void on_operation(const std::string& kind, const std::string& package) override;
};

} // namespace strata
