#pragma once

#include <optional>
#include <string>

namespace strata {

// Yes/no confirmation. nullopt means nobody could be asked.
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual std::optional<bool> confirm(const std::string& message, bool default_answer) = 0;
};

// Asks on stderr and reads stdin. Answers nullopt when stdin is not a
// terminal or when interaction was disabled.
class TerminalPrompter : public Prompter {
public:
    explicit TerminalPrompter(bool interactive = true) : interactive_(interactive) {}

    std::optional<bool> confirm(const std::string& message, bool default_answer) override;

private:
    bool interactive_;
};

} // namespace strata
