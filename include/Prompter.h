#ifndef PROMPTER_H
#define PROMPTER_H

#include <optional>
#include <string>
#include <vector>

/**
 * @class Prompter
 * @brief The operator-facing question surface used in interactive mode.
 *
 * Quiet runs never construct a prompt; tests substitute a scripted one.
 */
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual bool confirm(const std::string& question, bool default_yes) = 0;

    // Free text; an empty answer yields default_value.
    virtual std::string ask(const std::string& question, const std::string& default_value) = 0;

    // Input without echo. std::nullopt when the operator cancels or no
    // terminal is attached.
    virtual std::optional<std::string> ask_secret(const std::string& prompt) = 0;

    // Index into options, or std::nullopt when cancelled.
    virtual std::optional<size_t> choose(const std::string& title, const std::vector<std::string>& options) = 0;

    virtual void pause(const std::string& message) = 0;
};

class ConsolePrompter : public Prompter {
public:
    bool confirm(const std::string& question, bool default_yes) override;
    std::string ask(const std::string& question, const std::string& default_value) override;
    std::optional<std::string> ask_secret(const std::string& prompt) override;
    std::optional<size_t> choose(const std::string& title, const std::vector<std::string>& options) override;
    void pause(const std::string& message) override;
};

#endif // PROMPTER_H
