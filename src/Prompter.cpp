#include "Prompter.h"
#include "Logger.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {

// Restores the terminal mode on every exit path.
class TermiosGuard {
public:
    TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state) {}
    ~TermiosGuard() {
        if (tcsetattr(fd_, TCSAFLUSH, &state_) != 0) {
            CHROOT_LOG_WARN("[Prompt] Could not restore terminal echo: {}", strerror(errno));
        }
    }

private:
    int fd_;
    termios state_;
};

bool read_line(std::string& line) {
    if (!std::getline(std::cin, line)) {
        std::cin.clear();
        return false;
    }
    return true;
}

} // namespace

bool ConsolePrompter::confirm(const std::string& question, bool default_yes) {
    for (;;) {
        std::cout << question << (default_yes ? " [Y/n] " : " [y/N] ") << std::flush;
        std::string answer;
        if (!read_line(answer)) {
            std::cout << std::endl;
            return default_yes;
        }
        if (answer.empty()) return default_yes;
        if (answer == "y" || answer == "Y" || answer == "yes") return true;
        if (answer == "n" || answer == "N" || answer == "no") return false;
        std::cout << "Please answer y or n." << std::endl;
    }
}

std::string ConsolePrompter::ask(const std::string& question, const std::string& default_value) {
    std::cout << question;
    if (!default_value.empty()) {
        std::cout << " [" << default_value << "]";
    }
    std::cout << ": " << std::flush;
    std::string answer;
    if (!read_line(answer) || answer.empty()) {
        return default_value;
    }
    return answer;
}

std::optional<std::string> ConsolePrompter::ask_secret(const std::string& prompt) {
    if (!isatty(STDIN_FILENO)) {
        CHROOT_LOG_WARN("[Prompt] Secret input requires a terminal");
        return std::nullopt;
    }
    termios original{};
    if (tcgetattr(STDIN_FILENO, &original) != 0) {
        CHROOT_LOG_WARN("[Prompt] Cannot query terminal mode: {}", strerror(errno));
        return std::nullopt;
    }

    std::string secret;
    bool received = false;
    {
        TermiosGuard guard(STDIN_FILENO, original);
        termios silent = original;
        silent.c_lflag &= ~ECHO;
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
            CHROOT_LOG_WARN("[Prompt] Cannot disable terminal echo: {}", strerror(errno));
            return std::nullopt;
        }
        std::cout << prompt << std::flush;
        received = read_line(secret);
    }
    std::cout << std::endl;
    if (!received) {
        return std::nullopt;
    }
    return secret;
}

std::optional<size_t> ConsolePrompter::choose(const std::string& title, const std::vector<std::string>& options) {
    if (options.empty()) {
        return std::nullopt;
    }
    std::cout << title << std::endl;
    for (size_t i = 0; i < options.size(); ++i) {
        std::cout << "  " << (i + 1) << ") " << options[i] << std::endl;
    }
    for (;;) {
        std::cout << "Select 1-" << options.size() << " (empty to cancel): " << std::flush;
        std::string answer;
        if (!read_line(answer) || answer.empty()) {
            return std::nullopt;
        }
        try {
            const unsigned long choice = std::stoul(answer);
            if (choice >= 1 && choice <= options.size()) {
                return static_cast<size_t>(choice - 1);
            }
        } catch (const std::exception&) {
            // Not a number; ask again.
        }
        std::cout << "Invalid selection." << std::endl;
    }
}

void ConsolePrompter::pause(const std::string& message) {
    std::cout << message << std::flush;
    std::string ignored;
    if (!read_line(ignored)) {
        std::cout << std::endl;
    }
}
