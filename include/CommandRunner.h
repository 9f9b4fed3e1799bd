#ifndef COMMAND_RUNNER_H
#define COMMAND_RUNNER_H

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

/**
 * @class CommandRunner
 * @brief Runs the host tools the orchestrator drives (qemu-nbd, cryptsetup,
 * lvm, fuser, ...). Tests substitute a scripted implementation.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs argv[0] (looked up on PATH) and waits for it.
     * @param argv Program and arguments.
     * @param stdin_data Bytes written to the child's standard input.
     * @return Exit code and captured output. exit_code is -1 if no child could be
     * created, 127 if exec failed, 128+N if it was killed by signal N.
     */
    virtual CommandResult run(const std::vector<std::string>& argv,
                              const std::string& stdin_data = "") = 0;

    // True if the named tool is an executable on PATH.
    virtual bool has_tool(const std::string& name) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv,
                      const std::string& stdin_data = "") override;
    bool has_tool(const std::string& name) override;
};

// Joins argv into one printable line for logs.
std::string format_command(const std::vector<std::string>& argv);

#endif // COMMAND_RUNNER_H
