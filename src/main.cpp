#include "Config.h"
#include "ConfigParser.h"
#include "InteractiveSetup.h"
#include "Logger.h"
#include "MountBackend.h"
#include "Privileges.h"
#include "Prompter.h"
#include "Session.h"
#include "Signals.h"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pwd.h>
#include <signal.h>
#include <string>
#include <unistd.h>

struct CliOptions {
    std::string config_path;
    std::string virtual_image;
    bool quiet = false;
    bool debug = false;
    bool help = false;
};

void print_usage(const char* prog_name, std::ostream& out);
bool parse_cli(int argc, char* argv[], CliOptions& options);
std::string invoking_user();
void log_configuration(const SessionConfig& config);

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parse_cli(argc, argv, options)) {
        print_usage(argv[0], std::cerr);
        return 1;
    }
    if (options.help) {
        print_usage(argv[0], std::cout);
        return 0;
    }

    // A closed terminal must not kill us halfway through teardown.
    signal(SIGPIPE, SIG_IGN);

    if (!Logger::instance().init(Logger::default_log_path(getpid()), options.debug)) {
        std::cerr << "Warning: continuing with logging on standard error only" << std::endl;
    }
    CHROOT_LOG_INFO("[Main] Starting chroot-tool (PID {})", getpid());
    CHROOT_LOG_DEBUG("[Main] Session log: {}", Logger::instance().log_path());

    const auto missing = Privileges::CapabilityManager::missing_required();
    if (!missing.empty()) {
        for (auto cap : missing) {
            CHROOT_LOG_ERROR("[Main] Missing capability {}", Privileges::to_string(cap));
        }
        CHROOT_LOG_ERROR("[Main] This tool must run as root (try sudo)");
        return 1;
    }

    SessionConfig config;
    config.quiet = options.quiet;
    config.debug = options.debug;

    if (!options.config_path.empty()) {
        if (!std::filesystem::exists(options.config_path)) {
            CHROOT_LOG_ERROR("[Main] Configuration file not found: {}", options.config_path);
            return 1;
        }
        if (!ConfigParser::parse_file(options.config_path, config)) {
            return 1;
        }
    }
    if (!options.virtual_image.empty()) {
        config.virtual_image = options.virtual_image;
        config.root_device.clear();
    }

    ProcessCommandRunner runner;
    ConsolePrompter prompter;

    if (options.config_path.empty() && options.virtual_image.empty() && !options.quiet) {
        DeviceResolver resolver(runner);
        InteractiveSetup setup(prompter, resolver);
        if (!setup.run(config, invoking_user())) {
            CHROOT_LOG_ERROR("[Main] Interactive setup failed");
            return 1;
        }
    }

    if (!ConfigParser::validate(config)) {
        return 1;
    }
    log_configuration(config);

    SignalGuard signals;
    SyscallMountBackend backend;
    ChrootShellExecutor shell;
    ProcessReaper reaper(runner, config.timings);

    HostServices host(runner, backend, shell, prompter, reaper);
    host.stdin_is_tty = isatty(STDIN_FILENO) != 0;

    int exit_code = 0;
    {
        Session session(config, host);
        exit_code = session.run();
    }
    CHROOT_LOG_INFO("[Main] Exiting with status {}", exit_code);
    return exit_code;
}

bool parse_cli(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file argument." << std::endl;
                return false;
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--virtual") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an image path." << std::endl;
                return false;
            }
            options.virtual_image = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'" << std::endl;
            return false;
        }
    }
    return true;
}

// The user behind sudo, offered as the default chroot user.
std::string invoking_user() {
    if (const char* sudo_user = std::getenv("SUDO_USER")) {
        return sudo_user;
    }
    struct passwd* pw = getpwuid(getuid());
    return pw != nullptr ? pw->pw_name : "root";
}

void log_configuration(const SessionConfig& config) {
    CHROOT_LOG_INFO("[Main] === Configuration Summary ===");
    if (config.image_mode()) {
        CHROOT_LOG_INFO("[Main]   VIRTUAL_IMAGE: {}", config.virtual_image);
    } else {
        CHROOT_LOG_INFO("[Main]   ROOT_DEVICE: {}", config.root_device);
    }
    CHROOT_LOG_INFO("[Main]   ROOT_MOUNT: {}", config.root_mount);
    CHROOT_LOG_INFO("[Main]   EFI_PART: {}", config.efi_part.empty() ? "none" : config.efi_part);
    CHROOT_LOG_INFO("[Main]   BOOT_PART: {}", config.boot_part.empty() ? "none" : config.boot_part);
    CHROOT_LOG_INFO("[Main]   GUI_SUPPORT: {}", config.gui_enabled);
    CHROOT_LOG_INFO("[Main]   CHROOT_USER: {}", config.chroot_user.empty() ? "root" : config.chroot_user);
    CHROOT_LOG_INFO("[Main]   ADDITIONAL_MOUNTS: {} configured", config.additional_mounts.size());
}

void print_usage(const char* prog_name, std::ostream& out) {
    out << "Usage: " << prog_name << " [options]" << std::endl;
    out << "Mounts an installed Linux system (disk, partition or disk image) and opens a shell inside it."
        << std::endl;
    out << "\nOptions:" << std::endl;
    out << "  -c, --config <file>   Configuration file (JSON or KEY=value)" << std::endl;
    out << "  -v, --virtual <image> Disk image to attach instead of a block device" << std::endl;
    out << "  -q, --quiet           No prompts; use configuration values only" << std::endl;
    out << "  -d, --debug           Echo debug messages to standard error" << std::endl;
    out << "  -h, --help            Show this help" << std::endl;
    out << "\nConfiguration keys:" << std::endl;
    out << "  ROOT_DEVICE, ROOT_MOUNT, EFI_PART, BOOT_PART, ADDITIONAL_MOUNTS, CUSTOM_SHELL," << std::endl;
    out << "  ENABLE_GUI_SUPPORT, CHROOT_USER, VIRTUAL_IMAGE, LUKS_KEY_FILE, COPY_HOST_NETWORK_FILES" << std::endl;
    out << "\nExit status: 0 clean, 1 setup failed, 2 cleanup needs manual attention." << std::endl;
}
