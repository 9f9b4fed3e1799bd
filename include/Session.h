#ifndef SESSION_H
#define SESSION_H

#include "BackingStore.h"
#include "CommandRunner.h"
#include "Config.h"
#include "DeviceResolver.h"
#include "EncryptionLayer.h"
#include "GuiPassthrough.h"
#include "MountBackend.h"
#include "MountStack.h"
#include "ProcessReaper.h"
#include "Prompter.h"
#include "ResourceStack.h"
#include "SessionLauncher.h"
#include "StateManager.h"
#include "Teardown.h"
#include "VolumeActivator.h"
#include <string>
#include <vector>

// Host collaborators and locations a session works against. main() wires
// the real ones; tests pass fakes and scratch directories.
struct HostServices {
    HostServices(CommandRunner& runner, MountBackend& mounts, ShellExecutor& shell, Prompter& prompter,
                 ProcessReaper& reaper)
        : runner(runner), mounts(mounts), shell(shell), prompter(prompter), reaper(reaper) {}

    CommandRunner& runner;
    MountBackend& mounts;
    ShellExecutor& shell;
    Prompter& prompter;
    ProcessReaper& reaper;

    BackingStorePaths backing_paths;
    std::string mapper_dir = "/dev/mapper";
    std::string host_etc = "/etc";
    std::string state_path = "/tmp/chroot-tool.state.json";
    std::string x11_socket_dir = "/tmp/.X11-unix";
    bool stdin_is_tty = false;
};

// What acquisition found on the source, before anything is mounted.
struct SourceLayout {
    std::string root_device;
    FilesystemKind root_kind = FilesystemKind::Unknown;
    std::string efi_candidate; // detected inside an image when EFI_PART is unset
    std::vector<DeviceInfo> linux_partitions;
    std::vector<std::string> encrypted;
    std::vector<LogicalVolume> volumes;
    bool has_lvm_member = false;
};

/**
 * @class Session
 * @brief One complete chroot session: acquire, run the shell, tear down.
 *
 * Every resource is recorded on the session's ResourceStack as soon as it
 * exists, and teardown runs on every exit path of run(), including an
 * exception or an interrupting signal.
 */
class Session {
public:
    Session(const SessionConfig& config, HostServices& host);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Runs the whole session.
     * @return 0 on a clean run, 1 if acquisition failed (after teardown),
     * 2 if teardown left resources that need manual attention.
     */
    int run();

    // Acquisition phase only; throws ChrootError. Exposed for tests.
    void acquire();

    // Releases everything acquired so far. Safe to call more than once.
    std::vector<std::string> finish();

    const ResourceStack& resources() const { return stack_; }

    // Throws MissingToolError for a required tool of the source mode that
    // is missing from PATH; missing optional tools are one warning.
    void check_requirements();

    // Whether device should be mounted in the given role ("root", "boot",
    // "EFI"). Refusals of the root throw MountError.
    bool validate_filesystem(const std::string& device, FilesystemKind kind, const std::string& role);

private:
    void checkpoint();
    void update_state(const std::string& status);

    SourceLayout inspect_image();
    SourceLayout inspect_physical();
    void release_host_mount(const std::string& device);
    void unlock_encrypted(SourceLayout& layout);
    void activate_volumes(SourceLayout& layout);
    void choose_root(SourceLayout& layout);
    void mount_tree(const SourceLayout& layout);

    void require_tools(const std::vector<std::string>& tools);
    LaunchPlan prepare_launch();
    void print_banner(const LaunchPlan& plan) const;
    void report_residual(const std::vector<std::string>& failures) const;

    const SessionConfig config_;
    HostServices& host_;

    ResourceStack stack_;
    DeviceResolver resolver_;
    BackingStore backing_;
    EncryptionLayer encryption_;
    VolumeActivator volumes_;
    MountStack mounts_;
    GuiPassthrough gui_;
    Teardown teardown_;
    StateManager state_;
    SessionLauncher launcher_;

    bool state_claimed_ = false;
    std::string root_device_;
    std::vector<std::string> teardown_failures_;
};

#endif // SESSION_H
