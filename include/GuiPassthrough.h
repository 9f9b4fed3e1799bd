#ifndef GUI_PASSTHROUGH_H
#define GUI_PASSTHROUGH_H

#include "CommandRunner.h"
#include "SessionLauncher.h"
#include <string>
#include <sys/types.h>
#include <vector>

// X11 state of the invoking user on the host.
struct HostDisplay {
    std::string display;        // $DISPLAY
    std::string xauthority;     // cookie file to copy
    bool has_runtime_dir = false;
    uid_t invoking_uid = 0;

    // Reads DISPLAY, XAUTHORITY, XDG_RUNTIME_DIR and SUDO_USER/SUDO_UID.
    static HostDisplay capture();
};

/**
 * @class GuiPassthrough
 * @brief Experimental X11 forwarding into the chroot.
 *
 * setup() copies the X authority cookie into the target user's home,
 * opens the display to local clients with xhost and computes the variables
 * to forward. revert() undoes the host-side changes and must run before
 * the root filesystem is unmounted.
 */
class GuiPassthrough {
public:
    explicit GuiPassthrough(CommandRunner& runner, std::string x11_socket_dir = "/tmp/.X11-unix");

    // false leaves the session running without GUI support.
    bool setup(const std::string& root, const UserAccount& account, const HostDisplay& host);

    // Idempotent; false if some host change could not be undone.
    bool revert();

    bool active() const { return active_; }

    // DISPLAY and XDG_RUNTIME_DIR entries for the chroot environment.
    const std::vector<std::string>& environment() const { return environment_; }

private:
    CommandRunner& runner_;
    std::string x11_socket_dir_;
    bool active_ = false;
    bool xhost_opened_ = false;
    std::string copied_cookie_;
    std::vector<std::string> environment_;
};

#endif // GUI_PASSTHROUGH_H
