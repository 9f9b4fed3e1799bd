#include "GuiPassthrough.h"
#include "Logger.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string env_value(const char* name) {
    const char* value = getenv(name);
    return value != nullptr ? value : "";
}

// Home of the user who ran sudo, not root's.
std::string get_real_home_dir() {
    const std::string sudo_user = env_value("SUDO_USER");
    if (!sudo_user.empty()) {
        struct passwd* pw = getpwnam(sudo_user.c_str());
        if (pw != nullptr) return std::string(pw->pw_dir);
    }
    return env_value("HOME");
}

} // namespace

HostDisplay HostDisplay::capture() {
    HostDisplay host;
    host.display = env_value("DISPLAY");
    host.xauthority = env_value("XAUTHORITY");
    if (host.xauthority.empty()) {
        const std::string home = get_real_home_dir();
        if (!home.empty()) {
            host.xauthority = home + "/.Xauthority";
        }
    }
    host.has_runtime_dir = !env_value("XDG_RUNTIME_DIR").empty();
    host.invoking_uid = getuid();
    const std::string sudo_uid = env_value("SUDO_UID");
    if (!sudo_uid.empty()) {
        try {
            host.invoking_uid = static_cast<uid_t>(std::stoul(sudo_uid));
        } catch (const std::exception&) {
            CHROOT_LOG_DEBUG("[GUI] Ignoring malformed SUDO_UID '{}'", sudo_uid);
        }
    }
    return host;
}

GuiPassthrough::GuiPassthrough(CommandRunner& runner, std::string x11_socket_dir)
    : runner_(runner), x11_socket_dir_(std::move(x11_socket_dir)) {}

bool GuiPassthrough::setup(const std::string& root, const UserAccount& account, const HostDisplay& host) {
    CHROOT_LOG_INFO("[GUI] Setting up graphical support (X11) - EXPERIMENTAL");
    CHROOT_LOG_WARN("[GUI] GUI support is experimental and relaxes host display access control");

    if (host.display.empty()) {
        CHROOT_LOG_WARN("[GUI] DISPLAY not set, X11 support will not work");
        return false;
    }

    std::error_code ec;
    if (fs::is_directory(x11_socket_dir_, ec)) {
        fs::permissions(x11_socket_dir_, fs::perms::all | fs::perms::sticky_bit, fs::perm_options::replace, ec);
        if (ec) {
            CHROOT_LOG_WARN("[GUI] Failed to set permissions on {}: {}", x11_socket_dir_, ec.message());
        }
    } else {
        CHROOT_LOG_WARN("[GUI] {} does not exist on host", x11_socket_dir_);
    }

    const std::string cookie_target = (fs::path(root) / fs::path(account.home).relative_path() / ".Xauthority").string();
    if (!host.xauthority.empty() && fs::is_regular_file(host.xauthority, ec)) {
        CHROOT_LOG_INFO("[GUI] Copying Xauthority file to {}", cookie_target);
        fs::copy_file(host.xauthority, cookie_target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            CHROOT_LOG_WARN("[GUI] Failed to copy X authority for {}: {}", account.name, ec.message());
        } else {
            copied_cookie_ = cookie_target;
            if (chown(cookie_target.c_str(), account.uid, account.gid) != 0 ||
                chmod(cookie_target.c_str(), 0600) != 0) {
                CHROOT_LOG_WARN("[GUI] Failed to set ownership of {}: {}", cookie_target, strerror(errno));
            }
        }
    } else {
        CHROOT_LOG_WARN("[GUI] Xauthority file not found at {}; X11 authentication may fail", host.xauthority);
    }

    if (runner_.has_tool("xhost")) {
        CHROOT_LOG_INFO("[GUI] Configuring xhost for local access");
        CommandResult result = runner_.run({"xhost", "+local:"});
        if (result.ok()) {
            xhost_opened_ = true;
        } else {
            CHROOT_LOG_WARN("[GUI] Failed to configure xhost: {}", result.err);
        }
    } else {
        CHROOT_LOG_WARN("[GUI] xhost not found, X11 authentication may fail");
    }

    environment_.clear();
    environment_.push_back("DISPLAY=" + host.display);
    if (host.has_runtime_dir) {
        environment_.push_back("XDG_RUNTIME_DIR=/run/user/" + std::to_string(host.invoking_uid));
    }
    if (!copied_cookie_.empty()) {
        environment_.push_back("XAUTHORITY=" + (fs::path(account.home) / ".Xauthority").string());
    }

    active_ = true;
    CHROOT_LOG_INFO("[GUI] Graphical support setup complete (experimental mode)");
    return true;
}

bool GuiPassthrough::revert() {
    if (!active_) {
        return true;
    }
    CHROOT_LOG_INFO("[GUI] Cleaning up GUI support remnants");
    bool success = true;

    if (!copied_cookie_.empty()) {
        std::error_code ec;
        fs::remove(copied_cookie_, ec);
        if (ec) {
            CHROOT_LOG_WARN("[GUI] Could not remove {}: {}", copied_cookie_, ec.message());
            success = false;
        }
        copied_cookie_.clear();
    }

    if (xhost_opened_) {
        CommandResult result = runner_.run({"xhost", "-local:"});
        if (!result.ok()) {
            CHROOT_LOG_WARN("[GUI] Failed to reset xhost settings: {}", result.err);
            success = false;
        }
        xhost_opened_ = false;
    }

    active_ = false;
    environment_.clear();
    CHROOT_LOG_INFO("[GUI] GUI cleanup complete");
    return success;
}
