#include "Errors.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>
#include <utility>

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* to_string(MountFailureReason reason) {
    switch (reason) {
    case MountFailureReason::WrongFsType:
        return "wrong-fs-type";
    case MountFailureReason::Busy:
        return "busy";
    case MountFailureReason::PermissionDenied:
        return "permission-denied";
    case MountFailureReason::Unknown:
        return "unknown";
    }
    return "unknown";
}

MountFailureReason classify_mount_failure(const std::string& error_text) {
    const std::string text = lowercase(error_text);
    if (contains_any(text, {"wrong fs type", "unknown filesystem", "bad superblock",
                            "invalid argument", "no such device"})) {
        return MountFailureReason::WrongFsType;
    }
    if (contains_any(text, {"busy", "already mounted"})) {
        return MountFailureReason::Busy;
    }
    if (contains_any(text, {"permission denied", "operation not permitted", "read-only file system"})) {
        return MountFailureReason::PermissionDenied;
    }
    return MountFailureReason::Unknown;
}

std::string mount_failure_hint(MountFailureReason reason) {
    switch (reason) {
    case MountFailureReason::WrongFsType:
        return "the filesystem type is wrong or the partition is damaged; check it with blkid or fsck";
    case MountFailureReason::Busy:
        return "the target or device is busy; check with fuser -m or lsof";
    case MountFailureReason::PermissionDenied:
        return "permission denied; run as root and check that the device is not read-only";
    case MountFailureReason::Unknown:
        return "see the session log for the underlying error";
    }
    return "";
}

MountError::MountError(const std::string& source, const std::string& target,
                       MountFailureReason reason, const std::string& detail)
    : ChrootError("Failed to mount " + source + " on " + target + " (" + to_string(reason) +
                  "): " + detail + "; hint: " + mount_failure_hint(reason)),
      source_(source),
      target_(target),
      reason_(reason) {}

InterruptedError::InterruptedError(int signal_number)
    : ChrootError(std::string("Interrupted by signal ") + strsignal(signal_number)),
      signal_number_(signal_number) {}

TeardownPartialFailure::TeardownPartialFailure(std::vector<std::string> failures)
    : ChrootError("Teardown left " + std::to_string(failures.size()) +
                  " resource(s) that need manual attention"),
      failures_(std::move(failures)) {}
