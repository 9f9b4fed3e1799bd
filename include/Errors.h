#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

// Base class of every error that aborts the acquisition phase. Whatever
// was acquired before the throw is released by the session's teardown.
class ChrootError : public std::runtime_error {
public:
    explicit ChrootError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public ChrootError {
public:
    explicit ConfigError(const std::string& what) : ChrootError(what) {}
};

class DeviceNotFoundError : public ChrootError {
public:
    explicit DeviceNotFoundError(const std::string& device)
        : ChrootError("Device not found: " + device), device_(device) {}
    const std::string& device() const { return device_; }

private:
    std::string device_;
};

// A host tool needed by the current step is not on PATH.
class MissingToolError : public ChrootError {
public:
    explicit MissingToolError(const std::string& tool)
        : ChrootError("Required tool not found: " + tool), tool_(tool) {}
    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

class BackingStoreError : public ChrootError {
public:
    explicit BackingStoreError(const std::string& what) : ChrootError(what) {}
};

class EncryptionError : public ChrootError {
public:
    EncryptionError(const std::string& partition, const std::string& what)
        : ChrootError(what), partition_(partition) {}
    const std::string& partition() const { return partition_; }

private:
    std::string partition_;
};

class NoRootCandidateError : public ChrootError {
public:
    explicit NoRootCandidateError(const std::string& what) : ChrootError(what) {}
};

enum class MountFailureReason {
    WrongFsType,
    Busy,
    PermissionDenied,
    Unknown,
};

const char* to_string(MountFailureReason reason);

// Maps the error text reported by mount(2) or mount(8) onto a reason.
MountFailureReason classify_mount_failure(const std::string& error_text);

// A short operator hint for each reason.
std::string mount_failure_hint(MountFailureReason reason);

class MountError : public ChrootError {
public:
    MountError(const std::string& source, const std::string& target,
               MountFailureReason reason, const std::string& detail);

    const std::string& source() const { return source_; }
    const std::string& target() const { return target_; }
    MountFailureReason reason() const { return reason_; }

private:
    std::string source_;
    std::string target_;
    MountFailureReason reason_;
};

class ShellNotFoundError : public ChrootError {
public:
    explicit ShellNotFoundError(const std::string& what) : ChrootError(what) {}
};

class UserNotFoundInTargetError : public ChrootError {
public:
    UserNotFoundInTargetError(const std::string& user, const std::string& what)
        : ChrootError(what), user_(user) {}
    const std::string& user() const { return user_; }

private:
    std::string user_;
};

class InterruptedError : public ChrootError {
public:
    explicit InterruptedError(int signal_number);
    int signal_number() const { return signal_number_; }

private:
    int signal_number_;
};

class TeardownPartialFailure : public ChrootError {
public:
    explicit TeardownPartialFailure(std::vector<std::string> failures);
    const std::vector<std::string>& failures() const { return failures_; }

private:
    std::vector<std::string> failures_;
};

#endif // ERRORS_H
