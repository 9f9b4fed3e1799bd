#ifndef INTERACTIVE_SETUP_H
#define INTERACTIVE_SETUP_H

#include "Config.h"
#include "DeviceResolver.h"
#include "Prompter.h"
#include <optional>
#include <string>

// Builds a SessionConfig by questioning the operator when no config file
// was given and prompts are allowed.
class InteractiveSetup {
public:
    InteractiveSetup(Prompter& prompter, DeviceResolver& resolver,
                     std::string efi_firmware_dir = "/sys/firmware/efi");

    // Returns false if the operator cancelled a mandatory question.
    bool run(SessionConfig& config, const std::string& default_user);

    // Device path picked from the candidate list; std::nullopt on cancel or skip.
    std::optional<std::string> select_device(const std::string& role, bool allow_skip);

private:
    Prompter& prompter_;
    DeviceResolver& resolver_;
    std::string efi_firmware_dir_;
};

#endif // INTERACTIVE_SETUP_H
