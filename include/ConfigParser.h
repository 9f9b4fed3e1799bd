#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "Config.h"
#include <optional>
#include <string>

class ConfigParser {
public:
    // Reads a JSON or KEY=value config file into out_config. Keys absent
    // from the file keep their current values. Errors are logged.
    static bool parse_file(const std::string& filepath, SessionConfig& out_config);

    // Content starting with '{' is JSON, anything else the shell format.
    // Throws ConfigError on malformed input.
    static void parse_text(const std::string& text, SessionConfig& out_config);

    // "source:target[:options]"; std::nullopt when malformed.
    static std::optional<MountSpec> parse_mount_spec(const std::string& triple);

    static bool validate(const SessionConfig& config);

private:
    static void parse_json(const std::string& text, SessionConfig& out_config);
    static void parse_shell(const std::string& text, SessionConfig& out_config);
};

#endif // CONFIG_PARSER_H
