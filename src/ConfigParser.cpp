#include "ConfigParser.h"
#include "Errors.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "yes" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "0" || lowered.empty()) return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + value + "'");
}

// Splits shell words, honouring single and double quotes. A '#' outside
// quotes at the start of a word ends the line.
std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < text.size()) {
                current += text[++i];
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == '#' && !in_word) {
            // Skip to the end of the line.
            while (i < text.size() && text[i] != '\n') ++i;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else if (c == '\\' && i + 1 < text.size()) {
            current += text[++i];
            in_word = true;
        } else {
            current += c;
            in_word = true;
        }
    }
    if (quote != 0) {
        throw ConfigError("Unterminated quote in: " + text);
    }
    if (in_word) words.push_back(current);
    return words;
}

// Position of the first ')' outside quotes, or npos.
size_t find_array_end(const std::string& text) {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == ')') {
            return i;
        }
    }
    return std::string::npos;
}

std::vector<MountSpec> parse_mount_list(const std::vector<std::string>& entries) {
    std::vector<MountSpec> mounts;
    for (const auto& entry : entries) {
        auto spec = ConfigParser::parse_mount_spec(entry);
        if (!spec) {
            throw ConfigError("Invalid mount specification: " + entry);
        }
        mounts.push_back(*spec);
    }
    return mounts;
}

void apply_scalar(const std::string& key, const std::string& value, SessionConfig& config) {
    if (key == "ROOT_DEVICE") {
        config.root_device = value;
    } else if (key == "ROOT_MOUNT") {
        config.root_mount = value;
    } else if (key == "EFI_PART") {
        config.efi_part = value;
    } else if (key == "BOOT_PART") {
        config.boot_part = value;
    } else if (key == "CUSTOM_SHELL") {
        config.custom_shell = value;
    } else if (key == "ENABLE_GUI_SUPPORT") {
        config.gui_enabled = parse_bool(key, value);
    } else if (key == "CHROOT_USER") {
        config.chroot_user = value;
    } else if (key == "VIRTUAL_IMAGE") {
        config.virtual_image = value;
    } else if (key == "LUKS_KEY_FILE") {
        config.luks_key_file = value;
    } else if (key == "COPY_HOST_NETWORK_FILES") {
        config.copy_host_network_files = parse_bool(key, value);
    } else if (key == "ADDITIONAL_MOUNTS") {
        // A scalar assignment holds at most one entry.
        config.additional_mounts = value.empty() ? std::vector<MountSpec>{} : parse_mount_list({value});
    } else {
        CHROOT_LOG_DEBUG("[Config] Ignoring unknown key {}", key);
    }
}

} // namespace

std::optional<MountSpec> ConfigParser::parse_mount_spec(const std::string& triple) {
    static const std::regex pattern("^([^:]+):([^:]+)(:(.+))?$");
    std::smatch match;
    if (!std::regex_match(triple, match, pattern)) {
        return std::nullopt;
    }
    MountSpec spec;
    spec.source = match[1].str();
    spec.target = match[2].str();
    spec.options = match[4].matched ? match[4].str() : "";
    if (spec.target.front() != '/') {
        return std::nullopt;
    }
    return spec;
}

void ConfigParser::parse_json(const std::string& text, SessionConfig& out_config) {
    try {
        json data = json::parse(text);
        if (!data.is_object()) {
            throw ConfigError("JSON config must be an object");
        }

        out_config.root_device = data.value("ROOT_DEVICE", out_config.root_device);
        out_config.root_mount = data.value("ROOT_MOUNT", out_config.root_mount);
        out_config.efi_part = data.value("EFI_PART", out_config.efi_part);
        out_config.boot_part = data.value("BOOT_PART", out_config.boot_part);
        out_config.custom_shell = data.value("CUSTOM_SHELL", out_config.custom_shell);
        out_config.chroot_user = data.value("CHROOT_USER", out_config.chroot_user);
        out_config.virtual_image = data.value("VIRTUAL_IMAGE", out_config.virtual_image);
        out_config.luks_key_file = data.value("LUKS_KEY_FILE", out_config.luks_key_file);
        out_config.gui_enabled = data.value("ENABLE_GUI_SUPPORT", out_config.gui_enabled);
        out_config.copy_host_network_files =
            data.value("COPY_HOST_NETWORK_FILES", out_config.copy_host_network_files);

        if (data.contains("ADDITIONAL_MOUNTS")) {
            out_config.additional_mounts =
                parse_mount_list(data["ADDITIONAL_MOUNTS"].get<std::vector<std::string>>());
        }
    } catch (json::exception& e) {
        throw ConfigError(std::string("Failed to parse JSON config: ") + e.what());
    }
}

void ConfigParser::parse_shell(const std::string& text, SessionConfig& out_config) {
    static const std::regex assignment("^(?:export[ \\t]+)?([A-Za-z_][A-Za-z0-9_]*)=(.*)$");

    std::istringstream stream(text);
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        std::smatch match;
        if (!std::regex_match(trimmed, match, assignment)) {
            throw ConfigError("Line " + std::to_string(line_number) + ": expected KEY=value, got '" + trimmed + "'");
        }
        const std::string key = match[1].str();
        std::string value = match[2].str();

        if (!value.empty() && value[0] == '(') {
            // Arrays may span several lines.
            std::string body = value.substr(1);
            size_t end = find_array_end(body);
            while (end == std::string::npos) {
                std::string next;
                if (!std::getline(stream, next)) {
                    throw ConfigError("Line " + std::to_string(line_number) + ": unterminated array for " + key);
                }
                ++line_number;
                body += "\n" + next;
                end = find_array_end(body);
            }
            const std::vector<std::string> words = split_words(body.substr(0, end));
            if (key == "ADDITIONAL_MOUNTS") {
                out_config.additional_mounts = parse_mount_list(words);
            } else if (words.size() == 1) {
                apply_scalar(key, words[0], out_config);
            } else {
                CHROOT_LOG_DEBUG("[Config] Ignoring array value for {}", key);
            }
            continue;
        }

        const std::vector<std::string> words = split_words(value);
        if (words.size() > 1) {
            throw ConfigError("Line " + std::to_string(line_number) + ": unquoted whitespace in value of " + key);
        }
        apply_scalar(key, words.empty() ? "" : words[0], out_config);
    }
}

void ConfigParser::parse_text(const std::string& text, SessionConfig& out_config) {
    const std::string trimmed = trim(text);
    if (!trimmed.empty() && trimmed[0] == '{') {
        parse_json(trimmed, out_config);
    } else {
        parse_shell(text, out_config);
    }
}

bool ConfigParser::parse_file(const std::string& filepath, SessionConfig& out_config) {
    std::ifstream config_file(filepath);
    if (!config_file.is_open()) {
        CHROOT_LOG_ERROR("[Config] Could not open config file: {}", filepath);
        return false;
    }
    std::stringstream buffer;
    buffer << config_file.rdbuf();

    try {
        parse_text(buffer.str(), out_config);
    } catch (const ConfigError& e) {
        CHROOT_LOG_ERROR("[Config] {}: {}", filepath, e.what());
        return false;
    }
    CHROOT_LOG_DEBUG("[Config] Loaded configuration from {}", filepath);
    return true;
}

bool ConfigParser::validate(const SessionConfig& config) {
    if (config.root_device.empty() && config.virtual_image.empty()) {
        CHROOT_LOG_ERROR("[Config] Validation error: ROOT_DEVICE or VIRTUAL_IMAGE is required");
        return false;
    }
    if (config.root_mount.empty() || config.root_mount[0] != '/') {
        CHROOT_LOG_ERROR("[Config] Validation error: ROOT_MOUNT must be an absolute path, got '{}'",
                         config.root_mount);
        return false;
    }
    if (config.root_mount.find_first_not_of('/') == std::string::npos) {
        CHROOT_LOG_ERROR("[Config] Validation error: ROOT_MOUNT cannot be the host root");
        return false;
    }
    for (const auto& spec : config.additional_mounts) {
        if (spec.target.empty() || spec.target[0] != '/') {
            CHROOT_LOG_ERROR("[Config] Validation error: mount target '{}' must be absolute", spec.target);
            return false;
        }
    }
    return true;
}
