#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from get_config_path()
    static Result<Config> load();

    static Result<Config> load(const fs::path& path);

    // Parse an already-read YAML document
    static Result<Config> parse(const std::string& yaml_text);

    // Write back as YAML (comments from a hand-edited file are not kept)
    Result<void> save(const fs::path& path) const;

    // Accessors
    const std::optional<ConnectionDescriptor>& connection() const { return connection_; }
    const SshSettings& settings() const { return settings_; }
    const std::vector<SSHFileMapping>& mappings() const { return mappings_; }

    // Mappings whose module matches, in file order
    std::vector<SSHFileMapping> mappings_for(const std::string& module) const;

    void set_connection(const ConnectionDescriptor& conn) { connection_ = conn; }
    void set_settings(const SshSettings& settings) { settings_ = settings; }
    void add_mapping(const SSHFileMapping& mapping) { mappings_.push_back(mapping); }

public:
    Config() = default;

private:
    std::optional<ConnectionDescriptor> connection_;
    SshSettings settings_;
    std::vector<SSHFileMapping> mappings_;
};

// SSHMIRROR_CONFIG, else ~/.sshmirror/config.yaml
fs::path get_config_path();

bool config_exists();

// Leading "~" to the home directory; anything else unchanged
std::string expand_home(const std::string& path);

// Write a commented template. An existing file is left alone.
Result<void> create_default_config();
Result<void> create_default_config(const fs::path& path);
