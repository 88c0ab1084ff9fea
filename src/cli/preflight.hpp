#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // hints are printed but never block
};

// Checks the config at get_config_path(). Empty means ready to connect.
std::vector<PreflightIssue> run_preflight_checks();

// Missing or unparseable file, no connection block, then check_connection()
std::vector<PreflightIssue> check_config_file(const std::filesystem::path& path);

// Descriptor validity, tool availability, and what the auth method needs
std::vector<PreflightIssue> check_connection(const ConnectionDescriptor& conn,
                                             const SshSettings& settings);

// True if program is a path to an existing file or is found on PATH
bool program_available(const std::string& program);
