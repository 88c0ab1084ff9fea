#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Private keys pasted as text are materialized under <app_data>/.ssh/<md5>,
// keyed by the trimmed content so the same key always lands at the same path.
class KeyFileStore {
public:
    explicit KeyFileStore(fs::path app_data_dir);

    // True if the trimmed value starts with a PEM header.
    static bool is_private_key_content(const std::string& value);

    // Lowercase hex MD5 of the trimmed content.
    static std::string md5_hex(const std::string& content);

    // <app_data>/.ssh, created on demand.
    Result<fs::path> key_dir() const;

    // Write the key (0600) unless it already exists. Returns its path.
    Result<std::string> ensure_key_file(const std::string& content) const;

    // Best-effort delete of the file materialized for `content`.
    void remove_key_file(const std::string& content) const;

    // Pasted PEM content wins; otherwise the user-supplied path is returned unchanged.
    Result<std::string> resolve_key_path(const std::string& private_key_path,
                                         const std::string& private_key_content) const;

    const fs::path& app_data_dir() const { return app_data_dir_; }

private:
    fs::path app_data_dir_;
};
