#include "key_file.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

// Create a new file holding data. On POSIX it is 0600 from the moment it
// exists. EEXIST counts as success: another writer produced the same key.
static Result<void> write_private_file(const fs::path& path, const std::string& data) {
#ifdef _WIN32
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Result<void>::Err("cannot open for writing");
    out << data;
    if (!out) return Result<void>::Err("write failed");
    return Result<void>::Ok();
#else
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        if (errno == EEXIST) return Result<void>::Ok();
        return Result<void>::Err(std::strerror(errno));
    }

    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            close(fd);
            unlink(path.c_str());
            return Result<void>::Err(err);
        }
        done += static_cast<size_t>(n);
    }
    if (close(fd) != 0) {
        std::string err = std::strerror(errno);
        unlink(path.c_str());
        return Result<void>::Err(err);
    }
    return Result<void>::Ok();
#endif
}

KeyFileStore::KeyFileStore(fs::path app_data_dir)
    : app_data_dir_(std::move(app_data_dir)) {
}

bool KeyFileStore::is_private_key_content(const std::string& value) {
    return starts_with(trimmed(value), "-----BEGIN");
}

std::string KeyFileStore::md5_hex(const std::string& content) {
    std::string data = trimmed(content);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return "";
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

Result<fs::path> KeyFileStore::key_dir() const {
    fs::path dir = app_data_dir_ / KEY_DIR_NAME;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Result<fs::path>::Err(
                fmt::format("Failed to create .ssh directory: {}", ec.message()));
        }
    }
    return Result<fs::path>::Ok(dir);
}

Result<std::string> KeyFileStore::ensure_key_file(const std::string& content) const {
    auto dir = key_dir();
    if (dir.is_err()) return Result<std::string>::Err(dir.error);

    std::string hash = md5_hex(content);
    if (hash.empty()) {
        return Result<std::string>::Err("Failed to hash private key content");
    }
    fs::path file_path = dir.value / hash;

    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        // OpenSSH rejects key files that lack a trailing newline on some versions
        auto written = write_private_file(file_path, trimmed(content) + "\n");
        if (written.is_err()) {
            return Result<std::string>::Err(
                fmt::format("Failed to write key file {}: {}", file_path.string(), written.error));
        }

        // ssh refuses keys readable by group/other
        fs::permissions(file_path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            log_warn(fmt::format("Could not restrict key file permissions {}: {}",
                                 file_path.string(), ec.message()));
        }
        log_info(fmt::format("SSH key file created: {}", file_path.string()));
    }

    return Result<std::string>::Ok(file_path.string());
}

void KeyFileStore::remove_key_file(const std::string& content) const {
    if (trimmed(content).empty()) return;

    auto dir = key_dir();
    if (dir.is_err()) return;

    fs::path file_path = dir.value / md5_hex(content);
    std::error_code ec;
    if (fs::exists(file_path, ec) && fs::remove(file_path, ec)) {
        log_info(fmt::format("SSH key file removed: {}", file_path.string()));
    }
}

Result<std::string> KeyFileStore::resolve_key_path(const std::string& private_key_path,
                                                   const std::string& private_key_content) const {
    if (!trimmed(private_key_content).empty() && is_private_key_content(private_key_content)) {
        return ensure_key_file(private_key_content);
    }
    return Result<std::string>::Ok(private_key_path);
}
