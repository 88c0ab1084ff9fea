#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_config_path() {
    auto override_path = platform::get_env("SSHMIRROR_CONFIG");
    if (override_path && !override_path->empty()) {
        return fs::path(expand_home(*override_path));
    }
    return platform::home_dir() / APP_DIR_NAME / CONFIG_FILE;
}

bool config_exists() {
    std::error_code ec;
    return fs::exists(get_config_path(), ec);
}

std::string expand_home(const std::string& path) {
    if (path != "~" && !starts_with(path, "~/")) return path;
    auto home = platform::find_home_dir();
    if (!home) return path;
    return home->string() + path.substr(1);
}

Result<void> create_default_config() {
    return create_default_config(get_config_path());
}

Result<void> create_default_config(const fs::path& config_path) {
    std::error_code ec;

    // Don't overwrite existing config
    if (fs::exists(config_path, ec)) {
        return Result<void>::Ok();
    }

    if (config_path.has_parent_path()) {
        fs::create_directories(config_path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("Failed to create {}: {}",
                                                 config_path.parent_path().string(), ec.message()));
        }
    }

    const char* default_config = R"(# sshmirror configuration
# One remote host, reached through a shared OpenSSH ControlMaster.

connection:
  id: "default"
  host: ""
  port: 22
  username: ""
  auth_method: "key"               # key | password
  password: ""                     # password auth needs sshpass installed
  private_key_path: "~/.ssh/id_ed25519"
  private_key_content: ""          # pasted PEM text, wins over private_key_path
  passphrase: ""

# Optional: subprocess tuning
settings:
  ssh_program: "ssh"
  scp_program: "scp"
  sshpass_program: "sshpass"
  connect_timeout: 10
  keepalive_interval: 30
  keepalive_count_max: 3
  check_timeout: 15
  min_reconnect_interval_secs: 0   # 0 = reconnect on every call that finds the master gone
  app_data_dir: "~/.sshmirror"

# Files to push. Missing local sources are skipped, not errors.
mappings: []
#  - name: "claude-settings"
#    module: "claude"
#    local_path: "~/.claude/settings.json"
#    remote_path: "~/.claude/settings.json"
#  - name: "claude-agents"
#    module: "claude"
#    local_path: "~/.claude/agents"
#    remote_path: "~/.claude/agents"
#    is_directory: true
#  - name: "claude-commands"
#    module: "claude"
#    local_path: "~/.claude/commands/*.md"
#    remote_path: "~/.claude/commands"
#    is_pattern: true
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Parsing ────────────────────────────────────────────────

static Result<ConnectionDescriptor> parse_connection(const YAML::Node& node) {
    ConnectionDescriptor conn;
    conn.id = node["id"].as<std::string>("default");
    conn.host = node["host"].as<std::string>("");
    conn.port = node["port"].as<int>(22);
    conn.username = node["username"].as<std::string>("");
    conn.password = node["password"].as<std::string>("");
    conn.private_key_path = expand_home(node["private_key_path"].as<std::string>(""));
    conn.private_key_content = node["private_key_content"].as<std::string>("");
    conn.passphrase = node["passphrase"].as<std::string>("");

    auto method = parse_auth_method(node["auth_method"].as<std::string>("key"));
    if (method.is_err()) return Result<ConnectionDescriptor>::Err(method.error);
    conn.auth_method = method.value;

    return Result<ConnectionDescriptor>::Ok(conn);
}

static SshSettings parse_settings(const YAML::Node& node) {
    SshSettings s;
    s.ssh_program = node["ssh_program"].as<std::string>(DEFAULT_SSH_PROGRAM);
    s.scp_program = node["scp_program"].as<std::string>(DEFAULT_SCP_PROGRAM);
    s.sshpass_program = node["sshpass_program"].as<std::string>(DEFAULT_SSHPASS_PROGRAM);
    s.connect_timeout = node["connect_timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
    s.keepalive_interval = node["keepalive_interval"].as<int>(DEFAULT_KEEPALIVE_INTERVAL);
    s.keepalive_count_max = node["keepalive_count_max"].as<int>(DEFAULT_KEEPALIVE_COUNT_MAX);
    s.check_timeout = node["check_timeout"].as<int>(DEFAULT_CHECK_TIMEOUT_SECS);
    s.min_reconnect_interval_secs = node["min_reconnect_interval_secs"].as<int>(DEFAULT_MIN_RECONNECT_SECS);
    s.app_data_dir = expand_home(node["app_data_dir"].as<std::string>(""));
    return s;
}

static Result<SSHFileMapping> parse_mapping(const YAML::Node& node, size_t index) {
    SSHFileMapping m;
    m.name = node["name"].as<std::string>(fmt::format("mapping-{}", index + 1));
    m.module = node["module"].as<std::string>("");
    m.local_path = node["local_path"].as<std::string>("");
    m.remote_path = node["remote_path"].as<std::string>("");
    m.is_directory = node["is_directory"].as<bool>(false);
    m.is_pattern = node["is_pattern"].as<bool>(false);
    m.enabled = node["enabled"].as<bool>(true);

    if (m.local_path.empty() || m.remote_path.empty()) {
        return Result<SSHFileMapping>::Err(fmt::format(
            "Mapping '{}' needs both local_path and remote_path", m.name));
    }
    if (m.is_directory && m.is_pattern) {
        return Result<SSHFileMapping>::Err(fmt::format(
            "Mapping '{}' cannot be both is_directory and is_pattern", m.name));
    }
    return Result<SSHFileMapping>::Ok(m);
}

static Result<Config> from_root(const YAML::Node& root, Config config) {
    if (root["settings"] && root["settings"].IsMap()) {
        config.set_settings(parse_settings(root["settings"]));
    }

    if (root["connection"] && root["connection"].IsMap()) {
        auto conn = parse_connection(root["connection"]);
        if (conn.is_err()) return Result<Config>::Err(conn.error);
        config.set_connection(conn.value);
    }

    if (root["mappings"] && root["mappings"].IsSequence()) {
        size_t i = 0;
        for (const auto& node : root["mappings"]) {
            auto mapping = parse_mapping(node, i++);
            if (mapping.is_err()) return Result<Config>::Err(mapping.error);
            config.add_mapping(mapping.value);
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return from_root(root, Config());
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err(fmt::format(
            "Config not found at {}. Run 'sshmirror init' to create one.", path.string()));
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto config = from_root(root, Config());
        if (config.is_err()) {
            return Result<Config>::Err(fmt::format("{}: {}", path.string(), config.error));
        }
        return config;
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }
}

std::vector<SSHFileMapping> Config::mappings_for(const std::string& module) const {
    std::vector<SSHFileMapping> out;
    for (const auto& m : mappings_) {
        if (m.module == module) out.push_back(m);
    }
    return out;
}

// ── Saving ─────────────────────────────────────────────────

Result<void> Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    if (connection_) {
        const auto& c = *connection_;
        out << YAML::Key << "connection" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << c.id;
        out << YAML::Key << "host" << YAML::Value << c.host;
        out << YAML::Key << "port" << YAML::Value << c.port;
        out << YAML::Key << "username" << YAML::Value << c.username;
        out << YAML::Key << "auth_method" << YAML::Value << to_string(c.auth_method);
        out << YAML::Key << "password" << YAML::Value << c.password;
        out << YAML::Key << "private_key_path" << YAML::Value << c.private_key_path;
        out << YAML::Key << "private_key_content" << YAML::Value;
        if (c.private_key_content.empty()) out << c.private_key_content;
        else out << YAML::Literal << c.private_key_content;
        out << YAML::Key << "passphrase" << YAML::Value << c.passphrase;
        out << YAML::EndMap;
    }

    out << YAML::Key << "settings" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "ssh_program" << YAML::Value << settings_.ssh_program;
    out << YAML::Key << "scp_program" << YAML::Value << settings_.scp_program;
    out << YAML::Key << "sshpass_program" << YAML::Value << settings_.sshpass_program;
    out << YAML::Key << "connect_timeout" << YAML::Value << settings_.connect_timeout;
    out << YAML::Key << "keepalive_interval" << YAML::Value << settings_.keepalive_interval;
    out << YAML::Key << "keepalive_count_max" << YAML::Value << settings_.keepalive_count_max;
    out << YAML::Key << "check_timeout" << YAML::Value << settings_.check_timeout;
    out << YAML::Key << "min_reconnect_interval_secs" << YAML::Value << settings_.min_reconnect_interval_secs;
    out << YAML::Key << "app_data_dir" << YAML::Value << settings_.app_data_dir;
    out << YAML::EndMap;

    out << YAML::Key << "mappings" << YAML::Value << YAML::BeginSeq;
    for (const auto& m : mappings_) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << m.name;
        out << YAML::Key << "module" << YAML::Value << m.module;
        out << YAML::Key << "local_path" << YAML::Value << m.local_path;
        out << YAML::Key << "remote_path" << YAML::Value << m.remote_path;
        out << YAML::Key << "is_directory" << YAML::Value << m.is_directory;
        out << YAML::Key << "is_pattern" << YAML::Value << m.is_pattern;
        out << YAML::Key << "enabled" << YAML::Value << m.enabled;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream fout(path);
    if (!fout) {
        return Result<void>::Err("Failed to write config file at " + path.string());
    }
    fout << out.c_str();
    return Result<void>::Ok();
}
