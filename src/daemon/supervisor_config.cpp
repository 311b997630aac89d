#include "supervisor_config.hpp"

#include "../core/json_util.hpp"

#include <loom/logger.hpp>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string_view>

namespace loom::daemon
{

namespace
{

std::optional<int64_t> parse_int(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    std::string s(text);
    char*       end = nullptr;
    errno           = 0;
    long long v     = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0')
        return std::nullopt;
    return static_cast<int64_t>(v);
}

// Setters shared by the file and the command line. Each logs and keeps the
// current value when `v` is out of range.

void set_ms(std::chrono::milliseconds& field, std::optional<int64_t> v, std::string_view name,
            bool allow_zero = false)
{
    if (!v || *v < 0 || (*v == 0 && !allow_zero))
    {
        LOOM_LOG_WARN("config", "Invalid value for {}, keeping {} ms", name, field.count());
        return;
    }
    field = std::chrono::milliseconds(*v);
}

template <typename T>
void set_count(T& field, std::optional<int64_t> v, std::string_view name)
{
    if (!v || *v < 1)
    {
        LOOM_LOG_WARN("config", "Invalid value for {}, keeping {}", name, field);
        return;
    }
    field = static_cast<T>(*v);
}

void set_level(std::string& field, const std::string& v)
{
    LogLevel level;
    if (!Logger::parse_level(v, level))
    {
        LOOM_LOG_WARN("config", "Unknown log level '{}', keeping '{}'", v, field);
        return;
    }
    field = v;
}

void set_recoverable(std::set<ipc::RoleKind>& field, const std::vector<std::string>& names)
{
    std::set<ipc::RoleKind> kinds;
    for (const auto& name : names)
    {
        auto kind = ipc::role_kind_from_name(name);
        if (!kind || *kind == ipc::RoleKind::Primary)
        {
            LOOM_LOG_WARN("config", "Invalid recoverable role '{}', keeping defaults", name);
            return;
        }
        kinds.insert(*kind);
    }
    field = std::move(kinds);
}

bool next_arg(int argc, char** argv, int& i, std::string_view flag, std::string& out)
{
    if (i + 1 >= argc)
    {
        std::cerr << "Missing argument for " << flag << "\n";
        return false;
    }
    out = argv[++i];
    return true;
}

}   // anonymous namespace

bool apply_config_json(const std::string& json, SupervisorConfig& config)
{
    auto first = json.find_first_not_of(" \t\n\r");
    if (first == std::string::npos || json[first] != '{')
        return false;

    if (auto v = json::read_string(json, "socket"))
        config.socket_path = *v;
    if (auto v = json::read_string(json, "surface_binary"))
        config.surface_binary = *v;
    if (auto v = json::read_string(json, "layout"))
        config.layout_path = *v;
    if (auto v = json::read_string(json, "log_level"))
        set_level(config.log_level, *v);
    if (auto v = json::read_string(json, "log_file"))
        config.log_file = *v;

    auto has = [&](const char* key) { return json.find(std::string("\"") + key + "\"") != std::string::npos; };

    if (has("handshake_timeout_ms"))
        set_ms(config.handshake_timeout, json::read_int(json, "handshake_timeout_ms"), "handshake_timeout_ms");
    if (has("retry_budget"))
        set_count(config.spawn_retry_budget, json::read_int(json, "retry_budget"), "retry_budget");
    if (has("retry_delay_ms"))
        set_ms(config.spawn_retry_delay, json::read_int(json, "retry_delay_ms"), "retry_delay_ms");
    if (has("drain_timeout_ms"))
        set_ms(config.drain_timeout, json::read_int(json, "drain_timeout_ms"), "drain_timeout_ms", true);
    if (has("exit_grace_ms"))
        set_ms(config.exit_grace, json::read_int(json, "exit_grace_ms"), "exit_grace_ms");
    if (has("kill_grace_ms"))
        set_ms(config.kill_grace, json::read_int(json, "kill_grace_ms"), "kill_grace_ms");
    if (has("heartbeat_interval_ms"))
        set_ms(config.heartbeat_interval, json::read_int(json, "heartbeat_interval_ms"), "heartbeat_interval_ms");
    if (has("heartbeat_timeout_ms"))
        set_ms(config.heartbeat_timeout, json::read_int(json, "heartbeat_timeout_ms"), "heartbeat_timeout_ms", true);
    if (has("queue_capacity"))
        set_count(config.queue_capacity, json::read_int(json, "queue_capacity"), "queue_capacity");
    if (has("deferred_capacity"))
        set_count(config.deferred_capacity, json::read_int(json, "deferred_capacity"), "deferred_capacity");
    if (has("flush_interval_ms"))
        set_ms(config.flush_interval, json::read_int(json, "flush_interval_ms"), "flush_interval_ms");
    if (has("batch_max_items"))
        set_count(config.batch_max_items, json::read_int(json, "batch_max_items"), "batch_max_items");
    if (has("recoverable"))
        set_recoverable(config.recoverable, json::read_string_array(json, "recoverable"));

    return true;
}

bool load_config_file(const std::string& path, SupervisorConfig& config)
{
    auto json = json::read_file(path);
    if (!json)
    {
        LOOM_LOG_ERROR("config", "Cannot read config file {}", path);
        return false;
    }
    if (!apply_config_json(*json, config))
    {
        LOOM_LOG_ERROR("config", "Config file {} is not a JSON object", path);
        return false;
    }
    LOOM_LOG_INFO("config", "Loaded config from {}", path);
    return true;
}

ParseStatus parse_args(int argc, char** argv, SupervisorConfig& config)
{
    // --config first so flags override the file
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cout << usage(argv[0]);
            return ParseStatus::Help;
        }
        if (arg == "--config")
        {
            std::string path;
            if (!next_arg(argc, argv, i, arg, path))
                return ParseStatus::Error;
            if (!load_config_file(path, config))
                return ParseStatus::Error;
        }
    }

    std::set<ipc::RoleKind> no_recover;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        std::string      value;

        if (arg == "--config")
        {
            ++i;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            std::cerr << "Unexpected argument: " << arg << "\n" << usage(argv[0]);
            return ParseStatus::Error;
        }
        if (!next_arg(argc, argv, i, arg, value))
            return ParseStatus::Error;

        if (arg == "--socket")
            config.socket_path = value;
        else if (arg == "--surface-binary")
            config.surface_binary = value;
        else if (arg == "--layout")
            config.layout_path = value;
        else if (arg == "--log-level")
            set_level(config.log_level, value);
        else if (arg == "--log-file")
            config.log_file = value;
        else if (arg == "--handshake-timeout-ms")
            set_ms(config.handshake_timeout, parse_int(value), arg);
        else if (arg == "--retry-budget")
            set_count(config.spawn_retry_budget, parse_int(value), arg);
        else if (arg == "--drain-timeout-ms")
            set_ms(config.drain_timeout, parse_int(value), arg, true);
        else if (arg == "--queue-capacity")
            set_count(config.queue_capacity, parse_int(value), arg);
        else if (arg == "--flush-interval-ms")
            set_ms(config.flush_interval, parse_int(value), arg);
        else if (arg == "--batch-max-items")
            set_count(config.batch_max_items, parse_int(value), arg);
        else if (arg == "--heartbeat-timeout-ms")
            set_ms(config.heartbeat_timeout, parse_int(value), arg, true);
        else if (arg == "--no-recover")
        {
            auto kind = ipc::role_kind_from_name(value);
            if (kind && *kind != ipc::RoleKind::Primary)
                no_recover.insert(*kind);
            else
                LOOM_LOG_WARN("config", "--no-recover: unknown role '{}'", value);
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n" << usage(argv[0]);
            return ParseStatus::Error;
        }
    }

    for (auto kind : no_recover)
        config.recoverable.erase(kind);

    return ParseStatus::Ok;
}

std::string usage(const char* argv0)
{
    std::string name = argv0 ? argv0 : "loom-supervisor";
    return "Usage: " + name
           + " [options]\n"
             "  --config <file>              JSON config file (flags override it)\n"
             "  --socket <path>              producer socket path\n"
             "  --surface-binary <path>      loom-surface executable\n"
             "  --layout <file>              persisted layout file\n"
             "  --log-level <level>          trace|debug|info|warn|error|critical|off\n"
             "  --log-file <file>            also log to this file\n"
             "  --handshake-timeout-ms <n>   wait for surface.ready\n"
             "  --retry-budget <n>           launch attempts per surface\n"
             "  --drain-timeout-ms <n>       outbound drain on close\n"
             "  --queue-capacity <n>         outbound queue size per surface\n"
             "  --flush-interval-ms <n>      replaceable/batched flush interval\n"
             "  --batch-max-items <n>        flush a batch at this many items\n"
             "  --heartbeat-timeout-ms <n>   hung-surface timeout, 0 disables\n"
             "  --no-recover <kind>          do not restart <kind> after a crash\n";
}

}   // namespace loom::daemon
