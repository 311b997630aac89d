#pragma once

#include "../ipc/message.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace loom::daemon
{

struct SupervisorConfig
{
    // Paths
    std::string socket_path;      // producer socket; empty = default_socket_path()
    std::string surface_binary;   // empty = resolve next to argv[0]
    std::string layout_path;      // empty = no persisted layout

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Surface lifecycle
    std::chrono::milliseconds handshake_timeout{5000};
    uint32_t                  spawn_retry_budget = 3;
    std::chrono::milliseconds spawn_retry_delay{100};
    std::chrono::milliseconds drain_timeout{500};
    std::chrono::milliseconds exit_grace{1000};   // channel EOF without an exit status
    std::chrono::milliseconds kill_grace{2000};   // SIGTERM → SIGKILL
    std::chrono::milliseconds reap_interval{50};

    // Liveness
    std::chrono::milliseconds heartbeat_interval{5000};
    std::chrono::milliseconds heartbeat_timeout{15000};   // 0 disables

    // Queues and update policy
    size_t                    queue_capacity    = 1024;
    size_t                    deferred_capacity = 1024;
    std::chrono::milliseconds flush_interval{16};
    size_t                    batch_max_items = 256;

    // Final states of purged surfaces kept for state lookups and diagnostics
    // of messages still addressed to them; the oldest ids go first.
    size_t retired_history = 1024;

    // Roles restarted automatically after an unexpected termination.
    std::set<ipc::RoleKind> recoverable = {ipc::RoleKind::Debug,
                                           ipc::RoleKind::GraphView,
                                           ipc::RoleKind::Terminal};

    bool is_recoverable(ipc::RoleKind role) const
    {
        return role != ipc::RoleKind::Primary && recoverable.count(role) > 0;
    }
};

// Apply a JSON config file on top of `config`. Unknown keys are ignored;
// invalid values are logged and leave the current value in place.
// Returns false if the file cannot be read or is not a JSON object.
bool load_config_file(const std::string& path, SupervisorConfig& config);

// Same as load_config_file, from a JSON string.
bool apply_config_json(const std::string& json, SupervisorConfig& config);

enum class ParseStatus : uint8_t
{
    Ok,
    Help,    // --help given; usage printed
    Error,   // unknown flag or missing argument
};

// Parse the command line. A `--config <file>` is applied first, then every
// other flag on top of it regardless of order.
ParseStatus parse_args(int argc, char** argv, SupervisorConfig& config);

std::string usage(const char* argv0);

}   // namespace loom::daemon
