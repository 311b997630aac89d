#pragma once

#include "surface_directory.hpp"

#include "../ipc/message.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace loom::daemon
{

enum class HandlerResult : uint8_t
{
    Continue,   // keep routing after the handler ran
    Consumed,   // the handler took care of the message
};

using MessageHandler = std::function<HandlerResult(ipc::SurfaceId source, const ipc::Message&)>;

struct DispatchResult
{
    bool   handled      = false;   // a type handler ran
    size_t deliveries   = 0;       // destinations that accepted the message
    size_t backpressure = 0;       // destinations whose queue was full
    bool   diagnostic   = false;   // unroutable; one diagnostic was emitted

    std::vector<ipc::SurfaceId> recipients;
};

// Emitted once per unroutable message.
struct RoutingDiagnostic
{
    ipc::SurfaceId source = ipc::INVALID_SURFACE;
    std::string    type;
    std::string    reason;
};

// Routes a message from one source to its destinations:
//   1. type handler (may consume)
//   2. explicit target role
//   3. static routing table
// The source never receives its own message.
class MessageRouter
{
   public:
    using DiagnosticSink = std::function<void(const RoutingDiagnostic&)>;

    explicit MessageRouter(SurfaceDirectory& directory);

    // One handler per type; registering again replaces it.
    void on(std::string_view type, MessageHandler handler);
    void remove_handler(std::string_view type);
    bool has_handler(std::string_view type) const;

    void set_diagnostic_sink(DiagnosticSink sink) { diagnostic_sink_ = std::move(sink); }

    DispatchResult dispatch(ipc::SurfaceId source, const ipc::Message& msg);

    // Deliver to every live surface of `role` except `exclude`.
    DispatchResult deliver_to_role(ipc::RoleKind       role,
                                   const ipc::Message& msg,
                                   ipc::SurfaceId      exclude = ipc::INVALID_SURFACE);

    // Destination roles from the static table; empty for types it does not name.
    static std::vector<ipc::RoleKind> destinations(std::string_view type);

    size_t diagnostic_count() const { return diagnostic_count_; }
    size_t dispatch_count() const { return dispatch_count_; }

   private:
    void emit_diagnostic(ipc::SurfaceId source, const ipc::Message& msg, std::string reason);

    SurfaceDirectory&                                  directory_;
    std::map<std::string, MessageHandler, std::less<>> handlers_;
    DiagnosticSink                                     diagnostic_sink_;
    size_t                                             diagnostic_count_ = 0;
    size_t                                             dispatch_count_   = 0;
};

}   // namespace loom::daemon
