#pragma once

#include "../ipc/message.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loom::daemon
{

struct LayoutEntry
{
    ipc::RoleKind        role = ipc::RoleKind::Primary;
    ipc::GeometryPayload geometry;
};

// Persisted surface layout: one record per role kind.
//
// Format (JSON):
//   {
//     "version": 1,
//     "surfaces": [
//       { "role": "debug", "visible": true, "x": 0, "y": 0, "width": 800, "height": 600 }
//     ]
//   }
class LayoutStore
{
   public:
    static constexpr int VERSION = 1;

    // Replaces any existing record for `role`.
    void                                set(ipc::RoleKind role, const ipc::GeometryPayload& geometry);
    std::optional<ipc::GeometryPayload> get(ipc::RoleKind role) const;
    void                                remove(ipc::RoleKind role);
    void                                clear() { entries_.clear(); }

    const std::vector<LayoutEntry>& entries() const { return entries_; }
    size_t                          size() const { return entries_.size(); }

    std::string serialize() const;

    // Returns false for empty input or a newer version. Entries with an
    // unknown role are logged and skipped.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // Issue a create-request for every visible secondary entry, in file
    // order. A request that fails is logged and skipped. Returns the number
    // of successful requests.
    size_t restore(const std::function<bool(ipc::RoleKind)>& create) const;

   private:
    std::vector<LayoutEntry> entries_;
};

}   // namespace loom::daemon
