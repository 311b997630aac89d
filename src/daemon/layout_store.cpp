#include "layout_store.hpp"

#include "../core/json_util.hpp"

#include <loom/logger.hpp>

#include <algorithm>
#include <sstream>

namespace loom::daemon
{

void LayoutStore::set(ipc::RoleKind role, const ipc::GeometryPayload& geometry)
{
    for (auto& e : entries_)
    {
        if (e.role == role)
        {
            e.geometry = geometry;
            return;
        }
    }
    entries_.push_back({role, geometry});
}

std::optional<ipc::GeometryPayload> LayoutStore::get(ipc::RoleKind role) const
{
    for (const auto& e : entries_)
    {
        if (e.role == role)
            return e.geometry;
    }
    return std::nullopt;
}

void LayoutStore::remove(ipc::RoleKind role)
{
    entries_.erase(std::remove_if(entries_.begin(),
                                  entries_.end(),
                                  [role](const LayoutEntry& e) { return e.role == role; }),
                   entries_.end());
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string LayoutStore::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << VERSION << ",\n";
    os << "  \"surfaces\": [\n";
    for (size_t i = 0; i < entries_.size(); ++i)
    {
        const auto& e = entries_[i];
        const auto& g = e.geometry;
        os << "    {\n";
        os << "      \"role\": \"" << json::escape(std::string(ipc::role_kind_name(e.role))) << "\",\n";
        os << "      \"visible\": " << (g.visible ? "true" : "false") << ",\n";
        os << "      \"x\": " << g.x << ",\n";
        os << "      \"y\": " << g.y << ",\n";
        os << "      \"width\": " << g.width << ",\n";
        os << "      \"height\": " << g.height << "\n";
        os << "    }";
        if (i + 1 < entries_.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

bool LayoutStore::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    if (auto ver = json::read_int(json, "version"); ver && *ver > VERSION)
    {
        LOOM_LOG_WARN("layout", "Layout version {} is newer than {}, ignoring", *ver, VERSION);
        return false;
    }

    entries_.clear();
    for (const auto& obj : json::read_object_array(json, "surfaces"))
    {
        auto name = json::read_string(obj, "role");
        auto role = name ? ipc::role_kind_from_name(*name) : std::nullopt;
        if (!role)
        {
            LOOM_LOG_WARN("layout", "Skipping layout entry with unknown role '{}'", name.value_or(""));
            continue;
        }

        ipc::GeometryPayload g;
        g.visible = json::read_bool(obj, "visible").value_or(true);
        g.x       = static_cast<int32_t>(json::read_int(obj, "x").value_or(0));
        g.y       = static_cast<int32_t>(json::read_int(obj, "y").value_or(0));
        g.width   = static_cast<int32_t>(json::read_int(obj, "width").value_or(g.width));
        g.height  = static_cast<int32_t>(json::read_int(obj, "height").value_or(g.height));
        set(*role, g);
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool LayoutStore::save(const std::string& path) const
{
    if (!json::write_file(path, serialize()))
    {
        LOOM_LOG_ERROR("layout", "Failed to write layout to {}", path);
        return false;
    }
    LOOM_LOG_INFO("layout", "Saved {} layout entries to {}", entries_.size(), path);
    return true;
}

bool LayoutStore::load(const std::string& path)
{
    auto json = json::read_file(path);
    if (!json)
        return false;
    return deserialize(*json);
}

size_t LayoutStore::restore(const std::function<bool(ipc::RoleKind)>& create) const
{
    size_t restored = 0;
    for (const auto& e : entries_)
    {
        if (!e.geometry.visible || e.role == ipc::RoleKind::Primary)
            continue;
        if (create(e.role))
        {
            ++restored;
        }
        else
        {
            LOOM_LOG_WARN("layout", "Could not restore {} surface, skipping",
                          ipc::role_kind_name(e.role));
        }
    }
    return restored;
}

}   // namespace loom::daemon
