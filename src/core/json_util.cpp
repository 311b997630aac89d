#include "json_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace loom::json
{

std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 >= s.size())
        {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Position just past the ':' following "key", or npos.
static size_t value_pos(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\n\r", pos + 1);
}

// Reads a quoted string starting at `pos` (which must point at '"').
// Sets `end` to the closing quote.
static std::optional<std::string> quoted_at(const std::string& json, size_t pos, size_t& end)
{
    if (pos >= json.size() || json[pos] != '"')
        return std::nullopt;
    end = pos + 1;
    while (end < json.size())
    {
        if (json[end] == '\\')
        {
            end += 2;
            continue;
        }
        if (json[end] == '"')
            return unescape(json.substr(pos + 1, end - pos - 1));
        ++end;
    }
    return std::nullopt;
}

std::optional<std::string> read_string(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    size_t end = 0;
    return quoted_at(json, pos, end);
}

std::optional<int64_t> read_int(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* start = json.c_str() + pos;
    char*       stop  = nullptr;
    errno             = 0;
    long long value   = std::strtoll(start, &stop, 10);
    if (stop == start || errno == ERANGE)
        return std::nullopt;
    return static_cast<int64_t>(value);
}

std::optional<bool> read_bool(const std::string& json, const std::string& key)
{
    auto pos = value_pos(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

std::vector<std::string> read_object_array(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;
    auto                     pos = value_pos(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return objects;

    int    depth     = 0;
    size_t obj_start = 0;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == '"')
        {
            // Skip strings so braces inside them do not count
            size_t end = 0;
            if (!quoted_at(json, i, end))
                break;
            i = end;
        }
        else if (json[i] == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (json[i] == '}')
        {
            --depth;
            if (depth == 0)
                objects.push_back(json.substr(obj_start, i - obj_start + 1));
        }
        else if (json[i] == ']' && depth == 0)
        {
            break;
        }
    }
    return objects;
}

std::vector<std::string> read_string_array(const std::string& json, const std::string& key)
{
    std::vector<std::string> values;
    auto                     pos = value_pos(json, key);
    if (pos == std::string::npos || json[pos] != '[')
        return values;

    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == ']')
            break;
        if (json[i] != '"')
            continue;
        size_t end   = 0;
        auto   value = quoted_at(json, i, end);
        if (!value)
            break;
        values.push_back(std::move(*value));
        i = end;
    }
    return values;
}

std::optional<std::string> read_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

bool write_file(const std::string& path, const std::string& contents)
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << contents;
    return f.good();
}

}   // namespace loom::json
