#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loom::json
{

// Minimal readers for the flat JSON files this project writes itself
// (layout and supervisor config). Not a general JSON parser: keys are looked
// up by text search inside one object.

std::string escape(const std::string& s);

std::optional<std::string> read_string(const std::string& json, const std::string& key);
std::optional<int64_t>     read_int(const std::string& json, const std::string& key);
std::optional<bool>        read_bool(const std::string& json, const std::string& key);

// Top-level {...} objects inside the array named `key`, as raw text.
std::vector<std::string> read_object_array(const std::string& json, const std::string& key);

// Strings inside the array named `key`.
std::vector<std::string> read_string_array(const std::string& json, const std::string& key);

// Whole-file helpers. write_file creates missing parent directories.
std::optional<std::string> read_file(const std::string& path);
bool                       write_file(const std::string& path, const std::string& contents);

}   // namespace loom::json
