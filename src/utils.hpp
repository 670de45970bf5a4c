// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

namespace binauthz {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool parse_key_value(const std::string& line, std::string& key, std::string& value);
bool parse_uint64(const std::string& text, uint64_t& out);

std::string env_or_default(const char* name, const std::string& fallback);

// Read an unsigned env override. Invalid values are logged and ignored.
bool parse_u64_env(const char* key, uint64_t& out);

} // namespace binauthz
