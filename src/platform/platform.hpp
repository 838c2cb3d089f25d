#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir when unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expands a leading "~/" to the home directory.
std::filesystem::path expand_user(const std::string& path);

// True when the name resolves to at least one IPv4/IPv6 address.
bool is_resolvable(const std::string& host);

} // namespace platform
