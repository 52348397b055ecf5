#pragma once
#include <svcman/service.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace svcman {

// Reads a [Service] unit file into a ServiceConfig. Throws ConfigError for a
// missing file, a missing ExecStart or a malformed value.
ServiceConfig load_unit(const std::filesystem::path& path);

// splits a command line honouring quotes and backslash escapes
std::vector<std::string> split_cmd(const std::string& s);

} // namespace svcman
