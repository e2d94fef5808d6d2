#pragma once

#include <filesystem>
#include <string>

#include "planner/v1/session.pb.h"

namespace planner::daemon {

// Written 0600 through tmp + rename; the token grants full daemon access.
void         WritePortFile(const std::filesystem::path& path, const v1::PortFile& port_file);
v1::PortFile ReadPortFile(const std::filesystem::path& path);

void WriteTextFile(const std::filesystem::path& path, const std::string& content);

// Best effort; missing files are not an error.
void RemoveIfExists(const std::filesystem::path& path);

} // namespace planner::daemon
