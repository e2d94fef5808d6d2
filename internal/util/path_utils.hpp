#pragma once

#include <string>
#include <string_view>

namespace planner::util {

/*
  True when `name` names exactly one normal path component.

  Rejects NUL, '/', '\\', the Unicode look-alikes U+2215 (division slash)
  and U+2044 (fraction slash), the relative components "." and "..", and
  the empty string. Pure string check, never touches the filesystem.
*/
inline bool IsSinglePathComponent(std::string_view name) {
  static constexpr std::string_view kDivisionSlash = "\xE2\x88\x95";
  static constexpr std::string_view kFractionSlash = "\xE2\x81\x84";

  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  if (name.find(kDivisionSlash) != std::string_view::npos || name.find(kFractionSlash) != std::string_view::npos) {
    return false;
  }
  return true;
}

} // namespace planner::util
