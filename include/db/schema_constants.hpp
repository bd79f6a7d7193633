#pragma once

#include <string_view>

namespace joinscout::db {

inline constexpr std::string_view kYes           = "YES";
inline constexpr std::string_view kTrue          = "t";
inline constexpr std::string_view kDefaultSchema = "public";
inline constexpr char kSchemaSeparator           = '.';

} // namespace joinscout::db
