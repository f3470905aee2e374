#pragma once
/// @file json.hpp
/// @brief JSON type used for the sqlnav configuration file
///
/// Code that reads configuration spells the type as sqlnav::json so the
/// nlohmann dependency stays behind this one include.

#include <nlohmann/json.hpp>

namespace sqlnav {

using json = nlohmann::json;

} // namespace sqlnav
