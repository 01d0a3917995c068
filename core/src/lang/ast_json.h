#pragma once

#include <nlohmann/json.hpp>

#include "ast.h"

namespace ovsql {

/// Converts a parsed request into an ordered JSON tree for `--emit ast`.
/// MUST keep key order stable so dumps can be diffed.
nlohmann::ordered_json request_to_json(const Request& request);

}  // namespace ovsql
