#pragma once

#include <boost/python.hpp>

#include "nlohmann/json.hpp"
#include "sandbox/execution_types.hpp"

namespace pyfence::cli {

// Nesting deeper than this is rendered as the value's repr.
constexpr int kMaxJsonDepth = 16;

// Plain data maps onto JSON: None, bool, int, float, str, list, tuple and
// dict. Anything else, and ints that do not fit in 64 bits, become the repr.
nlohmann::json ToJson(const boost::python::object& value, int depth = 0);

// The document printed by "pyfence run".
nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result);

}  // namespace pyfence::cli
