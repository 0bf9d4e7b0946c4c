#pragma once

#include <set>
#include <string>

namespace pyfence::config {

// What guest code may do. Defaults are permissive but always sandboxed.
struct Policy {
    bool enabled = true;
    bool sandboxed = true;
    unsigned timeout_seconds = 10;
    unsigned max_memory_mb = 100;
    // Non-empty means strict allow-list.
    std::set<std::string> allowed_imports;
    std::set<std::string> blocked_imports;
    std::set<std::string> allowed_file_operations = {"read"};
    std::set<std::string> restricted_paths;
    // Extra interpreter-introspection attribute names, on top of the built-in table.
    std::set<std::string> blocked_attributes;
};

}  // namespace pyfence::config
