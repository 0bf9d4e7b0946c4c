#pragma once

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace pyfence::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

// "os.path" -> "os"
inline std::string TopLevelName(const std::string& dotted) {
    const auto dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

inline bool Contains(const std::set<std::string>& items, const std::string& value) {
    return items.find(value) != items.end();
}

}  // namespace pyfence::utils
