#ifndef DPOUTPUT_TORCH_INTERNAL_UTILS_HPP
#define DPOUTPUT_TORCH_INTERNAL_UTILS_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace dpoutput_torch {
namespace details {

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Format a list of names as `['a', 'b']`
inline std::string join_names(const std::vector<std::string>& names) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < names.size(); i++) {
        oss << "'" << names[i] << "'";
        if (i + 1 < names.size()) {
            oss << ", ";
        }
    }
    oss << "]";
    return oss.str();
}

/// Format a shape as `[4, 5]`
inline std::string format_shape(const std::vector<int64_t>& shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); i++) {
        oss << shape[i];
        if (i + 1 < shape.size()) {
            oss << ", ";
        }
    }
    oss << "]";
    return oss.str();
}

inline std::string python_bool(bool value) {
    return value ? "True" : "False";
}

}
}

#endif
