/**
 * @file environment.cpp
 * @brief getenv-backed environment lookup.
 */
#include "kprim/os/environment.hpp"

#include <cstdlib>

namespace kprim::os::env {

std::optional<std::string> get(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr) return std::nullopt;
    return std::string(v);
}

bool is_set(const std::string& name) {
    return get(name).has_value();
}

bool is_set(const std::string& name, const std::string& value) {
    const auto v = get(name);
    return v && *v == value;
}

} // namespace kprim::os::env
