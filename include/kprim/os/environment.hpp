#pragma once
/**
 * @file environment.hpp
 * @brief Environment-variable lookup (read-only).
 */

#include <optional>
#include <string>

namespace kprim::os::env {

    /// @brief Value of @p name, or std::nullopt when unset.
    std::optional<std::string> get(const std::string& name);

    /// @brief True when @p name is set (to anything, including empty).
    bool is_set(const std::string& name);

    /// @brief True when @p name is set to exactly @p value.
    bool is_set(const std::string& name, const std::string& value);

} // namespace kprim::os::env
