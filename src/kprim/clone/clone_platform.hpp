#pragma once
/**
 * @file clone_platform.hpp
 * @brief Per-platform primitives behind the clone engine (internal).
 */

#include <string>

#include "kprim/clone/clone_types.hpp"
#include "kprim/compat/expected.hpp"
#include "kprim/os/descriptor.hpp"

namespace kprim::clone::detail {

/// @brief Kernel descriptor-to-descriptor clone. Unsupported where the platform has none.
kprim_detail::expected<void, CopyError> reflink(os::Descriptor from, os::Descriptor to) noexcept;

/// @brief Truncate @p to and copy every byte of @p from into it (from offset 0).
kprim_detail::expected<void, CopyError> copy_bytes(os::Descriptor from, os::Descriptor to) noexcept;

/// @brief Descriptor algorithm shared by perform() and the path variants (no event recorded).
kprim_detail::expected<Result, CopyError>
run(os::Descriptor from, os::Descriptor to, Behavior behavior, bool& attempted_clone) noexcept;

/// @brief Path variant of run().
kprim_detail::expected<Result, CopyError>
run_paths(const std::string& from, const std::string& to, Behavior behavior, bool& attempted_clone) noexcept;

} // namespace kprim::clone::detail
