#pragma once
/**
 * @file clone.hpp
 * @brief File clone engine: shared-extent (reflink) clone with an explicit copy fallback policy.
 *
 * Decision order for perform():
 *  1) Both descriptors must be structurally valid (InvalidDescriptor, no syscall).
 *  2) Both must be different files (SameFile, never structural, so never copied).
 *     CopyOnly then copies bytes and never issues the clone syscall.
 *  3) Source and destination must share a device, else CrossDevice.
 *  4) The kernel clone is attempted; success is Reflinked for every behavior.
 *  5) Structural failure (Unsupported, CrossDevice, AlreadyExists): ReflinkOrFail reports it,
 *     ReflinkOrCopy copies bytes and returns Copied.
 *  6) Any other failure is returned as-is; it is never retried or masked by a copy.
 *
 * After success the destination holds exactly the bytes of the source as they were
 * during the call. Partial writes from a failed copy are not rolled back for perform();
 * file() removes the destination it created.
 */

#include <string>

#include "kprim/clone/clone_types.hpp"
#include "kprim/compat/expected.hpp"
#include "kprim/fs/file_system.hpp"
#include "kprim/os/descriptor.hpp"

namespace kprim::clone {

/**
 * @brief Clone (or copy) the whole content of @p from into @p to.
 * @param from Source, open for reading.
 * @param to   Destination, open for writing; truncated before a byte copy.
 */
kprim_detail::expected<Result, CopyError>
perform(os::Descriptor from, os::Descriptor to, Behavior behavior) noexcept;

/**
 * @brief Clone (or copy) the file at @p from to the new path @p to.
 * @details @p to must not exist (AlreadyExists). A destination created by this call is
 *          removed again if the call fails.
 */
kprim_detail::expected<Result, CopyError>
file(const std::string& from, const std::string& to, Behavior behavior) noexcept;

/// @brief Whether the filesystem described by @p stats supports reflink cloning.
Capability capability_of(const fs::Stats& stats) noexcept;

kprim_detail::expected<Capability, fs::StorageError> probe_capability(os::Descriptor d) noexcept;
kprim_detail::expected<Capability, fs::StorageError> probe_capability(const std::string& path) noexcept;

} // namespace kprim::clone
