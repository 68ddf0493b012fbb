#pragma once
/**
 * @file file.hpp
 * @brief Minimal file helpers returning owned descriptors and typed errors.
 */

#include <cstdint>
#include <string>

#include "kprim/compat/expected.hpp"
#include "kprim/config/constants.hpp"
#include "kprim/fs/file_system.hpp"
#include "kprim/os/descriptor.hpp"

namespace kprim::fs {

enum class OpenMode : std::uint8_t { Read, Write, ReadWrite };

/** @struct OpenOptions
 *  @brief open(2) flags in named form. O_CLOEXEC is always added.
 */
struct OpenOptions {
    OpenMode      mode{OpenMode::Read};
    bool          create{false};     ///< O_CREAT
    bool          exclusive{false};  ///< O_EXCL (only meaningful with create)
    bool          truncate{false};   ///< O_TRUNC
    std::uint32_t permissions{config::constants::DEFAULT_FILE_MODE};

    static OpenOptions read_only() noexcept { return OpenOptions{}; }

    /// @brief Write-only, created exclusively: fails with AlreadyExists if the path exists.
    static OpenOptions create_new() noexcept {
        OpenOptions o;
        o.mode      = OpenMode::Write;
        o.create    = true;
        o.exclusive = true;
        return o;
    }
};

kprim_detail::expected<os::UniqueDescriptor, StorageError>
open(const std::string& path, const OpenOptions& options) noexcept;

/// @brief Current size in bytes (fstat st_size).
kprim_detail::expected<std::uint64_t, StorageError> size(os::Descriptor d) noexcept;

/// @brief unlink(2) @p path.
kprim_detail::expected<void, StorageError> remove(const std::string& path) noexcept;

} // namespace kprim::fs
