#pragma once
/**
 * @file file_system.hpp
 * @brief File system probe: statfs-level facts about the filesystem holding a file.
 *
 * Used by the clone engine for its same-device pre-check and capability probe, and
 * available to callers directly.
 *
 * Probe failures are reported as StorageError. They are never folded into a
 * "different device" answer.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "kprim/compat/expected.hpp"
#include "kprim/os/descriptor.hpp"
#include "kprim/os/error_code.hpp"

namespace kprim::fs {

/**
 * @class Kind
 * @brief Filesystem type as reported by the kernel (statfs f_type magic).
 * @note On Darwin the magic is not meaningful; Stats::type_name carries the name instead.
 */
class Kind {
public:
    constexpr Kind() noexcept = default;
    constexpr explicit Kind(std::uint64_t magic) noexcept : magic_(magic) {}

    static const Kind Ext4;
    static const Kind Btrfs;
    static const Kind Xfs;
    static const Kind Tmpfs;
    static const Kind Proc;
    static const Kind Sysfs;
    static const Kind Nfs;
    static const Kind Cifs;

    constexpr std::uint64_t raw() const noexcept { return magic_; }

    /// @brief "ext4", "btrfs", ... for known kinds, otherwise "0x<hex>".
    std::string name() const;

    friend constexpr bool operator==(Kind, Kind) = default;

private:
    std::uint64_t magic_{0};
};

inline constexpr Kind Kind::Ext4{0xEF53};
inline constexpr Kind Kind::Btrfs{0x9123683E};
inline constexpr Kind Kind::Xfs{0x58465342};
inline constexpr Kind Kind::Tmpfs{0x01021994};
inline constexpr Kind Kind::Proc{0x9FA0};
inline constexpr Kind Kind::Sysfs{0x62656572};
inline constexpr Kind Kind::Nfs{0x6969};
inline constexpr Kind Kind::Cifs{0xFF534D42};

/**
 * @struct Stats
 * @brief Snapshot of one statfs/fstatfs call.
 */
struct Stats {
    Kind                       kind{};
    std::uint64_t              block_size{0};       ///< Optimal transfer block size
    std::uint64_t              blocks{0};           ///< Total data blocks
    std::uint64_t              free_blocks{0};      ///< Free blocks
    std::uint64_t              available_blocks{0}; ///< Free blocks available to unprivileged users
    std::uint64_t              files{0};            ///< Total inodes
    std::uint64_t              free_files{0};       ///< Free inodes
    std::uint64_t              fsid{0};             ///< Filesystem id (both words packed)
    std::uint64_t              name_max{0};         ///< Longest file name component
    std::optional<std::string> type_name;           ///< Darwin f_fstypename ("apfs", "hfs", ...)

    friend bool operator==(const Stats&, const Stats&) = default;
};

/**
 * @struct StorageError
 * @brief Probe / file helper failure: kind + raw platform code.
 */
struct StorageError {
    enum class Kind : std::uint8_t {
        InvalidDescriptor,  ///< EBADF, or a sentinel descriptor rejected before the syscall
        LimitProcess,       ///< EMFILE
        LimitSystem,        ///< ENFILE
        NotFound,           ///< ENOENT / ENOTDIR
        PermissionDenied,   ///< EACCES / EPERM / EROFS
        OutOfMemory,        ///< ENOMEM
        Io,                 ///< EIO
        NoSpace,            ///< ENOSPC
        Quota,              ///< EDQUOT
        AlreadyExists,      ///< EEXIST (exclusive create)
        Unknown             ///< Anything else; see code
    };

    Kind          kind{Kind::Unknown};
    os::ErrorCode code{};

    static StorageError from_code(os::ErrorCode code) noexcept;

    std::string to_string() const;

    friend bool operator==(const StorageError&, const StorageError&) = default;
};

const char* to_string(StorageError::Kind k) noexcept;

/// @brief Device number (st_dev) of the filesystem holding a file.
struct DeviceId {
    std::uint64_t value{0};
    friend constexpr bool operator==(DeviceId, DeviceId) = default;
};

/// @brief fstatfs() on @p d. A sentinel descriptor is rejected without a syscall.
kprim_detail::expected<Stats, StorageError> stats(os::Descriptor d) noexcept;

/// @brief statfs() on @p path.
kprim_detail::expected<Stats, StorageError> stats(const std::string& path) noexcept;

/// @brief Filesystem kind of @p d (shorthand for stats(d)->kind).
kprim_detail::expected<Kind, StorageError> kind(os::Descriptor d) noexcept;

/// @brief fstat() st_dev of @p d.
kprim_detail::expected<DeviceId, StorageError> device(os::Descriptor d) noexcept;

/// @brief True when @p a and @p b live on the same device.
kprim_detail::expected<bool, StorageError> same_device(os::Descriptor a, os::Descriptor b) noexcept;

/// @brief True when @p a and @p b refer to the same file (same st_dev and st_ino).
kprim_detail::expected<bool, StorageError> same_file(os::Descriptor a, os::Descriptor b) noexcept;

} // namespace kprim::fs

template <>
struct std::hash<kprim::fs::Kind> {
    std::size_t operator()(kprim::fs::Kind k) const noexcept {
        return std::hash<std::uint64_t>{}(k.raw());
    }
};

template <>
struct std::hash<kprim::fs::Stats> {
    std::size_t operator()(const kprim::fs::Stats& s) const noexcept {
        std::size_t h = std::hash<kprim::fs::Kind>{}(s.kind);
        const auto mix = [&h](std::uint64_t v) {
            h ^= std::hash<std::uint64_t>{}(v) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        };
        mix(s.block_size);
        mix(s.blocks);
        mix(s.free_blocks);
        mix(s.available_blocks);
        mix(s.files);
        mix(s.free_files);
        mix(s.fsid);
        mix(s.name_max);
        if (s.type_name) h ^= std::hash<std::string>{}(*s.type_name) << 1;
        return h;
    }
};
