/**
 * @file file_system_linux.cpp
 * @brief statfs/fstatfs translation for Linux.
 */
#if defined(__linux__)

#include "kprim/fs/file_system.hpp"

#include <cerrno>
#include <sys/vfs.h>

namespace kprim::fs {

namespace {

Stats translate(const struct statfs& s) noexcept {
    Stats out;
    out.kind             = Kind{static_cast<std::uint64_t>(s.f_type)};
    out.block_size       = static_cast<std::uint64_t>(s.f_bsize);
    out.blocks           = static_cast<std::uint64_t>(s.f_blocks);
    out.free_blocks      = static_cast<std::uint64_t>(s.f_bfree);
    out.available_blocks = static_cast<std::uint64_t>(s.f_bavail);
    out.files            = static_cast<std::uint64_t>(s.f_files);
    out.free_files       = static_cast<std::uint64_t>(s.f_ffree);
    out.fsid = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(s.f_fsid.__val[0])) << 32) |
               static_cast<std::uint32_t>(s.f_fsid.__val[1]);
    out.name_max = static_cast<std::uint64_t>(s.f_namelen);
    return out;
}

} // namespace

kprim_detail::expected<Stats, StorageError> stats(os::Descriptor d) noexcept {
    if (!d.is_valid()) {
        return kprim_detail::unexpected(StorageError::from_code(os::ErrorCode::posix(EBADF)));
    }
    struct statfs s{};
    if (::fstatfs(d.raw(), &s) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return translate(s);
}

kprim_detail::expected<Stats, StorageError> stats(const std::string& path) noexcept {
    struct statfs s{};
    if (::statfs(path.c_str(), &s) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return translate(s);
}

} // namespace kprim::fs

#endif // __linux__
