/**
 * @file file_system_darwin.cpp
 * @brief statfs/fstatfs translation for Darwin (macOS / iOS).
 * @details f_type is a private numbering on Darwin; the filesystem name comes from f_fstypename.
 */
#if defined(__APPLE__)

#include "kprim/fs/file_system.hpp"

#include <cerrno>
#include <sys/mount.h>
#include <sys/param.h>
#include <unistd.h>

namespace kprim::fs {

namespace {

Stats translate(const struct statfs& s, long name_max) {
    Stats out;
    out.kind             = Kind{static_cast<std::uint64_t>(s.f_type)};
    out.block_size       = static_cast<std::uint64_t>(s.f_bsize);
    out.blocks           = static_cast<std::uint64_t>(s.f_blocks);
    out.free_blocks      = static_cast<std::uint64_t>(s.f_bfree);
    out.available_blocks = static_cast<std::uint64_t>(s.f_bavail);
    out.files            = static_cast<std::uint64_t>(s.f_files);
    out.free_files       = static_cast<std::uint64_t>(s.f_ffree);
    out.fsid = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(s.f_fsid.val[0])) << 32) |
               static_cast<std::uint32_t>(s.f_fsid.val[1]);
    out.name_max  = name_max > 0 ? static_cast<std::uint64_t>(name_max) : std::uint64_t{NAME_MAX};
    out.type_name = std::string(s.f_fstypename);
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
    return translate(s, ::fpathconf(d.raw(), _PC_NAME_MAX));
}

kprim_detail::expected<Stats, StorageError> stats(const std::string& path) noexcept {
    struct statfs s{};
    if (::statfs(path.c_str(), &s) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return translate(s, ::pathconf(path.c_str(), _PC_NAME_MAX));
}

} // namespace kprim::fs

#endif // __APPLE__
