/**
 * @file file_system.cpp
 * @brief Platform-neutral parts of the probe: naming, error mapping, fstat device ids.
 */
#include "kprim/fs/file_system.hpp"

#include <cerrno>
#include <cstdio>
#include <sys/stat.h>

namespace kprim::fs {

std::string Kind::name() const {
    if (*this == Ext4)  return "ext4";
    if (*this == Btrfs) return "btrfs";
    if (*this == Xfs)   return "xfs";
    if (*this == Tmpfs) return "tmpfs";
    if (*this == Proc)  return "proc";
    if (*this == Sysfs) return "sysfs";
    if (*this == Nfs)   return "nfs";
    if (*this == Cifs)  return "cifs";
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(magic_));
    return buf;
}

StorageError StorageError::from_code(os::ErrorCode code) noexcept {
    Kind k = Kind::Unknown;
    switch (code.posix_value()) {
        case EBADF:  k = Kind::InvalidDescriptor; break;
        case EMFILE: k = Kind::LimitProcess; break;
        case ENFILE: k = Kind::LimitSystem; break;
        case ENOENT:
        case ENOTDIR:
            k = Kind::NotFound;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            k = Kind::PermissionDenied;
            break;
        case ENOMEM: k = Kind::OutOfMemory; break;
        case EIO:    k = Kind::Io; break;
        case ENOSPC: k = Kind::NoSpace; break;
        case EDQUOT: k = Kind::Quota; break;
        case EEXIST: k = Kind::AlreadyExists; break;
        default: break;
    }
    return StorageError{k, code};
}

std::string StorageError::to_string() const {
    std::string s = fs::to_string(kind);
    if (code.value != 0) s += " (" + code.to_string() + ")";
    return s;
}

const char* to_string(StorageError::Kind k) noexcept {
    using K = StorageError::Kind;
    switch (k) {
        case K::InvalidDescriptor: return "invalid descriptor";
        case K::LimitProcess:      return "process descriptor limit";
        case K::LimitSystem:       return "system descriptor limit";
        case K::NotFound:          return "not found";
        case K::PermissionDenied:  return "permission denied";
        case K::OutOfMemory:       return "out of memory";
        case K::Io:                return "i/o error";
        case K::NoSpace:           return "no space";
        case K::Quota:             return "quota exceeded";
        case K::AlreadyExists:     return "already exists";
        case K::Unknown:           return "unknown";
    }
    return "unknown";
}

kprim_detail::expected<Kind, StorageError> kind(os::Descriptor d) noexcept {
    auto st = stats(d);
    if (!st) return kprim_detail::unexpected(st.error());
    return st->kind;
}

kprim_detail::expected<DeviceId, StorageError> device(os::Descriptor d) noexcept {
    if (!d.is_valid()) {
        return kprim_detail::unexpected(StorageError::from_code(os::ErrorCode::posix(EBADF)));
    }
    struct stat st{};
    if (::fstat(d.raw(), &st) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return DeviceId{static_cast<std::uint64_t>(st.st_dev)};
}

kprim_detail::expected<bool, StorageError> same_device(os::Descriptor a, os::Descriptor b) noexcept {
    const auto da = device(a);
    if (!da) return kprim_detail::unexpected(da.error());
    const auto db = device(b);
    if (!db) return kprim_detail::unexpected(db.error());
    return *da == *db;
}

kprim_detail::expected<bool, StorageError> same_file(os::Descriptor a, os::Descriptor b) noexcept {
    if (!a.is_valid() || !b.is_valid()) {
        return kprim_detail::unexpected(StorageError::from_code(os::ErrorCode::posix(EBADF)));
    }
    struct stat sa{};
    struct stat sb{};
    if (::fstat(a.raw(), &sa) != 0 || ::fstat(b.raw(), &sb) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

} // namespace kprim::fs
