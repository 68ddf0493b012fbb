/**
 * @file file.cpp
 * @brief open/fstat/unlink wrappers.
 */
#include "kprim/fs/file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kprim::fs {

namespace {

int encode(const OpenOptions& o) noexcept {
    int flags = O_CLOEXEC;
    switch (o.mode) {
        case OpenMode::Read:      flags |= O_RDONLY; break;
        case OpenMode::Write:     flags |= O_WRONLY; break;
        case OpenMode::ReadWrite: flags |= O_RDWR; break;
    }
    if (o.create)    flags |= O_CREAT;
    if (o.exclusive) flags |= O_EXCL;
    if (o.truncate)  flags |= O_TRUNC;
    return flags;
}

} // namespace

kprim_detail::expected<os::UniqueDescriptor, StorageError>
open(const std::string& path, const OpenOptions& options) noexcept {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), encode(options), static_cast<mode_t>(options.permissions));
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return os::UniqueDescriptor(os::Descriptor(fd));
}

kprim_detail::expected<std::uint64_t, StorageError> size(os::Descriptor d) noexcept {
    if (!d.is_valid()) {
        return kprim_detail::unexpected(StorageError::from_code(os::ErrorCode::posix(EBADF)));
    }
    struct stat st{};
    if (::fstat(d.raw(), &st) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

kprim_detail::expected<void, StorageError> remove(const std::string& path) noexcept {
    if (::unlink(path.c_str()) != 0) {
        return kprim_detail::unexpected(StorageError::from_code(os::capture_errno()));
    }
    return {};
}

} // namespace kprim::fs
