/**
 * @file clone_linux.cpp
 * @brief Linux backend: ioctl(FICLONE), copy_file_range with a pread/pwrite fallback.
 */
#if defined(__linux__)

#include "clone_platform.hpp"
#include "kprim/clone/clone.hpp"
#include "kprim/config/config_loader.hpp"
#include "kprim/config/constants.hpp"
#include "kprim/fs/file.hpp"
#include "kprim/obs/observability.hpp"

#include <cerrno>
#include <memory>
#include <new>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kprim::clone {

namespace {

kprim_detail::unexpected<CopyError> fail(Operation op) noexcept {
    return kprim_detail::unexpected(CopyError::from_code(os::capture_errno(), op));
}

/// Errors that mean "copy_file_range cannot serve this pair", not "the copy failed".
bool range_unavailable(int e) noexcept {
    return e == EXDEV || e == EINVAL || e == ENOSYS || e == EOPNOTSUPP || e == ENOTSUP;
}

kprim_detail::expected<void, CopyError>
copy_buffered(int in, int out, off_t offset) noexcept {
    const std::size_t cap = config::current().copy_buffer_bytes;
    std::unique_ptr<std::byte[]> buf(new (std::nothrow) std::byte[cap]);
    if (!buf) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::Exhausted, Operation::Read,
                                                      os::ErrorCode::posix(ENOMEM)));
    }
    for (;;) {
        const ssize_t got = ::pread(in, buf.get(), cap, offset);
        if (got < 0) {
            if (errno == EINTR) continue;
            return fail(Operation::Read);
        }
        if (got == 0) return {};
        ssize_t done = 0;
        while (done < got) {
            const ssize_t put = ::pwrite(out, buf.get() + done, static_cast<std::size_t>(got - done),
                                         offset + done);
            if (put < 0) {
                if (errno == EINTR) continue;
                return fail(Operation::Write);
            }
            done += put;
        }
        offset += got;
    }
}

} // namespace

namespace detail {

kprim_detail::expected<void, CopyError> reflink(os::Descriptor from, os::Descriptor to) noexcept {
    if (::ioctl(to.raw(), FICLONE, from.raw()) != 0) return fail(Operation::Ficlone);
    return {};
}

kprim_detail::expected<void, CopyError> copy_bytes(os::Descriptor from, os::Descriptor to) noexcept {
    if (::ftruncate(to.raw(), 0) != 0) return fail(Operation::Truncate);

    loff_t in_off  = 0;
    loff_t out_off = 0;
    for (;;) {
        const ssize_t n = ::copy_file_range(from.raw(), &in_off, to.raw(), &out_off,
                                            config::constants::COPY_RANGE_CHUNK_BYTES, 0);
        if (n > 0) continue;
        if (n == 0) return {};
        if (errno == EINTR) continue;
        if (!range_unavailable(errno)) return fail(Operation::CopyFileRange);
        obs::logger()->debug("copy_file_range unavailable (errno={}), using read/write", errno);
        // Offsets advance together, so the buffered loop resumes where the kernel stopped.
        return copy_buffered(from.raw(), to.raw(), static_cast<off_t>(in_off));
    }
}

kprim_detail::expected<Result, CopyError>
run_paths(const std::string& from, const std::string& to, Behavior behavior, bool& attempted_clone) noexcept {
    attempted_clone = false;
    auto src = fs::open(from, fs::OpenOptions::read_only());
    if (!src) return kprim_detail::unexpected(CopyError::from_code(src.error().code, Operation::Open));
    struct stat st{};
    if (::fstat(src->get().raw(), &st) != 0) return fail(Operation::Fstat);
    if (S_ISDIR(st.st_mode)) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::IsDirectory, Operation::Open,
                                                      os::ErrorCode::posix(EISDIR)));
    }

    auto dst = fs::open(to, fs::OpenOptions::create_new());
    if (!dst) return kprim_detail::unexpected(CopyError::from_code(dst.error().code, Operation::Open));

    auto r = run(src->get(), dst->get(), behavior, attempted_clone);
    if (!r) {
        if (auto closed = dst->close(); !closed) {
            obs::logger()->warn("close({}) after failed clone: {}", to, closed.error().to_string());
        }
        if (auto removed = fs::remove(to); !removed) {
            obs::logger()->warn("remove({}) after failed clone: {}", to, removed.error().to_string());
        }
    }
    return r;
}

} // namespace detail

Capability capability_of(const fs::Stats& stats) noexcept {
    return (stats.kind == fs::Kind::Btrfs || stats.kind == fs::Kind::Xfs) ? Capability::Reflink
                                                                          : Capability::None;
}

} // namespace kprim::clone

#endif // __linux__
