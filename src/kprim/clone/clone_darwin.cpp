/**
 * @file clone_darwin.cpp
 * @brief Darwin backend: clonefile()/copyfile() for paths, fcopyfile() for descriptors.
 * @details Darwin has no descriptor-to-descriptor clone call, so reflink() always reports a
 *          structural Unsupported and perform() copies under ReflinkOrCopy.
 */
#if defined(__APPLE__)

#include "clone_platform.hpp"
#include "kprim/clone/clone.hpp"
#include "kprim/obs/observability.hpp"

#include <cerrno>

#include <copyfile.h>
#include <sys/clonefile.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kprim::clone {

namespace {

kprim_detail::unexpected<CopyError> fail(Operation op) noexcept {
    return kprim_detail::unexpected(CopyError::from_code(os::capture_errno(), op));
}

kprim_detail::expected<Result, CopyError> copy_path(const std::string& from, const std::string& to) noexcept {
    if (::copyfile(from.c_str(), to.c_str(), nullptr, COPYFILE_DATA | COPYFILE_EXCL) != 0) {
        return fail(Operation::Copyfile);
    }
    return Result::Copied;
}

} // namespace

namespace detail {

kprim_detail::expected<void, CopyError> reflink(os::Descriptor, os::Descriptor) noexcept {
    return kprim_detail::unexpected(CopyError::of(CopyError::Kind::Unsupported, Operation::Clonefile,
                                                  os::ErrorCode::posix(ENOTSUP)));
}

kprim_detail::expected<void, CopyError> copy_bytes(os::Descriptor from, os::Descriptor to) noexcept {
    if (::ftruncate(to.raw(), 0) != 0) return fail(Operation::Truncate);
    // fcopyfile works from the current offsets; start both at the beginning.
    if (::lseek(from.raw(), 0, SEEK_SET) < 0) return fail(Operation::Seek);
    if (::lseek(to.raw(), 0, SEEK_SET) < 0) return fail(Operation::Seek);
    if (::fcopyfile(from.raw(), to.raw(), nullptr, COPYFILE_DATA) != 0) return fail(Operation::Copyfile);
    return {};
}

kprim_detail::expected<Result, CopyError>
run_paths(const std::string& from, const std::string& to, Behavior behavior, bool& attempted_clone) noexcept {
    attempted_clone = false;
    struct stat st{};
    if (::stat(from.c_str(), &st) != 0) return fail(Operation::Open);
    if (S_ISDIR(st.st_mode)) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::IsDirectory, Operation::Open,
                                                      os::ErrorCode::posix(EISDIR)));
    }
    if (::lstat(to.c_str(), &st) == 0) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::AlreadyExists, Operation::Open,
                                                      os::ErrorCode::posix(EEXIST)));
    }

    if (behavior == Behavior::CopyOnly) return copy_path(from, to);

    attempted_clone = true;
    if (::clonefile(from.c_str(), to.c_str(), 0) == 0) return Result::Reflinked;
    const CopyError why = CopyError::from_code(os::capture_errno(), Operation::Clonefile);
    if (!why.is_structural() || behavior == Behavior::ReflinkOrFail) {
        return kprim_detail::unexpected(why);
    }
    obs::logger()->debug("clonefile unavailable ({}), copying bytes", why.to_string());
    return copy_path(from, to);
}

} // namespace detail

Capability capability_of(const fs::Stats& stats) noexcept {
    return (stats.type_name && *stats.type_name == "apfs") ? Capability::Reflink : Capability::None;
}

} // namespace kprim::clone

#endif // __APPLE__
