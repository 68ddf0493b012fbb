/**
 * @file clone.cpp
 * @brief Behavior dispatch, same-device pre-check and event recording for the clone engine.
 */
#include "kprim/clone/clone.hpp"
#include "kprim/obs/observability.hpp"
#include "clone_platform.hpp"

#include <cerrno>
#include <utility>

namespace kprim::clone {

namespace {

CopyError from_storage(const fs::StorageError& e, Operation op) noexcept {
    return CopyError::from_code(e.code, op);
}

kprim_detail::expected<Result, CopyError>
finish(kprim_detail::expected<Result, CopyError> r, int from_fd, int to_fd,
       Behavior behavior, bool attempted_clone) noexcept {
    obs::CloneEvent ev;
    ev.from_fd         = from_fd;
    ev.to_fd           = to_fd;
    ev.behavior        = behavior;
    ev.attempted_clone = attempted_clone;
    if (r) {
        ev.result = *r;
    } else {
        ev.error = r.error();
        obs::logger()->warn("clone ({}) failed: {}", to_string(behavior), r.error().to_string());
    }
    obs::make_spdlog_observer()->record(ev);
    return r;
}

kprim_detail::expected<Result, CopyError> copy(os::Descriptor from, os::Descriptor to) noexcept {
    if (auto r = detail::copy_bytes(from, to); !r) return kprim_detail::unexpected(r.error());
    return Result::Copied;
}

} // namespace

namespace detail {

kprim_detail::expected<Result, CopyError>
run(os::Descriptor from, os::Descriptor to, Behavior behavior, bool& attempted_clone) noexcept {
    attempted_clone = false;
    if (!from.is_valid() || !to.is_valid()) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::InvalidDescriptor,
                                                      Operation::Validate, os::ErrorCode::posix(EBADF)));
    }
    // Truncating the destination would empty the source too.
    const auto identical = fs::same_file(from, to);
    if (!identical) return kprim_detail::unexpected(from_storage(identical.error(), Operation::Fstat));
    if (*identical) {
        return kprim_detail::unexpected(CopyError::of(CopyError::Kind::SameFile, Operation::Fstat,
                                                      os::ErrorCode::posix(EINVAL)));
    }

    if (behavior == Behavior::CopyOnly) return copy(from, to);

    const auto same = fs::same_device(from, to);
    if (!same) return kprim_detail::unexpected(from_storage(same.error(), Operation::Fstat));

    CopyError why;
    if (!*same) {
        why = CopyError::of(CopyError::Kind::CrossDevice, Operation::Fstat, os::ErrorCode::posix(EXDEV));
    } else {
        attempted_clone = true;
        const auto cloned = reflink(from, to);
        if (cloned) return Result::Reflinked;
        why = cloned.error();
    }

    if (!why.is_structural() || behavior == Behavior::ReflinkOrFail) {
        return kprim_detail::unexpected(why);
    }
    obs::logger()->debug("reflink unavailable ({}), copying bytes", why.to_string());
    return copy(from, to);
}

} // namespace detail

kprim_detail::expected<Result, CopyError>
perform(os::Descriptor from, os::Descriptor to, Behavior behavior) noexcept {
    bool attempted = false;
    auto r = detail::run(from, to, behavior, attempted);
    return finish(std::move(r), from.raw(), to.raw(), behavior, attempted);
}

kprim_detail::expected<Result, CopyError>
file(const std::string& from, const std::string& to, Behavior behavior) noexcept {
    bool attempted = false;
    auto r = detail::run_paths(from, to, behavior, attempted);
    return finish(std::move(r), -1, -1, behavior, attempted);
}

kprim_detail::expected<Capability, fs::StorageError> probe_capability(os::Descriptor d) noexcept {
    const auto st = fs::stats(d);
    if (!st) return kprim_detail::unexpected(st.error());
    return capability_of(*st);
}

kprim_detail::expected<Capability, fs::StorageError> probe_capability(const std::string& path) noexcept {
    const auto st = fs::stats(path);
    if (!st) return kprim_detail::unexpected(st.error());
    return capability_of(*st);
}

} // namespace kprim::clone
