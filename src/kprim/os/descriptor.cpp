/**
 * @file descriptor.cpp
 * @brief POSIX descriptor liveness, close, and the RAII owner.
 * @details fcntl(F_GETFD) and close(2) behave the same on Linux and Darwin, so this
 *          file is shared by both platforms.
 */
#include "kprim/os/descriptor.hpp"
#include "kprim/obs/observability.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace kprim::os {

std::optional<ValidityError> ValidityError::from_code(ErrorCode code) noexcept {
    if (code.domain != ErrorDomain::Posix) return std::nullopt;
    switch (code.posix_value()) {
        case EBADF:  return ValidityError::invalid();
        case EMFILE: return ValidityError::limit_of(DescriptorLimit::Process);
        case ENFILE: return ValidityError::limit_of(DescriptorLimit::System);
        default:     return std::nullopt;
    }
}

std::string ValidityError::to_string() const {
    if (kind == Kind::Invalid) return "invalid descriptor";
    return limit == DescriptorLimit::Process ? "too many open files in process"
                                             : "too many open files in system";
}

CloseError CloseError::from_code(ErrorCode code) noexcept {
    CloseError e;
    e.code = code;
    if (auto v = ValidityError::from_code(code)) {
        e.kind   = Kind::Handle;
        e.handle = *v;
    } else if (code.posix_value() == EIO) {
        e.kind = Kind::Io;
    } else {
        e.kind = Kind::Platform;
    }
    return e;
}

std::string CloseError::to_string() const {
    switch (kind) {
        case Kind::Handle: return "handle: " + handle.to_string();
        case Kind::Io:     return "io: " + code.to_string();
        case Kind::Platform: break;
    }
    return "platform: " + code.to_string();
}

Validity validity(Descriptor d) noexcept {
    if (!d.is_valid()) return Validity::NeverOpened;
    if (::fcntl(d.raw(), F_GETFD) != -1) return Validity::Valid;
    // F_GETFD only fails with EBADF; it never allocates, so it cannot report exhaustion.
    return Validity::Closed;
}

const char* to_string(Validity v) noexcept {
    switch (v) {
        case Validity::Valid:       return "valid";
        case Validity::Closed:      return "closed";
        case Validity::Exhausted:   return "exhausted";
        case Validity::NeverOpened: return "never-opened";
    }
    return "unknown";
}

kprim_detail::expected<void, CloseError> close(Descriptor d) noexcept {
    if (!d.is_valid()) {
        CloseError e;
        e.kind   = CloseError::Kind::Handle;
        e.handle = ValidityError::invalid();
        e.code   = ErrorCode::posix(EBADF);
        return kprim_detail::unexpected(e);
    }
    // Do not retry on EINTR: Linux releases the descriptor before reporting it.
    if (::close(d.raw()) != 0) {
        return kprim_detail::unexpected(CloseError::from_code(capture_errno()));
    }
    return {};
}

UniqueDescriptor::~UniqueDescriptor() {
    if (!d_.is_valid()) return;
    if (auto r = kprim::os::close(d_); !r) {
        obs::logger()->warn("close(fd={}) on release failed: {}", d_.raw(), r.error().to_string());
    }
}

UniqueDescriptor& UniqueDescriptor::operator=(UniqueDescriptor&& other) noexcept {
    if (this != &other) {
        if (d_.is_valid()) {
            if (auto r = kprim::os::close(d_); !r) {
                obs::logger()->warn("close(fd={}) on reassign failed: {}", d_.raw(), r.error().to_string());
            }
        }
        d_ = other.release();
    }
    return *this;
}

kprim_detail::expected<void, CloseError> UniqueDescriptor::close() noexcept {
    return kprim::os::close(release());
}

} // namespace kprim::os
