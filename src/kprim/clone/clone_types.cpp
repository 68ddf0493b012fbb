/**
 * @file clone_types.cpp
 * @brief errno classification and labels for the clone engine vocabulary.
 */
#include "kprim/clone/clone_types.hpp"

#include <cerrno>

namespace kprim::clone {

CopyError CopyError::from_code(os::ErrorCode code, Operation op) noexcept {
    const int e = code.posix_value();
    Kind k = Kind::Unknown;
    // ENOTSUP and EOPNOTSUPP share a value on Linux, so no switch here.
    if (e == EBADF) k = Kind::InvalidDescriptor;
    else if (e == EXDEV) k = Kind::CrossDevice;
    else if (e == EINVAL || e == ENOTSUP || e == EOPNOTSUPP || e == ENOTTY || e == ENOSYS) k = Kind::Unsupported;
    else if (e == EEXIST) k = Kind::AlreadyExists;
    else if (e == ENOENT) k = Kind::NotFound;
    else if (e == EISDIR) k = Kind::IsDirectory;
    else if (e == EACCES || e == EPERM || e == EROFS) k = Kind::PermissionDenied;
    else if (e == ENOSPC || e == EDQUOT || e == EFBIG) k = Kind::NoSpace;
    else if (e == EIO) k = Kind::IoFailure;
    else if (e == EMFILE || e == ENFILE || e == ENOMEM) k = Kind::Exhausted;
    return CopyError{k, op, code};
}

std::string CopyError::to_string() const {
    std::string s = clone::to_string(kind);
    s += " during ";
    s += clone::to_string(operation);
    if (code.value != 0) {
        s += " (";
        s += code.to_string();
        s += ")";
    }
    return s;
}

const char* to_string(Behavior b) noexcept {
    switch (b) {
        case Behavior::ReflinkOrFail: return "reflink-or-fail";
        case Behavior::ReflinkOrCopy: return "reflink-or-copy";
        case Behavior::CopyOnly:      return "copy-only";
    }
    return "unknown";
}

const char* to_string(Result r) noexcept {
    switch (r) {
        case Result::Reflinked: return "reflinked";
        case Result::Copied:    return "copied";
    }
    return "unknown";
}

const char* to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Validate:      return "validate";
        case Operation::Fstat:         return "fstat";
        case Operation::Fstatfs:       return "fstatfs";
        case Operation::Open:          return "open";
        case Operation::Truncate:      return "ftruncate";
        case Operation::Ficlone:       return "ioctl(FICLONE)";
        case Operation::CopyFileRange: return "copy_file_range";
        case Operation::Seek:          return "lseek";
        case Operation::Read:          return "read";
        case Operation::Write:         return "write";
        case Operation::Clonefile:     return "clonefile";
        case Operation::Copyfile:      return "copyfile";
    }
    return "unknown";
}

const char* to_string(CopyError::Kind k) noexcept {
    using K = CopyError::Kind;
    switch (k) {
        case K::InvalidDescriptor: return "invalid descriptor";
        case K::Unsupported:       return "unsupported";
        case K::CrossDevice:       return "cross-device";
        case K::AlreadyExists:     return "already exists";
        case K::NotFound:          return "not found";
        case K::IsDirectory:       return "is a directory";
        case K::SameFile:          return "same file";
        case K::PermissionDenied:  return "permission denied";
        case K::NoSpace:           return "no space";
        case K::IoFailure:         return "i/o failure";
        case K::Exhausted:         return "resources exhausted";
        case K::Unknown:           return "unknown";
    }
    return "unknown";
}

} // namespace kprim::clone
