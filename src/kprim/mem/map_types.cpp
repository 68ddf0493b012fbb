/**
 * @file map_types.cpp
 * @brief errno classification and labels for MapError.
 */
#include "kprim/mem/map_types.hpp"

#include <cerrno>

namespace kprim::mem {

MapError MapError::from_code(os::ErrorCode code, MapOp op) noexcept {
    Kind k = Kind::Unknown;
    switch (code.posix_value()) {
        case ENOMEM:
        case EAGAIN:
            k = Kind::OutOfMemory;
            break;
        case EACCES:
        case EPERM:
            k = Kind::PermissionDenied;
            break;
        case EINVAL:
            k = Kind::InvalidArgument;
            break;
        default:
            break;
    }
    return MapError{k, op, code};
}

std::string MapError::to_string() const {
    std::string s = mem::to_string(op);
    s += ": ";
    s += mem::to_string(kind);
    if (code.value != 0) {
        s += " (";
        s += code.to_string();
        s += ")";
    }
    return s;
}

const char* to_string(MapOp op) noexcept {
    switch (op) {
        case MapOp::Map:     return "map";
        case MapOp::Unmap:   return "unmap";
        case MapOp::Sync:    return "sync";
        case MapOp::Protect: return "protect";
    }
    return "unknown";
}

const char* to_string(MapError::Kind k) noexcept {
    using K = MapError::Kind;
    switch (k) {
        case K::InvalidLength:    return "invalid length";
        case K::InvalidAlignment: return "invalid alignment";
        case K::InvalidOffset:    return "invalid offset";
        case K::OutOfMemory:      return "out of memory";
        case K::PermissionDenied: return "permission denied";
        case K::NotMapped:        return "not mapped";
        case K::InvalidArgument:  return "invalid argument";
        case K::Unknown:          return "unknown";
    }
    return "unknown";
}

} // namespace kprim::mem
