/**
 * @file error_code.cpp
 * @brief ErrorCode rendering and errno capture.
 */
#include "kprim/os/error_code.hpp"

#include <cerrno>

namespace kprim::os {

std::string ErrorCode::to_string() const {
    const char* tag = (domain == ErrorDomain::Posix) ? "posix(" : "win32(";
    return std::string(tag) + std::to_string(value) + ")";
}

ErrorCode capture_errno() noexcept {
    return ErrorCode::posix(errno);
}

} // namespace kprim::os
