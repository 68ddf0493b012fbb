/**
 * @file user.cpp
 * @brief getuid/geteuid wrappers.
 */
#include "kprim/os/user.hpp"

#include <unistd.h>

namespace kprim::os::user {

Id current() noexcept {
    return Id{static_cast<Id::raw_type>(::getuid())};
}

Id effective() noexcept {
    return Id{static_cast<Id::raw_type>(::geteuid())};
}

} // namespace kprim::os::user
