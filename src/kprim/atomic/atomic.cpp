/**
 * @file atomic.cpp
 * @brief Flag implementation.
 */

#include "kprim/atomic/atomic.hpp"

namespace kprim::atomic {

    bool Flag::is_set() noexcept {
        return load(value_, LoadOrdering::Acquiring) != 0;
    }

    void Flag::set() noexcept {
        store(value_, std::uint8_t{1}, StoreOrdering::Releasing);
    }

} // namespace kprim::atomic
