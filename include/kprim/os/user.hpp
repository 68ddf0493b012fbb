#pragma once
/**
 * @file user.hpp
 * @brief Process user identity.
 */

#include <cstdint>
#include <functional>

namespace kprim::os::user {

    /** @class Id
     *  @brief Strongly-typed numeric user id. Id(0) is the superuser.
     */
    class Id {
    public:
        using raw_type = std::uint32_t;

        constexpr explicit Id(raw_type v) noexcept : v_(v) {}

        static constexpr Id root() noexcept { return Id{0}; }

        constexpr raw_type raw() const noexcept { return v_; }
        constexpr bool is_root() const noexcept { return v_ == 0; }

        friend constexpr bool operator==(Id, Id) = default;

    private:
        raw_type v_;
    };

    /// @brief Real user id of the calling process.
    Id current() noexcept;

    /// @brief Effective user id (what permission checks use).
    Id effective() noexcept;

} // namespace kprim::os::user

template <>
struct std::hash<kprim::os::user::Id> {
    std::size_t operator()(kprim::os::user::Id id) const noexcept {
        return std::hash<std::uint32_t>{}(id.raw());
    }
};
