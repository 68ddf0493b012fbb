#pragma once
/**
 * @file error_code.hpp
 * @brief Raw platform error number (errno / GetLastError) carried by every typed error.
 * @details Typed errors (CopyError, MapError, StorageError, ...) classify a failure by kind;
 *          the ErrorCode keeps the exact number the kernel reported so nothing is lost.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace kprim::os {

    /// @brief Which numbering space the code belongs to.
    enum class ErrorDomain : std::uint8_t {
        Posix = 0,  ///< errno values
        Win32 = 1   ///< GetLastError() values
    };

    /** @struct ErrorCode
     *  @brief Platform error number tagged with its domain.
     */
    struct ErrorCode {
        ErrorDomain  domain{ErrorDomain::Posix};
        std::int64_t value{0};

        static constexpr ErrorCode posix(int e) noexcept {
            return ErrorCode{ErrorDomain::Posix, e};
        }
        static constexpr ErrorCode win32(std::uint32_t e) noexcept {
            return ErrorCode{ErrorDomain::Win32, static_cast<std::int64_t>(e)};
        }

        /// @return errno value if this is a POSIX code, otherwise -1.
        constexpr int posix_value() const noexcept {
            return domain == ErrorDomain::Posix ? static_cast<int>(value) : -1;
        }

        /// @return "posix(N)" or "win32(N)".
        std::string to_string() const;

        friend constexpr bool operator==(const ErrorCode&, const ErrorCode&) = default;
    };

    /// @brief Capture the calling thread's current errno.
    ErrorCode capture_errno() noexcept;

} // namespace kprim::os

template <>
struct std::hash<kprim::os::ErrorCode> {
    std::size_t operator()(const kprim::os::ErrorCode& c) const noexcept {
        const auto d = static_cast<std::uint64_t>(c.domain);
        return std::hash<std::uint64_t>{}((d << 56) ^ static_cast<std::uint64_t>(c.value));
    }
};
