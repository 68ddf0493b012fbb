#pragma once
/**
 * @file descriptor.hpp
 * @brief Opaque handle to an open OS resource, its liveness check, and an RAII owner.
 *
 * Ownership model:
 *  - Descriptor is a plain value (copyable); it does not own anything.
 *  - UniqueDescriptor owns exactly one descriptor and closes it once (explicitly or on destruction).
 *  - Using a Descriptor after it was closed is a programming error; validity() detects it
 *    best-effort only, since the kernel reuses descriptor numbers.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "kprim/compat/expected.hpp"  // kprim_detail::expected / unexpected
#include "kprim/os/error_code.hpp"

namespace kprim::os {

/**
 * @class Descriptor
 * @brief Value wrapper over the raw platform handle (int on POSIX).
 */
class Descriptor {
public:
    using raw_type = int;

    constexpr Descriptor() noexcept = default;
    constexpr explicit Descriptor(raw_type raw) noexcept : raw_(raw) {}

    /// @brief The sentinel that never refers to a resource.
    static constexpr Descriptor invalid() noexcept { return Descriptor{}; }

    constexpr raw_type raw() const noexcept { return raw_; }

    /// @brief Structural check only (raw >= 0). Use kprim::os::validity() for a kernel check.
    constexpr bool is_valid() const noexcept { return raw_ >= 0; }

    friend constexpr bool operator==(Descriptor, Descriptor) = default;

private:
    raw_type raw_{-1};
};

/// @brief Result of the liveness query.
enum class Validity : std::uint8_t {
    Valid,        ///< Not obviously invalid (may still be a reused number)
    Closed,       ///< Kernel reports no such open descriptor
    Exhausted,    ///< Descriptor table limit (EMFILE/ENFILE); reported by calls that allocate, never by validity()
    NeverOpened   ///< Structurally invalid (sentinel / negative)
};

/// @brief Which descriptor table ran out.
enum class DescriptorLimit : std::uint8_t {
    Process,  ///< EMFILE
    System    ///< ENFILE
};

/**
 * @struct ValidityError
 * @brief Descriptor-level failure: invalid handle, or a table limit.
 */
struct ValidityError {
    enum class Kind : std::uint8_t { Invalid, Limit };

    Kind            kind{Kind::Invalid};
    DescriptorLimit limit{DescriptorLimit::Process}; ///< Meaningful only for Kind::Limit

    static constexpr ValidityError invalid() noexcept { return {Kind::Invalid, DescriptorLimit::Process}; }
    static constexpr ValidityError limit_of(DescriptorLimit l) noexcept { return {Kind::Limit, l}; }

    /// @brief Map EBADF/EMFILE/ENFILE; std::nullopt for anything else.
    static std::optional<ValidityError> from_code(ErrorCode code) noexcept;

    std::string to_string() const;

    friend constexpr bool operator==(const ValidityError& a, const ValidityError& b) noexcept {
        return a.kind == b.kind && (a.kind != Kind::Limit || a.limit == b.limit);
    }
};

/**
 * @struct CloseError
 * @brief Failure of close(): handle problem, I/O error flushed at close, or platform code.
 */
struct CloseError {
    enum class Kind : std::uint8_t { Handle, Io, Platform };

    Kind          kind{Kind::Platform};
    ValidityError handle{};   ///< Meaningful only for Kind::Handle
    ErrorCode     code{};

    static CloseError from_code(ErrorCode code) noexcept;

    std::string to_string() const;

    friend bool operator==(const CloseError&, const CloseError&) = default;
};

/**
 * @brief Query whether @p d currently refers to an open resource.
 * @note No side effects; never crashes on garbage or already-closed handles.
 */
Validity validity(Descriptor d) noexcept;

/// @brief Convenience: validity(d) == Validity::Valid.
inline bool is_valid(Descriptor d) noexcept { return validity(d) == Validity::Valid; }

/// @brief Short label for logs ("valid", "closed", ...).
const char* to_string(Validity v) noexcept;

/**
 * @brief Close @p d. Structurally invalid descriptors are rejected before any syscall.
 * @note The descriptor is released by the kernel even when close reports EIO.
 */
kprim_detail::expected<void, CloseError> close(Descriptor d) noexcept;

/**
 * @class UniqueDescriptor
 * @brief Move-only owner of a Descriptor; closes it exactly once.
 */
class UniqueDescriptor {
public:
    UniqueDescriptor() noexcept = default;
    explicit UniqueDescriptor(Descriptor d) noexcept : d_(d) {}
    ~UniqueDescriptor();

    UniqueDescriptor(const UniqueDescriptor&)            = delete;
    UniqueDescriptor& operator=(const UniqueDescriptor&) = delete;

    UniqueDescriptor(UniqueDescriptor&& other) noexcept : d_(other.release()) {}
    UniqueDescriptor& operator=(UniqueDescriptor&& other) noexcept;

    Descriptor get() const noexcept { return d_; }
    explicit operator bool() const noexcept { return d_.is_valid(); }

    /// @brief Give up ownership without closing.
    Descriptor release() noexcept {
        const Descriptor d = d_;
        d_ = Descriptor::invalid();
        return d;
    }

    /// @brief Close now and report the outcome; the owner is empty afterwards.
    kprim_detail::expected<void, CloseError> close() noexcept;

private:
    Descriptor d_{};
};

} // namespace kprim::os

template <>
struct std::hash<kprim::os::Descriptor> {
    std::size_t operator()(kprim::os::Descriptor d) const noexcept {
        return std::hash<int>{}(d.raw());
    }
};
