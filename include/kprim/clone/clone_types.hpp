#pragma once
/**
 * @file clone_types.hpp
 * @brief Policy, outcome and error vocabulary of the file clone engine.
 * @details All types are plain values with no shared mutable state, so they are safe to move
 *          across threads.
 */

#include <cstdint>
#include <functional>
#include <string>

#include "kprim/os/error_code.hpp"

namespace kprim::clone {

/**
 * @enum Behavior
 * @brief Caller-selected strategy for one clone call.
 * @note Three independent strategies; no strictness order is implied.
 */
enum class Behavior : std::uint8_t {
    ReflinkOrFail = 0,  ///< Shared-extent clone only; report why when it is unavailable
    ReflinkOrCopy = 1,  ///< Shared-extent clone; byte copy when cloning is structurally unavailable
    CopyOnly      = 2   ///< Never issue the clone syscall; always byte copy
};

/**
 * @enum Result
 * @brief Which path executed. Only produced on success.
 */
enum class Result : std::uint8_t {
    Reflinked = 0,  ///< Destination shares extents with the source (copy-on-write)
    Copied    = 1   ///< Destination holds its own copy of every byte
};

/// @brief Whether a filesystem is known to support shared-extent cloning.
enum class Capability : std::uint8_t {
    Reflink = 0,
    None    = 1
};

/// @brief Syscall (or step) that produced a CopyError.
enum class Operation : std::uint8_t {
    Validate,
    Fstat,
    Fstatfs,
    Open,
    Truncate,
    Ficlone,
    CopyFileRange,
    Seek,
    Read,
    Write,
    Clonefile,
    Copyfile
};

/**
 * @struct CopyError
 * @brief Unified clone/copy failure: semantic kind + failing operation + raw platform code.
 */
struct CopyError {
    enum class Kind : std::uint8_t {
        InvalidDescriptor,  ///< Bad or closed descriptor
        Unsupported,        ///< No clone primitive for this pair/filesystem/platform
        CrossDevice,        ///< Source and destination live on different devices
        AlreadyExists,      ///< Destination exists and the platform clone call refuses it
        NotFound,           ///< Source path does not exist
        IsDirectory,        ///< Source or destination is a directory
        SameFile,           ///< Source and destination are the same file; never copied onto itself
        PermissionDenied,   ///< EACCES / EPERM / EROFS
        NoSpace,            ///< ENOSPC / EDQUOT
        IoFailure,          ///< EIO
        Exhausted,          ///< Descriptor or memory limit reached
        Unknown             ///< Anything else; see code
    };

    Kind           kind{Kind::Unknown};
    Operation      operation{Operation::Validate};
    os::ErrorCode  code{};

    /// @brief Classify a raw platform code produced by @p op.
    static CopyError from_code(os::ErrorCode code, Operation op) noexcept;

    static CopyError of(Kind k, Operation op, os::ErrorCode code = {}) noexcept {
        return CopyError{k, op, code};
    }

    /// @brief True when cloning is unavailable for this pair (the case a fallback copy addresses).
    constexpr bool is_structural() const noexcept {
        return kind == Kind::Unsupported || kind == Kind::CrossDevice || kind == Kind::AlreadyExists;
    }

    std::string to_string() const;

    friend bool operator==(const CopyError&, const CopyError&) = default;
};

const char* to_string(Behavior b) noexcept;
const char* to_string(Result r) noexcept;
const char* to_string(Operation op) noexcept;
const char* to_string(CopyError::Kind k) noexcept;

} // namespace kprim::clone

template <>
struct std::hash<kprim::clone::CopyError> {
    std::size_t operator()(const kprim::clone::CopyError& e) const noexcept {
        const std::size_t tag = (static_cast<std::size_t>(e.kind) << 8) | static_cast<std::size_t>(e.operation);
        return tag ^ (std::hash<kprim::os::ErrorCode>{}(e.code) << 1);
    }
};
