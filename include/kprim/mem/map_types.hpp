#pragma once
/**
 * @file map_types.hpp
 * @brief Flag sets and error vocabulary of the memory map engine.
 *
 * Bit values are platform-neutral; the platform encoding (PROT_*, MAP_*, MS_*) is applied
 * inside the implementation so callers never see it.
 */

#include <cstdint>
#include <functional>
#include <string>

#include "kprim/os/error_code.hpp"

namespace kprim::mem {

/**
 * @brief Fixed-width bitmask newtype with named constants.
 * Equality and hashing operate on the raw bits: two sets with the same bits are interchangeable.
 * @tparam Derived The concrete flag family (CRTP), so unrelated families never mix.
 */
template <class Derived>
class BitFlags {
public:
    using raw_type = std::uint32_t;

    constexpr BitFlags() noexcept = default;
    constexpr explicit BitFlags(raw_type raw) noexcept : raw_(raw) {}

    constexpr raw_type raw() const noexcept { return raw_; }
    constexpr bool empty() const noexcept { return raw_ == 0; }

    /// @brief True when every bit of @p other is also set here.
    constexpr bool contains(Derived other) const noexcept {
        return (raw_ & other.raw()) == other.raw();
    }

    constexpr Derived combine(Derived other) const noexcept { return Derived{raw_ | other.raw()}; }
    constexpr Derived without(Derived other) const noexcept { return Derived{raw_ & ~other.raw()}; }

    friend constexpr Derived operator|(Derived a, Derived b) noexcept { return a.combine(b); }
    friend constexpr bool operator==(Derived a, Derived b) noexcept { return a.raw() == b.raw(); }

private:
    raw_type raw_{0};
};

/// @brief Access permitted on a mapping (read / write / execute combination).
class Protection : public BitFlags<Protection> {
public:
    using BitFlags::BitFlags;

    static const Protection None;
    static const Protection Read;
    static const Protection Write;
    static const Protection Execute;
    static const Protection ReadWrite;
};

inline constexpr Protection Protection::None{0};
inline constexpr Protection Protection::Read{1u << 0};
inline constexpr Protection Protection::Write{1u << 1};
inline constexpr Protection Protection::Execute{1u << 2};
inline constexpr Protection Protection::ReadWrite{(1u << 0) | (1u << 1)};

/// @brief Mapping kind (shared vs private, anonymous, fixed address).
class MapFlags : public BitFlags<MapFlags> {
public:
    using BitFlags::BitFlags;

    static const MapFlags Shared;
    static const MapFlags Private;
    static const MapFlags Anonymous;
    static const MapFlags Fixed;
};

inline constexpr MapFlags MapFlags::Shared{1u << 0};
inline constexpr MapFlags MapFlags::Private{1u << 1};
inline constexpr MapFlags MapFlags::Anonymous{1u << 2};
inline constexpr MapFlags MapFlags::Fixed{1u << 3};

/**
 * @brief Flush semantics for sync(): independent, combinable bits.
 *  - Sync: block until dirty pages are written.
 *  - Async: schedule the write and return.
 *  - Invalidate: drop other mappings' stale cached copies.
 */
class SyncFlags : public BitFlags<SyncFlags> {
public:
    using BitFlags::BitFlags;

    static const SyncFlags Sync;
    static const SyncFlags Async;
    static const SyncFlags Invalidate;
};

inline constexpr SyncFlags SyncFlags::Sync{1u << 0};
inline constexpr SyncFlags SyncFlags::Async{1u << 1};
inline constexpr SyncFlags SyncFlags::Invalidate{1u << 2};

/// @brief Access-pattern hint for advise().
enum class Advice : std::uint8_t {
    Normal,
    Sequential,
    Random,
    WillNeed,
    DontNeed
};

/// @brief Engine operation that failed.
enum class MapOp : std::uint8_t { Map, Unmap, Sync, Protect };

/**
 * @struct MapError
 * @brief Memory map failure: kind + operation + raw platform code.
 */
struct MapError {
    enum class Kind : std::uint8_t {
        InvalidLength,     ///< Zero, or overflows when rounded to pages (caller bug)
        InvalidAlignment,  ///< Address not page aligned
        InvalidOffset,     ///< File offset not page aligned
        OutOfMemory,       ///< ENOMEM / EAGAIN from the kernel
        PermissionDenied,  ///< EACCES / EPERM
        NotMapped,         ///< Region already released (double unmap / sync after unmap)
        InvalidArgument,   ///< EINVAL from the kernel
        Unknown            ///< Anything else; see code
    };

    Kind          kind{Kind::Unknown};
    MapOp         op{MapOp::Map};
    os::ErrorCode code{};

    static MapError from_code(os::ErrorCode code, MapOp op) noexcept;

    static MapError of(Kind k, MapOp op, os::ErrorCode code = {}) noexcept {
        return MapError{k, op, code};
    }

    std::string to_string() const;

    friend bool operator==(const MapError&, const MapError&) = default;
};

const char* to_string(MapOp op) noexcept;
const char* to_string(MapError::Kind k) noexcept;

} // namespace kprim::mem

template <>
struct std::hash<kprim::mem::Protection> {
    std::size_t operator()(kprim::mem::Protection f) const noexcept {
        return std::hash<std::uint32_t>{}(f.raw());
    }
};

template <>
struct std::hash<kprim::mem::MapFlags> {
    std::size_t operator()(kprim::mem::MapFlags f) const noexcept {
        return std::hash<std::uint32_t>{}(f.raw());
    }
};

template <>
struct std::hash<kprim::mem::SyncFlags> {
    std::size_t operator()(kprim::mem::SyncFlags f) const noexcept {
        return std::hash<std::uint32_t>{}(f.raw());
    }
};
