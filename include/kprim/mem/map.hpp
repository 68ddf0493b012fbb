#pragma once
/**
 * @file map.hpp
 * @brief Memory map engine: anonymous (and file-backed) virtual memory regions.
 *
 * Lifecycle:
 *  - map_anonymous()/map_file() create a Region; unmap() releases it exactly once.
 *  - A second unmap() (or sync()/protect() after unmap) fails with MapError::Kind::NotMapped;
 *    it never touches the address range again.
 *  - A Region still mapped when destroyed is released by its destructor.
 *
 * Rules:
 *  - Zero length is rejected before any syscall.
 *  - Lengths are rounded up to the page size; Region::length() is the page-aligned ceiling,
 *    not necessarily the requested byte count.
 *  - Protection violations are hardware faults (SIGSEGV/SIGBUS), not recoverable errors.
 *  - Regions are not internally synchronized. Shared regions need external discipline for
 *    concurrent writers.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "kprim/compat/expected.hpp"
#include "kprim/mem/map_types.hpp"
#include "kprim/os/descriptor.hpp"

namespace kprim::mem {

/**
 * @class Region
 * @brief Exclusively owned mapped extent: base, page-aligned length, protection, sharing.
 */
class Region {
public:
    /// @brief Empty shell (not mapped). Real regions come from map_anonymous()/map_file().
    Region() noexcept = default;
    ~Region();

    Region(const Region&)            = delete; ///< Non-copyable: one owner per extent
    Region& operator=(const Region&) = delete;

    Region(Region&& other) noexcept { move_from(other); }
    Region& operator=(Region&& other) noexcept;

    /// @brief Base address. Non-null while mapped().
    void* base() const noexcept { return base_; }

    /// @brief Length in bytes (multiple of page_size()).
    std::size_t length() const noexcept { return length_; }

    Protection protection() const noexcept { return protection_; }
    bool shared() const noexcept { return shared_; }
    bool mapped() const noexcept { return mapped_; }

    /// @brief Byte view over the whole extent (empty when not mapped).
    std::span<std::byte> bytes() const noexcept {
        return mapped_ ? std::span<std::byte>(static_cast<std::byte*>(base_), length_)
                       : std::span<std::byte>{};
    }

private:
    friend kprim_detail::expected<Region, MapError>
    map_anonymous(std::size_t, Protection, bool) noexcept;
    friend kprim_detail::expected<Region, MapError>
    map_file(os::Descriptor, std::uint64_t, std::size_t, Protection, bool) noexcept;
    friend kprim_detail::expected<void, MapError> unmap(Region&) noexcept;
    friend kprim_detail::expected<void, MapError> protect(Region&, Protection) noexcept;

    Region(void* base, std::size_t length, Protection prot, bool shared) noexcept
        : base_(base), length_(length), protection_(prot), shared_(shared), mapped_(true) {}

    void move_from(Region& other) noexcept;

    void*       base_{nullptr};
    std::size_t length_{0};
    Protection  protection_{};
    bool        shared_{false};
    bool        mapped_{false};
};

/// @brief Platform page size in bytes (queried once).
std::size_t page_size() noexcept;

/// @brief Round @p length up to a page multiple; std::nullopt on overflow.
std::optional<std::size_t> round_to_pages(std::size_t length) noexcept;

/**
 * @brief Map anonymous memory.
 * @param length Requested bytes (> 0); rounded up to the page size.
 * @param protection Initial access (default read|write).
 * @param shared false: private copy-on-write; true: shared with other mappings of the same object.
 */
kprim_detail::expected<Region, MapError>
map_anonymous(std::size_t length,
              Protection protection = Protection::ReadWrite,
              bool shared = false) noexcept;

/**
 * @brief Map @p length bytes of the file behind @p d starting at page-aligned @p offset.
 * @param shared true writes through to the file; false gives a private copy-on-write view.
 */
kprim_detail::expected<Region, MapError>
map_file(os::Descriptor d, std::uint64_t offset, std::size_t length,
         Protection protection = Protection::Read, bool shared = false) noexcept;

/// @brief Release @p region. Second call fails with NotMapped.
kprim_detail::expected<void, MapError> unmap(Region& region) noexcept;

/// @brief Flush dirty pages of @p region according to @p flags.
kprim_detail::expected<void, MapError> sync(Region& region, SyncFlags flags = SyncFlags::Sync) noexcept;

/// @brief Change the access permitted on @p region.
kprim_detail::expected<void, MapError> protect(Region& region, Protection protection) noexcept;

/// @brief Advisory access-pattern hint; kernel refusal is ignored.
void advise(Region& region, Advice advice) noexcept;

} // namespace kprim::mem
