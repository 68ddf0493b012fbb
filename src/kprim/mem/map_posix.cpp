/**
 * @file map_posix.cpp
 * @brief mmap/munmap/msync/mprotect/madvise backed Region engine (Linux and Darwin).
 */
#include "kprim/mem/map.hpp"
#include "kprim/obs/observability.hpp"

#include <cerrno>
#include <limits>
#include <sys/mman.h>
#include <unistd.h>

namespace kprim::mem {

namespace {

int encode(Protection p) noexcept {
    int prot = PROT_NONE;
    if (p.contains(Protection::Read))    prot |= PROT_READ;
    if (p.contains(Protection::Write))   prot |= PROT_WRITE;
    if (p.contains(Protection::Execute)) prot |= PROT_EXEC;
    return prot;
}

int encode(MapFlags f) noexcept {
    int flags = 0;
    if (f.contains(MapFlags::Shared))    flags |= MAP_SHARED;
    if (f.contains(MapFlags::Private))   flags |= MAP_PRIVATE;
    if (f.contains(MapFlags::Anonymous)) flags |= MAP_ANONYMOUS;
    if (f.contains(MapFlags::Fixed))     flags |= MAP_FIXED;
    return flags;
}

int encode(SyncFlags f) noexcept {
    int flags = 0;
    // MS_SYNC and MS_ASYNC are mutually exclusive for the kernel; the blocking flush covers both.
    if (f.contains(SyncFlags::Sync))       flags |= MS_SYNC;
    else if (f.contains(SyncFlags::Async)) flags |= MS_ASYNC;
    if (f.contains(SyncFlags::Invalidate)) flags |= MS_INVALIDATE;
    return flags;
}

int encode(Advice a) noexcept {
    switch (a) {
        case Advice::Normal:     return MADV_NORMAL;
        case Advice::Sequential: return MADV_SEQUENTIAL;
        case Advice::Random:     return MADV_RANDOM;
        case Advice::WillNeed:   return MADV_WILLNEED;
        case Advice::DontNeed:   return MADV_DONTNEED;
    }
    return MADV_NORMAL;
}

const char* label(Advice a) noexcept {
    switch (a) {
        case Advice::Normal:     return "normal";
        case Advice::Sequential: return "sequential";
        case Advice::Random:     return "random";
        case Advice::WillNeed:   return "will-need";
        case Advice::DontNeed:   return "dont-need";
    }
    return "unknown";
}

void report(MapOp op, std::size_t length, bool shared, const MapError* error) noexcept {
    obs::MapEvent ev;
    ev.op     = op;
    ev.length = length;
    ev.shared = shared;
    if (error) ev.error = *error;
    obs::make_spdlog_observer()->record(ev);
}

kprim_detail::unexpected<MapError> fail(MapError e, std::size_t length, bool shared) noexcept {
    report(e.op, length, shared, &e);
    return kprim_detail::unexpected(e);
}

struct Extent {
    void*       base;
    std::size_t length;
};

kprim_detail::expected<Extent, MapError>
map_raw(int fd, off_t offset, std::size_t length, Protection protection, bool shared,
        MapFlags extra) noexcept {
    if (length == 0) {
        return fail(MapError::of(MapError::Kind::InvalidLength, MapOp::Map), length, shared);
    }
    const auto rounded = round_to_pages(length);
    if (!rounded) {
        return fail(MapError::of(MapError::Kind::InvalidLength, MapOp::Map), length, shared);
    }
    const MapFlags flags = (shared ? MapFlags::Shared : MapFlags::Private) | extra;
    void* base = ::mmap(nullptr, *rounded, encode(protection), encode(flags), fd, offset);
    if (base == MAP_FAILED) {
        return fail(MapError::from_code(os::capture_errno(), MapOp::Map), *rounded, shared);
    }
    report(MapOp::Map, *rounded, shared, nullptr);
    return Extent{base, *rounded};
}

} // namespace

std::size_t page_size() noexcept {
    static const std::size_t ps = [] {
        const long v = ::sysconf(_SC_PAGESIZE);
        return v > 0 ? static_cast<std::size_t>(v) : std::size_t{4096};
    }();
    return ps;
}

std::optional<std::size_t> round_to_pages(std::size_t length) noexcept {
    const std::size_t ps = page_size();
    if (length > std::numeric_limits<std::size_t>::max() - (ps - 1)) return std::nullopt;
    return (length + ps - 1) / ps * ps;
}

Region::~Region() {
    if (!mapped_) return;
    if (auto r = unmap(*this); !r) {
        obs::logger()->warn("munmap(len={}) on release failed: {}", length_, r.error().to_string());
    }
}

Region& Region::operator=(Region&& other) noexcept {
    if (this != &other) {
        if (mapped_) {
            if (auto r = unmap(*this); !r) {
                obs::logger()->warn("munmap(len={}) on reassign failed: {}", length_, r.error().to_string());
            }
        }
        move_from(other);
    }
    return *this;
}

void Region::move_from(Region& other) noexcept {
    base_       = other.base_;
    length_     = other.length_;
    protection_ = other.protection_;
    shared_     = other.shared_;
    mapped_     = other.mapped_;
    other.base_   = nullptr;
    other.length_ = 0;
    other.mapped_ = false;
}

kprim_detail::expected<Region, MapError>
map_anonymous(std::size_t length, Protection protection, bool shared) noexcept {
    const auto ext = map_raw(-1, 0, length, protection, shared, MapFlags::Anonymous);
    if (!ext) return kprim_detail::unexpected(ext.error());
    return Region(ext->base, ext->length, protection, shared);
}

kprim_detail::expected<Region, MapError>
map_file(os::Descriptor d, std::uint64_t offset, std::size_t length,
         Protection protection, bool shared) noexcept {
    if (offset % page_size() != 0 ||
        offset > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max())) {
        return fail(MapError::of(MapError::Kind::InvalidOffset, MapOp::Map), length, shared);
    }
    if (!d.is_valid()) {
        return fail(MapError::from_code(os::ErrorCode::posix(EBADF), MapOp::Map), length, shared);
    }
    const auto ext = map_raw(d.raw(), static_cast<off_t>(offset), length, protection, shared, MapFlags{});
    if (!ext) return kprim_detail::unexpected(ext.error());
    return Region(ext->base, ext->length, protection, shared);
}

kprim_detail::expected<void, MapError> unmap(Region& region) noexcept {
    if (!region.mapped_) {
        const auto e = MapError::of(MapError::Kind::NotMapped, MapOp::Unmap);
        report(MapOp::Unmap, 0, region.shared_, &e);
        return kprim_detail::unexpected(e);
    }
    if (::munmap(region.base_, region.length_) != 0) {
        const auto e = MapError::from_code(os::capture_errno(), MapOp::Unmap);
        report(MapOp::Unmap, region.length_, region.shared_, &e);
        return kprim_detail::unexpected(e);
    }
    report(MapOp::Unmap, region.length_, region.shared_, nullptr);
    region.mapped_ = false;
    region.base_   = nullptr;
    return {};
}

kprim_detail::expected<void, MapError> sync(Region& region, SyncFlags flags) noexcept {
    if (!region.mapped()) {
        const auto e = MapError::of(MapError::Kind::NotMapped, MapOp::Sync);
        report(MapOp::Sync, 0, region.shared(), &e);
        return kprim_detail::unexpected(e);
    }
    if (::msync(region.base(), region.length(), encode(flags)) != 0) {
        const auto e = MapError::from_code(os::capture_errno(), MapOp::Sync);
        report(MapOp::Sync, region.length(), region.shared(), &e);
        return kprim_detail::unexpected(e);
    }
    return {};
}

kprim_detail::expected<void, MapError> protect(Region& region, Protection protection) noexcept {
    if (!region.mapped_) {
        const auto e = MapError::of(MapError::Kind::NotMapped, MapOp::Protect);
        report(MapOp::Protect, 0, region.shared_, &e);
        return kprim_detail::unexpected(e);
    }
    if (::mprotect(region.base_, region.length_, encode(protection)) != 0) {
        const auto e = MapError::from_code(os::capture_errno(), MapOp::Protect);
        report(MapOp::Protect, region.length_, region.shared_, &e);
        return kprim_detail::unexpected(e);
    }
    region.protection_ = protection;
    return {};
}

void advise(Region& region, Advice advice) noexcept {
    if (!region.mapped()) return;
    if (::madvise(region.base(), region.length(), encode(advice)) != 0) {
        obs::logger()->debug("madvise({}) ignored: {}", label(advice), os::capture_errno().to_string());
    }
}

} // namespace kprim::mem
