/**
 * @file test_map.cpp
 * @brief Tests for the memory map engine (Region lifecycle, flags, sync/protect/advise).
 */
#include <gtest/gtest.h>
#include <cerrno>
#include <cstring>
#include <limits>
#include <unordered_set>

#include "kprim/fs/file.hpp"
#include "kprim/mem/map.hpp"
#include "kprim/obs/observability.hpp"
#include "support/temp_dir.hpp"

using kprim::mem::MapError;
using kprim::mem::MapOp;
using kprim::mem::Protection;
using kprim::mem::Region;
using kprim::mem::SyncFlags;

// ---------- flags ----------

TEST(SyncFlags, OrIsBitwiseUnion) {
  const auto both = SyncFlags::Sync | SyncFlags::Async;
  EXPECT_EQ(both.raw(), SyncFlags::Sync.raw() | SyncFlags::Async.raw());
  EXPECT_TRUE(both.contains(SyncFlags::Sync));
  EXPECT_TRUE(both.contains(SyncFlags::Async));
  EXPECT_FALSE(both.contains(SyncFlags::Invalidate));
  EXPECT_EQ(both.without(SyncFlags::Async), SyncFlags::Sync);
}

TEST(SyncFlags, EqualityAndHashUseRawBits) {
  const auto a = SyncFlags::Sync | SyncFlags::Invalidate;
  const SyncFlags b{SyncFlags::Sync.raw() | SyncFlags::Invalidate.raw()};
  EXPECT_EQ(a, b);
  EXPECT_EQ(std::hash<SyncFlags>{}(a), std::hash<SyncFlags>{}(b));
  std::unordered_set<SyncFlags> set{a, b, SyncFlags::Async};
  EXPECT_EQ(set.size(), 2u);
}

TEST(Protection, NamedCombinations) {
  EXPECT_EQ(Protection::Read | Protection::Write, Protection::ReadWrite);
  EXPECT_TRUE(Protection::None.empty());
  EXPECT_FALSE(Protection::Read.contains(Protection::Write));
}

// ---------- page arithmetic ----------

TEST(MapEngine, PageSizeAndRounding) {
  const auto ps = kprim::mem::page_size();
  ASSERT_GT(ps, 0u);
  EXPECT_EQ(ps & (ps - 1), 0u);
  EXPECT_EQ(kprim::mem::round_to_pages(1), std::optional<std::size_t>(ps));
  EXPECT_EQ(kprim::mem::round_to_pages(ps), std::optional<std::size_t>(ps));
  EXPECT_EQ(kprim::mem::round_to_pages(ps + 1), std::optional<std::size_t>(2 * ps));
  EXPECT_FALSE(kprim::mem::round_to_pages(std::numeric_limits<std::size_t>::max()).has_value());
}

// ---------- lifecycle ----------

TEST(MapEngine, OnePageAnonymous) {
  const auto ps = kprim::mem::page_size();
  auto r = kprim::mem::map_anonymous(ps);
  ASSERT_TRUE(r) << r.error().to_string();
  EXPECT_NE(r->base(), nullptr);
  EXPECT_EQ(r->length(), ps);
  EXPECT_TRUE(r->mapped());
  EXPECT_EQ(r->protection(), Protection::ReadWrite);

  // Anonymous memory starts zeroed and is writable.
  auto bytes = r->bytes();
  EXPECT_EQ(bytes[0], std::byte{0});
  bytes[0]      = std::byte{0x5A};
  bytes[ps - 1] = std::byte{0xA5};
  EXPECT_EQ(bytes[0], std::byte{0x5A});
}

TEST(MapEngine, ShortLengthRoundsUp) {
  auto r = kprim::mem::map_anonymous(10);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->length(), kprim::mem::page_size());
}

TEST(MapEngine, ZeroLengthRejected) {
  auto r = kprim::mem::map_anonymous(0);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, MapError::Kind::InvalidLength);
  EXPECT_EQ(r.error().op, MapOp::Map);
}

TEST(MapEngine, OverflowingLengthRejected) {
  auto r = kprim::mem::map_anonymous(std::numeric_limits<std::size_t>::max());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, MapError::Kind::InvalidLength);
}

TEST(MapEngine, DoubleUnmapIsNotMapped) {
  auto r = kprim::mem::map_anonymous(kprim::mem::page_size());
  ASSERT_TRUE(r);
  Region region = std::move(*r);

  ASSERT_TRUE(kprim::mem::unmap(region));
  EXPECT_FALSE(region.mapped());
  EXPECT_TRUE(region.bytes().empty());

  auto again = kprim::mem::unmap(region);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().kind, MapError::Kind::NotMapped);
  EXPECT_EQ(again.error().op, MapOp::Unmap);
}

TEST(MapEngine, SyncAndProtectAfterUnmapAreNotMapped) {
  auto r = kprim::mem::map_anonymous(kprim::mem::page_size());
  ASSERT_TRUE(r);
  ASSERT_TRUE(kprim::mem::unmap(*r));

  auto s = kprim::mem::sync(*r);
  ASSERT_FALSE(s);
  EXPECT_EQ(s.error().kind, MapError::Kind::NotMapped);
  EXPECT_EQ(s.error().op, MapOp::Sync);

  auto p = kprim::mem::protect(*r, Protection::Read);
  ASSERT_FALSE(p);
  EXPECT_EQ(p.error().kind, MapError::Kind::NotMapped);
}

TEST(MapEngine, MoveLeavesSourceUnmapped) {
  auto r = kprim::mem::map_anonymous(kprim::mem::page_size());
  ASSERT_TRUE(r);
  void* base = r->base();
  Region a = std::move(*r);
  EXPECT_FALSE(r->mapped());
  EXPECT_EQ(a.base(), base);

  Region b;
  b = std::move(a);
  EXPECT_FALSE(a.mapped());
  EXPECT_TRUE(b.mapped());
  EXPECT_EQ(b.base(), base);
}

TEST(MapEngine, SharedAnonymousSyncsWithAnyFlags) {
  auto r = kprim::mem::map_anonymous(2 * kprim::mem::page_size(), Protection::ReadWrite, true);
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->shared());
  EXPECT_TRUE(kprim::mem::sync(*r, SyncFlags::Sync));
  EXPECT_TRUE(kprim::mem::sync(*r, SyncFlags::Async));
  EXPECT_TRUE(kprim::mem::sync(*r, SyncFlags::Sync | SyncFlags::Async));
}

TEST(MapEngine, ProtectUpdatesRegion) {
  auto r = kprim::mem::map_anonymous(kprim::mem::page_size());
  ASSERT_TRUE(r);
  ASSERT_TRUE(kprim::mem::protect(*r, Protection::Read));
  EXPECT_EQ(r->protection(), Protection::Read);
  ASSERT_TRUE(kprim::mem::protect(*r, Protection::ReadWrite));
  r->bytes()[0] = std::byte{1};
  EXPECT_EQ(r->bytes()[0], std::byte{1});
}

TEST(MapEngine, AdviseNeverFails) {
  auto r = kprim::mem::map_anonymous(4 * kprim::mem::page_size());
  ASSERT_TRUE(r);
  kprim::mem::advise(*r, kprim::mem::Advice::Sequential);
  kprim::mem::advise(*r, kprim::mem::Advice::WillNeed);
  kprim::mem::advise(*r, kprim::mem::Advice::Normal);
  Region empty;
  kprim::mem::advise(empty, kprim::mem::Advice::DontNeed);
  EXPECT_TRUE(r->mapped());
}

// ---------- file-backed ----------

TEST(MapEngine, FileBackedSharedWritesThrough) {
  kprim_test::TempDir dir;
  ASSERT_TRUE(dir.ok());
  const auto path = dir.file("mapped.bin");
  const auto ps   = kprim::mem::page_size();
  kprim_test::write_file(path, std::string(ps, 'a'));

  kprim::fs::OpenOptions opts;
  opts.mode = kprim::fs::OpenMode::ReadWrite;
  auto fd = kprim::fs::open(path, opts);
  ASSERT_TRUE(fd);

  auto r = kprim::mem::map_file(fd->get(), 0, ps, Protection::ReadWrite, true);
  ASSERT_TRUE(r) << r.error().to_string();
  std::memcpy(r->base(), "hello", 5);
  ASSERT_TRUE(kprim::mem::sync(*r));
  ASSERT_TRUE(kprim::mem::unmap(*r));

  EXPECT_EQ(kprim_test::read_file(path).substr(0, 6), "helloa");
}

TEST(MapEngine, FileOffsetMustBePageAligned) {
  kprim_test::TempDir dir;
  ASSERT_TRUE(dir.ok());
  const auto path = dir.file("f.bin");
  kprim_test::write_file(path, std::string(2 * kprim::mem::page_size(), 'x'));
  auto fd = kprim::fs::open(path, kprim::fs::OpenOptions::read_only());
  ASSERT_TRUE(fd);

  auto r = kprim::mem::map_file(fd->get(), 1, 16);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, MapError::Kind::InvalidOffset);
}

TEST(MapEngine, FileMapWithInvalidDescriptorFails) {
  auto r = kprim::mem::map_file(kprim::os::Descriptor::invalid(), 0, 16);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().op, MapOp::Map);
}

// ---------- errors / observability ----------

TEST(MapError, FromCode) {
  using kprim::os::ErrorCode;
  EXPECT_EQ(MapError::from_code(ErrorCode::posix(ENOMEM), MapOp::Map).kind, MapError::Kind::OutOfMemory);
  EXPECT_EQ(MapError::from_code(ErrorCode::posix(EACCES), MapOp::Map).kind, MapError::Kind::PermissionDenied);
  EXPECT_EQ(MapError::from_code(ErrorCode::posix(EINVAL), MapOp::Sync).kind, MapError::Kind::InvalidArgument);
  const auto e = MapError::from_code(ErrorCode::posix(EFAULT), MapOp::Protect);
  EXPECT_EQ(e.kind, MapError::Kind::Unknown);
  EXPECT_EQ(e.code, ErrorCode::posix(EFAULT));
}

TEST(MapEngine, CountsMapsAndUnmaps) {
  auto* obs = kprim::obs::make_spdlog_observer();
  const auto before = obs->snapshot();
  {
    auto r = kprim::mem::map_anonymous(kprim::mem::page_size());
    ASSERT_TRUE(r);
  }
  (void)kprim::mem::map_anonymous(0);
  const auto after = obs->snapshot();
  EXPECT_EQ(after.maps - before.maps, 1u);
  EXPECT_EQ(after.unmaps - before.unmaps, 1u);
  EXPECT_EQ(after.map_failures - before.map_failures, 1u);
}
