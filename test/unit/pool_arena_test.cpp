/* zcpub: Zero-copy SHM publishing
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "test_common.hpp"
#include "zcpub/shm/classic/pool_arena.hpp"
#include "zcpub/shm/classic/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <cstring>
#include <sstream>

namespace zcpub::shm::classic
{

TEST(Pool_arena_test, Create_allocate_deallocate)
{
  test::Scoped_pool pool("basic");
  auto& arena = pool.m_arena;
  ASSERT_TRUE(arena.attached());
  EXPECT_GE(arena.size(), size_t(1024 * 1024));

  const auto free_before = arena.free_memory();
  void* buf = arena.allocate(1000);
  ASSERT_NE(buf, nullptr);
  EXPECT_LT(arena.free_memory(), free_before);

  EXPECT_TRUE(arena.deallocate(buf));
  EXPECT_EQ(arena.free_memory(), free_before);
}

TEST(Pool_arena_test, Allocate_aligned)
{
  test::Scoped_pool pool("aligned");
  auto& arena = pool.m_arena;

  for (const size_t alignment : { size_t(8), size_t(64), size_t(4096) })
  {
    void* buf = arena.allocate_aligned(100, alignment);
    ASSERT_NE(buf, nullptr);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(buf) % alignment, 0u);
    arena.deallocate(buf);
  }
}

TEST(Pool_arena_test, Out_of_space_throws)
{
  test::Scoped_pool pool("tiny", 0, 64 * 1024);
  EXPECT_THROW(pool.m_arena.allocate(1024 * 1024), bipc::bad_alloc);
}

TEST(Pool_arena_test, Relative_addressing_across_mappings)
{
  const Pointer_offset::Segment_id SEG_ID = 3;
  test::Scoped_pool pool("two_maps", SEG_ID);
  auto& writer = pool.m_arena;
  Pool_arena reader(test::test_logger(), pool.m_name, SEG_ID, util::OPEN_ONLY, true);
  ASSERT_TRUE(reader.attached());

  const char TEXT[] = "relative, not absolute";
  auto buf = static_cast<char*>(writer.allocate(sizeof(TEXT)));
  std::memcpy(buf, TEXT, sizeof(TEXT));

  const auto offset = writer.to_offset(buf);
  EXPECT_EQ(offset.segment_id(), SEG_ID);
  EXPECT_LT(offset.offset(), writer.size());

  // The reader's mapping is elsewhere in our address space, yet the offset leads to the same bytes.
  const auto reader_buf = static_cast<const char*>(reader.to_local(offset));
  EXPECT_NE(static_cast<const void*>(reader_buf), static_cast<const void*>(buf));
  EXPECT_STREQ(reader_buf, TEXT);

  // Round trip within one mapping.
  EXPECT_EQ(writer.to_local(offset), buf);

  writer.deallocate(buf);
}

TEST(Pool_arena_test, Create_only_collision)
{
  test::Scoped_pool pool("collide");

  Error_code err_code;
  Pool_arena dupe(test::test_logger(), pool.m_name, 0, util::CREATE_ONLY, 1024 * 1024, util::Permissions(0600),
                  &err_code);
  EXPECT_TRUE(err_code);
  EXPECT_FALSE(dupe.attached());
  EXPECT_EQ(dupe.allocate(8), nullptr);
  EXPECT_EQ(dupe.size(), 0u);

  // And the throwing form.
  EXPECT_THROW(Pool_arena(test::test_logger(), pool.m_name, 0, util::CREATE_ONLY, 1024 * 1024),
               flow::error::Runtime_error);
}

TEST(Pool_arena_test, Open_or_create)
{
  test::Scoped_pool pool("ooc");
  const char TEXT[] = "shared";
  auto buf = static_cast<char*>(pool.m_arena.allocate(sizeof(TEXT)));
  std::memcpy(buf, TEXT, sizeof(TEXT));
  const auto offset = pool.m_arena.to_offset(buf);

  // Opens the existing one, rather than creating anew.
  Pool_arena other(test::test_logger(), pool.m_name, 0, util::OPEN_OR_CREATE, 1024 * 1024);
  ASSERT_TRUE(other.attached());
  EXPECT_STREQ(static_cast<const char*>(other.to_local(offset)), TEXT);
}

TEST(Pool_arena_test, Open_only_missing)
{
  const auto name = test::unique_pool_name("missing");
  Error_code err_code;
  Pool_arena arena(test::test_logger(), name, 0, util::OPEN_ONLY, false, &err_code);
  EXPECT_TRUE(err_code);
  EXPECT_FALSE(arena.attached());
}

TEST(Pool_arena_test, Remove_persistent)
{
  const auto name = test::unique_pool_name("remove");
  {
    Pool_arena arena(test::test_logger(), name, 0, util::CREATE_ONLY, 64 * 1024);
  }

  Error_code err_code;
  Pool_arena::remove_persistent(test::test_logger(), name, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();

  // Gone now.
  Pool_arena::remove_persistent(test::test_logger(), name, &err_code);
  EXPECT_TRUE(err_code);
  EXPECT_THROW(Pool_arena::remove_persistent(test::test_logger(), name), flow::error::Runtime_error);
}

TEST(Pool_arena_test, Error_code_category)
{
  const Error_code err_code(error::Code::S_SHM_BIPC_MISC_LIBRARY_ERROR);
  EXPECT_STREQ(err_code.category().name(), "zcpub/shm/classic");
  EXPECT_NE(err_code.message().find("no system code"), std::string::npos);

  std::ostringstream os;
  os << error::Code::S_SHM_BIPC_MISC_LIBRARY_ERROR;
  EXPECT_EQ(os.str(), "SHM_BIPC_MISC_LIBRARY_ERROR");
}

} // namespace zcpub::shm::classic
