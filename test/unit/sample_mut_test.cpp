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
#include "zcpub/port/publisher.hpp"
#include "zcpub/port/sample_mut.hpp"
#include "zcpub/port/detail/chunk.hpp"
#include <boost/uuid/random_generator.hpp>
#include <flow/error/error.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <gtest/gtest.h>
#include <type_traits>
#include <vector>

namespace zcpub::port
{

namespace
{

struct Point
{
  int m_x;
  int m_y;
  double m_weight;
};

using Uninit = Sample_mut_uninit<Point>;
using Init = Sample_mut<Point>;

// Detectors for what a given sample type lets one write.

template<typename T, typename = void>
struct Can_read_payload : std::false_type {};
template<typename T>
struct Can_read_payload<T, std::void_t<decltype(std::declval<const T&>().payload())>> : std::true_type {};

template<typename T, typename = void>
struct Can_send_lvalue : std::false_type {};
template<typename T>
struct Can_send_lvalue<T, std::void_t<decltype(std::declval<T&>().send())>> : std::true_type {};

template<typename T, typename = void>
struct Can_send_rvalue : std::false_type {};
template<typename T>
struct Can_send_rvalue<T, std::void_t<decltype(std::declval<T&&>().send())>> : std::true_type {};

template<typename T, typename = void>
struct Can_write_lvalue : std::false_type {};
template<typename T>
struct Can_write_lvalue<T, std::void_t<decltype(std::declval<T&>().write_payload(std::declval<const Point&>()))>> :
  std::true_type {};

template<typename T, typename = void>
struct Can_write_rvalue : std::false_type {};
template<typename T>
struct Can_write_rvalue<T, std::void_t<decltype(std::declval<T&&>().write_payload(std::declval<const Point&>()))>> :
  std::true_type {};

template<typename T, typename = void>
struct Can_assume_init_lvalue : std::false_type {};
template<typename T>
struct Can_assume_init_lvalue<T, std::void_t<decltype(std::declval<T&>().assume_init())>> : std::true_type {};

// An uninitialized sample can be neither read nor sent.
static_assert(!Can_read_payload<Uninit>::value);
static_assert(!Can_send_lvalue<Uninit>::value);
static_assert(!Can_send_rvalue<Uninit>::value);
// Its transitions consume it.
static_assert(Can_write_rvalue<Uninit>::value);
static_assert(!Can_write_lvalue<Uninit>::value);
static_assert(!Can_assume_init_lvalue<Uninit>::value);
static_assert(std::is_same_v<decltype(std::declval<Uninit&&>().write_payload(std::declval<const Point&>())), Init>);
static_assert(std::is_same_v<decltype(std::declval<Uninit&&>().assume_init()), Init>);
// An initialized sample can be read, and sent only by giving it up.
static_assert(Can_read_payload<Init>::value);
static_assert(Can_send_rvalue<Init>::value);
static_assert(!Can_send_lvalue<Init>::value);
// Exactly one owner per chunk.
static_assert(!std::is_copy_constructible_v<Uninit> && !std::is_copy_assignable_v<Uninit>);
static_assert(!std::is_copy_constructible_v<Init> && !std::is_copy_assignable_v<Init>);
static_assert(std::is_nothrow_move_constructible_v<Uninit> && std::is_nothrow_move_constructible_v<Init>);
// Only the publisher makes samples.
static_assert(!std::is_default_constructible_v<Uninit> && !std::is_default_constructible_v<Init>);

/// Publisher that records every release of a chunk through the Publish_mgmt boundary.
class Spy_publisher :
  public Publisher<Point>
{
public:
  using Publisher<Point>::Publisher;

  void reclaim(const shm::Pointer_offset& offset) noexcept override
  {
    m_reclaimed.push_back(offset);
    Publisher<Point>::reclaim(offset);
  }

  size_t deliver(const shm::Pointer_offset& offset, Error_code* err_code) override
  {
    m_delivered.push_back(offset);
    return Publisher<Point>::deliver(offset, err_code);
  }

  size_t release_ct() const
  {
    return m_reclaimed.size() + m_delivered.size();
  }

  std::vector<shm::Pointer_offset> m_reclaimed;
  std::vector<shm::Pointer_offset> m_delivered;
}; // class Spy_publisher

/**
 * A transport other than Publisher: it loans chunks from a pool itself and, with receivers nominally connected,
 * finds the transport unreachable on every delivery.
 */
class Unreachable_transport :
  public Publish_mgmt
{
public:
  explicit Unreachable_transport(shm::classic::Pool_arena* data_segment) :
    m_data_segment(data_segment),
    m_id(boost::uuids::random_generator()()),
    m_receiver_ct(3)
  {
    // Done.
  }

  Uninit loan()
  {
    using Chunk = detail::Chunk<Point>;
    const auto chunk = ::new (m_data_segment->allocate_aligned(sizeof(Chunk), alignof(Chunk)))
                         Chunk(Header(m_id, boost::chrono::system_clock::now(), sizeof(Point)));
    return make_sample_uninit(m_data_segment->to_offset(chunk), &chunk->m_prefix.m_header, &chunk->m_payload);
  }

  void reclaim(const shm::Pointer_offset& offset) noexcept override
  {
    m_reclaimed.push_back(offset);
    m_data_segment->deallocate(m_data_segment->to_local(offset));
  }

  size_t deliver(const shm::Pointer_offset& offset, Error_code* err_code) override
  {
    m_delivered.push_back(offset);
    m_data_segment->deallocate(m_data_segment->to_local(offset));
    EXPECT_NE(m_receiver_ct, 0u);
    *err_code = error::Code::S_CONNECTION_FAILURE;
    return 0;
  }

  shm::classic::Pool_arena* const m_data_segment;
  const Header::Publisher_id m_id;
  const size_t m_receiver_ct;
  std::vector<shm::Pointer_offset> m_reclaimed;
  std::vector<shm::Pointer_offset> m_delivered;
}; // class Unreachable_transport

class Sample_mut_test :
  public ::testing::Test
{
protected:
  Sample_mut_test() :
    m_pool("sample_mut"),
    m_pub(test::test_logger(), &m_pool.m_arena)
  {
    // Done.
  }

  test::Scoped_pool m_pool;
  Spy_publisher m_pub;
}; // class Sample_mut_test

} // namespace (anon)

TEST_F(Sample_mut_test, Dropped_uninit_sample_is_reclaimed)
{
  const auto free_before = m_pool.m_arena.free_memory();
  std::optional<shm::Pointer_offset> offset;
  {
    auto sample = m_pub.loan_uninit();
    ASSERT_TRUE(sample);
    offset = sample->offset();
    EXPECT_EQ(m_pub.loaned_sample_count(), 1u);
  }

  ASSERT_EQ(m_pub.m_reclaimed.size(), 1u);
  EXPECT_EQ(m_pub.m_reclaimed.front(), *offset);
  EXPECT_TRUE(m_pub.m_delivered.empty());
  EXPECT_EQ(m_pub.loaned_sample_count(), 0u);
  EXPECT_EQ(m_pool.m_arena.free_memory(), free_before);
}

TEST_F(Sample_mut_test, Dropped_init_sample_is_reclaimed)
{
  {
    auto sample = m_pub.loan_uninit();
    ASSERT_TRUE(sample);
    auto ready = std::move(*sample).write_payload(Point{ 1, 2, 0.5 });
    EXPECT_TRUE(m_pub.m_reclaimed.empty()); // The transition itself released nothing.
  }

  EXPECT_EQ(m_pub.m_reclaimed.size(), 1u);
  EXPECT_TRUE(m_pub.m_delivered.empty());
  EXPECT_EQ(m_pub.loaned_sample_count(), 0u);
}

TEST_F(Sample_mut_test, Send_consumes_and_releases_once)
{
  test::Recording_receiver rcv(&m_pool.m_arena);
  m_pub.connect(&rcv);
  {
    auto sample = m_pub.loan_uninit();
    ASSERT_TRUE(sample);
    auto ready = std::move(*sample).write_payload(Point{ 3, 4, 1.5 });
    const auto offset = ready.offset();

    EXPECT_EQ(std::move(ready).send(), 1u);
    ASSERT_EQ(m_pub.m_delivered.size(), 1u);
    EXPECT_EQ(m_pub.m_delivered.front(), offset);
    // `sample` and `ready` are moved-from but still in scope here.
  }

  // Their destruction released nothing further.
  EXPECT_EQ(m_pub.release_ct(), 1u);
  EXPECT_TRUE(m_pub.m_reclaimed.empty());
  EXPECT_EQ(m_pub.loaned_sample_count(), 0u);
  m_pub.disconnect(&rcv);
}

TEST_F(Sample_mut_test, Transition_keeps_region)
{
  auto sample = m_pub.loan_uninit();
  ASSERT_TRUE(sample);
  const auto offset = sample->offset();
  void* const storage = sample->payload_mut().data();

  sample->payload_mut().write(Point{ 7, 8, 2.5 });
  auto ready = std::move(*sample).assume_init();

  EXPECT_EQ(ready.offset(), offset);
  EXPECT_EQ(static_cast<const void*>(&ready.payload()), storage);
  EXPECT_EQ(ready.payload().m_x, 7);
  EXPECT_EQ(ready.payload().m_y, 8);

  // Also via write_payload().
  auto sample2 = m_pub.loan_uninit();
  ASSERT_TRUE(sample2);
  const auto offset2 = sample2->offset();
  void* const storage2 = sample2->payload_mut().data();
  auto ready2 = std::move(*sample2).write_payload(Point{ 9, 10, 3.5 });
  EXPECT_EQ(ready2.offset(), offset2);
  EXPECT_EQ(static_cast<const void*>(&ready2.payload()), storage2);
  EXPECT_NE(offset2, offset);
}

TEST_F(Sample_mut_test, Header_is_stable)
{
  const auto before = boost::chrono::system_clock::now();
  auto sample = m_pub.loan_uninit();
  ASSERT_TRUE(sample);
  const auto after = boost::chrono::system_clock::now();

  const auto id = sample->header().publisher_id();
  const auto time_stamp = sample->header().time_stamp();
  EXPECT_EQ(id, m_pub.id());
  EXPECT_EQ(sample->header().payload_size(), sizeof(Point));
  EXPECT_LE(before, time_stamp);
  EXPECT_LE(time_stamp, after);

  auto ready = std::move(*sample).write_payload(Point{ 1, 1, 1.0 });
  ready.payload_mut().m_x = 100;

  EXPECT_EQ(ready.header().publisher_id(), id);
  EXPECT_EQ(ready.header().time_stamp(), time_stamp);
  EXPECT_EQ(ready.header().payload_size(), sizeof(Point));

  // It is the same header the receivers will see.
  EXPECT_EQ(&Publisher_base::header_at(m_pool.m_arena, ready.offset()), &ready.header());
}

TEST_F(Sample_mut_test, Move_transfers_ownership)
{
  auto a = m_pub.loan();
  ASSERT_TRUE(a);
  a->payload_mut().m_x = 1;
  const auto offset_a = a->offset();

  Init b(std::move(*a));
  EXPECT_EQ(b.offset(), offset_a);
  EXPECT_EQ(b.payload().m_x, 1);
  a.reset(); // Moved-from: nothing released.
  EXPECT_EQ(m_pub.release_ct(), 0u);

  auto c = m_pub.loan();
  ASSERT_TRUE(c);
  const auto offset_c = c->offset();

  // Assigning over b gives b's chunk back first.
  b = std::move(*c);
  ASSERT_EQ(m_pub.m_reclaimed.size(), 1u);
  EXPECT_EQ(m_pub.m_reclaimed.front(), offset_a);
  EXPECT_EQ(b.offset(), offset_c);
  EXPECT_EQ(m_pub.loaned_sample_count(), 1u);
}

TEST_F(Sample_mut_test, Loan_value_initializes)
{
  auto sample = m_pub.loan();
  ASSERT_TRUE(sample);
  EXPECT_EQ(sample->payload().m_x, 0);
  EXPECT_EQ(sample->payload().m_y, 0);
  EXPECT_EQ(sample->payload().m_weight, 0.0);
}

TEST_F(Sample_mut_test, Send_without_receivers_throws_and_frees)
{
  const auto free_before = m_pool.m_arena.free_memory();
  auto sample = m_pub.loan();
  ASSERT_TRUE(sample);

  try
  {
    std::move(*sample).send();
    ADD_FAILURE() << "send() should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_CONNECTION_FAILURE));
  }

  EXPECT_EQ(m_pub.m_delivered.size(), 1u);
  EXPECT_TRUE(m_pub.m_reclaimed.empty());
  EXPECT_EQ(m_pub.loaned_sample_count(), 0u);
  EXPECT_EQ(m_pool.m_arena.free_memory(), free_before);

  sample.reset();
  EXPECT_EQ(m_pub.release_ct(), 1u);
}

TEST_F(Sample_mut_test, Other_transport_connection_failure)
{
  Unreachable_transport transport(&m_pool.m_arena);
  const auto free_before = m_pool.m_arena.free_memory();
  {
    auto sample = transport.loan();
    EXPECT_EQ(sample.header().publisher_id(), transport.m_id);
    auto ready = std::move(sample).write_payload(Point{ 1, 2, 3.0 });
    const auto offset = ready.offset();

    Error_code err_code;
    EXPECT_EQ(std::move(ready).send(&err_code), 0u);
    EXPECT_EQ(err_code, Error_code(error::Code::S_CONNECTION_FAILURE));
    ASSERT_EQ(transport.m_delivered.size(), 1u);
    EXPECT_EQ(transport.m_delivered.front(), offset);
  }

  // Consumed by send(): never reclaimed as well.
  EXPECT_TRUE(transport.m_reclaimed.empty());
  EXPECT_EQ(transport.m_delivered.size(), 1u);
  EXPECT_EQ(m_pool.m_arena.free_memory(), free_before);

  // Throwing form.
  auto ready = transport.loan().write_payload(Point{ 4, 5, 6.0 });
  try
  {
    std::move(ready).send();
    ADD_FAILURE() << "send() should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_CONNECTION_FAILURE));
  }
  EXPECT_EQ(transport.m_delivered.size(), 2u);
  EXPECT_TRUE(transport.m_reclaimed.empty());
}

TEST_F(Sample_mut_test, Other_transport_reclaims_dropped_sample)
{
  Unreachable_transport transport(&m_pool.m_arena);
  const auto free_before = m_pool.m_arena.free_memory();
  std::optional<shm::Pointer_offset> offset;
  {
    auto sample = transport.loan();
    offset = sample.offset();
  }

  ASSERT_EQ(transport.m_reclaimed.size(), 1u);
  EXPECT_EQ(transport.m_reclaimed.front(), *offset);
  EXPECT_TRUE(transport.m_delivered.empty());
  EXPECT_EQ(m_pool.m_arena.free_memory(), free_before);
}

} // namespace zcpub::port
