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

/// @file

#include "zcpub/shm/classic/pool_arena.hpp"
#include "zcpub/shm/classic/error.hpp"
#include "zcpub/util/detail/util.hpp"
#include <boost/io/ios_state.hpp>
#include <cerrno>
#include <iomanip>
#include <type_traits>

namespace zcpub::shm::classic
{

template<typename Mode_tag>
Pool_arena::Pool_arena(Mode_tag mode_tag, flow::log::Logger* logger_ptr, const std::string& pool_name_arg,
                       Segment_id segment_id, size_t pool_sz,
                       const util::Permissions& perms, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SHM),
  m_pool_name(pool_name_arg),
  m_segment_id(segment_id)
{
  using boost::io::ios_all_saver;

  assert(pool_sz >= sizeof(void*));
  static_assert(std::is_same_v<Mode_tag, util::Create_only> || std::is_same_v<Mode_tag, util::Open_or_create>,
                "Can only delegate to this ctor with Mode_tag = Create_only or Open_or_create.");
  constexpr char const * MODE_STR = std::is_same_v<Mode_tag, util::Create_only>
                                      ? "create-only" : "open-or-create";

  if (get_logger() && get_logger()->should_log(flow::log::Sev::S_INFO, get_log_component()))
  {
    ios_all_saver saver{*(get_logger()->this_thread_ostream())}; // Revert std::oct/etc. soon.
    FLOW_LOG_INFO_WITHOUT_CHECKING
      ("SHM-classic pool [" << *this << "]: Constructing heap handle to heap/pool at name [" << m_pool_name << "] in "
       "[" << MODE_STR << "] mode; pool size [" << flow::util::ceil_div(pool_sz, size_t(1024 * 1024)) << "Mi]; "
       "perms = [" << std::setfill('0') << std::setw(4) << std::oct << perms.get_permissions() << "].");
  }

  /* m_pool is empty.  Try to create/create-or-open it; on error this leaves m_pool empty, as promised; and emits
   * the error via *err_code or exception. */
  util::detail::op_with_possible_bipc_exception
    (get_logger(), err_code, error::Code::S_SHM_BIPC_MISC_LIBRARY_ERROR, "Pool_arena(): Pool()", [&]()
  {
    m_pool.emplace(mode_tag, m_pool_name.c_str(), pool_sz, nullptr, perms);
  });
} // Pool_arena::Pool_arena()

Pool_arena::Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name_arg, Segment_id segment_id,
                       util::Create_only, size_t pool_sz,
                       const util::Permissions& perms, Error_code* err_code) :
  Pool_arena(util::CREATE_ONLY, logger_ptr, pool_name_arg, segment_id, pool_sz, perms, err_code)
{
  // Cool.
}

Pool_arena::Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name_arg, Segment_id segment_id,
                       util::Open_or_create, size_t pool_sz,
                       const util::Permissions& perms, Error_code* err_code) :
  Pool_arena(util::OPEN_OR_CREATE, logger_ptr, pool_name_arg, segment_id, pool_sz, perms, err_code)
{
  // Cool.
}

Pool_arena::Pool_arena(flow::log::Logger* logger_ptr, const std::string& pool_name_arg, Segment_id segment_id,
                       util::Open_only, bool read_only, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SHM),
  m_pool_name(pool_name_arg),
  m_segment_id(segment_id)
{
  FLOW_LOG_INFO("SHM-classic pool [" << *this << "]: Constructing heap handle to heap/pool at name "
                "[" << m_pool_name << "] in open-only mode; paged read-only? = [" << read_only << "].");

  util::detail::op_with_possible_bipc_exception(get_logger(), err_code, error::Code::S_SHM_BIPC_MISC_LIBRARY_ERROR,
                                                "Pool_arena(OPEN_ONLY): Pool()", [&]()
  {
    if (read_only)
    {
      m_pool.emplace(bipc::open_read_only, m_pool_name.c_str());
    }
    else
    {
      m_pool.emplace(util::OPEN_ONLY, m_pool_name.c_str());
    }
  });
} // Pool_arena::Pool_arena()

Pool_arena::~Pool_arena()
{
  FLOW_LOG_INFO("SHM-classic pool [" << *this << "]: Closing handle.");
}

bool Pool_arena::attached() const
{
  return bool(m_pool);
}

void* Pool_arena::allocate(size_t n)
{
  assert((n != 0) && "Please do not allocate(0).");

  if (!m_pool)
  {
    return nullptr;
  }
  // else

  const auto prev_free = m_pool->get_free_memory();
  const auto ret = m_pool->allocate(n); // Can throw (hence we can throw as advertised).
  log_free_space_change("SHM-alloc-ed user buffer", n, prev_free);
  return ret;
} // Pool_arena::allocate()

void* Pool_arena::allocate_aligned(size_t n, size_t alignment)
{
  assert((n != 0) && "Please do not allocate_aligned(0).");
  assert(((alignment != 0) && ((alignment & (alignment - 1)) == 0)) && "Alignment must be a power of 2.");

  if (!m_pool)
  {
    return nullptr;
  }
  // else

  const auto prev_free = m_pool->get_free_memory();
  const auto ret = m_pool->allocate_aligned(n, alignment); // Can throw, as in allocate().
  log_free_space_change("SHM-alloc-ed aligned user buffer", n, prev_free);
  return ret;
}

bool Pool_arena::deallocate(void* buf_not_null) noexcept
{
  assert(buf_not_null && "Please do not deallocate(nullptr).");

  if (!m_pool)
  {
    return false;
  }
  // else

  const auto prev_free = m_pool->get_free_memory();
  m_pool->deallocate(buf_not_null); // Does not throw.
  log_free_space_change("SHM-dealloc-ed user buffer (size unknown)", 0, prev_free);

  return true;
} // Pool_arena::deallocate()

void Pool_arena::log_free_space_change(util::String_view what, size_t n, size_t prev_free) const
{
  if ((!get_logger()) || (!get_logger()->should_log(flow::log::Sev::S_DATA, get_log_component())))
  {
    return;
  }
  // else

  const auto total = m_pool->get_size();
  const auto now_free = m_pool->get_free_memory();
  FLOW_LOG_DATA_WITHOUT_CHECKING("SHM-classic pool [" << *this << "]: " << what << " sized [" << n << "]; "
                                 "bipc alloc-algo reports free space changed "
                                 "[" << prev_free << "] (used [" << (total - prev_free) << "]) => "
                                 "[" << now_free << "] (used [" << (total - now_free) << "]).");
}

Pointer_offset Pool_arena::to_offset(const void* ptr) const
{
  assert(m_pool && "to_offset() requires an attached pool.");

  const auto p = static_cast<const uint8_t*>(ptr);
  const auto pool_base = static_cast<const uint8_t*>(m_pool->get_address());
  assert((p >= pool_base) && (p < (pool_base + m_pool->get_size()))
         && "Pointer does not point into this pool.  Bug?");

  return Pointer_offset(size_t(p - pool_base), m_segment_id);
}

void* Pool_arena::to_local(const Pointer_offset& offset) const
{
  assert(m_pool && "to_local() requires an attached pool.");
  assert((offset.segment_id() == m_segment_id) && "Offset belongs to another segment.  Bug?");
  assert((offset.offset() < m_pool->get_size()) && "Offset is beyond the pool's end.  Bug?");

  return static_cast<uint8_t*>(m_pool->get_address()) + offset.offset();
}

size_t Pool_arena::size() const
{
  return m_pool ? m_pool->get_size() : 0;
}

size_t Pool_arena::free_memory() const
{
  return m_pool ? m_pool->get_free_memory() : 0;
}

void Pool_arena::remove_persistent(flow::log::Logger* logger_ptr, // Static.
                                   const std::string& pool_name, Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SHM);

  FLOW_LOG_INFO("SHM-classic pool: Removing persistent SHM pool at name [" << pool_name << "] if possible.");

  Error_code our_err_code;
  if (!bipc::shared_memory_object::remove(pool_name.c_str()))
  {
    // bipc swallows the cause but leaves errno from the failed unlink.
    const int sys_err_code = errno;
    our_err_code = (sys_err_code == 0) ? Error_code(error::Code::S_SHM_BIPC_MISC_LIBRARY_ERROR)
                                       : Error_code(sys_err_code, boost::system::system_category());
    FLOW_LOG_WARNING("SHM-classic pool: Removal of persistent SHM pool at name [" << pool_name << "] failed: "
                     "[" << our_err_code << "] [" << our_err_code.message() << "].");
  }

  if (err_code)
  {
    *err_code = our_err_code;
    return;
  }
  // else
  if (our_err_code)
  {
    throw flow::error::Runtime_error(our_err_code, "Pool_arena::remove_persistent()");
  }
} // Pool_arena::remove_persistent()

std::ostream& operator<<(std::ostream& os, const Pool_arena& val)
{
  return os << '@' << &val << " => sh_name[" << val.m_pool_name << "] seg[" << int(val.m_segment_id) << ']';
}

} // namespace zcpub::shm::classic
