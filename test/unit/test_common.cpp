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

#include "test_common.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <atomic>

namespace zcpub::test
{

flow::log::Logger* test_logger()
{
  using flow::log::Config;
  using flow::log::Sev;
  using flow::log::Simple_ostream_logger;

  static Config s_log_config = []()
  {
    Config cfg(Sev::S_WARNING);
    cfg.init_component_to_union_idx_mapping<Log_component>
      (1000, static_cast<size_t>(Log_component::S_END_SENTINEL));
    cfg.init_component_names<Log_component>(S_ZCPUB_LOG_COMPONENT_NAME_MAP, false, "zcpub-");
    return cfg;
  }();
  static Simple_ostream_logger s_logger(&s_log_config);
  return &s_logger;
}

std::string unique_pool_name(const std::string& what)
{
  static std::atomic<unsigned int> s_idx(0);
  static const auto s_process_tag = boost::uuids::to_string(boost::uuids::random_generator()()).substr(0, 8);

  return "zcpub_test_" + what + '_' + s_process_tag + '_' + std::to_string(++s_idx);
}

Scoped_pool::Scoped_pool(const std::string& what, shm::Pointer_offset::Segment_id segment_id, size_t pool_sz) :
  m_name(unique_pool_name(what)),
  m_arena(test_logger(), m_name, segment_id, util::CREATE_ONLY, pool_sz, util::Permissions(0600))
{
  // Throws on failure.
}

Scoped_pool::~Scoped_pool()
{
  Error_code err_code;
  shm::classic::Pool_arena::remove_persistent(test_logger(), m_name, &err_code);
}

Recording_receiver::Recording_receiver(shm::classic::Pool_arena* data_segment, bool accept, bool release_at_once) :
  m_data_segment(data_segment),
  m_accept(accept),
  m_release_at_once(release_at_once)
{
  // Done.
}

Recording_receiver::~Recording_receiver()
{
  release_all();
}

bool Recording_receiver::on_sample(const shm::Pointer_offset& offset)
{
  m_offered.push_back(offset);
  if (!m_accept)
  {
    return false;
  }
  // else

  if (m_release_at_once)
  {
    port::Publisher_base::release_delivered_sample(test_logger(), m_data_segment, offset);
  }
  else
  {
    m_held.push_back(offset);
  }
  return true;
}

void Recording_receiver::release_all()
{
  for (const auto& offset : m_held)
  {
    port::Publisher_base::release_delivered_sample(test_logger(), m_data_segment, offset);
  }
  m_held.clear();
}

} // namespace zcpub::test
