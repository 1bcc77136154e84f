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

#include <zcpub/port/publisher.hpp>
#include <zcpub/port/sample_receiver.hpp>
#include <zcpub/shm/classic/pool_arena.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>

namespace
{

/// What we publish.
struct Cool_payload
{
  uint64_t m_cool_val;
  char m_cool_str[32];
};

/// Reads each sample through its own mapping of the segment; then releases it through that same mapping.
class Cool_receiver :
  public zcpub::port::Sample_receiver,
  public flow::log::Log_context
{
public:
  explicit Cool_receiver(flow::log::Logger* logger_ptr, zcpub::shm::classic::Pool_arena* data_segment) :
    flow::log::Log_context(logger_ptr, zcpub::Log_component::S_UNCAT),
    m_data_segment(data_segment),
    m_received_val(0)
  {
    // Done.
  }

  bool on_sample(const zcpub::shm::Pointer_offset& offset) override
  {
    using Publisher = zcpub::port::Publisher<Cool_payload>;

    const auto& header = Publisher::header_at(*m_data_segment, offset);
    const auto& payload = Publisher::payload_at(*m_data_segment, offset);
    FLOW_LOG_INFO("Receiver got sample at [" << offset << "] with header [" << header << "] and payloads "
                  "[" << payload.m_cool_str << "] and [" << payload.m_cool_val << "].");
    m_received_val = payload.m_cool_val;

    Publisher::release_delivered_sample(get_logger(), m_data_segment, offset);
    return true;
  }

  uint64_t received_val() const
  {
    return m_received_val;
  }

private:
  zcpub::shm::classic::Pool_arena* const m_data_segment;
  uint64_t m_received_val;
}; // class Cool_receiver

} // namespace (anon)

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main()
{
  using zcpub::shm::classic::Pool_arena;
  using zcpub::port::Publisher;
  using zcpub::util::CREATE_ONLY;
  using zcpub::util::OPEN_ONLY;
  using zcpub::util::Permissions;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;

  using std::string;
  using std::exception;

  const string LOG_FILE = "zcpub_link_test.log";
  const string POOL_NAME = "zcpub_link_test_pool";
  const int BAD_EXIT = 1;
  const uint64_t TEST_VAL = 42;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not?  Normally, one derives from
   * Log_context to do this very trivially, but we just have the one function, main(), so far so: */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<zcpub::Log_component>
    (1000, static_cast<size_t>(zcpub::Log_component::S_END_SENTINEL));
  std_log_config.init_component_names<zcpub::Log_component>(zcpub::S_ZCPUB_LOG_COMPONENT_NAME_MAP,
                                                            false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, zcpub::Log_component::S_UNCAT);

  // This is separate: the zcpub logging will go into this file.
  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for zcpub logs only.");
  Config log_config = std_log_config;
  log_config.configure_default_verbosity(Sev::S_INFO, true);
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  // Clean up any leftover from a prior crashed run; ignore failure (likely it's simply not there).
  Error_code ignored_err_code;
  Pool_arena::remove_persistent(&log_logger, POOL_NAME, &ignored_err_code);

  try
  {
    /* Publisher side creates the segment; receiver side opens it too, getting a mapping at a (likely)
     * different address.  Same process here, but nothing below cares. */
    Pool_arena pub_segment(&log_logger, POOL_NAME, 0, CREATE_ONLY, 64 * 1024, Permissions(0600));
    Pool_arena rcv_segment(&log_logger, POOL_NAME, 0, OPEN_ONLY, false);

    {
      Publisher<Cool_payload> pub(&log_logger, &pub_segment);
      Cool_receiver rcv(&log_logger, &rcv_segment);
      pub.connect(&rcv);

      auto sample_uninit = pub.loan_uninit(); // Let it throw on error.
      FLOW_LOG_INFO("Loaned sample [" << *sample_uninit << "] with header [" << sample_uninit->header() << "].");

      Cool_payload payload{ TEST_VAL, "Hello, world!" };
      auto sample = std::move(*sample_uninit).write_payload(payload);

      FLOW_LOG_INFO("Sending sample [" << sample << "].");
      const auto delivered_ct = std::move(sample).send();

      if ((delivered_ct != 1) || (rcv.received_val() != TEST_VAL))
      {
        FLOW_LOG_FATAL("WTF?!");
        std::abort();
      }

      pub.disconnect(&rcv);
    }

    Pool_arena::remove_persistent(&log_logger, POOL_NAME);
    FLOW_LOG_INFO("Looks good.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    Pool_arena::remove_persistent(&log_logger, POOL_NAME, &ignored_err_code);
    return BAD_EXIT;
  }

  return 0;
} // main()
