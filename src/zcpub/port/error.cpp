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

#include "zcpub/port/error.hpp"
#include "zcpub/util/util_fwd.hpp"
#include <cassert>

namespace zcpub::port::error
{

// Types.

/**
 * The boost.system category for errors returned by the zcpub::port module.  Conceptually each `Error_code` is a
 * pair: its category (a singleton of a subclass of `error_category`) and an `int` value; this is the category
 * for the values from Code.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category (for example, it may be logged).
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error code value (for example, it may be logged).
   *
   * @param val
   *        A value from the Code `enum`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns a brief string representing the given Code, suitable for `operator<<` and `operator>>`.
   *
   * @param code
   *        A value from the Code `enum`.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for port::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "zcpub/port";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CONNECTION_FAILURE:
    return "Publisher send: the sample could not be delivered at all, as there are no connected receivers.  "
           "(Individual receivers declining a sample is not this error.)";
  case Code::S_LOAN_EXCEEDS_MAX_LOANS:
    return "Publisher loan: the publisher already has the configured maximum number of samples loaned out; send or "
           "destroy one first.";
  case Code::S_LOAN_OUT_OF_MEMORY:
    return "Publisher loan: the publisher's data segment has no room for another sample.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_CONNECTION_FAILURE:
    return "CONNECTION_FAILURE";
  case Code::S_LOAN_EXCEEDS_MAX_LOANS:
    return "LOAN_EXCEEDS_MAX_LOANS";
  case Code::S_LOAN_OUT_OF_MEMORY:
    return "LOAN_OUT_OF_MEMORY";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace zcpub::port::error
