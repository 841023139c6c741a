/* Flow-Chan: Core
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
#include "chan/error.hpp"
#include "chan/util/util_fwd.hpp"

namespace chan::error
{

// Types.

/**
 * boost.system category `"chan"`, attached to every #Error_code built from an error::Code.  Only this file sees the
 * class; elsewhere it is reached via `Error_code::category()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// Singleton.
  static const Category S_CATEGORY;

  // Methods.

  /// `"chan"`.  @return See above.
  const char* name() const noexcept override;

  /**
   * Human-readable text for a Code; mirrors the doc comments on the enum members.
   *
   * @param val
   *        `int` value of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Symbol printed by `operator<<()`, i.e., the member name minus `S_`.  Must stay parseable by
   * `flow::util::istream_to_enum()`.
   *
   * @param code
   *        Code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Only #S_CATEGORY is ever constructed.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "chan";
}

std::string Category::message(int val) const // Virtual.
{
  switch (static_cast<Code>(val))
  {
  case Code::S_OPERATION_NOT_SUPPORTED:
    return "The channel or object does not support the requested operation at all (e.g., multicast join).";
  case Code::S_OPTION_UNSUPPORTED:
    return "Configurable object does not support the named option.";
  case Code::S_OPTION_VALUE_INVALID:
    return "Configurable object supports the named option but rejects the supplied value.";
  case Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT:
    return "Outgoing message would exceed the largest message that can be staged for a single send; "
           "nothing was sent.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API spec.";
  case Code::S_FACTORY_ALREADY_CREATED:
    return "Factory has already created its object; it can neither be reconfigured nor create another.";

  case Code::S_END_SENTINEL:
    assert(false && "END_SENTINEL is never an error result.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  switch (code)
  {
  case Code::S_OPERATION_NOT_SUPPORTED:
    return "OPERATION_NOT_SUPPORTED";
  case Code::S_OPTION_UNSUPPORTED:
    return "OPTION_UNSUPPORTED";
  case Code::S_OPTION_VALUE_INVALID:
    return "OPTION_VALUE_INVALID";
  case Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT:
    return "MESSAGE_SIZE_EXCEEDS_LIMIT";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_FACTORY_ALREADY_CREATED:
    return "FACTORY_ALREADY_CREATED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  // Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL; number allowed too; case-insensitive.
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace chan::error
