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

#include "chan/config/configurable_factory.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace chan::config::test
{

namespace
{

/// A factory of ints: option `BASE` (any value) and `FACTOR` (non-zero); the int made is their product.
class Product_factory : public Configurable_factory<int>
{
public:
  static const Option<int> S_BASE;
  static const Option<int> S_FACTOR;

  std::set<std::string> options() const override
  {
    return { S_BASE.name(), S_FACTOR.name() };
  }

protected:
  void get_option_impl(const Option_base& option, std::any* value, Error_code*) const override
  {
    *value = (option == S_BASE) ? m_base : m_factor;
  }

  void set_config_option_impl(const Option_base& option, const std::any& value, Error_code* err_code) override
  {
    const auto val = std::any_cast<int>(value);
    if (option == S_BASE)
    {
      m_base = val;
    }
    else if (val == 0)
    {
      *err_code = error::Code::S_OPTION_VALUE_INVALID;
    }
    else
    {
      m_factor = val;
    }
  }

  std::unique_ptr<int> create_impl(Error_code*) override
  {
    return std::make_unique<int>(m_base * m_factor);
  }

private:
  int m_base = 1;
  int m_factor = 1;
}; // class Product_factory

const Option<int> Product_factory::S_BASE("BASE");
const Option<int> Product_factory::S_FACTOR("FACTOR");

} // Anonymous namespace

TEST(Configurable_test, Get_set)
{
  Product_factory factory;
  EXPECT_TRUE(factory.supports_option(Product_factory::S_BASE));
  EXPECT_FALSE(factory.supports_option(Option<int>("EXPONENT")));

  Error_code err_code;
  factory.set_option(Product_factory::S_BASE, 6, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(factory.get_option(Product_factory::S_BASE), 6);
  EXPECT_EQ(factory.get_option(Product_factory::S_FACTOR), 1);

  // Unsupported: distinct from supported-but-invalid.
  EXPECT_EQ(factory.get_option(Option<int>("EXPONENT"), &err_code), 0);
  EXPECT_EQ(err_code, error::Code::S_OPTION_UNSUPPORTED);
  factory.set_option(Option<int>("EXPONENT"), 2, &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPTION_UNSUPPORTED);

  factory.set_option(Product_factory::S_FACTOR, 0, &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPTION_VALUE_INVALID);
  EXPECT_EQ(factory.get_option(Product_factory::S_FACTOR), 1); // Unchanged.

  EXPECT_THROW(factory.set_option(Product_factory::S_FACTOR, 0), flow::error::Runtime_error);
  EXPECT_THROW(factory.get_option(Option<int>("EXPONENT")), flow::error::Runtime_error);
}

TEST(Configurable_test, Factory_creates_once)
{
  Product_factory factory;
  factory.set_option(Product_factory::S_BASE, 6);
  factory.set_option(Product_factory::S_FACTOR, 7);
  EXPECT_FALSE(factory.created());

  Error_code err_code;
  const auto product = factory.create(&err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(product);
  EXPECT_EQ(*product, 42);
  EXPECT_TRUE(factory.created());

  // Spent: no reconfiguration; no second object.  Reading still works.
  factory.set_option(Product_factory::S_BASE, 1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_FACTORY_ALREADY_CREATED);
  EXPECT_EQ(factory.get_option(Product_factory::S_BASE), 6);

  EXPECT_FALSE(factory.create(&err_code));
  EXPECT_EQ(err_code, error::Code::S_FACTORY_ALREADY_CREATED);
  EXPECT_THROW(factory.create(), flow::error::Runtime_error);
}

TEST(Configurable_test, Option_identity)
{
  // Options are identified by name alone.
  EXPECT_EQ(Option<int>("X"), Option<int>("X"));
  EXPECT_NE(Option<int>("X"), Option<int>("Y"));
  EXPECT_EQ(Option_base("X"), Option<std::string>("X"));
  EXPECT_EQ(flow::util::ostream_op_string(Option<int>("X")), "option[X]");
}

} // namespace chan::config::test
