/* binapi: Structured API Channel
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "binapi/api/error.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace binapi::test
{

TEST(Error_category, Codes)
{
  using api::error::Code;

  const Error_code err_code = Code::S_REPLY_TIMEOUT;
  EXPECT_TRUE(err_code);
  EXPECT_STREQ(err_code.category().name(), "binapi/api");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_NE(Error_code(Code::S_INVALID_CONTEXT), Error_code(Code::S_NIL_MESSAGE));

  // Every code has a message.
  for (int val = api::error::S_CODE_LOWEST_INT_VALUE; val != static_cast<int>(Code::S_END_SENTINEL); ++val)
  {
    const Error_code code = static_cast<Code>(val);
    EXPECT_FALSE(code.message().empty()) << val;
  }
}

TEST(Error_category, Stream_round_trip)
{
  using api::error::Code;

  std::ostringstream os;
  os << Code::S_UNEXPECTED_MESSAGE_ID;
  EXPECT_EQ(os.str(), "UNEXPECTED_MESSAGE_ID");

  std::istringstream is("CHANNEL_CLOSED");
  Code code = Code::S_END_SENTINEL;
  is >> code;
  EXPECT_EQ(code, Code::S_CHANNEL_CLOSED);
}

} // namespace binapi::test
