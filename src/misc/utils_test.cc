/*
 * Meadow
 * Copyright (c) The Meadow Authors.
 * All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * THIS CODE IS PROVIDED ON AN *AS IS* BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT
 * LIMITATION ANY IMPLIED WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR
 * A PARTICULAR PURPOSE, MERCHANTABLITY OR NON-INFRINGEMENT.
 *
 * See the Apache Version 2.0 License for specific language governing
 * permissions and limitations under the License.
 */

// Utility function unit tests.

#include <gtest/gtest.h>

#include "base/common.h"
#include "base/instance_desc.pb.h"
#include "base/units.h"
#include "misc/time_sources.h"
#include "misc/utils.h"

namespace meadow {

// The fixture for testing the utility functions.
class UtilsTest : public ::testing::Test {
 protected:
  UtilsTest() {
    // You can do set-up work for each test here.
  }

  virtual ~UtilsTest() {
    // You can do clean-up work that doesn't throw exceptions here.
  }
};

// Instance IDs are handed out in creation order and never repeat.
TEST_F(UtilsTest, InstanceIDsIncrease) {
  InstanceID_t first = GenerateInstanceID();
  InstanceID_t second = GenerateInstanceID();
  InstanceID_t third = GenerateInstanceID();
  EXPECT_GT(first, 0ULL);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
}

TEST_F(UtilsTest, ParseMemoryQuantityUnits) {
  uint64_t memory_mb = 0;
  EXPECT_TRUE(ParseMemoryQuantity("4096m", &memory_mb));
  EXPECT_EQ(memory_mb, 4096ULL);
  EXPECT_TRUE(ParseMemoryQuantity("8192M", &memory_mb));
  EXPECT_EQ(memory_mb, 8192ULL);
  EXPECT_TRUE(ParseMemoryQuantity("2g", &memory_mb));
  EXPECT_EQ(memory_mb, 2048ULL);
  EXPECT_TRUE(ParseMemoryQuantity("1T", &memory_mb));
  EXPECT_EQ(memory_mb, 1048576ULL);
  EXPECT_TRUE(ParseMemoryQuantity("2048k", &memory_mb));
  EXPECT_EQ(memory_mb, 2ULL);
  // No unit means MB.
  EXPECT_TRUE(ParseMemoryQuantity(" 512 ", &memory_mb));
  EXPECT_EQ(memory_mb, 512ULL);
  EXPECT_TRUE(ParseMemoryQuantity("0", &memory_mb));
  EXPECT_EQ(memory_mb, 0ULL);
}

TEST_F(UtilsTest, ParseMemoryQuantityRejectsMalformedInput) {
  uint64_t memory_mb = 42;
  EXPECT_FALSE(ParseMemoryQuantity("", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("m", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("-4096m", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("+4096m", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("4096x", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("4.5g", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("1000k", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("99999999999999999999m", &memory_mb));
  EXPECT_FALSE(ParseMemoryQuantity("18446744073709551615g", &memory_mb));
  // The output is untouched on failure.
  EXPECT_EQ(memory_mb, 42ULL);
}

TEST_F(UtilsTest, EnumNames) {
  EXPECT_EQ(InstanceStateToString(InstanceDescriptor::LAUNCHING),
            "LAUNCHING");
  EXPECT_EQ(NodeStatusToString(NodeDescriptor::NODE_UNREACHABLE),
            "NODE_UNREACHABLE");
}

TEST_F(UtilsTest, SimulatedTimeOnlyMovesWhenAdvanced) {
  SimulatedTime time(5 * MICROSECONDS_IN_SECOND);
  EXPECT_EQ(time.GetCurrentTimestamp(), 5 * MICROSECONDS_IN_SECOND);
  time.AdvanceBy(250);
  time.AdvanceSeconds(2);
  EXPECT_EQ(time.GetCurrentTimestamp(), 7 * MICROSECONDS_IN_SECOND + 250);
  time.SetTimestamp(42);
  EXPECT_EQ(time.GetCurrentTimestamp(), 42ULL);
}

// The wall clock is after 2020-01-01 and does not go backwards.
TEST_F(UtilsTest, WallTimeIsEpochMicroseconds) {
  WallTime time;
  uint64_t first = time.GetCurrentTimestamp();
  EXPECT_GT(first, 1577836800ULL * MICROSECONDS_IN_SECOND);
  EXPECT_GE(time.GetCurrentTimestamp(), first);
}

}  // namespace meadow

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
