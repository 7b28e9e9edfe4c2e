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

// NodeCatalog class unit tests.

#include <vector>

#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>
#include <gtest/gtest.h>

#include "base/common.h"
#include "base/errors.h"
#include "scheduling/node_catalog.h"

namespace meadow {
namespace scheduler {

class NodeCatalogTest : public ::testing::Test {
 public:
  // Reserves one unit of cpu at a time until the node is full.
  void ReserveUntilFull(const NodeID_t& node_id, uint64_t* reserved) {
    uint64_t incarnation = 0;
    while (catalog_.Reserve(node_id, ResourceVector(1, 0, 0), &incarnation) ==
           CATALOG_OK) {
      (*reserved)++;
    }
  }

 protected:
  NodeCatalogTest() {
    catalog_.UpsertNode("node-b", ResourceVector(8, 16384, 1));
    catalog_.UpsertNode("node-a", ResourceVector(4, 8192, 0));
  }

  NodeCatalog catalog_;
};

TEST_F(NodeCatalogTest, UpsertAndSnapshot) {
  EXPECT_EQ(catalog_.NumNodes(), 2U);
  EXPECT_TRUE(catalog_.UpsertNode("node-c", ResourceVector(2, 1024, 0)));
  EXPECT_FALSE(catalog_.UpsertNode("node-c", ResourceVector(4, 1024, 0)));
  vector<NodeState> snapshot = catalog_.Snapshot();
  ASSERT_EQ(snapshot.size(), 3U);
  // Ascending node id, independent of insertion order.
  EXPECT_EQ(snapshot[0].node_id, "node-a");
  EXPECT_EQ(snapshot[1].node_id, "node-b");
  EXPECT_EQ(snapshot[2].node_id, "node-c");
  EXPECT_EQ(snapshot[2].total_capacity, ResourceVector(4, 1024, 0));
  EXPECT_TRUE(snapshot[2].allocated.IsZero());
  EXPECT_EQ(snapshot[2].status, NodeDescriptor::NODE_READY);
}

TEST_F(NodeCatalogTest, ReserveAndRelease) {
  uint64_t incarnation = 0;
  ResourceVector request(3, 4096, 0);
  EXPECT_EQ(catalog_.Reserve("node-a", request, &incarnation), CATALOG_OK);
  EXPECT_GT(incarnation, 0ULL);
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-a", &node));
  EXPECT_EQ(node.allocated, request);
  EXPECT_EQ(node.free(), ResourceVector(1, 4096, 0));
  // Not enough cpu left for a second one.
  EXPECT_EQ(catalog_.Reserve("node-a", request, NULL),
            CATALOG_INSUFFICIENT_CAPACITY);
  ASSERT_TRUE(catalog_.GetNode("node-a", &node));
  EXPECT_EQ(node.allocated, request);
  EXPECT_EQ(catalog_.Release("node-a", request, incarnation), CATALOG_OK);
  ASSERT_TRUE(catalog_.GetNode("node-a", &node));
  EXPECT_TRUE(node.allocated.IsZero());
  EXPECT_EQ(node.free(), node.total_capacity);
}

TEST_F(NodeCatalogTest, OverReleaseThrows) {
  uint64_t incarnation = 0;
  ASSERT_EQ(catalog_.Reserve("node-b", ResourceVector(1, 0, 0), &incarnation),
            CATALOG_OK);
  EXPECT_THROW(catalog_.Release("node-b", ResourceVector(2, 0, 0),
                                incarnation),
               InvariantViolation);
  // Nothing changed.
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-b", &node));
  EXPECT_EQ(node.allocated, ResourceVector(1, 0, 0));
}

TEST_F(NodeCatalogTest, OnlyReadyNodesAcceptReservations) {
  EXPECT_EQ(catalog_.MarkDraining("node-a"), CATALOG_OK);
  EXPECT_EQ(catalog_.Reserve("node-a", ResourceVector(1, 0, 0), NULL),
            CATALOG_NODE_NOT_READY);
  EXPECT_EQ(catalog_.MarkUnreachable("node-b"), CATALOG_OK);
  EXPECT_EQ(catalog_.Reserve("node-b", ResourceVector(1, 0, 0), NULL),
            CATALOG_NODE_NOT_READY);
  EXPECT_EQ(catalog_.Reserve("node-z", ResourceVector(1, 0, 0), NULL),
            CATALOG_NODE_NOT_FOUND);
  EXPECT_EQ(catalog_.MarkUnreachable("node-z"), CATALOG_NODE_NOT_FOUND);
  // A heartbeat revives an unreachable node, but not a draining one.
  catalog_.UpsertNode("node-a", ResourceVector(4, 8192, 0));
  catalog_.UpsertNode("node-b", ResourceVector(8, 16384, 1));
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-a", &node));
  EXPECT_EQ(node.status, NodeDescriptor::NODE_DRAINING);
  ASSERT_TRUE(catalog_.GetNode("node-b", &node));
  EXPECT_EQ(node.status, NodeDescriptor::NODE_READY);
  EXPECT_EQ(catalog_.MarkReady("node-a"), CATALOG_OK);
  EXPECT_EQ(catalog_.Reserve("node-a", ResourceVector(1, 0, 0), NULL),
            CATALOG_OK);
}

// Releases against a node that was removed, or removed and registered
// again, must not touch the new registration.
TEST_F(NodeCatalogTest, ReleaseAfterRemoval) {
  uint64_t incarnation = 0;
  ResourceVector request(2, 1024, 0);
  ASSERT_EQ(catalog_.Reserve("node-a", request, &incarnation), CATALOG_OK);
  EXPECT_EQ(catalog_.RemoveNode("node-a"), CATALOG_OK);
  EXPECT_EQ(catalog_.RemoveNode("node-a"), CATALOG_NODE_NOT_FOUND);
  EXPECT_EQ(catalog_.Release("node-a", request, incarnation),
            CATALOG_NODE_NOT_FOUND);
  EXPECT_TRUE(catalog_.UpsertNode("node-a", ResourceVector(4, 8192, 0)));
  EXPECT_EQ(catalog_.Release("node-a", request, incarnation),
            CATALOG_NODE_NOT_FOUND);
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-a", &node));
  EXPECT_TRUE(node.allocated.IsZero());
  EXPECT_NE(node.incarnation, incarnation);
}

// A capacity update below the current allocation is ignored.
TEST_F(NodeCatalogTest, ShrinkBelowAllocation) {
  ASSERT_EQ(catalog_.Reserve("node-b", ResourceVector(6, 0, 0), NULL),
            CATALOG_OK);
  catalog_.UpsertNode("node-b", ResourceVector(4, 16384, 1));
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-b", &node));
  EXPECT_EQ(node.total_capacity, ResourceVector(8, 16384, 1));
  catalog_.UpsertNode("node-b", ResourceVector(6, 16384, 1));
  ASSERT_TRUE(catalog_.GetNode("node-b", &node));
  EXPECT_EQ(node.total_capacity, ResourceVector(6, 16384, 1));
  EXPECT_EQ(node.free(), ResourceVector(0, 16384, 1));
}

// Concurrent reservations never overcommit a node.
TEST_F(NodeCatalogTest, ConcurrentReservations) {
  const uint64_t kThreads = 8;
  vector<uint64_t> reserved(kThreads, 0);
  boost::thread_group threads;
  for (uint64_t i = 0; i < kThreads; ++i) {
    threads.create_thread(boost::bind(&NodeCatalogTest::ReserveUntilFull,
                                      this, string("node-b"),
                                      &reserved[i]));
  }
  threads.join_all();
  uint64_t total = 0;
  for (uint64_t count : reserved)
    total += count;
  EXPECT_EQ(total, 8ULL);
  NodeState node;
  ASSERT_TRUE(catalog_.GetNode("node-b", &node));
  EXPECT_EQ(node.allocated.cpu_cores(), 8ULL);
  EXPECT_EQ(node.free().cpu_cores(), 0ULL);
}

}  // namespace scheduler
}  // namespace meadow

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
