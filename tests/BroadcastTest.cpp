//++
// BroadcastTest.cpp -> CChannel and CBroadcast tests
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the communications library project.  COMMLIB is
// free software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    COMMLIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with COMMLIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   Tests for the point to point channel and the publish/subscribe fan out
// used by sessions.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, ...
#include <vector>               // C++ std::vector template
#include <thread>               // C++ std::thread
#include <chrono>               // C++ std::chrono::steady_clock, ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "COMMLIB.hpp"          // communications library definitions
#include "Channel.hpp"          // CChannel template
#include "Broadcast.hpp"        // CBroadcast and CSubscription templates
using std::vector;              // ...


TEST(Channel, ReceiveTimesOut)
{
  CChannel<int> ch;  int n = 0;
  std::chrono::steady_clock::time_point tStart = std::chrono::steady_clock::now();
  EXPECT_EQ(0, ch.Receive(n, 100));
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()-tStart).count(), 90);
  EXPECT_EQ(0, ch.TryReceive(n));
}

TEST(Channel, KeepsOrder)
{
  CChannel<int> ch;  int n = 0;
  for (int i = 0;  i < 5;  ++i) EXPECT_TRUE(ch.Send(i));
  EXPECT_EQ(5u, ch.Size());
  for (int i = 0;  i < 5;  ++i) {
    ASSERT_EQ(1, ch.Receive(n, 100));
    EXPECT_EQ(i, n);
  }
}

TEST(Channel, CloseDrainsThenReportsClosed)
{
  CChannel<int> ch;  int n = 0;
  ch.Send(42);
  ch.Close();
  EXPECT_TRUE(ch.IsClosed());
  EXPECT_FALSE(ch.Send(43));
  EXPECT_EQ(1, ch.Receive(n, 100));
  EXPECT_EQ(42, n);
  EXPECT_EQ(-1, ch.Receive(n, 100));
}

TEST(Channel, CloseWakesWaitingReceiver)
{
  CChannel<int> ch;  int nResult = 0;
  std::thread th([&]() {int n;  nResult = ch.Receive(n, 10000);});
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ch.Close();
  th.join();
  EXPECT_EQ(-1, nResult);
}

TEST(Broadcast, SubscribersSeeTheSameSequence)
{
  CBroadcast<int> bc;
  CSubscription<int> subA = bc.Subscribe(), subB = bc.Subscribe();
  for (int i = 0;  i < 100;  ++i) EXPECT_EQ(2u, bc.Publish(i));
  for (int i = 0;  i < 100;  ++i) {
    int nA = -1, nB = -1;
    ASSERT_EQ(1, subA.Receive(nA, 100));
    ASSERT_EQ(1, subB.Receive(nB, 100));
    EXPECT_EQ(i, nA);
    EXPECT_EQ(i, nB);
  }
  EXPECT_EQ(0u, subA.GetDropped());
}

TEST(Broadcast, LateSubscriberMissesEarlierMessages)
{
  CBroadcast<int> bc;
  CSubscription<int> subEarly = bc.Subscribe();
  bc.Publish(1);
  CSubscription<int> subLate = bc.Subscribe();
  bc.Publish(2);
  int n = 0;
  ASSERT_EQ(1, subLate.TryReceive(n));
  EXPECT_EQ(2, n);
  EXPECT_EQ(0, subLate.TryReceive(n));
  EXPECT_EQ(2u, subEarly.GetPending());
}

TEST(Broadcast, SlowSubscriberDropsOldest)
{
  CBroadcast<int> bc(4);
  CSubscription<int> subSlow = bc.Subscribe(), subFast = bc.Subscribe();
  int n = 0;
  for (int i = 0;  i < 10;  ++i) {
    bc.Publish(i);
    ASSERT_EQ(1, subFast.TryReceive(n));
    EXPECT_EQ(i, n);
  }
  EXPECT_EQ(4u, subSlow.GetPending());
  EXPECT_EQ(6u, subSlow.GetDropped());
  EXPECT_EQ(0u, subFast.GetDropped());
  for (int i = 6;  i < 10;  ++i) {
    ASSERT_EQ(1, subSlow.TryReceive(n));
    EXPECT_EQ(i, n);
  }
}

TEST(Broadcast, DroppedSubscriptionsArePruned)
{
  CBroadcast<int> bc;
  CSubscription<int> subKeep = bc.Subscribe();
  {
    CSubscription<int> subGone = bc.Subscribe();
    EXPECT_EQ(2u, bc.Publish(1));
  }
  EXPECT_EQ(1u, bc.Publish(2));
}

TEST(Broadcast, CloseEndsSubscriptions)
{
  CBroadcast<int> bc;
  CSubscription<int> sub = bc.Subscribe();
  bc.Publish(7);
  bc.Close();
  int n = 0;
  EXPECT_EQ(1, sub.Receive(n, 100));
  EXPECT_EQ(7, n);
  EXPECT_EQ(-1, sub.Receive(n, 100));
}
