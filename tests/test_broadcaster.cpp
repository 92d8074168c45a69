//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2026 The p44home Authors
//
//  This file is part of p44home.
//
//  p44home is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  p44home is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with p44home. If not, see <http://www.gnu.org/licenses/>.
//

#include "hometestutils.hpp"

#include "broadcaster.hpp"

#include <stdexcept>

using namespace p44home::test;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::NiceMock;


class BroadcasterTest : public ::testing::Test
{
protected:

  SubscriptionRegistry mSubscriptions;
  NiceMock<MockConnections> mConnections;
  Broadcaster mBroadcaster;

  BroadcasterTest() : mBroadcaster(mSubscriptions, mConnections) {}

  virtual void SetUp() P44_OVERRIDE
  {
    mSubscriptions.join(1, 10);
    mSubscriptions.join(1, 11);
    mSubscriptions.join(2, 20);
  }

};


TEST_F(BroadcasterTest, DeliversToHouseSubscribers)
{
  EXPECT_CALL(mConnections, sendToClient(10, "msg")).WillOnce(Return(ErrorPtr()));
  EXPECT_CALL(mConnections, sendToClient(11, "msg")).WillOnce(Return(ErrorPtr()));
  EXPECT_CALL(mConnections, sendToClient(20, _)).Times(0);
  EXPECT_EQ(2, mBroadcaster.broadcast(1, "msg"));
  EXPECT_EQ(2u, mBroadcaster.deliveredCount());
}

TEST_F(BroadcasterTest, ExcludedClientNeverReceives)
{
  EXPECT_CALL(mConnections, sendToClient(10, _)).Times(0);
  EXPECT_CALL(mConnections, sendToClient(11, _)).WillOnce(Return(ErrorPtr()));
  EXPECT_EQ(1, mBroadcaster.broadcast(1, "msg", 10));
}

TEST_F(BroadcasterTest, ExcludingNonSubscriberIsHarmless)
{
  EXPECT_CALL(mConnections, sendToClient(20, _)).Times(0);
  EXPECT_CALL(mConnections, sendToClient(10, _)).WillOnce(Return(ErrorPtr()));
  EXPECT_CALL(mConnections, sendToClient(11, _)).WillOnce(Return(ErrorPtr()));
  EXPECT_EQ(2, mBroadcaster.broadcast(1, "msg", 20));
}

TEST_F(BroadcasterTest, FailuresAreCountedNotPropagated)
{
  EXPECT_CALL(mConnections, sendToClient(10, _)).WillOnce(Return(TextError::err("gone")));
  EXPECT_CALL(mConnections, sendToClient(11, _)).WillOnce(Throw(std::runtime_error("socket closed")));
  EXPECT_EQ(0, mBroadcaster.broadcast(1, "msg"));
  EXPECT_EQ(2u, mBroadcaster.failedCount());
  EXPECT_EQ(0u, mBroadcaster.deliveredCount());
  // failed clients stay subscribed
  EXPECT_EQ(2u, mSubscriptions.subscribersOf(1).size());
  JsonObjectPtr stats = mBroadcaster.statistics();
  EXPECT_EQ(2, intField(stats, "failed"));
}

TEST_F(BroadcasterTest, OneFailureDoesNotStopOthers)
{
  EXPECT_CALL(mConnections, sendToClient(10, _)).WillOnce(Return(TextError::err("gone")));
  EXPECT_CALL(mConnections, sendToClient(11, _)).WillOnce(Return(ErrorPtr()));
  EXPECT_EQ(1, mBroadcaster.broadcast(1, "msg"));
}

TEST_F(BroadcasterTest, BroadcastToAllUsesConnectionTable)
{
  ClientIdList all;
  all.push_back(10);
  all.push_back(20);
  all.push_back(30); // connected, but not in any house
  EXPECT_CALL(mConnections, connectedClients()).WillOnce(Return(all));
  EXPECT_CALL(mConnections, sendToClient(_, "notice")).Times(3).WillRepeatedly(Return(ErrorPtr()));
  EXPECT_EQ(3, mBroadcaster.broadcastToAll("notice"));
}

TEST_F(BroadcasterTest, ChangeEventRendered)
{
  ChangeEventPtr ev = ChangeEventPtr(new ChangeEvent(event_alarm_update, 2, 5));
  ev->mAction = "arm";
  string sent;
  EXPECT_CALL(mConnections, sendToClient(20, _)).WillOnce(::testing::DoAll(::testing::SaveArg<1>(&sent), Return(ErrorPtr())));
  EXPECT_EQ(1, mBroadcaster.broadcast(ev));
  JsonObjectPtr j = J(sent.c_str());
  EXPECT_EQ("alarm_update", stringField(j, "type"));
  EXPECT_EQ(5, intField(j, "seq"));
  EXPECT_EQ(0, mBroadcaster.broadcast(ChangeEventPtr()));
}
