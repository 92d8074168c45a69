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

#include "subscriptions.hpp"

using namespace p44home::test;


TEST(SubscriptionRegistry, JoinAndList)
{
  SubscriptionRegistry reg;
  reg.join(1, 10);
  reg.join(1, 11);
  reg.join(2, 12);
  ClientIdList subs = reg.subscribersOf(1);
  ASSERT_EQ(2u, subs.size());
  EXPECT_THAT(subs, ::testing::UnorderedElementsAre(10u, 11u));
  EXPECT_TRUE(reg.subscribersOf(3).empty());
}

TEST(SubscriptionRegistry, JoinMovesClient)
{
  SubscriptionRegistry reg;
  reg.join(1, 10);
  reg.join(2, 10);
  EXPECT_TRUE(reg.subscribersOf(1).empty());
  EXPECT_THAT(reg.subscribersOf(2), ::testing::ElementsAre(10u));
  HouseId h = 0;
  ASSERT_TRUE(reg.houseOf(10, h));
  EXPECT_EQ(2u, h);
}

TEST(SubscriptionRegistry, LeaveOnlyFromOwnHouse)
{
  SubscriptionRegistry reg;
  reg.join(1, 10);
  EXPECT_FALSE(reg.leave(2, 10));
  EXPECT_EQ(1u, reg.subscribersOf(1).size());
  EXPECT_TRUE(reg.leave(1, 10));
  EXPECT_TRUE(reg.subscribersOf(1).empty());
  HouseId h = 0;
  EXPECT_FALSE(reg.houseOf(10, h));
}

TEST(SubscriptionRegistry, DetachRemovesEverything)
{
  SubscriptionRegistry reg;
  reg.join(1, 10);
  reg.join(1, 11);
  reg.detach(10);
  reg.detach(99); // unknown clients are ignored
  EXPECT_THAT(reg.subscribersOf(1), ::testing::ElementsAre(11u));
}

TEST(SubscriptionRegistry, SubscribersIsSnapshot)
{
  SubscriptionRegistry reg;
  reg.join(1, 10);
  ClientIdList subs = reg.subscribersOf(1);
  reg.join(1, 11);
  EXPECT_EQ(1u, subs.size());
}
