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

#include "securitycontroller.hpp"

using namespace p44home::test;


class SecurityControllerTest : public ::testing::Test
{
protected:

  House mHouse;
  SecurityController mSecurity;
  RoomId mRoomId;
  DeviceId mLockId;
  DeviceId mLampId;

  SecurityControllerTest() : mHouse(1, "Test", 3), mRoomId(NO_ROOM), mLockId(NO_DEVICE), mLampId(NO_DEVICE) {}

  virtual void SetUp() P44_OVERRIDE
  {
    ASSERT_TRUE(Error::isOK(mHouse.addRoom("Entry", mRoomId)));
    Device lock, lamp;
    ASSERT_TRUE(Error::isOK(Device::create(devicetype_lock, J("{\"code\":\"1234\"}"), lock)));
    ASSERT_TRUE(Error::isOK(Device::create(devicetype_lamp, JsonObjectPtr(), lamp)));
    ASSERT_TRUE(Error::isOK(room().addDevice(lock)));
    ASSERT_TRUE(Error::isOK(room().addDevice(lamp)));
    mLockId = lock.mDeviceId;
    mLampId = lamp.mDeviceId;
  }

  Room &room() { return *mHouse.getRoom(mRoomId); }
  Device &lock() { return *room().getDevice(mLockId); }
  Device &lamp() { return *room().getDevice(mLampId); }

  ErrorPtr alarm(AlarmAction aAction, bool &aChanged)
  {
    return mSecurity.changeAlarm(mHouse, aAction, aChanged);
  }

};


TEST_F(SecurityControllerTest, AlarmTransitions)
{
  bool changed;
  EXPECT_EQ("invalid-value", kindOf(alarm(alarmaction_trigger, changed)));
  EXPECT_EQ("invalid-value", kindOf(alarm(alarmaction_stop, changed)));
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_TRUE(changed);
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_FALSE(changed);
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_trigger, changed)));
  EXPECT_TRUE(changed);
  EXPECT_EQ(alarm_triggered, mHouse.mAlarm.mState);
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_trigger, changed)));
  EXPECT_FALSE(changed);
  EXPECT_EQ("invalid-value", kindOf(alarm(alarmaction_arm, changed)));
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_stop, changed)));
  EXPECT_TRUE(changed);
  EXPECT_EQ(alarm_disarmed, mHouse.mAlarm.mState);
}

TEST_F(SecurityControllerTest, DisarmFromTriggered)
{
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_trigger, changed)));
  EXPECT_TRUE(Error::isOK(alarm(alarmaction_disarm, changed)));
  EXPECT_TRUE(changed);
  EXPECT_EQ(alarm_disarmed, mHouse.mAlarm.mState);
}

TEST_F(SecurityControllerTest, GuardOnlyWhileTriggered)
{
  EXPECT_TRUE(Error::isOK(mSecurity.checkDeviceAction(mHouse, lamp())));
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_TRUE(Error::isOK(mSecurity.checkDeviceAction(mHouse, lamp())));
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_trigger, changed)));
  EXPECT_EQ("alarm-active", kindOf(mSecurity.checkDeviceAction(mHouse, lamp())));
  EXPECT_TRUE(Error::isOK(mSecurity.checkDeviceAction(mHouse, lock())));
}

TEST_F(SecurityControllerTest, ThresholdTriggersOnce)
{
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_EQ(alarm_armed, mHouse.mAlarm.mState);
  EXPECT_TRUE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_EQ(alarm_triggered, mHouse.mAlarm.mState);
  EXPECT_EQ(3, lock().mLock.mFailedAttempts);
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_EQ(4, lock().mLock.mFailedAttempts);
}

TEST_F(SecurityControllerTest, DisarmedHouseStaysDisarmed)
{
  for (int i=0; i<5; i++) {
    EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  }
  EXPECT_EQ(alarm_disarmed, mHouse.mAlarm.mState);
  EXPECT_EQ(5, lock().mLock.mFailedAttempts);
  EXPECT_TRUE(Error::isOK(mSecurity.checkDeviceAction(mHouse, lamp())));
  // counter is kept, so the next failure after arming triggers
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_TRUE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_EQ(alarm_triggered, mHouse.mAlarm.mState);
}

TEST_F(SecurityControllerTest, ForceTriggerNeedsArmed)
{
  EXPECT_FALSE(mHouse.mAlarm.forceTrigger());
  EXPECT_EQ(alarm_disarmed, mHouse.mAlarm.mState);
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  EXPECT_TRUE(mHouse.mAlarm.forceTrigger());
  EXPECT_FALSE(mHouse.mAlarm.forceTrigger());
  EXPECT_EQ(alarm_triggered, mHouse.mAlarm.mState);
}

TEST_F(SecurityControllerTest, SuccessResetsCounter)
{
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), true));
  EXPECT_EQ(0, lock().mLock.mFailedAttempts);
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_FALSE(mSecurity.noteUnlockAttempt(mHouse, lock(), false));
  EXPECT_EQ(alarm_disarmed, mHouse.mAlarm.mState);
}

TEST_F(SecurityControllerTest, StopClearsLockCounters)
{
  bool changed;
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_arm, changed)));
  for (int i=0; i<3; i++) mSecurity.noteUnlockAttempt(mHouse, lock(), false);
  ASSERT_EQ(alarm_triggered, mHouse.mAlarm.mState);
  ASSERT_TRUE(Error::isOK(alarm(alarmaction_stop, changed)));
  EXPECT_EQ(0, lock().mLock.mFailedAttempts);
}

TEST(AlarmActionNames, Parse)
{
  AlarmAction a;
  ASSERT_TRUE(alarmActionFromName("Disarm", a));
  EXPECT_EQ(alarmaction_disarm, a);
  EXPECT_FALSE(alarmActionFromName("snooze", a));
}
