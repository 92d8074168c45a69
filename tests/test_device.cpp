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

#include "house.hpp"

using namespace p44home::test;


static ErrorPtr act(Device &aDevice, const string &aAction, const char *aParams = NULL)
{
  bool unlockAttempt, codeAccepted;
  return performDeviceAction(aDevice, aAction, aParams ? J(aParams) : JsonObjectPtr(), unlockAttempt, codeAccepted);
}


// MARK: - type names

TEST(DeviceTypeNames, ParseCaseInsensitive)
{
  DeviceType t;
  ASSERT_TRUE(deviceTypeFromName("ceilinglight", t));
  EXPECT_EQ(devicetype_ceilinglight, t);
  ASSERT_TRUE(deviceTypeFromName("LAMP", t));
  EXPECT_EQ(devicetype_lamp, t);
  EXPECT_FALSE(deviceTypeFromName("Toaster", t));
  EXPECT_STREQ("Blinds", deviceTypeName(devicetype_blinds));
}


// MARK: - lights

TEST(LightDevice, DefaultsAndPartialAttributes)
{
  Device lamp;
  ASSERT_TRUE(Error::isOK(Device::create(devicetype_lamp, J("{\"brightness\":50}"), lamp)));
  JsonObjectPtr st = lamp.status();
  EXPECT_FALSE(boolField(st, "on"));
  EXPECT_EQ(50, intField(st, "brightness"));
  EXPECT_EQ("white", stringField(st, "color"));
}

TEST(LightDevice, InvalidAttributesRejected)
{
  Device lamp;
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lamp, J("{\"brightness\":101}"), lamp)));
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lamp, J("{\"color\":\"magenta\"}"), lamp)));
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_ceilinglight, J("[1,2]"), lamp)));
}

TEST(LightDevice, Actions)
{
  Device lamp(devicetype_lamp);
  EXPECT_TRUE(Error::isOK(act(lamp, "on")));
  EXPECT_TRUE(lamp.mLight.mOn);
  EXPECT_TRUE(Error::isOK(act(lamp, "toggle")));
  EXPECT_FALSE(lamp.mLight.mOn);
  EXPECT_TRUE(Error::isOK(act(lamp, "dim", "{\"level\":0}")));
  EXPECT_EQ(0, lamp.mLight.mBrightness);
  EXPECT_TRUE(Error::isOK(act(lamp, "color", "{\"color\":\"Purple\"}")));
  EXPECT_EQ("purple", lamp.mLight.mColor);
}

TEST(LightDevice, InvalidActionsLeaveStateUnchanged)
{
  Device lamp(devicetype_lamp);
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "dim", "{\"level\":150}")));
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "dim")));
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "explode")));
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "dim", "[50]")));
  // set validates everything before applying anything
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "set", "{\"on\":true,\"brightness\":20,\"color\":\"black\"}")));
  EXPECT_FALSE(lamp.mLight.mOn);
  EXPECT_EQ(100, lamp.mLight.mBrightness);
  EXPECT_EQ("white", lamp.mLight.mColor);
}

TEST(LightDevice, SetAppliesAllValues)
{
  Device lamp(devicetype_ceilinglight);
  EXPECT_TRUE(Error::isOK(act(lamp, "set", "{\"on\":true,\"brightness\":20,\"color\":\"red\"}")));
  EXPECT_TRUE(lamp.mLight.mOn);
  EXPECT_EQ(20, lamp.mLight.mBrightness);
  EXPECT_EQ("red", lamp.mLight.mColor);
  EXPECT_EQ("invalid-value", kindOf(act(lamp, "set", "{}")));
}


// MARK: - locks

TEST(LockDevice, CodeRequiredAtCreation)
{
  Device lock;
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lock, JsonObjectPtr(), lock)));
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lock, J("{\"code\":\"12a4\"}"), lock)));
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lock, J("{\"code\":\"123\"}"), lock)));
  EXPECT_EQ("invalid-value", kindOf(Device::create(devicetype_lock, J("{\"code\":\"123456789\"}"), lock)));
  ASSERT_TRUE(Error::isOK(Device::create(devicetype_lock, J("{\"code\":\"12345678\"}"), lock)));
  EXPECT_FALSE(lock.mLock.mUnlocked);
}

TEST(LockDevice, CodeNeverInStatus)
{
  Device lock;
  ASSERT_TRUE(Error::isOK(Device::create(devicetype_lock, J("{\"code\":\"4711\"}"), lock)));
  string text = lock.jsonObject()->json_str();
  EXPECT_EQ(string::npos, text.find("4711"));
  EXPECT_TRUE(objField(lock.status(), "code").get()==NULL);
}

TEST(LockDevice, UnlockReportsAttempt)
{
  Device lock;
  ASSERT_TRUE(Error::isOK(Device::create(devicetype_lock, J("{\"code\":\"4711\"}"), lock)));
  bool attempt, accepted;
  EXPECT_TRUE(Error::isOK(performDeviceAction(lock, "unlock", J("{\"code\":\"0000\"}"), attempt, accepted)));
  EXPECT_TRUE(attempt);
  EXPECT_FALSE(accepted);
  EXPECT_FALSE(lock.mLock.mUnlocked);
  EXPECT_TRUE(Error::isOK(performDeviceAction(lock, "unlock", J("{\"code\":\"4711\"}"), attempt, accepted)));
  EXPECT_TRUE(attempt);
  EXPECT_TRUE(accepted);
  EXPECT_TRUE(lock.mLock.mUnlocked);
  // malformed code is not an attempt
  EXPECT_EQ("invalid-value", kindOf(performDeviceAction(lock, "unlock", J("{\"code\":\"47\"}"), attempt, accepted)));
  EXPECT_FALSE(attempt);
  EXPECT_TRUE(Error::isOK(performDeviceAction(lock, "lock", JsonObjectPtr(), attempt, accepted)));
  EXPECT_FALSE(attempt);
  EXPECT_FALSE(lock.mLock.mUnlocked);
}


// MARK: - blinds

TEST(BlindsDevice, Actions)
{
  Device blinds(devicetype_blinds);
  EXPECT_TRUE(blinds.mBlinds.mUp);
  EXPECT_FALSE(blinds.mBlinds.mOpen);
  EXPECT_TRUE(Error::isOK(act(blinds, "down")));
  EXPECT_FALSE(blinds.mBlinds.mUp);
  EXPECT_TRUE(Error::isOK(act(blinds, "toggle")));
  EXPECT_TRUE(blinds.mBlinds.mUp);
  EXPECT_TRUE(Error::isOK(act(blinds, "open")));
  EXPECT_TRUE(blinds.mBlinds.mOpen);
  EXPECT_TRUE(Error::isOK(act(blinds, "shutter")));
  EXPECT_FALSE(blinds.mBlinds.mOpen);
  EXPECT_EQ("invalid-value", kindOf(act(blinds, "dim", "{\"level\":10}")));
}


// MARK: - rooms and houses

TEST(RoomModel, SecondCeilingLightIsDuplicate)
{
  Room room(1, "Kitchen");
  Device cl1(devicetype_ceilinglight);
  Device cl2(devicetype_ceilinglight);
  ASSERT_TRUE(Error::isOK(room.addDevice(cl1)));
  EXPECT_EQ("duplicate", kindOf(room.addDevice(cl2)));
  EXPECT_EQ(1u, room.mDevices.size());
}

TEST(RoomModel, SecondBlindsIsDuplicate)
{
  Room room(1, "Bedroom");
  Device b1(devicetype_blinds);
  Device b2(devicetype_blinds);
  Device lamp(devicetype_lamp);
  ASSERT_TRUE(Error::isOK(room.addDevice(b1)));
  ErrorPtr err = room.addDevice(b2);
  EXPECT_TRUE(HomeError::isKind(err, HomeError::Duplicate));
  EXPECT_EQ(NO_DEVICE, b2.mDeviceId);
  EXPECT_EQ(1u, room.mDevices.size());
  // other types are not limited
  EXPECT_TRUE(Error::isOK(room.addDevice(lamp)));
  // once removed, blinds can be added again
  ASSERT_TRUE(Error::isOK(room.removeDevice(b1.mDeviceId)));
  EXPECT_TRUE(Error::isOK(room.addDevice(b2)));
}

TEST(RoomModel, DeviceIdsNotReused)
{
  Room room(3, "Hall");
  Device a(devicetype_lamp), b(devicetype_lamp), c(devicetype_blinds);
  ASSERT_TRUE(Error::isOK(room.addDevice(a)));
  ASSERT_TRUE(Error::isOK(room.addDevice(b)));
  EXPECT_EQ(3u, b.mRoomId);
  ASSERT_TRUE(Error::isOK(room.removeDevice(b.mDeviceId)));
  ASSERT_TRUE(Error::isOK(room.addDevice(c)));
  EXPECT_GT(c.mDeviceId, b.mDeviceId);
  EXPECT_EQ("not-found", kindOf(room.removeDevice(b.mDeviceId)));
}

TEST(HouseModel, RemoveRoomCascades)
{
  House house(1, "Villa", 3);
  RoomId rid;
  ASSERT_TRUE(Error::isOK(house.addRoom("Living", rid)));
  Device a(devicetype_lamp), b(devicetype_blinds);
  ASSERT_TRUE(Error::isOK(house.getRoom(rid)->addDevice(a)));
  ASSERT_TRUE(Error::isOK(house.getRoom(rid)->addDevice(b)));
  size_t removed = 0;
  ASSERT_TRUE(Error::isOK(house.removeRoom(rid, removed)));
  EXPECT_EQ(2u, removed);
  EXPECT_TRUE(house.getRoom(rid)==NULL);
  DeviceVector all;
  house.allDevices(all);
  EXPECT_TRUE(all.empty());
  EXPECT_EQ("invalid-value", kindOf(house.addRoom("", rid)));
}

TEST(HouseModel, ImportFromDescription)
{
  House house;
  ErrorPtr err = House::fromJson(J(
    "{\"house_id\":7,\"name\":\"Chalet\",\"alarm\":{\"state\":\"armed\",\"threshold\":2},"
    "\"rooms\":[{\"room_id\":4,\"name\":\"Entry\",\"next_device_id\":10,\"devices\":["
    "{\"device_id\":2,\"type\":\"Lock\",\"code\":\"2468\",\"status\":{\"unlocked\":true,\"failed_attempts\":1}},"
    "{\"device_id\":5,\"type\":\"Lamp\",\"on\":true,\"brightness\":30}"
    "]}]}"), 3, house);
  ASSERT_TRUE(Error::isOK(err)) << err->text();
  EXPECT_EQ(7u, house.mHouseId);
  EXPECT_EQ(alarm_armed, house.mAlarm.mState);
  EXPECT_EQ(2, house.mAlarm.mThreshold);
  Room *room = house.getRoom(4);
  ASSERT_TRUE(room!=NULL);
  Device *lock = room->getDevice(2);
  ASSERT_TRUE(lock!=NULL);
  EXPECT_TRUE(lock->mLock.mUnlocked);
  EXPECT_EQ(1, lock->mLock.mFailedAttempts);
  EXPECT_EQ("2468", lock->mLock.mCode);
  Device *lamp = room->getDevice(5);
  ASSERT_TRUE(lamp!=NULL);
  EXPECT_EQ(30, lamp->mLight.mBrightness);
  EXPECT_EQ(4u, lamp->mRoomId);
  Device next(devicetype_blinds);
  ASSERT_TRUE(Error::isOK(room->addDevice(next)));
  EXPECT_EQ(10u, next.mDeviceId);
  RoomId rid;
  ASSERT_TRUE(Error::isOK(house.addRoom("Attic", rid)));
  EXPECT_EQ(5u, rid);
}

TEST(HouseModel, ImportRejectsDuplicates)
{
  House house;
  EXPECT_EQ("duplicate", kindOf(House::fromJson(J(
    "{\"house_id\":1,\"name\":\"X\",\"rooms\":[{\"room_id\":1,\"name\":\"A\"},{\"room_id\":1,\"name\":\"B\"}]}"), 3, house)));
  EXPECT_EQ("duplicate", kindOf(House::fromJson(J(
    "{\"house_id\":1,\"name\":\"X\",\"rooms\":[{\"room_id\":1,\"name\":\"A\",\"devices\":["
    "{\"device_id\":1,\"type\":\"CeilingLight\"},{\"device_id\":2,\"type\":\"CeilingLight\"}]}]}"), 3, house)));
  EXPECT_TRUE(HomeError::isKind(House::fromJson(J(
    "{\"house_id\":1,\"name\":\"X\",\"rooms\":[{\"room_id\":1,\"name\":\"A\",\"devices\":["
    "{\"device_id\":1,\"type\":\"Blinds\"},{\"device_id\":2,\"type\":\"Blinds\"}]}]}"), 3, house), HomeError::Duplicate));
  EXPECT_EQ("invalid-value", kindOf(House::fromJson(J(
    "{\"house_id\":1,\"name\":\"X\",\"rooms\":[{\"room_id\":1,\"name\":\"A\",\"devices\":["
    "{\"device_id\":1,\"type\":\"Lock\"}]}]}"), 3, house)));
}
