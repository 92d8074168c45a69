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

#ifndef __p44home__sharedstate__
#define __p44home__sharedstate__

#include "house.hpp"
#include "securitycontroller.hpp"
#include "changeevent.hpp"

#include <pthread.h>

using namespace std;

namespace p44home {

  class Broadcaster;

  /// a registered house together with the mutex that serializes all access to it
  class HouseSlot
  {
  public:
    pthread_mutex_t mAccess;
    House mHouse;

    explicit HouseSlot(const House &aHouse);
    ~HouseSlot();
  };


  typedef vector<HouseId> HouseIdList;


  /// The shared state of all houses, accessed concurrently by the client worker threads.
  /// Every operation runs under the mutex of the house it operates on, so operations on different houses
  /// never block each other. Reads return value copies (snapshots) taken under the same mutex.
  /// Mutations return a ChangeEvent describing the change, which the caller is expected to broadcast.
  class SharedStateManager : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    typedef map<HouseId, HouseSlot *> HousesMap;

    pthread_mutex_t mRegistryAccess; ///< protects mHouses (lookup and insertion only)
    HousesMap mHouses; ///< registered houses. Slots are never removed while the manager exists

    SecurityController mSecurityController;
    Broadcaster *mSecurityBroadcaster; ///< where security alerts go, NULL if none
    int mDefaultAlarmThreshold;

  public:

    SharedStateManager(int aDefaultAlarmThreshold);
    virtual ~SharedStateManager();

    virtual string contextType() const P44_OVERRIDE { return "State"; };

    /// set the broadcaster that receives security alerts (alarm triggered by failed unlocks)
    /// @param aBroadcaster the broadcaster, must live as long as this manager. NULL to disable alert broadcasts
    void setSecurityBroadcaster(Broadcaster *aBroadcaster) { mSecurityBroadcaster = aBroadcaster; };

    int defaultAlarmThreshold() const { return mDefaultAlarmThreshold; };

    /// @name house registration
    /// @{

    /// register a new empty house
    /// @return Duplicate if the id is already registered, InvalidValue for id 0
    ErrorPtr addHouse(HouseId aHouseId, const string &aName);

    /// register a house from its JSON description (see House::fromJson())
    /// @param aHouseId will be set to the id of the imported house
    ErrorPtr importHouse(JsonObjectPtr aDesc, HouseId &aHouseId);

    /// @return ids of all registered houses, ascending
    HouseIdList houseIds();

    /// @}


    /// @name snapshots
    /// @return NotFound if the house (room, device) does not exist
    /// @{

    ErrorPtr getHouseSnapshot(HouseId aHouseId, House &aHouse);
    ErrorPtr getRoomSnapshot(HouseId aHouseId, RoomId aRoomId, Room &aRoom);
    ErrorPtr getDeviceSnapshot(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, Device &aDevice);
    ErrorPtr getGroupSnapshot(HouseId aHouseId, DeviceType aDeviceType, DeviceVector &aDevices);

    /// @}


    /// @name mutations
    /// @param aEvent will be set to the resulting change event on success
    /// @{

    /// apply an action to a single device
    /// @return NotFound, AlarmActive or the error from the device's behaviour
    /// @param aAlertP if not NULL, a security alert caused by the action is returned here (NULL if none) and
    ///   the caller must broadcast it to all subscribers of the house, after it has delivered aEvent.
    ///   If NULL, the manager broadcasts the alert itself before this method returns.
    /// @note a failed unlock is a successful operation (the failure counter changed), with
    ///   "code_accepted":false in the event's status. If it triggers the alarm, a security alert follows
    ///   the device update with the next sequence number.
    ErrorPtr applyDeviceAction(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, const string &aAction, JsonObjectPtr aParams, ChangeEventPtr &aEvent, ChangeEventPtr *aAlertP = NULL);

    /// apply an action to all devices of a type in the house
    /// @param aResult per device outcomes. Devices refused by the alarm guard are reported as failures.
    ///   The outcome whose action triggered the alarm carries the security alert
    /// @param aBroadcastAlert if set, the manager broadcasts a security alert itself before returning.
    ///   Otherwise the caller must broadcast it, right after the event of the same outcome
    /// @return NotFound if the house does not exist. Failures on single devices do not fail the group action
    ErrorPtr applyGroupAction(HouseId aHouseId, DeviceType aDeviceType, const string &aAction, JsonObjectPtr aParams, GroupActionResult &aResult, bool aBroadcastAlert = true);

    ErrorPtr addRoom(HouseId aHouseId, const string &aName, RoomId &aNewRoomId, ChangeEventPtr &aEvent);
    ErrorPtr addDevice(HouseId aHouseId, RoomId aRoomId, DeviceType aDeviceType, JsonObjectPtr aAttributes, DeviceId &aNewDeviceId, ChangeEventPtr &aEvent);
    /// delete a room with all of its devices
    ErrorPtr delRoom(HouseId aHouseId, RoomId aRoomId, ChangeEventPtr &aEvent);
    ErrorPtr delDevice(HouseId aHouseId, RoomId aRoomId, DeviceId aDeviceId, ChangeEventPtr &aEvent);

    /// change the alarm state
    /// @param aEvent will be set to an alarm_update event if the state changed, NULL for accepted no-ops
    ErrorPtr setAlarm(HouseId aHouseId, AlarmAction aAction, ChangeEventPtr &aEvent);

    /// @}

  private:

    HouseSlot *lockHouse(HouseId aHouseId);
    void unlockHouse(HouseSlot *aSlot);
    ErrorPtr registerHouse(const House &aHouse);

    ErrorPtr deviceActionLocked(House &aHouse, Device &aDevice, const string &aAction, JsonObjectPtr aParams, ChangeEventPtr &aEvent, ChangeEventPtr &aAlert);
    void broadcastAlert(ChangeEventPtr aAlert);

  };

} // namespace p44home

#endif /* defined(__p44home__sharedstate__) */
