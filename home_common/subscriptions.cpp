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

#include "subscriptions.hpp"

using namespace p44home;


SubscriptionRegistry::SubscriptionRegistry()
{
  pthread_mutex_init(&mAccess, NULL);
}


SubscriptionRegistry::~SubscriptionRegistry()
{
  pthread_mutex_destroy(&mAccess);
}


void SubscriptionRegistry::removeLocked(ClientId aClientId, HouseId aHouseId)
{
  SubscribersMap::iterator pos = mSubscribers.find(aHouseId);
  if (pos!=mSubscribers.end()) {
    pos->second.erase(aClientId);
    if (pos->second.empty()) mSubscribers.erase(pos);
  }
  mMembership.erase(aClientId);
}


void SubscriptionRegistry::join(HouseId aHouseId, ClientId aClientId)
{
  pthread_mutex_lock(&mAccess);
  MembershipMap::iterator pos = mMembership.find(aClientId);
  if (pos!=mMembership.end() && pos->second!=aHouseId) {
    OLOG(LOG_INFO, "client %llu moves from house #%u to house #%u", (unsigned long long)aClientId, pos->second, aHouseId);
    removeLocked(aClientId, pos->second);
  }
  mSubscribers[aHouseId].insert(aClientId);
  mMembership[aClientId] = aHouseId;
  pthread_mutex_unlock(&mAccess);
  OLOG(LOG_INFO, "client %llu joined house #%u", (unsigned long long)aClientId, aHouseId);
}


bool SubscriptionRegistry::leave(HouseId aHouseId, ClientId aClientId)
{
  bool wasSubscribed = false;
  pthread_mutex_lock(&mAccess);
  MembershipMap::iterator pos = mMembership.find(aClientId);
  if (pos!=mMembership.end() && pos->second==aHouseId) {
    removeLocked(aClientId, aHouseId);
    wasSubscribed = true;
  }
  pthread_mutex_unlock(&mAccess);
  if (wasSubscribed) {
    OLOG(LOG_INFO, "client %llu left house #%u", (unsigned long long)aClientId, aHouseId);
  }
  return wasSubscribed;
}


void SubscriptionRegistry::detach(ClientId aClientId)
{
  pthread_mutex_lock(&mAccess);
  MembershipMap::iterator pos = mMembership.find(aClientId);
  if (pos!=mMembership.end()) {
    removeLocked(aClientId, pos->second);
  }
  pthread_mutex_unlock(&mAccess);
  OLOG(LOG_DEBUG, "client %llu detached", (unsigned long long)aClientId);
}


ClientIdList SubscriptionRegistry::subscribersOf(HouseId aHouseId)
{
  ClientIdList clients;
  pthread_mutex_lock(&mAccess);
  SubscribersMap::iterator pos = mSubscribers.find(aHouseId);
  if (pos!=mSubscribers.end()) {
    clients.assign(pos->second.begin(), pos->second.end());
  }
  pthread_mutex_unlock(&mAccess);
  return clients;
}


bool SubscriptionRegistry::houseOf(ClientId aClientId, HouseId &aHouseId)
{
  bool found = false;
  pthread_mutex_lock(&mAccess);
  MembershipMap::iterator pos = mMembership.find(aClientId);
  if (pos!=mMembership.end()) {
    aHouseId = pos->second;
    found = true;
  }
  pthread_mutex_unlock(&mAccess);
  return found;
}
