//
//  Copyright (c) 2016 the dprobe authors
//
//  This file is part of dprobe.
//
//  dprobe is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dprobe is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dprobe. If not, see <http://www.gnu.org/licenses/>.
//


#include "refreshcoordinator.hpp"

using namespace dprobe;


RefreshCoordinator::RefreshCoordinator(MainLoop &aMainLoop, RefreshCB aRefreshAction, MLMicroSeconds aExpiryInterval) :
  mainLoop(aMainLoop),
  refreshAction(aRefreshAction),
  expiryInterval(aExpiryInterval),
  cachedValue(false),
  expiry(Never),
  refreshTicket(0),
  refreshesScheduled(0)
{
  pthread_mutex_init(&gateMutex, NULL);
}


RefreshCoordinator::~RefreshCoordinator()
{
  pthread_mutex_lock(&gateMutex);
  mainLoop.cancelExecutionTicket(refreshTicket);
  pthread_mutex_unlock(&gateMutex);
  pthread_mutex_destroy(&gateMutex);
}


void RefreshCoordinator::setExpiryInterval(MLMicroSeconds aExpiryInterval)
{
  pthread_mutex_lock(&gateMutex);
  expiryInterval = aExpiryInterval;
  pthread_mutex_unlock(&gateMutex);
}


bool RefreshCoordinator::isExpired()
{
  pthread_mutex_lock(&gateMutex);
  bool expired = !cachedValue || MainLoop::now()>=expiry;
  pthread_mutex_unlock(&gateMutex);
  return expired;
}


int RefreshCoordinator::numScheduled()
{
  pthread_mutex_lock(&gateMutex);
  int n = refreshesScheduled;
  pthread_mutex_unlock(&gateMutex);
  return n;
}


bool RefreshCoordinator::requestRefresh()
{
  pthread_mutex_lock(&gateMutex);
  MLMicroSeconds now = MainLoop::now();
  if (cachedValue && now<expiry) {
    pthread_mutex_unlock(&gateMutex);
    DBGLOG(LOG_DEBUG, "Refresh skipped, already refreshing");
    return false;
  }
  cachedValue = true;
  expiry = now+expiryInterval;
  refreshesScheduled++;
  refreshTicket = mainLoop.executeOnce(boost::bind(&RefreshCoordinator::runRefresh, this, _1));
  pthread_mutex_unlock(&gateMutex);
  DBGLOG(LOG_DEBUG, "Refresh scheduled");
  return true;
}


void RefreshCoordinator::runRefresh(MLMicroSeconds aCycleStartTime)
{
  pthread_mutex_lock(&gateMutex);
  refreshTicket = 0;
  pthread_mutex_unlock(&gateMutex);
  if (refreshAction) refreshAction();
}
