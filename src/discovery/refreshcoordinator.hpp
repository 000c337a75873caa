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


#ifndef __dprobe__refreshcoordinator__
#define __dprobe__refreshcoordinator__

#include "dp_common.hpp"

#include <pthread.h>

using namespace std;

namespace dprobe {

  #define DEFAULT_REFRESH_EXPIRY (5*Second)

  /// the refresh to run
  typedef boost::function<void ()> RefreshCB;

  class RefreshCoordinator;
  typedef boost::intrusive_ptr<RefreshCoordinator> RefreshCoordinatorPtr;

  /// gate that lets at most one refresh through per expiry window
  /// @note requestRefresh() may be called from any thread, the refresh itself always runs on the mainloop
  class RefreshCoordinator : public DpObj
  {
    MainLoop &mainLoop;
    RefreshCB refreshAction;
    MLMicroSeconds expiryInterval;

    pthread_mutex_t gateMutex; ///< protects everything below
    bool cachedValue; ///< a refresh was triggered in the current window
    MLMicroSeconds expiry; ///< end of the current window
    long refreshTicket;
    int refreshesScheduled;

  public:

    /// @param aMainLoop the mainloop to run the refresh action on
    /// @param aRefreshAction the refresh to run
    /// @param aExpiryInterval length of the window in which further requests are ignored
    RefreshCoordinator(MainLoop &aMainLoop, RefreshCB aRefreshAction, MLMicroSeconds aExpiryInterval = DEFAULT_REFRESH_EXPIRY);
    virtual ~RefreshCoordinator();

    void setExpiryInterval(MLMicroSeconds aExpiryInterval);

    /// request a refresh
    /// @return true if a refresh was scheduled, false if one is in flight or was done within the expiry window
    bool requestRefresh();

    /// @return true if the cached refresh flag has expired (next request will schedule a refresh)
    bool isExpired();

    /// @return number of refreshes scheduled so far
    int numScheduled();

  private:

    void runRefresh(MLMicroSeconds aCycleStartTime);

  };

} // namespace dprobe

#endif /* defined(__dprobe__refreshcoordinator__) */
