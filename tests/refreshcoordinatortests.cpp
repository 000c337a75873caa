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


#include <gtest/gtest.h>

#include "refreshcoordinator.hpp"

#include "testloop.hpp"

#include <unistd.h>
#include <pthread.h>

using namespace dprobe;


namespace {

  class RefreshCounter
  {
  public:
    int count;
    RefreshCounter() : count(0) {};
    void refresh() { count++; };
  };

  void *hammerRefresh(void *aArg)
  {
    RefreshCoordinator *rc = static_cast<RefreshCoordinator *>(aArg);
    for (int i=0; i<50; i++) {
      rc->requestRefresh();
    }
    return NULL;
  }

}


TEST(RefreshCoordinator, CollapsesRequestsWithinWindow)
{
  RefreshCounter counter;
  RefreshCoordinatorPtr rc = RefreshCoordinatorPtr(new RefreshCoordinator(MainLoop::currentMainLoop(), boost::bind(&RefreshCounter::refresh, &counter), 10*Second));
  EXPECT_TRUE(rc->isExpired());
  EXPECT_TRUE(rc->requestRefresh());
  for (int i=0; i<5; i++) {
    EXPECT_FALSE(rc->requestRefresh());
  }
  EXPECT_FALSE(rc->isExpired());
  EXPECT_EQ(1, rc->numScheduled());
  // runs asynchronously, never from within requestRefresh()
  EXPECT_EQ(0, counter.count);
  runLoopFor(20*MilliSecond);
  EXPECT_EQ(1, counter.count);
}


TEST(RefreshCoordinator, SchedulesAgainAfterExpiry)
{
  RefreshCounter counter;
  RefreshCoordinatorPtr rc = RefreshCoordinatorPtr(new RefreshCoordinator(MainLoop::currentMainLoop(), boost::bind(&RefreshCounter::refresh, &counter), 30*MilliSecond));
  EXPECT_TRUE(rc->requestRefresh());
  EXPECT_FALSE(rc->requestRefresh());
  usleep(40000);
  EXPECT_TRUE(rc->isExpired());
  EXPECT_TRUE(rc->requestRefresh());
  EXPECT_EQ(2, rc->numScheduled());
  runLoopFor(20*MilliSecond);
  EXPECT_EQ(2, counter.count);
}


TEST(RefreshCoordinator, ConcurrentRequestsScheduleOnce)
{
  RefreshCounter counter;
  RefreshCoordinatorPtr rc = RefreshCoordinatorPtr(new RefreshCoordinator(MainLoop::currentMainLoop(), boost::bind(&RefreshCounter::refresh, &counter), 10*Second));
  const int numThreads = 8;
  pthread_t threads[numThreads];
  for (int i=0; i<numThreads; i++) {
    ASSERT_EQ(0, pthread_create(&threads[i], NULL, hammerRefresh, rc.get()));
  }
  for (int i=0; i<numThreads; i++) {
    pthread_join(threads[i], NULL);
  }
  EXPECT_EQ(1, rc->numScheduled());
  runLoopFor(20*MilliSecond);
  EXPECT_EQ(1, counter.count);
}


TEST(RefreshCoordinator, DestructionCancelsPendingRefresh)
{
  RefreshCounter counter;
  size_t before = MainLoop::currentMainLoop().pendingExecutions();
  {
    RefreshCoordinatorPtr rc = RefreshCoordinatorPtr(new RefreshCoordinator(MainLoop::currentMainLoop(), boost::bind(&RefreshCounter::refresh, &counter)));
    EXPECT_TRUE(rc->requestRefresh());
    EXPECT_EQ(before+1, MainLoop::currentMainLoop().pendingExecutions());
  }
  EXPECT_EQ(before, MainLoop::currentMainLoop().pendingExecutions());
  runLoopFor(10*MilliSecond);
  EXPECT_EQ(0, counter.count);
}
