//
//  Copyright (c) 2013-2016 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
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


#include "mainloop.hpp"

#include <unistd.h>
#include <time.h>
#include <stdlib.h>

#pragma mark - MainLoop


#define MAINLOOP_DEFAULT_CYCLE_TIME_uS 100000 // 100mS


using namespace dprobe;

// time reference in microseconds
MLMicroSeconds MainLoop::now()
{
  struct timespec tsp;
  clock_gettime(CLOCK_MONOTONIC, &tsp);
  // return microseconds
  return ((MLMicroSeconds)(tsp.tv_sec))*1000000ll + tsp.tv_nsec/1000; // uS
}


// the current thread's main looop
static __thread MainLoop *currentMainLoopP = NULL;

// get the per-thread singleton mainloop
MainLoop &MainLoop::currentMainLoop()
{
  if (currentMainLoopP==NULL) {
    // need to create it
    currentMainLoopP = new MainLoop();
  }
  return *currentMainLoopP;
}


MainLoop::MainLoop() :
  ticketNo(0),
  terminated(false),
  exitCode(EXIT_SUCCESS),
  loopCycleTime(MAINLOOP_DEFAULT_CYCLE_TIME_uS),
  cycleStartTime(Never)
{
  pthread_mutex_init(&onetimeHandlersMutex, NULL);
}


MainLoop::~MainLoop()
{
  pthread_mutex_destroy(&onetimeHandlersMutex);
}


void MainLoop::setLoopCycleTime(MLMicroSeconds aCycleTime)
{
  loopCycleTime = aCycleTime;
}


long MainLoop::executeOnce(OneTimeCB aCallback, MLMicroSeconds aDelay)
{
  MLMicroSeconds executionTime = now()+aDelay;
  return executeOnceAt(aCallback, executionTime);
}


long MainLoop::executeOnceAt(OneTimeCB aCallback, MLMicroSeconds aExecutionTime)
{
  OnetimeHandler h;
  h.executionTime = aExecutionTime;
  h.callback = aCallback;
  return scheduleOneTimeHandler(h);
}


long MainLoop::scheduleOneTimeHandler(OnetimeHandler &aHandler)
{
  pthread_mutex_lock(&onetimeHandlersMutex);
  aHandler.ticketNo = ++ticketNo;
  // insert in queue before first item that has a higher execution time
  OnetimeHandlerList::iterator pos = onetimeHandlers.begin();
  while (pos!=onetimeHandlers.end() && pos->executionTime<=aHandler.executionTime) {
    ++pos;
  }
  onetimeHandlers.insert(pos, aHandler);
  long t = aHandler.ticketNo;
  pthread_mutex_unlock(&onetimeHandlersMutex);
  return t;
}


void MainLoop::cancelExecutionTicket(long &aTicketNo)
{
  if (aTicketNo==0) return; // no ticket, NOP
  pthread_mutex_lock(&onetimeHandlersMutex);
  for (OnetimeHandlerList::iterator pos = onetimeHandlers.begin(); pos!=onetimeHandlers.end(); ++pos) {
    if (pos->ticketNo==aTicketNo) {
      onetimeHandlers.erase(pos);
      break;
    }
  }
  pthread_mutex_unlock(&onetimeHandlersMutex);
  // reset the ticket
  aTicketNo = 0;
}


size_t MainLoop::pendingExecutions()
{
  pthread_mutex_lock(&onetimeHandlersMutex);
  size_t n = onetimeHandlers.size();
  pthread_mutex_unlock(&onetimeHandlersMutex);
  return n;
}


MLMicroSeconds MainLoop::nextExecutionTime()
{
  MLMicroSeconds t = Never;
  pthread_mutex_lock(&onetimeHandlersMutex);
  if (!onetimeHandlers.empty()) t = onetimeHandlers.front().executionTime;
  pthread_mutex_unlock(&onetimeHandlersMutex);
  return t;
}


void MainLoop::terminate(int aExitCode)
{
  exitCode = aExitCode;
  terminated = true;
}


void MainLoop::runOnetimeHandlers()
{
  // Note: handlers are taken out of the list one by one with the mutex held, but called without,
  //   so handlers (or other threads) can schedule new handlers while we run them.
  while (!terminated) {
    OneTimeCB cb;
    pthread_mutex_lock(&onetimeHandlersMutex);
    OnetimeHandlerList::iterator pos = onetimeHandlers.begin();
    if (pos!=onetimeHandlers.end() && pos->executionTime<=now()) {
      cb = pos->callback;
      onetimeHandlers.erase(pos);
    }
    pthread_mutex_unlock(&onetimeHandlersMutex);
    if (cb.empty()) break; // nothing due (any more)
    cb(cycleStartTime); // call handler
  }
}


void MainLoop::registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler)
{
  if (aPollEventHandler.empty()) {
    unregisterPollHandler(aFD); // no handler means unregistering handler
    return;
  }
  IOPollHandler h;
  h.monitoredFD = aFD;
  h.pollFlags = aPollFlags;
  h.pollHandler = aPollEventHandler;
  ioPollHandlers[aFD] = h;
}


void MainLoop::unregisterPollHandler(int aFD)
{
  ioPollHandlers.erase(aFD);
}


bool MainLoop::handleIOPoll(MLMicroSeconds aTimeout)
{
  // fill poll structure
  std::vector<struct pollfd> pollFds;
  for (IOPollHandlerMap::iterator pos = ioPollHandlers.begin(); pos!=ioPollHandlers.end(); ++pos) {
    if (pos->second.pollFlags) {
      // don't include handlers that are currently disabled (no flags set)
      struct pollfd pfd;
      pfd.fd = pos->second.monitoredFD;
      pfd.events = (short)pos->second.pollFlags;
      pfd.revents = 0; // no event returned so far
      pollFds.push_back(pfd);
    }
  }
  // block until input becomes available or timeout
  int numReadyFDs = 0;
  if (pollFds.size()>0) {
    numReadyFDs = poll(&pollFds[0], (nfds_t)pollFds.size(), (int)(aTimeout/MilliSecond));
  }
  else if (aTimeout>0) {
    // nothing to test, just await timeout
    usleep((useconds_t)aTimeout);
  }
  if (numReadyFDs>0) {
    // at least one of the flagged events has occurred in at least one FD
    for (size_t i = 0; i<pollFds.size(); i++) {
      struct pollfd &pfd = pollFds[i];
      if (pfd.revents) {
        // - get handler, note that it might have been deleted in the meantime
        IOPollHandlerMap::iterator pos = ioPollHandlers.find(pfd.fd);
        if (pos!=ioPollHandlers.end()) {
          IOPollCB cb = pos->second.pollHandler; // copy, handler might unregister itself
          cb(cycleStartTime, pfd.fd, pfd.revents);
        }
      }
    }
  }
  // return true if poll actually reported something (not just timed out)
  return numReadyFDs>0;
}


int MainLoop::run()
{
  terminated = false;
  while (!terminated) {
    cycleStartTime = now();
    // start of a new cycle
    runOnetimeHandlers();
    if (terminated) break;
    // wait for I/O until end of cycle or next scheduled execution, whichever comes first
    MLMicroSeconds timeLeft = cycleStartTime+loopCycleTime-now();
    MLMicroSeconds next = nextExecutionTime();
    if (next!=Never && next-now()<timeLeft) {
      timeLeft = next-now();
    }
    handleIOPoll(timeLeft>0 ? timeLeft : 0);
  }
  return exitCode;
}
