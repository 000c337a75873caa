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


#ifndef __dprobe__mainloop__
#define __dprobe__mainloop__

#include "dp_common.hpp"

#include <sys/poll.h>
#include <pthread.h>

using namespace std;

namespace dprobe {

  class MainLoop;

  // Mainloop timing unit
  typedef long long MLMicroSeconds;
  const MLMicroSeconds Never = 0;
  const MLMicroSeconds Infinite = -1;
  const MLMicroSeconds MicroSecond = 1;
  const MLMicroSeconds MilliSecond = 1000;
  const MLMicroSeconds Second = 1000*MilliSecond;
  const MLMicroSeconds Minute = 60*Second;

  /// @name Mainloop callbacks
  /// @{

  /// Generic handler for returning a status (ok or error)
  typedef boost::function<void (ErrorPtr aError)> StatusCB;

  /// Handler for one time processing (scheduled by executeOnce()/executeOnceAt())
  typedef boost::function<void (MLMicroSeconds aCycleStartTime)> OneTimeCB;

  /// I/O callback
  /// @param aCycleStartTime the time when the current mainloop cycle has started
  /// @param aFD the file descriptor that was signalled and has caused this call
  /// @param aPollFlags the poll flags describing the reason for the callback
  /// @return should true if callback really handled some I/O, false if it only checked flags and found nothing to do
  typedef boost::function<bool (MLMicroSeconds aCycleStartTime, int aFD, int aPollFlags)> IOPollCB;

  /// @}


  /// A main loop for a thread
  class MainLoop : public DpObj
  {
    typedef struct {
      long ticketNo;
      MLMicroSeconds executionTime;
      OneTimeCB callback;
    } OnetimeHandler;
    typedef std::list<OnetimeHandler> OnetimeHandlerList;

    OnetimeHandlerList onetimeHandlers;
    pthread_mutex_t onetimeHandlersMutex; ///< protects onetimeHandlers and ticketNo
    long ticketNo;

    typedef struct {
      int monitoredFD;
      int pollFlags;
      IOPollCB pollHandler;
    } IOPollHandler;
    typedef std::map<int, IOPollHandler> IOPollHandlerMap;

    IOPollHandlerMap ioPollHandlers;

  protected:

    bool terminated;
    int exitCode;

    MLMicroSeconds loopCycleTime;
    MLMicroSeconds cycleStartTime;

    // protected constructor
    MainLoop();

  public:

    virtual ~MainLoop();

    /// returns or creates the current thread's mainloop
    static MainLoop &currentMainLoop();

    /// returns the current microsecond in a monotonic time base
    static MLMicroSeconds now();

    /// set the cycle time
    /// @note the cycle time is the max time the mainloop waits for I/O before checking one time handlers again.
    void setLoopCycleTime(MLMicroSeconds aCycleTime);

    /// have handler called from the mainloop once at a given time
    /// @param aCallback the functor to be called
    /// @param aExecutionTime when to execute (approximately), in now() timescale
    /// @return ticket number which can be used to cancel this specific execution request
    /// @note this method may be called from any thread
    long executeOnceAt(OneTimeCB aCallback, MLMicroSeconds aExecutionTime);

    /// have handler called from the mainloop once with an optional delay from now
    /// @param aCallback the functor to be called
    /// @param aDelay delay from now when to execute (approximately)
    /// @return ticket number which can be used to cancel this specific execution request
    /// @note this method may be called from any thread
    long executeOnce(OneTimeCB aCallback, MLMicroSeconds aDelay = 0);

    /// cancel pending execution by ticket number
    /// @param aTicketNo ticket of execution to cancel. Will be set to 0 on return
    void cancelExecutionTicket(long &aTicketNo);

    /// @return number of one time handlers waiting for execution
    size_t pendingExecutions();

    /// register handler to be called for activity on specified file descriptor
    /// @param aFD the file descriptor to poll
    /// @param aPollFlags POLLxxx flags to specify events we want a callback for
    /// @param aPollEventHandler the functor to be called when poll() reports an event for one of the flags set in aPollFlags
    void registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler);

    /// unregister poll handler for a file descriptor
    /// @param aFD the file descriptor
    void unregisterPollHandler(int aFD);

    /// terminate the mainloop
    /// @param aExitCode the code to return from run()
    void terminate(int aExitCode);

    /// run the mainloop until terminate() is called
    /// @return returns the exit code passed to terminate()
    virtual int run();

  protected:

    /// run all one time handlers that are due
    void runOnetimeHandlers();

    /// poll file descriptors and call their handlers
    /// @param aTimeout max time to wait for I/O
    /// @return true if I/O handling occurred
    bool handleIOPoll(MLMicroSeconds aTimeout);

  private:

    long scheduleOneTimeHandler(OnetimeHandler &aHandler);
    MLMicroSeconds nextExecutionTime();

  };

} // namespace dprobe

#endif /* defined(__dprobe__mainloop__) */
