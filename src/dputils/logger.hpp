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


#ifndef __dprobe__logger__
#define __dprobe__logger__

#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>

#include <syslog.h>
#include <string>

#if defined(DEBUG) || ALWAYS_DEBUG
#define DBGLOG(lvl,...) LOG(lvl,##__VA_ARGS__)
#define LOGGER_DEFAULT_LOGLEVEL LOG_DEBUG
#else
#define DBGLOG(lvl,...)
#define LOGGER_DEFAULT_LOGLEVEL LOG_NOTICE
#endif

// define FOCUSLOGLEVEL before including to get FOCUSLOG output of a single file
#if FOCUSLOGLEVEL
#define FOCUSLOG(...) LOG(FOCUSLOGLEVEL,##__VA_ARGS__)
#else
#define FOCUSLOG(...)
#endif

#define LOG(lvl,...) { if (globalLogger.logEnabled(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }

#define SETLOGLEVEL(lvl) globalLogger.setLogLevel(lvl)
#define SETERRLEVEL(lvl, dup) globalLogger.setErrLevel(lvl, dup)


namespace dprobe {

  /// line oriented logger writing to stdout and stderr
  /// @note messages at or above the stderr level are always written, regardless of the log level
  class Logger
  {
    pthread_mutex_t outputMutex;
    int logLevel;
    int stderrLevel;
    bool errToStdout;

  public:
    Logger();
    ~Logger();

    /// @return true if a message at aLevel would be written anywhere
    bool logEnabled(int aLevel) const { return aLevel<=logLevel || aLevel<=stderrLevel; };

    /// log a printf style message. A line end is added when missing
    void log(int aLevel, const char *aFmt, ... );

    /// @param aLogLevel syslog level (LOG_EMERG..LOG_DEBUG) for stdout, other values are ignored
    void setLogLevel(int aLogLevel);

    /// @param aStderrLevel messages at this or a more severe level go to stderr (default LOG_ERR)
    /// @param aErrToStdout if set, stderr messages also go to stdout when the log level allows
    void setErrLevel(int aStderrLevel, bool aErrToStdout);

    /// escape ASCII control characters as \xNN, keep line ends and UTF-8
    /// @param aMessage message to escape in place
    /// @return true if the message has more than one line
    static bool escapeMessage(std::string &aMessage);

    /// @return "[YYYY-MM-DD HH:MM:SS.mmm X]" with X being the level's letter
    static std::string linePrefix(int aLevel);

  };

} // namespace dprobe


extern dprobe::Logger globalLogger;


#endif /* defined(__dprobe__logger__) */
