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


#include "logger.hpp"

#include <sys/time.h>
#include <ctype.h>
#include <stdint.h>
#include <time.h>

#include "utils.hpp"

using namespace dprobe;

dprobe::Logger globalLogger;

static const char levelLetters[] = "MACEWNID"; // indexed by syslog level, LOG_EMERG..LOG_DEBUG


Logger::Logger() :
  logLevel(LOGGER_DEFAULT_LOGLEVEL),
  stderrLevel(LOG_ERR),
  errToStdout(true)
{
  pthread_mutex_init(&outputMutex, NULL);
}


Logger::~Logger()
{
  pthread_mutex_destroy(&outputMutex);
}


bool Logger::escapeMessage(string &aMessage)
{
  bool multiline = false;
  string out;
  out.reserve(aMessage.size());
  for (size_t i=0; i<aMessage.size(); i++) {
    char c = aMessage[i];
    if (c=='\n') {
      if (i+1<aMessage.size()) multiline = true;
      out += c;
    }
    else if ((uint8_t)c<0x80 && !isprint(c)) {
      string_format_append(out, "\\x%02x", (unsigned)(uint8_t)c);
    }
    else {
      out += c;
    }
  }
  aMessage.swap(out);
  return multiline;
}


string Logger::linePrefix(int aLevel)
{
  struct timeval t;
  struct tm tim;
  gettimeofday(&t, NULL);
  localtime_r(&t.tv_sec, &tim);
  char letter = aLevel>=LOG_EMERG && aLevel<=LOG_DEBUG ? levelLetters[aLevel] : '?';
  return string_format(
    "[%04d-%02d-%02d %02d:%02d:%02d.%03d %c]",
    tim.tm_year+1900, tim.tm_mon+1, tim.tm_mday, tim.tm_hour, tim.tm_min, tim.tm_sec,
    (int)(t.tv_usec/1000), letter
  );
}


void Logger::log(int aLevel, const char *aFmt, ... )
{
  bool toStderr = aLevel<=stderrLevel;
  bool toStdout = aLevel<=logLevel && (!toStderr || errToStdout);
  if (!toStderr && !toStdout) return;
  va_list args;
  va_start(args, aFmt);
  string message;
  string_format_v(message, false, aFmt, args);
  va_end(args);
  bool multiline = escapeMessage(message);
  if (message.empty() || message[message.size()-1]!='\n') message += '\n';
  // multiline messages start on their own line
  string line = linePrefix(aLevel) + (multiline ? "\n" : " ") + message;
  pthread_mutex_lock(&outputMutex);
  if (toStderr) { fputs(line.c_str(), stderr); fflush(stderr); }
  if (toStdout) { fputs(line.c_str(), stdout); fflush(stdout); }
  pthread_mutex_unlock(&outputMutex);
}


void Logger::setLogLevel(int aLogLevel)
{
  if (aLogLevel>=LOG_EMERG && aLogLevel<=LOG_DEBUG) logLevel = aLogLevel;
}


void Logger::setErrLevel(int aStderrLevel, bool aErrToStdout)
{
  if (aStderrLevel<LOG_EMERG || aStderrLevel>LOG_DEBUG) return;
  stderrLevel = aStderrLevel;
  errToStdout = aErrToStdout;
}
