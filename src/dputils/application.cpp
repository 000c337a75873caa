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


#include "application.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace dprobe;

#pragma mark - Application base class

static Application *sharedApplicationP = NULL;


Application *Application::sharedApplication()
{
  return sharedApplicationP;
}


Application::Application(MainLoop &aMainLoop) :
  mainLoop(aMainLoop)
{
  sharedApplicationP = this;
}


Application::Application() :
  mainLoop(MainLoop::currentMainLoop())
{
  sharedApplicationP = this;
}


Application::~Application()
{
  if (sharedApplicationP==this) sharedApplicationP = NULL;
}


int Application::main(int argc, char **argv)
{
  // NOP application
  return EXIT_SUCCESS;
}


void Application::initialize()
{
  // NOP
}


void Application::initializeHandler(MLMicroSeconds aCycleStartTime)
{
  initialize();
}


int Application::run()
{
  // schedule the initialize() method as first mainloop method
  mainLoop.executeOnce(boost::bind(&Application::initializeHandler, this, _1));
  // run the mainloop
  return mainLoop.run();
}


void Application::terminateApp(int aExitCode)
{
  mainLoop.terminate(aExitCode);
}


#pragma mark - CmdLineApp command line application


CmdLineApp::CmdLineApp(MainLoop &aMainLoop) :
  inherited(aMainLoop),
  optionDescriptors(NULL),
  parseExitCode(EXIT_SUCCESS)
{
}


CmdLineApp::CmdLineApp() :
  optionDescriptors(NULL),
  parseExitCode(EXIT_SUCCESS)
{
}


CmdLineApp::~CmdLineApp()
{
}


void CmdLineApp::setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors)
{
  optionDescriptors = aOptionDescriptors;
  synopsis = aSynopsis ? aSynopsis : "Usage: %1$s";
}


static bool endOfDescriptors(const CmdLineOptionDescriptor *aDescP)
{
  return aDescP==NULL || (aDescP->longOptionName==NULL && aDescP->shortOptionChar=='\x00');
}


// splits "argname;description" for options with argument
static void splitDescription(const CmdLineOptionDescriptor &aDesc, string &aArgName, string &aText)
{
  aArgName.clear();
  aText = nonNullCStr(aDesc.optionDescription);
  if (aDesc.withArgument) {
    size_t n = aText.find(';');
    if (n!=string::npos) {
      aArgName = aText.substr(0, n);
      aText.erase(0, n+1);
    }
    else {
      aArgName = "value";
    }
  }
}


#define MAX_INDENT 40

void CmdLineApp::showUsage()
{
  // print synopsis
  fprintf(stderr, synopsis.c_str(), invocationName.c_str());
  fprintf(stderr, "\n");
  // - calculate indent
  size_t indent = 0;
  bool anyShortOpts = false;
  for (const CmdLineOptionDescriptor *optionDescP = optionDescriptors; !endOfDescriptors(optionDescP); optionDescP++) {
    if (optionDescP->shortOptionChar) anyShortOpts = true;
    string argName, text;
    splitDescription(*optionDescP, argName, text);
    size_t n = 0;
    if (optionDescP->longOptionName) n += strlen(optionDescP->longOptionName)+2; // "--XXXXX"
    if (!argName.empty()) n += argName.size()+1; // " argname"
    if (n>MAX_INDENT) n = MAX_INDENT;
    if (n>indent) indent = n;
  }
  if (anyShortOpts) indent += 4; // "-X, " prefix
  indent += 2+2; // two at beginning, two at end
  // - print options
  fprintf(stderr, "Options:\n");
  for (const CmdLineOptionDescriptor *optionDescP = optionDescriptors; !endOfDescriptors(optionDescP); optionDescP++) {
    string line = "  ";
    if (anyShortOpts) {
      if (optionDescP->shortOptionChar)
        string_format_append(line, "-%c", optionDescP->shortOptionChar);
      else
        line += "  ";
      if (optionDescP->longOptionName)
        line += optionDescP->shortOptionChar ? ", " : "  ";
    }
    if (optionDescP->longOptionName) {
      string_format_append(line, "--%s", optionDescP->longOptionName);
    }
    string argName, text;
    splitDescription(*optionDescP, argName, text);
    if (!argName.empty()) {
      string_format_append(line, " %s", argName.c_str());
    }
    // complete first line indent, too long option names get their own line
    if (line.size()+2>indent) {
      line += "\n";
      line.append(indent, ' ');
    }
    else {
      line.append(indent-line.size(), ' ');
    }
    // description, continuation lines indented
    for (size_t i=0; i<text.size(); i++) {
      line += text[i];
      if (text[i]=='\n') line.append(indent, ' ');
    }
    fprintf(stderr, "%s\n", line.c_str());
  }
  fprintf(stderr, "\n");
}


bool CmdLineApp::parseCommandLine(int aArgc, char **aArgv)
{
  parseExitCode = EXIT_SUCCESS;
  if (aArgc<=0) return true;
  invocationName = aArgv[0];
  int rawArgIndex = 1;
  while (rawArgIndex<aArgc) {
    const char *argP = aArgv[rawArgIndex];
    if (*argP=='-' && argP[1]) {
      // option argument
      argP++;
      bool longOpt = false;
      string optName;
      string optArg;
      bool optArgFound = false;
      if (*argP=='-') {
        longOpt = true;
        optName = argP+1;
      }
      else {
        optName = argP;
        if (optName.length()>1 && optName[1]!='=') {
          // option argument follows directly after single char option
          optArgFound = true;
          optArg = optName.substr(1);
          optName.erase(1);
        }
      }
      // option argument directly following option, separated by equal sign
      string::size_type n = optName.find('=');
      if (n!=string::npos) {
        optArgFound = true; // counts as option argument even if empty string
        optArg = optName.substr(n+1);
        optName.erase(n);
      }
      if ((longOpt && optName=="help") || (!longOpt && optName=="h")) {
        showUsage();
        parseExitCode = EXIT_SUCCESS;
        return false;
      }
      // search for option descriptor
      const CmdLineOptionDescriptor *optionDescP = optionDescriptors;
      bool optionFound = false;
      for (; !endOfDescriptors(optionDescP); optionDescP++) {
        if (
          (longOpt && optionDescP->longOptionName && optName==optionDescP->longOptionName) ||
          (!longOpt && optionDescP->shortOptionChar && optName[0]==optionDescP->shortOptionChar)
        ) {
          optionFound = true;
          break;
        }
      }
      if (!optionFound) {
        fprintf(stderr, "Unknown Option '%s'\n", optName.c_str());
        showUsage();
        parseExitCode = EXIT_FAILURE;
        return false;
      }
      if (!optionDescP->withArgument) {
        if (optArgFound) {
          fprintf(stderr, "Option '%s' does not expect an argument\n", optName.c_str());
          showUsage();
          parseExitCode = EXIT_FAILURE;
          return false;
        }
      }
      else if (!optArgFound) {
        // next raw argument is the option argument
        if (rawArgIndex+1>=aArgc) {
          fprintf(stderr, "Option '%s' requires an argument\n", optName.c_str());
          showUsage();
          parseExitCode = EXIT_FAILURE;
          return false;
        }
        rawArgIndex++;
        optArg = aArgv[rawArgIndex];
      }
      // have option processed by subclass, store it otherwise
      if (!processOption(*optionDescP, optArg.c_str())) {
        string key = optionDescP->longOptionName ? optionDescP->longOptionName : string(1, optionDescP->shortOptionChar);
        options[key] = optArg;
      }
    }
    else {
      // non-option argument
      if (!processArgument(argP)) {
        arguments.push_back(argP);
      }
    }
    rawArgIndex++;
  }
  return true;
}


const char *CmdLineApp::getInvocationName()
{
  return invocationName.c_str();
}


const char *CmdLineApp::getOption(const char *aOptionName)
{
  OptionsMap::iterator pos = options.find(aOptionName);
  if (pos!=options.end()) {
    return pos->second.c_str();
  }
  return NULL;
}


bool CmdLineApp::getIntOption(const char *aOptionName, int &aInteger)
{
  const char *opt = getOption(aOptionName);
  if (opt) {
    int i;
    char extra;
    if (sscanf(opt, "%d%c", &i, &extra)==1) {
      aInteger = i;
      return true;
    }
  }
  return false;
}


bool CmdLineApp::getStringOption(const char *aOptionName, string &aString)
{
  const char *opt = getOption(aOptionName);
  if (opt && *opt) {
    aString = opt;
    return true;
  }
  return false;
}


const char *CmdLineApp::getArgument(size_t aArgumentIndex)
{
  if (aArgumentIndex>=arguments.size()) return NULL;
  return arguments[aArgumentIndex].c_str();
}


size_t CmdLineApp::numArguments()
{
  return arguments.size();
}
