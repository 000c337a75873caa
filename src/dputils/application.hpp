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


#ifndef __dprobe__application__
#define __dprobe__application__

#include "dp_common.hpp"

using namespace std;

namespace dprobe {

  class Application : public DpObj
  {
    MainLoop &mainLoop;

  public:

    Application(MainLoop &aMainLoop);
    Application();

    virtual ~Application();

    /// main routine
    /// @param argc argument count as passed to C-level main() entry point
    /// @param argv argument pointer array as passed to C-level main() entry point
    virtual int main(int argc, char **argv);

    /// get shared instance (singleton)
    static Application *sharedApplication();

    /// terminate app by terminating its mainloop
    /// @param aExitCode the exit code to return from run()
    void terminateApp(int aExitCode);

  protected:

    /// the mainloop this app runs on
    MainLoop &appMainLoop() { return mainLoop; };

    /// start running the app's main loop
    /// @return the exit code passed to terminateApp()
    int run();

    /// scheduled to run when mainloop has started
    virtual void initialize();

  private:

    void initializeHandler(MLMicroSeconds aCycleStartTime);

  };


  /// Command line option descriptor
  /// @note a descriptor with both longOptionName==NULL and shortOptionChar=0 terminates a list of option descriptors
  typedef struct {
    char shortOptionChar; ///< the short option name (single character) or 0/NUL if none
    const char *longOptionName; ///< the long option name (string) or NULL if none
    bool withArgument; ///< true if option has an argument (separated by = or next argument)
    const char *optionDescription; ///< "argname;description" for options with argument, description only otherwise. Lines separated by \n
  } CmdLineOptionDescriptor;

  typedef vector<string> ArgumentsVector;
  typedef map<string,string> OptionsMap;

  class CmdLineApp : public Application
  {
    typedef Application inherited;

    const CmdLineOptionDescriptor *optionDescriptors;

    string invocationName;
    string synopsis;
    OptionsMap options;
    ArgumentsVector arguments;
    int parseExitCode;

  public:

    CmdLineApp(MainLoop &aMainLoop);
    CmdLineApp();

    virtual ~CmdLineApp();

  protected:

    /// set command description constants (option definitions and synopsis)
    /// @param aSynopsis short usage description, used in showUsage(). %1$s will be replaced by invocationName
    /// @param aOptionDescriptors pointer to array of descriptors for the options
    void setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors);

    /// show usage, consisting of invocationName + synopsis + option descriptions
    void showUsage();

    /// parse command line.
    /// @param aArgc argument count as passed to C-level main() entry point
    /// @param aArgv argument pointer array as passed to C-level main() entry point
    /// @return false if the command line has syntax errors (usage already shown) or help was requested.
    ///   The app should then exit with parseResult()
    /// @note setCommandDescriptors() must be called before using this method
    bool parseCommandLine(int aArgc, char **aArgv);

    /// @return EXIT_SUCCESS after help was shown, EXIT_FAILURE after a command line syntax error
    int parseResult() { return parseExitCode; };

    /// process a command line option. Override this to implement processing command line options
    /// @param aOptionDescriptor the descriptor of the option
    /// @param aOptionValue the value of the option, empty string if option has no value
    /// @return true if option has been processed; false if option should be stored for later reference via getOption()
    virtual bool processOption(const CmdLineOptionDescriptor &aOptionDescriptor, const char *aOptionValue) { return false; };

    /// process a non-option command line argument
    /// @param aArgument non-option argument
    /// @return true if argument has been processed; false if argument should be stored for later reference via getArgument()
    virtual bool processArgument(const char *aArgument) { return false; };

    /// get app invocation name
    const char *getInvocationName();

    /// get option
    /// @param aOptionName the name of the option (longOptionName if exists, shortOptionChar if no longOptionName exists)
    /// @return NULL if option was not specified on the command line, empty string for options without argument, option's argument otherwise
    const char *getOption(const char *aOptionName);

    /// @param aOptionName the name of the option
    /// @param aInteger will be set with the integer value of the option, if any
    /// @return true if option was specified and had a valid integer argument, false otherwise (aInteger will be untouched then)
    bool getIntOption(const char *aOptionName, int &aInteger);

    /// @param aOptionName the name of the option
    /// @param aString will be set to the option argument, if any
    /// @return true if option was specified and had an option argument
    bool getStringOption(const char *aOptionName, string &aString);

    /// get non-option argument
    /// @param aArgumentIndex the index of the argument (0=first non-option argument)
    /// @return NULL if aArgumentIndex>=numArguments(), argument otherwise
    const char *getArgument(size_t aArgumentIndex);

    /// get number of (non-processed) arguments
    size_t numArguments();

  };

} // namespace dprobe


#endif /* defined(__dprobe__application__) */
