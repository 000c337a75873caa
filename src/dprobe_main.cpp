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


#include "application.hpp"

#include "capabilityprober.hpp"
#include "jsoncatalog.hpp"
#include "jsonrpcchannel.hpp"
#include "reportstore.hpp"

using namespace dprobe;

#define DEFAULT_LOGLEVEL LOG_NOTICE
#define DEFAULT_BATCH_TIMEOUT 30 // seconds
#define DEFAULT_REFRESH_EXPIRY_S 5 // seconds


/// run parameters, as collected from the command line
typedef struct {
  string host; ///< device host name or address
  uint16_t port; ///< device UDP port
  string model; ///< device model identifier
  string databaseDir; ///< device database directory
  string reportDir; ///< where reports go
  int boundaryOffset; ///< ids below the last probe id that complete a batch
  int batchTimeout; ///< seconds, 0 = wait for boundary response forever
  int refreshExpiry; ///< seconds
  int refreshInterval; ///< seconds, 0 = no periodic refresh
  bool monitor; ///< keep running after the report
} DiscoveryConfig;


class DProbe : public CmdLineApp
{
  typedef CmdLineApp inherited;

  DiscoveryConfig config;

  JsonRpcChannelPtr channel;
  CapabilityProberPtr prober;
  long refreshTicket;

public:

  DProbe() :
    refreshTicket(0)
  {
    config.port = JSONRPC_DEFAULT_PORT;
    config.databaseDir = ".";
    config.reportDir = ".";
    config.boundaryOffset = 0;
    config.batchTimeout = DEFAULT_BATCH_TIMEOUT;
    config.refreshExpiry = DEFAULT_REFRESH_EXPIRY_S;
    config.refreshInterval = 0;
    config.monitor = false;
  }

  virtual ~DProbe()
  {
    appMainLoop().cancelExecutionTicket(refreshTicket);
    prober.reset();
    channel.reset();
  }


  virtual int main(int argc, char **argv)
  {
    const char *usageText =
      "Usage: %1$s [options]\n"
      "Probes a device for the properties it supports and writes a capability report\n";
    const CmdLineOptionDescriptor options[] = {
      { 0  , "host",            true,  "host[:port];device host name or IP address (required)" },
      { 0  , "port",            true,  "port;device UDP port (default 54321)" },
      { 'm', "model",           true,  "model;device model identifier, e.g. vendor.family.v1 (required)" },
      { 'd', "database",        true,  "dirpath;directory with device database JSON files (default: current dir)" },
      { 'r', "reportdir",       true,  "dirpath;directory to write the report to (default: current dir)" },
      { 0  , "boundaryoffset",  true,  "ids;batch completes this many ids before the last probe (default 0)" },
      { 0  , "batchtimeout",    true,  "seconds;finalize unfinished batch after this time, 0=never (default 30)" },
      { 0  , "refreshexpiry",   true,  "seconds;minimal time between device info refreshes (default 5)" },
      { 0  , "refreshinterval", true,  "seconds;request device info refresh periodically, 0=never (default)" },
      { 0  , "monitor",         false, "keep running and refreshing device info after the report is written" },
      { 'l', "loglevel",        true,  "level;set max level of log message detail to show on stdout (default 5)" },
      { 0  , "errlevel",        true,  "level;set max level for log messages to go to stderr as well (default 3)" },
      { 'h', "help",            false, "show this text" },
      { 0, NULL } // list terminator
    };

    // parse the command line
    setCommandDescriptors(usageText, options);
    if (!parseCommandLine(argc, argv)) {
      return parseResult();
    }

    // log options
    int loglevel = DEFAULT_LOGLEVEL;
    getIntOption("loglevel", loglevel);
    SETLOGLEVEL(loglevel);
    int errlevel = LOG_ERR;
    getIntOption("errlevel", errlevel);
    SETERRLEVEL(errlevel, false);

    // device
    string hostSpec;
    if (!getStringOption("host", hostSpec) || !getStringOption("model", config.model)) {
      fprintf(stderr, "--host and --model must be specified\n");
      showUsage();
      return EXIT_FAILURE;
    }
    int port = config.port;
    getIntOption("port", port);
    if (port<=0 || port>0xFFFF) {
      fprintf(stderr, "invalid port %d\n", port);
      return EXIT_FAILURE;
    }
    config.port = (uint16_t)port;
    if (!splitHost(hostSpec, config.host, config.port)) {
      fprintf(stderr, "invalid host specification '%s'\n", hostSpec.c_str());
      return EXIT_FAILURE;
    }
    getStringOption("database", config.databaseDir);
    getStringOption("reportdir", config.reportDir);
    getIntOption("boundaryoffset", config.boundaryOffset);
    getIntOption("batchtimeout", config.batchTimeout);
    getIntOption("refreshexpiry", config.refreshExpiry);
    getIntOption("refreshinterval", config.refreshInterval);
    config.monitor = getOption("monitor")!=NULL;

    // create the parts
    channel = JsonRpcChannelPtr(new JsonRpcChannel(appMainLoop()));
    channel->setDeviceAddress(config.host, config.port);
    JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(config.databaseDir));
    ReportStorePtr store = ReportStorePtr(new FileReportStore(config.reportDir));
    prober = CapabilityProberPtr(new CapabilityProber(appMainLoop(), channel, catalog, store));
    prober->setBoundaryOffset(config.boundaryOffset);
    prober->setBatchTimeout(config.batchTimeout*Second);
    prober->setRefreshExpiry(config.refreshExpiry*Second);
    prober->setDiscoveryStatusHandler(boost::bind(&DProbe::discoveryStatus, this, _1));

    // app now ready to run
    return run();
  }


  virtual void initialize()
  {
    LOG(LOG_NOTICE, "dprobe: probing %s:%hu, model '%s'", config.host.c_str(), config.port, config.model.c_str());
    ErrorPtr err = channel->open();
    if (!Error::isOK(err)) {
      LOG(LOG_ERR, "Cannot open connection to device: %s", err->description().c_str());
      terminateApp(EXIT_FAILURE);
      return;
    }
    if (config.refreshInterval>0) {
      refreshTicket = appMainLoop().executeOnce(boost::bind(&DProbe::periodicRefresh, this, _1), config.refreshInterval*Second);
    }
    err = prober->runDiscovery(config.model);
    if (!Error::isOK(err)) {
      terminateApp(EXIT_FAILURE);
    }
  }


  void discoveryStatus(bool aDiscovering)
  {
    LOG(LOG_INFO, "Discovery status: %s", aDiscovering ? "ON" : "OFF");
    if (!aDiscovering) {
      if (!prober->deviceInfo().empty()) {
        LOG(LOG_NOTICE, "Device info: %s", prober->deviceInfo().c_str());
      }
      if (!config.monitor) {
        terminateApp(EXIT_SUCCESS);
      }
    }
  }


  void periodicRefresh(MLMicroSeconds aCycleStartTime)
  {
    prober->requestRefresh();
    refreshTicket = appMainLoop().executeOnce(boost::bind(&DProbe::periodicRefresh, this, _1), config.refreshInterval*Second);
  }

};


int main(int argc, char **argv)
{
  // prevent all logging until command line determines level
  SETLOGLEVEL(LOG_EMERG);
  SETERRLEVEL(LOG_EMERG, false); // messages, if any, go to stderr
  // create app with current mainloop
  DProbe *application = new DProbe;
  // pass control
  int status = application->main(argc, argv);
  // done
  delete application;
  return status;
}
