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


#ifndef __dprobe__capabilityprober__
#define __dprobe__capabilityprober__

#include "dp_common.hpp"

#include "propertycatalog.hpp"
#include "commandchannel.hpp"
#include "reportstore.hpp"
#include "probesession.hpp"
#include "responsecorrelator.hpp"
#include "reportassembler.hpp"
#include "refreshcoordinator.hpp"

#include <pthread.h>

using namespace std;

namespace dprobe {

  /// discovery status
  /// @param aDiscovering true when a batch has been started, false when it has finished
  typedef boost::function<void (bool aDiscovering)> DiscoveryStatusCB;

  class CapabilityProber;
  typedef boost::intrusive_ptr<CapabilityProber> CapabilityProberPtr;

  /// discovers which properties one device supports
  /// @note all methods may be called from any thread, session state is serialized by an internal mutex
  class CapabilityProber : public DpObj
  {
    MainLoop &mainLoop;
    CommandChannelPtr channel;
    CandidateCatalogPtr catalog;

    pthread_mutex_t proberMutex; ///< protects session, correlator, assembler and deadline
    ProbeSession session;
    ReportAssembler assembler;
    ResponseCorrelator correlator;
    RefreshCoordinatorPtr refreshCoordinator;

    MLMicroSeconds batchTimeout;
    long deadlineTicket;
    DiscoveryStatusCB statusHandler;

  public:

    /// @param aMainLoop mainloop for refreshes and the batch deadline
    /// @param aChannel the command channel to the device. The prober installs its response handler
    /// @param aCatalog candidate catalog
    /// @param aReportStore where to put reports, can be NULL
    CapabilityProber(MainLoop &aMainLoop, CommandChannelPtr aChannel, CandidateCatalogPtr aCatalog, ReportStorePtr aReportStore);
    virtual ~CapabilityProber();

    /// @param aBoundaryOffset see ProbeSession::setBoundaryOffset()
    void setBoundaryOffset(int aBoundaryOffset);

    /// @param aBatchTimeout time after which an unfinished batch is finalized with what it has, Never to wait forever
    void setBatchTimeout(MLMicroSeconds aBatchTimeout);

    /// @param aExpiry refresh gate window
    void setRefreshExpiry(MLMicroSeconds aExpiry);

    /// @param aStatusHandler called when discovery starts or ends
    void setDiscoveryStatusHandler(DiscoveryStatusCB aStatusHandler);

    /// run discovery for a device model. An unfinished previous discovery is abandoned
    /// @param aModel the device model identifier
    /// @return error only for an unusable model. A model without catalog entries produces an empty report
    ErrorPtr runDiscovery(const string &aModel);

    /// request a periodic refresh (identity probe), collapsed within the refresh expiry window
    /// @return true if a refresh was scheduled
    bool requestRefresh();

    /// @return true while a discovery batch is active
    bool isDiscovering();

    /// @return sanitized device identity as last received
    string deviceInfo();

    /// @return number of reports finalized so far
    int numReports();

  protected:

    /// finalize batch aBatchNo with what it has collected, if it is still the active one
    /// @note a deadline already dequeued by the mainloop can still arrive after a newer batch has started
    void batchDeadline(MLMicroSeconds aCycleStartTime, int aBatchNo);

  private:

    void responseHandler(const ProbeResponse &aResponse);
    void refreshAction();
    void signalStatus(bool aDiscovering);

  };

} // namespace dprobe

#endif /* defined(__dprobe__capabilityprober__) */
