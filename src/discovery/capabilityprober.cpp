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


#include "capabilityprober.hpp"

#include "discoveryerror.hpp"

using namespace dprobe;


CapabilityProber::CapabilityProber(MainLoop &aMainLoop, CommandChannelPtr aChannel, CandidateCatalogPtr aCatalog, ReportStorePtr aReportStore) :
  mainLoop(aMainLoop),
  channel(aChannel),
  catalog(aCatalog),
  session(*aChannel, *aCatalog),
  assembler(aReportStore),
  correlator(session, assembler),
  batchTimeout(Never),
  deadlineTicket(0)
{
  pthread_mutex_init(&proberMutex, NULL);
  refreshCoordinator = RefreshCoordinatorPtr(new RefreshCoordinator(mainLoop, boost::bind(&CapabilityProber::refreshAction, this)));
  channel->setResponseHandler(boost::bind(&CapabilityProber::responseHandler, this, _1));
}


CapabilityProber::~CapabilityProber()
{
  channel->setResponseHandler(ProbeResponseCB());
  refreshCoordinator.reset();
  mainLoop.cancelExecutionTicket(deadlineTicket);
  pthread_mutex_destroy(&proberMutex);
}


void CapabilityProber::setBoundaryOffset(int aBoundaryOffset)
{
  pthread_mutex_lock(&proberMutex);
  session.setBoundaryOffset(aBoundaryOffset);
  pthread_mutex_unlock(&proberMutex);
}


void CapabilityProber::setBatchTimeout(MLMicroSeconds aBatchTimeout)
{
  pthread_mutex_lock(&proberMutex);
  batchTimeout = aBatchTimeout>0 ? aBatchTimeout : Never;
  pthread_mutex_unlock(&proberMutex);
}


void CapabilityProber::setRefreshExpiry(MLMicroSeconds aExpiry)
{
  refreshCoordinator->setExpiryInterval(aExpiry);
}


void CapabilityProber::setDiscoveryStatusHandler(DiscoveryStatusCB aStatusHandler)
{
  pthread_mutex_lock(&proberMutex);
  statusHandler = aStatusHandler;
  pthread_mutex_unlock(&proberMutex);
}


void CapabilityProber::signalStatus(bool aDiscovering)
{
  pthread_mutex_lock(&proberMutex);
  DiscoveryStatusCB cb = statusHandler;
  pthread_mutex_unlock(&proberMutex);
  if (cb) cb(aDiscovering);
}


ErrorPtr CapabilityProber::runDiscovery(const string &aModel)
{
  pthread_mutex_lock(&proberMutex);
  mainLoop.cancelExecutionTicket(deadlineTicket);
  ErrorPtr err = session.startBatch(aModel);
  if (Error::isError(err, DiscoveryError::domain(), DiscoveryErrorInvalidModel)) {
    pthread_mutex_unlock(&proberMutex);
    LOG(LOG_ERR, "Cannot run discovery: %s", err->description().c_str());
    return err;
  }
  bool started = session.isActive();
  if (!started) {
    // nothing to wait for, report right away
    LOG(LOG_WARNING, "Discovery for '%s' ends without probing: %s", aModel.c_str(), Error::text(err).c_str());
    correlator.finalizeBatch();
  }
  else if (batchTimeout!=Never) {
    deadlineTicket = mainLoop.executeOnce(boost::bind(&CapabilityProber::batchDeadline, this, _1, session.currentBatch()), batchTimeout);
  }
  pthread_mutex_unlock(&proberMutex);
  signalStatus(started);
  return ErrorPtr();
}


void CapabilityProber::responseHandler(const ProbeResponse &aResponse)
{
  pthread_mutex_lock(&proberMutex);
  bool completed = correlator.onResponse(aResponse);
  if (completed) {
    mainLoop.cancelExecutionTicket(deadlineTicket);
  }
  pthread_mutex_unlock(&proberMutex);
  if (completed) signalStatus(false);
}


void CapabilityProber::batchDeadline(MLMicroSeconds aCycleStartTime, int aBatchNo)
{
  pthread_mutex_lock(&proberMutex);
  int current = session.currentBatch();
  if (aBatchNo!=current) {
    // deadline of an earlier batch, the current one has its own
    pthread_mutex_unlock(&proberMutex);
    DBGLOG(LOG_DEBUG, "Ignoring deadline of batch #%d, batch #%d is current", aBatchNo, current);
    return;
  }
  mainLoop.cancelExecutionTicket(deadlineTicket); // NOP when called by the ticket itself
  bool expired = session.isActive();
  if (expired) {
    LOG(LOG_WARNING, "Batch #%d did not complete in time, %zu probes unanswered, finalizing", session.currentBatch(), session.numPending());
    correlator.finalizeBatch();
  }
  pthread_mutex_unlock(&proberMutex);
  if (expired) signalStatus(false);
}


bool CapabilityProber::requestRefresh()
{
  return refreshCoordinator->requestRefresh();
}


void CapabilityProber::refreshAction()
{
  pthread_mutex_lock(&proberMutex);
  if (session.isActive()) {
    DBGLOG(LOG_DEBUG, "Periodic update skipped, discovery in progress");
  }
  else {
    LOG(LOG_DEBUG, "Periodic update: requesting device info");
    ErrorPtr err;
    if (channel->sendCommand(IDENTITY_COMMAND, err)<0) {
      LOG(LOG_DEBUG, "Error while updating device info: %s", Error::text(err).c_str());
    }
  }
  pthread_mutex_unlock(&proberMutex);
}


bool CapabilityProber::isDiscovering()
{
  pthread_mutex_lock(&proberMutex);
  bool active = session.isActive();
  pthread_mutex_unlock(&proberMutex);
  return active;
}


string CapabilityProber::deviceInfo()
{
  pthread_mutex_lock(&proberMutex);
  string info = session.getDeviceInfo();
  pthread_mutex_unlock(&proberMutex);
  return info;
}


int CapabilityProber::numReports()
{
  pthread_mutex_lock(&proberMutex);
  int n = assembler.numReports();
  pthread_mutex_unlock(&proberMutex);
  return n;
}
