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


#include "probesession.hpp"

#include "discoveryerror.hpp"

using namespace dprobe;


ProbeSession::ProbeSession(CommandChannel &aChannel, CandidateCatalog &aCatalog) :
  channel(aChannel),
  catalog(aCatalog),
  boundaryOffset(0),
  batchNo(0),
  firstRequestId(-1),
  batchUpperBound(-1)
{
}


void ProbeSession::resetBatch()
{
  model.clear();
  probedProperties.clear();
  pendingByRequestId.clear();
  firstRequestId = -1;
  batchUpperBound = -1;
  supportedProperties.clear();
  transcript.clear();
  probeList.clear();
}


void ProbeSession::abandon()
{
  if (isActive()) {
    LOG(LOG_INFO, "Abandoning unfinished batch #%d for '%s' with %zu probes still pending", batchNo, model.c_str(), pendingByRequestId.size());
  }
  resetBatch();
}


void ProbeSession::endBatch()
{
  pendingByRequestId.clear();
  batchUpperBound = -1;
}


ErrorPtr ProbeSession::startBatch(const string &aModel)
{
  if (trimWhiteSpace(aModel).empty()) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorInvalidModel, "empty model identifier"));
  }
  abandon();
  batchNo++;
  model = aModel;
  PropertyDescriptorList candidates;
  ErrorPtr catalogErr = catalog.candidatesForModel(model, candidates);
  LOG(LOG_NOTICE, "Start testing supported properties for model '%s' (batch #%d, %zu candidates)", model.c_str(), batchNo, candidates.size());
  // identity first
  ErrorPtr err;
  int id = channel.sendCommand(IDENTITY_COMMAND, err);
  if (id<0) {
    LOG(LOG_WARNING, "Cannot send identity probe: %s", Error::text(err).c_str());
  }
  else {
    firstRequestId = id;
  }
  if (!Error::isOK(catalogErr)) {
    LOG(LOG_WARNING, "No properties to test for '%s': %s", model.c_str(), catalogErr->description().c_str());
    return catalogErr;
  }
  // one probe per candidate
  int lastId = -1;
  for (PropertyDescriptorList::iterator pos = candidates.begin(); pos!=candidates.end(); ++pos) {
    string cmd = string_format(GETPROP_COMMAND "[\"%s\"]", pos->propertyName.c_str());
    err.reset();
    id = channel.sendCommand(cmd, err);
    if (id<0) {
      LOG(LOG_WARNING, "Cannot send probe for '%s', skipped: %s", pos->propertyName.c_str(), Error::text(err).c_str());
      continue;
    }
    pendingByRequestId[id] = probedProperties.size();
    probedProperties.push_back(*pos);
    string_format_append(probeList, "%s -> %d, ", pos->propertyName.c_str(), id);
    if (firstRequestId<0) firstRequestId = id;
    lastId = id;
  }
  if (lastId<0) {
    return TextError::err("none of the %zu probes could be sent", candidates.size());
  }
  batchUpperBound = lastId-boundaryOffset;
  if (batchUpperBound<firstRequestId) batchUpperBound = firstRequestId;
  LOG(LOG_NOTICE, "Properties: %s", probeList.c_str());
  LOG(LOG_INFO, "Batch #%d window is %d..%d", batchNo, firstRequestId, batchUpperBound);
  return ErrorPtr();
}


bool ProbeSession::isBatchBoundary(int aRequestId) const
{
  return isActive() && aRequestId>=batchUpperBound;
}


bool ProbeSession::inBatchRange(int aRequestId) const
{
  return isActive() && aRequestId>=firstRequestId && aRequestId<=batchUpperBound;
}


void ProbeSession::snapshotReport(CapabilityReport &aReport) const
{
  aReport.model = model;
  aReport.deviceInfo = deviceInfo;
  aReport.probeList = probeList;
  aReport.transcript = transcript;
  aReport.properties.clear();
  for (SupportedMap::const_iterator pos = supportedProperties.begin(); pos!=supportedProperties.end(); ++pos) {
    SupportedProperty sp;
    sp.descriptor = probedProperties[pos->first];
    sp.rawResponse = pos->second;
    aReport.properties.push_back(sp);
  }
  aReport.generated = time(NULL);
}
