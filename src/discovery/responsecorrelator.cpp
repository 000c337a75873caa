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


#include "responsecorrelator.hpp"

#include "jsonobject.hpp"

using namespace dprobe;

// identity fields that must never end up in a report
static const char *secretIdentityFields[] = { "token", "ap", "mac", "netif", NULL };


ResponseCorrelator::ResponseCorrelator(ProbeSession &aSession, ReportAssembler &aAssembler) :
  session(aSession),
  assembler(aAssembler)
{
}


bool ResponseCorrelator::isSupportedResult(bool aIsError, const string &aRawResult)
{
  if (aIsError) return false;
  string res = trimWhiteSpace(aRawResult);
  return !(res.empty() || res=="null" || res=="[]" || res=="[null]");
}


string ResponseCorrelator::sanitizedIdentity(const string &aRawResult)
{
  JsonObjectPtr info = JsonObject::objFromText(aRawResult.c_str());
  if (!info || !info->isType(json_type_object)) {
    return aRawResult;
  }
  for (const char **f = secretIdentityFields; *f; f++) {
    info->del(*f);
  }
  return info->json_str();
}


bool ResponseCorrelator::onResponse(const ProbeResponse &aResponse)
{
  if (aResponse.kind==CommandKindInfo && !aResponse.isError) {
    session.setDeviceInfo(sanitizedIdentity(aResponse.rawResult));
    DBGLOG(LOG_DEBUG, "Device info updated: %s", session.getDeviceInfo().c_str());
  }
  if (!session.isActive()) return false;
  if (session.inBatchRange(aResponse.requestId)) {
    session.transcript.push_back(string_format("%s -> %s", aResponse.commandString.c_str(), aResponse.responseText.c_str()));
    ProbeSession::PendingMap::iterator pos = session.pendingByRequestId.find(aResponse.requestId);
    if (pos!=session.pendingByRequestId.end()) {
      if (isSupportedResult(aResponse.isError, aResponse.rawResult)) {
        session.supportedProperties[pos->second] = aResponse.rawResult;
        LOG(LOG_INFO, "Property '%s' is supported: %s", session.probedProperties[pos->second].propertyName.c_str(), aResponse.rawResult.c_str());
      }
      else {
        DBGLOG(LOG_DEBUG, "Property '%s' not supported: %s", session.probedProperties[pos->second].propertyName.c_str(), aResponse.responseText.c_str());
      }
    }
  }
  else {
    FOCUSLOG("Response %d outside batch window %d..%d", aResponse.requestId, session.getFirstRequestId(), session.getBatchUpperBound());
  }
  // ids past the bound complete the batch as well
  if (session.isBatchBoundary(aResponse.requestId)) {
    finalizeBatch();
    return true;
  }
  return false;
}


void ResponseCorrelator::finalizeBatch()
{
  CapabilityReport report;
  session.snapshotReport(report);
  LOG(LOG_NOTICE, "Batch #%d for '%s' complete: %zu of %zu properties responsive", session.currentBatch(), report.model.c_str(), report.properties.size(), session.getProbedProperties().size());
  session.endBatch();
  assembler.finalize(report);
}
