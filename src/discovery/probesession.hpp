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


#ifndef __dprobe__probesession__
#define __dprobe__probesession__

#include "dp_common.hpp"

#include "propertycatalog.hpp"
#include "commandchannel.hpp"
#include "reportassembler.hpp"

using namespace std;

namespace dprobe {

  /// state of probing one device: the active batch and the device identity
  /// @note not thread safe, owner must serialize access
  class ProbeSession
  {
    friend class ResponseCorrelator;

    CommandChannel &channel;
    CandidateCatalog &catalog;

    int boundaryOffset;

    // device session
    string deviceInfo;
    int batchNo;

    // current batch
    string model;
    PropertyDescriptorList probedProperties; ///< candidates in probe order
    typedef std::map<int, size_t> PendingMap;
    PendingMap pendingByRequestId; ///< request id -> index into probedProperties
    int firstRequestId;
    int batchUpperBound; ///< -1 when idle
    typedef std::map<size_t, string> SupportedMap;
    SupportedMap supportedProperties; ///< probe index -> raw response, iterates in probe order
    std::vector<string> transcript;
    string probeList;

  public:

    ProbeSession(CommandChannel &aChannel, CandidateCatalog &aCatalog);

    /// @param aBoundaryOffset number of ids below the last probe id that already complete the batch
    void setBoundaryOffset(int aBoundaryOffset) { boundaryOffset = aBoundaryOffset>0 ? aBoundaryOffset : 0; };

    /// start a new probing batch, abandoning any unfinished one
    /// @param aModel the device model identifier
    /// @return DiscoveryErrorInvalidModel for an empty model (nothing sent). Other errors (empty catalog,
    ///   channel failures) are logged, the batch is then not active
    /// @note returns after issuing the probes, responses arrive asynchronously
    ErrorPtr startBatch(const string &aModel);

    /// drop the active batch without reporting
    void abandon();

    /// @return true if a batch is active
    bool isActive() const { return batchUpperBound>=0; };

    /// @return true if aRequestId completes the active batch
    bool isBatchBoundary(int aRequestId) const;

    /// @return true if aRequestId belongs to the active batch's window
    bool inBatchRange(int aRequestId) const;

    /// @return sequence number of the current (or last) batch, 0 before the first batch
    int currentBatch() const { return batchNo; };

    int getFirstRequestId() const { return firstRequestId; };
    int getBatchUpperBound() const { return batchUpperBound; };
    size_t numPending() const { return pendingByRequestId.size(); };
    size_t numSupported() const { return supportedProperties.size(); };
    const string &getModel() const { return model; };
    const PropertyDescriptorList &getProbedProperties() const { return probedProperties; };

    /// sanitized device identity, survives batches
    const string &getDeviceInfo() const { return deviceInfo; };
    void setDeviceInfo(const string &aDeviceInfo) { deviceInfo = aDeviceInfo; };

    /// collect the report data of the current batch
    /// @param aReport will be filled, generation time set to now
    void snapshotReport(CapabilityReport &aReport) const;

    /// end the current batch: forget pending probes, go idle
    void endBatch();

  private:

    void resetBatch();

  };

} // namespace dprobe

#endif /* defined(__dprobe__probesession__) */
