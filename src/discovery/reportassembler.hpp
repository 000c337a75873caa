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


#ifndef __dprobe__reportassembler__
#define __dprobe__reportassembler__

#include "dp_common.hpp"

#include "propertycatalog.hpp"
#include "reportstore.hpp"

using namespace std;

namespace dprobe {

  /// a property that answered with a usable payload
  typedef struct {
    PropertyDescriptor descriptor;
    string rawResponse;
  } SupportedProperty;

  typedef std::vector<SupportedProperty> SupportedPropertyList;

  /// everything a finished batch has to report
  typedef struct {
    string model;
    string deviceInfo; ///< sanitized identity, empty if never received
    string probeList; ///< "name -> id, " for every probe sent
    std::vector<string> transcript; ///< "command -> response" for every response within the batch
    SupportedPropertyList properties; ///< in probe order
    time_t generated; ///< wall clock time of finalizing
  } CapabilityReport;


  /// renders capability reports and hands them to a report store
  class ReportAssembler
  {
    ReportStorePtr reportStore;
    int reportsEmitted;
    string lastReportFileName;

  public:

    /// @param aReportStore where to store reports, can be NULL to only log them
    ReportAssembler(ReportStorePtr aReportStore);

    /// render the report text
    /// @param aReport the report data
    /// @return report as text, lines terminated by \n
    static string render(const CapabilityReport &aReport);

    /// @param aModel the model identifier
    /// @param aTime wall clock time
    /// @return name for the report file, test-<model>-<YYYYMMDD-HHmmss>.txt in local time
    static string reportFileName(const string &aModel, time_t aTime);

    /// render, log and store a report. Store errors are logged only
    /// @param aReport the report data
    /// @return the rendered report
    string finalize(const CapabilityReport &aReport);

    /// @return number of reports finalized so far
    int numReports() const { return reportsEmitted; };

    /// @return the file name of the last finalized report
    const string &lastFileName() const { return lastReportFileName; };

  };

} // namespace dprobe

#endif /* defined(__dprobe__reportassembler__) */
