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


#ifndef __dprobe__reportstore__
#define __dprobe__reportstore__

#include "dp_common.hpp"

using namespace std;

namespace dprobe {

  class ReportStore;
  typedef boost::intrusive_ptr<ReportStore> ReportStorePtr;
  class FileReportStore;
  typedef boost::intrusive_ptr<FileReportStore> FileReportStorePtr;

  /// persistence for finished capability reports
  class ReportStore : public DpObj
  {
  public:

    virtual ~ReportStore() {};

    /// store a report
    /// @param aFileName name of the report (no path)
    /// @param aPayload the report text
    /// @return error if the report could not be stored
    virtual ErrorPtr store(const string &aFileName, const string &aPayload) = 0;

  };


  /// stores reports as files in a directory
  class FileReportStore : public ReportStore
  {
    typedef ReportStore inherited;

    string reportDir;

  public:

    /// @param aReportDir directory to store reports in. Created (one level) when missing
    FileReportStore(const string &aReportDir);

    /// @return the full path a report with the given name is stored at
    string pathFor(const string &aFileName);

    virtual ErrorPtr store(const string &aFileName, const string &aPayload);

  };

} // namespace dprobe

#endif /* defined(__dprobe__reportstore__) */
