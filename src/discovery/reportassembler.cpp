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


#include "reportassembler.hpp"

using namespace dprobe;

#define REPORT_SEPARATOR "===================================="
#define PROPERTY_NAME_WIDTH 15
#define FRIENDLY_NAME_WIDTH 25


ReportAssembler::ReportAssembler(ReportStorePtr aReportStore) :
  reportStore(aReportStore),
  reportsEmitted(0)
{
}


string ReportAssembler::render(const CapabilityReport &aReport)
{
  string r;
  string_format_append(r, "Info for %s\n", aReport.model.c_str());
  string_format_append(r, "Properties: %s\n", aReport.probeList.c_str());
  for (std::vector<string>::const_iterator pos = aReport.transcript.begin(); pos!=aReport.transcript.end(); ++pos) {
    r += *pos;
    r += "\n";
  }
  r += REPORT_SEPARATOR "\n";
  r += "Responsive properties\n";
  r += REPORT_SEPARATOR "\n";
  string_format_append(r, "Device Info: %s\n", aReport.deviceInfo.c_str());
  for (SupportedPropertyList::const_iterator pos = aReport.properties.begin(); pos!=aReport.properties.end(); ++pos) {
    string_format_append(r, "Property: %s Friendly Name: %s Response: %s\n",
      padToMinLength(pos->descriptor.propertyName, PROPERTY_NAME_WIDTH).c_str(),
      padToMinLength(pos->descriptor.friendlyName, FRIENDLY_NAME_WIDTH).c_str(),
      pos->rawResponse.c_str()
    );
  }
  return r;
}


string ReportAssembler::reportFileName(const string &aModel, time_t aTime)
{
  return string_format("test-%s-%s.txt", aModel.c_str(), localTimeString("%Y%m%d-%H%M%S", aTime).c_str());
}


string ReportAssembler::finalize(const CapabilityReport &aReport)
{
  string payload = render(aReport);
  reportsEmitted++;
  lastReportFileName = reportFileName(aReport.model, aReport.generated);
  LOG(LOG_INFO, "Capability report for '%s':\n%s", aReport.model.c_str(), payload.c_str());
  if (reportStore) {
    ErrorPtr err = reportStore->store(lastReportFileName, payload);
    if (Error::isOK(err)) {
      LOG(LOG_NOTICE, "Saved device capability report as '%s' (%zu responsive properties)", lastReportFileName.c_str(), aReport.properties.size());
    }
    else {
      LOG(LOG_WARNING, "Could not save report '%s': %s", lastReportFileName.c_str(), err->description().c_str());
    }
  }
  return payload;
}
