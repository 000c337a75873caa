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


#include "reportstore.hpp"

#include "discoveryerror.hpp"

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

using namespace dprobe;


FileReportStore::FileReportStore(const string &aReportDir) :
  reportDir(aReportDir)
{
  // no trailing slash
  while (reportDir.size()>1 && reportDir[reportDir.size()-1]=='/') {
    reportDir.erase(reportDir.size()-1);
  }
}


string FileReportStore::pathFor(const string &aFileName)
{
  if (reportDir.empty()) return aFileName;
  return reportDir + "/" + aFileName;
}


ErrorPtr FileReportStore::store(const string &aFileName, const string &aPayload)
{
  if (aFileName.empty() || aFileName.find('/')!=string::npos) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorStoreFailed, string_format("invalid report file name '%s'", aFileName.c_str())));
  }
  if (!reportDir.empty()) {
    struct stat st;
    if (stat(reportDir.c_str(), &st)!=0) {
      if (mkdir(reportDir.c_str(), 0755)!=0 && errno!=EEXIST) {
        return ErrorPtr(new DiscoveryError(DiscoveryErrorStoreFailed, string_format("cannot create report directory '%s': %s", reportDir.c_str(), strerror(errno))));
      }
    }
    else if (!S_ISDIR(st.st_mode)) {
      return ErrorPtr(new DiscoveryError(DiscoveryErrorStoreFailed, string_format("'%s' is not a directory", reportDir.c_str())));
    }
  }
  string path = pathFor(aFileName);
  FILE *f = fopen(path.c_str(), "w");
  if (!f) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorStoreFailed, string_format("cannot open '%s': %s", path.c_str(), strerror(errno))));
  }
  size_t written = fwrite(aPayload.c_str(), 1, aPayload.size(), f);
  bool writeFailed = written!=aPayload.size() || ferror(f);
  if (fclose(f)!=0) writeFailed = true;
  if (writeFailed) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorStoreFailed, string_format("error writing '%s'", path.c_str())));
  }
  return ErrorPtr();
}
