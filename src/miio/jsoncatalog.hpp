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


#ifndef __dprobe__jsoncatalog__
#define __dprobe__jsoncatalog__

#include "dp_common.hpp"

#include "propertycatalog.hpp"
#include "jsonobject.hpp"

using namespace std;

namespace dprobe {

  class JsonCatalog;
  typedef boost::intrusive_ptr<JsonCatalog> JsonCatalogPtr;

  /// candidate catalog read from a directory of device database JSON files
  class JsonCatalog : public CandidateCatalog
  {
    typedef CandidateCatalog inherited;

    typedef struct {
      string source; ///< file the definition was read from
      std::vector<string> modelIds;
      PropertyDescriptorList channels;
    } DeviceDefinition;
    typedef std::vector<DeviceDefinition> DeviceDefinitionList;

    string databaseDir;
    bool loaded;
    DeviceDefinitionList devices;

  public:

    /// @param aDatabaseDir directory containing *.json device definitions
    JsonCatalog(const string &aDatabaseDir);

    /// (re)load all definition files in lexical file name order
    /// @return error if the directory cannot be read. Malformed files are logged and skipped
    ErrorPtr load();

    /// add a single device definition
    /// @param aDefinition the parsed file contents, a {"deviceMapping":{...}} object
    /// @param aSource name of the source for log messages
    /// @return DiscoveryErrorMalformedEntry if the definition is not usable
    ErrorPtr addDeviceDefinition(JsonObjectPtr aDefinition, const string &aSource);

    /// @return number of device definitions loaded
    size_t numDevices() { return devices.size(); };

    virtual ErrorPtr listCandidateProperties(const string &aModelFamily, PropertyDescriptorList &aDescriptors);

  private:

    ErrorPtr loadFile(const string &aPath);

  };

} // namespace dprobe

#endif /* defined(__dprobe__jsoncatalog__) */
