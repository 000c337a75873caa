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


#include "jsoncatalog.hpp"

#include "discoveryerror.hpp"

#include <dirent.h>
#include <algorithm>

using namespace dprobe;


JsonCatalog::JsonCatalog(const string &aDatabaseDir) :
  databaseDir(aDatabaseDir),
  loaded(false)
{
}


ErrorPtr JsonCatalog::load()
{
  devices.clear();
  loaded = true;
  DIR *dir = opendir(databaseDir.c_str());
  if (!dir) {
    return SysError::errNo(string_format("cannot read device database directory '%s': ", databaseDir.c_str()).c_str());
  }
  std::vector<string> fileNames;
  struct dirent *entry;
  while ((entry = readdir(dir))!=NULL) {
    string name = entry->d_name;
    if (name.size()>5 && name.compare(name.size()-5, 5, ".json")==0) {
      fileNames.push_back(name);
    }
  }
  closedir(dir);
  std::sort(fileNames.begin(), fileNames.end());
  for (std::vector<string>::iterator pos = fileNames.begin(); pos!=fileNames.end(); ++pos) {
    ErrorPtr err = loadFile(databaseDir + "/" + *pos);
    if (!Error::isOK(err)) {
      LOG(LOG_WARNING, "Device database file '%s' skipped: %s", pos->c_str(), err->description().c_str());
    }
  }
  LOG(LOG_INFO, "Device database '%s': %zu device definitions from %zu files", databaseDir.c_str(), devices.size(), fileNames.size());
  return ErrorPtr();
}


ErrorPtr JsonCatalog::loadFile(const string &aPath)
{
  ErrorPtr err;
  JsonObjectPtr definition = JsonObject::objFromFile(aPath.c_str(), &err);
  if (!Error::isOK(err)) return err;
  return addDeviceDefinition(definition, aPath);
}


ErrorPtr JsonCatalog::addDeviceDefinition(JsonObjectPtr aDefinition, const string &aSource)
{
  JsonObjectPtr mapping;
  if (!aDefinition || !aDefinition->get("deviceMapping", mapping) || !mapping || !mapping->isType(json_type_object)) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorMalformedEntry, "no deviceMapping object"));
  }
  DeviceDefinition dev;
  dev.source = aSource;
  JsonObjectPtr ids = mapping->get("id");
  if (!ids || !ids->isType(json_type_array)) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorMalformedEntry, "deviceMapping has no id array"));
  }
  for (int i=0; i<ids->arrayLength(); i++) {
    JsonObjectPtr id = ids->arrayGet(i);
    if (id && id->isType(json_type_string)) dev.modelIds.push_back(id->stringValue());
  }
  JsonObjectPtr channels = mapping->get("channels");
  if (!channels || !channels->isType(json_type_array)) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorMalformedEntry, "deviceMapping has no channels array"));
  }
  for (int i=0; i<channels->arrayLength(); i++) {
    JsonObjectPtr ch = channels->arrayGet(i);
    if (!ch || !ch->isType(json_type_object)) {
      LOG(LOG_WARNING, "%s: channel #%d is not an object, skipped", aSource.c_str(), i);
      continue;
    }
    PropertyDescriptor pd;
    JsonObjectPtr o = ch->get("property");
    pd.propertyName = o && o->isType(json_type_string) ? o->stringValue() : "";
    o = ch->get("friendlyName");
    pd.friendlyName = o && o->isType(json_type_string) ? o->stringValue() : "";
    // MIoT channels address properties by service/property id
    pd.excludedProtocol = ch->get("siid") || ch->get("piid");
    dev.channels.push_back(pd);
  }
  FOCUSLOG("%s: %zu models, %zu channels", aSource.c_str(), dev.modelIds.size(), dev.channels.size());
  devices.push_back(dev);
  return ErrorPtr();
}


ErrorPtr JsonCatalog::listCandidateProperties(const string &aModelFamily, PropertyDescriptorList &aDescriptors)
{
  if (!loaded) {
    ErrorPtr err = load();
    if (!Error::isOK(err)) return err;
  }
  for (DeviceDefinitionList::iterator dev = devices.begin(); dev!=devices.end(); ++dev) {
    bool matches = aModelFamily.empty();
    for (std::vector<string>::iterator id = dev->modelIds.begin(); !matches && id!=dev->modelIds.end(); ++id) {
      matches = hasPrefix(*id, aModelFamily);
    }
    if (matches) {
      DBGLOG(LOG_DEBUG, "Adding channels from '%s'", dev->source.c_str());
      aDescriptors.insert(aDescriptors.end(), dev->channels.begin(), dev->channels.end());
    }
  }
  return ErrorPtr();
}
