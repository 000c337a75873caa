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


#include "propertycatalog.hpp"

#include "discoveryerror.hpp"

#include <set>

using namespace dprobe;


string CandidateCatalog::modelFamily(const string &aModel)
{
  size_t n = aModel.rfind('.');
  if (n==string::npos) return aModel;
  return aModel.substr(0, n);
}


ErrorPtr CandidateCatalog::candidatesForModel(const string &aModel, PropertyDescriptorList &aCandidates)
{
  aCandidates.clear();
  string family = modelFamily(aModel);
  PropertyDescriptorList descriptors;
  // same family first
  ErrorPtr err = listCandidateProperties(family, descriptors);
  if (!Error::isOK(err)) {
    LOG(LOG_WARNING, "Catalog lookup for family '%s' failed: %s", family.c_str(), err->description().c_str());
  }
  size_t familyCount = descriptors.size();
  // then everything else
  err = listCandidateProperties("", descriptors);
  if (!Error::isOK(err)) {
    LOG(LOG_WARNING, "Full catalog lookup failed: %s", err->description().c_str());
  }
  DBGLOG(LOG_DEBUG, "Catalog: %zu descriptors from family '%s', %zu in total", familyCount, family.c_str(), descriptors.size());
  std::set<string> seen;
  for (PropertyDescriptorList::iterator pos = descriptors.begin(); pos!=descriptors.end(); ++pos) {
    if (pos->excludedProtocol) continue;
    if (trimWhiteSpace(pos->propertyName).empty()) continue;
    if (seen.count(pos->propertyName)) continue;
    seen.insert(pos->propertyName);
    aCandidates.push_back(*pos);
  }
  if (aCandidates.empty()) {
    return ErrorPtr(new DiscoveryError(DiscoveryErrorCatalogMiss, string_format("no candidate properties for model '%s'", aModel.c_str())));
  }
  return ErrorPtr();
}
