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


#ifndef __dprobe__propertycatalog__
#define __dprobe__propertycatalog__

#include "dp_common.hpp"

using namespace std;

namespace dprobe {

  /// a property a device might support, as known from the catalog
  typedef struct {
    string propertyName; ///< the property identifier sent to the device
    string friendlyName; ///< human readable name
    bool excludedProtocol; ///< property belongs to a sub-protocol that is not probed this way
  } PropertyDescriptor;

  typedef std::vector<PropertyDescriptor> PropertyDescriptorList;


  class CandidateCatalog;
  typedef boost::intrusive_ptr<CandidateCatalog> CandidateCatalogPtr;

  /// source of candidate properties for device models
  class CandidateCatalog : public DpObj
  {
  public:

    virtual ~CandidateCatalog() {};

    /// list the property descriptors known for a model family
    /// @param aModelFamily model family prefix. Descriptors of all models whose model identifier starts
    ///   with this prefix are listed. An empty family lists the full catalog
    /// @param aDescriptors descriptors are appended here, in catalog order (duplicates possible)
    /// @return error if the catalog could not be queried at all
    virtual ErrorPtr listCandidateProperties(const string &aModelFamily, PropertyDescriptorList &aDescriptors) = 0;

    /// get the ordered, deduplicated list of properties to probe for a model
    /// @param aModel the model identifier
    /// @param aCandidates will be set to the candidates: same family first, then the rest of the catalog,
    ///   first seen wins, excluded protocols and blank names removed
    /// @return DiscoveryErrorCatalogMiss if there are no candidates at all
    ErrorPtr candidatesForModel(const string &aModel, PropertyDescriptorList &aCandidates);

    /// @param aModel a model identifier like "vendor.family.version"
    /// @return the model up to (not including) its last dot, or the model itself if it has no dot
    static string modelFamily(const string &aModel);

  };

} // namespace dprobe

#endif /* defined(__dprobe__propertycatalog__) */
