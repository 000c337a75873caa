//
//  Copyright (c) 2013-2016 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
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

#ifndef __dprobe__dpobj__
#define __dprobe__dpobj__

#include <boost/intrusive_ptr.hpp>

namespace dprobe {

  /// reference counted base for everything held by boost::intrusive_ptr
  /// @note the count itself is not atomic. An object must only be shared between threads
  ///   while another reference keeps it alive, as the prober and its channel do
  class DpObj
  {
    int refCount;

    friend void intrusive_ptr_add_ref(DpObj *aObj) { aObj->refCount++; }
    friend void intrusive_ptr_release(DpObj *aObj) { if (--aObj->refCount==0) delete aObj; }

  protected:
    DpObj() : refCount(0) {};
    virtual ~DpObj() {};
  };

} // namespace dprobe


#endif /* defined(__dprobe__dpobj__) */
