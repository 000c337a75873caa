//
//  dp_common.hpp
//  dprobe
//
//  Author: Lukas Zeller / luz@plan44.ch
//  Copyright: 2012-2016 by plan44.ch/luz
//

#ifndef __dprobe__common__
#define __dprobe__common__

#include <list>
#include <vector>
#include <map>
#include <string>

#include <boost/intrusive_ptr.hpp>
#include <boost/function.hpp>
#include <boost/bind.hpp>

#include "dpobj.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "error.hpp"
#include "mainloop.hpp"

#endif /* __dprobe__common__ */
