
//    --------------------------------------------------------------------
//
//    This file is part of powspec.
//
//    powspec is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    powspec is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with powspec. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __POWSPEC_H__
#define __POWSPEC_H__

#include "defs/defs.h"
#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"

#include "miscmath/miscmath.h"

#include "fftw/fftwrap.h"

#include "timeseries/lightcurve.h"

#include "spectral/segments.h"
#include "spectral/periodogram.h"
#include "spectral/averager.h"
#include "spectral/normalize.h"
#include "spectral/rebin.h"
#include "spectral/powerspec.h"

#include "output/tables.h"

#endif
