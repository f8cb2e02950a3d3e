
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

#ifndef __POWSPEC_MISCMATH_H__
#define __POWSPEC_MISCMATH_H__

#include <vector>
#include <cstddef>

namespace MiscMath
{
  
  // true for 1, 2, 4, ... 2^30
  bool is_power_of_two( const long int n );

  // the one rounding rule used for bin counts: half away from zero
  long int round_count( const double x );
  
  // mean
  double mean( const std::vector<double> & x );
  double mean( const double * x , const int n );
  
}

#endif
