
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

#include "miscmath/miscmath.h"

#include <cmath>


bool MiscMath::is_power_of_two( const long int n )
{
  // beyond 2^30 a segment cannot be held as an FFT buffer anyway
  if ( n < 1 || n > 1073741824L ) return false;
  return ( n & ( n - 1 ) ) == 0;
}


long int MiscMath::round_count( const double x )
{
  return std::lround( x );
}


double MiscMath::mean( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  return mean( &(x[0]) , x.size() );
}


double MiscMath::mean( const double * x , const int n )
{
  if ( n == 0 ) return 0;
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s / (double)n;
}

