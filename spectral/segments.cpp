
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

#include "spectral/segments.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"


segmenter_t::segmenter_t( const lightcurve_t & lc , const int seconds )
  : lc( lc ) , nb( 0 ) , delta_t( 0 ) , pos( 0 ) , cnt( 0 )
{

  if ( seconds <= 0 )
    throw validation_error_t( "segment length must be a positive number of seconds, not " + Helper::int2str( seconds ) );

  delta_t = lc.dt();

  nb = bins_per_segment( seconds , delta_t );

}


int segmenter_t::bins_per_segment( const int seconds , const double dt )
{

  if ( seconds <= 0 )
    throw validation_error_t( "segment length must be a positive number of seconds, not " + Helper::int2str( seconds ) );

  if ( ! ( dt > 0 ) )
    throw validation_error_t( "time bin size must be positive, not " + Helper::dbl2str( dt ) );

  // no segment this long could be transformed
  if ( 1.0 / dt > 1073741824.0 )
    throw validation_error_t( "time bin size too small: " + Helper::dbl2str( dt ) );

  const long int n = (long int)seconds * MiscMath::round_count( 1.0 / dt );

  if ( ! MiscMath::is_power_of_two( n ) )
    throw validation_error_t( "number of bins per segment (" + Helper::int2str( n )
			      + ") is not a power of two; time bin size " + Helper::dbl2str( dt ) );

  return (int)n;
}


bool segmenter_t::next( segment_t * seg )
{

  // a full window must remain
  if ( pos + nb > lc.size() ) return false;

  seg->rate = lc.rate_ptr( pos );
  seg->n = nb;
  seg->index = cnt;
  seg->start = pos;

  pos += nb;
  ++cnt;

  return true;
}
