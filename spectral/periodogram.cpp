
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

#include "spectral/periodogram.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"


periodogram_computer_t::periodogram_computer_t( const int n_bins , const double dt )
  : nb( n_bins ) , fft( n_bins , dt , FFT_FORWARD ) , demeaned( n_bins , 0 )
{
}


periodogram_t periodogram_computer_t::compute( const segment_t & seg )
{
  return compute( seg.rate , seg.n );
}


periodogram_t periodogram_computer_t::compute( const double * x , const int n )
{

  if ( n != nb )
    throw validation_error_t( "segment of " + Helper::int2str( n )
			      + " points given to a " + Helper::int2str( nb ) + "-point periodogram" );

  periodogram_t pg;

  pg.mean_rate = MiscMath::mean( x , n );

  // removes the 0 Hz spike
  for (int i=0;i<n;i++) demeaned[i] = x[i] - pg.mean_rate;

  if ( ! fft.apply( demeaned ) )
    throw validation_error_t( "FFT failed on a " + Helper::int2str( n ) + "-point segment" );

  pg.power = fft.X;

  return pg;
}
