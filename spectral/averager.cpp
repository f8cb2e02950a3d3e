
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

#include "spectral/averager.h"

#include "helper/helper.h"
#include "helper/errors.h"

#include <cmath>


psd_accumulator_t::psd_accumulator_t( const int n_bins )
  : nb( n_bins ) , sum_power( Eigen::ArrayXd::Zero( n_bins ) ) , sum_rate( 0 ) , cnt( 0 )
{
  if ( n_bins < 1 )
    throw validation_error_t( "accumulator needs at least one bin" );
}


void psd_accumulator_t::add( const periodogram_t & pg )
{

  if ( pg.power.size() != nb )
    throw validation_error_t( "periodogram of " + Helper::int2str( (int)pg.power.size() )
			      + " bins added to a " + Helper::int2str( nb ) + "-bin accumulator" );

  sum_power += Eigen::Map<const Eigen::ArrayXd>( pg.power.data() , nb );
  sum_rate += pg.mean_rate;
  ++cnt;

}


psd_accumulator_t & psd_accumulator_t::operator+=( const psd_accumulator_t & rhs )
{

  // an empty, default-constructed accumulator takes on the other's size
  if ( nb == 0 )
    {
      *this = rhs;
      return *this;
    }

  if ( rhs.nb == 0 ) return *this;

  if ( rhs.nb != nb )
    throw validation_error_t( "cannot merge " + Helper::int2str( nb ) + "-bin and "
			      + Helper::int2str( rhs.nb ) + "-bin accumulators" );

  sum_power += rhs.sum_power;
  sum_rate += rhs.sum_rate;
  cnt += rhs.cnt;

  return *this;
}


psd_accumulator_t operator+( psd_accumulator_t a , const psd_accumulator_t & b )
{
  a += b;
  return a;
}


int psd_accumulator_t::positive_bins( const int n )
{
  return n % 2 == 0 ? n/2+1 : (n+1)/2 ;
}


averaged_spectrum_t psd_accumulator_t::average( const double dt ) const
{

  if ( cnt == 0 )
    throw insufficient_data_error_t( "no complete segments: the light curve is shorter than one segment" );

  if ( ! ( dt > 0 ) )
    throw validation_error_t( "time bin size must be positive, not " + Helper::dbl2str( dt ) );

  averaged_spectrum_t avg;

  avg.num_segments = cnt;
  avg.n_bins = nb;
  avg.dt = dt;
  avg.mean_rate = sum_rate / (double)cnt;

  const int L = positive_bins( nb );

  Eigen::ArrayXd p = sum_power.head( L ) / (double)cnt;

  Eigen::ArrayXd e = p / sqrt( (double)cnt * L );

  avg.power.assign( p.data() , p.data() + L );
  avg.err.assign( e.data() , e.data() + L );

  // DFT bin k to Hz; the Nyquist bin (k = n/2) is taken as positive
  avg.freq.resize( L );
  for (int k=0;k<L;k++)
    avg.freq[k] = k / ( nb * dt );

  return avg;
}
