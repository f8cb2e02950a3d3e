
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

#include <catch2/catch.hpp>

#include "spectral/averager.h"
#include "helper/errors.h"

#include <vector>
#include <cmath>

using Catch::Matchers::WithinAbs;


static periodogram_t flat( const int n , const double p , const double rate )
{
  periodogram_t pg;
  pg.mean_rate = rate;
  pg.power.assign( n , p );
  return pg;
}


TEST_CASE( "positive bins for even and odd lengths" , "[averager]" )
{
  REQUIRE( psd_accumulator_t::positive_bins( 16 ) == 9 );
  REQUIRE( psd_accumulator_t::positive_bins( 2 ) == 2 );
  REQUIRE( psd_accumulator_t::positive_bins( 1 ) == 1 );
  REQUIRE( psd_accumulator_t::positive_bins( 7 ) == 4 );
}

TEST_CASE( "average over segments" , "[averager]" )
{
  const int n = 8;

  psd_accumulator_t acc( n );
  acc.add( flat( n , 1.0 , 10.0 ) );
  acc.add( flat( n , 3.0 , 20.0 ) );

  REQUIRE( acc.segments() == 2 );

  averaged_spectrum_t avg = acc.average( 0.5 );

  // L = 5 non-negative bins
  REQUIRE( avg.size() == 5 );
  REQUIRE( avg.num_segments == 2 );
  REQUIRE( avg.n_bins == n );
  REQUIRE( avg.dt == 0.5 );
  REQUIRE_THAT( avg.mean_rate , WithinAbs( 15.0 , 1e-12 ) );

  for (int k=0;k<5;k++)
    {
      REQUIRE_THAT( avg.power[k] , WithinAbs( 2.0 , 1e-12 ) );
      REQUIRE_THAT( avg.err[k] , WithinAbs( 2.0 / sqrt( 10.0 ) , 1e-12 ) );
      REQUIRE_THAT( avg.freq[k] , WithinAbs( k / 4.0 , 1e-12 ) );
    }

  // Nyquist at 1/(2 dt)
  REQUIRE_THAT( avg.freq[4] , WithinAbs( 1.0 , 1e-12 ) );
}

TEST_CASE( "merging accumulators does not depend on order" , "[averager]" )
{
  const int n = 4;

  psd_accumulator_t a( n ) , b( n ) , c( n ) , all( n );

  for (int i=0;i<5;i++)
    {
      periodogram_t pg = flat( n , i + 0.5 , 2.0 * i + 1 );
      pg.power[1] = i * i;
      if ( i < 2 ) a.add( pg ); else if ( i < 4 ) b.add( pg ); else c.add( pg );
      all.add( pg );
    }

  averaged_spectrum_t x = ( a + b + c ).average( 1.0 );
  averaged_spectrum_t y = ( c + a + b ).average( 1.0 );
  averaged_spectrum_t z = all.average( 1.0 );

  REQUIRE( x.num_segments == 5 );
  REQUIRE( y.num_segments == 5 );

  for (int k=0;k<x.size();k++)
    {
      REQUIRE_THAT( x.power[k] , WithinAbs( z.power[k] , 1e-12 ) );
      REQUIRE_THAT( y.power[k] , WithinAbs( z.power[k] , 1e-12 ) );
    }

  REQUIRE_THAT( x.mean_rate , WithinAbs( z.mean_rate , 1e-12 ) );

  SECTION( "an empty accumulator adopts the other" )
    {
      psd_accumulator_t empty;
      empty += a;
      REQUIRE( empty.n_bins() == n );
      REQUIRE( empty.segments() == 2 );
    }

  SECTION( "sizes must agree" )
    {
      psd_accumulator_t other( 8 );
      other.add( flat( 8 , 1.0 , 1.0 ) );
      REQUIRE_THROWS_AS( a += other , validation_error_t );
    }
}

TEST_CASE( "averaging zero segments is an error" , "[averager]" )
{
  psd_accumulator_t acc( 16 );
  REQUIRE_THROWS_AS( acc.average( 1.0 ) , insufficient_data_error_t );
}

TEST_CASE( "periodogram length must match the accumulator" , "[averager]" )
{
  psd_accumulator_t acc( 16 );
  REQUIRE_THROWS_AS( acc.add( flat( 8 , 1.0 , 1.0 ) ) , validation_error_t );
}
