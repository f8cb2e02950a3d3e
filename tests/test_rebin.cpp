
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

#include "spectral/rebin.h"
#include "helper/errors.h"

#include <vector>
#include <cmath>

using Catch::Matchers::WithinAbs;


// L bins at df = 1/16, power k, error 0.1
struct rebin_fixture_t
{
  rebin_fixture_t( const int L )
  {
    for (int k=0;k<L;k++)
      {
	freq.push_back( k / 16.0 );
	power.push_back( k );
	err.push_back( 0.1 );
      }
  }

  std::vector<double> freq , power , err;
};


TEST_CASE( "groups for c = 1.5 over nine bins" , "[rebin]" )
{
  rebin_fixture_t d( 9 );

  geom_rebinner_t rebinner( d.power , d.err , d.freq , 1.5 );

  const int lwr[] = { 1 , 2 , 4 , 6 };
  const int upr[] = { 2 , 4 , 6 , 9 };

  rebinned_bin_t b;
  int i = 0;
  while ( rebinner.next( &b ) )
    {
      REQUIRE( i < 4 );
      REQUIRE( b.lwr == lwr[i] );
      REQUIRE( b.upr == upr[i] );
      ++i;
    }

  REQUIRE( i == 4 );
  REQUIRE( rebinner.done() );

  rebinned_spectrum_t rs = geometric_rebin( d.power , d.err , d.freq , 1.5 );

  REQUIRE( rs.size() == 4 );

  // single bin passes through
  REQUIRE_THAT( rs.freq[0] , WithinAbs( 1.0 / 16.0 , 1e-12 ) );
  REQUIRE_THAT( rs.power[0] , WithinAbs( 1.0 , 1e-12 ) );
  REQUIRE_THAT( rs.err[0] , WithinAbs( 0.1 , 1e-12 ) );

  // [2,4)
  REQUIRE_THAT( rs.freq[1] , WithinAbs( 3.0 / 16.0 , 1e-12 ) );
  REQUIRE_THAT( rs.power[1] , WithinAbs( 2.5 , 1e-12 ) );
  REQUIRE_THAT( rs.err[1] , WithinAbs( sqrt( 0.02 ) / 2.0 , 1e-12 ) );

  // [4,6)
  REQUIRE_THAT( rs.freq[2] , WithinAbs( 5.0 / 16.0 , 1e-12 ) );
  REQUIRE_THAT( rs.power[2] , WithinAbs( 4.5 , 1e-12 ) );

  // [6,9): upper edge extrapolated one step past the last bin
  REQUIRE_THAT( rs.freq[3] , WithinAbs( 7.0 / 16.0 , 1e-12 ) );
  REQUIRE_THAT( rs.power[3] , WithinAbs( 7.0 , 1e-12 ) );
  REQUIRE_THAT( rs.err[3] , WithinAbs( sqrt( 0.03 ) / 3.0 , 1e-12 ) );
}

TEST_CASE( "halves round up when stepping" , "[rebin]" )
{
  rebin_fixture_t d( 20 );

  // sizes 1, round(2.5) = 3, round(6.25) = 6
  rebinned_spectrum_t rs;
  geom_rebinner_t rebinner( d.power , d.err , d.freq , 2.5 );
  rebinned_bin_t b;

  REQUIRE( rebinner.next( &b ) );
  REQUIRE( b.lwr == 1 );
  REQUIRE( b.upr == 2 );

  REQUIRE( rebinner.next( &b ) );
  REQUIRE( b.lwr == 2 );
  REQUIRE( b.upr == 5 );

  REQUIRE( rebinner.next( &b ) );
  REQUIRE( b.lwr == 5 );
  REQUIRE( b.upr == 11 );

  // round(15.625) = 16 would run past L = 20
  REQUIRE_FALSE( rebinner.next( &b ) );
}

TEST_CASE( "consecutive groups neither overlap nor leave gaps" , "[rebin]" )
{
  const double cs[] = { 1.0 , 1.1 , 1.25 , 1.5 , 2.0 , 3.7 };

  for (int j=0;j<6;j++)
    {
      rebin_fixture_t d( 257 );
      geom_rebinner_t rebinner( d.power , d.err , d.freq , cs[j] );
      rebinned_bin_t b;
      int expect_lwr = 1;
      while ( rebinner.next( &b ) )
	{
	  REQUIRE( b.lwr == expect_lwr );
	  REQUIRE( b.upr > b.lwr );
	  REQUIRE( b.upr <= 257 );
	  // frequency lies inside the group
	  REQUIRE( b.freq >= d.freq[ b.lwr ] );
	  expect_lwr = b.upr;
	}
    }
}

TEST_CASE( "c = 1 reproduces the unbinned non-DC spectrum" , "[rebin]" )
{
  rebin_fixture_t d( 17 );

  rebinned_spectrum_t rs = geometric_rebin( d.power , d.err , d.freq , 1.0 );

  REQUIRE( rs.size() == 16 );
  for (int k=1;k<17;k++)
    {
      REQUIRE( rs.freq[k-1] == d.freq[k] );
      REQUIRE( rs.power[k-1] == d.power[k] );
      REQUIRE( rs.err[k-1] == d.err[k] );
    }
}

TEST_CASE( "a constant very close to 1 also reproduces it" , "[rebin]" )
{
  rebin_fixture_t d( 9 );
  rebinned_spectrum_t rs = geometric_rebin( d.power , d.err , d.freq , 1.0001 );
  REQUIRE( rs.size() == 8 );
  for (int k=1;k<9;k++)
    REQUIRE( rs.power[k-1] == d.power[k] );
}

TEST_CASE( "nothing to rebin without non-DC bins" , "[rebin]" )
{
  rebin_fixture_t one( 1 );
  REQUIRE( geometric_rebin( one.power , one.err , one.freq , 1.5 ).empty() );

  rebin_fixture_t two( 2 );
  rebinned_spectrum_t rs = geometric_rebin( two.power , two.err , two.freq , 1.5 );
  REQUIRE( rs.size() == 1 );
  REQUIRE( rs.power[0] == 1.0 );
}

TEST_CASE( "rebinning rejects bad constants and ragged input" , "[rebin]" )
{
  rebin_fixture_t d( 9 );

  REQUIRE_THROWS_AS( geometric_rebin( d.power , d.err , d.freq , 0.9 ) , validation_error_t );
  REQUIRE_THROWS_AS( geometric_rebin( d.power , d.err , d.freq , std::nan( "" ) ) , validation_error_t );

  std::vector<double> short_err( 5 , 0.1 );
  REQUIRE_THROWS_AS( geometric_rebin( d.power , short_err , d.freq , 1.5 ) , validation_error_t );
}
