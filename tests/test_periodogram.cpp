
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

#include "spectral/periodogram.h"
#include "helper/errors.h"

#include <vector>
#include <cmath>

using Catch::Matchers::WithinAbs;


TEST_CASE( "constant segment has no power after mean removal" , "[periodogram]" )
{
  const int n = 32;
  std::vector<double> x( n , 250.0 );

  periodogram_computer_t computer( n , 1.0 / 32.0 );
  periodogram_t pg = computer.compute( &(x[0]) , n );

  REQUIRE_THAT( pg.mean_rate , WithinAbs( 250.0 , 1e-12 ) );
  REQUIRE( pg.power.size() == n );
  for (int k=0;k<n;k++)
    REQUIRE( pg.power[k] < 1e-10 );
}

TEST_CASE( "sinusoid puts (A n / 2)^2 into its bin" , "[periodogram]" )
{
  const int n = 64;
  const double A = 5.0;
  const int m = 6;
  const double pi = 3.14159265358979323846;

  std::vector<double> x( n );
  for (int i=0;i<n;i++)
    x[i] = 40.0 + A * sin( 2.0 * pi * m * i / (double)n );

  periodogram_computer_t computer( n , 1.0 );
  periodogram_t pg = computer.compute( &(x[0]) , n );

  const double peak = ( A * n / 2.0 ) * ( A * n / 2.0 );

  REQUIRE_THAT( pg.mean_rate , WithinAbs( 40.0 , 1e-10 ) );
  REQUIRE_THAT( pg.power[m] , WithinAbs( peak , 1e-6 * peak ) );
  // mirror image of a real input
  REQUIRE_THAT( pg.power[n-m] , WithinAbs( peak , 1e-6 * peak ) );
  REQUIRE( pg.power[0] < 1e-10 );
  REQUIRE( pg.power[m+1] < 1e-8 );
}

TEST_CASE( "computer is reused across segments" , "[periodogram]" )
{
  const int n = 8;
  std::vector<double> a( n , 1.0 ) , b( n , 0.0 );
  b[0] = 8;

  periodogram_computer_t computer( n , 1.0 );

  periodogram_t pa = computer.compute( &(a[0]) , n );
  periodogram_t pb = computer.compute( &(b[0]) , n );

  REQUIRE( pa.power[1] < 1e-12 );
  // impulse of 8 minus mean 1: every non-DC bin has |X|^2 = 64
  REQUIRE_THAT( pb.power[1] , WithinAbs( 64.0 , 1e-9 ) );
  REQUIRE_THAT( pb.power[0] , WithinAbs( 0.0 , 1e-9 ) );
}

TEST_CASE( "periodogram refuses a segment of the wrong length" , "[periodogram]" )
{
  std::vector<double> x( 10 , 1.0 );
  periodogram_computer_t computer( 16 , 1.0 );
  REQUIRE_THROWS_AS( computer.compute( &(x[0]) , 10 ) , validation_error_t );
}
