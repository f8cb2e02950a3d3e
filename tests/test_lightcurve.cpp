
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

#include "timeseries/lightcurve.h"
#include "helper/errors.h"

#include <fstream>
#include <cstdio>
#include <string>


static void write_file( const std::string & filename , const std::string & text )
{
  std::ofstream O1( filename.c_str() , std::ios::out | std::ios::binary );
  O1 << text;
  O1.close();
}


TEST_CASE( "light curve from a whitespace table" , "[lightcurve]" )
{
  const std::string f = "powspec_test_lc1.txt";

  write_file( f ,
	      "# time rate\n"
	      "% another comment\n"
	      "\n"
	      "0.0\t10.5\n"
	      "0.5  11.0\n"
	      "1.0,9.5\n" );

  lightcurve_t lc;
  lc.load( f );

  REQUIRE( lc.size() == 3 );
  REQUIRE( lc.id == f );
  REQUIRE( lc.time[2] == 1.0 );
  REQUIRE( lc.rate[0] == 10.5 );
  REQUIRE( lc.rate[2] == 9.5 );
  REQUIRE( lc.dt() == 0.5 );

  std::remove( f.c_str() );
}

TEST_CASE( "light curve columns are selectable" , "[lightcurve]" )
{
  const std::string f = "powspec_test_lc2.txt";

  write_file( f ,
	      "1 0.0 5 0.2\r\n"
	      "2 0.25 6 0.3\r\n" );

  lightcurve_t lc;
  lc.load( f , 2 , 3 );

  REQUIRE( lc.size() == 2 );
  REQUIRE( lc.time[1] == 0.25 );
  REQUIRE( lc.rate[1] == 6 );

  std::remove( f.c_str() );
}

TEST_CASE( "light curve read failures" , "[lightcurve]" )
{
  lightcurve_t lc;

  SECTION( "missing file" )
    {
      REQUIRE_THROWS_AS( lc.load( "powspec_test_no_such_file.txt" ) , io_error_t );
    }

  SECTION( "non-numeric field" )
    {
      const std::string f = "powspec_test_lc3.txt";
      write_file( f , "0 1\n1 x\n" );
      REQUIRE_THROWS_AS( lc.load( f ) , io_error_t );
      std::remove( f.c_str() );
    }

  SECTION( "too few columns" )
    {
      const std::string f = "powspec_test_lc4.txt";
      write_file( f , "0 1\n1\n" );
      REQUIRE_THROWS_AS( lc.load( f ) , io_error_t );
      std::remove( f.c_str() );
    }

  SECTION( "bad column numbers" )
    {
      REQUIRE_THROWS_AS( lc.load( "any.txt" , 0 , 2 ) , validation_error_t );
      REQUIRE_THROWS_AS( lc.load( "any.txt" , 2 , 2 ) , validation_error_t );
    }
}

TEST_CASE( "sampling interval needs two samples" , "[lightcurve]" )
{
  std::vector<double> t( 1 , 0.0 ) , r( 1 , 5.0 );
  lightcurve_t lc( t , r );
  REQUIRE_THROWS_AS( lc.dt() , insufficient_data_error_t );

  std::vector<double> t2( 2 , 0.0 );
  REQUIRE_THROWS_AS( lightcurve_t( t2 , r ) , validation_error_t );
}
