
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

#include "timeseries/lightcurve.h"

#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;


lightcurve_t::lightcurve_t( const std::vector<double> & t , const std::vector<double> & r )
  : time( t ) , rate( r )
{
  if ( time.size() != rate.size() )
    throw validation_error_t( "light curve time and rate columns differ in length" );
}


void lightcurve_t::load( const std::string & filename , const int tcol , const int rcol )
{

  if ( tcol < 1 || rcol < 1 )
    throw validation_error_t( "column numbers are 1-based: tcol=" + Helper::int2str( tcol ) + ", rcol=" + Helper::int2str( rcol ) );

  if ( tcol == rcol )
    throw validation_error_t( "tcol and rcol refer to the same column" );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  if ( ! IN1.good() )
    throw io_error_t( "could not open " + filename );

  id = filename;
  time.clear();
  rate.clear();

  const int need = tcol > rcol ? tcol : rcol ;

  int lineno = 0;

  while ( ! IN1.eof() )
    {

      std::string line;

      Helper::safe_getline( IN1 , line );

      if ( IN1.eof() && line == "" ) break;

      if ( IN1.bad() )
	throw io_error_t( "problem reading " + filename );

      ++lineno;

      line = Helper::lrtrim( line );

      // comments and blank lines
      if ( line == "" || line[0] == '#' || line[0] == '%' ) continue;

      std::vector<std::string> tok = Helper::parse( line , "\t ," );

      if ( tok.size() < need )
	throw io_error_t( filename + " line " + Helper::int2str( lineno )
			  + ": expecting at least " + Helper::int2str( need ) + " columns" );

      double t , r;

      if ( ! Helper::str2dbl( tok[ tcol - 1 ] , &t ) )
	throw io_error_t( filename + " line " + Helper::int2str( lineno ) + ": bad time value " + tok[ tcol - 1 ] );

      if ( ! Helper::str2dbl( tok[ rcol - 1 ] , &r ) )
	throw io_error_t( filename + " line " + Helper::int2str( lineno ) + ": bad rate value " + tok[ rcol - 1 ] );

      time.push_back( t );
      rate.push_back( r );

    }

  IN1.close();

  logger << "  read " << rate.size() << " samples from " << filename << "\n";

}


double lightcurve_t::dt() const
{
  if ( time.size() < 2 )
    throw insufficient_data_error_t( "need at least two samples to determine the time bin size" );
  return time[1] - time[0];
}
