
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

#include "powspec.h"
#include "main.h"

#include <cstring>
#include <cstdlib>
#include <set>
#include <sstream>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << powspec_version() ;
      std::cerr << "FFTW library " << fftw_version << "\n";
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = powspec_version() +
    "usage: powspec light-curve out-file rebinned-out-file seconds rebin-const\n"
    "               [tcol=1] [rcol=2] [leahy] [log=file] [silent]\n"
    "\n"
    "  light-curve        text file, time and count rate columns\n"
    "  out-file           table of the fractional rms power spectrum\n"
    "  rebinned-out-file  table of the geometrically re-binned spectrum\n"
    "  seconds            segment length, an integer power of two\n"
    "  rebin-const        >= 1.0, bin_size[n+1] = bin_size[n] * rebin-const\n";

  if ( argc >= 2 && ( strcmp( argv[1] , "-h" ) == 0 || strcmp( argv[1] , "--help" ) == 0 ) )
    {
      std::cerr << usage_msg;
      std::exit(0);
    }

  //
  // degenerate command line?
  //

  if ( argc < 6 )
    {
      std::cerr << usage_msg;
      std::exit(1);
    }

  const std::string lc_file = argv[1];
  const std::string out_file = argv[2];
  const std::string rebinned_out_file = argv[3];

  try
    {

      //
      // positional numeric arguments, then key=value options
      //

      int seconds = 0;
      if ( ! Helper::str2int( argv[4] , &seconds ) )
	throw validation_error_t( "segment length must be an integer number of seconds, not " + std::string( argv[4] ) );

      double rebin_const = 0;
      if ( ! Helper::str2dbl( argv[5] , &rebin_const ) )
	throw validation_error_t( "rebin constant must be numeric, not " + std::string( argv[5] ) );

      for (int i=6;i<argc;i++)
	globals::param.parse( argv[i] );

      std::set<std::string> allowed;
      allowed.insert( "tcol" );
      allowed.insert( "rcol" );
      allowed.insert( "leahy" );
      allowed.insert( "log" );
      allowed.insert( "silent" );
      globals::param.check( allowed );

      if ( globals::param.has( "silent" ) )
	global.api();

      if ( globals::param.has( "log" ) )
	logger.write_log( globals::param.requires( "log" ) );

      const int tcol = globals::param.has( "tcol" ) ? globals::param.requires_int( "tcol" ) : 1 ;
      const int rcol = globals::param.has( "rcol" ) ? globals::param.requires_int( "rcol" ) : 2 ;
      const bool add_leahy = globals::param.yesno( "leahy" );

      logger.banner( globals::version , globals::date );

      if ( globals::param.size() != 0 )
	logger << "options:\n" << globals::param.dump( "  " , "\n" ) << "\n";

      // fail on bad parameters before touching the data
      powspec_t::validate( seconds , rebin_const );

      logger << "reading data from " << lc_file << "\n";

      lightcurve_t lc;

      lc.load( lc_file , tcol , rcol );

      powspec_t ps( lc , seconds , rebin_const );

      write_tables( out_file , rebinned_out_file , ps , lc_file , add_leahy );

    }
  catch ( const validation_error_t & e )
    {
      globals::retcode = globals::RETCODE_VALIDATION;
      Helper::halt( std::string( "invalid parameter: " ) + e.what() );
    }
  catch ( const insufficient_data_error_t & e )
    {
      globals::retcode = globals::RETCODE_INSUFFICIENT;
      Helper::halt( std::string( "insufficient data: " ) + e.what() );
    }
  catch ( const domain_error_t & e )
    {
      globals::retcode = globals::RETCODE_DOMAIN;
      Helper::halt( std::string( "cannot normalize: " ) + e.what() );
    }
  catch ( const io_error_t & e )
    {
      globals::retcode = globals::RETCODE_IO;
      Helper::halt( std::string( "I/O problem: " ) + e.what() );
    }
  catch ( const std::exception & e )
    {
      globals::retcode = 1;
      Helper::halt( e.what() );
    }

  std::exit( globals::retcode );

}


std::string powspec_version()
{
  std::stringstream ss;
  ss << "powspec version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "powspec build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* You need a shorter light curve or shorter segments*\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
