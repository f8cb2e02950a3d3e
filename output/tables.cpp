
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

#include "output/tables.h"

#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;


void write_unbinned( std::ostream & out ,
		     const powspec_t & ps ,
		     const std::string & source ,
		     const bool add_leahy )
{

  const normalized_spectrum_t & ns = ps.normalized;

  out << "#\t\tPower spectrum"
      << "\n# Data: " << source
      << "\n# Time bin size = " << Helper::dbl2str( ps.dt , 12 ) << " seconds"
      << "\n# Number of bins per segment = " << ps.n_bins
      << "\n# Number of segments per light curve = " << ps.num_segments()
      << "\n# Duration of light curve used = " << (long)ps.duration() << " seconds"
      << "\n# Mean count rate = " << Helper::dbl2str( ps.mean_rate() , 8 ) << ", over whole light curve"
      << "\n# "
      << "\n# Column 1: Frequency in Hz (sample_frequency * 1.0/dt)"
      << "\n# Column 2: Fractional rms normalized mean power"
      << "\n# Column 3: Fractional rms normalized error on the mean power";

  if ( add_leahy )
    out << "\n# Column 4: Leahy normalized mean power";

  out << "\n# ";

  // rows follow a newline, so no trailing newline at the end
  for (int k=0;k<ns.size();k++)
    {
      out << "\n" << Helper::dbl2str( ns.freq[k] , 8 )
	  << "\t" << Helper::dbl2str( ns.rms[k] , 8 )
	  << "\t" << Helper::dbl2str( ns.rms_err[k] , 8 );
      if ( add_leahy )
	out << "\t" << Helper::dbl2str( ns.leahy[k] , 8 );
    }

}


void write_rebinned( std::ostream & out ,
		     const powspec_t & ps ,
		     const std::string & source ,
		     const std::string & unbinned_file )
{

  const rebinned_spectrum_t & rs = ps.rebinned;

  out << "#\t\tPower spectrum"
      << "\n# Data: " << source
      << "\n# Geometrically re-binned in frequency at (" << Helper::dbl2str( ps.rebin_constant() , 6 ) << " * previous bin size)"
      << "\n# Corresponding un-binned output file: " << unbinned_file
      << "\n# Original time bin size = " << Helper::dbl2str( ps.dt , 12 ) << " seconds"
      << "\n# Duration of light curve used = " << (long)ps.duration() << " seconds"
      << "\n# Mean count rate = " << Helper::dbl2str( ps.mean_rate() , 8 ) << ", over whole light curve"
      << "\n# "
      << "\n# Column 1: Frequency in Hz"
      << "\n# Column 2: Fractional rms normalized mean power"
      << "\n# Column 3: Error in fractional rms normalized mean power"
      << "\n# ";

  for (int k=0;k<rs.size();k++)
    out << "\n" << Helper::dbl2str( rs.freq[k] , 8 )
	<< "\t" << Helper::dbl2str( rs.power[k] , 8 )
	<< "\t" << Helper::dbl2str( rs.err[k] , 8 );

}


void write_tables( const std::string & out_file ,
		   const std::string & rebinned_out_file ,
		   const powspec_t & ps ,
		   const std::string & source ,
		   const bool add_leahy )
{

  std::ofstream O1( out_file.c_str() , std::ios::out );
  if ( ! O1.good() )
    throw io_error_t( "could not open " + out_file + " for writing" );

  write_unbinned( O1 , ps , source , add_leahy );

  O1.close();
  if ( O1.fail() )
    throw io_error_t( "problem writing " + out_file );

  logger << "  output sent to " << out_file << "\n";

  std::ofstream O2( rebinned_out_file.c_str() , std::ios::out );
  if ( ! O2.good() )
    throw io_error_t( "could not open " + rebinned_out_file + " for writing" );

  write_rebinned( O2 , ps , source , out_file );

  O2.close();
  if ( O2.fail() )
    throw io_error_t( "problem writing " + rebinned_out_file );

  logger << "  and " << rebinned_out_file << "\n";

}
