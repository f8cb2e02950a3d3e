
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

#include "spectral/powerspec.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

extern logger_t logger;


void powspec_t::validate( const int seconds , const double rebin_const )
{

  if ( seconds <= 0 )
    throw validation_error_t( "segment length must be a positive number of seconds, not " + Helper::int2str( seconds ) );

  if ( ! MiscMath::is_power_of_two( seconds ) )
    throw validation_error_t( "segment length must be a power of two, not " + Helper::int2str( seconds ) );

  if ( ! ( rebin_const >= 1.0 ) )
    throw validation_error_t( "rebin constant must be at least 1.0, not " + Helper::dbl2str( rebin_const ) );

}


void powspec_t::process()
{

  validate( seconds , rebin_const );

  segmenter_t segmenter( lc , seconds );

  n_bins = segmenter.n_bins();

  dt = segmenter.dt();

  logger << "  time bin size = " << Helper::dbl2str( dt , 12 ) << " seconds\n"
	 << "  " << n_bins << " bins per " << seconds << "-second segment\n";

  //
  // fold each segment's periodogram into the running sums
  //

  periodogram_computer_t computer( n_bins , dt );

  psd_accumulator_t acc( n_bins );

  logger << "  segments computed:\n";

  segment_t seg;

  while ( segmenter.next( &seg ) )
    {

      if ( seg.index % 100 == 0 )
	logger << "\t" << seg.index << "\n";

      acc.add( computer.compute( seg ) );

    }

  const int unused = lc.size() - segmenter.count() * n_bins;

  if ( unused > 0 && segmenter.count() > 0 )
    Helper::warn( "ignoring the final " + Helper::int2str( unused ) + " samples, less than one segment" );

  averaged = acc.average( dt );

  logger << "  averaged " << averaged.num_segments << " segments, mean count rate = "
	 << Helper::dbl2str( averaged.mean_rate , 8 ) << "\n";

  //
  // normalise, then rebin the rms spectrum
  //

  normalized = normalize( averaged );

  rebinned = geometric_rebin( normalized , rebin_const );

  logger << "  " << normalized.size() << " frequency bins, "
	 << rebinned.size() << " after geometric rebinning (c = " << rebin_const << ")\n";

}
