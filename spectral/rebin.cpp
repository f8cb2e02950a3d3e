
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

#include "spectral/rebin.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"

#include <cmath>


geom_rebinner_t::geom_rebinner_t( const std::vector<double> & power ,
				  const std::vector<double> & err ,
				  const std::vector<double> & freq ,
				  const double rebin_const )
  : power( power ) , err( err ) , freq( freq ) , c( rebin_const ) , L( freq.size() ) ,
    pm( 1 ) , cm( 2 ) , ri( 1.0 )
{

  if ( ! ( rebin_const >= 1.0 ) )
    throw validation_error_t( "rebin constant must be at least 1.0, not " + Helper::dbl2str( rebin_const ) );

  if ( power.size() != freq.size() || err.size() != freq.size() )
    throw validation_error_t( "geometric rebinning given power, error and frequency arrays of different lengths" );

}


bool geom_rebinner_t::next( rebinned_bin_t * b )
{

  // bin 0 (DC) is never part of a group; L <= 1 gives nothing
  if ( cm > L ) return false;

  const int bin_range = cm - pm;

  double bin_power = 0;
  double err2 = 0;

  for (int k=pm;k<cm;k++)
    {
      bin_power += power[k];
      err2 += err[k] * err[k];
    }

  double bin_freq;

  // a single bin is passed through as is
  if ( bin_range == 1 )
    {
      bin_power = power[pm];
      bin_freq = freq[pm];
    }
  else
    {
      bin_power /= (double)bin_range;

      // upper edge: one step past the last bin if the group reaches the end
      const double f_upr = cm < L ? freq[cm] : freq[L-1] + ( freq[L-1] - freq[L-2] );

      bin_freq = freq[pm] + ( f_upr - freq[pm] ) / (double)bin_range;
    }

  b->freq = bin_freq;
  b->power = bin_power;
  b->err = sqrt( err2 ) / (double)bin_range;
  b->lwr = pm;
  b->upr = cm;

  //
  // next group starts where this one ended
  //

  pm = cm;
  ri *= c;

  // a step beyond the end finishes; this also keeps lround() in range
  if ( ri >= (double)L )
    cm = L + 1;
  else
    cm += MiscMath::round_count( ri );

  return true;
}


rebinned_spectrum_t geometric_rebin( const std::vector<double> & power ,
				     const std::vector<double> & err ,
				     const std::vector<double> & freq ,
				     const double rebin_const )
{
  rebinned_spectrum_t rs;
  geom_rebinner_t rebinner( power , err , freq , rebin_const );
  rebinned_bin_t b;
  while ( rebinner.next( &b ) )
    rs.add( b );
  return rs;
}


rebinned_spectrum_t geometric_rebin( const normalized_spectrum_t & ns , const double rebin_const )
{
  return geometric_rebin( ns.rms , ns.rms_err , ns.freq , rebin_const );
}
