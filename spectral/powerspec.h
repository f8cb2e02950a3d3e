
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

#ifndef __POWSPEC_POWERSPEC_H__
#define __POWSPEC_POWERSPEC_H__

#include "timeseries/lightcurve.h"
#include "spectral/segments.h"
#include "spectral/periodogram.h"
#include "spectral/averager.h"
#include "spectral/normalize.h"
#include "spectral/rebin.h"


//
// Averaged, normalised and geometrically rebinned power spectrum of a
// light curve, from non-overlapping segments of 'seconds' length
//

class powspec_t
{

 public:

 powspec_t( const lightcurve_t & lc ,
	    const int seconds ,
	    const double rebin_const )
   : n_bins(0) , dt(0) , lc(lc) , seconds(seconds) , rebin_const(rebin_const)
  {
    process();
  }

  // parameter checks that do not need the data
  static void validate( const int seconds , const double rebin_const );

  //
  // Derived variables
  //

  int n_bins;

  double dt;

  averaged_spectrum_t averaged;

  normalized_spectrum_t normalized;

  rebinned_spectrum_t rebinned;

  int num_segments() const { return averaged.num_segments; }

  double mean_rate() const { return averaged.mean_rate; }

  double rebin_constant() const { return rebin_const; }

  // total time covered by the segments used
  double duration() const { return averaged.num_segments * (double)n_bins * dt; }

 private:

  void process();

  // input light curve
  const lightcurve_t & lc;

  // segment length (seconds)
  const int seconds;

  // bin_size[n+1] = bin_size[n] * rebin_const
  const double rebin_const;

};

#endif
