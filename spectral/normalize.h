
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

#ifndef __POWSPEC_NORMALIZE_H__
#define __POWSPEC_NORMALIZE_H__

#include <vector>

#include "spectral/averager.h"


//
// Leahy and fractional-rms normalisations of an averaged spectrum
//
//   leahy   = 2 P dt / n / R
//   rms     = 2 P dt / n / R^2 - 2 / R      (Poisson noise level removed)
//   rms_err = 2 E dt / n / R^2
//
// for mean raw power P, its error E, n bins per segment and mean rate R
//

struct normalized_spectrum_t
{

  normalized_spectrum_t() : mean_rate(0) { }

  int size() const { return freq.size(); }

  std::vector<double> freq;

  std::vector<double> leahy;

  std::vector<double> rms;

  std::vector<double> rms_err;

  double mean_rate;

};


// throws domain_error_t unless the mean rate is positive
normalized_spectrum_t normalize( const averaged_spectrum_t & avg );

#endif
