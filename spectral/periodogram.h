
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

#ifndef __POWSPEC_PERIODOGRAM_H__
#define __POWSPEC_PERIODOGRAM_H__

#include <vector>

#include "fftw/fftwrap.h"
#include "spectral/segments.h"


//
// raw periodogram of one segment: the segment mean rate, and |DFT|^2
// of the mean-subtracted rates over all n bins
//

struct periodogram_t
{
  periodogram_t() : mean_rate(0) { }

  double mean_rate;

  std::vector<double> power;
};


//
// Holds one FFTW plan for a fixed segment length, so that it can be
// reused for every segment of a run
//

class periodogram_computer_t
{

 public:

  periodogram_computer_t( const int n_bins , const double dt );

  periodogram_t compute( const segment_t & seg );

  periodogram_t compute( const double * x , const int n );

  int n_bins() const { return nb; }

 private:

  int nb;

  FFT fft;

  std::vector<double> demeaned;

};

#endif
