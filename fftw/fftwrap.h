
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

#ifndef __POWSPEC_FFTWRAP_H__
#define __POWSPEC_FFTWRAP_H__

#include "fftw3.h"

#include <vector>

#include "defs/defs.h"


//
// Complex 1D DFT of a real series, returning raw (unnormalised)
// squared magnitudes over all Nfft bins
//

class FFT
{

 public:

  FFT() : Nfft(0) , dt(0) , type(FFT_FORWARD) , in(NULL) , out(NULL) , p(NULL) , cutoff(0) { }

  FFT( int Nfft , double dt , fft_t type = FFT_FORWARD )
    : in(NULL) , out(NULL) , p(NULL) , cutoff(0)
    {
      init( Nfft , dt , type );
    }

  void init( int Nfft , double dt , fft_t type = FFT_FORWARD );

  void reset();

  ~FFT();

  // owns the FFTW buffers and plan
  FFT( const FFT & ) = delete;
  FFT & operator=( const FFT & ) = delete;

 private:

  // Size (NFFT)
  int Nfft;

  // Sampling interval, so we can construct the appropriate Hz
  double dt;

  // Forward or inverse FFT?
  fft_t type;

  // Input signal
  fftw_complex *in;

  // Output signal
  fftw_complex *out;

  // FFT plan from FFTW3
  fftw_plan p;

 public:

  // number of non-negative frequency bins
  int cutoff;

  // |X[k]|^2 for k in [0,Nfft)
  std::vector<double> X;

  // frequencies (Hz) of the first 'cutoff' bins
  std::vector<double> frq;

 public:

  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );

  int size() const { return Nfft; }

};


#endif
