
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

#include "fftw/fftwrap.h"

#include "helper/helper.h"
#include "helper/errors.h"

#include <cmath>
#include <new>


void FFT::reset()
{
  if ( p != NULL ) fftw_destroy_plan(p);
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = out = NULL;
}

FFT::~FFT()
{
  reset();
}


void FFT::init( int Nfft_, double dt_ , fft_t type_ )
{

  reset();

  Nfft = Nfft_;
  dt = dt_;
  type = type_;

  if ( Nfft < 1 ) throw validation_error_t( "FFT requires at least one point" );
  if ( dt <= 0 ) throw validation_error_t( "FFT requires a positive sampling interval" );

  // Allocate storage for input/output
  in = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  if ( in == NULL || out == NULL )
    {
      reset();
      throw std::bad_alloc();
    }

  // Initialise (probably not necessary, but do anyway)
  for (int i=0;i<Nfft;i++) { in[i][0] = in[i][1] = 0; }

  // Generate plan
  p = fftw_plan_dft_1d( Nfft, in, out , type == FFT_FORWARD ? FFTW_FORWARD : FFTW_BACKWARD , FFTW_ESTIMATE );

  //
  // non-negative frequencies only: DC through Nyquist (inclusive) when Nfft is even
  //

  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;

  X.assign( Nfft , 0 );
  frq.assign( cutoff , 0 );

  //
  // Scale frequencies appropriately
  //

  double T = Nfft * dt;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;

}


bool FFT::apply( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return false;
  return apply( &(x[0]) , x.size() );
}


bool FFT::apply( const double * x , const int n )
{

  if ( p == NULL ) return false;

  if ( n != Nfft ) return false;

  //
  // Load up input buffer
  //

  for (int i=0;i<Nfft;i++) { in[i][0] = x[i];  in[i][1] = 0; }

  //
  // Execute actual FFT
  //

  fftw_execute(p);

  //
  // raw power: abs(xdft).^2, with no scaling and no one-sided doubling
  //

  for (int i=0;i<Nfft;i++)
    {
      const double a = out[i][0];
      const double b = out[i][1];
      X[i] = a*a + b*b;
    }

  return true;

}


