
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

#ifndef __POWSPEC_SEGMENTS_H__
#define __POWSPEC_SEGMENTS_H__

#include "timeseries/lightcurve.h"


//
// one non-overlapping window of n consecutive rates; points into the
// light curve, so it is only valid while that is alive
//

struct segment_t
{
  segment_t() : rate(NULL) , n(0) , index(0) , start(0) { }

  const double * rate;

  int n;

  // segment number (0-based) and first sample
  int index;
  int start;
};


//
// Walks a light curve in windows of n_bins samples; a trailing
// remainder shorter than n_bins is dropped
//

class segmenter_t
{

 public:

  segmenter_t( const lightcurve_t & lc , const int seconds );

  // seconds * round(1/dt), throwing unless a power of two
  static int bins_per_segment( const int seconds , const double dt );

  // false once no full segment remains
  bool next( segment_t * seg );

  int n_bins() const { return nb; }

  double dt() const { return delta_t; }

  // segments handed out so far
  int count() const { return cnt; }

 private:

  const lightcurve_t & lc;

  int nb;

  double delta_t;

  // first sample of the next segment
  int pos;

  int cnt;

};

#endif
