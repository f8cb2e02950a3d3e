
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

#ifndef __POWSPEC_AVERAGER_H__
#define __POWSPEC_AVERAGER_H__

#include <vector>

#include <Eigen/Dense>

#include "spectral/periodogram.h"


//
// Cross-segment mean of the raw periodograms, restricted to the
// non-negative frequencies [0,L)
//

struct averaged_spectrum_t
{

  averaged_spectrum_t() : mean_rate(0) , num_segments(0) , n_bins(0) , dt(0) { }

  int size() const { return freq.size(); }

  std::vector<double> freq;

  // mean raw power and its error, avg/sqrt(num_segments*L)
  std::vector<double> power;
  std::vector<double> err;

  // mean of the per-segment mean rates
  double mean_rate;

  int num_segments;

  int n_bins;

  double dt;

};


//
// Running sums over segments; accumulators for disjoint sets of
// segments can be merged in any order
//

class psd_accumulator_t
{

 public:

  psd_accumulator_t() : nb(0) , sum_rate(0) , cnt(0) { }

  explicit psd_accumulator_t( const int n_bins );

  void add( const periodogram_t & pg );

  psd_accumulator_t & operator+=( const psd_accumulator_t & rhs );

  friend psd_accumulator_t operator+( psd_accumulator_t a , const psd_accumulator_t & b );

  int segments() const { return cnt; }

  int n_bins() const { return nb; }

  // throws insufficient_data_error_t if nothing was added
  averaged_spectrum_t average( const double dt ) const;

  // non-negative frequency bins for an n-point DFT
  static int positive_bins( const int n );

 private:

  int nb;

  Eigen::ArrayXd sum_power;

  double sum_rate;

  int cnt;

};

#endif
