
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

#ifndef __POWSPEC_REBIN_H__
#define __POWSPEC_REBIN_H__

#include <vector>

#include "spectral/normalize.h"


//
// one geometric bin, covering input bins [lwr,upr)
//

struct rebinned_bin_t
{
  rebinned_bin_t() : freq(0) , power(0) , err(0) , lwr(0) , upr(0) { }

  double freq;
  double power;
  double err;

  int lwr;
  int upr;
};


struct rebinned_spectrum_t
{

  int size() const { return freq.size(); }

  bool empty() const { return freq.size() == 0; }

  void add( const rebinned_bin_t & b )
  {
    freq.push_back( b.freq );
    power.push_back( b.power );
    err.push_back( b.err );
  }

  std::vector<double> freq;
  std::vector<double> power;
  std::vector<double> err;

};


//
// Geometric rebinning: group sizes 1, round(c), round(c^2), ... over
// the non-DC bins, so bin_size[n+1] ~ bin_size[n] * c
//
// Bins are produced one at a time by next(); the group [prev_m,current_m)
// is emitted while it lies entirely inside [1,L), so consecutive groups
// neither overlap nor leave gaps.  A partial group at the top end is
// dropped.  Rounding of the running real-valued group size is half away
// from zero.
//
// The input vectors are held by reference and must outlive the rebinner.
//

class geom_rebinner_t
{

 public:

  geom_rebinner_t( const std::vector<double> & power ,
		   const std::vector<double> & err ,
		   const std::vector<double> & freq ,
		   const double rebin_const );

  bool next( rebinned_bin_t * b );

  // state, exposed for checking the no-gap/no-overlap invariant
  int prev_m() const { return pm; }
  int current_m() const { return cm; }
  double real_index() const { return ri; }

  bool done() const { return cm > L; }

 private:

  const std::vector<double> & power;
  const std::vector<double> & err;
  const std::vector<double> & freq;

  const double c;

  const int L;

  int pm;
  int cm;
  double ri;

};


rebinned_spectrum_t geometric_rebin( const std::vector<double> & power ,
				     const std::vector<double> & err ,
				     const std::vector<double> & freq ,
				     const double rebin_const );

rebinned_spectrum_t geometric_rebin( const normalized_spectrum_t & ns , const double rebin_const );

#endif
