
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

#ifndef __POWSPEC_LIGHTCURVE_H__
#define __POWSPEC_LIGHTCURVE_H__

#include <string>
#include <vector>


//
// An evenly sampled count-rate time series: (timestamp, rate) pairs
//

struct lightcurve_t
{

  lightcurve_t() { }

  lightcurve_t( const std::vector<double> & t , const std::vector<double> & r );

  // plain-text table; columns are 1-based
  void load( const std::string & filename , const int tcol = 1 , const int rcol = 2 );

  // sampling interval from the first two timestamps
  double dt() const;

  int size() const { return rate.size(); }

  bool empty() const { return rate.size() == 0; }

  // start of a contiguous slice of the rate column
  const double * rate_ptr( const int i ) const { return &(rate[i]); }

  // source identifier (file name), reported in the output tables
  std::string id;

  std::vector<double> time;

  std::vector<double> rate;

};


#endif
