
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

#include "spectral/normalize.h"

#include "helper/helper.h"
#include "helper/errors.h"

#include <Eigen/Dense>


normalized_spectrum_t normalize( const averaged_spectrum_t & avg )
{

  const double R = avg.mean_rate;

  if ( ! ( R > 0 ) )
    throw domain_error_t( "cannot normalize by a mean count rate of " + Helper::dbl2str( R ) );

  if ( avg.n_bins < 1 || ! ( avg.dt > 0 ) )
    throw validation_error_t( "averaged spectrum has no valid n_bins/dt" );

  if ( avg.power.size() != avg.freq.size() || avg.err.size() != avg.freq.size() )
    throw validation_error_t( "averaged spectrum arrays differ in length" );

  const int L = avg.size();

  const double dt = avg.dt;

  const double n = avg.n_bins;

  Eigen::Map<const Eigen::ArrayXd> P( avg.power.data() , L );
  Eigen::Map<const Eigen::ArrayXd> E( avg.err.data() , L );

  Eigen::ArrayXd leahy = 2.0 * P * dt / n / R;
  Eigen::ArrayXd rms = 2.0 * P * dt / n / ( R * R ) - 2.0 / R;
  Eigen::ArrayXd rms_err = 2.0 * E * dt / n / ( R * R );

  normalized_spectrum_t ns;

  ns.mean_rate = R;
  ns.freq = avg.freq;
  ns.leahy.assign( leahy.data() , leahy.data() + L );
  ns.rms.assign( rms.data() , rms.data() + L );
  ns.rms_err.assign( rms_err.data() , rms_err.data() + L );

  return ns;
}
