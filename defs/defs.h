
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

#ifndef __POWSPEC_DEFS_H__
#define __POWSPEC_DEFS_H__

#include <string>

#include "param.h"

enum fft_t 
{
  FFT_FORWARD,
  FFT_INVERSE
};


//
// process-wide settings and return codes
//

class globals
{
  
 public:

  static std::string version;

  static std::string date;

  // exit code handed back by Helper::halt()
  static int retcode;

  // retcodes per failure category
  static const int RETCODE_VALIDATION   = 2;
  static const int RETCODE_INSUFFICIENT = 3;
  static const int RETCODE_DOMAIN       = 4;
  static const int RETCODE_IO           = 5;
  
  // function to bail to if needed (instead of exit)
  static void (*bail_function) ( const std::string & msg );

  // redirect of logger output
  static void (*logger_function) ( const std::string & msg );

  // no log output
  static bool silent;

  // generic global parameters (from the command line)
  static param_t param;

  // global functions: primary initiation of all globals
  void init_defs();

  // quiet mode, e.g. when called from tests
  void api();

};

#endif
