
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

#include "defs/defs.h"

std::string globals::version;
std::string globals::date;

int globals::retcode;

param_t globals::param;

void (*globals::bail_function) ( const std::string & );

void (*globals::logger_function) ( const std::string & );

bool globals::silent;


void globals::api()
{
  silent = true;
}


void globals::init_defs()
{

  //
  // Version
  //
  
  version = "v0.3.1";
  
  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //
  
  bail_function = NULL;

  //
  // Optional redirect of logger?
  //

  logger_function = NULL; 
  
  //
  // Output
  //

  silent = false;

  param.clear();
  
}
