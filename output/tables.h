
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

#ifndef __POWSPEC_TABLES_H__
#define __POWSPEC_TABLES_H__

#include <string>
#include <ostream>

#include "spectral/powerspec.h"


//
// Plain-text tables: the linear (unbinned) spectrum over all
// non-negative frequencies, and the geometrically rebinned one
//

void write_unbinned( std::ostream & out ,
		     const powspec_t & ps ,
		     const std::string & source ,
		     const bool add_leahy = false );

void write_rebinned( std::ostream & out ,
		     const powspec_t & ps ,
		     const std::string & source ,
		     const std::string & unbinned_file );

// both tables to files; throws io_error_t
void write_tables( const std::string & out_file ,
		   const std::string & rebinned_out_file ,
		   const powspec_t & ps ,
		   const std::string & source ,
		   const bool add_leahy = false );

#endif
