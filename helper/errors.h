
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

#ifndef __POWSPEC_ERRORS_H__
#define __POWSPEC_ERRORS_H__

#include <stdexcept>
#include <string>

//
// Failure categories raised by the spectral core; main() maps each
// to its own message prefix and return code
//

// bad parameters: detected before (or independent of) the data
struct validation_error_t : public std::runtime_error
{
  explicit validation_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// not enough samples to form a single segment
struct insufficient_data_error_t : public std::runtime_error
{
  explicit insufficient_data_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// data-dependent numerical failure, e.g. a zero mean count rate
struct domain_error_t : public std::runtime_error
{
  explicit domain_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// reading the light curve or writing a table failed
struct io_error_t : public std::runtime_error
{
  explicit io_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

#endif
