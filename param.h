
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

#ifndef __POWSPEC_PARAM_H__
#define __POWSPEC_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sstream>

//
// Helper to parse key=value options from the command line
//

struct param_t
{

 public:
  
  void add( const std::string & option , const std::string & value = "" ); 

  int size() const;
  
  void parse( const std::string & s );
  
  void clear();
  
  bool has(const std::string & s ) const;
  
  bool empty(const std::string & s ) const;
  
  // if ! has(X) return F
  // else return yesno(value(X)), where a bare key counts as yes
  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s ) const;
 
  std::string requires( const std::string & s ) const;
  
  int requires_int( const std::string & s ) const;
  
  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  // throws if any key is not in 'allowed'
  void check( const std::set<std::string> & allowed ) const;
  
private:

  std::map<std::string,std::string> opt;

};


#endif
