
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

#ifndef __POWSPEC_HELPER_H__
#define __POWSPEC_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <algorithm> 
#include <cctype>
#include <stdint.h>
#include <cmath>

namespace Helper 
{

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](int c) {return !std::isspace(c);} ));
    return s;
  }
 
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](int c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    if ( a + b >= (int)s.size() ) return "";
    return s.substr(a,s.size()-a-b);
  }

  bool yesno( const std::string & );
  
  std::istream& safe_getline(std::istream& is, std::string& t);

  void halt( const std::string & msg );
  void warn( const std::string & msg );
  
  std::string int2str(int n);  
  std::string int2str(long n);
  std::string dbl2str(double n);  
  std::string dbl2str(double n, int dp);  

  // whole-token conversions: trailing characters make these fail
  bool str2dbl(const std::string & , double * );
  bool str2int(const std::string & , int * );

  std::vector<std::string> char_split( const std::string & s , const char c , bool empty = false );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , bool empty = false );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty = false );
  
  std::vector<std::string> parse(const std::string & item, const char s , bool empty = false );
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t" , bool empty = false );
  
  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      if ( (iss >> f >> t).fail() ) return false;
      iss >> std::ws;
      return iss.eof();
    }
  
}

#endif
