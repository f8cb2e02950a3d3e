
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

#include "param.h"

#include "helper/helper.h"
#include "helper/errors.h"


//
// param_t 
//

void param_t::add( const std::string & option , const std::string & value ) 
{
  // set key=value pairs to opt[]

  if ( option == "" ) return;
  
  // one command line, so no doubles
  if ( opt.find( option ) != opt.end() ) 
    throw validation_error_t( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value; 
  
}  


int param_t::size() const 
{ 
  return opt.size();
}


void param_t::parse( const std::string & s )
{
  std::vector<std::string> tok = Helper::parse( s , '=' );
  if ( tok.size() == 0 ) return;
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else // ignore subsequent '=' signs in 'value'  (i.e. key=value=2  is 'okay', means "value=2" is set to 'key')
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}


void param_t::clear() 
{ 
  opt.clear(); 
} 

bool param_t::has(const std::string & s ) const 
{
  return opt.find(s) != opt.end(); 
} 

bool param_t::empty(const std::string & s ) const
{
  if ( ! has( s ) ) return true; // no key
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno(const std::string & s ) const
{
  if ( ! has( s ) ) return false;
  if ( empty( s ) ) return true;
  return Helper::yesno( opt.find( s )->second ) ; 
}

std::string param_t::value( const std::string & s ) const 
{ 
  if ( has( s ) && ! empty( s ) )
    return Helper::unquote( opt.find( s )->second );
  return "";
}

std::string param_t::requires( const std::string & s ) const
{
  if ( empty(s) ) throw validation_error_t( "command requires parameter " + s );
  return value( s );
}

int param_t::requires_int( const std::string & s ) const
{
  int r;
  if ( ! Helper::str2int( requires( s ) , &r ) ) 
    throw validation_error_t( "command requires parameter " + s + " to have an integer value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  int sz = opt.size();
  int cnt = 1;
  std::stringstream ss;
  while ( ii != opt.end() ) 
    {

      if ( ii->second != "__null__" )
	ss << indent << ii->first << "=" << ii->second; 
      else
	ss << indent << ii->first ;

      if ( cnt != sz )
	ss << delim; 
      
      ++cnt;
      ++ii;
    }
  return ss.str();
}

void param_t::check( const std::set<std::string> & allowed ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      if ( allowed.find( ii->first ) == allowed.end() )
	throw validation_error_t( "unrecognized option: " + ii->first );
      ++ii;
    }
}
