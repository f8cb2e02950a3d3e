
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

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __POWSPEC_LOGGER_H__
#define	__POWSPEC_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;
  
  std::ofstream  _log_file;
  
  bool         is_off;

  bool         has_banner;
  
 public:
  
 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream ) 
  {
    is_off = false;
    save_log = false;
    has_banner = false;
  }

  void write_log( const std::string & log_file )
  {

    if ( is_off || globals::silent ) return;
    
    // close any existing stream?
    if ( save_log )
      stop_writing_log();
    
    _log_file.open( log_file.c_str() );
    save_log = _log_file.good();
  }
  
  void stop_writing_log()
  {
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }
  
  void flush() { _out_stream.flush(); } 

  void off() { flush(); stop_writing_log(); is_off = true; } 

  void banner( const std::string & v , const std::string & bd ) 
  {

    if ( is_off || globals::silent ) return;
    
    // initialize log with this message
    
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo); 

    _out_stream << "===================================================================" << "\n"
		<< _log_header
		<< " | " << v << ", " << bd << " | starting " << BUFFER  << " +++\n"
		<< "===================================================================" << std::endl;

    if ( save_log )
      _log_file << "===================================================================" << "\n"
		<< _log_header
		<< " | " << v << ", " << bd << " | starting " << BUFFER  << " +++\n"
		<< "===================================================================" << std::endl;

    has_banner = true;
  }

                         
   
  ~logger_t()
    {

      // only close out a log that was opened with a banner
      if ( is_off || globals::silent || ! has_banner ) return;
      
      time_t rawtime;
      time (&rawtime);
      struct tm * timeinfo = localtime (&rawtime);
	  
      char BUFFER[50];
      strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);
      
      _out_stream << "-------------------------------------------------------------------"
		  << "\n"
		  << _log_header << " | finishing "
		  << BUFFER
		  << "                       +++\n"
		  << "==================================================================="
		  << std::endl;
      
      if ( save_log )
	{
	  
	  _log_file << "-------------------------------------------------------------------"
		    << "\n"
		    << _log_header << " | finishing "
		    << BUFFER
		    << "                       +++\n"
		    << "==================================================================="
		    << std::endl;
	  
	  stop_writing_log();
	}
      
    }


  void warning( const std::string & msg )
  {
    if ( is_off || globals::silent ) return ;
    
    if ( globals::logger_function )
      (*globals::logger_function)( " ** warning: " + msg + " **" );
    else
      {
	_out_stream << " ** warning: " << msg << " ** " << std::endl;
	if ( save_log )
	  _log_file << " ** warning: " << msg << " ** " << std::endl;
      }
  }
  
  
  template<typename T>           
    logger_t& operator<< (const T& data) 
    {
      if ( is_off || globals::silent ) return *this;      
      
      if ( globals::logger_function )
	{
	  std::stringstream ss1;
	  ss1 << data;
	  (*globals::logger_function)( ss1.str() );
	  return *this;
	}
      
      _out_stream << data;
      if ( save_log )	
	_log_file << data;
      
      return *this;

    }
  
};


#endif
