//    --------------------------------------------------------------------
//
//    This file is part of fmill.
//
//    fmill is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    fmill is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with fmill. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __FMILL_LOGGER_H__
#define	__FMILL_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>
#include <mutex>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;

  std::ofstream  _log_file;

  bool         is_off;

  // worker threads may warn concurrently
  std::mutex   mtx;

  static std::string timestamp()
  {
    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);
    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);
    return BUFFER;
  }

 public:

 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream )
  {
    is_off = false;
    save_log = false;
  }

  void write_log( const std::string & log_file )
  {

    // not in embedded mode
    if ( is_off || globals::silent || globals::api_mode ) return;

    if ( save_log )
      stop_writing_log();

    _log_file.open( log_file.c_str() );
    save_log = true;
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

    std::stringstream b;
    b << "===================================================================" << "\n"
      << _log_header
      << " | " << v << ", " << bd << " | starting " << timestamp()  << " +++\n"
      << "===================================================================" << std::endl;

    _out_stream << b.str();
    if ( save_log ) _log_file << b.str();

  }

  ~logger_t()
    {

      if ( is_off || globals::silent || globals::api_mode ) return;

      std::stringstream b;
      b << "-------------------------------------------------------------------"
	<< "\n"
	<< "+++ fmill | finishing "
	<< timestamp()
	<< "                      +++\n"
	<< "==================================================================="
	<< std::endl;

      _out_stream << b.str();

      if ( save_log )
	{
	  _log_file << b.str();
	  stop_writing_log();
	}

    }


  void warning( const std::string & msg )
  {
    if ( is_off ) return ;

    std::lock_guard<std::mutex> lock( mtx );

    if ( globals::logger_function )
      (*globals::logger_function)( " ** warning: " + msg + " **" );
    else if ( ! globals::silent )
      {
	_out_stream << " ** warning: " << msg << " ** " << std::endl;
	if ( save_log )
	  _log_file << " ** warning: " << msg << " ** " << std::endl;
      }
  }


  template<typename T>
    logger_t& operator<< (const T& data)
    {
      if ( is_off ) return *this;

      std::lock_guard<std::mutex> lock( mtx );

      if ( ! globals::silent )
	{
	  _out_stream << data;
	  if ( save_log )
	    _log_file << data;
	}

      if ( globals::logger_function )
	{
	  std::stringstream ss1;
	  ss1 << data;
	  (*globals::logger_function)( ss1.str() );
	}

      return *this;

    }

};


#endif
