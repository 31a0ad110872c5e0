
//    --------------------------------------------------------------------
//
//    This file is part of SGSIM.
//
//    SGSIM is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    SGSIM is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with SGSIM. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#ifndef __LOGGER_H__
#define __LOGGER_H__

#include <iostream>
#include <fstream>
#include <string>
#include <ctime>

#include "defs/defs.h"

//
// Progress log: console (stderr by default), optionally mirrored to a file
//

class logger_t
{

 public:

  logger_t( const std::string & log_header , std::ostream & out_stream = std::cerr )
    : header( log_header ) , out( out_stream ) , to_file( false ) , is_off( false ) , has_banner( false )
  { }

  ~logger_t()
  {
    // only sessions opened with a banner get a trailer
    if ( is_off || globals::silent || ! has_banner ) return;
    emit( rule( '-' ) + "\n" + header + " | finishing " + timestamp() + "\n" + rule( '=' ) + "\n" );
    stop_writing_log();
  }

  // mirror all output to a file (replaces any previous log file)
  void write_log( const std::string & filename )
  {
    if ( is_off || globals::silent ) return;
    stop_writing_log();
    file.open( filename.c_str() );
    to_file = file.good();
    if ( ! to_file ) warning( "could not open log file " + filename );
  }

  void stop_writing_log()
  {
    if ( to_file ) file.close();
    to_file = false;
  }

  // silence for good, e.g. before a fatal error
  void off()
  {
    out.flush();
    stop_writing_log();
    is_off = true;
  }

  void banner( const std::string & version , const std::string & date )
  {
    if ( is_off || globals::silent ) return;
    has_banner = true;
    emit( rule( '=' ) + "\n"
	  + header + " | " + version + ", " + date + " | starting " + timestamp() + "\n"
	  + rule( '=' ) + "\n" );
  }

  void warning( const std::string & msg )
  {
    if ( is_off || globals::silent ) return;
    emit( " ** warning: " + msg + " **\n" );
  }

  template<typename T>
    logger_t & operator<< ( const T & data )
    {
      if ( ! is_off && ! globals::silent ) emit( data );
      return *this;
    }

 private:

  template<typename T>
    void emit( const T & data )
    {
      out << data;
      if ( to_file ) file << data;
    }

  static std::string rule( const char c )
  {
    return std::string( 67 , c );
  }

  static std::string timestamp()
  {
    time_t rawtime;
    time( &rawtime );
    char buf[50];
    strftime( buf , sizeof(buf) , "%d-%b-%Y %H:%M:%S" , localtime( &rawtime ) );
    return buf;
  }

  const std::string header;

  std::ostream & out;

  std::ofstream file;

  bool to_file;

  bool is_off;

  bool has_banner;

};

#endif
