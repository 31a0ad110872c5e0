
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


#ifndef __HELPER_H__
#define __HELPER_H__

#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Helper
{

  //
  // errors and warnings
  //

  // fatal: calls globals::bail_function if set, else prints and exits
  void halt( const std::string & msg );

  // non-fatal, via the logger
  void warn( const std::string & msg );


  //
  // strings
  //

  std::string toupper( const std::string & );

  std::string tolower( const std::string & );

  // case insensitive comparison
  bool iequals( const std::string & a , const std::string & b );

  // strip leading and trailing whitespace
  inline std::string lrtrim( const std::string & s )
  {
    std::string::const_iterator b = std::find_if( s.begin() , s.end() , [](int c) { return ! std::isspace(c); } );
    std::string::const_reverse_iterator e = std::find_if( s.rbegin() , s.rend() , [](int c) { return ! std::isspace(c); } );
    if ( b == s.end() ) return "";
    return std::string( b , e.base() );
  }

  // drop one enclosing pair of quotes
  inline std::string unquote( const std::string & s , const char q = '"' )
  {
    if ( s.size() == 0 ) return s;
    const int a = s[0] == q ? 1 : 0;
    const int b = s.size() > 1 && s[ s.size() - 1 ] == q ? 1 : 0;
    return s.substr( a , s.size() - a - b );
  }

  // split on any of the delimiter characters; empty fields are dropped
  std::vector<std::string> parse( const std::string & item , const std::string & delims = " \t\n" );

  std::vector<std::string> parse( const std::string & item , const char delim );

  template<typename T>
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;
      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }


  //
  // conversions
  //

  // the whole string must be consumed
  bool str2dbl( const std::string & , double * );
  bool str2int( const std::string & , int * );

  std::string int2str( int n );
  std::string dbl2str( double n );

  // 0/n/N/f/F (or empty) is no, anything else yes
  bool yesno( const std::string & );

  // neither NaN nor +/-inf
  inline bool realnum( double d ) { return std::isfinite( d ); }


  //
  // files
  //

  // leading ~ to $HOME
  std::string expand( const std::string & f );

  bool fileExists( const std::string & );

  bool deleteFile( const std::string & );

  // lines, without \r or \n endings
  std::vector<std::string> file2strvector( const std::string & filename );

}

#endif
