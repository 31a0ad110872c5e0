
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


#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <cstdio>
#include <cstdlib>

extern logger_t logger;


void Helper::halt( const std::string & msg )
{

  // library or test mode: the caller decides what happens
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  if ( ! globals::bail_on_fail ) return;

  // no close-out trailer after an error
  logger.off();

  std::cerr << "error : " << msg << "\n";

  std::exit(1);
}


void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}


std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::tolower( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::tolower( s[i] );
  return j;
}

bool Helper::iequals( const std::string & a , const std::string & b )
{
  if ( a.size() != b.size() ) return false;
  for (int i=0;i<a.size();i++)
    if ( std::tolower( a[i] ) != std::tolower( b[i] ) ) return false;
  return true;
}


std::vector<std::string> Helper::parse( const std::string & item , const std::string & delims )
{
  std::vector<std::string> tok;
  std::string cur;
  for (int j=0;j<item.size();j++)
    {
      if ( delims.find( item[j] ) != std::string::npos )
	{
	  if ( cur.size() ) tok.push_back( cur );
	  cur.clear();
	}
      else
	cur += item[j];
    }
  if ( cur.size() ) tok.push_back( cur );
  return tok;
}

std::vector<std::string> Helper::parse( const std::string & item , const char delim )
{
  return parse( item , std::string( 1 , delim ) );
}


bool Helper::str2dbl( const std::string & s , double * d )
{
  std::istringstream iss( s );
  double x = 0;
  if ( ! ( iss >> x ) ) return false;
  iss >> std::ws;
  if ( ! iss.eof() ) return false;
  *d = x;
  return true;
}

bool Helper::str2int( const std::string & s , int * i )
{
  std::istringstream iss( s );
  int x = 0;
  if ( ! ( iss >> x ) ) return false;
  iss >> std::ws;
  if ( ! iss.eof() ) return false;
  *i = x;
  return true;
}

std::string Helper::int2str( int n )
{
  std::ostringstream ss;
  ss << n;
  return ss.str();
}

std::string Helper::dbl2str( double n )
{
  std::ostringstream ss;
  ss << n;
  return ss.str();
}

bool Helper::yesno( const std::string & s )
{
  if ( s.size() == 0 ) return false;
  const char c = s[0];
  return ! ( c == '0' || c == 'n' || c == 'N' || c == 'f' || c == 'F' );
}


std::string Helper::expand( const std::string & f )
{
  if ( f.size() == 0 || f[0] != '~' ) return f;
  const char * home = getenv( "HOME" );
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}

bool Helper::fileExists( const std::string & f )
{
  std::ifstream IN1( f.c_str() );
  return IN1.good();
}

bool Helper::deleteFile( const std::string & f )
{
  if ( ! fileExists( f ) ) return false;
  if ( std::remove( f.c_str() ) != 0 ) Helper::halt( "problem removing file " + f );
  return true;
}

std::vector<std::string> Helper::file2strvector( const std::string & filename )
{
  std::ifstream IN1( filename.c_str() , std::ios::in );
  if ( ! IN1.good() ) Helper::halt( "could not open " + filename );

  std::vector<std::string> d;
  std::string line;
  while ( std::getline( IN1 , line ) )
    {
      // CRLF files
      if ( line.size() && line[ line.size() - 1 ] == '\r' )
	line.erase( line.size() - 1 );
      d.push_back( line );
    }
  return d;
}
