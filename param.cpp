
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


#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

extern logger_t logger;

// value stored for a bare flag
static const std::string flag_value = "__null__";


void param_t::add( const std::string & option , const std::string & value )
{
  if ( option == "" ) return;

  if ( option[ option.size() - 1 ] == '+' )
    {
      const std::string k = option.substr( 0 , option.size() - 1 );
      if ( k == "" ) return;
      std::map<std::string,std::string>::iterator ii = opt.find( k );
      if ( ii == opt.end() ) opt[ k ] = value;
      else ii->second += "," + value;
      return;
    }

  if ( has( option ) )
    Helper::halt( option + " specified twice (use " + option + "+= to append)" );

  opt[ option ] = value;
}


void param_t::parse( const std::string & s )
{
  const std::string t = Helper::lrtrim( s );
  if ( t == "" ) return;

  // split on the first '='; the value may itself contain '='
  const std::size_t eq = t.find( "=" );
  if ( eq == std::string::npos )
    add( t , flag_value );
  else
    add( Helper::lrtrim( t.substr( 0 , eq ) ) , Helper::lrtrim( t.substr( eq + 1 ) ) );
}


void param_t::include( const std::string & filename )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not open parameter file " + f );

  std::vector<std::string> lines = Helper::file2strvector( f );

  int cnt = 0;

  for (int l=0; l<lines.size(); l++)
    {
      std::string line = lines[l];

      const std::size_t c = line.find( "%" );
      if ( c != std::string::npos ) line = line.substr( 0 , c );

      line = Helper::lrtrim( line );
      if ( line == "" ) continue;

      if ( line.find( "=" ) == std::string::npos )
	{
	  std::vector<std::string> tok = Helper::parse( line , " \t" );
	  if ( tok.size() == 2 ) line = tok[0] + "=" + tok[1];
	}

      parse( line );
      ++cnt;
    }

  logger << "  read " << cnt << " option(s) from " << f << "\n";

}


bool param_t::empty( const std::string & k ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.find( k );
  return ii == opt.end() || ii->second == flag_value;
}

bool param_t::yesno( const std::string & k ) const
{
  if ( ! has( k ) ) return false;
  if ( empty( k ) ) return true;
  return Helper::yesno( opt.find( k )->second );
}

std::string param_t::value( const std::string & k , const bool uppercase ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.find( k );
  if ( ii == opt.end() || ii->second == flag_value ) return "";
  const std::string v = Helper::unquote( ii->second );
  return uppercase ? Helper::toupper( v ) : v;
}


void param_t::missing( const std::string & k ) const
{
  if ( ! has( k ) ) Helper::halt( "requires option " + k );
}

std::string param_t::requires( const std::string & k , const bool uppercase ) const
{
  missing( k );
  return value( k , uppercase );
}

int param_t::requires_int( const std::string & k ) const
{
  missing( k );
  int r = 0;
  if ( ! Helper::str2int( value( k ) , &r ) )
    Helper::halt( "option " + k + " requires an integer value, got '" + value( k ) + "'" );
  return r;
}

double param_t::requires_dbl( const std::string & k ) const
{
  missing( k );
  double r = 0;
  if ( ! Helper::str2dbl( value( k ) , &r ) )
    Helper::halt( "option " + k + " requires a numeric value, got '" + value( k ) + "'" );
  return r;
}


std::vector<std::string> param_t::tokens( const std::string & k , const std::string & delim ) const
{
  std::vector<std::string> tok = Helper::parse( value( k ) , delim );
  for (int i=0;i<tok.size();i++) tok[i] = Helper::unquote( Helper::lrtrim( tok[i] ) );
  return tok;
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string & delim ) const
{
  return tokens( k , delim );
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string & delim ) const
{
  std::vector<std::string> tok = tokens( k , delim );
  std::vector<double> r( tok.size() );
  for (int i=0;i<tok.size();i++)
    if ( ! Helper::str2dbl( tok[i] , &r[i] ) )
      Helper::halt( "option " + k + " requires numeric value(s), got '" + tok[i] + "'" );
  return r;
}


std::set<std::string> param_t::keys() const
{
  std::set<std::string> s;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      s.insert( ii->first );
      ++ii;
    }
  return s;
}
