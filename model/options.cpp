
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


#include "model/options.h"
#include "model/shapes.h"
#include "model/store.h"

#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


bool options::parse_quantity( const std::string & s , shape_t * shape , std::vector<double> * p )
{
  p->clear();

  std::string vals = s;
  bool named = false;

  const std::size_t c = s.find( ":" );
  if ( c != std::string::npos )
    {
      *shape = shapes::lookup( Helper::lrtrim( s.substr( 0 , c ) ) );
      vals = s.substr( c + 1 );
      named = true;
    }

  std::vector<std::string> tok = Helper::parse( vals , ',' );
  for (int i=0;i<tok.size();i++)
    {
      double d = 0;
      if ( ! Helper::str2dbl( Helper::lrtrim( tok[i] ) , &d ) )
	Helper::halt( "could not parse a numeric value from '" + tok[i] + "' in " + s );
      p->push_back( d );
    }

  return named;
}


model_config_t options::build_config( const param_t & param )
{

  model_config_t cfg = param.has( "load" )
    ? model_store_t::load( param.value( "load" ) )
    : model_config_t( param.requires_int( "npts" ) , param.requires_dbl( "dt" ) );

  // explicit options override anything loaded
  if ( param.has( "load" ) )
    {
      if ( param.has( "npts" ) ) cfg.set_npts( param.requires_int( "npts" ) );
      if ( param.has( "dt" ) ) cfg.set_dt( param.requires_dbl( "dt" ) );
    }

  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      const std::string & label = globals::quantity_label[ qt ];
      if ( ! param.has( label ) ) continue;

      shape_t s = cfg.shape( qt );
      std::vector<double> p;
      parse_quantity( param.value( label ) , &s , &p );
      cfg.set( qt , s , p );
    }

  if ( param.has( "band" ) )
    {
      std::vector<double> b = param.dblvector( "band" );
      if ( b.size() != 2 ) Helper::halt( "band requires two values, band=lwr,upr" );
      cfg.set_freq_mask( b[0] , b[1] );
    }

  if ( param.has( "tp" ) )
    {
      std::vector<double> t = param.dblvector( "tp" );
      if ( t.size() != 3 ) Helper::halt( "tp requires three values, tp=start,stop,step" );
      cfg.set_tp( t[0] , t[1] , t[2] );
    }

  return cfg;
}


uint32_t options::seed( const param_t & param )
{
  const int s = param.requires_int( "seed" );
  if ( s < 0 ) Helper::halt( "seed must be non-negative, got " + Helper::int2str( s ) );
  return (uint32_t)s;
}
