
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


#include "model/shapes.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <map>

extern logger_t logger;

const double shapes::background_weight = 0.05;

const double shapes::strong_phase_weight = 0.95;


namespace shapes
{

  struct shape_def_t
  {
    shape_def_t() { }
    shape_def_t( const std::string & label , const std::string & pars )
      : label( label ) , names( Helper::parse( pars , ',' ) ) { }
    std::string label;
    std::vector<std::string> names;
  };

  const std::map<shape_t,shape_def_t> & table()
  {
    static std::map<shape_t,shape_def_t> defs;
    if ( defs.size() == 0 )
      {
	defs[ SHAPE_CONSTANT ]    = shape_def_t( "constant"    , "pc" );
	defs[ SHAPE_LINEAR ]      = shape_def_t( "linear"      , "pf,pl" );
	defs[ SHAPE_BILINEAR ]    = shape_def_t( "bilinear"    , "pf,pm,pl,tmax" );
	defs[ SHAPE_EXPONENTIAL ] = shape_def_t( "exponential" , "pf,pl" );
	defs[ SHAPE_BETA_BASIC ]  = shape_def_t( "beta_basic"  , "p1,c1,Et,tn" );
	defs[ SHAPE_BETA_SINGLE ] = shape_def_t( "beta_single" , "p1,c1,Et,tn" );
	defs[ SHAPE_BETA_DUAL ]   = shape_def_t( "beta_dual"   , "p1,c1,p2,c2,a1,Et,tn" );
	defs[ SHAPE_GAMMA ]       = shape_def_t( "gamma"       , "p0,p1,p2" );
	defs[ SHAPE_HOUSNER ]     = shape_def_t( "housner"     , "p0,p1,p2,t1,t2" );
      }
    return defs;
  }

  const shape_def_t & def( shape_t s )
  {
    std::map<shape_t,shape_def_t>::const_iterator ii = table().find( s );
    if ( ii == table().end() ) Helper::halt( "internal error: unregistered shape" );
    return ii->second;
  }

  double last( const std::vector<double> & t )
  {
    if ( t.size() == 0 ) Helper::halt( "empty time axis" );
    return t[ t.size() - 1 ];
  }

  // quadratic background density, 6 t (tn-t) / tn^3
  double background( double t , double tn )
  {
    return 6.0 * t * ( tn - t ) / ( tn * tn * tn );
  }

  void check_beta( double p , double c , double tn )
  {
    if ( ! ( tn > 0 ) ) Helper::halt( "beta shape requires tn > 0" );
    if ( ! ( c > 0 ) ) Helper::halt( "beta shape requires c > 0" );
    if ( p < 0 || p > 1 ) Helper::halt( "beta shape requires 0 <= p <= 1" );
  }

}


std::string shapes::name( shape_t s )
{
  return def( s ).label;
}

std::vector<std::string> shapes::param_names( shape_t s )
{
  return def( s ).names;
}

int shapes::n_params( shape_t s )
{
  return def( s ).names.size();
}

bool shapes::known( const std::string & n )
{
  std::map<shape_t,shape_def_t>::const_iterator ii = table().begin();
  while ( ii != table().end() )
    {
      if ( Helper::iequals( ii->second.label , n ) ) return true;
      ++ii;
    }
  return false;
}

shape_t shapes::lookup( const std::string & n )
{
  std::map<shape_t,shape_def_t>::const_iterator ii = table().begin();
  while ( ii != table().end() )
    {
      if ( Helper::iequals( ii->second.label , n ) ) return ii->first;
      ++ii;
    }
  Helper::halt( "unsupported shape function: " + n );
  return SHAPE_CONSTANT;
}


shape_result_t shapes::evaluate( shape_t s , const std::vector<double> & t , const std::vector<double> & p )
{

  const shape_def_t & d = def( s );

  if ( p.size() != d.names.size() )
    Helper::halt( d.label + " expects " + Helper::int2str( (int)d.names.size() )
		  + " parameters (" + Helper::stringize( d.names ) + "), got "
		  + Helper::int2str( (int)p.size() ) );

  shape_result_t r;
  r.params = p;
  r.names = d.names;

  switch ( s )
    {
    case SHAPE_CONSTANT :    r.y = constant( t , p[0] ); break;
    case SHAPE_LINEAR :      r.y = linear( t , p[0] , p[1] ); break;
    case SHAPE_BILINEAR :    r.y = bilinear( t , p[0] , p[1] , p[2] , p[3] ); break;
    case SHAPE_EXPONENTIAL : r.y = exponential( t , p[0] , p[1] ); break;
    case SHAPE_BETA_BASIC :  r.y = beta_basic( t , p[0] , p[1] , p[2] , p[3] ); break;
    case SHAPE_BETA_SINGLE : r.y = beta_single( t , p[0] , p[1] , p[2] , p[3] ); break;
    case SHAPE_BETA_DUAL :   r.y = beta_dual( t , p[0] , p[1] , p[2] , p[3] , p[4] , p[5] , p[6] ); break;
    case SHAPE_GAMMA :       r.y = gamma( t , p[0] , p[1] , p[2] ); break;
    case SHAPE_HOUSNER :     r.y = housner( t , p[0] , p[1] , p[2] , p[3] , p[4] ); break;
    }

  return r;
}


std::vector<double> shapes::constant( const std::vector<double> & t , double pc )
{
  return std::vector<double>( t.size() , pc );
}


std::vector<double> shapes::linear( const std::vector<double> & t , double pf , double pl )
{
  const double tl = last( t );
  const int n = t.size();
  std::vector<double> y( n , pf );
  if ( tl == 0 ) return y;
  for (int i=0;i<n;i++)
    y[i] = pf - ( pf - pl ) * ( t[i] / tl );
  return y;
}


std::vector<double> shapes::bilinear( const std::vector<double> & t , double pf , double pm , double pl , double tmax )
{
  const double tl = last( t );
  if ( ! ( tmax > 0 && tmax < tl ) )
    Helper::halt( "bilinear requires 0 < tmax < " + Helper::dbl2str( tl ) );

  const int n = t.size();
  std::vector<double> y( n );
  for (int i=0;i<n;i++)
    {
      if ( t[i] <= tmax )
	y[i] = pf - ( pf - pm ) * t[i] / tmax;
      else
	y[i] = pm - ( pm - pl ) * ( t[i] - tmax ) / ( tl - tmax );
    }
  return y;
}


std::vector<double> shapes::exponential( const std::vector<double> & t , double pf , double pl )
{
  if ( ! ( pf > 0 && pl > 0 ) )
    Helper::halt( "exponential requires positive first and last values" );

  const double tl = last( t );
  const int n = t.size();
  std::vector<double> y( n , pf );
  if ( tl == 0 ) return y;
  const double r = log( pl / pf );
  for (int i=0;i<n;i++)
    y[i] = pf * exp( r * ( t[i] / tl ) );
  return y;
}


double shapes::beta_density( double t , double p , double c , double tn )
{
  const double a = 1 + c * p;
  const double b = 1 + c * ( 1 - p );
  const double lbeta = std::lgamma( a ) + std::lgamma( b ) - std::lgamma( a + b );
  return exp( ( c * p ) * log( t )
	      + ( c * ( 1 - p ) ) * log( tn - t )
	      - lbeta
	      - ( 1 + c ) * log( tn ) );
}


std::vector<double> shapes::beta_basic( const std::vector<double> & t , double p1 , double c1 , double Et , double tn )
{
  check_beta( p1 , c1 , tn );
  if ( Et < 0 ) Helper::halt( "beta_basic requires Et >= 0" );

  const double a = 1 + c1 * p1;
  const double b = 1 + c1 * ( 1 - p1 );
  const double beta = exp( std::lgamma( a ) + std::lgamma( b ) - std::lgamma( a + b ) );

  const int n = t.size();
  std::vector<double> y( n , 0 );
  for (int i=0;i<n;i++)
    {
      if ( t[i] < 0 || t[i] > tn ) continue;
      const double d = pow( t[i] , c1 * p1 ) * pow( tn - t[i] , c1 * ( 1 - p1 ) )
	/ ( beta * pow( tn , 1 + c1 ) );
      y[i] = sqrt( Et * d );
    }
  return y;
}


std::vector<double> shapes::beta_single( const std::vector<double> & t , double p1 , double c1 , double Et , double tn )
{
  check_beta( p1 , c1 , tn );
  if ( Et < 0 ) Helper::halt( "beta_single requires Et >= 0" );

  // endpoints, and anything past tn, stay exactly zero
  const int n = t.size();
  std::vector<double> y( n , 0 );
  for (int i=0;i<n;i++)
    {
      if ( ! ( t[i] > 0 && t[i] < tn ) ) continue;
      const double e = background_weight * background( t[i] , tn )
	+ strong_phase_weight * beta_density( t[i] , p1 , c1 , tn );
      y[i] = sqrt( Et * e );
    }
  return y;
}


std::vector<double> shapes::beta_dual( const std::vector<double> & t ,
				       double p1 , double c1 , double p2 , double c2 , double a1 ,
				       double Et , double tn )
{
  check_beta( p1 , c1 , tn );
  check_beta( p2 , c2 , tn );
  if ( Et < 0 ) Helper::halt( "beta_dual requires Et >= 0" );
  if ( a1 < 0 || a1 > strong_phase_weight )
    Helper::halt( "beta_dual requires 0 <= a1 <= " + Helper::dbl2str( strong_phase_weight ) );

  const double a2 = strong_phase_weight - a1;

  const int n = t.size();
  std::vector<double> y( n , 0 );
  for (int i=0;i<n;i++)
    {
      if ( ! ( t[i] > 0 && t[i] < tn ) ) continue;
      const double e = background_weight * background( t[i] , tn )
	+ a1 * beta_density( t[i] , p1 , c1 , tn )
	+ a2 * beta_density( t[i] , p2 , c2 , tn );
      y[i] = sqrt( Et * e );
    }
  return y;
}


std::vector<double> shapes::gamma( const std::vector<double> & t , double p0 , double p1 , double p2 )
{
  if ( p1 < 0 ) Helper::halt( "gamma requires p1 >= 0" );
  const int n = t.size();
  std::vector<double> y( n );
  for (int i=0;i<n;i++)
    y[i] = p0 * pow( t[i] , p1 ) * exp( -p2 * t[i] );
  return y;
}


std::vector<double> shapes::housner( const std::vector<double> & t , double p0 , double p1 , double p2 , double t1 , double t2 )
{
  if ( ! ( t1 > 0 && t1 <= t2 ) ) Helper::halt( "housner requires 0 < t1 <= t2" );

  const int n = t.size();
  std::vector<double> y( n , 0 );
  for (int i=0;i<n;i++)
    {
      const double & x = t[i];
      if ( x < 0 ) continue;
      if ( x < t1 )
	y[i] = p0 * ( x / t1 ) * ( x / t1 );
      else if ( x <= t2 )
	y[i] = p0;
      else
	y[i] = p0 * exp( -p1 * pow( x - t2 , p2 ) );
    }
  return y;
}
