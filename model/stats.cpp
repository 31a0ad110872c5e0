
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


#include "model/stats.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"

#include <cmath>

extern logger_t logger;


model_stats_t::model_stats_t( int npts , double dt )
  : cfg( npts , dt )
{
  reset();
}

model_stats_t::model_stats_t( const model_config_t & c )
  : cfg( c )
{
  reset();
}


void model_stats_t::reset() const
{
  const int n = cfg.grid().npts();
  const int nf = cfg.grid().freq().size();

  var = variance_t( n );
  has_stats = false;

  _fas.assign( nf , 0 );
  _ce.assign( n , 0 );

  for (int r=0;r<3;r++)
    {
      _mle[ (response_t)r ].assign( n , 0 );
      _mzc[ (response_t)r ].assign( n , 0 );
      _pmnm[ (response_t)r ].assign( n , 0 );
    }

  seen_revision = cfg.revision();
}


void model_stats_t::check() const
{
  if ( seen_revision != cfg.revision() ) reset();
}


bool model_stats_t::stats_current() const
{
  check();
  return has_stats;
}


double model_stats_t::rate( double num , double den )
{
  if ( ! ( den > 0 ) ) return 0;
  const double r = num / den;
  if ( ! Helper::realnum( r ) || r < 0 ) return 0;
  return sqrt( r );
}


//
// spectral moments
//

void model_stats_t::compute_stats()
{
  check();
  var = filter::compute_stats( cfg.wu() , cfg.zu() , cfg.wl() , cfg.zl() , cfg.grid().freq() );
  has_stats = true;
}


void model_stats_t::compute_fas()
{
  check();
  _fas = filter::compute_fas( cfg.mdl() , cfg.wu() , cfg.zu() , cfg.wl() , cfg.zl() ,
			      cfg.grid().freq() , cfg.grid().dt() );
}


void model_stats_t::compute_ce()
{
  check();
  const std::vector<double> & mdl = cfg.mdl();
  std::vector<double> e2( mdl.size() );
  for (int i=0;i<mdl.size();i++) e2[i] = mdl[i] * mdl[i];
  _ce = MiscMath::cumsum( e2 , cfg.grid().dt() );
}


//
// extrema-rate curves; per response, the moment ratios are
//
//   local extrema : ACC v2dot/vdot , VEL vdot/v    , DISP v/vbar
//   zero crossing : ACC vdot/v     , VEL v/vbar    , DISP vbar/v2bar
//

void model_stats_t::compute_mle()
{
  if ( ! stats_current() ) compute_stats();

  const int n = cfg.grid().npts();
  const double dt = cfg.grid().dt();

  std::vector<double> ra( n ) , rv( n ) , rd( n );
  for (int i=0;i<n;i++)
    {
      ra[i] = rate( var.variance_2dot[i] , var.variance_dot[i] ) / ( 2.0 * M_PI );
      rv[i] = rate( var.variance_dot[i] , var.variance[i] ) / ( 2.0 * M_PI );
      rd[i] = rate( var.variance[i] , var.variance_bar[i] ) / ( 2.0 * M_PI );
    }

  _mle[ ACC ]  = MiscMath::cumsum( ra , dt );
  _mle[ VEL ]  = MiscMath::cumsum( rv , dt );
  _mle[ DISP ] = MiscMath::cumsum( rd , dt );
}


void model_stats_t::compute_mzc()
{
  if ( ! stats_current() ) compute_stats();

  const int n = cfg.grid().npts();
  const double dt = cfg.grid().dt();

  std::vector<double> ra( n ) , rv( n ) , rd( n );
  for (int i=0;i<n;i++)
    {
      ra[i] = rate( var.variance_dot[i] , var.variance[i] ) / ( 2.0 * M_PI );
      rv[i] = rate( var.variance[i] , var.variance_bar[i] ) / ( 2.0 * M_PI );
      rd[i] = rate( var.variance_bar[i] , var.variance_2bar[i] ) / ( 2.0 * M_PI );
    }

  _mzc[ ACC ]  = MiscMath::cumsum( ra , dt );
  _mzc[ VEL ]  = MiscMath::cumsum( rv , dt );
  _mzc[ DISP ] = MiscMath::cumsum( rd , dt );
}


void model_stats_t::compute_pmnm()
{
  if ( ! stats_current() ) compute_stats();

  const int n = cfg.grid().npts();
  const double dt = cfg.grid().dt();

  // (sqrt(extrema ratio) - sqrt(crossing ratio)) / 4pi, not clamped
  std::vector<double> ra( n ) , rv( n ) , rd( n );
  for (int i=0;i<n;i++)
    {
      ra[i] = ( rate( var.variance_2dot[i] , var.variance_dot[i] )
		- rate( var.variance_dot[i] , var.variance[i] ) ) / ( 4.0 * M_PI );
      rv[i] = ( rate( var.variance_dot[i] , var.variance[i] )
		- rate( var.variance[i] , var.variance_bar[i] ) ) / ( 4.0 * M_PI );
      rd[i] = ( rate( var.variance[i] , var.variance_bar[i] )
		- rate( var.variance_bar[i] , var.variance_2bar[i] ) ) / ( 4.0 * M_PI );
    }

  _pmnm[ ACC ]  = MiscMath::cumsum( ra , dt );
  _pmnm[ VEL ]  = MiscMath::cumsum( rv , dt );
  _pmnm[ DISP ] = MiscMath::cumsum( rd , dt );
}


void model_stats_t::compute_all()
{
  compute_stats();
  compute_fas();
  compute_ce();
  compute_mle();
  compute_mzc();
  compute_pmnm();
}


//
// accessors
//

const std::vector<double> & model_stats_t::variance() const      { check(); return var.variance; }
const std::vector<double> & model_stats_t::variance_dot() const  { check(); return var.variance_dot; }
const std::vector<double> & model_stats_t::variance_2dot() const { check(); return var.variance_2dot; }
const std::vector<double> & model_stats_t::variance_bar() const  { check(); return var.variance_bar; }
const std::vector<double> & model_stats_t::variance_2bar() const { check(); return var.variance_2bar; }

const std::vector<double> & model_stats_t::fas() const { check(); return _fas; }
const std::vector<double> & model_stats_t::ce() const  { check(); return _ce; }

const std::vector<double> & model_stats_t::mle( response_t r ) const
{
  check();
  return _mle[ r ];
}

const std::vector<double> & model_stats_t::mzc( response_t r ) const
{
  check();
  return _mzc[ r ];
}

const std::vector<double> & model_stats_t::pmnm( response_t r ) const
{
  check();
  return _pmnm[ r ];
}
