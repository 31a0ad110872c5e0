
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


#include "model/grid.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"

#include <cmath>

extern logger_t logger;


grid_t::grid_t( int npts , double dt )
  : _npts( 0 ) , _dt( 0 ) , _revision( 0 ) , _npts_sim( 0 )
{
  if ( npts < 1 ) Helper::halt( "npts must be a positive integer" );
  if ( ! ( dt > 0 ) ) Helper::halt( "dt must be positive" );

  _npts = npts;
  _dt = dt;

  band = globals::freq_mask_default;
  tp_start = globals::tp_start;
  tp_stop  = globals::tp_stop;
  tp_step  = globals::tp_step;

  invalidate();
}


void grid_t::set_npts( int n )
{
  if ( n < 1 ) Helper::halt( "npts must be a positive integer" );
  _npts = n;
  invalidate();
}

void grid_t::set_dt( double d )
{
  if ( ! ( d > 0 ) ) Helper::halt( "dt must be positive" );
  _dt = d;
  invalidate();
}

void grid_t::invalidate()
{
  dirty_t = dirty_freq = dirty_sim = dirty_mask = dirty_tp = true;
  ++_revision;
}


//
// time axis
//

void grid_t::make_t() const
{
  _t.resize( _npts );
  for (int i=0;i<_npts;i++) _t[i] = i * _dt;
  dirty_t = false;
}

const std::vector<double> & grid_t::t() const
{
  if ( dirty_t ) make_t();
  return _t;
}


//
// analysis frequencies
//

void grid_t::make_freq() const
{

  const int nf = _npts / 2 + 1;
  const double df = 2.0 * M_PI / ( _npts * _dt );

  _freq.resize( nf );
  _freq_p2.resize( nf );
  _freq_p4.resize( nf );
  _freq_n2.resize( nf );
  _freq_n4.resize( nf );

  for (int k=0;k<nf;k++)
    {
      const double w = k * df;
      const double w2 = w * w;
      _freq[k] = w;
      _freq_p2[k] = w2;
      _freq_p4[k] = w2 * w2;
      // zero bin excluded from reciprocals
      _freq_n2[k] = k == 0 ? 0 : 1.0 / w2;
      _freq_n4[k] = k == 0 ? 0 : 1.0 / ( w2 * w2 );
    }

  dirty_freq = false;
}

const std::vector<double> & grid_t::freq() const
{
  if ( dirty_freq ) make_freq();
  return _freq;
}

const std::vector<double> & grid_t::freq_p2() const
{
  if ( dirty_freq ) make_freq();
  return _freq_p2;
}

const std::vector<double> & grid_t::freq_p4() const
{
  if ( dirty_freq ) make_freq();
  return _freq_p4;
}

const std::vector<double> & grid_t::freq_n2() const
{
  if ( dirty_freq ) make_freq();
  return _freq_n2;
}

const std::vector<double> & grid_t::freq_n4() const
{
  if ( dirty_freq ) make_freq();
  return _freq_n4;
}


//
// zero-padded simulation axis
//

void grid_t::make_sim() const
{
  _npts_sim = MiscMath::nextpow2( 2 * _npts );

  const int nf = _npts_sim / 2 + 1;
  const double df = 2.0 * M_PI / ( _npts_sim * _dt );

  _freq_sim.resize( nf );
  _freq_sim_p2.resize( nf );
  for (int k=0;k<nf;k++)
    {
      _freq_sim[k] = k * df;
      _freq_sim_p2[k] = _freq_sim[k] * _freq_sim[k];
    }

  dirty_sim = false;
}

int grid_t::npts_sim() const
{
  if ( dirty_sim ) make_sim();
  return _npts_sim;
}

const std::vector<double> & grid_t::freq_sim() const
{
  if ( dirty_sim ) make_sim();
  return _freq_sim;
}

const std::vector<double> & grid_t::freq_sim_p2() const
{
  if ( dirty_sim ) make_sim();
  return _freq_sim_p2;
}


//
// band mask
//

void grid_t::set_freq_mask( double lwr , double upr )
{
  if ( lwr < 0 || upr < 0 ) Helper::halt( "frequency mask bounds must be non-negative" );
  if ( lwr > upr ) Helper::halt( "frequency mask requires lower <= upper, got " + globals::print( freq_range_t( lwr , upr ) ) );
  band = freq_range_t( lwr , upr );
  dirty_mask = true;
  ++_revision;
}

void grid_t::make_mask() const
{
  const std::vector<double> & w = freq();
  const int nf = w.size();
  _mask.resize( nf );
  for (int k=0;k<nf;k++)
    {
      const double hz = w[k] / ( 2.0 * M_PI );
      _mask[k] = hz >= band.first && hz <= band.second;
    }
  dirty_mask = false;
}

const std::vector<bool> & grid_t::freq_mask() const
{
  if ( dirty_mask || dirty_freq ) make_mask();
  return _mask;
}


//
// period axis
//

void grid_t::set_tp( double start , double stop , double step )
{
  if ( ! ( step > 0 ) ) Helper::halt( "period axis requires a positive step" );
  if ( stop <= start ) Helper::halt( "period axis requires stop > start" );
  tp_start = start;
  tp_stop = stop;
  tp_step = step;
  dirty_tp = true;
  ++_revision;
}

void grid_t::make_tp() const
{
  _tp = MiscMath::arange( tp_start , tp_stop , tp_step );
  dirty_tp = false;
}

const std::vector<double> & grid_t::tp() const
{
  if ( dirty_tp ) make_tp();
  return _tp;
}
