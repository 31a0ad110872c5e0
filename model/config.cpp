
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


#include "model/config.h"
#include "model/shapes.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>
#include <sstream>

extern logger_t logger;


model_config_t::model_config_t( int npts , double dt )
  : _grid( npts , dt ) , _revision( 0 )
{
  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      q[ qt ].shape = globals::default_shape[ qt ];
      q[ qt ].y.assign( npts , 0 );
    }
}


model_config_t::model_config_t( int npts , double dt ,
				shape_t mdl_shape , shape_t wu_shape , shape_t zu_shape ,
				shape_t wl_shape , shape_t zl_shape )
  : _grid( npts , dt ) , _revision( 0 )
{
  q[ Q_MDL ].shape = mdl_shape;
  q[ Q_WU ].shape  = wu_shape;
  q[ Q_ZU ].shape  = zu_shape;
  q[ Q_WL ].shape  = wl_shape;
  q[ Q_ZL ].shape  = zl_shape;

  for (int i=0;i<5;i++)
    q[ (quantity_t)i ].y.assign( npts , 0 );
}


void model_config_t::set_npts( int n )
{
  grid_t g( _grid );
  g.set_npts( n );
  regrid( g );
}

void model_config_t::set_dt( double dt )
{
  grid_t g( _grid );
  g.set_dt( dt );
  regrid( g );
}

void model_config_t::set_freq_mask( double lwr , double upr )
{
  _grid.set_freq_mask( lwr , upr );
}

void model_config_t::set_tp( double start , double stop , double step )
{
  _grid.set_tp( start , stop , step );
}


void model_config_t::regrid( const grid_t & g )
{
  // every quantity is evaluated over the new axis before anything is
  // committed; a shape that fails there leaves grid and series as they were
  std::vector<std::vector<double> > y( 5 );
  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      if ( q[ qt ].assigned )
	y[i] = evaluate( g , qt , q[ qt ].func , q[ qt ].params ).y;
      else
	y[i].assign( g.npts() , 0 );
    }

  _grid = g;
  for (int i=0;i<5;i++) q[ (quantity_t)i ].y.swap( y[i] );
  ++_revision;
}


void model_config_t::set( quantity_t qt , const std::vector<double> & p )
{
  // a rejected parameter set leaves the record untouched
  shape_result_t res = evaluate( _grid , qt , q[ qt ].shape , p );

  quantity_record_t & r = q[ qt ];
  r.func = r.shape;
  r.params = res.params;
  r.names = res.names;
  r.y = res.y;
  r.assigned = true;
  ++_revision;
}

void model_config_t::set( quantity_t qt , shape_t s , const std::vector<double> & p )
{
  shape_result_t res = evaluate( _grid , qt , s , p );

  quantity_record_t & r = q[ qt ];
  r.shape = r.func = s;
  r.params = res.params;
  r.names = res.names;
  r.y = res.y;
  r.assigned = true;
  ++_revision;
}


shape_result_t model_config_t::evaluate( const grid_t & g , quantity_t qt , shape_t s , const std::vector<double> & p ) const
{
  shape_result_t res = shapes::evaluate( s , g.t() , p );

  // frequencies given in Hz, held in rad/s
  if ( qt == Q_WU || qt == Q_WL )
    for (int i=0;i<res.y.size();i++) res.y[i] *= 2.0 * M_PI;

  return res;
}


void model_config_t::set_shape( quantity_t qt , shape_t s )
{
  q[ qt ].shape = s;
}

shape_t model_config_t::shape( quantity_t qt ) const
{
  return record( qt ).shape;
}

bool model_config_t::assigned( quantity_t qt ) const
{
  return record( qt ).assigned;
}

bool model_config_t::all_assigned() const
{
  for (int i=0;i<5;i++)
    if ( ! assigned( (quantity_t)i ) ) return false;
  return true;
}

const quantity_record_t & model_config_t::record( quantity_t qt ) const
{
  std::map<quantity_t,quantity_record_t>::const_iterator ii = q.find( qt );
  if ( ii == q.end() ) Helper::halt( "internal error: unknown model quantity" );
  return ii->second;
}

const std::vector<double> & model_config_t::get( quantity_t qt ) const
{
  return record( qt ).y;
}


std::string model_config_t::summary() const
{
  std::stringstream ss;
  ss << "  npts=" << _grid.npts() << " dt=" << _grid.dt() << "\n";
  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      const quantity_record_t & r = record( qt );
      if ( r.assigned )
	{
	  ss << "  " << globals::quantity_label[ qt ] << " : " << shapes::name( r.func );
	  ss << " (";
	  for (int j=0;j<r.params.size();j++)
	    ss << ( j ? ", " : "" ) << r.names[j] << "=" << r.params[j];
	  ss << ")";
	}
      else
	ss << "  " << globals::quantity_label[ qt ] << " : " << shapes::name( r.shape ) << " (unassigned)";
      ss << "\n";
    }
  return ss.str();
}
