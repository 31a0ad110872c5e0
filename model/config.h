
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


#ifndef __SGSIM_CONFIG_H__
#define __SGSIM_CONFIG_H__

#include <vector>
#include <string>
#include <map>
#include <stdint.h>

#include "defs/defs.h"
#include "model/grid.h"
#include "model/shapes.h"

//
// One time-varying model quantity: its shape, raw parameters and series
//

struct quantity_record_t
{
  quantity_record_t() : shape( SHAPE_LINEAR ) , func( SHAPE_LINEAR ) , assigned( false ) { }

  // shape for the next assignment
  shape_t shape;

  // shape that produced y
  shape_t func;

  bool assigned;

  // as given (Hz for wu/wl)
  std::vector<double> params;

  std::vector<std::string> names;

  // evaluated over t (rad/s for wu/wl)
  std::vector<double> y;
};


//
// Evolutionary model state: the envelope (mdl) and the upper/lower filter
// frequencies and damping ratios, each from one parametric shape
//

struct model_config_t
{

 public:

  // default shapes
  model_config_t( int npts , double dt );

  model_config_t( int npts , double dt ,
		  shape_t mdl_shape , shape_t wu_shape , shape_t zu_shape ,
		  shape_t wl_shape , shape_t zl_shape );

  const grid_t & grid() const { return _grid; }

  // grid mutations; npts/dt changes re-evaluate all assigned quantities
  void set_npts( int n );
  void set_dt( double dt );
  void set_freq_mask( double lwr , double upr );
  void set_tp( double start , double stop , double step );

  void set_mdl( const std::vector<double> & p ) { set( Q_MDL , p ); }
  void set_wu( const std::vector<double> & p )  { set( Q_WU , p ); }
  void set_zu( const std::vector<double> & p )  { set( Q_ZU , p ); }
  void set_wl( const std::vector<double> & p )  { set( Q_WL , p ); }
  void set_zl( const std::vector<double> & p )  { set( Q_ZL , p ); }

  // evaluate the assigned shape for quantity q
  void set( quantity_t q , const std::vector<double> & p );

  void set( quantity_t q , shape_t s , const std::vector<double> & p );

  // shape used by subsequent set() calls
  void set_shape( quantity_t q , shape_t s );

  shape_t shape( quantity_t q ) const;

  bool assigned( quantity_t q ) const;

  bool all_assigned() const;

  const quantity_record_t & record( quantity_t q ) const;

  // current series (zeros before assignment)
  const std::vector<double> & get( quantity_t q ) const;

  const std::vector<double> & mdl() const { return get( Q_MDL ); }
  const std::vector<double> & wu() const  { return get( Q_WU ); }
  const std::vector<double> & zu() const  { return get( Q_ZU ); }
  const std::vector<double> & wl() const  { return get( Q_WL ); }
  const std::vector<double> & zl() const  { return get( Q_ZL ); }

  // bumped whenever any series changes
  uint64_t revision() const { return _revision; }

  std::string summary() const;

 private:

  shape_result_t evaluate( const grid_t & g , quantity_t qt , shape_t s , const std::vector<double> & p ) const;

  // commits g and the re-evaluated series together
  void regrid( const grid_t & g );

  grid_t _grid;

  std::map<quantity_t,quantity_record_t> q;

  uint64_t _revision;

};

#endif
