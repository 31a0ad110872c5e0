
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


#ifndef __SGSIM_SHAPES_H__
#define __SGSIM_SHAPES_H__

#include <vector>
#include <string>

#include "defs/defs.h"

//
// Parametric time-shaping functions: (t, params) -> series
//

struct shape_result_t
{
  std::vector<double> y;
  std::vector<double> params;
  std::vector<std::string> names;
};

namespace shapes
{

  // weights of the beta-family envelopes
  extern const double background_weight;   // quadratic background density
  extern const double strong_phase_weight; // beta densities

  // dispatch on tag; halts on a wrong parameter count
  shape_result_t evaluate( shape_t s , const std::vector<double> & t , const std::vector<double> & p );

  // case-insensitive; halts on an unknown name
  shape_t lookup( const std::string & name );

  bool known( const std::string & name );

  std::string name( shape_t s );

  std::vector<std::string> param_names( shape_t s );

  int n_params( shape_t s );

  // individual shapes

  std::vector<double> constant( const std::vector<double> & t , double pc );

  std::vector<double> linear( const std::vector<double> & t , double pf , double pl );

  std::vector<double> bilinear( const std::vector<double> & t , double pf , double pm , double pl , double tmax );

  std::vector<double> exponential( const std::vector<double> & t , double pf , double pl );

  std::vector<double> beta_basic( const std::vector<double> & t , double p1 , double c1 , double Et , double tn );

  std::vector<double> beta_single( const std::vector<double> & t , double p1 , double c1 , double Et , double tn );

  std::vector<double> beta_dual( const std::vector<double> & t ,
				 double p1 , double c1 , double p2 , double c2 , double a1 ,
				 double Et , double tn );

  std::vector<double> gamma( const std::vector<double> & t , double p0 , double p1 , double p2 );

  std::vector<double> housner( const std::vector<double> & t , double p0 , double p1 , double p2 , double t1 , double t2 );

  // normalized beta density on (0,tn), log form; only valid for 0 < t < tn
  double beta_density( double t , double p , double c , double tn );

}

#endif
