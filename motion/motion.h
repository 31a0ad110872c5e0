
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


#ifndef __SGSIM_MOTION_H__
#define __SGSIM_MOTION_H__

#include <string>
#include <vector>
#include <map>

#include <Eigen/Dense>

#include "defs/defs.h"
#include "model/grid.h"
#include "model/stochastic.h"

//
// A set of ground motions (recorded or simulated) sharing one grid; each
// record is a row of the ac/vel/disp matrices. Metrics are cached per
// feature and dropped whenever the records or the grid change
//

struct motion_t
{

 public:

  motion_t( int npts , double dt ,
	    const Eigen::MatrixXd & ac ,
	    const Eigen::MatrixXd & vel ,
	    const Eigen::MatrixXd & disp );

  // simulated motions; takes the model's grid, band and period axis
  static motion_t from_model( const stochastic_model_t & model , const ensemble_t & ens );

  const grid_t & grid() const { return _grid; }

  int npts() const { return _grid.npts(); }

  double dt() const { return _grid.dt(); }

  int size() const { return _ac.rows(); }

  const Eigen::MatrixXd & ac() const { return _ac; }
  const Eigen::MatrixXd & vel() const { return _vel; }
  const Eigen::MatrixXd & disp() const { return _disp; }

  void set_freq_mask( double lwr , double upr );

  void set_tp( double start , double stop , double step );

  // keep the samples whose normalized cumulative energy is in range;
  // 'energy' is the only named option
  void set_range( const std::string & option , const freq_range_t & r );

  // keep the selected samples
  void set_range( const std::vector<bool> & mask );

  // default-range energy mask (0.001..0.999)
  std::vector<bool> energy_mask() const;

  // any dependent feature, n x (axis length)
  const Eigen::MatrixXd & get( feature_t f ) const;

  // independent axes: t, freq (rad/s) or tp
  std::vector<double> axis( feature_t f ) const;

  const Eigen::MatrixXd & fas() const { return get( F_FAS ); }
  const Eigen::MatrixXd & fas_star() const { return get( F_FAS_STAR ); }
  const Eigen::MatrixXd & ce() const { return get( F_CE ); }
  const Eigen::MatrixXd & sa() const { return get( F_SA ); }
  const Eigen::MatrixXd & sv() const { return get( F_SV ); }
  const Eigen::MatrixXd & sd() const { return get( F_SD ); }

  const Eigen::MatrixXd & mle( response_t r ) const;
  const Eigen::MatrixXd & mzc( response_t r ) const;
  const Eigen::MatrixXd & pmnm( response_t r ) const;

  // peak ground acceleration, velocity, displacement (per record)
  Eigen::VectorXd pgp( response_t r ) const;

  // CSV: x_var, then var_1..var_n for each dependent variable
  void save_simulations( const std::string & filename ,
			 const std::string & x_var ,
			 const std::vector<std::string> & y_vars ) const;

 private:

  void reset();

  const Eigen::MatrixXd & response( response_t r ) const;

  void make_spectra() const;

  grid_t _grid;

  Eigen::MatrixXd _ac, _vel, _disp;

  mutable std::map<feature_t,Eigen::MatrixXd> cache;

};

#endif
