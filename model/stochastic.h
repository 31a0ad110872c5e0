
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


#ifndef __SGSIM_STOCHASTIC_H__
#define __SGSIM_STOCHASTIC_H__

#include <random>
#include <stdint.h>

#include <Eigen/Dense>

#include "defs/defs.h"
#include "model/stats.h"

// n x npts realizations (one per row)
struct ensemble_t
{
  Eigen::MatrixXd ac;
  Eigen::MatrixXd vel;
  Eigen::MatrixXd disp;

  int size() const { return ac.rows(); }

  const Eigen::MatrixXd & get( response_t r ) const
  {
    return r == ACC ? ac : r == VEL ? vel : disp;
  }
};


//
// Monte Carlo synthesis from the evolutionary model
//

struct stochastic_model_t
{

 public:

  stochastic_model_t( int npts , double dt );

  stochastic_model_t( int npts , double dt ,
		      shape_t mdl_shape , shape_t wu_shape , shape_t zu_shape ,
		      shape_t wl_shape , shape_t zl_shape );

  explicit stochastic_model_t( const model_config_t & cfg );

  model_stats_t & stats() { return _stats; }
  const model_stats_t & stats() const { return _stats; }

  model_config_t & config() { return _stats.config(); }
  const model_config_t & config() const { return _stats.config(); }

  const grid_t & grid() const { return _stats.grid(); }

  // replaces the random stream
  void set_seed( uint32_t s );

  bool has_seed() const { return seeded; }

  uint32_t seed() const { return _seed; }

  ensemble_t simulate( int n );

 private:

  model_stats_t _stats;

  std::mt19937 rng;

  bool seeded;

  uint32_t _seed;

};

#endif
