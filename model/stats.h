
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


#ifndef __SGSIM_STATS_H__
#define __SGSIM_STATS_H__

#include <vector>
#include <map>
#include <stdint.h>

#include "defs/defs.h"
#include "model/config.h"
#include "model/filter.h"

//
// Statistics of the evolutionary model: spectral moments, the model FAS,
// cumulative energy and cumulative extrema-rate curves. Every cached
// array reads as zeros after any change to the model, until recomputed
//

struct model_stats_t
{

 public:

  model_stats_t( int npts , double dt );

  explicit model_stats_t( const model_config_t & cfg );

  model_config_t & config() { return cfg; }

  const model_config_t & config() const { return cfg; }

  const grid_t & grid() const { return cfg.grid(); }

  // the five spectral moments, together
  void compute_stats();

  void compute_fas();

  void compute_ce();

  // cumulative counts, for ACC, VEL and DISP
  void compute_mle();
  void compute_mzc();
  void compute_pmnm();

  // stats, fas, ce and all rate curves
  void compute_all();

  // true if the variances match the current model
  bool stats_current() const;

  const std::vector<double> & variance() const;
  const std::vector<double> & variance_dot() const;
  const std::vector<double> & variance_2dot() const;
  const std::vector<double> & variance_bar() const;
  const std::vector<double> & variance_2bar() const;

  const std::vector<double> & fas() const;
  const std::vector<double> & ce() const;

  const std::vector<double> & mle( response_t r ) const;
  const std::vector<double> & mzc( response_t r ) const;
  const std::vector<double> & pmnm( response_t r ) const;

  // sqrt(num/den), or 0 if den <= 0 or the ratio is not finite
  static double rate( double num , double den );

 private:

  // zero everything if the model changed since the last reset
  void check() const;

  void reset() const;

  model_config_t cfg;

  mutable uint64_t seen_revision;

  mutable bool has_stats;

  mutable variance_t var;

  mutable std::vector<double> _fas;

  mutable std::vector<double> _ce;

  mutable std::map<response_t,std::vector<double> > _mle, _mzc, _pmnm;

};

#endif
