
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


#ifndef __SGSIM_GRID_H__
#define __SGSIM_GRID_H__

#include <vector>
#include <stdint.h>

#include "defs/defs.h"

//
// Time and frequency grid: npts samples at dt seconds; all derived
// axes are cached and rebuilt on first read after npts/dt changes
//

struct grid_t
{

 public:

  grid_t( int npts , double dt );

  int npts() const { return _npts; }

  double dt() const { return _dt; }

  void set_npts( int n );

  void set_dt( double d );

  // bumped on every mutation (npts, dt, mask, tp)
  uint64_t revision() const { return _revision; }

  // t = 0, dt, ... (npts values)
  const std::vector<double> & t() const;

  // angular frequency (rad/s) of the npts-point real DFT (npts/2+1 bins)
  const std::vector<double> & freq() const;

  // w^2, w^4 and w^-2, w^-4 (zero bin set to 0)
  const std::vector<double> & freq_p2() const;
  const std::vector<double> & freq_p4() const;
  const std::vector<double> & freq_n2() const;
  const std::vector<double> & freq_n4() const;

  // simulation axis: smallest power of two >= 2*npts
  int npts_sim() const;

  const std::vector<double> & freq_sim() const;
  const std::vector<double> & freq_sim_p2() const;

  // band selection over freq[], in Hz (inclusive)
  void set_freq_mask( double lwr , double upr );
  const std::vector<bool> & freq_mask() const;
  freq_range_t freq_band() const { return band; }

  // period axis for response spectra (sec), [start,stop) by step
  void set_tp( double start , double stop , double step );
  const std::vector<double> & tp() const;

 private:

  void invalidate();

  void make_t() const;
  void make_freq() const;
  void make_sim() const;
  void make_mask() const;
  void make_tp() const;

  int _npts;

  double _dt;

  uint64_t _revision;

  freq_range_t band;

  double tp_start, tp_stop, tp_step;

  // caches and their dirty flags
  mutable bool dirty_t, dirty_freq, dirty_sim, dirty_mask, dirty_tp;

  mutable std::vector<double> _t;
  mutable std::vector<double> _freq, _freq_p2, _freq_p4, _freq_n2, _freq_n4;
  mutable int _npts_sim;
  mutable std::vector<double> _freq_sim, _freq_sim_p2;
  mutable std::vector<bool> _mask;
  mutable std::vector<double> _tp;

};

#endif
