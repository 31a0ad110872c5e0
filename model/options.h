
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


#ifndef __SGSIM_OPTIONS_H__
#define __SGSIM_OPTIONS_H__

#include <string>
#include <vector>
#include <stdint.h>

#include "defs/defs.h"
#include "model/config.h"

struct param_t;

//
// Building a model from key=value options
//
//   npts=N dt=X                 grid (unless load=file)
//   mdl=shape:p1,p2,...         (likewise wu, zu, wl, zl; shape optional)
//   band=lwr,upr                analysis band, Hz
//   tp=start,stop,step          period axis, sec
//   load=file.db                parameter file
//   seed=S                      PRNG seed, 0 <= S
//

namespace options
{

  // 'shape:p1,p2,...' or 'p1,p2,...'; returns true if a shape was named
  bool parse_quantity( const std::string & s , shape_t * shape , std::vector<double> * p );

  model_config_t build_config( const param_t & param );

  // seed=S as an unsigned seed; negative values are rejected
  uint32_t seed( const param_t & param );

}

#endif
