
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


#ifndef __SGSIM_H__
#define __SGSIM_H__

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"
#include "fftw/fftwrap.h"
#include "db/sqlwrap.h"

#include "model/grid.h"
#include "model/shapes.h"
#include "model/config.h"
#include "model/filter.h"
#include "model/stats.h"
#include "model/stochastic.h"
#include "model/store.h"
#include "model/options.h"

#include "motion/signal.h"
#include "motion/motion.h"

#endif
