
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


#ifndef __MISCMATH_H__
#define __MISCMATH_H__

#include <vector>
#include <cstddef>
#include <stdint.h>

namespace MiscMath
{

  // smallest power of two >= a
  long int nextpow2( const int a );

  // half-open [a,b) with step s
  std::vector<double> arange( double a , double b , double s );

  // running sum, optionally scaled (rectangle rule)
  std::vector<double> cumsum( const std::vector<double> & x , const double scale = 1.0 );

  // odd-numbered window, edges filled from the first/last full window
  std::vector<double> moving_average( const std::vector<double> & x , int n );

}

#endif
