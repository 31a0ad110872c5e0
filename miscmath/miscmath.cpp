
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


#include "miscmath/miscmath.h"

#include "helper/helper.h"

#include <cmath>


long int MiscMath::nextpow2( const int a )
{
  long int t = 1;
  while ( t < a )
    {
      t <<= 1;
      if ( t > ( 1L << 31 ) ) Helper::halt( "nextpow2(): " + Helper::int2str( a ) + " is too large" );
    }
  return t;
}


//
// arange: a, a+s, ... < b
//

std::vector<double> MiscMath::arange( double a , double b , double s )
{
  if ( s <= 0 ) Helper::halt( "arange requires a positive step" );
  if ( b <= a ) Helper::halt( "arange requires stop > start" );

  const int n = (int)std::ceil( ( b - a ) / s );
  std::vector<double> r( n );
  for (int i=0;i<n;i++) r[i] = a + i * s;
  return r;
}


std::vector<double> MiscMath::cumsum( const std::vector<double> & x , const double scale )
{
  const int n = x.size();
  std::vector<double> r( n );
  double s = 0;
  for (int i=0;i<n;i++)
    {
      s += x[i];
      r[i] = s * scale;
    }
  return r;
}


std::vector<double> MiscMath::moving_average( const std::vector<double> & x , int w )
{

  const int n = x.size();

  if ( w < 1 || w % 2 == 0 ) Helper::halt( "moving_average() requires an odd window" );

  if ( n == 0 ) return x;

  // shrink to the largest odd window that fits
  if ( w > n )
    {
      Helper::warn( "moving_average(): window " + Helper::int2str( w )
		    + " exceeds " + Helper::int2str( n ) + " points" );
      w = n % 2 == 0 ? n - 1 : n;
    }

  if ( w <= 1 ) return x;

  const int h = w / 2;

  std::vector<double> r( n );

  double run = 0;
  for (int i=0;i<w;i++) run += x[i];

  // centred windows, sliding one sample at a time
  for (int i=h; i<n-h; i++)
    {
      r[i] = run / (double)w;
      if ( i + h + 1 < n ) run += x[i+h+1] - x[i-h];
    }

  // edges take the nearest full window
  for (int i=0;i<h;i++) r[i] = r[h];
  for (int i=n-h;i<n;i++) r[i] = r[n-h-1];

  return r;

}
