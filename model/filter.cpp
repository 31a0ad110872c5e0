
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


#include "model/filter.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


namespace filter
{
  void check_lengths( const int n ,
		      const std::vector<double> & a ,
		      const std::vector<double> & b ,
		      const std::vector<double> & c ,
		      const std::vector<double> & d )
  {
    if ( a.size() != n || b.size() != n || c.size() != n || d.size() != n )
      Helper::halt( "filter quantities must all have the same length" );
  }
}


double filter::psd( double w2 , double wu , double zu , double wl , double zl )
{
  const double w4 = w2 * w2;

  const double wl2 = wl * wl;
  const double dl = wl2 * wl2 + w4 + 2.0 * wl2 * w2 * ( 2.0 * zl * zl - 1.0 );
  if ( ! ( dl > 0 ) ) return 0;

  const double wu2 = wu * wu;
  const double du = wu2 * wu2 + w4 + 2.0 * wu2 * w2 * ( 2.0 * zu * zu - 1.0 );
  if ( ! ( du > 0 ) ) return 0;

  return w4 / ( dl * du );
}


dcomp filter::frf( double w , double wu , double zu , double wl , double zl )
{
  const double w2 = w * w;
  const dcomp hl( wl * wl - w2 , 2.0 * zl * wl * w );
  const dcomp hu( wu * wu - w2 , 2.0 * zu * wu * w );
  const dcomp d = hl * hu;
  if ( std::norm( d ) == 0 ) return dcomp( 0 , 0 );
  return -w2 / d;
}


variance_t filter::compute_stats( const std::vector<double> & wu ,
				  const std::vector<double> & zu ,
				  const std::vector<double> & wl ,
				  const std::vector<double> & zl ,
				  const std::vector<double> & freq )
{

  const int n = wu.size();
  check_lengths( n , wu , zu , wl , zl );

  const int nf = freq.size();

  std::vector<double> w2( nf ) , w4( nf ) , wn2( nf ) , wn4( nf );
  for (int k=0;k<nf;k++)
    {
      w2[k] = freq[k] * freq[k];
      w4[k] = w2[k] * w2[k];
      wn2[k] = w2[k] > 0 ? 1.0 / w2[k] : 0 ;
      wn4[k] = w2[k] > 0 ? 1.0 / w4[k] : 0 ;
    }

  variance_t v( n );

  for (int i=0;i<n;i++)
    {
      double s0 = 0 , s1 = 0 , s2 = 0 , sb = 0 , s2b = 0;
      for (int k=0;k<nf;k++)
	{
	  const double p = psd( w2[k] , wu[i] , zu[i] , wl[i] , zl[i] );
	  s0  += p;
	  s1  += w2[k] * p;
	  s2  += w4[k] * p;
	  sb  += wn2[k] * p;
	  s2b += wn4[k] * p;
	}
      v.variance[i]      = s0;
      v.variance_dot[i]  = s1;
      v.variance_2dot[i] = s2;
      v.variance_bar[i]  = sb;
      v.variance_2bar[i] = s2b;
    }

  return v;
}


std::vector<double> filter::compute_fas( const std::vector<double> & mdl ,
					 const std::vector<double> & wu ,
					 const std::vector<double> & zu ,
					 const std::vector<double> & wl ,
					 const std::vector<double> & zl ,
					 const std::vector<double> & freq ,
					 double dt )
{

  const int n = mdl.size();
  check_lengths( n , wu , zu , wl , zl );

  const int nf = freq.size();

  std::vector<double> w2( nf );
  for (int k=0;k<nf;k++) w2[k] = freq[k] * freq[k];

  std::vector<double> acc( nf , 0 );

  for (int i=0;i<n;i++)
    {
      if ( mdl[i] == 0 ) continue;

      // normalizing variance of this instant
      double var = 0;
      for (int k=0;k<nf;k++)
	var += psd( w2[k] , wu[i] , zu[i] , wl[i] , zl[i] );
      if ( ! ( var > 0 ) ) continue;

      const double s = mdl[i] * mdl[i] / var;
      for (int k=0;k<nf;k++)
	acc[k] += s * psd( w2[k] , wu[i] , zu[i] , wl[i] , zl[i] );
    }

  std::vector<double> fas( nf );
  for (int k=0;k<nf;k++)
    fas[k] = dt * sqrt( 0.5 * n * acc[k] );

  return fas;
}


Eigen::MatrixXcd filter::synthesize_series( int n , int npts ,
					    const std::vector<double> & t ,
					    const std::vector<double> & freq_sim ,
					    const std::vector<double> & mdl ,
					    const std::vector<double> & wu ,
					    const std::vector<double> & zu ,
					    const std::vector<double> & wl ,
					    const std::vector<double> & zl ,
					    const std::vector<double> & variance ,
					    const Eigen::MatrixXd & white_noise )
{

  if ( t.size() != npts || mdl.size() != npts || variance.size() != npts )
    Helper::halt( "synthesize_series() given inconsistent series lengths" );
  check_lengths( npts , wu , zu , wl , zl );

  if ( white_noise.rows() != n || white_noise.cols() != npts )
    Helper::halt( "synthesize_series() expects an n x npts noise matrix" );

  const int nf = freq_sim.size();

  Eigen::MatrixXcd spec = Eigen::MatrixXcd::Zero( n , nf );

  if ( nf == 0 ) return spec;

  // uniform axis: the phase term exp(-i w_k t_i) is built by recurrence over k
  const double dw = nf > 1 ? freq_sim[1] - freq_sim[0] : 0;

  for (int i=0;i<npts;i++)
    {

      if ( mdl[i] == 0 || ! ( variance[i] > 0 ) ) continue;

      const double scale = mdl[i] * sqrt( npts / ( 2.0 * variance[i] ) );

      const dcomp step = std::polar( 1.0 , -dw * t[i] );
      dcomp phase = std::polar( 1.0 , -freq_sim[0] * t[i] );

      for (int k=0;k<nf;k++)
	{
	  const dcomp c = scale * frf( freq_sim[k] , wu[i] , zu[i] , wl[i] , zl[i] ) * phase;
	  for (int r=0;r<n;r++)
	    spec( r , k ) += white_noise( r , i ) * c;
	  phase *= step;
	}

    }

  return spec;
}
