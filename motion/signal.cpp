
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


#include "motion/signal.h"

#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


Eigen::MatrixXd sigtools::fas( double dt , const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  const int npts = x.cols();
  if ( npts == 0 ) Helper::halt( "fas() requires at least one sample" );

  real_FFT fft( npts , npts , 1.0 / dt );

  Eigen::MatrixXd r( n , fft.cutoff );
  std::vector<double> row( npts );

  for (int i=0;i<n;i++)
    {
      for (int j=0;j<npts;j++) row[j] = x(i,j);
      fft.apply( row );
      for (int k=0;k<fft.cutoff;k++) r(i,k) = fft.mag[k] * dt;
    }

  return r;
}


Eigen::MatrixXd sigtools::select_columns( const Eigen::MatrixXd & x , const std::vector<bool> & mask )
{
  if ( mask.size() != x.cols() ) Helper::halt( "mask length does not match the data" );

  int nc = 0;
  for (int j=0;j<mask.size();j++) if ( mask[j] ) ++nc;

  Eigen::MatrixXd r( x.rows() , nc );
  int c = 0;
  for (int j=0;j<mask.size();j++)
    if ( mask[j] )
      r.col( c++ ) = x.col( j );
  return r;
}


Eigen::MatrixXd sigtools::fas_star( const Eigen::MatrixXd & fas , const std::vector<bool> & mask , int w )
{
  const int n = fas.rows();
  const int nf = fas.cols();

  Eigen::MatrixXd sm( n , nf );
  std::vector<double> row( nf );
  for (int i=0;i<n;i++)
    {
      for (int k=0;k<nf;k++) row[k] = fas(i,k);
      std::vector<double> a = MiscMath::moving_average( row , w );
      for (int k=0;k<nf;k++) sm(i,k) = a[k];
    }

  return select_columns( sm , mask );
}


Eigen::MatrixXd sigtools::ce( double dt , const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  const int npts = x.cols();
  Eigen::MatrixXd r( n , npts );
  for (int i=0;i<n;i++)
    {
      double s = 0;
      for (int j=0;j<npts;j++)
	{
	  s += x(i,j) * x(i,j);
	  r(i,j) = s * dt;
	}
    }
  return r;
}


//
// event counts: an event at sample j is credited to column j
//

Eigen::MatrixXd sigtools::mle( const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  const int npts = x.cols();
  Eigen::MatrixXd r = Eigen::MatrixXd::Zero( n , npts );
  for (int i=0;i<n;i++)
    {
      double s = 0;
      for (int j=0;j<npts;j++)
	{
	  if ( j > 0 && j < npts - 1 )
	    if ( ( x(i,j) - x(i,j-1) ) * ( x(i,j+1) - x(i,j) ) < 0 ) s += 0.5;
	  r(i,j) = s;
	}
    }
  return r;
}


Eigen::MatrixXd sigtools::mzc( const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  const int npts = x.cols();
  Eigen::MatrixXd r = Eigen::MatrixXd::Zero( n , npts );
  for (int i=0;i<n;i++)
    {
      double s = 0;
      for (int j=0;j<npts;j++)
	{
	  if ( j > 0 && x(i,j-1) * x(i,j) < 0 ) s += 0.5;
	  r(i,j) = s;
	}
    }
  return r;
}


Eigen::MatrixXd sigtools::pmnm( const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  const int npts = x.cols();
  Eigen::MatrixXd r = Eigen::MatrixXd::Zero( n , npts );
  for (int i=0;i<n;i++)
    {
      double s = 0;
      for (int j=0;j<npts;j++)
	{
	  if ( j > 0 && j < npts - 1 )
	    {
	      const double d0 = x(i,j) - x(i,j-1);
	      const double d1 = x(i,j+1) - x(i,j);
	      const bool posmin = d0 < 0 && d1 > 0 && x(i,j) > 0;
	      const bool negmax = d0 > 0 && d1 < 0 && x(i,j) < 0;
	      if ( posmin || negmax ) s += 0.5;
	    }
	  r(i,j) = s;
	}
    }
  return r;
}


Eigen::VectorXd sigtools::pgp( const Eigen::MatrixXd & x )
{
  const int n = x.rows();
  Eigen::VectorXd r = Eigen::VectorXd::Zero( n );
  if ( x.cols() == 0 ) return r;
  for (int i=0;i<n;i++)
    r[i] = x.row(i).cwiseAbs().maxCoeff();
  return r;
}


std::vector<bool> sigtools::energy_mask( double dt , const Eigen::MatrixXd & x , double lwr , double upr )
{
  if ( lwr < 0 || upr > 1 || lwr > upr )
    Helper::halt( "energy range must satisfy 0 <= lower <= upper <= 1" );

  const int npts = x.cols();

  // pooled over rows
  std::vector<double> e( npts , 0 );
  for (int j=0;j<npts;j++)
    e[j] = x.col(j).squaredNorm();
  std::vector<double> c = MiscMath::cumsum( e , dt );

  std::vector<bool> m( npts , false );
  const double total = npts ? c[ npts - 1 ] : 0;
  if ( ! ( total > 0 ) )
    {
      Helper::warn( "energy_mask() given a record with no energy" );
      return m;
    }

  for (int j=0;j<npts;j++)
    {
      const double f = c[j] / total;
      m[j] = f >= lwr && f <= upr;
    }
  return m;
}


void sigtools::response_spectra( double dt , const Eigen::MatrixXd & ac ,
				 const std::vector<double> & tp , double zeta ,
				 Eigen::MatrixXd * sd , Eigen::MatrixXd * sv , Eigen::MatrixXd * sa )
{

  if ( zeta < 0 || zeta >= 1 ) Helper::halt( "damping ratio must be in [0,1)" );

  const int n = ac.rows();
  const int npts = ac.cols();
  const int np = tp.size();

  sd->resize( n , np );
  sv->resize( n , np );
  sa->resize( n , np );

  // average acceleration: beta = 1/4 , gamma = 1/2
  const double beta = 0.25;
  const double gam = 0.5;

  const double a0 = 1.0 / ( beta * dt * dt );
  const double a1 = gam / ( beta * dt );
  const double a2 = 1.0 / ( beta * dt );
  const double a3 = 1.0 / ( 2.0 * beta ) - 1.0;
  const double a4 = gam / beta - 1.0;
  const double a5 = 0.5 * dt * ( gam / beta - 2.0 );

  for (int p=0;p<np;p++)
    {

      if ( ! ( tp[p] > 0 ) ) Helper::halt( "response spectra require positive periods" );

      // unit mass oscillator
      const double w = 2.0 * M_PI / tp[p];
      const double k = w * w;
      const double c = 2.0 * zeta * w;
      const double keff = k + a0 + a1 * c;

      for (int i=0;i<n;i++)
	{
	  double u = 0 , v = 0 , a = npts ? -ac(i,0) : 0;
	  double umax = 0;

	  for (int j=1;j<npts;j++)
	    {
	      const double peff = -ac(i,j)
		+ ( a0 * u + a2 * v + a3 * a )
		+ c * ( a1 * u + a4 * v + a5 * a );
	      const double u1 = peff / keff;
	      const double acc1 = a0 * ( u1 - u ) - a2 * v - a3 * a;
	      v = v + dt * ( ( 1.0 - gam ) * a + gam * acc1 );
	      a = acc1;
	      u = u1;
	      if ( fabs( u ) > umax ) umax = fabs( u );
	    }

	  (*sd)(i,p) = umax;
	  (*sv)(i,p) = w * umax;
	  (*sa)(i,p) = k * umax;
	}
    }

}
