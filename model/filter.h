
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


#ifndef __SGSIM_FILTER_H__
#define __SGSIM_FILTER_H__

#include <vector>

#include <Eigen/Dense>

#include "defs/defs.h"

//
// Evolutionary filter: a second-order high-pass (wl,zl) in series with
// a second-order low-pass (wu,zu); all frequencies in rad/s
//

struct variance_t
{
  variance_t() { }
  explicit variance_t( int n )
    : variance( n , 0 ) , variance_dot( n , 0 ) , variance_2dot( n , 0 ) ,
      variance_bar( n , 0 ) , variance_2bar( n , 0 ) { }

  std::vector<double> variance;      // sum psd
  std::vector<double> variance_dot;  // sum w^2 psd
  std::vector<double> variance_2dot; // sum w^4 psd
  std::vector<double> variance_bar;  // sum w^-2 psd (w > 0)
  std::vector<double> variance_2bar; // sum w^-4 psd (w > 0)
};

namespace filter
{

  // |H(w)|^2 given w^2; zero if a denominator is not positive
  double psd( double w2 , double wu , double zu , double wl , double zl );

  // H(w) = -w^2 / ( (wl^2 - w^2 + 2i zl wl w) (wu^2 - w^2 + 2i zu wu w) )
  dcomp frf( double w , double wu , double zu , double wl , double zl );

  variance_t compute_stats( const std::vector<double> & wu ,
			    const std::vector<double> & zu ,
			    const std::vector<double> & wl ,
			    const std::vector<double> & zl ,
			    const std::vector<double> & freq );

  // expected Fourier amplitude of the simulated acceleration
  std::vector<double> compute_fas( const std::vector<double> & mdl ,
				   const std::vector<double> & wu ,
				   const std::vector<double> & zu ,
				   const std::vector<double> & wl ,
				   const std::vector<double> & zl ,
				   const std::vector<double> & freq ,
				   double dt );

  // n x len(freq_sim) one-sided spectra, one row per realization;
  // white_noise is n x npts
  Eigen::MatrixXcd synthesize_series( int n , int npts ,
				      const std::vector<double> & t ,
				      const std::vector<double> & freq_sim ,
				      const std::vector<double> & mdl ,
				      const std::vector<double> & wu ,
				      const std::vector<double> & zu ,
				      const std::vector<double> & wl ,
				      const std::vector<double> & zl ,
				      const std::vector<double> & variance ,
				      const Eigen::MatrixXd & white_noise );

}

#endif
