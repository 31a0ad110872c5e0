
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


#ifndef __SGSIM_SIGNAL_H__
#define __SGSIM_SIGNAL_H__

#include <vector>

#include <Eigen/Dense>

//
// Elementary signal metrics; records are the rows of an n x npts matrix
//

namespace sigtools
{

  // |rfft(x)| * dt, n x (npts/2+1)
  Eigen::MatrixXd fas( double dt , const Eigen::MatrixXd & x );

  // w-point moving average of each FAS row, restricted to mask
  Eigen::MatrixXd fas_star( const Eigen::MatrixXd & fas , const std::vector<bool> & mask , int w = 9 );

  // cumsum(x^2) * dt
  Eigen::MatrixXd ce( double dt , const Eigen::MatrixXd & x );

  // cumulative counts, each event weighted 1/2 (i.e. maxima, up-crossings)
  Eigen::MatrixXd mle( const Eigen::MatrixXd & x );   // local extrema
  Eigen::MatrixXd mzc( const Eigen::MatrixXd & x );   // zero crossings
  Eigen::MatrixXd pmnm( const Eigen::MatrixXd & x );  // positive minima & negative maxima

  // peak absolute value per row
  Eigen::VectorXd pgp( const Eigen::MatrixXd & x );

  // samples whose normalized cumulative energy (of the row sum) lies in [lwr,upr]
  std::vector<bool> energy_mask( double dt , const Eigen::MatrixXd & x , double lwr , double upr );

  // SDOF displacement, pseudo-velocity and pseudo-acceleration spectra,
  // Newmark average acceleration; each n x len(tp)
  void response_spectra( double dt , const Eigen::MatrixXd & ac ,
			 const std::vector<double> & tp , double zeta ,
			 Eigen::MatrixXd * sd , Eigen::MatrixXd * sv , Eigen::MatrixXd * sa );

  // rows restricted to the selected columns
  Eigen::MatrixXd select_columns( const Eigen::MatrixXd & x , const std::vector<bool> & mask );

}

#endif
