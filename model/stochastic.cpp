
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


#include "model/stochastic.h"
#include "model/filter.h"

#include "fftw/fftwrap.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


stochastic_model_t::stochastic_model_t( int npts , double dt )
  : _stats( npts , dt ) , rng( std::random_device{}() ) , seeded( false ) , _seed( 0 )
{
}

stochastic_model_t::stochastic_model_t( int npts , double dt ,
					shape_t mdl_shape , shape_t wu_shape , shape_t zu_shape ,
					shape_t wl_shape , shape_t zl_shape )
  : _stats( model_config_t( npts , dt , mdl_shape , wu_shape , zu_shape , wl_shape , zl_shape ) ) ,
    rng( std::random_device{}() ) , seeded( false ) , _seed( 0 )
{
}

stochastic_model_t::stochastic_model_t( const model_config_t & cfg )
  : _stats( cfg ) , rng( std::random_device{}() ) , seeded( false ) , _seed( 0 )
{
}


void stochastic_model_t::set_seed( uint32_t s )
{
  rng = std::mt19937( s );
  _seed = s;
  seeded = true;
}


ensemble_t stochastic_model_t::simulate( int n )
{

  if ( n < 1 ) Helper::halt( "number of simulations must be a positive integer" );

  const model_config_t & cfg = _stats.config();

  if ( ! cfg.all_assigned() )
    Helper::warn( "simulating with one or more unassigned model quantities (zeros)" );

  if ( ! _stats.stats_current() ) _stats.compute_stats();

  const grid_t & grid = cfg.grid();
  const int npts = grid.npts();
  const int nsim = grid.npts_sim();
  const std::vector<double> & w = grid.freq_sim();
  const std::vector<double> & w2 = grid.freq_sim_p2();
  const int nf = w.size();

  logger << "  simulating " << n << " realization(s), npts=" << npts
	 << ", transform length " << nsim << "\n";

  //
  // white noise, drawn row by row
  //

  std::normal_distribution<double> norm( 0.0 , 1.0 );
  Eigen::MatrixXd noise( n , npts );
  for (int r=0;r<n;r++)
    for (int i=0;i<npts;i++)
      noise( r , i ) = norm( rng );

  //
  // filtered Fourier series over the zero-padded axis
  //

  Eigen::MatrixXcd spec = filter::synthesize_series( n , npts , grid.t() , w ,
						     cfg.mdl() , cfg.wu() , cfg.zu() ,
						     cfg.wl() , cfg.zl() ,
						     _stats.variance() , noise );

  ensemble_t ens;
  ens.ac.resize( n , npts );
  ens.vel.resize( n , npts );
  ens.disp.resize( n , npts );

  // one plan, reused for every row and response
  real_iFFT ifft( nsim );

  std::vector<dcomp> row( nf ) , iv( nf ) , id( nf );
  std::vector<double> x( npts );

  for (int r=0;r<n;r++)
    {

      for (int k=0;k<nf;k++) row[k] = spec( r , k );

      // frequency-domain integration; the zero bin is omitted
      iv[0] = id[0] = dcomp( 0 , 0 );
      for (int k=1;k<nf;k++)
	{
	  iv[k] = row[k] / dcomp( 0 , w[k] );
	  id[k] = -row[k] / w2[k];
	}

      // inverse transform, keep the first npts samples
      ifft.apply( row );
      ifft.inverse( &(x[0]) , npts );
      for (int i=0;i<npts;i++) ens.ac( r , i ) = x[i];

      ifft.apply( iv );
      ifft.inverse( &(x[0]) , npts );
      for (int i=0;i<npts;i++) ens.vel( r , i ) = x[i];

      ifft.apply( id );
      ifft.inverse( &(x[0]) , npts );
      for (int i=0;i<npts;i++) ens.disp( r , i ) = x[i];

    }

  return ens;

}
