
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


#include "motion/motion.h"
#include "motion/signal.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <iomanip>

extern logger_t logger;


motion_t::motion_t( int npts , double dt ,
		    const Eigen::MatrixXd & ac ,
		    const Eigen::MatrixXd & vel ,
		    const Eigen::MatrixXd & disp )
  : _grid( npts , dt ) , _ac( ac ) , _vel( vel ) , _disp( disp )
{
  if ( ac.cols() != npts || vel.cols() != npts || disp.cols() != npts )
    Helper::halt( "motion records must have npts columns" );
  if ( vel.rows() != ac.rows() || disp.rows() != ac.rows() )
    Helper::halt( "motion requires the same number of ac, vel and disp records" );
}


motion_t motion_t::from_model( const stochastic_model_t & model , const ensemble_t & ens )
{
  const grid_t & g = model.grid();
  motion_t m( g.npts() , g.dt() , ens.ac , ens.vel , ens.disp );
  m._grid = g;
  return m;
}


void motion_t::reset()
{
  cache.clear();
}


void motion_t::set_freq_mask( double lwr , double upr )
{
  _grid.set_freq_mask( lwr , upr );
  reset();
}

void motion_t::set_tp( double start , double stop , double step )
{
  _grid.set_tp( start , stop , step );
  reset();
}


std::vector<bool> motion_t::energy_mask() const
{
  return sigtools::energy_mask( dt() , _ac ,
				globals::energy_range_default.first ,
				globals::energy_range_default.second );
}


void motion_t::set_range( const std::string & option , const freq_range_t & r )
{
  if ( Helper::iequals( option , "energy" ) )
    set_range( sigtools::energy_mask( dt() , _ac , r.first , r.second ) );
  else
    Helper::halt( "unsupported range option: " + option );
}


void motion_t::set_range( const std::vector<bool> & mask )
{
  if ( mask.size() != npts() ) Helper::halt( "range mask length does not match npts" );

  int n = 0;
  for (int j=0;j<mask.size();j++) if ( mask[j] ) ++n;
  if ( n == 0 ) Helper::halt( "range mask selects no samples" );

  _ac = sigtools::select_columns( _ac , mask );
  _vel = sigtools::select_columns( _vel , mask );
  _disp = sigtools::select_columns( _disp , mask );

  _grid.set_npts( n );
  reset();
}


const Eigen::MatrixXd & motion_t::response( response_t r ) const
{
  return r == ACC ? _ac : r == VEL ? _vel : _disp;
}


void motion_t::make_spectra() const
{
  Eigen::MatrixXd sd, sv, sa;
  sigtools::response_spectra( dt() , _ac , _grid.tp() , globals::spectra_zeta , &sd , &sv , &sa );
  cache[ F_SD ] = sd;
  cache[ F_SV ] = sv;
  cache[ F_SA ] = sa;
}


const Eigen::MatrixXd & motion_t::get( feature_t f ) const
{

  std::map<feature_t,Eigen::MatrixXd>::const_iterator ii = cache.find( f );
  if ( ii != cache.end() ) return ii->second;

  switch ( f )
    {
    case F_AC :   return _ac;
    case F_VEL :  return _vel;
    case F_DISP : return _disp;

    case F_FAS :      cache[ f ] = sigtools::fas( dt() , _ac ); break;
    case F_FAS_STAR : cache[ f ] = sigtools::fas_star( get( F_FAS ) , _grid.freq_mask() ); break;
    case F_CE :       cache[ f ] = sigtools::ce( dt() , _ac ); break;

    case F_MLE_AC :   cache[ f ] = sigtools::mle( _ac ); break;
    case F_MLE_VEL :  cache[ f ] = sigtools::mle( _vel ); break;
    case F_MLE_DISP : cache[ f ] = sigtools::mle( _disp ); break;

    case F_MZC_AC :   cache[ f ] = sigtools::mzc( _ac ); break;
    case F_MZC_VEL :  cache[ f ] = sigtools::mzc( _vel ); break;
    case F_MZC_DISP : cache[ f ] = sigtools::mzc( _disp ); break;

    case F_PMNM_AC :   cache[ f ] = sigtools::pmnm( _ac ); break;
    case F_PMNM_VEL :  cache[ f ] = sigtools::pmnm( _vel ); break;
    case F_PMNM_DISP : cache[ f ] = sigtools::pmnm( _disp ); break;

    case F_SA :
    case F_SV :
    case F_SD :
      make_spectra(); break;

    default :
      Helper::halt( globals::feature_label[ f ] + " is not a dependent variable" );
    }

  return cache[ f ];
}


const Eigen::MatrixXd & motion_t::mle( response_t r ) const
{
  return get( r == ACC ? F_MLE_AC : r == VEL ? F_MLE_VEL : F_MLE_DISP );
}

const Eigen::MatrixXd & motion_t::mzc( response_t r ) const
{
  return get( r == ACC ? F_MZC_AC : r == VEL ? F_MZC_VEL : F_MZC_DISP );
}

const Eigen::MatrixXd & motion_t::pmnm( response_t r ) const
{
  return get( r == ACC ? F_PMNM_AC : r == VEL ? F_PMNM_VEL : F_PMNM_DISP );
}

Eigen::VectorXd motion_t::pgp( response_t r ) const
{
  return sigtools::pgp( response( r ) );
}


std::vector<double> motion_t::axis( feature_t f ) const
{
  if ( f == F_T ) return _grid.t();
  if ( f == F_FREQ ) return _grid.freq();
  if ( f == F_TP ) return _grid.tp();
  Helper::halt( globals::feature_label[ f ] + " is not an independent variable" );
  return std::vector<double>();
}


void motion_t::save_simulations( const std::string & filename ,
				 const std::string & x_var ,
				 const std::vector<std::string> & y_vars ) const
{

  std::map<std::string,feature_t>::const_iterator xx = globals::label_feature.find( Helper::tolower( x_var ) );
  if ( xx == globals::label_feature.end() )
    Helper::halt( "unknown variable: " + x_var );

  const std::vector<double> x = axis( xx->second );
  const int nx = x.size();

  std::vector<const Eigen::MatrixXd*> ys;
  for (int v=0;v<y_vars.size();v++)
    {
      std::map<std::string,feature_t>::const_iterator yy = globals::label_feature.find( Helper::tolower( y_vars[v] ) );
      if ( yy == globals::label_feature.end() )
	Helper::halt( "unknown variable: " + y_vars[v] );
      const Eigen::MatrixXd & m = get( yy->second );
      if ( m.cols() != nx )
	Helper::halt( y_vars[v] + " has " + Helper::int2str( (int)m.cols() )
		      + " values per record, but " + x_var + " has " + Helper::int2str( nx ) );
      ys.push_back( &m );
    }

  std::ofstream O1( Helper::expand( filename ).c_str() , std::ios::out );
  if ( ! O1.good() ) Helper::halt( "could not write to " + filename );

  O1 << x_var;
  for (int v=0;v<ys.size();v++)
    for (int r=0;r<ys[v]->rows();r++)
      O1 << "," << y_vars[v] << "_" << r + 1;
  O1 << "\n";

  O1 << std::setprecision( 12 );
  for (int j=0;j<nx;j++)
    {
      O1 << x[j];
      for (int v=0;v<ys.size();v++)
	for (int r=0;r<ys[v]->rows();r++)
	  O1 << "," << (*ys[v])(r,j);
      O1 << "\n";
    }

  O1.close();

  logger << "  wrote " << ys.size() << " variable(s) to " << filename << "\n";

}
