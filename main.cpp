
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


#include "main.h"
#include "param.h"
#include "sgsim.h"

#include <iostream>
#include <fstream>
#include <iomanip>
#include <cstring>
#include <cstdlib>
#include <new>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  std::set_new_handler(NoMem);

  global.init_defs();

  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0
	 || strcmp( argv[1] ,"version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << sgsim_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< SQL::version() << "\n";
      std::cerr << fftw_version << "\n";
      std::exit( globals::retcode );
    }

  //
  // primary usage
  //

  std::string usage_msg = sgsim_version() +
    "usage: sgsim [simulate|stats|save|version] [@param-file] [key=value ...]\n"
    "  grid      npts=N dt=X [band=lwr,upr] [tp=start,stop,step]\n"
    "  model     mdl|wu|zu|wl|zl=[shape:]p1,p2,...  [load=file.db]\n"
    "  simulate  n=N [seed=S] [out=file.csv] [x=t] [vars=ac,vel,...]\n"
    "  stats     [out=file.csv]\n"
    "  save      save=file.db\n"
    "  flags     silent log=file\n";

  if ( argc < 2 )
    {
      std::cerr << usage_msg;
      std::exit(1);
    }

  const std::string cmd = Helper::tolower( argv[1] );

  param_t param;
  build_param( &param , argc , argv , 2 );

  if ( param.yesno( "silent" ) ) global.api();

  check_options( param );

  if ( param.has( "log" ) )
    {
      globals::log_file = param.value( "log" );
      logger.write_log( globals::log_file );
    }

  logger.banner( globals::version , globals::date );

  if ( cmd == "simulate" )
    proc_simulate( param );
  else if ( cmd == "stats" )
    proc_stats( param );
  else if ( cmd == "save" )
    proc_save( param );
  else
    {
      logger.off();
      std::cerr << usage_msg;
      Helper::halt( "unrecognized command: " + cmd );
    }

  std::exit( globals::retcode );

}


void build_param( param_t * param , int argc , char** argv , int start )
{
  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      if ( x[0] == '@' )
	param->include( x.substr(1) );
      else
	param->parse( x );
    }
}


void check_options( const param_t & param )
{
  const char * opts[] = { "npts" , "dt" , "mdl" , "wu" , "zu" , "wl" , "zl" ,
			  "band" , "tp" , "load" , "save" , "n" , "seed" ,
			  "out" , "x" , "vars" , "silent" , "log" };
  const std::set<std::string> known( opts , opts + sizeof(opts) / sizeof(opts[0]) );

  std::set<std::string> k = param.keys();
  std::set<std::string>::const_iterator kk = k.begin();
  while ( kk != k.end() )
    {
      if ( known.find( *kk ) == known.end() )
	Helper::warn( "ignoring unrecognized option " + *kk );
      ++kk;
    }
}


void proc_simulate( const param_t & param )
{

  stochastic_model_t model( options::build_config( param ) );

  logger << model.config().summary();

  if ( param.has( "seed" ) )
    model.set_seed( options::seed( param ) );

  const int n = param.has( "n" ) ? param.requires_int( "n" ) : 1;

  ensemble_t ens = model.simulate( n );

  motion_t motion = motion_t::from_model( model , ens );

  Eigen::VectorXd pga = motion.pgp( ACC );
  Eigen::VectorXd pgv = motion.pgp( VEL );
  Eigen::VectorXd pgd = motion.pgp( DISP );

  for (int r=0;r<motion.size();r++)
    logger << "  realization " << r + 1
	   << " : pga=" << pga[r]
	   << " pgv=" << pgv[r]
	   << " pgd=" << pgd[r] << "\n";

  if ( param.has( "out" ) )
    {
      const std::string x = param.has( "x" ) ? param.value( "x" ) : "t";
      std::vector<std::string> vars = param.has( "vars" )
	? param.strvector( "vars" )
	: std::vector<std::string>( 1 , "ac" );
      motion.save_simulations( param.value( "out" ) , x , vars );
    }

  if ( param.has( "save" ) )
    model_store_t::save( model.config() , param.value( "save" ) );

}


void proc_stats( const param_t & param )
{

  model_stats_t stats( options::build_config( param ) );

  logger << stats.config().summary();

  stats.compute_all();

  const int n = stats.grid().npts();

  logger << "  total energy " << stats.ce()[ n - 1 ] << "\n";

  for (int r=0;r<3;r++)
    {
      const response_t rt = (response_t)r;
      logger << "  " << globals::response_label[ rt ]
	     << " : mle=" << stats.mle( rt )[ n - 1 ]
	     << " mzc=" << stats.mzc( rt )[ n - 1 ]
	     << " pmnm=" << stats.pmnm( rt )[ n - 1 ] << "\n";
    }

  if ( param.has( "out" ) )
    {
      const std::string f = Helper::expand( param.value( "out" ) );
      std::ofstream O1( f.c_str() , std::ios::out );
      if ( ! O1.good() ) Helper::halt( "could not write to " + f );

      O1 << "t,mdl,variance,variance_dot,variance_2dot,variance_bar,variance_2bar,ce";
      for (int r=0;r<3;r++)
	{
	  const std::string & lab = globals::response_label[ (response_t)r ];
	  O1 << ",mle_" << lab << ",mzc_" << lab << ",pmnm_" << lab;
	}
      O1 << "\n";

      O1 << std::setprecision( 12 );
      const std::vector<double> & t = stats.grid().t();
      for (int i=0;i<n;i++)
	{
	  O1 << t[i]
	     << "," << stats.config().mdl()[i]
	     << "," << stats.variance()[i]
	     << "," << stats.variance_dot()[i]
	     << "," << stats.variance_2dot()[i]
	     << "," << stats.variance_bar()[i]
	     << "," << stats.variance_2bar()[i]
	     << "," << stats.ce()[i];
	  for (int r=0;r<3;r++)
	    {
	      const response_t rt = (response_t)r;
	      O1 << "," << stats.mle( rt )[i]
		 << "," << stats.mzc( rt )[i]
		 << "," << stats.pmnm( rt )[i];
	    }
	  O1 << "\n";
	}
      O1.close();
      logger << "  wrote model statistics to " << f << "\n";
    }

}


void proc_save( const param_t & param )
{
  model_config_t cfg = options::build_config( param );
  logger << cfg.summary();
  model_store_t::save( cfg , param.requires( "save" ) );
}


//
// report version
//

std::string sgsim_version()
{
  std::stringstream ss;
  ss << "sgsim version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "sgsim build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
