
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


#include "model/store.h"
#include "model/shapes.h"

#include "db/sqlwrap.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <vector>

extern logger_t logger;


void model_store_t::save( const model_config_t & cfg , const std::string & filename )
{

  for (int i=0;i<5;i++)
    if ( ! cfg.assigned( (quantity_t)i ) )
      Helper::halt( "cannot save model: " + globals::quantity_label[ (quantity_t)i ] + " has not been assigned" );

  const std::string f = Helper::expand( filename );

  if ( Helper::fileExists( f ) ) Helper::deleteFile( f );

  SQL sql;
  sql.open( f );

  sql.exec( "CREATE TABLE domain( npts INTEGER NOT NULL , dt REAL NOT NULL );" );
  sql.exec( "CREATE TABLE time( idx INTEGER PRIMARY KEY , t REAL NOT NULL );" );
  sql.exec( "CREATE TABLE quantities( quantity TEXT PRIMARY KEY , func TEXT NOT NULL , vars TEXT NOT NULL );" );
  sql.exec( "CREATE TABLE parameters( quantity TEXT NOT NULL , idx INTEGER NOT NULL , value REAL NOT NULL );" );

  sql.begin();

  const grid_t & grid = cfg.grid();

  sqlite3_stmt * s = sql.prepare( "INSERT INTO domain( npts , dt ) VALUES( :npts , :dt );" );
  sql.bind( s , ":npts" , grid.npts() );
  sql.bind( s , ":dt" , grid.dt() );
  sql.step( s );
  sql.finalise( s );

  const std::vector<double> & t = grid.t();
  s = sql.prepare( "INSERT INTO time( idx , t ) VALUES( :idx , :t );" );
  for (int i=0;i<t.size();i++)
    {
      sql.bind( s , ":idx" , i );
      sql.bind( s , ":t" , t[i] );
      sql.step( s );
      sql.reset( s );
    }
  sql.finalise( s );

  sqlite3_stmt * sq = sql.prepare( "INSERT INTO quantities( quantity , func , vars ) VALUES( :q , :f , :v );" );
  sqlite3_stmt * sp = sql.prepare( "INSERT INTO parameters( quantity , idx , value ) VALUES( :q , :idx , :value );" );

  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      const quantity_record_t & r = cfg.record( qt );
      const std::string & label = globals::quantity_label[ qt ];

      sql.bind( sq , ":q" , label );
      sql.bind( sq , ":f" , shapes::name( r.func ) );
      sql.bind( sq , ":v" , Helper::stringize( r.names ) );
      sql.step( sq );
      sql.reset( sq );

      for (int j=0;j<r.params.size();j++)
	{
	  sql.bind( sp , ":q" , label );
	  sql.bind( sp , ":idx" , j );
	  sql.bind( sp , ":value" , r.params[j] );
	  sql.step( sp );
	  sql.reset( sp );
	}
    }

  sql.finalise( sq );
  sql.finalise( sp );

  sql.commit();

  sql.close();

  logger << "  saved model parameters to " << f << "\n";

}


model_config_t model_store_t::load( const std::string & filename )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not find parameter file " + f );

  SQL sql;
  sql.open( f , true );

  const char * tables[] = { "domain" , "time" , "quantities" , "parameters" };
  for (int i=0;i<4;i++)
    if ( ! sql.has_table( tables[i] ) )
      Helper::halt( "parameter file " + f + " has no table " + tables[i] );

  //
  // domain
  //

  sqlite3_stmt * s = sql.prepare( "SELECT npts , dt FROM domain;" );
  if ( ! sql.step( s ) )
    Helper::halt( "parameter file " + f + " has no domain record" );
  if ( sql.col_null( s , 0 ) || sql.col_null( s , 1 ) )
    Helper::halt( "parameter file " + f + " has an incomplete domain record" );
  const int npts = sql.col_int( s , 0 );
  const double dt = sql.col_dbl( s , 1 );
  sql.finalise( s );

  const int nt = sql.scalar_int( "SELECT COUNT(*) FROM time;" );
  if ( nt != npts )
    Helper::halt( "parameter file " + f + " time axis has " + Helper::int2str( nt )
		  + " samples, expecting " + Helper::int2str( npts ) );

  // built locally; only returned once complete
  model_config_t cfg( npts , dt );

  sqlite3_stmt * sq = sql.prepare( "SELECT func , vars FROM quantities WHERE quantity = :q ;" );
  sqlite3_stmt * sp = sql.prepare( "SELECT value FROM parameters WHERE quantity = :q ORDER BY idx ;" );

  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      const std::string & label = globals::quantity_label[ qt ];

      sql.bind( sq , ":q" , label );
      if ( ! sql.step( sq ) )
	Helper::halt( "parameter file " + f + " has no record for " + label );
      const std::string func = sql.col_str( sq , 0 );
      const std::string vars = sql.col_str( sq , 1 );
      sql.reset( sq );

      const shape_t shape = shapes::lookup( func );

      std::vector<std::string> names = Helper::parse( vars , ',' );
      if ( names != shapes::param_names( shape ) )
	Helper::halt( "parameter file " + f + " lists parameters (" + vars + ") for "
		      + label + ", but " + func + " takes (" + Helper::stringize( shapes::param_names( shape ) ) + ")" );

      std::vector<double> p;
      sql.bind( sp , ":q" , label );
      while ( sql.step( sp ) )
	p.push_back( sql.col_dbl( sp , 0 ) );
      sql.reset( sp );

      cfg.set( qt , shape , p );
    }

  sql.finalise( sq );
  sql.finalise( sp );

  sql.close();

  logger << "  loaded model parameters from " << f << "\n";

  return cfg;

}
