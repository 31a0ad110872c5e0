
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


#include "db/sqlwrap.h"
#include "helper/helper.h"

void SQL::fail( const std::string & what )
{
  const std::string err = db ? sqlite3_errmsg( db ) : "no connection";
  Helper::halt( "database " + filename + ": " + what + " (" + err + ")" );
}


void SQL::open( const std::string & f , const bool readonly )
{
  close();

  filename = Helper::expand( f );

  const int flags = readonly ? SQLITE_OPEN_READONLY : ( SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE );

  rc = sqlite3_open_v2( filename.c_str() , &db , flags , NULL );

  if ( rc != SQLITE_OK )
    {
      // sqlite3 hands back a handle even when the open fails
      const std::string err = db ? sqlite3_errmsg( db ) : "out of memory";
      sqlite3_close( db );
      db = NULL;
      Helper::halt( "could not open database " + filename + " (" + err + ")" );
    }
}


void SQL::close()
{
  if ( db == NULL ) return;

  for (std::set<sqlite3_stmt*>::iterator ss = live.begin(); ss != live.end(); ++ss)
    sqlite3_finalize( *ss );
  live.clear();

  sqlite3_close( db );
  db = NULL;
}


void SQL::exec( const std::string & q )
{
  char * msg = NULL;
  rc = sqlite3_exec( db , q.c_str() , NULL , NULL , &msg );
  if ( rc == SQLITE_OK ) return;

  const std::string err = msg ? msg : "unknown error";
  sqlite3_free( msg );
  Helper::halt( "database " + filename + ": " + err );
}


bool SQL::has_table( const std::string & table )
{
  sqlite3_stmt * s = prepare( "SELECT 1 FROM sqlite_master WHERE type='table' AND name=:name;" );
  bind( s , ":name" , table );
  const bool found = step( s );
  finalise( s );
  return found;
}


int SQL::scalar_int( const std::string & q )
{
  sqlite3_stmt * s = prepare( q );
  const int r = step( s ) ? col_int( s , 0 ) : -1;
  finalise( s );
  return r;
}


sqlite3_stmt * SQL::prepare( const std::string & q )
{
  sqlite3_stmt * s = NULL;
  rc = sqlite3_prepare_v2( db , q.c_str() , (int)q.size() , &s , NULL );
  if ( rc != SQLITE_OK ) fail( "could not prepare '" + q + "'" );
  live.insert( s );
  return s;
}


bool SQL::step( sqlite3_stmt * s )
{
  rc = sqlite3_step( s );
  if ( rc == SQLITE_ROW ) return true;
  if ( rc == SQLITE_DONE ) return false;
  sqlite3_reset( s );
  fail( "step failed, code " + Helper::int2str( rc ) );
  return false;
}


void SQL::finalise( sqlite3_stmt * s )
{
  if ( live.erase( s ) ) sqlite3_finalize( s );
}


int SQL::key_index( sqlite3_stmt * s , const std::string & key )
{
  const int i = sqlite3_bind_parameter_index( s , key.c_str() );
  if ( i == 0 ) fail( "no statement parameter " + key );
  return i;
}

void SQL::bind( sqlite3_stmt * s , const std::string & key , int value )
{
  sqlite3_bind_int( s , key_index( s , key ) , value );
}

void SQL::bind( sqlite3_stmt * s , const std::string & key , double value )
{
  sqlite3_bind_double( s , key_index( s , key ) , value );
}

void SQL::bind( sqlite3_stmt * s , const std::string & key , const std::string & value )
{
  sqlite3_bind_text( s , key_index( s , key ) , value.c_str() , (int)value.size() , SQLITE_TRANSIENT );
}


std::string SQL::col_str( sqlite3_stmt * s , int c )
{
  const unsigned char * p = sqlite3_column_text( s , c );
  return p ? std::string( (const char*)p ) : std::string();
}
