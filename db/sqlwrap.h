
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


#ifndef __SQLWRAP_H__
#define __SQLWRAP_H__

#include <string>
#include <set>

#include "sqlite3.h"

//
// SQLite connection used by the parameter store; failures go to Helper::halt()
//

class SQL {

 public:

  SQL() : db( NULL ) , rc( SQLITE_OK ) { }

  ~SQL() { close(); }

  // read-only opens never create a file
  void open( const std::string & filename , const bool readonly = false );

  // finalises any statement still outstanding
  void close();

  void exec( const std::string & q );

  bool has_table( const std::string & table );

  // single integer result, or -1 if no row
  int scalar_int( const std::string & q );

  void begin() { exec( "BEGIN;" ); }
  void commit() { exec( "COMMIT;" ); }

  //
  // prepared statements
  //

  sqlite3_stmt * prepare( const std::string & q );

  // true while rows remain
  bool step( sqlite3_stmt * );

  void reset( sqlite3_stmt * s ) { sqlite3_reset( s ); }

  void finalise( sqlite3_stmt * );

  // named parameters (':key')
  void bind( sqlite3_stmt * , const std::string & key , int value );
  void bind( sqlite3_stmt * , const std::string & key , double value );
  void bind( sqlite3_stmt * , const std::string & key , const std::string & value );

  int col_int( sqlite3_stmt * s , int c ) { return sqlite3_column_int( s , c ); }
  double col_dbl( sqlite3_stmt * s , int c ) { return sqlite3_column_double( s , c ); }
  std::string col_str( sqlite3_stmt * s , int c );
  bool col_null( sqlite3_stmt * s , int c ) { return sqlite3_column_type( s , c ) == SQLITE_NULL; }

  static std::string version() { return SQLITE_VERSION; }

 private:

  SQL( const SQL & );
  SQL & operator=( const SQL & );

  int key_index( sqlite3_stmt * , const std::string & key );

  void fail( const std::string & what );

  std::set<sqlite3_stmt*> live;

  sqlite3 * db;

  int rc;

  std::string filename;

};

#endif
