
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


#ifndef __SGSIM_PARAM_H__
#define __SGSIM_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>

//
// key=value options, from the command line or an @file
//

struct param_t
{

 public:

  // 'key+=' appends to an existing comma-delimited list; otherwise a
  // repeated key is an error
  void add( const std::string & option , const std::string & value );

  // 'key=value' or a bare 'key' (flag)
  void parse( const std::string & s );

  // one option per line, as key=value or 'key value'; '%' starts a comment
  void include( const std::string & filename );

  int size() const { return opt.size(); }

  bool has( const std::string & k ) const { return opt.find( k ) != opt.end(); }

  // absent, or given as a flag
  bool empty( const std::string & k ) const;

  // a bare flag counts as yes
  bool yesno( const std::string & k ) const;

  // unquoted value, or "" if absent
  std::string value( const std::string & k , const bool uppercase = false ) const;

  std::string requires( const std::string & k , const bool uppercase = false ) const;

  int requires_int( const std::string & k ) const;

  double requires_dbl( const std::string & k ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string & delim = "," ) const;

  std::vector<double> dblvector( const std::string & k , const std::string & delim = "," ) const;

  std::set<std::string> keys() const;

 private:

  std::vector<std::string> tokens( const std::string & k , const std::string & delim ) const;

  void missing( const std::string & k ) const;

  std::map<std::string,std::string> opt;

};

#endif
