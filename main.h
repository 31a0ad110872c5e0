
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


#ifndef __SGSIM_MAIN_H__
#define __SGSIM_MAIN_H__

#include <string>

struct param_t;

// build options from the command line (key=value and @file)
void build_param( param_t * , int argc , char** argv , int start );

// warn about options no command uses
void check_options( const param_t & );

// commands
void proc_simulate( const param_t & );
void proc_stats( const param_t & );
void proc_save( const param_t & );

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return version
std::string sgsim_version();

#endif
