
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


#ifndef __SGSIM_STORE_H__
#define __SGSIM_STORE_H__

#include <string>

#include "model/config.h"

//
// Parameter file (SQLite): domain, time axis, and for each model
// quantity its shape name, parameter names and raw parameter vector
//
//   domain( npts , dt )
//   time( idx , t )
//   quantities( quantity , func , vars )
//   parameters( quantity , idx , value )
//

struct model_store_t
{

  // overwrites any existing file; all five quantities must be assigned
  static void save( const model_config_t & cfg , const std::string & filename );

  // rebuilds the model by re-evaluating the stored shapes
  static model_config_t load( const std::string & filename );

};

#endif
