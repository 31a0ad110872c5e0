
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


#include "defs/defs.h"
#include "helper/helper.h"

#include <cmath>


std::string globals::version;
std::string globals::date;

int globals::retcode;

std::map<response_t,std::string> globals::response_label;
std::map<quantity_t,std::string> globals::quantity_label;

std::map<feature_t,std::string> globals::feature_label;
std::map<std::string,feature_t> globals::label_feature;

std::map<quantity_t,shape_t> globals::default_shape;

freq_range_t globals::freq_mask_default;

double globals::tp_start;
double globals::tp_stop;
double globals::tp_step;

freq_range_t globals::energy_range_default;

double globals::spectra_zeta;

void (*globals::bail_function) ( const std::string & );

bool globals::silent;
bool globals::bail_on_fail;

std::string globals::log_file;


std::string globals::print( const freq_range_t & f )
{
  return Helper::dbl2str( f.first ) + ".." + Helper::dbl2str( f.second );
}


void globals::api()
{
  silent = true;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.3.1";

  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  bail_on_fail = true;

  //
  // Output
  //

  silent = false;

  log_file = "";

  //
  // Labels
  //

  response_label.clear();
  response_label[ ACC ]  = "ac";
  response_label[ VEL ]  = "vel";
  response_label[ DISP ] = "disp";

  quantity_label.clear();
  quantity_label[ Q_MDL ] = "mdl";
  quantity_label[ Q_WU ]  = "wu";
  quantity_label[ Q_ZU ]  = "zu";
  quantity_label[ Q_WL ]  = "wl";
  quantity_label[ Q_ZL ]  = "zl";

  feature_label.clear();
  feature_label[ F_T ]         = "t";
  feature_label[ F_FREQ ]      = "freq";
  feature_label[ F_TP ]        = "tp";
  feature_label[ F_AC ]        = "ac";
  feature_label[ F_VEL ]       = "vel";
  feature_label[ F_DISP ]      = "disp";
  feature_label[ F_FAS ]       = "fas";
  feature_label[ F_FAS_STAR ]  = "fas_star";
  feature_label[ F_CE ]        = "ce";
  feature_label[ F_MLE_AC ]    = "mle_ac";
  feature_label[ F_MLE_VEL ]   = "mle_vel";
  feature_label[ F_MLE_DISP ]  = "mle_disp";
  feature_label[ F_MZC_AC ]    = "mzc_ac";
  feature_label[ F_MZC_VEL ]   = "mzc_vel";
  feature_label[ F_MZC_DISP ]  = "mzc_disp";
  feature_label[ F_PMNM_AC ]   = "pmnm_ac";
  feature_label[ F_PMNM_VEL ]  = "pmnm_vel";
  feature_label[ F_PMNM_DISP ] = "pmnm_disp";
  feature_label[ F_SA ]        = "sa";
  feature_label[ F_SV ]        = "sv";
  feature_label[ F_SD ]        = "sd";

  label_feature.clear();
  std::map<feature_t,std::string>::const_iterator ff = feature_label.begin();
  while ( ff != feature_label.end() )
    {
      label_feature[ ff->second ] = ff->first;
      ++ff;
    }

  //
  // Model defaults
  //

  default_shape.clear();
  default_shape[ Q_MDL ] = SHAPE_BETA_SINGLE;
  default_shape[ Q_WU ]  = SHAPE_LINEAR;
  default_shape[ Q_ZU ]  = SHAPE_LINEAR;
  default_shape[ Q_WL ]  = SHAPE_LINEAR;
  default_shape[ Q_ZL ]  = SHAPE_LINEAR;

  freq_mask_default = freq_range_t( 0.1 , 25.0 );

  tp_start = 0.04;
  tp_stop  = 10.04;
  tp_step  = 0.01;

  energy_range_default = freq_range_t( 0.001 , 0.999 );

  spectra_zeta = 0.05;

}
