
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


#ifndef __DEFS_H__
#define __DEFS_H__

#include <map>
#include <set>
#include <string>
#include <complex>
#include <stdint.h>
#include <vector>

typedef std::complex<double> dcomp;

typedef std::pair<double,double> freq_range_t;

// response views of the modelled process
enum response_t
  {
    ACC = 0 ,
    VEL ,
    DISP
  };

// the five time-varying model quantities
enum quantity_t
  {
    Q_MDL = 0 ,  // modulating function (envelope)
    Q_WU ,       // upper dominant frequency
    Q_ZU ,       // upper damping ratio
    Q_WL ,       // lower dominant frequency
    Q_ZL         // lower damping ratio
  };

// parametric shape functions
enum shape_t
  {
    SHAPE_CONSTANT = 0 ,
    SHAPE_LINEAR ,
    SHAPE_BILINEAR ,
    SHAPE_EXPONENTIAL ,
    SHAPE_BETA_BASIC ,
    SHAPE_BETA_SINGLE ,
    SHAPE_BETA_DUAL ,
    SHAPE_GAMMA ,
    SHAPE_HOUSNER
  };

// motion features, for CSV export
enum feature_t
  {
    F_T = 0 , F_FREQ , F_TP ,
    F_AC , F_VEL , F_DISP ,
    F_FAS , F_FAS_STAR , F_CE ,
    F_MLE_AC , F_MLE_VEL , F_MLE_DISP ,
    F_MZC_AC , F_MZC_VEL , F_MZC_DISP ,
    F_PMNM_AC , F_PMNM_VEL , F_PMNM_DISP ,
    F_SA , F_SV , F_SD
  };


struct globals
{

  static std::string version;
  static std::string date;

  // return code
  static int retcode;

  // response and quantity labels
  static std::map<response_t,std::string> response_label;
  static std::map<quantity_t,std::string> quantity_label;

  // feature labels (CSV export)
  static std::map<feature_t,std::string> feature_label;
  static std::map<std::string,feature_t> label_feature;

  // default model shapes
  static std::map<quantity_t,shape_t> default_shape;

  // default analysis band (Hz)
  static freq_range_t freq_mask_default;

  // default period axis: start, stop, step (sec)
  static double tp_start;
  static double tp_stop;
  static double tp_step;

  // default energy range for motions
  static freq_range_t energy_range_default;

  // damping ratio for response spectra
  static double spectra_zeta;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // quiet mode
  static bool silent;

  static bool bail_on_fail;

  static std::string log_file;

  // global functions: primary initiation of all globals
  void init_defs();

  // library mode: no console output
  void api();

  static std::string print( const freq_range_t & );

};

#endif
