
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


#ifndef __FFTWRAP_H__
#define __FFTWRAP_H__

#include "fftw3.h"

#include <vector>
#include <complex>

#include "defs/defs.h"

//
// FFTW3 plans for the one-sided real transforms; each object owns its
// buffers and plan, and is reused across records of the same length
//

// forward: ndata samples, zero-padded to nfft, magnitudes over [0, fs/2]
class real_FFT
{

 public:

  real_FFT( int ndata , int nfft , double fs );

  ~real_FFT() { release(); }

  // x must hold exactly ndata samples
  void apply( const double * x , const int n );

  void apply( const std::vector<double> & x ) { apply( x.data() , (int)x.size() ); }

  // number of one-sided bins
  int cutoff;

  // |X(k)| and bin frequency (Hz)
  std::vector<double> mag;
  std::vector<double> frq;

 private:

  real_FFT( const real_FFT & );
  real_FFT & operator=( const real_FFT & );

  void release();

  int ndata, nfft;

  double * rbuf;
  fftw_complex * cbuf;
  fftw_plan plan;

};


// inverse: up to cutoff one-sided bins to nfft real samples
class real_iFFT
{

 public:

  explicit real_iFFT( int nfft );

  ~real_iFFT() { release(); }

  // bins beyond n are taken as zero
  void apply( const dcomp * x , const int n );

  void apply( const std::vector<dcomp> & x ) { apply( x.data() , (int)x.size() ); }

  // first n output samples, scaled by 1/nfft
  void inverse( double * r , const int n ) const;

  int cutoff;

 private:

  real_iFFT( const real_iFFT & );
  real_iFFT & operator=( const real_iFFT & );

  void release();

  int nfft;

  fftw_complex * cbuf;
  double * rbuf;
  fftw_plan plan;

};

#endif
