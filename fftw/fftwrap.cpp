
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


#include "fftw/fftwrap.h"

#include "helper/helper.h"

#include <cmath>
#include <algorithm>


static int one_sided( const int nfft )
{
  return nfft / 2 + 1;
}


//
// forward
//

real_FFT::real_FFT( int ndata_ , int nfft_ , double fs )
  : ndata( ndata_ ) , nfft( nfft_ ) , rbuf( NULL ) , cbuf( NULL ) , plan( NULL )
{

  if ( nfft < 1 || ndata < 1 ) Helper::halt( "real_FFT: transform length must be positive" );
  if ( ndata > nfft ) Helper::halt( "real_FFT: more samples than transform points" );

  cutoff = one_sided( nfft );

  rbuf = fftw_alloc_real( nfft );
  cbuf = fftw_alloc_complex( cutoff );
  if ( rbuf == NULL || cbuf == NULL )
    {
      release();
      Helper::halt( "real_FFT: could not allocate buffers" );
    }

  plan = fftw_plan_dft_r2c_1d( nfft , rbuf , cbuf , FFTW_ESTIMATE );

  mag.assign( cutoff , 0 );
  frq.resize( cutoff );
  const double df = fs / (double)nfft;
  for (int k=0;k<cutoff;k++) frq[k] = k * df;

}


void real_FFT::release()
{
  if ( plan ) fftw_destroy_plan( plan );
  fftw_free( rbuf );
  fftw_free( cbuf );
  plan = NULL;
  rbuf = NULL;
  cbuf = NULL;
}


void real_FFT::apply( const double * x , const int n )
{
  if ( n != ndata )
    Helper::halt( "real_FFT: expected " + Helper::int2str( ndata )
		  + " samples, got " + Helper::int2str( n ) );

  std::copy( x , x + n , rbuf );
  std::fill( rbuf + n , rbuf + nfft , 0.0 );

  fftw_execute( plan );

  for (int k=0;k<cutoff;k++)
    mag[k] = std::hypot( cbuf[k][0] , cbuf[k][1] );
}


//
// inverse
//

real_iFFT::real_iFFT( int nfft_ )
  : nfft( nfft_ ) , cbuf( NULL ) , rbuf( NULL ) , plan( NULL )
{

  if ( nfft < 1 ) Helper::halt( "real_iFFT: transform length must be positive" );

  cutoff = one_sided( nfft );

  cbuf = fftw_alloc_complex( cutoff );
  rbuf = fftw_alloc_real( nfft );
  if ( rbuf == NULL || cbuf == NULL )
    {
      release();
      Helper::halt( "real_iFFT: could not allocate buffers" );
    }

  plan = fftw_plan_dft_c2r_1d( nfft , cbuf , rbuf , FFTW_ESTIMATE );

}


void real_iFFT::release()
{
  if ( plan ) fftw_destroy_plan( plan );
  fftw_free( cbuf );
  fftw_free( rbuf );
  plan = NULL;
  cbuf = NULL;
  rbuf = NULL;
}


void real_iFFT::apply( const dcomp * x , const int n )
{
  if ( n > cutoff )
    Helper::halt( "real_iFFT: " + Helper::int2str( n ) + " bins exceeds the "
		  + Helper::int2str( cutoff ) + " available" );

  // c2r destroys its input, so the buffer is always reloaded in full
  for (int k=0;k<cutoff;k++)
    {
      const dcomp c = k < n ? x[k] : dcomp( 0 , 0 );
      cbuf[k][0] = c.real();
      cbuf[k][1] = c.imag();
    }

  fftw_execute( plan );
}


void real_iFFT::inverse( double * r , const int n ) const
{
  if ( n > nfft ) Helper::halt( "real_iFFT: cannot return more than the transform length" );
  const double s = 1.0 / (double)nfft;
  for (int i=0;i<n;i++) r[i] = rbuf[i] * s;
}
