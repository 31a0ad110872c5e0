
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


#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "fftw/fftwrap.h"

TEST(FftTest, ForwardMagnitudesAndAxis)
{
  // 2 Hz cosine, 1 s at 16 Hz
  const int n = 16;
  std::vector<double> x( n );
  for (int i=0;i<n;i++) x[i] = cos( 2 * M_PI * 2.0 * i / 16.0 );

  real_FFT fft( n , n , 16.0 );
  ASSERT_EQ( fft.cutoff , 9 );
  fft.apply( x );

  EXPECT_DOUBLE_EQ( fft.frq[0] , 0.0 );
  EXPECT_DOUBLE_EQ( fft.frq[2] , 2.0 );
  EXPECT_DOUBLE_EQ( fft.frq[8] , 8.0 );

  EXPECT_NEAR( fft.mag[2] , 8.0 , 1e-9 );
  EXPECT_NEAR( fft.mag[0] , 0.0 , 1e-9 );
  EXPECT_NEAR( fft.mag[5] , 0.0 , 1e-9 );

  EXPECT_THROW( fft.apply( std::vector<double>( 10 , 1.0 ) ) , std::runtime_error );
}

TEST(FftTest, InverseIsScaledAndZeroFilled)
{
  real_iFFT ifft( 8 );
  ASSERT_EQ( ifft.cutoff , 5 );

  // only the DC bin supplied; the rest are zero
  std::vector<dcomp> s( 1 , dcomp( 8.0 , 0.0 ) );
  ifft.apply( s );

  double r[8];
  ifft.inverse( r , 8 );
  for (int i=0;i<8;i++) EXPECT_NEAR( r[i] , 1.0 , 1e-12 );

  // truncated read
  double q[3];
  ifft.inverse( q , 3 );
  EXPECT_NEAR( q[2] , 1.0 , 1e-12 );

  EXPECT_THROW( ifft.inverse( r , 9 ) , std::runtime_error );
  EXPECT_THROW( ifft.apply( std::vector<dcomp>( 6 ) ) , std::runtime_error );
}

TEST(FftTest, InverseOfForward)
{
  const int n = 32;
  std::vector<double> x( n );
  for (int i=0;i<n;i++) x[i] = sin( 0.37 * i ) + 0.25 * i;

  real_FFT fft( n , n , 1.0 );
  fft.apply( x );

  // direct DFT as reference
  real_iFFT ifft( n );
  std::vector<dcomp> bins( fft.cutoff );
  for (int k=0;k<fft.cutoff;k++)
    {
      double re = 0 , im = 0;
      for (int i=0;i<n;i++)
	{
	  re += x[i] * cos( 2 * M_PI * k * i / n );
	  im -= x[i] * sin( 2 * M_PI * k * i / n );
	}
      bins[k] = dcomp( re , im );
      EXPECT_NEAR( std::abs( bins[k] ) , fft.mag[k] , 1e-9 );
    }

  ifft.apply( bins );
  std::vector<double> y( n );
  ifft.inverse( &(y[0]) , n );
  for (int i=0;i<n;i++) EXPECT_NEAR( y[i] , x[i] , 1e-9 );
}
