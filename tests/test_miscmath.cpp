
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

#include <stdexcept>
#include <vector>

#include "miscmath/miscmath.h"

TEST(MiscMathTest, NextPow2)
{
  EXPECT_EQ( MiscMath::nextpow2( 1 ) , 1 );
  EXPECT_EQ( MiscMath::nextpow2( 5 ) , 8 );
  EXPECT_EQ( MiscMath::nextpow2( 1024 ) , 1024 );
  EXPECT_EQ( MiscMath::nextpow2( 1025 ) , 2048 );
}

TEST(MiscMathTest, MovingAverageInterior)
{
  const std::vector<double> x = { 1 , 2 , 3 , 4 , 5 , 6 , 7 };
  std::vector<double> a = MiscMath::moving_average( x , 3 );
  ASSERT_EQ( a.size() , 7u );
  EXPECT_DOUBLE_EQ( a[1] , 2.0 );
  EXPECT_DOUBLE_EQ( a[5] , 6.0 );
  // edges copy the nearest full window
  EXPECT_DOUBLE_EQ( a[0] , 2.0 );
  EXPECT_DOUBLE_EQ( a[6] , 6.0 );

  EXPECT_EQ( MiscMath::moving_average( x , 1 ) , x );
  EXPECT_THROW( MiscMath::moving_average( x , 4 ) , std::runtime_error );
}

TEST(MiscMathTest, MovingAverageWindowOfFullLength)
{
  const std::vector<double> x = { 1 , 2 , 3 , 4 , 5 };

  // a window that fits exactly is used as given
  std::vector<double> a = MiscMath::moving_average( x , 5 );
  for (int i=0;i<5;i++) EXPECT_DOUBLE_EQ( a[i] , 3.0 ) << i;

  // wider windows shrink to the longest odd window that fits
  std::vector<double> b = MiscMath::moving_average( x , 9 );
  for (int i=0;i<5;i++) EXPECT_DOUBLE_EQ( b[i] , 3.0 ) << i;

  const std::vector<double> y = { 1 , 2 , 3 , 4 };
  std::vector<double> c = MiscMath::moving_average( y , 9 );
  EXPECT_EQ( c , std::vector<double>( { 2 , 2 , 3 , 3 } ) );
}
