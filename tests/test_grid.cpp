
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

#include "model/grid.h"

TEST(GridTest, AxisLengths)
{
  grid_t g( 512 , 0.01 );
  EXPECT_EQ( g.t().size() , 512u );
  EXPECT_EQ( g.freq().size() , 257u );
  EXPECT_EQ( g.npts_sim() , 1024 );
  EXPECT_EQ( g.freq_sim().size() , 513u );

  grid_t h( 1000 , 0.02 );
  EXPECT_EQ( h.npts_sim() , 2048 );
  EXPECT_GE( h.npts_sim() , 2 * h.npts() );
  EXPECT_EQ( h.freq_sim().size() , 1025u );
  EXPECT_EQ( h.freq().size() , 501u );
}

TEST(GridTest, AxisValues)
{
  grid_t g( 100 , 0.05 );
  EXPECT_DOUBLE_EQ( g.t()[0] , 0.0 );
  EXPECT_DOUBLE_EQ( g.t()[1] , 0.05 );
  EXPECT_DOUBLE_EQ( g.t()[99] , 99 * 0.05 );

  const double df = 2 * M_PI / ( 100 * 0.05 );
  EXPECT_DOUBLE_EQ( g.freq()[0] , 0.0 );
  EXPECT_NEAR( g.freq()[3] , 3 * df , 1e-12 );
  EXPECT_NEAR( g.freq_p2()[3] , 9 * df * df , 1e-9 );
  EXPECT_NEAR( g.freq_p4()[2] , 16 * std::pow( df , 4 ) , 1e-6 );

  // zero bin excluded from the reciprocals
  EXPECT_EQ( g.freq_n2()[0] , 0.0 );
  EXPECT_EQ( g.freq_n4()[0] , 0.0 );
  EXPECT_NEAR( g.freq_n2()[2] , 1.0 / ( 4 * df * df ) , 1e-12 );

  const double dfs = 2 * M_PI / ( g.npts_sim() * 0.05 );
  EXPECT_NEAR( g.freq_sim()[5] , 5 * dfs , 1e-12 );
}

TEST(GridTest, MutationInvalidatesAxes)
{
  grid_t g( 256 , 0.01 );
  EXPECT_EQ( g.t().size() , 256u );
  const uint64_t r0 = g.revision();

  g.set_npts( 300 );
  EXPECT_GT( g.revision() , r0 );
  EXPECT_EQ( g.t().size() , 300u );
  EXPECT_EQ( g.freq().size() , 151u );
  EXPECT_EQ( g.npts_sim() , 1024 );
  EXPECT_EQ( g.freq_mask().size() , 151u );

  g.set_dt( 0.02 );
  EXPECT_DOUBLE_EQ( g.t()[10] , 0.2 );
  EXPECT_NEAR( g.freq()[1] , 2 * M_PI / ( 300 * 0.02 ) , 1e-12 );
}

TEST(GridTest, RejectsNonPositive)
{
  EXPECT_THROW( grid_t( 0 , 0.01 ) , std::runtime_error );
  EXPECT_THROW( grid_t( 10 , 0.0 ) , std::runtime_error );
  EXPECT_THROW( grid_t( 10 , -0.01 ) , std::runtime_error );

  grid_t g( 10 , 0.01 );
  EXPECT_THROW( g.set_npts( -5 ) , std::runtime_error );
  EXPECT_THROW( g.set_dt( 0 ) , std::runtime_error );
}

TEST(GridTest, FrequencyMask)
{
  // bins at k / 5.12 Hz
  grid_t g( 512 , 0.01 );
  const std::vector<bool> & m = g.freq_mask();
  ASSERT_EQ( m.size() , 257u );
  EXPECT_FALSE( m[0] );
  EXPECT_TRUE( m[1] );     // 0.195 Hz
  EXPECT_TRUE( m[127] );   // 24.8 Hz
  EXPECT_FALSE( m[129] );  // 25.2 Hz

  g.set_freq_mask( 1.0 , 2.0 );
  int n = 0;
  for (int k=0;k<g.freq_mask().size();k++) if ( g.freq_mask()[k] ) ++n;
  EXPECT_EQ( n , 5 );  // 6..10 -> 1.17 .. 1.95 Hz

  EXPECT_THROW( g.set_freq_mask( 5 , 1 ) , std::runtime_error );
  EXPECT_THROW( g.set_freq_mask( -1 , 1 ) , std::runtime_error );
}

TEST(GridTest, PeriodAxis)
{
  grid_t g( 100 , 0.01 );
  ASSERT_EQ( g.tp().size() , 1000u );
  EXPECT_DOUBLE_EQ( g.tp()[0] , 0.04 );
  EXPECT_NEAR( g.tp()[999] , 10.03 , 1e-9 );

  g.set_tp( 0.1 , 1.0 , 0.1 );
  EXPECT_EQ( g.tp().size() , 9u );

  EXPECT_THROW( g.set_tp( 1.0 , 0.5 , 0.1 ) , std::runtime_error );
  EXPECT_THROW( g.set_tp( 0.1 , 1.0 , 0.0 ) , std::runtime_error );
}
