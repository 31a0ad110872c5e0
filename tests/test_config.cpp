
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

#include "model/config.h"

TEST(ConfigTest, ZerosBeforeAssignment)
{
  model_config_t cfg( 200 , 0.01 );
  EXPECT_FALSE( cfg.all_assigned() );
  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      EXPECT_FALSE( cfg.assigned( qt ) );
      ASSERT_EQ( cfg.get( qt ).size() , 200u );
      for (int j=0;j<200;j++) EXPECT_EQ( cfg.get( qt )[j] , 0.0 );
    }
  EXPECT_EQ( cfg.shape( Q_MDL ) , SHAPE_BETA_SINGLE );
  EXPECT_EQ( cfg.shape( Q_WU ) , SHAPE_LINEAR );
}

TEST(ConfigTest, FrequenciesHeldInRadians)
{
  model_config_t cfg( 101 , 0.1 );
  cfg.set_wu( { 5.0 , 3.0 } );
  cfg.set_zu( { 0.6 , 0.4 } );
  EXPECT_NEAR( cfg.wu()[0] , 2 * M_PI * 5.0 , 1e-12 );
  EXPECT_NEAR( cfg.wu()[100] , 2 * M_PI * 3.0 , 1e-12 );

  // damping is not scaled; raw params stay in Hz
  EXPECT_DOUBLE_EQ( cfg.zu()[0] , 0.6 );
  EXPECT_EQ( cfg.record( Q_WU ).params , std::vector<double>( { 5.0 , 3.0 } ) );
  EXPECT_EQ( cfg.record( Q_WU ).names , std::vector<std::string>( { "pf" , "pl" } ) );
}

TEST(ConfigTest, RevisionTracksChanges)
{
  model_config_t cfg( 100 , 0.01 );
  const uint64_t r0 = cfg.revision();
  cfg.set_zl( { 0.5 , 0.5 } );
  EXPECT_GT( cfg.revision() , r0 );
  const uint64_t r1 = cfg.revision();
  cfg.set_npts( 150 );
  EXPECT_GT( cfg.revision() , r1 );
}

TEST(ConfigTest, RejectedParametersLeaveRecord)
{
  model_config_t cfg( 100 , 0.01 );
  cfg.set_wl( { 0.5 , 0.2 } );
  const std::vector<double> before = cfg.wl();
  const uint64_t rev = cfg.revision();

  EXPECT_THROW( cfg.set_wl( { 1.0 } ) , std::runtime_error );
  EXPECT_THROW( cfg.set( Q_WL , SHAPE_EXPONENTIAL , { -1.0 , 2.0 } ) , std::runtime_error );

  EXPECT_EQ( cfg.wl() , before );
  EXPECT_EQ( cfg.revision() , rev );
  EXPECT_EQ( cfg.record( Q_WL ).func , SHAPE_LINEAR );
  EXPECT_TRUE( cfg.assigned( Q_WL ) );
}

TEST(ConfigTest, ExplicitShapes)
{
  model_config_t cfg( 100 , 0.01 ,
		      SHAPE_BETA_DUAL , SHAPE_EXPONENTIAL , SHAPE_CONSTANT ,
		      SHAPE_CONSTANT , SHAPE_CONSTANT );
  EXPECT_EQ( cfg.shape( Q_WU ) , SHAPE_EXPONENTIAL );

  cfg.set_zu( { 0.3 } );
  EXPECT_DOUBLE_EQ( cfg.zu()[50] , 0.3 );

  cfg.set( Q_ZU , SHAPE_LINEAR , { 0.3 , 0.1 } );
  EXPECT_EQ( cfg.shape( Q_ZU ) , SHAPE_LINEAR );
  EXPECT_NEAR( cfg.zu()[99] , 0.1 , 1e-12 );

  // a new shape applies from the next assignment on
  cfg.set_shape( Q_ZU , SHAPE_CONSTANT );
  EXPECT_EQ( cfg.record( Q_ZU ).func , SHAPE_LINEAR );
  EXPECT_NEAR( cfg.zu()[99] , 0.1 , 1e-12 );
}

TEST(ConfigTest, RegridReevaluates)
{
  model_config_t cfg( 101 , 0.1 );
  cfg.set_wu( { 4.0 , 2.0 } );
  cfg.set_mdl( { 0.3 , 10.0 , 1.0 , 10.0 } );

  cfg.set_npts( 201 );
  ASSERT_EQ( cfg.wu().size() , 201u );
  ASSERT_EQ( cfg.zu().size() , 201u );
  EXPECT_NEAR( cfg.wu()[0] , 2 * M_PI * 4.0 , 1e-12 );
  EXPECT_NEAR( cfg.wu()[200] , 2 * M_PI * 2.0 , 1e-12 );
  EXPECT_EQ( cfg.zu()[10] , 0.0 );
  EXPECT_EQ( cfg.grid().t().size() , 201u );

  cfg.set_dt( 0.05 );
  EXPECT_NEAR( cfg.grid().t()[200] , 10.0 , 1e-12 );
  EXPECT_EQ( cfg.mdl()[200] , 0.0 );

  EXPECT_THROW( cfg.set_npts( 0 ) , std::runtime_error );
}

TEST(ConfigTest, FailedRegridLeavesModelUnchanged)
{
  model_config_t cfg( 1000 , 0.01 );
  cfg.set_mdl( { 0.3 , 10.0 , 1.0 , 9.0 } );
  cfg.set( Q_WU , SHAPE_BILINEAR , { 5.0 , 8.0 , 3.0 , 5.0 } );
  cfg.set_zu( { 0.4 , 0.2 } );

  const uint64_t rev = cfg.revision();
  const std::vector<double> mdl = cfg.mdl();
  const std::vector<double> wu = cfg.wu();

  // tmax = 5 s lies beyond the shortened 3.99 s axis
  EXPECT_THROW( cfg.set_npts( 400 ) , std::runtime_error );

  EXPECT_EQ( cfg.revision() , rev );
  EXPECT_EQ( cfg.grid().npts() , 1000 );
  EXPECT_EQ( cfg.grid().t().size() , 1000u );
  EXPECT_EQ( cfg.mdl() , mdl );
  EXPECT_EQ( cfg.wu() , wu );
  EXPECT_EQ( cfg.zu().size() , 1000u );
  EXPECT_EQ( cfg.wl().size() , 1000u );

  // same for a time step that pulls tmax off the axis
  EXPECT_THROW( cfg.set_dt( 0.004 ) , std::runtime_error );
  EXPECT_EQ( cfg.revision() , rev );
  EXPECT_DOUBLE_EQ( cfg.grid().dt() , 0.01 );
  EXPECT_EQ( cfg.wu() , wu );

  // a valid change still goes through
  cfg.set_npts( 800 );
  EXPECT_EQ( cfg.wu().size() , 800u );
  EXPECT_GT( cfg.revision() , rev );
}

TEST(ConfigTest, Summary)
{
  model_config_t cfg( 100 , 0.01 );
  cfg.set_wu( { 5.0 , 3.0 } );
  const std::string s = cfg.summary();
  EXPECT_NE( s.find( "linear (pf=5, pl=3)" ) , std::string::npos );
  EXPECT_NE( s.find( "unassigned" ) , std::string::npos );
}
