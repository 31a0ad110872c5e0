
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

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "param.h"
#include "model/options.h"

TEST(ParamTest, ParseAndFlags)
{
  param_t p;
  p.parse( "npts=500" );
  p.parse( "silent" );
  p.parse( "expr=a=b" );

  EXPECT_EQ( p.size() , 3 );
  EXPECT_TRUE( p.has( "npts" ) );
  EXPECT_EQ( p.requires_int( "npts" ) , 500 );
  EXPECT_TRUE( p.empty( "silent" ) );
  EXPECT_TRUE( p.yesno( "silent" ) );
  EXPECT_FALSE( p.yesno( "verbose" ) );
  EXPECT_EQ( p.value( "expr" ) , "a=b" );
  EXPECT_EQ( p.value( "missing" ) , "" );

  EXPECT_EQ( p.keys().size() , 3u );
}

TEST(ParamTest, DuplicateAndAppend)
{
  param_t p;
  p.add( "vars" , "ac" );
  EXPECT_THROW( p.add( "vars" , "vel" ) , std::runtime_error );

  p.add( "vars+" , "vel" );
  p.add( "vars+" , "disp" );
  EXPECT_EQ( p.strvector( "vars" ) , std::vector<std::string>( { "ac" , "vel" , "disp" } ) );
}

TEST(ParamTest, RequiredValues)
{
  param_t p;
  p.parse( "dt=abc" );
  p.parse( "n=2.5" );
  p.parse( "band=0.5,20" );

  EXPECT_THROW( p.requires( "npts" ) , std::runtime_error );
  EXPECT_THROW( p.requires_dbl( "dt" ) , std::runtime_error );
  EXPECT_THROW( p.requires_int( "nope" ) , std::runtime_error );
  EXPECT_DOUBLE_EQ( p.requires_dbl( "n" ) , 2.5 );

  std::vector<double> b = p.dblvector( "band" );
  ASSERT_EQ( b.size() , 2u );
  EXPECT_DOUBLE_EQ( b[1] , 20.0 );
  EXPECT_THROW( p.dblvector( "dt" ) , std::runtime_error );
  EXPECT_TRUE( p.dblvector( "missing" ).empty() );
}

TEST(ParamTest, IncludeFile)
{
  const std::string f = ::testing::TempDir() + "sgsim_param_test.txt";
  {
    std::ofstream O1( f.c_str() );
    O1 << "% model grid\n"
       << "npts=1000\n"
       << "\n"
       << "dt 0.01   % seconds\n"
       << "wu=linear:5,3\n";
  }

  param_t p;
  p.include( f );
  EXPECT_EQ( p.size() , 3 );
  EXPECT_EQ( p.requires_int( "npts" ) , 1000 );
  EXPECT_DOUBLE_EQ( p.requires_dbl( "dt" ) , 0.01 );
  EXPECT_EQ( p.value( "wu" ) , "linear:5,3" );

  std::remove( f.c_str() );

  param_t q;
  EXPECT_THROW( q.include( f ) , std::runtime_error );
}

TEST(OptionsTest, ParseQuantity)
{
  shape_t s = SHAPE_CONSTANT;
  std::vector<double> p;

  EXPECT_TRUE( options::parse_quantity( "beta_single:0.3,10,1,9.99" , &s , &p ) );
  EXPECT_EQ( s , SHAPE_BETA_SINGLE );
  EXPECT_EQ( p , std::vector<double>( { 0.3 , 10 , 1 , 9.99 } ) );

  s = SHAPE_LINEAR;
  EXPECT_FALSE( options::parse_quantity( "0.5, 0.2" , &s , &p ) );
  EXPECT_EQ( s , SHAPE_LINEAR );
  EXPECT_EQ( p , std::vector<double>( { 0.5 , 0.2 } ) );

  EXPECT_THROW( options::parse_quantity( "cosine:1,2" , &s , &p ) , std::runtime_error );
  EXPECT_THROW( options::parse_quantity( "linear:1,x" , &s , &p ) , std::runtime_error );
}

TEST(OptionsTest, BuildConfig)
{
  param_t p;
  p.parse( "npts=200" );
  p.parse( "dt=0.05" );
  p.parse( "mdl=beta_single:0.3,10,1,9.95" );
  p.parse( "wu=exponential:6,2" );
  p.parse( "zu=0.5,0.3" );
  p.parse( "band=0.5,10" );
  p.parse( "tp=0.1,2,0.1" );

  model_config_t cfg = options::build_config( p );
  EXPECT_EQ( cfg.grid().npts() , 200 );
  EXPECT_DOUBLE_EQ( cfg.grid().dt() , 0.05 );
  EXPECT_EQ( cfg.record( Q_WU ).func , SHAPE_EXPONENTIAL );
  EXPECT_EQ( cfg.record( Q_ZU ).func , SHAPE_LINEAR );
  EXPECT_TRUE( cfg.assigned( Q_MDL ) );
  EXPECT_FALSE( cfg.assigned( Q_WL ) );
  EXPECT_EQ( cfg.grid().freq_band() , freq_range_t( 0.5 , 10.0 ) );
  EXPECT_EQ( cfg.grid().tp().size() , 19u );
}

TEST(OptionsTest, BuildConfigErrors)
{
  param_t p;
  p.parse( "dt=0.05" );
  EXPECT_THROW( options::build_config( p ) , std::runtime_error );

  param_t q;
  q.parse( "npts=100" );
  q.parse( "dt=0.01" );
  q.parse( "band=1" );
  EXPECT_THROW( options::build_config( q ) , std::runtime_error );

  param_t r;
  r.parse( "npts=100" );
  r.parse( "dt=0.01" );
  r.parse( "wu=linear:1" );
  EXPECT_THROW( options::build_config( r ) , std::runtime_error );
}

TEST(OptionsTest, Seed)
{
  param_t p;
  p.parse( "seed=42" );
  EXPECT_EQ( options::seed( p ) , 42u );

  param_t z;
  z.parse( "seed=0" );
  EXPECT_EQ( options::seed( z ) , 0u );

  param_t neg;
  neg.parse( "seed=-1" );
  EXPECT_THROW( options::seed( neg ) , std::runtime_error );

  param_t bad;
  bad.parse( "seed=abc" );
  EXPECT_THROW( options::seed( bad ) , std::runtime_error );

  param_t none;
  EXPECT_THROW( options::seed( none ) , std::runtime_error );
}
