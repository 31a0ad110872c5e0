
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
#include <cstdio>
#include <stdexcept>

#include "model/store.h"
#include "db/sqlwrap.h"
#include "helper/helper.h"

namespace {

class StoreTest : public ::testing::Test
{
protected:

  void SetUp() override
  {
    filename = ::testing::TempDir() + "sgsim_store_test.db";
    std::remove( filename.c_str() );
  }

  void TearDown() override
  {
    std::remove( filename.c_str() );
  }

  static model_config_t make_model()
  {
    model_config_t cfg( 300 , 0.02 ,
			SHAPE_BETA_DUAL , SHAPE_EXPONENTIAL , SHAPE_LINEAR ,
			SHAPE_BILINEAR , SHAPE_CONSTANT );
    cfg.set_mdl( { 0.2 , 10.0 , 0.6 , 15.0 , 0.5 , 1.5 , 5.98 } );
    cfg.set_wu( { 6.0 , 2.5 } );
    cfg.set_zu( { 0.45 , 0.25 } );
    cfg.set_wl( { 0.8 , 0.3 , 0.1 , 2.0 } );
    cfg.set_zl( { 0.7 } );
    return cfg;
  }

  std::string filename;
};

}

TEST_F(StoreTest, RoundTrip)
{
  model_config_t cfg = make_model();
  model_store_t::save( cfg , filename );
  ASSERT_TRUE( Helper::fileExists( filename ) );

  model_config_t loaded = model_store_t::load( filename );

  EXPECT_EQ( loaded.grid().npts() , 300 );
  EXPECT_EQ( loaded.grid().dt() , 0.02 );
  EXPECT_TRUE( loaded.all_assigned() );

  for (int i=0;i<5;i++)
    {
      const quantity_t qt = (quantity_t)i;
      EXPECT_EQ( loaded.record( qt ).func , cfg.record( qt ).func );
      EXPECT_EQ( loaded.record( qt ).params , cfg.record( qt ).params );
      EXPECT_EQ( loaded.get( qt ) , cfg.get( qt ) );
    }
}

TEST_F(StoreTest, Overwrite)
{
  model_config_t cfg = make_model();
  model_store_t::save( cfg , filename );

  cfg.set_wu( { 9.0 , 4.0 } );
  model_store_t::save( cfg , filename );

  model_config_t loaded = model_store_t::load( filename );
  EXPECT_EQ( loaded.record( Q_WU ).params , std::vector<double>( { 9.0 , 4.0 } ) );
}

TEST_F(StoreTest, UnassignedModelNotSaved)
{
  model_config_t cfg( 100 , 0.01 );
  cfg.set_wu( { 5.0 , 3.0 } );
  EXPECT_THROW( model_store_t::save( cfg , filename ) , std::runtime_error );
  EXPECT_FALSE( Helper::fileExists( filename ) );
}

TEST_F(StoreTest, MissingFile)
{
  EXPECT_THROW( model_store_t::load( filename ) , std::runtime_error );
}

TEST_F(StoreTest, MissingTable)
{
  {
    SQL sql;
    sql.open( filename );
    sql.exec( "CREATE TABLE domain( npts INTEGER NOT NULL , dt REAL NOT NULL );" );
    sql.exec( "INSERT INTO domain VALUES( 10 , 0.1 );" );
  }
  EXPECT_THROW( model_store_t::load( filename ) , std::runtime_error );
}

TEST_F(StoreTest, MissingQuantity)
{
  model_store_t::save( make_model() , filename );
  {
    SQL sql;
    sql.open( filename );
    sql.exec( "DELETE FROM quantities WHERE quantity = 'zl';" );
  }
  EXPECT_THROW( model_store_t::load( filename ) , std::runtime_error );
}

TEST_F(StoreTest, InconsistentParameters)
{
  model_store_t::save( make_model() , filename );
  {
    SQL sql;
    sql.open( filename );
    sql.exec( "DELETE FROM parameters WHERE quantity = 'wu' AND idx = 1;" );
  }
  EXPECT_THROW( model_store_t::load( filename ) , std::runtime_error );
}

TEST_F(StoreTest, TimeAxisMismatch)
{
  model_store_t::save( make_model() , filename );
  {
    SQL sql;
    sql.open( filename );
    sql.exec( "UPDATE domain SET npts = 301;" );
  }
  EXPECT_THROW( model_store_t::load( filename ) , std::runtime_error );
}
