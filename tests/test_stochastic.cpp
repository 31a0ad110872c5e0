
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

#include "model/stochastic.h"

namespace {

void assign_model( model_config_t & cfg )
{
  const double tn = cfg.grid().t().back();
  cfg.set_mdl( { 0.3 , 10.0 , 1.0 , tn } );
  cfg.set_wu( { 5.0 , 3.0 } );
  cfg.set_zu( { 0.5 , 0.5 } );
  cfg.set_wl( { 0.5 , 0.2 } );
  cfg.set_zl( { 0.6 , 0.6 } );
}

}

TEST(StochasticTest, Shapes)
{
  stochastic_model_t m( 512 , 0.01 );
  assign_model( m.config() );
  m.set_seed( 7 );

  ensemble_t e = m.simulate( 3 );
  EXPECT_EQ( e.size() , 3 );
  EXPECT_EQ( e.ac.cols() , 512 );
  EXPECT_EQ( e.vel.cols() , 512 );
  EXPECT_EQ( e.disp.cols() , 512 );
  EXPECT_EQ( &e.get( VEL ) , &e.vel );

  EXPECT_TRUE( m.stats().stats_current() );
}

TEST(StochasticTest, SeedReproducibility)
{
  stochastic_model_t a( 400 , 0.01 ) , b( 400 , 0.01 ) , c( 400 , 0.01 );
  assign_model( a.config() );
  assign_model( b.config() );
  assign_model( c.config() );

  a.set_seed( 42 );
  b.set_seed( 42 );
  c.set_seed( 43 );
  EXPECT_TRUE( a.has_seed() );
  EXPECT_EQ( a.seed() , 42u );

  ensemble_t ea = a.simulate( 2 );
  ensemble_t eb = b.simulate( 2 );
  ensemble_t ec = c.simulate( 2 );

  EXPECT_TRUE( ea.ac == eb.ac );
  EXPECT_TRUE( ea.vel == eb.vel );
  EXPECT_TRUE( ea.disp == eb.disp );
  EXPECT_FALSE( ea.ac == ec.ac );

  // the stream moves on between calls; reseeding restarts it
  ensemble_t ea2 = a.simulate( 2 );
  EXPECT_FALSE( ea.ac == ea2.ac );
  a.set_seed( 42 );
  EXPECT_TRUE( a.simulate( 2 ).ac == ea.ac );
}

TEST(StochasticTest, FiniteWithFullLengthEnvelope)
{
  // envelope reaching the end of the record; zero padding keeps the
  // circular wrap out of the kept samples
  stochastic_model_t m( 512 , 0.01 );
  model_config_t & cfg = m.config();
  cfg.set_mdl( { 0.4 , 8.0 , 1.0 , cfg.grid().t().back() } );
  cfg.set_wu( { 8.0 , 2.0 } );
  cfg.set_zu( { 0.3 , 0.3 } );
  cfg.set_wl( { 1.0 , 0.3 } );
  cfg.set_zl( { 0.7 , 0.7 } );
  m.set_seed( 1 );

  ensemble_t e = m.simulate( 1 );
  ASSERT_EQ( e.ac.rows() , 1 );
  ASSERT_EQ( e.ac.cols() , 512 );
  EXPECT_TRUE( e.ac.allFinite() );
  EXPECT_TRUE( e.vel.allFinite() );
  EXPECT_TRUE( e.disp.allFinite() );
  EXPECT_GT( e.ac.cwiseAbs().maxCoeff() , 0.0 );
}

TEST(StochasticTest, EnergyMatchesEnvelope)
{
  const int npts = 512;
  stochastic_model_t m( npts , 0.01 );
  assign_model( m.config() );
  m.set_seed( 2024 );

  const int n = 100;
  ensemble_t e = m.simulate( n );

  // mean total energy of the realizations against sum(mdl^2)
  double sim = e.ac.array().square().sum() / n;
  double target = 0;
  for (int i=0;i<npts;i++) target += m.config().mdl()[i] * m.config().mdl()[i];

  EXPECT_NEAR( sim / target , 1.0 , 0.3 );
}

TEST(StochasticTest, InvalidCount)
{
  stochastic_model_t m( 64 , 0.01 );
  assign_model( m.config() );
  EXPECT_THROW( m.simulate( 0 ) , std::runtime_error );
  EXPECT_THROW( m.simulate( -3 ) , std::runtime_error );
}

TEST(StochasticTest, ModelChangeRefreshesStats)
{
  stochastic_model_t m( 256 , 0.01 );
  assign_model( m.config() );
  m.set_seed( 3 );
  m.simulate( 1 );
  const double v0 = m.stats().variance()[100];

  m.config().set_wu( { 9.0 , 6.0 } );
  EXPECT_FALSE( m.stats().stats_current() );

  m.simulate( 1 );
  EXPECT_TRUE( m.stats().stats_current() );
  EXPECT_NE( m.stats().variance()[100] , v0 );
}
