/* LightOff: an application to analyze catalytic light-off activity data.
 
 Copyright 2018 National Technology & Engineering Solutions of Sandia, LLC
 (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
 Government retains certain rights in this software.
 For questions contact William Johnson via email at wcjohns@sandia.gov, or
 alternative emails of interspec@sandia.gov.
 
 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.
 
 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.
 
 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "LightOff_config.h"

#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#define BOOST_TEST_MODULE test_AppUtils_suite
#include <boost/test/included/unit_test.hpp>

#include "LightOff/AppUtils.h"

using namespace std;
using namespace boost::unit_test;


BOOST_AUTO_TEST_CASE( ParseDoubleList )
{
  vector<double> values = AppUtils::parse_double_list( "500, 450,400 350" );
  BOOST_REQUIRE_EQUAL( values.size(), 4 );
  BOOST_CHECK_EQUAL( values[0], 500.0 );
  BOOST_CHECK_EQUAL( values[1], 450.0 );
  BOOST_CHECK_EQUAL( values[2], 400.0 );
  BOOST_CHECK_EQUAL( values[3], 350.0 );

  values = AppUtils::parse_double_list( "20,50.5,  80" );
  BOOST_REQUIRE_EQUAL( values.size(), 3 );
  BOOST_CHECK_CLOSE( values[1], 50.5, 1.0E-9 );

  values = AppUtils::parse_double_list( "-1.5e1" );
  BOOST_REQUIRE_EQUAL( values.size(), 1 );
  BOOST_CHECK_CLOSE( values[0], -15.0, 1.0E-9 );

  BOOST_CHECK( AppUtils::parse_double_list( "" ).empty() );
  BOOST_CHECK( AppUtils::parse_double_list( "  , " ).empty() );

  BOOST_CHECK_THROW( AppUtils::parse_double_list( "500,abc,400" ), std::runtime_error );
}


BOOST_AUTO_TEST_CASE( ParseIntList )
{
  const vector<int> values = AppUtils::parse_int_list( "1,2, 1 2" );
  BOOST_REQUIRE_EQUAL( values.size(), 4 );
  BOOST_CHECK_EQUAL( values[0], 1 );
  BOOST_CHECK_EQUAL( values[1], 2 );
  BOOST_CHECK_EQUAL( values[2], 1 );
  BOOST_CHECK_EQUAL( values[3], 2 );

  BOOST_CHECK( AppUtils::parse_int_list( "" ).empty() );
  BOOST_CHECK_THROW( AppUtils::parse_int_list( "one" ), std::runtime_error );
}


BOOST_AUTO_TEST_CASE( CompileDate )
{
  const uint32_t date = AppUtils::compile_date_as_int();
  BOOST_CHECK_GT( date, 20200101u );
  BOOST_CHECK_LT( date, 30000101u );

  BOOST_CHECK_GE( AppUtils::terminal_width(), 40u );
}
