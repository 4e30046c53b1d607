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
#include <cstdlib>
#include <iostream>

#include "LightOff/AppUtils.h"
#include "LightOff/BatchCommandLine.h"

static_assert( USE_BATCH_TOOLS, "You must have USE_BATCH_TOOLS enabled to build this code" );


#ifdef _WIN32
int wmain( int argc, wchar_t *wargv[] )
{
  char **argv;
  AppUtils::getUtf8Args( argc, wargv, argv );
#else
int main( int argc, char *argv[] )
{
#endif

  int rval = EXIT_FAILURE;
  try
  {
    rval = BatchCommandLine::run_batch_command( argc, argv );
  }catch( std::exception &e )
  {
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    rval = EXIT_FAILURE;
  }

#ifdef _WIN32
  AppUtils::cleanupUtf8Args( argc, argv );
#endif

  return rval;
}//int main( int argc, char *argv[] )
