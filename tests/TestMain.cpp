//++
// TestMain.cpp -> main program for the COMMLIB unit tests
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the communications library project.  COMMLIB is
// free software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    COMMLIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with COMMLIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   This is the main program for the unit tests.  It creates the CLog object
// that the library expects to exist, and then runs all the tests.  Only
// errors go to the console, but everything down to TRACE level goes to the
// log file so that a failed test can be picked apart afterwards.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#include <stdio.h>              // printf(), ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility


int main (int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  CLog *pLog = DBGNEW CLog("commtest");
  pLog->SetConsoleLevel(CLog::ERROR);
  if (!pLog->OpenLog("commtest.log", CLog::TRACE, false))
    fprintf(stderr, "unable to open commtest.log - continuing without it\n");
  int nResult = RUN_ALL_TESTS();
  delete pLog;
  return nResult;
}
