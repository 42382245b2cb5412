//++
// COMMLIB.cpp -> Miscellaneous communications library helper routines
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
//   This module contains a handful of small, generally useful, functions that
// don't belong to any particular class - string formatting, file name
// manipulation, hex dumps for the log, and so on.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // snprintf(), vsnprintf(), ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <string.h>             // strerror_r(), memset(), ...
#include <errno.h>              // errno, ENOENT, ...
#include <time.h>               // nanosleep(), struct timespec, ...
#include <sys/stat.h>           // stat(), S_ISDIR(), ...
#include "COMMLIB.hpp"          // global declarations for this library


extern "C" void _sleep_ms (uint32_t nDelay)
{
  //++
  // Delay for the specified number of milliseconds ...
  //--
  struct timespec ts;
  ts.tv_sec  =  nDelay / 1000UL;
  ts.tv_nsec = (nDelay % 1000UL) * 1000000UL;
  while ((nanosleep(&ts, &ts) != 0) && (errno == EINTR)) ;
}

string FormatString (const char *pszFormat, ...)
{
  //++
  //   This routine is just like sprintf(), except that it returns a C++
  // std::string instead of filling in a character buffer.  The result is
  // limited to 1K characters, which is plenty for anything we print.
  //--
  char szBuffer[1024];  va_list args;
  memset(szBuffer, 0, sizeof(szBuffer));
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  return string(szBuffer);
}

string MakePath (const string &sDirectory, const string &sFileName)
{
  //++
  //   Combine a directory and a file name into a complete path.  An empty
  // directory means the current directory, and a trailing "/" on the
  // directory name is optional ...
  //--
  if (sDirectory.empty()) return sFileName;
  if (sDirectory[sDirectory.length()-1] == '/') return sDirectory + sFileName;
  return sDirectory + "/" + sFileName;
}

bool FileExists (const char *pszPath)
{
  //++
  // Return TRUE if the specified file (or directory!) exists ...
  //--
  struct stat st;
  return stat(pszPath, &st) == 0;
}

bool DirectoryExists (const char *pszPath)
{
  //++
  // Return TRUE if the path exists AND it's a directory ...
  //--
  struct stat st;
  if (stat(pszPath, &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

string ErrorText (int nError)
{
  //++
  //   Return the message text associated with an errno value.  This hides
  // the difference between the GNU and XSI flavors of strerror_r()...
  //--
  char szBuffer[256];
  memset(szBuffer, 0, sizeof(szBuffer));
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
  return string(strerror_r(nError, szBuffer, sizeof(szBuffer)));
#else
  if (strerror_r(nError, szBuffer, sizeof(szBuffer)) != 0)
    return FormatString("error %d", nError);
  return string(szBuffer);
#endif
}

string DumpBuffer (const char *pszTitle, const uint8_t *pabBuffer, size_t cbBuffer)
{
  //++
  //   Dump a buffer in hex and ASCII, sixteen bytes per line, for the log
  // file.  This is used for TRACE level logging of packets and it's not
  // expected to be very efficient.  The result contains embedded newlines,
  // but CLog knows how to deal with that ...
  //--
  string sDump = FormatString("%s: %u bytes", pszTitle, (unsigned) cbBuffer);
  for (size_t i = 0;  i < cbBuffer;  i += 16) {
    string sHex, sASCII;
    for (size_t j = 0;  j < 16;  ++j) {
      if ((i+j) < cbBuffer) {
        uint8_t b = pabBuffer[i+j];
        sHex += FormatString("%02X ", b);
        sASCII += ((b >= 0x20) && (b < 0x7F)) ? (char) b : '.';
      } else
        sHex += "   ";
    }
    sDump += FormatString("\n%04X/ %s %s", (unsigned) i, sHex.c_str(), sASCII.c_str());
  }
  return sDump;
}
