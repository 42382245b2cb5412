//++
// COMMLIB.hpp -> Global declarations for the communications library
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
//   This file contains global constants and universal macros for the
// communications library.  It's used by every module, and by the test
// programs too.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>           // uint8_t, uint32_t, etc ...
#include <stddef.h>           // size_t, ...
#include <string>             // C++ std::string class, et al ...
using std::string;            // this is used EVERYWHERE!

//  "PRIVATE" functions, outside of a class definition, are local to the
// source file where they live ...
#define PRIVATE static

// Byte and word extraction and assembly ...
#define LOBYTE(x)       ((uint8_t)  ((x) & 0xFF))
#define HIBYTE(x)       ((uint8_t)  (((x) >> 8) & 0xFF))
#define MASK8(x)        ((x) & 0xFF)
#define MASK16(x)       ((x) & 0xFFFF)
#define MKWORD(h,l)     ((uint16_t) ((((h) & 0xFF) << 8) | ((l) & 0xFF)))

// Other generally useful macros ...
#define MIN(a,b)  ((a) < (b) ? (a) : (b))

// Case insensitive string comparison ...
#define STRIEQL(a,b)    (strcasecmp(a,b) == 0)

//   Define the C++ new operator to use the debug version. This enables tracing
// of memory leaks via _CrtDumpMemoryLeaks(), et al, where it's available ...
#if defined(_DEBUG) && defined(_MSC_VER)
#define DBGNEW new( _CLIENT_BLOCK, __FILE__, __LINE__)
#else
#define DBGNEW new
#endif

// Prototypes for routines declared in COMMLIB.cpp ...
extern "C" void _sleep_ms (uint32_t nDelay);
// FormatString() ...
extern string FormatString (const char *pszFormat, ...);
// MakePath() ...
extern string MakePath (const string &sDirectory, const string &sFileName);
// FileExists() and DirectoryExists() ...
extern bool FileExists (const char *pszPath);
inline bool FileExists (const string &sPath) {return FileExists(sPath.c_str());}
extern bool DirectoryExists (const char *pszPath);
inline bool DirectoryExists (const string &sPath) {return DirectoryExists(sPath.c_str());}
// Return the text associated with an errno value ...
extern string ErrorText (int nError);
// Dump buffers in HEX and ASCII ...
extern string DumpBuffer (const char *pszTitle, const uint8_t *pabBuffer, size_t cbBuffer);
