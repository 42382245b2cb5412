//++
// LogFile.hpp -> CLog (communications library log file) definitions
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
//   The CLog class is the logging facility used by everything in COMMLIB.
// There is only one instance per application; the program creates it
// explicitly, and everybody else finds it with CLog::GetLog().  Messages are
// written with the LOGS() (iostream style) or LOGF() (printf style) macros,
// both of which are harmless if no CLog exists yet.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdio.h>              // FILE, fopen(), fprintf(), ...
#include <sys/time.h>           // struct timeval, gettimeofday(), ...
#include <string>               // C++ std::string class, et al ...
#include <sstream>              // C++ std::ostringstream, et al ...
#include <mutex>                // C++ std::mutex, std::lock_guard, ...
using std::string;              // ...
using std::ostringstream;       // ...


//   Send a message to the log using the C++ iostream notation, for example
//
//      LOGS(DEBUG, "block " << nBlock << " received");
//
// Note that the message level is just the bare name (DEBUG, WARNING, etc) and
// the CLog:: is added automatically...
#define LOGS(lvl,args) {                                    \
  if (CLog::IsLogged(CLog::lvl)) {                          \
    ostringstream osLog;  osLog << args;                    \
    CLog::GetLog()->Print(CLog::lvl, osLog);                \
  }                                                         \
}

// And the same thing, but using printf() style formatting ...
#define LOGF(lvl,...) {                                     \
  if (CLog::IsLogged(CLog::lvl))                            \
    CLog::GetLog()->Print(CLog::lvl, __VA_ARGS__);          \
}


class CLog {
  //++
  // Message logging facility ...
  //--

  // Message severity levels ...
public:
  enum _SEVERITY {
    TRACE   = 1,        // protocol traces and packet dumps
    DEBUG   = 2,        // debugging messages
    WARNING = 3,        // warnings and informational messages
    ERROR   = 4,        // errors
    NOLOG   = 5,        // nothing is logged at this level
  };
  typedef enum _SEVERITY SEVERITY;
  typedef struct timeval TIMESTAMP;

  // Other constants ...
public:
  enum {
    MAXMSG  = 2048,     // longest message we'll print
  };

  // Constructor and destructor ...
public:
  CLog (const char *pszProgram);
  virtual ~CLog();
private:
  // Disallow copy and assignment operations ...
  CLog (const CLog &) = delete;
  CLog& operator= (const CLog &) = delete;

  // Public properties ...
public:
  // Return a pointer to the one and only CLog instance ...
  static CLog *GetLog() {return m_pLog;}
  // Return TRUE if a message at this level would be logged anywhere ...
  static bool IsLogged (SEVERITY nLevel)
    {return (m_pLog != NULL) && (m_pLog->IsLoggedToConsole(nLevel) || m_pLog->IsLoggedToFile(nLevel));}
  // Get or set the console and log file message levels ...
  SEVERITY GetConsoleLevel() const {return m_lvlConsole;}
  void SetConsoleLevel (SEVERITY nLevel) {m_lvlConsole = nLevel;}
  SEVERITY GetFileLevel() const {return m_lvlFile;}
  void SetFileLevel (SEVERITY nLevel) {m_lvlFile = nLevel;}
  bool IsLoggedToConsole (SEVERITY nLevel) const {return nLevel >= m_lvlConsole;}
  bool IsLoggedToFile (SEVERITY nLevel) const
    {return IsLogFileOpen() && (nLevel >= m_lvlFile);}
  // Return the log file status ...
  bool IsLogFileOpen() const {return m_pLogFile != NULL;}
  string GetLogFileName() const {return m_sLogName;}
  string GetProgramName() const {return m_sProgram;}

  // Public log methods ...
public:
  // Open or close a log file ...
  bool OpenLog (const string &sFileName, SEVERITY nLevel=WARNING, bool fAppend=true);
  void CloseLog();
  // Log messages to the console and/or log file ...
  void Print (SEVERITY nLevel, ostringstream &osText);
  void Print (SEVERITY nLevel, const char *pszFormat, ...);
  // Time stamp and level formatting ...
  static void GetTimeStamp (TIMESTAMP *ptb);
  static string TimeStampToString (const TIMESTAMP *ptb);
  static string LevelToString (SEVERITY nLevel);
  string GetDefaultLogFileName() const;

  // Private methods ...
private:
  void LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText);
  void SendLog (SEVERITY nLevel, const char *pszText);
  void SendConsole (SEVERITY nLevel, const char *pszText);
  void PrintText (SEVERITY nLevel, const char *pszText);

  // Private member data ...
private:
  string      m_sProgram;     // name of this application
  SEVERITY    m_lvlConsole;   // current console message level
  SEVERITY    m_lvlFile;      // current log file message level
  string      m_sLogName;     // name of the current log file
  FILE       *m_pLogFile;     // handle of the current log file
  std::mutex  m_mtxPrint;     // serializes output from multiple threads
  // The one and only CLog instance ...
  static CLog *m_pLog;
};
