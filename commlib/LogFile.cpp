//++
// LogFile.cpp -> CLog (communications library log file) methods
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
//   The CLog class defines a generic logging facility for the communications
// library.  Messages may be logged to the console, to a file, or both
// depending on the message severity.  Messages logged to the log file are
// automatically time stamped.  Log files may be opened and closed, and the
// message level for both console and log file may be changed dynamically.
//
//    It's important to remember that COMMLIB is multi-threaded.  Every
// session runs a pump thread, file transfers run a forwarding thread, and
// the application has its own thread(s) too.  The Print() methods may be
// called by any of them, at the same time, and so all output goes through
// a single mutex.  The control methods (OpenLog(), CloseLog(), etc) are
// expected to be called only by the application's main thread.
//
//   Lastly, note that it is intended that there be only one CLog instance per
// application, and it follows a somewhat modified Singleton design pattern.
// It's modified because the constructor has parameters and we want it to be
// explicitly called, but only once.  Subsequent calls to the constructor will
// generate assertion failures, and a pointer to the original CLog instance
// can be retrieved at any time by calling CLog::GetLog().
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <assert.h>             // assert() (what else??)
#include <string.h>             // strchr(), memset(), etc ...
#include <errno.h>              // errno, ...
#include <time.h>               // localtime_r(), ...
#include <sys/time.h>           // gettimeofday() ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // declarations for this module


// Initialize the pointer to the one and only CLog instance ...
CLog *CLog::m_pLog = NULL;


CLog::CLog (const char *pszProgram)
  : m_sProgram(pszProgram), m_sLogName(), m_pLogFile(NULL), m_mtxPrint()
{
  //++
  //   The log file constructor just initializes all the members.  The
  // initial console logging level is set to WARNING and the log file is
  // initially closed.
  //
  //   Note that the pszProgram parameter is the name of the application that
  // uses COMMLIB.  It's used as a prefix on console messages and as part of
  // the default log file name.
  //--

  // This had better be the first and only instance of this object!
  assert(m_pLog == NULL);
  m_pLog = this;
  m_lvlFile = NOLOG;
#if defined(_DEBUG)
  m_lvlConsole = DEBUG;
#else
  m_lvlConsole = WARNING;
#endif
}

CLog::~CLog()
{
  //++
  // Destroying the log closes the log file ...
  //--
  if (IsLogFileOpen()) CloseLog();

  //   Reset the pointer to this Singleton object. In theory this would allow
  // another CLog instance to be created, but that's not likely to be useful.
  assert(m_pLog == this);
  m_pLog = NULL;
}

/*static*/ string CLog::LevelToString (SEVERITY nLevel)
{
  //++
  //   Return a simple string corresponding to nLevel.   This is used to
  // put the message level into the log file...
  //--
  switch (nLevel) {
    case TRACE:   return string("TRACE");
    case DEBUG:   return string("DEBUG");
    case WARNING: return string("WARN");
    case ERROR:   return string("ERROR");
    default:      return string("UNKNOWN");
  }
}

/*static*/ void CLog::GetTimeStamp (TIMESTAMP *ptb)
{
  //++
  //   Return the time stamp for right now!  Yes, this is a trivial function
  // but it's here to help hide the actual implementation of TIMESTAMP.
  //--
  gettimeofday(ptb, NULL);
}

/*static*/ string CLog::TimeStampToString (const TIMESTAMP *ptb)
{
  //++
  //   This method will convert the specified timestamp into the local time of
  // day as a string in the format "HH:MM:SS.ddd". Notice that the milliseconds
  // are included because many messages get logged in short intervals ...
  //--
  struct tm tmNow;  char szNow[32];
  time_t tSeconds = ptb->tv_sec;
  localtime_r(&tSeconds, &tmNow);
  snprintf(szNow, sizeof(szNow), "%02d:%02d:%02d.%03ld",
    tmNow.tm_hour, tmNow.tm_min, tmNow.tm_sec, (long) (ptb->tv_usec / 1000));
  return string(szNow);
}

string CLog::GetDefaultLogFileName() const
{
  //++
  //   This method returns a default name for the log file, something like
  // "program_yyyymmdd.log".  It's used when the caller doesn't specify an
  // explicit log file name...
  //--
  time_t tNow;  struct tm tmNow;  char szFN[256];
  time(&tNow);  localtime_r(&tNow, &tmNow);
  snprintf(szFN, sizeof(szFN), "%s_%04d%02d%02d.log",
    m_sProgram.c_str(), tmNow.tm_year+1900, tmNow.tm_mon+1, tmNow.tm_mday);
  return string(szFN);
}

bool CLog::OpenLog (const string &sFileName, SEVERITY nLevel, bool fAppend)
{
  //++
  //   This method opens a new log file and sets the default message level for
  // it. If the file name passed is empty, then a default file name will be
  // used instead.  Normally new text is appended to any existing file, however
  // if fAppend is false then any existing log will be overwritten.  In either
  // case a new, empty, file will be created if one does not exist.
  //--
  if (IsLogFileOpen()) CloseLog();
  string sName = sFileName.empty() ? GetDefaultLogFileName() : sFileName;
  FILE *pFile = fopen(sName.c_str(), fAppend ? "a+" : "w+");
  if (pFile == NULL) {
    LOGS(ERROR, "error (" << errno << ") opening log " << sName);
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(m_mtxPrint);
    m_pLogFile = pFile;  m_sLogName = sName;  m_lvlFile = nLevel;
  }
  LOGS(DEBUG, "log " << m_sLogName << " opened");
  return true;
}

void CLog::CloseLog()
{
  //++
  //   Close the currently open log file (if any).  Console logging is not
  // affected by this operation.
  //--
  if (!IsLogFileOpen()) return;
  LOGS(DEBUG, "log " << m_sLogName << " closed");
  std::lock_guard<std::mutex> lock(m_mtxPrint);
  fclose(m_pLogFile);
  m_pLogFile = NULL;  m_sLogName.clear();  m_lvlFile = NOLOG;
}

void CLog::Print (SEVERITY nLevel, ostringstream &osText)
{
  //++
  //   This method does the work for the LOGS() macro - it sends output from
  // an ostringstream to the console and/or log file.
  //--
  PrintText(nLevel, osText.str().c_str());
}

void CLog::Print (SEVERITY nLevel, const char *pszFormat, ...)
{
  //++
  //   And this method does the work for the LOGF() macro - it sends printf()
  // formatted output to the console and/or log file.  This takes a tiny bit
  // more work than the I/O streams version ...
  //--
  char szBuffer[MAXMSG];  va_list args;
  memset(szBuffer, 0, sizeof(szBuffer));
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  PrintText(nLevel, szBuffer);
}

void CLog::PrintText (SEVERITY nLevel, const char *pszText)
{
  //++
  //   Send a completely formatted message to the log file and/or the console,
  // depending on the current levels.  This is the one place where the print
  // mutex is taken, so that messages from different threads don't get mixed
  // together ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxPrint);
  if (IsLoggedToFile(nLevel)) SendLog(nLevel, pszText);
  if (IsLoggedToConsole(nLevel)) SendConsole(nLevel, pszText);
}

void CLog::LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText)
{
  //++
  //   This private method writes a text string, which must be guaranteed to
  // be a single line, to the log file.  A date/time stamp and the message
  // severity is also printed at the start of the line (which is why the
  // message text shouldn't contain newlines!)
  //--
  if (!IsLogFileOpen()) return;
  fprintf(m_pLogFile, "%s %s\t%s\n",
    TimeStampToString(ptb).c_str(),  sPrefix.c_str(), pszText);
  fflush(m_pLogFile);
}

void CLog::SendLog (SEVERITY nLevel, const char *pszText)
{
  //++
  //   This method sends text to the log file, where the text may contain
  // newline characters.  That's messy, because we have to split the text up
  // into individual lines for logging.  Every line gets the same time stamp.
  //--
  const char *pszEnd;  TIMESTAMP tbNow;
  GetTimeStamp(&tbNow);
  string sPrefix = LevelToString(nLevel);
  while ((pszEnd = strchr(pszText, '\n')) != NULL) {
    string sLine(pszText, pszEnd-pszText);
    LogSingleLine(&tbNow, sPrefix, sLine.c_str());
    pszText = pszEnd+1;
  }
  LogSingleLine(&tbNow, sPrefix, pszText);
}

void CLog::SendConsole (SEVERITY nLevel, const char *pszText)
{
  //++
  //   This method sends a message to the console (which is always stderr,
  // so that it never gets mixed up with any program output).  The format
  // depends on the severity of the message.
  //--
  switch (nLevel) {
    case TRACE:   fprintf(stderr, "-- %s\n", pszText);                       break;
    case DEBUG:   fprintf(stderr, "[%s]\n", pszText);                        break;
    default:      fprintf(stderr, "%s: %s\n", m_sProgram.c_str(), pszText);  break;
  }
}
