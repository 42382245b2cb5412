//++
// Transport.hpp -> CTransport (abstract byte pipe) interface class
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
//   CTransport is the abstract interface for anything that can move bytes to
// and from a remote peer - a serial port (CSerialTransport) or a TCP socket
// (CTcpTransport).  The derived classes implement only the RawXXX() methods;
// this base class wraps those with the statistics bookkeeping and the error
// text handling that every transport needs.
//
//   Transports are created by the static Open() method, which looks at the
// CTransportConfig and picks the right derived class.  The caller owns the
// object that's returned and must delete it when done.
//
//   A transport is NOT generally thread safe, however it's guaranteed that
// one thread may call Read() while another thread calls Write().  That's
// exactly how a CSession uses it.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <time.h>               // time_t, time(), ...
#include <string>               // C++ std::string class, et al ...
#include <mutex>                // C++ std::mutex, std::lock_guard, ...
#include "TransportConfig.hpp"  // CTransportConfig declarations
using std::string;              // ...


class CTransport {
  //++
  // Abstract serial port or network connection interface class ...
  //--

  // Link status codes ...
public:
  enum _LINK_STATUS {
    LINK_OK,                    // success
    LINK_CONNECT_ERROR,         // unable to open the device or connect
    LINK_IO_ERROR,              // read or write failed
    LINK_DISCONNECTED,          // no connection (or the connection was lost)
  };
  typedef enum _LINK_STATUS LINK_STATUS;

  // Transfer statistics ...
public:
  struct _TRANSPORT_STATS {
    uint64_t  qBytesSent;       // total bytes written
    uint64_t  qBytesReceived;   // total bytes read
    uint64_t  qChunksSent;      // number of Write() calls
    uint64_t  qChunksReceived;  // number of non-empty Read() calls
    uint64_t  qErrors;          // number of read or write errors
    uint32_t  lUptime;          // seconds since the connection was opened
  };
  typedef struct _TRANSPORT_STATS TRANSPORT_STATS;

  // Constructor and destructor ...
public:
  CTransport (const CTransportConfig &cfg);
  virtual ~CTransport() {};
private:
  // Disallow copy and assignment operations ...
  CTransport (const CTransport &) = delete;
  CTransport& operator= (const CTransport &) = delete;

  // Create and open the right kind of transport for a configuration ...
public:
  static CTransport *Open (const CTransportConfig &cfg, string &sError);

  // Public properties ...
public:
  const CTransportConfig &GetConfig() const {return m_Config;}
  // Return a human readable description of the connection ...
  virtual string GetConnectionInfo() const {return m_Config.ToString();}
  // Return the last error message ...
  string GetLastError() const;
  // Return a copy of the statistics ...
  TRANSPORT_STATS GetStats() const;
  virtual bool IsOpen() const = 0;

  // Public transport methods ...
public:
  // Read whatever is available, waiting at most lTimeout milliseconds ...
  int32_t Read (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout);
  // Write all the bytes, or fail ...
  bool Write (const uint8_t *pabBuffer, size_t cbBuffer);
  // Close the connection (idempotent) ...
  virtual void Close() = 0;
  //   Modem control.  These are meaningful only for serial ports; for
  // network connections they do nothing and always succeed.
  virtual bool SetDTR (bool fDTR) {return true;}
  virtual bool SetRTS (bool fRTS) {return true;}
  virtual bool SendBreak() {return true;}

  // Methods implemented by the derived classes ...
protected:
  //   RawRead() returns the number of bytes read, zero if the timeout
  // expired, or -1 if the connection is broken.  RawWrite() returns false
  // on any error.  Either way, use SetLastError() for the details ...
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout) = 0;
  virtual bool RawWrite (const uint8_t *pabBuffer, size_t cbBuffer) = 0;
  // Record the reason for the most recent failure ...
  void SetLastError (const string &sError);
  // Start the uptime clock ...
  void SetConnected() {m_tConnected = time(NULL);}

  // Private member data ...
protected:
  const CTransportConfig  m_Config;     // how this transport was opened
private:
  mutable std::mutex      m_mtxStats;   // protects m_Stats and m_sLastError
  TRANSPORT_STATS         m_Stats;      // transfer statistics
  string                  m_sLastError; // text of the last error
  time_t                  m_tConnected; // time the connection was opened
};
