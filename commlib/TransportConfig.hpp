//++
// TransportConfig.hpp -> CTransportConfig (serial or network endpoint) class
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
//   A CTransportConfig describes how to reach the other end of a connection.
// It's either a serial port (device path, baud rate, framing and flow
// control) or a network address (host name and TCP port).  Once constructed
// the object is never modified, and it's passed by value to whoever needs it.
//
//   Configurations can be created directly with the Serial() or Network()
// factory methods, or parsed from a connection string with Parse().  The
// syntax for the latter is
//
//      serial:<device>[,<baud>[,<framing>[,<flow>]]]
//      tcp:<host>:<port>[,<timeout>]
//
// where <framing> is something like "8N1" or "7E2", <flow> is one of the
// FLOW_CONTROL keywords, and <timeout> is the TCP connect timeout in seconds.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint16_t, uint32_t, ...
#include <string>               // C++ std::string class, et al ...
using std::string;              // ...


class CTransportConfig {
  //++
  // Serial or network endpoint configuration ...
  //--

  // Constants and enums ...
public:
  // Transport types ...
  enum _TRANSPORT_TYPE {
    TRANSPORT_SERIAL,           // local serial port
    TRANSPORT_NETWORK,          // TCP/IP connection
  };
  typedef enum _TRANSPORT_TYPE TRANSPORT_TYPE;
  // Serial port parity ...
  enum _PARITY {
    PARITY_NONE,                // no parity bit
    PARITY_ODD,                 // odd parity
    PARITY_EVEN,                // even parity
  };
  typedef enum _PARITY PARITY;
  // Serial port flow control ...
  enum _FLOW_CONTROL {
    FLOW_NONE,                  // no flow control
    FLOW_HARDWARE,              // RTS/CTS
    FLOW_SOFTWARE,              // XON/XOFF
  };
  typedef enum _FLOW_CONTROL FLOW_CONTROL;
  // Defaults ...
  enum {
    DEFAULT_BAUD          = 115200, // default serial baud rate
    DEFAULT_DATA_BITS     = 8,      // default number of data bits
    DEFAULT_STOP_BITS     = 1,      // default number of stop bits
    DEFAULT_TCP_TIMEOUT   = 10,     // default TCP connect timeout (seconds)
    DEFAULT_WRITE_TIMEOUT = 10000,  // longest a write may stall (milliseconds)
  };

  //   This structure is used to build tables of keywords and the associated
  // values (e.g. "hardware" -> FLOW_HARDWARE) for the Parse() method.
public:
  struct _KEYWORD {
    const char *m_pszName;
    intptr_t    m_pValue;
  };
  typedef struct _KEYWORD KEYWORD;
  static const KEYWORD g_keysTransport[];
  static const KEYWORD g_keysParity[];
  static const KEYWORD g_keysFlowControl[];

  // Constructors ...
public:
  //   The default constructor creates an invalid (empty serial path)
  // configuration, which is mostly useful as the target of Parse() ...
  CTransportConfig();
  // Create a serial port configuration ...
  static CTransportConfig Serial (const string &sPath, uint32_t lBaud=DEFAULT_BAUD,
    uint8_t nDataBits=DEFAULT_DATA_BITS, PARITY nParity=PARITY_NONE,
    uint8_t nStopBits=DEFAULT_STOP_BITS, FLOW_CONTROL nFlow=FLOW_NONE);
  // Create a network configuration ...
  static CTransportConfig Network (const string &sHost, uint16_t nPort,
    uint32_t lTimeout=DEFAULT_TCP_TIMEOUT);
  // Parse a connection string ...
  static bool Parse (const string &sText, CTransportConfig &cfg, string &sError);

  // Properties ...
public:
  TRANSPORT_TYPE GetType() const {return m_nType;}
  bool IsSerial() const {return m_nType == TRANSPORT_SERIAL;}
  bool IsNetwork() const {return m_nType == TRANSPORT_NETWORK;}
  // Serial port parameters ...
  string GetPath() const {return m_sPath;}
  uint32_t GetBaudRate() const {return m_lBaud;}
  uint8_t GetDataBits() const {return m_nDataBits;}
  PARITY GetParity() const {return m_nParity;}
  uint8_t GetStopBits() const {return m_nStopBits;}
  FLOW_CONTROL GetFlowControl() const {return m_nFlow;}
  // Network parameters ...
  string GetHost() const {return m_sHost;}
  uint16_t GetPort() const {return m_nPort;}
  uint32_t GetConnectTimeout() const {return m_lTimeout;}
  //   A write that makes no progress at all for this many milliseconds (the
  // peer isn't reading, or flow control is holding us off) fails ...
  uint32_t GetWriteTimeout() const {return m_lWriteTimeout;}
  void SetWriteTimeout (uint32_t lTimeout) {m_lWriteTimeout = lTimeout;}

  // Public methods ...
public:
  // Verify that all the parameters are reasonable ...
  bool Validate (string &sError) const;
  // Return a human readable description of the endpoint ...
  string ToString() const;
  // Convert enums to strings ...
  static const char *ParityToString (PARITY nParity);
  static const char *FlowControlToString (FLOW_CONTROL nFlow);
  // Search a keyword table (case insensitive) ...
  static int Search (const char *pszToken, const KEYWORD *paKeys);

  // Private methods ...
private:
  static bool ParseSerial (const string &sText, CTransportConfig &cfg, string &sError);
  static bool ParseNetwork (const string &sText, CTransportConfig &cfg, string &sError);
  static bool ParseFraming (const string &sText, CTransportConfig &cfg, string &sError);
  static bool ParseNumber (const string &sText, uint32_t lMax, uint32_t &lValue);

  // Private member data ...
private:
  TRANSPORT_TYPE  m_nType;      // serial or network
  string          m_sPath;      // serial device path (e.g. /dev/ttyUSB0)
  uint32_t        m_lBaud;      // serial baud rate
  uint8_t         m_nDataBits;  // data bits per character (5..8)
  PARITY          m_nParity;    // parity
  uint8_t         m_nStopBits;  // stop bits (1 or 2)
  FLOW_CONTROL    m_nFlow;      // flow control
  string          m_sHost;      // network host name or address
  uint16_t        m_nPort;      // network TCP port
  uint32_t        m_lTimeout;   // network connect timeout (seconds)
  uint32_t        m_lWriteTimeout;  // write stall timeout (milliseconds)
};
