//++
// TransportConfig.cpp -> CTransportConfig (serial or network endpoint) methods
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
//   This module implements the CTransportConfig class, which is mostly
// parsing and validation of connection parameters.  See TransportConfig.hpp
// for the connection string syntax.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // strcmp(), ...
#include <strings.h>            // strcasecmp(), ...
#include <ctype.h>              // isdigit(), toupper(), ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "TransportConfig.hpp"  // declarations for this module


// Transport type keywords (the prefix on the connection string) ...
const CTransportConfig::KEYWORD CTransportConfig::g_keysTransport[] = {
  {"serial",  TRANSPORT_SERIAL},
  {"tcp",     TRANSPORT_NETWORK},
  {"net",     TRANSPORT_NETWORK},
  {NULL, 0}
};

// Parity keywords (the middle character of "8N1") ...
const CTransportConfig::KEYWORD CTransportConfig::g_keysParity[] = {
  {"N",       PARITY_NONE},
  {"O",       PARITY_ODD},
  {"E",       PARITY_EVEN},
  {NULL, 0}
};

// Flow control keywords ...
const CTransportConfig::KEYWORD CTransportConfig::g_keysFlowControl[] = {
  {"none",     FLOW_NONE},
  {"hardware", FLOW_HARDWARE},
  {"rts",      FLOW_HARDWARE},
  {"software", FLOW_SOFTWARE},
  {"xon",      FLOW_SOFTWARE},
  {NULL, 0}
};


CTransportConfig::CTransportConfig()
  : m_nType(TRANSPORT_SERIAL), m_sPath(), m_lBaud(DEFAULT_BAUD),
    m_nDataBits(DEFAULT_DATA_BITS), m_nParity(PARITY_NONE),
    m_nStopBits(DEFAULT_STOP_BITS), m_nFlow(FLOW_NONE),
    m_sHost(), m_nPort(0), m_lTimeout(DEFAULT_TCP_TIMEOUT),
    m_lWriteTimeout(DEFAULT_WRITE_TIMEOUT)
{
}

/*static*/ CTransportConfig CTransportConfig::Serial (const string &sPath, uint32_t lBaud,
  uint8_t nDataBits, PARITY nParity, uint8_t nStopBits, FLOW_CONTROL nFlow)
{
  CTransportConfig cfg;
  cfg.m_nType = TRANSPORT_SERIAL;  cfg.m_sPath = sPath;  cfg.m_lBaud = lBaud;
  cfg.m_nDataBits = nDataBits;  cfg.m_nParity = nParity;
  cfg.m_nStopBits = nStopBits;  cfg.m_nFlow = nFlow;
  return cfg;
}

/*static*/ CTransportConfig CTransportConfig::Network (const string &sHost, uint16_t nPort, uint32_t lTimeout)
{
  CTransportConfig cfg;
  cfg.m_nType = TRANSPORT_NETWORK;  cfg.m_sHost = sHost;
  cfg.m_nPort = nPort;  cfg.m_lTimeout = lTimeout;
  return cfg;
}

/*static*/ const char *CTransportConfig::ParityToString (PARITY nParity)
{
  switch (nParity) {
    case PARITY_NONE: return "N";
    case PARITY_ODD:  return "O";
    case PARITY_EVEN: return "E";
    default:          return "?";
  }
}

/*static*/ const char *CTransportConfig::FlowControlToString (FLOW_CONTROL nFlow)
{
  switch (nFlow) {
    case FLOW_NONE:     return "No FC";
    case FLOW_HARDWARE: return "HW FC";
    case FLOW_SOFTWARE: return "SW FC";
    default:            return "?? FC";
  }
}

string CTransportConfig::ToString() const
{
  //++
  //   Return a human readable description of this endpoint, for example
  // "/dev/ttyUSB0 @ 115200 baud (8N1 No FC)" or "localhost:23" ...
  //--
  if (IsNetwork()) return FormatString("%s:%u", m_sHost.c_str(), m_nPort);
  return FormatString("%s @ %u baud (%u%s%u %s)", m_sPath.c_str(), m_lBaud,
    m_nDataBits, ParityToString(m_nParity), m_nStopBits, FlowControlToString(m_nFlow));
}

bool CTransportConfig::Validate (string &sError) const
{
  //++
  //   Check that all the parameters make sense.  If they don't, return false
  // and a message describing what's wrong.  Note that this doesn't check
  // that the device or host actually exists - that's up to the transport!
  //--
  if (IsSerial()) {
    if (m_sPath.empty()) {
      sError = "serial device path is empty";  return false;
    }
    if (m_lBaud == 0) {
      sError = "baud rate must be greater than zero";  return false;
    }
    if ((m_nDataBits < 5) || (m_nDataBits > 8)) {
      sError = FormatString("invalid data bits %u (must be 5..8)", m_nDataBits);  return false;
    }
    if ((m_nStopBits < 1) || (m_nStopBits > 2)) {
      sError = FormatString("invalid stop bits %u (must be 1 or 2)", m_nStopBits);  return false;
    }
  } else {
    if (m_sHost.empty()) {
      sError = "host name is empty";  return false;
    }
    if (m_nPort == 0) {
      sError = "TCP port must be 1..65535";  return false;
    }
  }
  return true;
}

/*static*/ int CTransportConfig::Search (const char *pszToken, const KEYWORD *paKeys)
{
  //++
  //   Search a keyword table for a match with the token and return its
  // index, or -1 if there isn't any match.  Keywords are case insensitive
  // and must match exactly (no abbreviations) ...
  //--
  for (int i = 0;  paKeys[i].m_pszName != NULL;  ++i)
    if (STRIEQL(pszToken, paKeys[i].m_pszName)) return i;
  return -1;
}

/*static*/ bool CTransportConfig::ParseNumber (const string &sText, uint32_t lMax, uint32_t &lValue)
{
  //++
  //   Parse an unsigned decimal number and verify that it's no larger than
  // lMax.  Leading and trailing junk of any kind is an error ...
  //--
  if (sText.empty() || (sText.length() > 10)) return false;
  uint64_t qValue = 0;
  for (size_t i = 0;  i < sText.length();  ++i) {
    if (!isdigit((unsigned char) sText[i])) return false;
    qValue = qValue*10 + (sText[i]-'0');
  }
  if (qValue > lMax) return false;
  lValue = (uint32_t) qValue;
  return true;
}

/*static*/ bool CTransportConfig::ParseFraming (const string &sText, CTransportConfig &cfg, string &sError)
{
  //++
  // Parse the "8N1" style framing specification ...
  //--
  if (sText.length() != 3) {
    sError = "invalid framing \"" + sText + "\"";  return false;
  }
  char szParity[2] = {sText[1], 0};
  int nParity = Search(szParity, g_keysParity);
  if (!isdigit((unsigned char) sText[0]) || !isdigit((unsigned char) sText[2]) || (nParity < 0)) {
    sError = "invalid framing \"" + sText + "\"";  return false;
  }
  cfg.m_nDataBits = sText[0] - '0';
  cfg.m_nParity = (PARITY) g_keysParity[nParity].m_pValue;
  cfg.m_nStopBits = sText[2] - '0';
  return true;
}

/*static*/ bool CTransportConfig::ParseSerial (const string &sText, CTransportConfig &cfg, string &sError)
{
  //++
  //   Parse the "<device>[,<baud>[,<framing>[,<flow>]]]" part of a serial
  // connection string.  Anything omitted gets the default value ...
  //--
  cfg = Serial("");
  size_t nField = 0, nStart = 0;
  while (nStart <= sText.length()) {
    size_t nComma = sText.find(',', nStart);
    if (nComma == string::npos) nComma = sText.length();
    string sField = sText.substr(nStart, nComma-nStart);
    switch (nField++) {
      case 0:
        cfg.m_sPath = sField;  break;
      case 1:
        if (!ParseNumber(sField, UINT32_MAX, cfg.m_lBaud)) {
          sError = "invalid baud rate \"" + sField + "\"";  return false;
        }
        break;
      case 2:
        if (!ParseFraming(sField, cfg, sError)) return false;
        break;
      case 3: {
        int nFlow = Search(sField.c_str(), g_keysFlowControl);
        if (nFlow < 0) {
          sError = "unknown flow control \"" + sField + "\"";  return false;
        }
        cfg.m_nFlow = (FLOW_CONTROL) g_keysFlowControl[nFlow].m_pValue;
        break;
      }
      default:
        sError = "too many serial parameters";  return false;
    }
    nStart = nComma+1;
  }
  return true;
}

/*static*/ bool CTransportConfig::ParseNetwork (const string &sText, CTransportConfig &cfg, string &sError)
{
  //++
  //   Parse the "<host>:<port>[,<timeout>]" part of a network connection
  // string.  The port is separated from the host by the LAST colon, so
  // that the host may be a bare IPv6 address ...
  //--
  cfg = Network("", 0);
  string sAddress = sText;
  size_t nComma = sText.find(',');
  if (nComma != string::npos) {
    sAddress = sText.substr(0, nComma);
    if (!ParseNumber(sText.substr(nComma+1), 3600, cfg.m_lTimeout) || (cfg.m_lTimeout == 0)) {
      sError = "invalid connect timeout \"" + sText.substr(nComma+1) + "\"";  return false;
    }
  }
  size_t nColon = sAddress.rfind(':');
  if (nColon == string::npos) {
    sError = "missing TCP port in \"" + sAddress + "\"";  return false;
  }
  uint32_t lPort;
  string sPort = sAddress.substr(nColon+1);
  if (!ParseNumber(sPort, 65535, lPort)) {
    sError = "invalid TCP port \"" + sPort + "\"";  return false;
  }
  cfg.m_sHost = sAddress.substr(0, nColon);  cfg.m_nPort = (uint16_t) lPort;
  return true;
}

/*static*/ bool CTransportConfig::Parse (const string &sText, CTransportConfig &cfg, string &sError)
{
  //++
  //   Parse a complete connection string, "serial:..." or "tcp:...", and
  // then validate the result.  If anything is wrong, return false and an
  // error message; cfg is undefined in that case ...
  //--
  size_t nColon = sText.find(':');
  if (nColon == string::npos) {
    sError = "missing transport type in \"" + sText + "\"";  return false;
  }
  string sType = sText.substr(0, nColon);
  int nType = Search(sType.c_str(), g_keysTransport);
  if (nType < 0) {
    sError = "unknown transport type \"" + sType + "\"";  return false;
  }
  string sRest = sText.substr(nColon+1);
  bool fOK = (g_keysTransport[nType].m_pValue == TRANSPORT_SERIAL)
           ? ParseSerial(sRest, cfg, sError) : ParseNetwork(sRest, cfg, sError);
  if (!fOK || !cfg.Validate(sError)) return false;
  LOGS(DEBUG, "parsed connection \"" << sText << "\" -> " << cfg.ToString());
  return true;
}
