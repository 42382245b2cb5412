//++
// Transport.cpp -> CTransport (abstract byte pipe) common methods
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
//   This file implements the parts of CTransport that are common to all
// transports - the Open() factory, statistics and error bookkeeping.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // memset(), ...
#include <time.h>               // time(), difftime(), ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "TransportConfig.hpp"  // CTransportConfig declarations
#include "Transport.hpp"        // declarations for this module
#include "SerialTransport.hpp"  // serial port transport
#include "TcpTransport.hpp"     // TCP/IP network transport


CTransport::CTransport (const CTransportConfig &cfg)
  : m_Config(cfg), m_mtxStats(), m_sLastError(), m_tConnected(0)
{
  memset(&m_Stats, 0, sizeof(m_Stats));
}

/*static*/ CTransport *CTransport::Open (const CTransportConfig &cfg, string &sError)
{
  //++
  //   Create a transport of the right type for this configuration and open
  // it.  If all is well, return a pointer to the new transport (which the
  // caller now owns).  If anything goes wrong then return NULL and a message
  // in sError ...
  //--
  if (!cfg.Validate(sError)) return NULL;
  CTransport *pTransport = NULL;  bool fOK = false;
  switch (cfg.GetType()) {
    case CTransportConfig::TRANSPORT_SERIAL: {
      CSerialTransport *pSerial = DBGNEW CSerialTransport(cfg);
      fOK = pSerial->Open();  pTransport = pSerial;
      break;
    }
    case CTransportConfig::TRANSPORT_NETWORK: {
      CTcpTransport *pTCP = DBGNEW CTcpTransport(cfg);
      fOK = pTCP->Open();  pTransport = pTCP;
      break;
    }
  }
  if (pTransport == NULL) {
    sError = "unknown transport type";  return NULL;
  }
  if (!fOK) {
    sError = pTransport->GetLastError();
    delete pTransport;  return NULL;
  }
  LOGS(DEBUG, "transport opened " << pTransport->GetConnectionInfo());
  return pTransport;
}

string CTransport::GetLastError() const
{
  std::lock_guard<std::mutex> lock(m_mtxStats);
  return m_sLastError;
}

void CTransport::SetLastError (const string &sError)
{
  std::lock_guard<std::mutex> lock(m_mtxStats);
  m_sLastError = sError;
}

CTransport::TRANSPORT_STATS CTransport::GetStats() const
{
  //++
  // Return a snapshot of the statistics, with the uptime filled in ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxStats);
  TRANSPORT_STATS stats = m_Stats;
  stats.lUptime = (m_tConnected != 0) ? (uint32_t) difftime(time(NULL), m_tConnected) : 0;
  return stats;
}

int32_t CTransport::Read (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout)
{
  //++
  //   Read up to cbBuffer bytes, waiting no more than lTimeout milliseconds
  // for something to arrive.  Returns the number of bytes read, zero if the
  // timeout expired, or -1 if the link is broken (GetLastError() has the
  // reason in that case) ...
  //--
  if (!IsOpen()) {
    SetLastError("transport is not open");  return -1;
  }
  int32_t cbRead = RawRead(pabBuffer, cbBuffer, lTimeout);
  std::lock_guard<std::mutex> lock(m_mtxStats);
  if (cbRead > 0) {
    m_Stats.qBytesReceived += cbRead;  ++m_Stats.qChunksReceived;
  } else if (cbRead < 0)
    ++m_Stats.qErrors;
  return cbRead;
}

bool CTransport::Write (const uint8_t *pabBuffer, size_t cbBuffer)
{
  //++
  //   Write all the bytes in the buffer.  Returns false if the link is
  // broken or the write fails for any reason.  A partial write is still a
  // failure ...
  //--
  if (!IsOpen()) {
    SetLastError("transport is not open");  return false;
  }
  bool fOK = RawWrite(pabBuffer, cbBuffer);
  std::lock_guard<std::mutex> lock(m_mtxStats);
  if (fOK) {
    m_Stats.qBytesSent += cbBuffer;  ++m_Stats.qChunksSent;
  } else
    ++m_Stats.qErrors;
  return fOK;
}
