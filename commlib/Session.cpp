//++
// Session.cpp -> CSession (transport independent connection) methods
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
//   This module implements the CSession class.  See Session.hpp for the
// big picture.
//
// NOTES:
//   * The pump thread is the only thing that ever reads from the transport.
// Writes come from whatever thread calls Send(), and they're serialized by
// m_mtxTransport.  The transport pointer itself only changes while the pump
// is stopped, so the pump can use it without taking any lock.
//
//   * The pump never blocks for longer than PUMP_POLL_TIME, so that it
// notices m_fStopPump promptly when Disconnect() is called.
//
//   * When the pump finds the connection broken it publishes an error and
// a change to DISCONNECTED and then exits, but it doesn't close or delete
// the transport.  That's left for Disconnect(), or the next Connect().
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "TransportConfig.hpp"  // CTransportConfig declarations
#include "Transport.hpp"        // CTransport declarations
#include "Channel.hpp"          // CChannel template
#include "Broadcast.hpp"        // CBroadcast template
#include "SessionEvent.hpp"     // CConnectionState and CSessionEvent
#include "Session.hpp"          // declarations for this module


CSession::CSession (const char *pszName, size_t nQueueCapacity)
  : m_sName(pszName), m_Events(nQueueCapacity), m_mtxState(), m_State(),
    m_sLastError(), m_mtxTransport(), m_pTransport(NULL), m_thPump(),
    m_fStopPump(false), m_mtxDivert(), m_pDivert(NULL)
{
}

CSession::~CSession()
{
  //++
  //   Destroying the session disconnects it, and then closes the broadcast
  // so that any subscribers still waiting will find out we're gone ...
  //--
  Disconnect();
  m_Events.Close();
}

/*static*/ const char *CSession::LinkStatusToString (LINK_STATUS nStatus)
{
  switch (nStatus) {
    case CTransport::LINK_OK:             return "OK";
    case CTransport::LINK_CONNECT_ERROR:  return "connect error";
    case CTransport::LINK_IO_ERROR:       return "I/O error";
    case CTransport::LINK_DISCONNECTED:   return "disconnected";
    default:                              return "unknown";
  }
}

CConnectionState CSession::GetState() const
{
  std::lock_guard<std::mutex> lock(m_mtxState);
  return m_State;
}

string CSession::GetLastError() const
{
  std::lock_guard<std::mutex> lock(m_mtxState);
  return m_sLastError;
}

string CSession::GetConnectionInfo() const
{
  //++
  //   Return a description of the current connection, or "not connected"
  // if there isn't one ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  return (m_pTransport != NULL) ? m_pTransport->GetConnectionInfo() : string("not connected");
}

bool CSession::GetStats (CTransport::TRANSPORT_STATS &stats) const
{
  //++
  // Return the transport statistics, if there's a transport ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  if (m_pTransport == NULL) return false;
  stats = m_pTransport->GetStats();
  return true;
}

void CSession::Publish (const CSessionEvent &ev)
{
  //++
  // Send an event to all subscribers ...
  //--
  if (ev.GetEvent() != CSessionEvent::DATA_RECEIVED) LOGS(TRACE, m_sName << " event " << ev.ToString());
  m_Events.Publish(ev);
}

void CSession::SetState (const CConnectionState &state)
{
  //++
  // Change the connection state and tell everybody about it ...
  //--
  {
    std::lock_guard<std::mutex> lock(m_mtxState);
    m_State = state;
    if (state.GetState() == CConnectionState::ERROR) m_sLastError = state.GetError();
  }
  LOGS(DEBUG, m_sName << " state " << state.ToString());
  Publish(CSessionEvent::StateChanged(state));
}

CSession::LINK_STATUS CSession::Connect (const CTransportConfig &cfg)
{
  //++
  //   Open a transport for the configuration given and, if that works, start
  // the pump thread.  If we're already connected, then the old connection is
  // closed first.  If the transport can't be opened then an error event and
  // an ERROR state change are published, and LINK_CONNECT_ERROR returned.
  //--
  Disconnect();
  SetState(CConnectionState::CONNECTING);
  string sError;
  CTransport *pTransport = CTransport::Open(cfg, sError);
  if (pTransport == NULL) {
    LOGS(ERROR, m_sName << " unable to connect - " << sError);
    Publish(CSessionEvent::Error(sError));
    SetState(CConnectionState::Error(sError));
    return CTransport::LINK_CONNECT_ERROR;
  }
  {
    std::lock_guard<std::mutex> lock(m_mtxTransport);
    m_pTransport = pTransport;
  }
  m_fStopPump = false;
  SetState(CConnectionState::CONNECTED);
  m_thPump = std::thread(&CSession::PumpThread, this);
  LOGS(WARNING, m_sName << " connected to " << pTransport->GetConnectionInfo());
  return CTransport::LINK_OK;
}

void CSession::StopPump()
{
  //++
  // Ask the pump thread to exit, and wait for it ...
  //--
  m_fStopPump = true;
  if (m_thPump.joinable()) m_thPump.join();
}

void CSession::Disconnect()
{
  //++
  //   Stop the pump, close the transport, and publish a final state change
  // to DISCONNECTED.  It's harmless to call this more than once; only the
  // first call does anything ...
  //--
  StopPump();
  CTransport *pTransport;
  {
    std::lock_guard<std::mutex> lock(m_mtxTransport);
    pTransport = m_pTransport;  m_pTransport = NULL;
  }
  if (pTransport != NULL) {
    pTransport->Close();
    delete pTransport;
  }
  if (GetState().GetState() != CConnectionState::DISCONNECTED) {
    SetState(CConnectionState::DISCONNECTED);
    LOGS(WARNING, m_sName << " disconnected");
  }
}

void CSession::PumpThread()
{
  //++
  //   This is the pump - it runs in its own thread, reads everything that
  // arrives from the transport, and either publishes it to the subscribers
  // or sends it to the diversion channel.  It exits when asked to, or when
  // the transport reports an error.
  //--
  assert(m_pTransport != NULL);
  uint8_t abBuffer[PUMP_BUFFER_SIZE];
  LOGS(DEBUG, m_sName << " pump started");
  while (!m_fStopPump) {
    int32_t cbRead = m_pTransport->Read(abBuffer, sizeof(abBuffer), PUMP_POLL_TIME);
    if (cbRead == 0) continue;

    if (cbRead > 0) {
      std::lock_guard<std::mutex> lock(m_mtxDivert);
      if (m_pDivert != NULL)
        m_pDivert->Send(vector<uint8_t>(abBuffer, abBuffer+cbRead));
      else
        Publish(CSessionEvent::DataReceived(abBuffer, cbRead));
      continue;
    }

    // The connection is broken ...
    if (m_fStopPump) break;
    string sError = m_pTransport->GetLastError();
    LOGS(ERROR, m_sName << " read error - " << sError);
    {
      std::lock_guard<std::mutex> lock(m_mtxState);
      m_sLastError = sError;
    }
    Publish(CSessionEvent::Error(sError));
    {
      std::lock_guard<std::mutex> lock(m_mtxDivert);
      if (m_pDivert != NULL) m_pDivert->Close();
    }
    SetState(CConnectionState::DISCONNECTED);
    break;
  }
  LOGS(DEBUG, m_sName << " pump stopped");
}

CSession::LINK_STATUS CSession::Send (const uint8_t *pabData, size_t cbData)
{
  //++
  //   Write bytes to the remote end.  There's no buffering and no retry -
  // either all the bytes are written or we return an error.  If the write
  // works, a DATA_SENT event is published ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  if ((m_pTransport == NULL) || !IsConnected()) return CTransport::LINK_DISCONNECTED;
  if (!m_pTransport->Write(pabData, cbData)) {
    string sError = m_pTransport->GetLastError();
    LOGS(ERROR, m_sName << " write error - " << sError);
    std::lock_guard<std::mutex> lockState(m_mtxState);
    m_sLastError = sError;
    return CTransport::LINK_IO_ERROR;
  }
  Publish(CSessionEvent::DataSent(pabData, cbData));
  return CTransport::LINK_OK;
}

CSession::LINK_STATUS CSession::SetDTR (bool fDTR)
{
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  if (m_pTransport == NULL) return CTransport::LINK_DISCONNECTED;
  if (!m_pTransport->SetDTR(fDTR)) {
    LOGS(ERROR, m_sName << " " << m_pTransport->GetLastError());
    return CTransport::LINK_IO_ERROR;
  }
  return CTransport::LINK_OK;
}

CSession::LINK_STATUS CSession::SetRTS (bool fRTS)
{
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  if (m_pTransport == NULL) return CTransport::LINK_DISCONNECTED;
  if (!m_pTransport->SetRTS(fRTS)) {
    LOGS(ERROR, m_sName << " " << m_pTransport->GetLastError());
    return CTransport::LINK_IO_ERROR;
  }
  return CTransport::LINK_OK;
}

CSession::LINK_STATUS CSession::SendBreak()
{
  std::lock_guard<std::mutex> lock(m_mtxTransport);
  if (m_pTransport == NULL) return CTransport::LINK_DISCONNECTED;
  if (!m_pTransport->SendBreak()) {
    LOGS(ERROR, m_sName << " " << m_pTransport->GetLastError());
    return CTransport::LINK_IO_ERROR;
  }
  return CTransport::LINK_OK;
}

bool CSession::DivertInbound (CByteChannel *pChannel)
{
  //++
  //   Send all inbound data to pChannel instead of the subscribers.  This
  // fails if some other diversion is already in effect ...
  //--
  assert(pChannel != NULL);
  std::lock_guard<std::mutex> lock(m_mtxDivert);
  if (m_pDivert != NULL) return false;
  m_pDivert = pChannel;
  LOGS(DEBUG, m_sName << " inbound data diverted");
  return true;
}

void CSession::RestoreInbound()
{
  //++
  // Stop diverting inbound data and go back to the subscribers ...
  //--
  std::lock_guard<std::mutex> lock(m_mtxDivert);
  if (m_pDivert == NULL) return;
  m_pDivert = NULL;
  LOGS(DEBUG, m_sName << " inbound data restored");
}

bool CSession::IsDiverted() const
{
  std::lock_guard<std::mutex> lock(m_mtxDivert);
  return m_pDivert != NULL;
}
