//++
// Session.hpp -> CSession (transport independent connection) class
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
//   A CSession owns one transport (serial or TCP, it doesn't care which) and
// a background "pump" thread that reads from it.  Everything the pump reads
// is published, along with every state change and error, to any number of
// subscribers through a CBroadcast.  Subscribers each have their own bounded
// queue, so a slow subscriber never holds up the pump or anybody else.
//
//   The session goes through the states DISCONNECTED -> CONNECTING ->
// CONNECTED and then either back to DISCONNECTED or to ERROR.  Send() works
// only in the CONNECTED state.
//
//   For file transfers the inbound data can be temporarily diverted into a
// CChannel with DivertInbound().  While that's in effect the subscribers see
// no DATA_RECEIVED events at all, and the protocol engine gets every byte.
// RestoreInbound() puts things back to normal.  Only one diversion can be in
// effect at any time.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <thread>               // C++ std::thread
#include <mutex>                // C++ std::mutex, std::lock_guard, ...
#include <atomic>               // C++ std::atomic
#include "TransportConfig.hpp"  // CTransportConfig declarations
#include "Transport.hpp"        // CTransport declarations
#include "Channel.hpp"          // CChannel template
#include "Broadcast.hpp"        // CBroadcast and CSubscription templates
#include "SessionEvent.hpp"     // CConnectionState and CSessionEvent
using std::string;              // ...
using std::vector;              // ...

// Handy shorthand for the session event subscriber handle ...
typedef CSubscription<CSessionEvent> CEventSubscription;
// And for a channel of raw bytes ...
typedef CChannel<vector<uint8_t> > CByteChannel;


class CSession {
  //++
  // Transport independent communications session ...
  //--

  // Constants ...
public:
  enum {
    PUMP_BUFFER_SIZE  = 4096,   // largest chunk the pump reads at once
    PUMP_POLL_TIME    = 100,    // pump checks for shutdown this often (ms)
  };
  typedef CTransport::LINK_STATUS LINK_STATUS;

  // Constructor and destructor ...
public:
  CSession (const char *pszName="session", size_t nQueueCapacity=CBroadcast<CSessionEvent>::DEFAULT_CAPACITY);
  virtual ~CSession();
private:
  // Disallow copy and assignment operations ...
  CSession (const CSession &) = delete;
  CSession& operator= (const CSession &) = delete;

  // Public properties ...
public:
  string GetName() const {return m_sName;}
  CConnectionState GetState() const;
  bool IsConnected() const {return GetState().IsConnected();}
  string GetConnectionInfo() const;
  string GetLastError() const;
  bool GetStats (CTransport::TRANSPORT_STATS &stats) const;
  static const char *LinkStatusToString (LINK_STATUS nStatus);

  // Public session methods ...
public:
  // Open a transport and start the pump ...
  LINK_STATUS Connect (const CTransportConfig &cfg);
  // Stop the pump and close the transport ...
  void Disconnect();
  // Write bytes to the remote end ...
  LINK_STATUS Send (const uint8_t *pabData, size_t cbData);
  LINK_STATUS Send (const vector<uint8_t> &abData)
    {return Send(abData.data(), abData.size());}
  LINK_STATUS Send (const string &sText)
    {return Send((const uint8_t *) sText.data(), sText.length());}
  // Create a new event subscriber ...
  CEventSubscription Subscribe() {return m_Events.Subscribe();}
  // Modem control (serial only) ...
  LINK_STATUS SetDTR (bool fDTR);
  LINK_STATUS SetRTS (bool fRTS);
  LINK_STATUS SendBreak();
  // Divert inbound data to a protocol engine, and put it back again ...
  bool DivertInbound (CByteChannel *pChannel);
  void RestoreInbound();
  bool IsDiverted() const;

  // Private methods ...
private:
  void SetState (const CConnectionState &state);
  void Publish (const CSessionEvent &ev);
  void PumpThread();
  void StopPump();

  // Private member data ...
private:
  const string                m_sName;        // name of this session (for messages)
  CBroadcast<CSessionEvent>   m_Events;       // subscriber fan out
  mutable std::mutex          m_mtxState;     // protects m_State and m_sLastError
  CConnectionState            m_State;        // current connection state
  string                      m_sLastError;   // last error message
  mutable std::mutex          m_mtxTransport; // serializes writes and transport changes
  CTransport                 *m_pTransport;   // current transport (NULL if none)
  std::thread                 m_thPump;       // the pump thread
  std::atomic<bool>           m_fStopPump;    // set to ask the pump to exit
  mutable std::mutex          m_mtxDivert;    // protects m_pDivert
  CByteChannel               *m_pDivert;      // inbound diversion (NULL if none)
};
