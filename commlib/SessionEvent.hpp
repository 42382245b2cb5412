//++
// SessionEvent.hpp -> CConnectionState and CSessionEvent value classes
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
//   CConnectionState is the state of a session - disconnected, connecting,
// connected, or failed with an error description.  CSessionEvent is what a
// session publishes to its subscribers - received data, sent data, a state
// change, or an error.  Both are plain values that are copied to every
// subscriber, so there's never any shared state between them.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
using std::string;              // ...
using std::vector;              // ...


class CConnectionState {
  //++
  // Session connection state ...
  //--
public:
  enum _STATE {
    DISCONNECTED,               // no connection
    CONNECTING,                 // opening the transport
    CONNECTED,                  // connected and the pump is running
    ERROR,                      // connection failed (see GetError())
  };
  typedef enum _STATE STATE;

public:
  CConnectionState (STATE nState=DISCONNECTED, const string &sError=string())
    : m_nState(nState), m_sError(sError) {};
  static CConnectionState Error (const string &sError) {return CConnectionState(ERROR, sError);}

public:
  STATE GetState() const {return m_nState;}
  string GetError() const {return m_sError;}
  bool IsConnected() const {return m_nState == CONNECTED;}
  string ToString() const;
  static const char *StateToString (STATE nState);
  bool operator== (const CConnectionState &s) const
    {return (m_nState == s.m_nState) && (m_sError == s.m_sError);}
  bool operator!= (const CConnectionState &s) const {return !(*this == s);}

private:
  STATE   m_nState;             // current state
  string  m_sError;             // error description (ERROR state only)
};


class CSessionEvent {
  //++
  // Event published by a session to all subscribers ...
  //--
public:
  enum _EVENT {
    DATA_RECEIVED,              // bytes arrived from the remote end
    DATA_SENT,                  // bytes were written to the remote end
    STATE_CHANGED,              // the connection state changed
    SESSION_ERROR,              // something went wrong
  };
  typedef enum _EVENT EVENT;

public:
  CSessionEvent() : m_nEvent(STATE_CHANGED), m_abData(), m_State(), m_sError() {};
  static CSessionEvent DataReceived (const uint8_t *pabData, size_t cbData);
  static CSessionEvent DataSent (const uint8_t *pabData, size_t cbData);
  static CSessionEvent StateChanged (const CConnectionState &state);
  static CSessionEvent Error (const string &sError);

public:
  EVENT GetEvent() const {return m_nEvent;}
  const vector<uint8_t> &GetData() const {return m_abData;}
  const CConnectionState &GetState() const {return m_State;}
  string GetError() const {return m_sError;}
  string ToString() const;

private:
  EVENT             m_nEvent;   // what kind of event this is
  vector<uint8_t>   m_abData;   // DATA_RECEIVED or DATA_SENT bytes
  CConnectionState  m_State;    // STATE_CHANGED new state
  string            m_sError;   // SESSION_ERROR description
};
