//++
// SessionEvent.cpp -> CConnectionState and CSessionEvent methods
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
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, ...
#include "COMMLIB.hpp"          // communications library definitions
#include "SessionEvent.hpp"     // declarations for this module


/*static*/ const char *CConnectionState::StateToString (STATE nState)
{
  switch (nState) {
    case DISCONNECTED:  return "Disconnected";
    case CONNECTING:    return "Connecting";
    case CONNECTED:     return "Connected";
    case ERROR:         return "Error";
    default:            return "Unknown";
  }
}

string CConnectionState::ToString() const
{
  if (m_nState == ERROR) return string("Error: ") + m_sError;
  return StateToString(m_nState);
}

/*static*/ CSessionEvent CSessionEvent::DataReceived (const uint8_t *pabData, size_t cbData)
{
  CSessionEvent ev;
  ev.m_nEvent = DATA_RECEIVED;  ev.m_abData.assign(pabData, pabData+cbData);
  return ev;
}

/*static*/ CSessionEvent CSessionEvent::DataSent (const uint8_t *pabData, size_t cbData)
{
  CSessionEvent ev;
  ev.m_nEvent = DATA_SENT;  ev.m_abData.assign(pabData, pabData+cbData);
  return ev;
}

/*static*/ CSessionEvent CSessionEvent::StateChanged (const CConnectionState &state)
{
  CSessionEvent ev;
  ev.m_nEvent = STATE_CHANGED;  ev.m_State = state;
  return ev;
}

/*static*/ CSessionEvent CSessionEvent::Error (const string &sError)
{
  CSessionEvent ev;
  ev.m_nEvent = SESSION_ERROR;  ev.m_sError = sError;
  return ev;
}

string CSessionEvent::ToString() const
{
  //++
  // Describe this event (for the log file, mostly) ...
  //--
  switch (m_nEvent) {
    case DATA_RECEIVED: return FormatString("DataReceived(%u bytes)", (unsigned) m_abData.size());
    case DATA_SENT:     return FormatString("DataSent(%u bytes)", (unsigned) m_abData.size());
    case STATE_CHANGED: return "StateChanged(" + m_State.ToString() + ")";
    case SESSION_ERROR: return "Error(" + m_sError + ")";
    default:            return "Unknown";
  }
}
