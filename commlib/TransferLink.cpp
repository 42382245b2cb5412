//++
// TransferLink.cpp -> CTransferLink (session to protocol engine glue) methods
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
//   This module implements CTransferLink.  See TransferLink.hpp for the
// details.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <thread>               // C++ std::thread
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "Session.hpp"          // CSession declarations
#include "FileTransfer.hpp"     // CFileTransfer declarations
#include "TransferLink.hpp"     // declarations for this module


void CTransferLink::ForwardThread (CByteChannel *pOutbound, CByteChannel *pInbound,
  CSession::LINK_STATUS *pnLink)
{
  //++
  //   This runs in its own thread for the duration of a transfer.  It takes
  // everything the protocol engine sends and writes it to the session.  It
  // exits when the engine is done (and the outbound channel is closed and
  // empty).  If a write fails then the inbound channel is closed, which the
  // engine sees as a disconnect, and the reason is left in *pnLink.
  //--
  vector<uint8_t> abData;  int nStatus;
  while ((nStatus = pOutbound->Receive(abData, FORWARD_POLL_TIME)) >= 0) {
    if (nStatus == 0) continue;
    CSession::LINK_STATUS nLink = m_Session.Send(abData);
    if (nLink != CTransport::LINK_OK) {
      LOGS(ERROR, m_Session.GetName() << " transfer send failed - " << CSession::LinkStatusToString(nLink));
      *pnLink = nLink;
      pInbound->Close();
      pOutbound->Close();
    }
  }
}

CFileTransfer::XFER_RESULT CTransferLink::Run (CFileTransfer &protocol, bool fSend,
  const string &sPath, CFileTransfer::STATUS_CHANNEL *pStatus, string &sFileName)
{
  //++
  //   Do the common work for SendFile() and ReceiveFile() - set up the
  // channels, divert the session, start the forwarding thread, run the
  // transfer, and then clean up ...
  //--
  if (!m_Session.IsConnected()) {
    LOGS(ERROR, m_Session.GetName() << " is not connected");
    return CFileTransfer::XFER_DISCONNECTED;
  }
  CByteChannel chInbound, chOutbound;
  if (!m_Session.DivertInbound(&chInbound)) {
    LOGS(ERROR, m_Session.GetName() << " is already busy with another transfer");
    return CFileTransfer::XFER_DISCONNECTED;
  }
  CSession::LINK_STATUS nLink = CTransport::LINK_OK;
  std::thread thForward(&CTransferLink::ForwardThread, this, &chOutbound, &chInbound, &nLink);

  XFER_RESULT nResult;
  if (fSend)
    nResult = protocol.SendFile(sPath, chOutbound, chInbound, pStatus);
  else
    nResult = protocol.ReceiveFile(sPath, chOutbound, chInbound, pStatus, sFileName);

  // Let the forwarding thread drain whatever's left, then put things back ...
  chOutbound.Close();
  thForward.join();
  m_Session.RestoreInbound();

  //   If the engine gave up because the forwarder couldn't write to a session
  // that's still connected, then that's an I/O error rather than a disconnect ...
  if ((nResult != CFileTransfer::XFER_SUCCESS) && (nLink == CTransport::LINK_IO_ERROR))
    nResult = CFileTransfer::XFER_IO_ERROR;
  LOGS(DEBUG, m_Session.GetName() << " " << protocol.GetName() << " transfer finished - "
    << CFileTransfer::ResultToString(nResult));
  return nResult;
}

CFileTransfer::XFER_RESULT CTransferLink::SendFile (CFileTransfer &protocol, const string &sPath,
  CFileTransfer::STATUS_CHANNEL *pStatus)
{
  string sIgnored;
  return Run(protocol, true, sPath, pStatus, sIgnored);
}

CFileTransfer::XFER_RESULT CTransferLink::ReceiveFile (CFileTransfer &protocol, const string &sDirectory,
  CFileTransfer::STATUS_CHANNEL *pStatus, string &sFileName)
{
  return Run(protocol, false, sDirectory, pStatus, sFileName);
}
