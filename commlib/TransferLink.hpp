//++
// TransferLink.hpp -> CTransferLink (session to protocol engine glue) class
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
//   CTransferLink runs one file transfer over a connected CSession.  It
// diverts the session's inbound data into the protocol engine's inbound
// channel, starts a thread that forwards everything the engine sends to
// CSession::Send(), runs the transfer in the caller's thread, and then puts
// the session back the way it was.  A failed transfer never disconnects
// the session.  If the forwarder can't write to a session that is still
// connected, the transfer fails with XFER_IO_ERROR instead of
// XFER_DISCONNECTED.
//
//   A link is good for any number of transfers, but only one at a time, and
// only one link can use a session at a time (that's enforced by
// CSession::DivertInbound()).
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <thread>               // C++ std::thread
#include "Session.hpp"          // CSession declarations
#include "FileTransfer.hpp"     // CFileTransfer declarations
using std::string;              // ...


class CTransferLink {
  //++
  // Run a file transfer over a session ...
  //--

  // Constants ...
public:
  enum {
    FORWARD_POLL_TIME = 100,    // forwarding thread poll interval (ms)
  };
  typedef CFileTransfer::XFER_RESULT XFER_RESULT;

  // Constructor and destructor ...
public:
  CTransferLink (CSession &session) : m_Session(session) {};
  virtual ~CTransferLink() {};
private:
  // Disallow copy and assignment operations ...
  CTransferLink (const CTransferLink &) = delete;
  CTransferLink& operator= (const CTransferLink &) = delete;

  // Public methods ...
public:
  XFER_RESULT SendFile (CFileTransfer &protocol, const string &sPath,
    CFileTransfer::STATUS_CHANNEL *pStatus=NULL);
  XFER_RESULT ReceiveFile (CFileTransfer &protocol, const string &sDirectory,
    CFileTransfer::STATUS_CHANNEL *pStatus, string &sFileName);

  // Private methods ...
private:
  XFER_RESULT Run (CFileTransfer &protocol, bool fSend, const string &sPath,
    CFileTransfer::STATUS_CHANNEL *pStatus, string &sFileName);
  void ForwardThread (CByteChannel *pOutbound, CByteChannel *pInbound,
    CSession::LINK_STATUS *pnLink);

  // Private member data ...
private:
  CSession   &m_Session;        // the session we're using
};
