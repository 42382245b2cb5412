//++
// FileTransfer.hpp -> CFileTransfer (abstract file transfer protocol) class
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
//   CFileTransfer is the interface that every file transfer protocol (XMODEM
// for now, but maybe others later) implements.  A protocol engine doesn't
// know anything about sessions or transports - it's given a channel for the
// bytes it sends, a channel for the bytes it receives, and an optional
// channel for progress reports.  CTransferLink connects those channels to
// a CSession.
//
//   CTransferStatus is the progress report.  A new one is created for each
// transfer, updated as the transfer goes along, and a copy is sent to the
// status channel after every step that changes it.
//
//   Cancel() may be called from any thread at any time.  It sets a flag that
// the protocol engine checks every time around its wait loops, and the
// transfer in progress (or the next one, if none is in progress) ends with
// XFER_CANCELLED as soon as possible.  The flag stays set until ResetCancel()
// is called.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <atomic>               // C++ std::atomic
#include "Channel.hpp"          // CChannel template
using std::string;              // ...
using std::vector;              // ...


class CTransferStatus {
  //++
  // File transfer progress report ...
  //--
public:
  CTransferStatus (const string &sFileName=string())
    : m_sFileName(sFileName), m_qTotalBytes(0), m_fTotalBytes(false),
      m_lTotalPackets(0), m_fTotalPackets(false), m_lPacket(0),
      m_qBytes(0), m_lRetries(0), m_fComplete(false) {};

  // Properties ...
public:
  string GetFileName() const {return m_sFileName;}
  void SetFileName (const string &sFileName) {m_sFileName = sFileName;}
  // Total file size and packet count, when they're known ...
  bool HasTotalBytes() const {return m_fTotalBytes;}
  uint64_t GetTotalBytes() const {return m_qTotalBytes;}
  void SetTotalBytes (uint64_t qBytes) {m_qTotalBytes = qBytes;  m_fTotalBytes = true;}
  bool HasTotalPackets() const {return m_fTotalPackets;}
  uint32_t GetTotalPackets() const {return m_lTotalPackets;}
  void SetTotalPackets (uint32_t lPackets) {m_lTotalPackets = lPackets;  m_fTotalPackets = true;}
  // Current packet number and cumulative bytes transferred ...
  uint32_t GetPacket() const {return m_lPacket;}
  void SetPacket (uint32_t lPacket) {m_lPacket = lPacket;}
  uint64_t GetBytes() const {return m_qBytes;}
  void SetBytes (uint64_t qBytes) {m_qBytes = qBytes;}
  // Number of retries so far ...
  uint32_t GetRetries() const {return m_lRetries;}
  void AddRetry() {++m_lRetries;}
  // TRUE when the transfer has finished successfully ...
  bool IsComplete() const {return m_fComplete;}
  void SetComplete() {m_fComplete = true;}
  // Percent complete, or zero if the size isn't known ...
  uint32_t GetPercent() const;

private:
  string    m_sFileName;        // file being sent or received
  uint64_t  m_qTotalBytes;      // total size of the file ...
  bool      m_fTotalBytes;      //  ... if it's known
  uint32_t  m_lTotalPackets;    // total number of packets ...
  bool      m_fTotalPackets;    //  ... if it's known
  uint32_t  m_lPacket;          // current packet number
  uint64_t  m_qBytes;           // bytes transferred so far
  uint32_t  m_lRetries;         // total retries so far
  bool      m_fComplete;        // TRUE when the transfer is done
};


class CFileTransfer {
  //++
  // Abstract file transfer protocol interface ...
  //--

  // Transfer results ...
public:
  enum _XFER_RESULT {
    XFER_SUCCESS,               // transfer completed normally
    XFER_FILE_ERROR,            // unable to read or write the local file
    XFER_IO_ERROR,              // unable to send to the remote end
    XFER_DISCONNECTED,          // the connection went away
    XFER_TIMEOUT,               // the remote end stopped responding
    XFER_TOO_MANY_RETRIES,      // retry limit exceeded
    XFER_CANCELLED,             // cancelled by either end
  };
  typedef enum _XFER_RESULT XFER_RESULT;
  // Which part of the transfer failed ...
  enum _XFER_PHASE {
    PHASE_NONE,                 // nothing failed (yet!)
    PHASE_FILE,                 // opening, reading or writing the file
    PHASE_HANDSHAKE,            // waiting for the receiver to start
    PHASE_BLOCK,                // sending or receiving a data block
    PHASE_EOT,                  // finishing the transfer
  };
  typedef enum _XFER_PHASE XFER_PHASE;

  // Channel types used by all protocols ...
  typedef CChannel<vector<uint8_t> > BYTE_CHANNEL;
  typedef CChannel<CTransferStatus> STATUS_CHANNEL;

  // Constructor and destructor ...
public:
  CFileTransfer();
  virtual ~CFileTransfer() {};
private:
  // Disallow copy and assignment operations ...
  CFileTransfer (const CFileTransfer &) = delete;
  CFileTransfer& operator= (const CFileTransfer &) = delete;

  // Public protocol interface ...
public:
  // Return the name of this protocol ...
  virtual const char *GetName() const = 0;
  //   Send a file.  Bytes to be sent to the remote end go to chOutbound,
  // bytes from the remote end come from chInbound, and (if pStatus isn't
  // NULL) progress reports go to pStatus.
  virtual XFER_RESULT SendFile (const string &sPath, BYTE_CHANNEL &chOutbound,
    BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus=NULL) = 0;
  //   Receive a file into the directory sDirectory.  The protocol picks the
  // file name, and returns it (just the name, not the directory) in sFileName ...
  virtual XFER_RESULT ReceiveFile (const string &sDirectory, BYTE_CHANNEL &chOutbound,
    BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus, string &sFileName) = 0;
  // Cancel the current (or next) transfer ...
  void Cancel() {m_fCancel = true;}
  void ResetCancel() {m_fCancel = false;}
  bool IsCancelled() const {return m_fCancel;}

  // Error details for the last transfer ...
public:
  XFER_PHASE GetErrorPhase() const {return m_nErrorPhase;}
  uint32_t GetErrorBlock() const {return m_lErrorBlock;}
  string GetErrorText() const {return m_sErrorText;}
  static const char *ResultToString (XFER_RESULT nResult);
  static const char *PhaseToString (XFER_PHASE nPhase);

  // Methods for the derived classes ...
protected:
  void ClearError();
  XFER_RESULT Fail (XFER_RESULT nResult, XFER_PHASE nPhase, uint32_t lBlock, const string &sText);
  // Send a status snapshot, if anybody wants it ...
  static void Report (STATUS_CHANNEL *pStatus, const CTransferStatus &status)
    {if (pStatus != NULL) pStatus->Send(status);}

  // Private member data ...
private:
  std::atomic<bool> m_fCancel;        // set to cancel the transfer
  XFER_PHASE        m_nErrorPhase;    // phase of the last failure
  uint32_t          m_lErrorBlock;    // block number of the last failure
  string            m_sErrorText;     // description of the last failure
};
