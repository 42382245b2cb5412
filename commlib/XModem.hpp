//++
// XModem.hpp -> CXModem (XMODEM, XMODEM-CRC and XMODEM-1K protocol) class
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
//   CXModem implements the XMODEM file transfer protocol, in all three of its
// common flavors - the original with 128 byte blocks and an 8 bit checksum,
// XMODEM-CRC with a 16 bit CRC, and XMODEM-1K with 1024 byte blocks and a CRC.
// Every packet looks like this -
//
//      <SOH|STX> <block> <~block> <128 or 1024 data bytes> <checksum|CRC>
//
// SOH means 128 data bytes follow and STX means 1024.  The block number
// starts at 1 and wraps around after 255 to 0.  The checksum is a single
// byte, the sum of all the data bytes, and the CRC is two bytes (high byte
// first) computed with the CCITT polynomial 0x1021 and a zero seed.  The last
// block of a file is padded with SUB (^Z) characters, and the receiver
// strips all trailing SUBs from the file when it's done.
//
//   The receiver starts things off by sending 'C' (for CRC mode) or NAK (for
// checksum mode), and the sender uses whatever mode the receiver asks for.
// The sender ends the transfer by sending EOT, and either end can abort the
// transfer by sending CAN.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint16_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <deque>                // C++ std::deque template
#include <chrono>               // C++ std::chrono::steady_clock, ...
#include "FileTransfer.hpp"     // CFileTransfer base class
using std::string;              // ...
using std::vector;              // ...


class CXModem : public CFileTransfer {
  //++
  // XMODEM file transfer protocol ...
  //--

  // Generic constants ...
public:
  enum {
    // Magic XMODEM characters ...
    SOH             = 0x01,     // start of a 128 byte block
    STX             = 0x02,     // start of a 1024 byte block
    EOT             = 0x04,     // end of transmission (last block)
    ACK             = 0x06,     // block received OK
    NAK             = 0x15,     // block NOT received OK
    CAN             = 0x18,     // cancel the transfer
    SUB             = 0x1A,     // used as a padding character for the last block
    XPAD            = SUB,      // standard character for padding last buffer
    CRCREQ          = 'C',      // receiver requests CRC mode
    // Other protocol constants ...
    XBLKLEN         = 128,      // standard block size (data bytes only!)
    XBLKLEN1K       = 1024,     // XMODEM-1K block size
    CANCOUNT        = 3,        // number of CANs we send to abort
    // Default timing and retry parameters ...
    MAXRETRY        = 10,       // retries allowed for any one step
    HANDSHAKE_TIME  = 60000,    // wait this long for the receiver to start (ms)
    RESPONSE_TIME   = 10000,    // wait this long for ACK/NAK or a block (ms)
    BYTE_TIME       = 1000,     // longest gap between bytes in a block (ms)
    POLL_TIME       = 100,      // check for cancel this often (ms)
  };

  // Protocol variants ...
public:
  enum _XMODEM_VARIANT {
    XMODEM_CHECKSUM,            // 128 byte blocks, 8 bit checksum
    XMODEM_CRC,                 // 128 byte blocks, 16 bit CRC
    XMODEM_1K,                  // 1024 byte blocks, 16 bit CRC
  };
  typedef enum _XMODEM_VARIANT XMODEM_VARIANT;

  // Constructor and destructor ...
public:
  CXModem (XMODEM_VARIANT nVariant=XMODEM_CRC);
  virtual ~CXModem() {};
private:
  // Disallow copy and assignment operations ...
  CXModem (const CXModem &) = delete;
  CXModem& operator= (const CXModem &) = delete;

  // Public properties ...
public:
  virtual const char *GetName() const override {return VariantToString(m_nVariant);}
  static const char *VariantToString (XMODEM_VARIANT nVariant);
  XMODEM_VARIANT GetVariant() const {return m_nVariant;}
  size_t GetBlockSize() const {return (m_nVariant == XMODEM_1K) ? XBLKLEN1K : XBLKLEN;}
  bool IsCRC() const {return m_nVariant != XMODEM_CHECKSUM;}
  // Timeouts (all in milliseconds) and the retry limit ...
  void SetHandshakeTimeout (uint32_t lTimeout) {m_lHandshakeTimeout = lTimeout;}
  uint32_t GetHandshakeTimeout() const {return m_lHandshakeTimeout;}
  void SetResponseTimeout (uint32_t lTimeout) {m_lResponseTimeout = lTimeout;}
  uint32_t GetResponseTimeout() const {return m_lResponseTimeout;}
  void SetByteTimeout (uint32_t lTimeout) {m_lByteTimeout = lTimeout;}
  uint32_t GetByteTimeout() const {return m_lByteTimeout;}
  void SetMaxRetries (uint32_t nRetries) {m_nMaxRetries = nRetries;}
  uint32_t GetMaxRetries() const {return m_nMaxRetries;}

  // Packet level functions ...
public:
  static uint8_t Checksum (const uint8_t *pabData, size_t cbData);
  static uint16_t CRC16 (const uint8_t *pabData, size_t cbData);
  static size_t PacketLength (size_t cbBlock, bool fCRC) {return 3 + cbBlock + (fCRC ? 2 : 1);}
  static void BuildPacket (uint8_t bBlock, const uint8_t *pabData, size_t cbData,
    size_t cbBlock, bool fCRC, vector<uint8_t> &abPacket);
  // Pick a unique name for a received file ...
  static string MakeReceiveName (const string &sDirectory);

  // CFileTransfer methods ...
public:
  virtual XFER_RESULT SendFile (const string &sPath, BYTE_CHANNEL &chOutbound,
    BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus=NULL) override;
  virtual XFER_RESULT ReceiveFile (const string &sDirectory, BYTE_CHANNEL &chOutbound,
    BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus, string &sFileName) override;

  // Private types ...
private:
  enum _READ_STATUS {
    READ_OK,                    // a byte was read
    READ_TIMEOUT,               // nothing arrived in time
    READ_CLOSED,                // the inbound channel was closed
    READ_CANCELLED,             // the transfer was cancelled locally
  };
  typedef enum _READ_STATUS READ_STATUS;
  enum _FRAME_STATUS {
    FRAME_OK,                   // good block
    FRAME_SHORT,                // timeout in the middle of a block
    FRAME_BAD_NUMBER,           // block number and complement don't match
    FRAME_BAD_CHECK,            // checksum or CRC doesn't match
    FRAME_CLOSED,               // the inbound channel was closed
    FRAME_CANCELLED,            // the transfer was cancelled locally
  };
  typedef enum _FRAME_STATUS FRAME_STATUS;
  typedef std::chrono::steady_clock::time_point DEADLINE;

  // Private methods ...
private:
  // Low level I/O ...
  READ_STATUS ReadByte (BYTE_CHANNEL &chInbound, uint8_t &bData, uint32_t lTimeout);
  READ_STATUS ReadByteBefore (BYTE_CHANNEL &chInbound, uint8_t &bData, const DEADLINE &tDeadline);
  bool WriteBytes (BYTE_CHANNEL &chOutbound, const uint8_t *pabData, size_t cbData);
  bool WriteByte (BYTE_CHANNEL &chOutbound, uint8_t bData) {return WriteBytes(chOutbound, &bData, 1);}
  XFER_RESULT CancelTransfer (BYTE_CHANNEL &chOutbound, XFER_PHASE nPhase, uint32_t lBlock);
  static DEADLINE MakeDeadline (uint32_t lTimeout);
  // Sender functions ...
  XFER_RESULT WaitHandshake (BYTE_CHANNEL &chOutbound, BYTE_CHANNEL &chInbound,
    CTransferStatus &status, STATUS_CHANNEL *pStatus, bool &fCRC);
  XFER_RESULT SendAndWaitACK (const uint8_t *pabData, size_t cbData, XFER_PHASE nPhase,
    uint32_t lBlock, BYTE_CHANNEL &chOutbound, BYTE_CHANNEL &chInbound,
    CTransferStatus &status, STATUS_CHANNEL *pStatus);
  // Receiver functions ...
  FRAME_STATUS ReadFrame (BYTE_CHANNEL &chInbound, uint8_t bHeader, bool fCRC,
    uint8_t &bBlock, vector<uint8_t> &abData);
  bool WriteReceivedFile (const string &sDirectory, vector<uint8_t> &abFile, string &sPath);

  // Private member data ...
private:
  const XMODEM_VARIANT  m_nVariant;           // checksum, CRC or 1K
  uint32_t              m_lHandshakeTimeout;  // sender waits this long for C/NAK
  uint32_t              m_lResponseTimeout;   // wait for ACK/NAK or next block
  uint32_t              m_lByteTimeout;       // gap allowed inside a block
  uint32_t              m_nMaxRetries;        // retries before we give up
  std::deque<uint8_t>   m_abInput;            // bytes received but not used yet
};
