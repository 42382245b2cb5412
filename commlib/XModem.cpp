//++
// XModem.cpp -> CXModem (XMODEM, XMODEM-CRC and XMODEM-1K protocol) methods
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
//   This module implements the XMODEM protocol engine, both sender and
// receiver.  Unlike the old console XMODEM code, which was a byte at a time
// state machine driven by the UART emulation, this version runs in the
// caller's thread and simply waits (with timeouts) for what it needs next.
// All I/O goes through CChannel objects, so the engine doesn't care whether
// it's talking to a serial port, a network connection, or a test program.
//
// NOTES:
//   * The sender waits HANDSHAKE_TIME for the receiver to send 'C' or NAK.
// Up to MAXRETRY garbage characters are ignored while waiting, but one more
// than that is an error.  Silence for the whole time is a timeout.
//
//   * After each block (or EOT) the sender waits RESPONSE_TIME for an ACK.
// NAK or a timeout means send it again, up to MAXRETRY times for any one
// block.  Any ACK ends the block, and the next block starts over with a
// fresh retry count.
//
//   * The receiver waits RESPONSE_TIME for each block.  A timeout gets a NAK
// (or, if no block has arrived yet, the original 'C' or NAK again).  Bad
// blocks, short blocks and timeouts all share the same retry count, which is
// reset whenever a block is accepted.
//
//   * The receiver ACKs a duplicate (or any other out of sequence) block but
// doesn't save it.  That happens when our ACK gets lost and the sender
// repeats the last block.
//
//   * An EOT ends the transfer, no matter how many blocks we've received.
// An EOT before any data at all produces an empty file and a warning.
//
//   * Cancel() is checked every time we wait for anything.  When it's set we
// send three CANs to the other end and give up.  A CAN from the other end
// also ends the transfer, but we don't send anything back in that case.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdio.h>              // FILE, fopen(), fread(), fwrite(), ...
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // memset(), strrchr(), ...
#include <errno.h>              // errno, ...
#include <assert.h>             // assert() (what else??)
#include <time.h>               // time(), localtime_r(), ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "FileTransfer.hpp"     // CFileTransfer base class
#include "XModem.hpp"           // declarations for this module


CXModem::CXModem (XMODEM_VARIANT nVariant)
  : CFileTransfer(), m_nVariant(nVariant), m_abInput()
{
  m_lHandshakeTimeout = HANDSHAKE_TIME;
  m_lResponseTimeout  = RESPONSE_TIME;
  m_lByteTimeout      = BYTE_TIME;
  m_nMaxRetries       = MAXRETRY;
}

/*static*/ const char *CXModem::VariantToString (XMODEM_VARIANT nVariant)
{
  switch (nVariant) {
    case XMODEM_CHECKSUM: return "XMODEM";
    case XMODEM_CRC:      return "XMODEM-CRC";
    case XMODEM_1K:       return "XMODEM-1K";
    default:              return "XMODEM-???";
  }
}


////////////////////////////////////////////////////////////////////////////////
//////////////////////////////   PACKET METHODS   //////////////////////////////
////////////////////////////////////////////////////////////////////////////////

/*static*/ uint8_t CXModem::Checksum (const uint8_t *pabData, size_t cbData)
{
  //++
  // The original XMODEM checksum is just the 8 bit sum of the data bytes ...
  //--
  uint8_t bSum = 0;
  for (size_t i = 0;  i < cbData;  ++i) bSum += pabData[i];
  return bSum;
}

/*static*/ uint16_t CXModem::CRC16 (const uint8_t *pabData, size_t cbData)
{
  //++
  //   Compute the XMODEM CRC-16 - CCITT polynomial 0x1021, MSB first, with
  // an initial value of zero and no final XOR.  The CRC of the ASCII string
  // "123456789" is 0x31C3, which makes a handy test ...
  //--
  uint16_t wCRC = 0;
  for (size_t i = 0;  i < cbData;  ++i) {
    wCRC ^= (uint16_t) pabData[i] << 8;
    for (int j = 0;  j < 8;  ++j)
      wCRC = (wCRC & 0x8000) ? MASK16((wCRC << 1) ^ 0x1021) : MASK16(wCRC << 1);
  }
  return wCRC;
}

/*static*/ void CXModem::BuildPacket (uint8_t bBlock, const uint8_t *pabData, size_t cbData,
  size_t cbBlock, bool fCRC, vector<uint8_t> &abPacket)
{
  //++
  //   Build a complete packet - header, block number and complement, data
  // padded out to cbBlock bytes with SUB characters, and either the checksum
  // or CRC.  Note that the checksum/CRC covers the padded data ...
  //--
  assert((cbBlock == XBLKLEN) || (cbBlock == XBLKLEN1K));
  assert(cbData <= cbBlock);
  abPacket.clear();
  abPacket.reserve(PacketLength(cbBlock, fCRC));
  abPacket.push_back((cbBlock == XBLKLEN1K) ? STX : SOH);
  abPacket.push_back(bBlock);
  abPacket.push_back(MASK8(~bBlock));
  abPacket.insert(abPacket.end(), pabData, pabData+cbData);
  abPacket.insert(abPacket.end(), cbBlock-cbData, (uint8_t) XPAD);
  const uint8_t *pabPadded = abPacket.data() + 3;
  if (fCRC) {
    uint16_t wCRC = CRC16(pabPadded, cbBlock);
    abPacket.push_back(HIBYTE(wCRC));
    abPacket.push_back(LOBYTE(wCRC));
  } else
    abPacket.push_back(Checksum(pabPadded, cbBlock));
}

/*static*/ string CXModem::MakeReceiveName (const string &sDirectory)
{
  //++
  //   XMODEM doesn't send the file name, so we make one up from the current
  // date and time - "received_yyyymmdd_hhmmss.bin".  If that file already
  // exists, then add "_1", "_2", etc until we find one that doesn't ...
  //--
  time_t tNow;  struct tm tmNow;  char szBase[64];
  time(&tNow);  localtime_r(&tNow, &tmNow);
  snprintf(szBase, sizeof(szBase), "received_%04d%02d%02d_%02d%02d%02d",
    tmNow.tm_year+1900, tmNow.tm_mon+1, tmNow.tm_mday, tmNow.tm_hour, tmNow.tm_min, tmNow.tm_sec);
  string sPath = MakePath(sDirectory, string(szBase) + ".bin");
  for (uint32_t n = 1;  FileExists(sPath);  ++n)
    sPath = MakePath(sDirectory, FormatString("%s_%u.bin", szBase, n));
  return sPath;
}


////////////////////////////////////////////////////////////////////////////////
////////////////////////////   LOW LEVEL I/O METHODS   /////////////////////////
////////////////////////////////////////////////////////////////////////////////

/*static*/ CXModem::DEADLINE CXModem::MakeDeadline (uint32_t lTimeout)
{
  return std::chrono::steady_clock::now() + std::chrono::milliseconds(lTimeout);
}

CXModem::READ_STATUS CXModem::ReadByteBefore (BYTE_CHANNEL &chInbound, uint8_t &bData, const DEADLINE &tDeadline)
{
  //++
  //   Return the next byte from the other end, waiting until tDeadline for
  // one to arrive.  Bytes arrive from the channel in chunks of any size, so
  // anything we don't need right now is saved in m_abInput for next time.
  //
  //   The wait is done in POLL_TIME slices, and the cancel flag is checked
  // before every one of them ...
  //--
  for (;;) {
    if (IsCancelled()) return READ_CANCELLED;
    if (!m_abInput.empty()) {
      bData = m_abInput.front();  m_abInput.pop_front();  return READ_OK;
    }
    std::chrono::milliseconds msLeft = std::chrono::duration_cast<std::chrono::milliseconds>
      (tDeadline - std::chrono::steady_clock::now());
    uint32_t lWait = (msLeft.count() > 0) ? (uint32_t) MIN(msLeft.count(), (int64_t) POLL_TIME) : 0;
    vector<uint8_t> abChunk;
    int nStatus = chInbound.Receive(abChunk, lWait);
    if (nStatus > 0) {
      m_abInput.insert(m_abInput.end(), abChunk.begin(), abChunk.end());
      continue;
    }
    if (nStatus < 0) return READ_CLOSED;
    if (lWait == 0) return READ_TIMEOUT;
  }
}

CXModem::READ_STATUS CXModem::ReadByte (BYTE_CHANNEL &chInbound, uint8_t &bData, uint32_t lTimeout)
{
  return ReadByteBefore(chInbound, bData, MakeDeadline(lTimeout));
}

bool CXModem::WriteBytes (BYTE_CHANNEL &chOutbound, const uint8_t *pabData, size_t cbData)
{
  //++
  //   Send bytes to the other end.  The only way this can fail is if the
  // outbound channel has been closed, which means the connection is gone.
  //--
  if (cbData > 1) LOGS(TRACE, DumpBuffer("XMODEM send", pabData, cbData));
  return chOutbound.Send(vector<uint8_t>(pabData, pabData+cbData));
}

CFileTransfer::XFER_RESULT CXModem::CancelTransfer (BYTE_CHANNEL &chOutbound, XFER_PHASE nPhase, uint32_t lBlock)
{
  //++
  //   Abort the transfer because Cancel() was called.  Send CANs to the
  // other end (if we still can) so that it knows, too ...
  //--
  uint8_t abCancel[CANCOUNT];
  memset(abCancel, CAN, sizeof(abCancel));
  WriteBytes(chOutbound, abCancel, sizeof(abCancel));
  m_abInput.clear();
  return Fail(XFER_CANCELLED, nPhase, lBlock, "cancelled by operator");
}


////////////////////////////////////////////////////////////////////////////////
///////////////////////////////   SENDER METHODS   /////////////////////////////
////////////////////////////////////////////////////////////////////////////////

CFileTransfer::XFER_RESULT CXModem::WaitHandshake (BYTE_CHANNEL &chOutbound, BYTE_CHANNEL &chInbound,
  CTransferStatus &status, STATUS_CHANNEL *pStatus, bool &fCRC)
{
  //++
  //   Wait for the receiver to start the transfer by sending either 'C' (and
  // then we use CRC mode) or NAK (and we use checksum mode).  Anything else
  // is ignored, up to a point ...
  //--
  DEADLINE tDeadline = MakeDeadline(m_lHandshakeTimeout);
  uint32_t nJunk = 0;  uint8_t bData;
  for (;;) {
    READ_STATUS nRead = ReadByteBefore(chInbound, bData, tDeadline);
    if (nRead == READ_CANCELLED) return CancelTransfer(chOutbound, PHASE_HANDSHAKE, 0);
    if (nRead == READ_CLOSED) return Fail(XFER_DISCONNECTED, PHASE_HANDSHAKE, 0, "connection closed");
    if (nRead == READ_TIMEOUT) return Fail(XFER_TIMEOUT, PHASE_HANDSHAKE, 0, "no response from receiver");
    if (bData == CRCREQ) {
      fCRC = true;  break;
    }
    if (bData == NAK) {
      fCRC = false;  break;
    }
    if (bData == CAN) return Fail(XFER_CANCELLED, PHASE_HANDSHAKE, 0, "cancelled by receiver");
    LOGF(DEBUG, "XMODEM unexpected 0x%02X during handshake", bData);
    status.AddRetry();  Report(pStatus, status);
    if (++nJunk > m_nMaxRetries)
      return Fail(XFER_TOO_MANY_RETRIES, PHASE_HANDSHAKE, 0, "no valid handshake from receiver");
  }
  LOGS(DEBUG, "XMODEM receiver requested " << (fCRC ? "CRC" : "checksum") << " mode");
  return XFER_SUCCESS;
}

CFileTransfer::XFER_RESULT CXModem::SendAndWaitACK (const uint8_t *pabData, size_t cbData,
  XFER_PHASE nPhase, uint32_t lBlock, BYTE_CHANNEL &chOutbound, BYTE_CHANNEL &chInbound,
  CTransferStatus &status, STATUS_CHANNEL *pStatus)
{
  //++
  //   Send a packet (or an EOT) and wait for the receiver to ACK it.  If we
  // get a NAK, or nothing at all, then send it again.  Give up after too
  // many retries, or if either end cancels ...
  //--
  uint32_t nRetries = 0;
  for (;;) {
    if (IsCancelled()) return CancelTransfer(chOutbound, nPhase, lBlock);
    if (!WriteBytes(chOutbound, pabData, cbData))
      return Fail(XFER_DISCONNECTED, nPhase, lBlock, "connection closed");

    // Wait for an ACK, NAK or CAN.  Anything else is line noise ...
    DEADLINE tDeadline = MakeDeadline(m_lResponseTimeout);
    READ_STATUS nRead;  uint8_t bData = 0;
    while ((nRead = ReadByteBefore(chInbound, bData, tDeadline)) == READ_OK) {
      if ((bData == ACK) || (bData == NAK)) break;
      if (bData == CAN) return Fail(XFER_CANCELLED, nPhase, lBlock, "cancelled by receiver");
      LOGF(DEBUG, "XMODEM ignoring 0x%02X while waiting for ACK", bData);
    }
    if (nRead == READ_CANCELLED) return CancelTransfer(chOutbound, nPhase, lBlock);
    if (nRead == READ_CLOSED) return Fail(XFER_DISCONNECTED, nPhase, lBlock, "connection closed");
    if ((nRead == READ_OK) && (bData == ACK)) return XFER_SUCCESS;

    // It's either a NAK or a timeout - try again ...
    ++nRetries;  status.AddRetry();  Report(pStatus, status);
    LOGS(DEBUG, "XMODEM " << ((nRead == READ_OK) ? "NAK" : "timeout") << " for "
      << ((nPhase == PHASE_EOT) ? string("EOT") : FormatString("block %u", lBlock)) << ", retry " << nRetries);
    if (nRetries > m_nMaxRetries)
      return Fail(XFER_TOO_MANY_RETRIES, nPhase, lBlock, FormatString("no ACK after %u retries", m_nMaxRetries));
  }
}

CFileTransfer::XFER_RESULT CXModem::SendFile (const string &sPath, BYTE_CHANNEL &chOutbound,
  BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus)
{
  //++
  //   Send a file using the XMODEM protocol.  This waits for the receiver to
  // start things off, sends every block of the file, and then sends EOT.
  // A progress report goes to pStatus after every block is acknowledged.
  //--
  ClearError();  m_abInput.clear();
  FILE *pFile = fopen(sPath.c_str(), "rb");
  if (pFile == NULL) {
    int nError = errno;
    return Fail(XFER_FILE_ERROR, PHASE_FILE, 0, "unable to open " + sPath + " - " + ErrorText(nError));
  }
  uint64_t qSize = 0;
  if ((fseek(pFile, 0, SEEK_END) == 0) && (ftell(pFile) >= 0)) {
    qSize = (uint64_t) ftell(pFile);
    rewind(pFile);
  } else {
    fclose(pFile);
    return Fail(XFER_FILE_ERROR, PHASE_FILE, 0, "unable to determine the size of " + sPath);
  }

  // Set up the progress report ...
  const char *pszName = strrchr(sPath.c_str(), '/');
  CTransferStatus status((pszName != NULL) ? string(pszName+1) : sPath);
  size_t cbBlock = GetBlockSize();
  status.SetTotalBytes(qSize);
  status.SetTotalPackets((uint32_t) ((qSize + cbBlock - 1) / cbBlock));
  Report(pStatus, status);
  LOGS(WARNING, GetName() << " sending " << sPath << " (" << qSize << " bytes)");

  // Wait for the receiver ...
  bool fCRC = IsCRC();
  XFER_RESULT nResult = WaitHandshake(chOutbound, chInbound, status, pStatus, fCRC);
  if (nResult != XFER_SUCCESS) {
    fclose(pFile);  return nResult;
  }

  // Send all the blocks ...
  vector<uint8_t> abData(cbBlock), abPacket;
  uint8_t bBlock = 1;  uint32_t lBlocks = 0;  uint64_t qSent = 0;
  for (;;) {
    size_t cbRead = fread(abData.data(), 1, cbBlock, pFile);
    if (cbRead == 0) {
      if (ferror(pFile)) {
        fclose(pFile);
        return Fail(XFER_FILE_ERROR, PHASE_FILE, lBlocks+1, "error reading " + sPath);
      }
      break;
    }
    BuildPacket(bBlock, abData.data(), cbRead, cbBlock, fCRC, abPacket);
    nResult = SendAndWaitACK(abPacket.data(), abPacket.size(), PHASE_BLOCK, lBlocks+1,
      chOutbound, chInbound, status, pStatus);
    if (nResult != XFER_SUCCESS) {
      fclose(pFile);  return nResult;
    }
    ++lBlocks;  ++bBlock;  qSent += cbRead;
    status.SetPacket(lBlocks);  status.SetBytes(qSent);
    Report(pStatus, status);
    if (cbRead < cbBlock) break;
  }
  fclose(pFile);

  // And finish up with EOT ...
  uint8_t bEOT = EOT;
  nResult = SendAndWaitACK(&bEOT, 1, PHASE_EOT, lBlocks, chOutbound, chInbound, status, pStatus);
  if (nResult != XFER_SUCCESS) return nResult;
  status.SetComplete();  Report(pStatus, status);
  LOGS(WARNING, GetName() << " sent " << lBlocks << " blocks, " << qSent << " bytes, "
    << status.GetRetries() << " retries");
  return XFER_SUCCESS;
}


////////////////////////////////////////////////////////////////////////////////
//////////////////////////////   RECEIVER METHODS   ////////////////////////////
////////////////////////////////////////////////////////////////////////////////

CXModem::FRAME_STATUS CXModem::ReadFrame (BYTE_CHANNEL &chInbound, uint8_t bHeader, bool fCRC,
  uint8_t &bBlock, vector<uint8_t> &abData)
{
  //++
  //   Read the rest of a block after the SOH or STX.  The header tells us
  // how many data bytes to expect, and fCRC tells us how many check bytes.
  // If there's a gap of more than m_lByteTimeout between any two bytes then
  // the block is "short" and it's rejected.
  //--
  size_t cbBlock = (bHeader == STX) ? XBLKLEN1K : XBLKLEN;
  size_t cbFrame = PacketLength(cbBlock, fCRC) - 1;
  vector<uint8_t> abFrame;  abFrame.reserve(cbFrame);
  while (abFrame.size() < cbFrame) {
    uint8_t bData;
    READ_STATUS nRead = ReadByte(chInbound, bData, m_lByteTimeout);
    if (nRead == READ_CANCELLED) return FRAME_CANCELLED;
    if (nRead == READ_CLOSED) return FRAME_CLOSED;
    if (nRead == READ_TIMEOUT) {
      LOGF(DEBUG, "XMODEM short block (%u of %u bytes)", (unsigned) abFrame.size()+1, (unsigned) cbFrame+1);
      return FRAME_SHORT;
    }
    abFrame.push_back(bData);
  }
  LOGS(TRACE, DumpBuffer("XMODEM receive", abFrame.data(), abFrame.size()));

  // Check the block number and its complement ...
  bBlock = abFrame[0];
  if (MASK8(bBlock + abFrame[1]) != 0xFF) return FRAME_BAD_NUMBER;

  // And check the checksum or CRC ...
  const uint8_t *pabData = abFrame.data() + 2;
  if (fCRC) {
    uint16_t wCRC = MKWORD(abFrame[cbFrame-2], abFrame[cbFrame-1]);
    if (CRC16(pabData, cbBlock) != wCRC) return FRAME_BAD_CHECK;
  } else {
    if (Checksum(pabData, cbBlock) != abFrame[cbFrame-1]) return FRAME_BAD_CHECK;
  }
  abData.assign(pabData, pabData+cbBlock);
  return FRAME_OK;
}

bool CXModem::WriteReceivedFile (const string &sDirectory, vector<uint8_t> &abFile, string &sPath)
{
  //++
  //   Strip the padding from the end of the received data and write it to a
  // new file.  Only SUBs at the very end are removed - there's no way to
  // tell padding from real data, and the ones in the middle are obviously
  // real!
  //--
  while (!abFile.empty() && (abFile.back() == XPAD)) abFile.pop_back();
  sPath = MakeReceiveName(sDirectory);
  FILE *pFile = fopen(sPath.c_str(), "wb");
  if (pFile == NULL) {
    int nError = errno;
    Fail(XFER_FILE_ERROR, PHASE_FILE, 0, "unable to create " + sPath + " - " + ErrorText(nError));
    return false;
  }
  size_t cbWritten = abFile.empty() ? 0 : fwrite(abFile.data(), 1, abFile.size(), pFile);
  bool fOK = (cbWritten == abFile.size());
  if (fclose(pFile) != 0) fOK = false;
  if (!fOK) Fail(XFER_FILE_ERROR, PHASE_FILE, 0, "error writing " + sPath);
  return fOK;
}

CFileTransfer::XFER_RESULT CXModem::ReceiveFile (const string &sDirectory, BYTE_CHANNEL &chOutbound,
  BYTE_CHANNEL &chInbound, STATUS_CHANNEL *pStatus, string &sFileName)
{
  //++
  //   Receive a file using the XMODEM protocol and save it in sDirectory.
  // The file name is made up by MakeReceiveName() and returned, without the
  // directory, in sFileName.
  // The whole file is kept in memory until the EOT arrives, so a failed
  // transfer never leaves a partial file behind.
  //--
  ClearError();  m_abInput.clear();  sFileName.clear();
  string sDir = sDirectory.empty() ? string(".") : sDirectory;
  if (!DirectoryExists(sDir))
    return Fail(XFER_FILE_ERROR, PHASE_FILE, 0, "directory " + sDir + " does not exist");

  bool fCRC = IsCRC();
  uint8_t bReady = fCRC ? (uint8_t) CRCREQ : (uint8_t) NAK;
  CTransferStatus status;
  Report(pStatus, status);
  LOGS(WARNING, GetName() << " receiving into " << sDir);
  if (!WriteByte(chOutbound, bReady))
    return Fail(XFER_DISCONNECTED, PHASE_HANDSHAKE, 0, "connection closed");

  vector<uint8_t> abFile, abData;
  uint8_t bExpected = 1;  uint32_t lBlocks = 0, nRetries = 0;
  for (;;) {
    XFER_PHASE nPhase = (lBlocks == 0) ? PHASE_HANDSHAKE : PHASE_BLOCK;
    uint8_t bData;
    READ_STATUS nRead = ReadByte(chInbound, bData, m_lResponseTimeout);
    if (nRead == READ_CANCELLED) return CancelTransfer(chOutbound, nPhase, lBlocks+1);
    if (nRead == READ_CLOSED) return Fail(XFER_DISCONNECTED, nPhase, lBlocks+1, "connection closed");

    string sProblem;
    if (nRead == READ_TIMEOUT) {
      sProblem = "timeout";
    } else if (bData == EOT) {
      if (!WriteByte(chOutbound, ACK))
        return Fail(XFER_DISCONNECTED, PHASE_EOT, lBlocks, "connection closed");
      if (lBlocks == 0) LOGS(WARNING, GetName() << " EOT received before any data");
      break;
    } else if (bData == CAN) {
      return Fail(XFER_CANCELLED, nPhase, lBlocks+1, "cancelled by sender");
    } else if ((bData == SOH) || (bData == STX)) {
      uint8_t bBlock = 0;
      FRAME_STATUS nFrame = ReadFrame(chInbound, bData, fCRC, bBlock, abData);
      if (nFrame == FRAME_CANCELLED) return CancelTransfer(chOutbound, PHASE_BLOCK, lBlocks+1);
      if (nFrame == FRAME_CLOSED) return Fail(XFER_DISCONNECTED, PHASE_BLOCK, lBlocks+1, "connection closed");
      if (nFrame == FRAME_OK) {
        if (bBlock == bExpected) {
          abFile.insert(abFile.end(), abData.begin(), abData.end());
          ++bExpected;  ++lBlocks;
          status.SetPacket(lBlocks);  status.SetBytes(abFile.size());
          Report(pStatus, status);
        } else
          LOGF(DEBUG, "XMODEM block %u received, expecting %u - ignored", bBlock, bExpected);
        nRetries = 0;
        if (!WriteByte(chOutbound, ACK))
          return Fail(XFER_DISCONNECTED, PHASE_BLOCK, lBlocks, "connection closed");
        continue;
      }
      sProblem = (nFrame == FRAME_SHORT) ? "short block"
               : (nFrame == FRAME_BAD_NUMBER) ? "bad block number" : "bad checksum";
      //   Throw away anything else that's already arrived - it's the rest of
      // a bad block, or garbage anyway ...
      m_abInput.clear();
    } else {
      LOGF(DEBUG, "XMODEM ignoring 0x%02X while waiting for a block", bData);
      continue;
    }

    // Something went wrong - count a retry and NAK ...
    ++nRetries;  status.AddRetry();  Report(pStatus, status);
    LOGS(DEBUG, "XMODEM " << sProblem << " waiting for block " << (lBlocks+1) << ", retry " << nRetries);
    if (nRetries > m_nMaxRetries)
      return Fail(XFER_TOO_MANY_RETRIES, nPhase, lBlocks+1, sProblem + " after " + FormatString("%u", m_nMaxRetries) + " retries");
    uint8_t bReply = (lBlocks == 0) ? bReady : (uint8_t) NAK;
    if (!WriteByte(chOutbound, bReply))
      return Fail(XFER_DISCONNECTED, nPhase, lBlocks+1, "connection closed");
  }

  // Save the file and we're done ...
  string sPath;
  if (!WriteReceivedFile(sDir, abFile, sPath)) return XFER_FILE_ERROR;
  sFileName = sPath.substr(sPath.find_last_of('/')+1);
  status.SetFileName(sFileName);  status.SetTotalBytes(abFile.size());
  status.SetTotalPackets(lBlocks);  status.SetBytes(abFile.size());
  status.SetComplete();  Report(pStatus, status);
  LOGS(WARNING, GetName() << " received " << sPath << " (" << lBlocks << " blocks, "
    << abFile.size() << " bytes, " << status.GetRetries() << " retries)");
  return XFER_SUCCESS;
}
