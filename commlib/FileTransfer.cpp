//++
// FileTransfer.cpp -> CFileTransfer and CTransferStatus common methods
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
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "FileTransfer.hpp"     // declarations for this module


uint32_t CTransferStatus::GetPercent() const
{
  //++
  // Return the percentage complete, if we know the total size ...
  //--
  if (m_fComplete) return 100;
  if (!m_fTotalBytes || (m_qTotalBytes == 0)) return 0;
  uint64_t qPercent = (m_qBytes * 100) / m_qTotalBytes;
  return (uint32_t) MIN(qPercent, 100);
}

CFileTransfer::CFileTransfer()
  : m_fCancel(false), m_nErrorPhase(PHASE_NONE), m_lErrorBlock(0), m_sErrorText()
{
}

/*static*/ const char *CFileTransfer::ResultToString (XFER_RESULT nResult)
{
  switch (nResult) {
    case XFER_SUCCESS:          return "success";
    case XFER_FILE_ERROR:       return "file error";
    case XFER_IO_ERROR:         return "I/O error";
    case XFER_DISCONNECTED:     return "disconnected";
    case XFER_TIMEOUT:          return "timeout";
    case XFER_TOO_MANY_RETRIES: return "too many retries";
    case XFER_CANCELLED:        return "cancelled";
    default:                    return "unknown";
  }
}

/*static*/ const char *CFileTransfer::PhaseToString (XFER_PHASE nPhase)
{
  switch (nPhase) {
    case PHASE_NONE:      return "none";
    case PHASE_FILE:      return "file";
    case PHASE_HANDSHAKE: return "handshake";
    case PHASE_BLOCK:     return "block";
    case PHASE_EOT:       return "EOT";
    default:              return "unknown";
  }
}

void CFileTransfer::ClearError()
{
  m_nErrorPhase = PHASE_NONE;  m_lErrorBlock = 0;  m_sErrorText.clear();
}

CFileTransfer::XFER_RESULT CFileTransfer::Fail (XFER_RESULT nResult, XFER_PHASE nPhase, uint32_t lBlock, const string &sText)
{
  //++
  //   Record the details of a failed transfer, log them, and return the
  // result code.  This lets the protocol engines just say
  //
  //      return Fail(XFER_TIMEOUT, PHASE_BLOCK, nBlock, "no response");
  //--
  m_nErrorPhase = nPhase;  m_lErrorBlock = lBlock;  m_sErrorText = sText;
  if (nResult == XFER_CANCELLED) {
    LOGS(WARNING, GetName() << " transfer cancelled");
  } else if (nPhase == PHASE_BLOCK) {
    LOGS(ERROR, GetName() << " " << ResultToString(nResult) << " at block " << lBlock << " - " << sText);
  } else {
    LOGS(ERROR, GetName() << " " << ResultToString(nResult) << " during " << PhaseToString(nPhase) << " - " << sText);
  }
  return nResult;
}
