//++
// SerialTransport.hpp -> CSerialTransport (termios serial port) class
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
//   CSerialTransport implements the CTransport interface for a local serial
// port, using the POSIX termios interface.  The port is always opened in raw
// mode, with exclusive access, and with the baud rate, framing and flow
// control given by the CTransportConfig.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <termios.h>            // struct termios, speed_t, ...
#include <sys/ioctl.h>          // TIOCM_DTR, TIOCM_RTS, ...
#include "Transport.hpp"        // CTransport base class


class CSerialTransport : public CTransport {
  //++
  // Serial port transport ...
  //--

  // Constants ...
public:
  enum {
    BREAK_DURATION  = 250,      // length of a BREAK, in milliseconds
  };

  // Constructor and destructor ...
public:
  CSerialTransport (const CTransportConfig &cfg);
  virtual ~CSerialTransport() override;
private:
  // Disallow copy and assignment operations ...
  CSerialTransport (const CSerialTransport &) = delete;
  CSerialTransport& operator= (const CSerialTransport &) = delete;

  // Public methods ...
public:
  bool Open();
  virtual bool IsOpen() const override {return m_fdPort >= 0;}
  virtual void Close() override;
  virtual bool SetDTR (bool fDTR) override {return SetModemLine(TIOCM_DTR, fDTR);}
  virtual bool SetRTS (bool fRTS) override {return SetModemLine(TIOCM_RTS, fRTS);}
  virtual bool SendBreak() override;
  // Convert a baud rate to the termios speed_t code ...
  static bool BaudToSpeed (uint32_t lBaud, speed_t &nSpeed);

  // CTransport methods ...
protected:
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout) override;
  virtual bool RawWrite (const uint8_t *pabBuffer, size_t cbBuffer) override;

  // Private methods ...
private:
  bool Configure();
  bool SetModemLine (int nLine, bool fSet);

  // Private member data ...
private:
  int             m_fdPort;     // file descriptor of the open port
  struct termios  m_tioSaved;   // original port settings
};
