//++
// SerialTransport.cpp -> CSerialTransport (termios serial port) methods
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
//   This module implements the CTransport interface for local serial ports
// on Linux.  The port is put into raw mode with cfmakeraw() and then the
// baud rate, character size, parity, stop bits and flow control are set
// from the configuration.  VMIN and VTIME are both zero, so a read() never
// blocks and all waiting is done with select().  This is the same way the
// console window code handles the keyboard.
//
// NOTES:
//   * The port is opened with O_NOCTTY so that it never becomes our
// controlling terminal, and TIOCEXCL is set so that nobody else can open it
// while we're using it (root excepted, of course!).
//
//   * Only the standard termios baud rates are supported.  An unsupported
// rate is an error when the port is opened.
//
//   * When the remote end hangs up, select() reports the port readable but
// read() returns either zero or EIO.  Either way we treat that as a broken
// connection.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // memset(), ...
#include <assert.h>             // assert() (what else??)
#include <errno.h>              // errno, EAGAIN, EINTR, ...
#include <fcntl.h>              // open(), O_RDWR, O_NOCTTY, ...
#include <unistd.h>             // read(), write(), close(), ...
#include <termios.h>            // struct termios (what else?!)
#include <sys/ioctl.h>          // ioctl(), TIOCEXCL, TIOCMBIS, ...
#include <sys/select.h>         // select(), fd_set, ...
#include <sys/time.h>           // struct timeval, ...
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "Transport.hpp"        // CTransport base class
#include "SerialTransport.hpp"  // declarations for this module


// Table of baud rates and the corresponding termios speed codes ...
PRIVATE const struct {
  uint32_t  lBaud;
  speed_t   nSpeed;
} g_aBaudRates[] = {
  {     50,     B50}, {     75,     B75}, {    110,    B110}, {    134,    B134},
  {    150,    B150}, {    200,    B200}, {    300,    B300}, {    600,    B600},
  {   1200,   B1200}, {   1800,   B1800}, {   2400,   B2400}, {   4800,   B4800},
  {   9600,   B9600}, {  19200,  B19200}, {  38400,  B38400}, {  57600,  B57600},
  { 115200, B115200}, { 230400, B230400}, { 460800, B460800}, { 500000, B500000},
  { 576000, B576000}, { 921600, B921600}, {1000000,B1000000}, {1152000,B1152000},
  {1500000,B1500000}, {2000000,B2000000}, {2500000,B2500000}, {3000000,B3000000},
  {3500000,B3500000}, {4000000,B4000000}, {0, B0}
};


CSerialTransport::CSerialTransport (const CTransportConfig &cfg)
  : CTransport(cfg)
{
  assert(cfg.IsSerial());
  m_fdPort = -1;
  memset(&m_tioSaved, 0, sizeof(m_tioSaved));
}

CSerialTransport::~CSerialTransport()
{
  Close();
}

/*static*/ bool CSerialTransport::BaudToSpeed (uint32_t lBaud, speed_t &nSpeed)
{
  //++
  // Look up the termios speed code for a baud rate ...
  //--
  for (size_t i = 0;  g_aBaudRates[i].lBaud != 0;  ++i) {
    if (g_aBaudRates[i].lBaud == lBaud) {
      nSpeed = g_aBaudRates[i].nSpeed;  return true;
    }
  }
  return false;
}

bool CSerialTransport::Open()
{
  //++
  //   Open the serial port, lock it for exclusive access, and set it up
  // according to our configuration.  Returns false (with the reason in
  // GetLastError()) if the device doesn't exist, is busy, or doesn't like
  // the parameters.
  //--
  if (IsOpen()) Close();
  string sPath = m_Config.GetPath();
  m_fdPort = open(sPath.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (m_fdPort < 0) {
    int nError = errno;
    SetLastError(FormatString("unable to open %s - %s", sPath.c_str(), ErrorText(nError).c_str()));
    return false;
  }
  if (!isatty(m_fdPort)) {
    SetLastError(sPath + " is not a serial port");
    close(m_fdPort);  m_fdPort = -1;  return false;
  }
  if (ioctl(m_fdPort, TIOCEXCL) != 0) {
    int nError = errno;
    SetLastError(FormatString("%s is busy - %s", sPath.c_str(), ErrorText(nError).c_str()));
    close(m_fdPort);  m_fdPort = -1;  return false;
  }
  if (tcgetattr(m_fdPort, &m_tioSaved) != 0) {
    int nError = errno;
    SetLastError(FormatString("unable to read settings for %s - %s", sPath.c_str(), ErrorText(nError).c_str()));
    close(m_fdPort);  m_fdPort = -1;  return false;
  }
  if (!Configure()) {
    close(m_fdPort);  m_fdPort = -1;  return false;
  }
  tcflush(m_fdPort, TCIOFLUSH);
  SetConnected();
  LOGS(DEBUG, "serial port " << GetConnectionInfo() << " opened");
  return true;
}

bool CSerialTransport::Configure()
{
  //++
  //   Set up the termios structure for raw I/O with the configured baud rate,
  // character size, parity, stop bits and flow control...
  //--
  speed_t nSpeed;
  if (!BaudToSpeed(m_Config.GetBaudRate(), nSpeed)) {
    SetLastError(FormatString("unsupported baud rate %u", m_Config.GetBaudRate()));
    return false;
  }
  struct termios tio;
  memcpy(&tio, &m_tioSaved, sizeof(tio));
  cfmakeraw(&tio);
  cfsetispeed(&tio, nSpeed);  cfsetospeed(&tio, nSpeed);

  // Character size ...
  tio.c_cflag &= ~CSIZE;
  switch (m_Config.GetDataBits()) {
    case 5:  tio.c_cflag |= CS5;  break;
    case 6:  tio.c_cflag |= CS6;  break;
    case 7:  tio.c_cflag |= CS7;  break;
    default: tio.c_cflag |= CS8;  break;
  }

  // Parity ...
  tio.c_cflag &= ~(PARENB | PARODD);
  if (m_Config.GetParity() == CTransportConfig::PARITY_EVEN)
    tio.c_cflag |= PARENB;
  else if (m_Config.GetParity() == CTransportConfig::PARITY_ODD)
    tio.c_cflag |= PARENB | PARODD;

  // Stop bits ...
  if (m_Config.GetStopBits() == 2)
    tio.c_cflag |= CSTOPB;
  else
    tio.c_cflag &= ~CSTOPB;

  // Flow control ...
  tio.c_cflag &= ~CRTSCTS;  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  if (m_Config.GetFlowControl() == CTransportConfig::FLOW_HARDWARE)
    tio.c_cflag |= CRTSCTS;
  else if (m_Config.GetFlowControl() == CTransportConfig::FLOW_SOFTWARE)
    tio.c_iflag |= IXON | IXOFF;

  //   Ignore modem control lines, enable the receiver, and make read() return
  // immediately with whatever is buffered ...
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(m_fdPort, TCSANOW, &tio) != 0) {
    int nError = errno;
    SetLastError(FormatString("unable to configure %s - %s", m_Config.GetPath().c_str(), ErrorText(nError).c_str()));
    return false;
  }
  return true;
}

void CSerialTransport::Close()
{
  //++
  //   Close the serial port, restoring the original settings first.  It's
  // harmless to call this if the port isn't open ...
  //--
  if (!IsOpen()) return;
  tcsetattr(m_fdPort, TCSANOW, &m_tioSaved);
  ioctl(m_fdPort, TIOCNXCL);
  close(m_fdPort);  m_fdPort = -1;
  LOGS(DEBUG, "serial port " << m_Config.GetPath() << " closed");
}

int32_t CSerialTransport::RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout)
{
  //++
  //   Wait up to lTimeout milliseconds for something to arrive and then read
  // whatever is available.  The return value is the number of bytes read,
  // zero if the timeout expired, or -1 if the port is broken ...
  //--
  struct timeval tmo;
  tmo.tv_sec  =  lTimeout / 1000UL;
  tmo.tv_usec = (lTimeout % 1000UL) * 1000UL;
  fd_set rdfs;
  FD_ZERO(&rdfs);
  FD_SET(m_fdPort, &rdfs);
  int nReady = select(m_fdPort+1, &rdfs, NULL, NULL, &tmo);
  if (nReady < 0) {
    if (errno == EINTR) return 0;
    int nError = errno;
    SetLastError("select failed - " + ErrorText(nError));  return -1;
  }
  if ((nReady == 0) || !FD_ISSET(m_fdPort, &rdfs)) return 0;

  ssize_t cbRead = read(m_fdPort, pabBuffer, cbBuffer);
  if (cbRead > 0) return (int32_t) cbRead;
  if ((cbRead < 0) && ((errno == EAGAIN) || (errno == EINTR))) return 0;
  if (cbRead == 0) {
    SetLastError(m_Config.GetPath() + " hung up");
  } else {
    int nError = errno;
    SetLastError("read failed - " + ErrorText(nError));
  }
  return -1;
}

bool CSerialTransport::RawWrite (const uint8_t *pabBuffer, size_t cbBuffer)
{
  //++
  //   Write all the bytes to the port.  The port is non-blocking, so if the
  // output buffer fills up we wait (with select) until there's room again.
  // If there's no room for the whole write timeout (nobody is draining the
  // line, or CTS or XOFF is holding us off) then the write fails ...
  //--
  uint32_t lTimeout = m_Config.GetWriteTimeout();
  size_t cbDone = 0;
  while (cbDone < cbBuffer) {
    ssize_t cbWrite = write(m_fdPort, pabBuffer+cbDone, cbBuffer-cbDone);
    if (cbWrite > 0) {
      cbDone += cbWrite;  continue;
    }
    if ((cbWrite < 0) && (errno == EINTR)) continue;
    if ((cbWrite < 0) && (errno == EAGAIN)) {
      fd_set wrfs;
      FD_ZERO(&wrfs);
      FD_SET(m_fdPort, &wrfs);
      struct timeval tmo;
      tmo.tv_sec = lTimeout / 1000;  tmo.tv_usec = (lTimeout % 1000) * 1000;
      int nReady = select(m_fdPort+1, NULL, &wrfs, NULL, &tmo);
      if (nReady > 0) continue;
      if ((nReady < 0) && (errno == EINTR)) continue;
      if (nReady == 0) {
        SetLastError(FormatString("write timed out after %u ms", lTimeout));
        return false;
      }
    }
    int nError = errno;
    SetLastError("write failed - " + ErrorText(nError));
    return false;
  }
  return true;
}

bool CSerialTransport::SetModemLine (int nLine, bool fSet)
{
  //++
  // Set or clear the DTR or RTS modem control signal ...
  //--
  if (!IsOpen()) {
    SetLastError("transport is not open");  return false;
  }
  if (ioctl(m_fdPort, fSet ? TIOCMBIS : TIOCMBIC, &nLine) != 0) {
    int nError = errno;
    SetLastError("modem control failed - " + ErrorText(nError));  return false;
  }
  LOGF(DEBUG, "%s %s %s", m_Config.GetPath().c_str(), (nLine == TIOCM_DTR) ? "DTR" : "RTS", fSet ? "set" : "cleared");
  return true;
}

bool CSerialTransport::SendBreak()
{
  //++
  //   Send a BREAK on the serial line.  tcsendbreak() has an unpredictable
  // duration, so we do it the hard way with TIOCSBRK and TIOCCBRK ...
  //--
  if (!IsOpen()) {
    SetLastError("transport is not open");  return false;
  }
  if (ioctl(m_fdPort, TIOCSBRK) != 0) {
    int nError = errno;
    SetLastError("unable to send break - " + ErrorText(nError));  return false;
  }
  _sleep_ms(BREAK_DURATION);
  if (ioctl(m_fdPort, TIOCCBRK) != 0) {
    int nError = errno;
    SetLastError("unable to clear break - " + ErrorText(nError));  return false;
  }
  LOGS(DEBUG, "break sent on " << m_Config.GetPath());
  return true;
}
