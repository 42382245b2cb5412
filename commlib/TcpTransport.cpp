//++
// TcpTransport.cpp -> CTcpTransport (TCP/IP client connection) methods
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
//   This module implements the CTransport interface for TCP connections.
// The host name is resolved with getaddrinfo() and each address is tried in
// turn until one connects.  The connect is done in non-blocking mode so that
// the configured timeout can be enforced, and then the socket is put back
// into blocking mode with TCP_NODELAY set.  Interactive terminal traffic is
// mostly single characters and Nagle would only slow it down.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string.h>             // memset(), ...
#include <assert.h>             // assert() (what else??)
#include <errno.h>              // errno, EINPROGRESS, ...
#include <fcntl.h>              // fcntl(), O_NONBLOCK, ...
#include <unistd.h>             // close(), ...
#include <netdb.h>              // getaddrinfo(), struct addrinfo, ...
#include <sys/types.h>          // size_t, ssize_t, ...
#include <sys/socket.h>         // socket(), connect(), send(), recv(), ...
#include <sys/select.h>         // select(), fd_set, ...
#include <sys/time.h>           // struct timeval, ...
#include <netinet/in.h>         // IPPROTO_TCP, ...
#include <netinet/tcp.h>        // TCP_NODELAY
#include "COMMLIB.hpp"          // communications library definitions
#include "LogFile.hpp"          // message logging facility
#include "Transport.hpp"        // CTransport base class
#include "TcpTransport.hpp"     // declarations for this module


CTcpTransport::CTcpTransport (const CTransportConfig &cfg)
  : CTransport(cfg)
{
  assert(cfg.IsNetwork());
  m_fdSocket = -1;
}

CTcpTransport::~CTcpTransport()
{
  Close();
}

int CTcpTransport::ConnectWithTimeout (const struct addrinfo *pAddr, string &sError)
{
  //++
  //   Try to connect to one address, giving up after the configured timeout.
  // Returns the connected socket, or -1 (with a message in sError) if the
  // connection fails for any reason.
  //--
  int fd = socket(pAddr->ai_family, pAddr->ai_socktype, pAddr->ai_protocol);
  if (fd < 0) {
    sError = "unable to create socket - " + ErrorText(errno);  return -1;
  }
  int nFlags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, nFlags | O_NONBLOCK);

  if (connect(fd, pAddr->ai_addr, pAddr->ai_addrlen) != 0) {
    if (errno != EINPROGRESS) {
      sError = "connect failed - " + ErrorText(errno);
      close(fd);  return -1;
    }
    fd_set wrfs;
    FD_ZERO(&wrfs);
    FD_SET(fd, &wrfs);
    struct timeval tmo;
    tmo.tv_sec = m_Config.GetConnectTimeout();  tmo.tv_usec = 0;
    int nReady = select(fd+1, NULL, &wrfs, NULL, &tmo);
    if (nReady == 0) {
      sError = FormatString("connection timeout after %u seconds", m_Config.GetConnectTimeout());
      close(fd);  return -1;
    }
    int nError = 0;  socklen_t cbError = sizeof(nError);
    if ((nReady < 0) || (getsockopt(fd, SOL_SOCKET, SO_ERROR, &nError, &cbError) != 0)) nError = errno;
    if (nError != 0) {
      sError = "connect failed - " + ErrorText(nError);
      close(fd);  return -1;
    }
  }

  // Back to blocking mode, and turn off Nagle ...
  fcntl(fd, F_SETFL, nFlags & ~O_NONBLOCK);
  int nNoDelay = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nNoDelay, sizeof(nNoDelay)) != 0)
    LOGS(WARNING, "unable to set TCP_NODELAY - " << ErrorText(errno));
  // A send that can't make any progress for the write timeout gives up ...
  struct timeval tvSend;
  tvSend.tv_sec = m_Config.GetWriteTimeout() / 1000;
  tvSend.tv_usec = (m_Config.GetWriteTimeout() % 1000) * 1000;
  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tvSend, sizeof(tvSend)) != 0)
    LOGS(WARNING, "unable to set SO_SNDTIMEO - " << ErrorText(errno));
  return fd;
}

bool CTcpTransport::Open()
{
  //++
  //   Resolve the host name and connect to the first address that answers.
  // Returns false, with the reason in GetLastError(), if the host can't be
  // resolved or if none of its addresses accept the connection ...
  //--
  if (IsOpen()) Close();
  struct addrinfo hints, *pResult = NULL;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  string sPort = FormatString("%u", m_Config.GetPort());
  int nStatus = getaddrinfo(m_Config.GetHost().c_str(), sPort.c_str(), &hints, &pResult);
  if (nStatus != 0) {
    SetLastError(FormatString("unable to resolve %s - %s", m_Config.GetHost().c_str(), gai_strerror(nStatus)));
    return false;
  }

  string sError = "no addresses for " + m_Config.GetHost();
  for (struct addrinfo *p = pResult;  (p != NULL) && (m_fdSocket < 0);  p = p->ai_next)
    m_fdSocket = ConnectWithTimeout(p, sError);
  freeaddrinfo(pResult);
  if (m_fdSocket < 0) {
    SetLastError(FormatString("unable to connect to %s - %s", GetConnectionInfo().c_str(), sError.c_str()));
    return false;
  }
  SetConnected();
  LOGS(DEBUG, "connected to " << GetConnectionInfo());
  return true;
}

void CTcpTransport::Close()
{
  //++
  // Close the connection.  It's harmless to call this if we're not open ...
  //--
  if (!IsOpen()) return;
  shutdown(m_fdSocket, SHUT_RDWR);
  close(m_fdSocket);  m_fdSocket = -1;
  LOGS(DEBUG, "disconnected from " << GetConnectionInfo());
}

int32_t CTcpTransport::RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout)
{
  //++
  //   Wait up to lTimeout milliseconds for data and then read whatever is
  // available.  A recv() that returns zero means the peer closed the
  // connection, and that's reported as an error ...
  //--
  struct timeval tmo;
  tmo.tv_sec  =  lTimeout / 1000UL;
  tmo.tv_usec = (lTimeout % 1000UL) * 1000UL;
  fd_set rdfs;
  FD_ZERO(&rdfs);
  FD_SET(m_fdSocket, &rdfs);
  int nReady = select(m_fdSocket+1, &rdfs, NULL, NULL, &tmo);
  if (nReady < 0) {
    if (errno == EINTR) return 0;
    SetLastError("select failed - " + ErrorText(errno));  return -1;
  }
  if ((nReady == 0) || !FD_ISSET(m_fdSocket, &rdfs)) return 0;

  ssize_t cbRead = recv(m_fdSocket, pabBuffer, cbBuffer, 0);
  if (cbRead > 0) return (int32_t) cbRead;
  if ((cbRead < 0) && ((errno == EAGAIN) || (errno == EINTR))) return 0;
  if (cbRead == 0)
    SetLastError("connection closed by " + GetConnectionInfo());
  else
    SetLastError("receive failed - " + ErrorText(errno));
  return -1;
}

bool CTcpTransport::RawWrite (const uint8_t *pabBuffer, size_t cbBuffer)
{
  //++
  //   Send all the bytes.  MSG_NOSIGNAL keeps a broken connection from
  // raising SIGPIPE; we get EPIPE instead.  SO_SNDTIMEO makes a send that
  // stalls for the write timeout return EAGAIN ...
  //--
  size_t cbDone = 0;
  while (cbDone < cbBuffer) {
    ssize_t cbSent = send(m_fdSocket, pabBuffer+cbDone, cbBuffer-cbDone, MSG_NOSIGNAL);
    if (cbSent > 0) {
      cbDone += cbSent;  continue;
    }
    if ((cbSent < 0) && (errno == EINTR)) continue;
    if ((cbSent < 0) && ((errno == EAGAIN) || (errno == EWOULDBLOCK))) {
      SetLastError(FormatString("send timed out after %u ms", m_Config.GetWriteTimeout()));
      return false;
    }
    SetLastError("send failed - " + ErrorText(errno));
    return false;
  }
  return true;
}
