//++
// TcpTransport.hpp -> CTcpTransport (TCP/IP client connection) class
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
//   CTcpTransport implements the CTransport interface for an outgoing TCP
// connection to a terminal server, a telnet port, a serial-to-ethernet
// adapter, or whatever.  No telnet option negotiation is done; the data is
// passed through exactly as is.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include "Transport.hpp"        // CTransport base class
struct addrinfo;                // defined in <netdb.h>


class CTcpTransport : public CTransport {
  //++
  // TCP/IP network transport ...
  //--

  // Constructor and destructor ...
public:
  CTcpTransport (const CTransportConfig &cfg);
  virtual ~CTcpTransport() override;
private:
  // Disallow copy and assignment operations ...
  CTcpTransport (const CTcpTransport &) = delete;
  CTcpTransport& operator= (const CTcpTransport &) = delete;

  // Public methods ...
public:
  bool Open();
  virtual bool IsOpen() const override {return m_fdSocket >= 0;}
  virtual void Close() override;

  // CTransport methods ...
protected:
  virtual int32_t RawRead (uint8_t *pabBuffer, size_t cbBuffer, uint32_t lTimeout) override;
  virtual bool RawWrite (const uint8_t *pabBuffer, size_t cbBuffer) override;

  // Private methods ...
private:
  int ConnectWithTimeout (const struct addrinfo *pAddr, string &sError);

  // Private member data ...
private:
  int   m_fdSocket;             // connected socket handle
};
