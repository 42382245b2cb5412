//++
// SerialTransportTest.cpp -> serial transport tests using a pseudo terminal
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
//   There's no real serial port on a test machine, so these tests use a
// pseudo terminal instead.  The transport opens the slave side just like it
// would open /dev/ttyUSB0, and the test reads and writes the master side.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, ...
#include <stdlib.h>             // posix_openpt(), grantpt(), unlockpt(), ptsname() ...
#include <fcntl.h>              // O_RDWR, O_NOCTTY, ...
#include <unistd.h>             // read(), write(), close(), ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <chrono>               // C++ std::chrono::steady_clock, ...
#include <future>               // C++ std::async, std::future, ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "COMMLIB.hpp"          // communications library definitions
#include "TransportConfig.hpp"  // CTransportConfig declarations
#include "Transport.hpp"        // CTransport declarations
#include "Session.hpp"          // CSession declarations
#include "XModem.hpp"           // CXModem declarations
#include "TransferLink.hpp"     // CTransferLink declarations
#include "TestUtils.hpp"        // test helpers
using std::string;              // ...
using std::vector;              // ...


class SerialTransport : public ::testing::Test {
  //++
  // Fixture that creates a pseudo terminal pair ...
  //--
protected:
  SerialTransport() : m_fdMaster(-1), m_sSlave() {};
  virtual void SetUp() override {
    m_fdMaster = posix_openpt(O_RDWR | O_NOCTTY);
    ASSERT_GE(m_fdMaster, 0);
    ASSERT_EQ(0, grantpt(m_fdMaster));
    ASSERT_EQ(0, unlockpt(m_fdMaster));
    const char *pszSlave = ptsname(m_fdMaster);
    ASSERT_TRUE(pszSlave != NULL);
    m_sSlave = pszSlave;
  }
  virtual void TearDown() override {
    if (m_fdMaster >= 0) close(m_fdMaster);
  }
  // Read cbWanted bytes from the master side ...
  vector<uint8_t> ReadMaster (size_t cbWanted) {
    vector<uint8_t> abData;  uint8_t abBuffer[256];
    while ((abData.size() < cbWanted) && WaitReadable(m_fdMaster, 5000)) {
      ssize_t cbRead = read(m_fdMaster, abBuffer, MIN(sizeof(abBuffer), cbWanted-abData.size()));
      if (cbRead <= 0) break;
      abData.insert(abData.end(), abBuffer, abBuffer+cbRead);
    }
    return abData;
  }
  bool WriteMaster (const string &sData) {
    return write(m_fdMaster, sData.data(), sData.length()) == (ssize_t) sData.length();
  }

protected:
  int     m_fdMaster;
  string  m_sSlave;
};


TEST_F(SerialTransport, ReadAndWrite)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial(m_sSlave, 9600), sError);
  ASSERT_TRUE(pPort != NULL) << sError;
  EXPECT_TRUE(pPort->IsOpen());
  EXPECT_EQ(m_sSlave + " @ 9600 baud (8N1 No FC)", pPort->GetConnectionInfo());

  ASSERT_TRUE(WriteMaster("from master"));
  vector<uint8_t> abData;  uint8_t abBuffer[64];
  while (abData.size() < 11) {
    int32_t cbRead = pPort->Read(abBuffer, sizeof(abBuffer), 2000);
    ASSERT_GT(cbRead, 0);
    abData.insert(abData.end(), abBuffer, abBuffer+cbRead);
  }
  EXPECT_EQ("from master", string(abData.begin(), abData.end()));
  EXPECT_EQ(0, pPort->Read(abBuffer, sizeof(abBuffer), 50));

  const string sReply("from slave");
  ASSERT_TRUE(pPort->Write((const uint8_t *) sReply.data(), sReply.length()));
  vector<uint8_t> abReply = ReadMaster(sReply.length());
  EXPECT_EQ(sReply, string(abReply.begin(), abReply.end()));

  CTransport::TRANSPORT_STATS stats = pPort->GetStats();
  EXPECT_EQ(11u, stats.qBytesReceived);
  EXPECT_EQ(sReply.length(), stats.qBytesSent);
  pPort->Close();
  EXPECT_FALSE(pPort->IsOpen());
  delete pPort;
}

TEST_F(SerialTransport, HangupIsAnError)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial(m_sSlave), sError);
  ASSERT_TRUE(pPort != NULL) << sError;
  close(m_fdMaster);  m_fdMaster = -1;
  uint8_t abBuffer[16];
  EXPECT_EQ(-1, pPort->Read(abBuffer, sizeof(abBuffer), 1000));
  EXPECT_FALSE(pPort->GetLastError().empty());
  delete pPort;
}

TEST_F(SerialTransport, SessionOverSerial)
{
  CSession session("serial");
  CEventSubscription sub = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(CTransportConfig::Serial(m_sSlave, 115200)));
  ASSERT_TRUE(WriteMaster("abc"));
  vector<uint8_t> abData = CollectReceived(sub, 3);
  EXPECT_EQ("abc", string(abData.begin(), abData.end()));
  EXPECT_EQ(CTransport::LINK_OK, session.Send(string("xyz")));
  vector<uint8_t> abReply = ReadMaster(3);
  EXPECT_EQ("xyz", string(abReply.begin(), abReply.end()));
  session.Disconnect();
}

TEST_F(SerialTransport, StalledWriteTimesOut)
{
  //   Nobody ever reads the master side, so the pty buffer fills up and the
  // write has to give up ...
  CTransportConfig cfg = CTransportConfig::Serial(m_sSlave, 115200);
  cfg.SetWriteTimeout(300);
  string sError;
  CTransport *pPort = CTransport::Open(cfg, sError);
  ASSERT_TRUE(pPort != NULL) << sError;
  vector<uint8_t> abData(1024*1024, 'x');
  std::chrono::steady_clock::time_point tStart = std::chrono::steady_clock::now();
  EXPECT_FALSE(pPort->Write(abData.data(), abData.size()));
  EXPECT_LT(std::chrono::steady_clock::now() - tStart, std::chrono::seconds(5));
  EXPECT_NE(string::npos, pPort->GetLastError().find("timed out"));
  EXPECT_EQ(1u, pPort->GetStats().qErrors);
  delete pPort;
}

TEST_F(SerialTransport, StalledSendDoesNotHangSession)
{
  CTransportConfig cfg = CTransportConfig::Serial(m_sSlave, 115200);
  cfg.SetWriteTimeout(300);
  CSession session("stalled");
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(cfg));
  vector<uint8_t> abData(1024*1024, 'y');
  std::future<CSession::LINK_STATUS> futSend = std::async(std::launch::async,
    [&session, &abData]() {return session.Send(abData);});
  ASSERT_EQ(std::future_status::ready, futSend.wait_for(std::chrono::seconds(5)));
  EXPECT_EQ(CTransport::LINK_IO_ERROR, futSend.get());
  std::future<void> futDisconnect = std::async(std::launch::async,
    [&session]() {session.Disconnect();});
  ASSERT_EQ(std::future_status::ready, futDisconnect.wait_for(std::chrono::seconds(5)));
  EXPECT_FALSE(session.IsConnected());
}

TEST_F(SerialTransport, StalledTransferIsAnIOError)
{
  //   Fill up the line first, so that the very first thing the receiver
  // sends can't get out ...
  CTransportConfig cfg = CTransportConfig::Serial(m_sSlave, 115200);
  cfg.SetWriteTimeout(300);
  CSession session("stalled");
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(cfg));
  ASSERT_EQ(CTransport::LINK_IO_ERROR, session.Send(vector<uint8_t>(1024*1024, 'z')));

  CTempDirectory dir;
  CXModem xm(CXModem::XMODEM_CRC);
  CTransferLink link(session);
  string sFile;
  EXPECT_EQ(CFileTransfer::XFER_IO_ERROR, link.ReceiveFile(xm, dir.GetPath(), NULL, sFile));
  EXPECT_TRUE(sFile.empty());
  // A failed write doesn't drop the connection ...
  EXPECT_TRUE(session.IsConnected());
  EXPECT_FALSE(session.IsDiverted());
  session.Disconnect();
}

TEST_F(SerialTransport, UnsupportedBaudRate)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial(m_sSlave, 12345), sError);
  EXPECT_TRUE(pPort == NULL);
  EXPECT_NE(string::npos, sError.find("baud"));
  delete pPort;
}

TEST(SerialTransportErrors, MissingDevice)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial("/dev/no_such_tty"), sError);
  EXPECT_TRUE(pPort == NULL);
  EXPECT_NE(string::npos, sError.find("/dev/no_such_tty"));
  delete pPort;
}

TEST(SerialTransportErrors, NotATerminal)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial("/dev/null"), sError);
  EXPECT_TRUE(pPort == NULL);
  EXPECT_NE(string::npos, sError.find("not a serial port"));
  delete pPort;
}

TEST(SerialTransportErrors, InvalidConfiguration)
{
  string sError;
  CTransport *pPort = CTransport::Open(CTransportConfig::Serial(""), sError);
  EXPECT_TRUE(pPort == NULL);
  EXPECT_FALSE(sError.empty());
  delete pPort;
}
