//++
// SessionTest.cpp -> CSession and CTransferLink tests over loopback TCP
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
//   These tests connect sessions to a TCP listener on the loopback address
// and check the state changes, the data fan out to subscribers, sending,
// inbound diversion and what happens when the remote end goes away.  The
// last tests run complete XMODEM transfers between two sessions joined by a
// relay.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, ...
#include <unistd.h>             // close(), ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <thread>               // C++ std::thread
#include <chrono>               // C++ std::chrono::milliseconds, ...
#include <gtest/gtest.h>        // GoogleTest framework
#include "COMMLIB.hpp"          // communications library definitions
#include "Session.hpp"          // CSession declarations
#include "XModem.hpp"           // CXModem declarations
#include "TransferLink.hpp"     // CTransferLink declarations
#include "TestUtils.hpp"        // test helpers
using std::string;              // ...
using std::vector;              // ...


// Wait for a STATE_CHANGED event and return the new state ...
static CConnectionState::STATE NextState (CEventSubscription &sub)
{
  CSessionEvent ev;
  if (WaitForEvent(sub, CSessionEvent::STATE_CHANGED, ev)) return ev.GetState().GetState();
  ADD_FAILURE() << "no state change received";
  return CConnectionState::ERROR;
}

static vector<uint8_t> Bytes (const string &s) {return vector<uint8_t>(s.begin(), s.end());}


TEST(Session, ConnectPublishesStateChanges)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  EXPECT_FALSE(session.IsConnected());
  EXPECT_EQ("not connected", session.GetConnectionInfo());

  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);
  EXPECT_EQ(CConnectionState::CONNECTING, NextState(sub));
  EXPECT_EQ(CConnectionState::CONNECTED, NextState(sub));
  EXPECT_TRUE(session.IsConnected());
  EXPECT_EQ(FormatString("127.0.0.1:%u", listener.GetPort()), session.GetConnectionInfo());

  session.Disconnect();
  EXPECT_EQ(CConnectionState::DISCONNECTED, NextState(sub));
  close(fdPeer);
}

TEST(Session, SubscribersSeeIdenticalData)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription subA = session.Subscribe(), subB = session.Subscribe();
  CEventSubscription subIdle = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);

  ASSERT_TRUE(WriteSocket(fdPeer, "hello "));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_TRUE(WriteSocket(fdPeer, "world"));
  vector<uint8_t> abA = CollectReceived(subA, 11), abB = CollectReceived(subB, 11);
  EXPECT_EQ(Bytes("hello world"), abA);
  EXPECT_EQ(abA, abB);
  //   A subscriber that hasn't read anything doesn't hold up the others, and
  // its events are all still waiting for it ...
  EXPECT_GT(subIdle.GetPending(), 0u);
  EXPECT_EQ(0u, subIdle.GetDropped());
  EXPECT_EQ(abA, CollectReceived(subIdle, 11));
  close(fdPeer);
}

TEST(Session, SlowSubscriberDoesNotBlockOthers)
{
  CTestListener listener;
  CSession session("test", 8);
  CEventSubscription subIdle = session.Subscribe(), subBusy = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);

  string sExpected;
  std::thread th([&]() {
    for (int i = 0;  i < 40;  ++i) {
      WriteSocket(fdPeer, FormatString("%02d", i));
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  });
  for (int i = 0;  i < 40;  ++i) sExpected += FormatString("%02d", i);
  vector<uint8_t> abBusy = CollectReceived(subBusy, sExpected.length());
  th.join();

  EXPECT_EQ(Bytes(sExpected), abBusy);
  EXPECT_LE(subIdle.GetPending(), 8u);
  EXPECT_GT(subIdle.GetDropped(), 0u);
  close(fdPeer);
}

TEST(Session, SendReachesPeer)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);

  EXPECT_EQ(CTransport::LINK_OK, session.Send(string("ping")));
  EXPECT_EQ(Bytes("ping"), ReadSocket(fdPeer, 4));
  CSessionEvent ev;
  ASSERT_TRUE(WaitForEvent(sub, CSessionEvent::DATA_SENT, ev));
  EXPECT_EQ(Bytes("ping"), ev.GetData());

  CTransport::TRANSPORT_STATS stats;
  ASSERT_TRUE(session.GetStats(stats));
  EXPECT_EQ(4u, stats.qBytesSent);
  EXPECT_EQ(1u, stats.qChunksSent);
  close(fdPeer);
}

TEST(Session, PeerCloseDisconnects)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);
  EXPECT_EQ(CConnectionState::CONNECTING, NextState(sub));
  EXPECT_EQ(CConnectionState::CONNECTED, NextState(sub));

  close(fdPeer);
  CSessionEvent ev;
  ASSERT_TRUE(WaitForEvent(sub, CSessionEvent::SESSION_ERROR, ev));
  EXPECT_FALSE(ev.GetError().empty());
  EXPECT_EQ(CConnectionState::DISCONNECTED, NextState(sub));
  EXPECT_FALSE(session.IsConnected());
  EXPECT_FALSE(session.GetLastError().empty());
  EXPECT_EQ(CTransport::LINK_DISCONNECTED, session.Send(string("too late")));
}

TEST(Session, ConnectRefused)
{
  CTestListener listener;
  CTransportConfig cfg = listener.GetConfig();
  listener.Close();

  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  EXPECT_EQ(CTransport::LINK_CONNECT_ERROR, session.Connect(cfg));
  EXPECT_EQ(CConnectionState::CONNECTING, NextState(sub));
  CSessionEvent ev;
  ASSERT_TRUE(WaitForEvent(sub, CSessionEvent::SESSION_ERROR, ev));
  EXPECT_FALSE(ev.GetError().empty());
  ASSERT_TRUE(WaitForEvent(sub, CSessionEvent::STATE_CHANGED, ev));
  EXPECT_EQ(CConnectionState::ERROR, ev.GetState().GetState());
  EXPECT_EQ(ev.GetState().GetError(), session.GetLastError());
  EXPECT_EQ(CConnectionState::ERROR, session.GetState().GetState());
}

TEST(Session, SendWhenDisconnected)
{
  CSession session("test");
  EXPECT_EQ(CTransport::LINK_DISCONNECTED, session.Send(string("hello")));
  CTransport::TRANSPORT_STATS stats;
  EXPECT_FALSE(session.GetStats(stats));
}

TEST(Session, DisconnectIsIdempotent)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  session.Disconnect();
  session.Disconnect();

  int nDisconnected = 0;  CSessionEvent ev;
  while (sub.Receive(ev, 200) > 0)
    if ((ev.GetEvent() == CSessionEvent::STATE_CHANGED)
     && (ev.GetState().GetState() == CConnectionState::DISCONNECTED)) ++nDisconnected;
  EXPECT_EQ(1, nDisconnected);
  if (fdPeer >= 0) close(fdPeer);
}

TEST(Session, DivertAndRestoreInbound)
{
  CTestListener listener;
  CSession session("test");
  CEventSubscription sub = session.Subscribe();
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);

  CByteChannel chDivert, chOther;
  ASSERT_TRUE(session.DivertInbound(&chDivert));
  EXPECT_TRUE(session.IsDiverted());
  EXPECT_FALSE(session.DivertInbound(&chOther));
  ASSERT_TRUE(WriteSocket(fdPeer, "diverted"));
  vector<uint8_t> abData, abChunk;
  while ((abData.size() < 8) && (chDivert.Receive(abChunk, 5000) > 0))
    abData.insert(abData.end(), abChunk.begin(), abChunk.end());
  EXPECT_EQ(Bytes("diverted"), abData);

  session.RestoreInbound();
  EXPECT_FALSE(session.IsDiverted());
  ASSERT_TRUE(WriteSocket(fdPeer, "normal"));
  EXPECT_EQ(Bytes("normal"), CollectReceived(sub, 6));
  close(fdPeer);
}

TEST(Session, EventDescriptions)
{
  EXPECT_EQ("Error: boom", CConnectionState::Error("boom").ToString());
  EXPECT_TRUE(CConnectionState(CConnectionState::CONNECTED) == CConnectionState(CConnectionState::CONNECTED));
  EXPECT_TRUE(CConnectionState::Error("a") != CConnectionState::Error("b"));
  EXPECT_STREQ("disconnected", CSession::LinkStatusToString(CTransport::LINK_DISCONNECTED));
}


////////////////////////////////////////////////////////////////////////////////
///////////////////////////   FILE TRANSFER TESTS   ////////////////////////////
////////////////////////////////////////////////////////////////////////////////

TEST(TransferLink, XModemBetweenTwoSessions)
{
  CTempDirectory dir;
  vector<uint8_t> abData = MakeTestData(5000, 9);
  string sSource = dir.File("source.bin");
  ASSERT_TRUE(WriteTestFile(sSource, abData));

  CTestRelay relay;
  CSession sessionA("alpha"), sessionB("bravo");
  ASSERT_EQ(CTransport::LINK_OK, sessionA.Connect(relay.GetConfig()));
  ASSERT_EQ(CTransport::LINK_OK, sessionB.Connect(relay.GetConfig()));

  CXModem xmSend(CXModem::XMODEM_1K), xmReceive(CXModem::XMODEM_CRC);
  CTransferLink linkA(sessionA), linkB(sessionB);
  CFileTransfer::STATUS_CHANNEL chStatus;
  CFileTransfer::XFER_RESULT nReceive = CFileTransfer::XFER_IO_ERROR;
  CFileTransfer::XFER_RESULT nSend = CFileTransfer::XFER_IO_ERROR;
  string sFile;
  // Start the sender first, so that it's listening when the receiver starts ...
  std::thread th([&]() {nSend = linkA.SendFile(xmSend, sSource);});
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  nReceive = linkB.ReceiveFile(xmReceive, dir.GetPath(), &chStatus, sFile);
  th.join();

  EXPECT_EQ(CFileTransfer::XFER_SUCCESS, nSend);
  ASSERT_EQ(CFileTransfer::XFER_SUCCESS, nReceive);
  EXPECT_EQ(abData, ReadTestFile(dir.File(sFile)));
  CTransferStatus status, last;
  while (chStatus.TryReceive(status) > 0) last = status;
  EXPECT_TRUE(last.IsComplete());
  EXPECT_EQ(5u, last.GetTotalPackets());

  // Both sessions are still usable afterwards ...
  EXPECT_TRUE(sessionA.IsConnected());
  EXPECT_TRUE(sessionB.IsConnected());
  EXPECT_FALSE(sessionA.IsDiverted());
  CEventSubscription subB = sessionB.Subscribe();
  EXPECT_EQ(CTransport::LINK_OK, sessionA.Send(string("after")));
  EXPECT_EQ(Bytes("after"), CollectReceived(subB, 5));
}

TEST(TransferLink, FailedTransferLeavesSessionConnected)
{
  CTestListener listener;
  CSession session("test");
  ASSERT_EQ(CTransport::LINK_OK, session.Connect(listener.GetConfig()));
  int fdPeer = listener.Accept();
  ASSERT_GE(fdPeer, 0);

  CTempDirectory dir;
  CXModem xm(CXModem::XMODEM_CRC);
  xm.SetResponseTimeout(20);
  CTransferLink link(session);
  string sFile;
  EXPECT_EQ(CFileTransfer::XFER_TOO_MANY_RETRIES, link.ReceiveFile(xm, dir.GetPath(), NULL, sFile));
  EXPECT_TRUE(session.IsConnected());
  EXPECT_FALSE(session.IsDiverted());
  // The peer saw the receiver asking for CRC mode over and over ...
  vector<uint8_t> abSeen = ReadSocket(fdPeer, 11);
  EXPECT_EQ(vector<uint8_t>(11, CXModem::CRCREQ), abSeen);
  close(fdPeer);
}

TEST(TransferLink, RequiresConnectedSession)
{
  CTempDirectory dir;
  CSession session("test");
  CXModem xm;
  CTransferLink link(session);
  EXPECT_EQ(CFileTransfer::XFER_DISCONNECTED, link.SendFile(xm, dir.File("x.bin")));
}
