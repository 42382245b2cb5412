//++
// Channel.hpp -> CChannel (thread safe message queue) template class
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
//   A CChannel is a simple, unbounded, first in first out queue that's used
// to pass messages from one thread to another.  Any number of threads may
// Send() to the channel and any number may Receive() from it, although
// normally there's just one of each.  Receive() waits, with a timeout, for
// something to arrive.
//
//   A channel may be closed by either end.  After that Send() fails, and
// Receive() returns whatever is still queued and then reports the channel
// as closed.  That's how a protocol engine finds out that the connection
// has gone away, and how a forwarding thread finds out that the protocol
// engine is done.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint32_t, ...
#include <deque>                // C++ std::deque template
#include <mutex>                // C++ std::mutex, std::unique_lock, ...
#include <chrono>               // C++ std::chrono::milliseconds, ...
#include <condition_variable>   // C++ std::condition_variable


template <typename T> class CChannel {
  //++
  // Thread safe FIFO message queue ...
  //--

  // Constructor and destructor ...
public:
  CChannel() : m_mtxQueue(), m_cvQueue(), m_Queue(), m_fClosed(false) {};
  virtual ~CChannel() {};
private:
  // Disallow copy and assignment operations ...
  CChannel (const CChannel &) = delete;
  CChannel& operator= (const CChannel &) = delete;

  // Public channel methods ...
public:
  //   Add a message to the end of the queue and wake up any receiver.  This
  // returns false if the channel has been closed ...
  bool Send (const T &msg) {
    {
      std::lock_guard<std::mutex> lock(m_mtxQueue);
      if (m_fClosed) return false;
      m_Queue.push_back(msg);
    }
    m_cvQueue.notify_one();  return true;
  }

  //   Remove the next message from the queue, waiting for up to lTimeout
  // milliseconds for one to arrive.  Returns +1 if a message was received,
  // zero if the timeout expired, and -1 if the channel is closed AND empty.
  int Receive (T &msg, uint32_t lTimeout) {
    std::unique_lock<std::mutex> lock(m_mtxQueue);
    if (m_Queue.empty() && !m_fClosed && (lTimeout > 0))
      m_cvQueue.wait_for(lock, std::chrono::milliseconds(lTimeout),
        [this] {return !m_Queue.empty() || m_fClosed;});
    if (!m_Queue.empty()) {
      msg = m_Queue.front();  m_Queue.pop_front();  return 1;
    }
    return m_fClosed ? -1 : 0;
  }
  // Same, but never wait ...
  int TryReceive (T &msg) {return Receive(msg, 0);}

  // Close the channel and wake up everybody who's waiting ...
  void Close() {
    {
      std::lock_guard<std::mutex> lock(m_mtxQueue);
      m_fClosed = true;
    }
    m_cvQueue.notify_all();
  }

  // Properties ...
public:
  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(m_mtxQueue);
    return m_fClosed;
  }
  size_t Size() const {
    std::lock_guard<std::mutex> lock(m_mtxQueue);
    return m_Queue.size();
  }

  // Private member data ...
private:
  mutable std::mutex      m_mtxQueue;   // protects everything here
  std::condition_variable m_cvQueue;    // signalled when a message arrives
  std::deque<T>           m_Queue;      // the messages themselves
  bool                    m_fClosed;    // true when the channel is closed
};
