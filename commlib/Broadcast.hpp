//++
// Broadcast.hpp -> CBroadcast and CSubscription (event fan out) templates
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
//   A CBroadcast delivers a copy of every message published to it to every
// subscriber.  Each subscriber has its own queue, a circular buffer of fixed
// capacity, and when that fills up the OLDEST message in that queue is thrown
// away to make room.  The publisher never waits for anybody, and a subscriber
// that's slow (or never reads at all!) affects nobody but itself.  Each
// subscriber can find out how many messages it has lost this way.
//
//   Subscribe() returns a CSubscription, which is a lightweight handle that
// may be copied freely (all copies share the same queue).  When the last
// copy is destroyed the queue goes away and the broadcast forgets about it
// the next time something is published.  A subscriber only ever sees the
// messages published after it subscribed.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint32_t, uint64_t, ...
#include <deque>                // C++ std::deque template
#include <vector>               // C++ std::vector template
#include <memory>               // C++ std::shared_ptr, std::weak_ptr, ...
#include <mutex>                // C++ std::mutex, std::lock_guard, ...
#include <chrono>               // C++ std::chrono::milliseconds, ...
#include <condition_variable>   // C++ std::condition_variable
#include "COMMLIB.hpp"          // DBGNEW, ...


template <typename T> class CSubscriberQueue {
  //++
  //   This is the private, bounded, queue for one subscriber.  Nobody outside
  // of this file should ever need to use it directly ...
  //--
public:
  CSubscriberQueue (size_t nCapacity)
    : m_mtxQueue(), m_cvQueue(), m_Queue(), m_nCapacity(nCapacity), m_qDropped(0), m_fClosed(false) {};

  // Add a message, discarding the oldest one if we're full ...
  void Push (const T &msg) {
    {
      std::lock_guard<std::mutex> lock(m_mtxQueue);
      if (m_fClosed) return;
      if (m_Queue.size() >= m_nCapacity) {
        m_Queue.pop_front();  ++m_qDropped;
      }
      m_Queue.push_back(msg);
    }
    m_cvQueue.notify_one();
  }

  // Wait for and remove the next message (see CChannel::Receive()) ...
  int Pop (T &msg, uint32_t lTimeout) {
    std::unique_lock<std::mutex> lock(m_mtxQueue);
    if (m_Queue.empty() && !m_fClosed && (lTimeout > 0))
      m_cvQueue.wait_for(lock, std::chrono::milliseconds(lTimeout),
        [this] {return !m_Queue.empty() || m_fClosed;});
    if (!m_Queue.empty()) {
      msg = m_Queue.front();  m_Queue.pop_front();  return 1;
    }
    return m_fClosed ? -1 : 0;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(m_mtxQueue);
      m_fClosed = true;
    }
    m_cvQueue.notify_all();
  }

  uint64_t GetDropped() const {std::lock_guard<std::mutex> lock(m_mtxQueue);  return m_qDropped;}
  size_t GetPending() const {std::lock_guard<std::mutex> lock(m_mtxQueue);  return m_Queue.size();}

private:
  mutable std::mutex      m_mtxQueue;   // protects everything here
  std::condition_variable m_cvQueue;    // signalled when a message arrives
  std::deque<T>           m_Queue;      // messages waiting to be received
  const size_t            m_nCapacity;  // maximum queue length
  uint64_t                m_qDropped;   // messages lost to overflow
  bool                    m_fClosed;    // true when the broadcast is closed
};


template <typename T> class CSubscription {
  //++
  // Receive handle for one broadcast subscriber ...
  //--
public:
  CSubscription (const std::shared_ptr<CSubscriberQueue<T> > &pQueue) : m_pQueue(pQueue) {};

  //   Receive the next message, waiting up to lTimeout milliseconds.  Returns
  // +1 if a message was received, zero on timeout, or -1 if the broadcast
  // has been closed and nothing more is queued ...
  int Receive (T &msg, uint32_t lTimeout) {return m_pQueue->Pop(msg, lTimeout);}
  int TryReceive (T &msg) {return m_pQueue->Pop(msg, 0);}
  // Number of messages this subscriber has lost to overflow ...
  uint64_t GetDropped() const {return m_pQueue->GetDropped();}
  // Number of messages waiting ...
  size_t GetPending() const {return m_pQueue->GetPending();}

private:
  std::shared_ptr<CSubscriberQueue<T> > m_pQueue;
};


template <typename T> class CBroadcast {
  //++
  // Bounded, drop oldest, fan out of messages to any number of subscribers ...
  //--

  // Constants ...
public:
  enum {
    DEFAULT_CAPACITY = 1024,    // default length of each subscriber's queue
  };

  // Constructor and destructor ...
public:
  CBroadcast (size_t nCapacity=DEFAULT_CAPACITY)
    : m_mtxList(), m_lstQueues(), m_nCapacity((nCapacity > 0) ? nCapacity : 1) {};
  virtual ~CBroadcast() {Close();}
private:
  // Disallow copy and assignment operations ...
  CBroadcast (const CBroadcast &) = delete;
  CBroadcast& operator= (const CBroadcast &) = delete;

  // Public methods ...
public:
  // Create a new subscriber ...
  CSubscription<T> Subscribe() {
    std::shared_ptr<CSubscriberQueue<T> > pQueue(DBGNEW CSubscriberQueue<T>(m_nCapacity));
    std::lock_guard<std::mutex> lock(m_mtxList);
    m_lstQueues.push_back(pQueue);
    return CSubscription<T>(pQueue);
  }

  //   Send a copy of this message to every subscriber that still exists, and
  // forget about the ones that don't.  Returns the number of subscribers
  // that got the message ...
  size_t Publish (const T &msg) {
    std::lock_guard<std::mutex> lock(m_mtxList);
    size_t nDelivered = 0;
    typename QUEUE_LIST::iterator it = m_lstQueues.begin();
    while (it != m_lstQueues.end()) {
      std::shared_ptr<CSubscriberQueue<T> > pQueue = it->lock();
      if (!pQueue) {
        it = m_lstQueues.erase(it);
      } else {
        pQueue->Push(msg);  ++nDelivered;  ++it;
      }
    }
    return nDelivered;
  }

  //   Close every subscriber's queue.  They can still receive whatever is
  // queued, but after that Receive() returns -1 ...
  void Close() {
    std::lock_guard<std::mutex> lock(m_mtxList);
    for (typename QUEUE_LIST::iterator it = m_lstQueues.begin();  it != m_lstQueues.end();  ++it) {
      std::shared_ptr<CSubscriberQueue<T> > pQueue = it->lock();
      if (pQueue) pQueue->Close();
    }
    m_lstQueues.clear();
  }

  // Properties ...
public:
  size_t GetCapacity() const {return m_nCapacity;}

  // Private member data ...
private:
  typedef std::vector<std::weak_ptr<CSubscriberQueue<T> > > QUEUE_LIST;
  std::mutex    m_mtxList;      // protects the subscriber list
  QUEUE_LIST    m_lstQueues;    // all the current subscribers
  const size_t  m_nCapacity;    // length of each subscriber queue
};
