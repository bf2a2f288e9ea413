// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace cosync::core {

// Multi-producer queue drained by a single consumer thread
template <typename T>
struct ConcurrentQueue
{
  void push(T value);
  std::optional<T> try_pop();
  std::vector<T> drain(); // everything queued, in push order

  size_t size() const;
  bool empty() const;
  void clear();

 private:
  mutable std::mutex m_mutex;
  std::deque<T> m_queue;
};

// Inlined definitions ////////////////////////////////////////////////////////

template <typename T>
inline void ConcurrentQueue<T>::push(T value)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_queue.push_back(std::move(value));
}

template <typename T>
inline std::optional<T> ConcurrentQueue<T>::try_pop()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_queue.empty())
    return std::nullopt;
  T value = std::move(m_queue.front());
  m_queue.pop_front();
  return value;
}

template <typename T>
inline std::vector<T> ConcurrentQueue<T>::drain()
{
  std::deque<T> items;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    items.swap(m_queue);
  }
  return std::vector<T>(
      std::make_move_iterator(items.begin()),
      std::make_move_iterator(items.end()));
}

template <typename T>
inline size_t ConcurrentQueue<T>::size() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

template <typename T>
inline bool ConcurrentQueue<T>::empty() const
{
  return size() == 0;
}

template <typename T>
inline void ConcurrentQueue<T>::clear()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_queue.clear();
}

} // namespace cosync::core
