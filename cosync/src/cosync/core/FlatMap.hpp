// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace cosync::core {

// Key-sorted associative container stored contiguously. Iteration order is
// always ascending key order, which keeps anything encoded from it canonical.
template <typename KEY, typename VALUE>
struct FlatMap
{
  using key_type = KEY;
  using mapped_type = VALUE;
  using item_t = std::pair<KEY, VALUE>;
  using storage_t = std::vector<item_t>;
  using iterator = typename storage_t::iterator;
  using const_iterator = typename storage_t::const_iterator;

  FlatMap() = default;
  FlatMap(std::initializer_list<item_t> items);

  VALUE &operator[](const KEY &key);

  VALUE *at(const KEY &key); // nullptr if not present
  const VALUE *at(const KEY &key) const;

  const item_t &at_index(size_t i) const;
  item_t &at_index(size_t i);

  bool contains(const KEY &key) const;
  bool erase(const KEY &key);
  void clear();
  void reserve(size_t size);

  size_t size() const;
  bool empty() const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

 private:
  const_iterator lower(const KEY &key) const;
  iterator lower(const KEY &key);

  storage_t m_items;
};

template <typename KEY, typename VALUE>
bool operator==(const FlatMap<KEY, VALUE> &a, const FlatMap<KEY, VALUE> &b);
template <typename KEY, typename VALUE>
bool operator!=(const FlatMap<KEY, VALUE> &a, const FlatMap<KEY, VALUE> &b);

///////////////////////////////////////////////////////////////////////////////
// Inlined definitions ////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

template <typename KEY, typename VALUE>
inline FlatMap<KEY, VALUE>::FlatMap(std::initializer_list<item_t> items)
{
  for (const auto &i : items)
    (*this)[i.first] = i.second;
}

template <typename KEY, typename VALUE>
inline VALUE &FlatMap<KEY, VALUE>::operator[](const KEY &key)
{
  auto it = lower(key);
  if (it == m_items.end() || it->first != key)
    it = m_items.emplace(it, key, VALUE{});
  return it->second;
}

template <typename KEY, typename VALUE>
inline VALUE *FlatMap<KEY, VALUE>::at(const KEY &key)
{
  auto it = lower(key);
  return (it == m_items.end() || it->first != key) ? nullptr : &it->second;
}

template <typename KEY, typename VALUE>
inline const VALUE *FlatMap<KEY, VALUE>::at(const KEY &key) const
{
  auto it = lower(key);
  return (it == m_items.end() || it->first != key) ? nullptr : &it->second;
}

template <typename KEY, typename VALUE>
inline const typename FlatMap<KEY, VALUE>::item_t &
FlatMap<KEY, VALUE>::at_index(size_t i) const
{
  return m_items[i];
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::item_t &FlatMap<KEY, VALUE>::at_index(
    size_t i)
{
  return m_items[i];
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::contains(const KEY &key) const
{
  return at(key) != nullptr;
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::erase(const KEY &key)
{
  auto it = lower(key);
  if (it == m_items.end() || it->first != key)
    return false;
  m_items.erase(it);
  return true;
}

template <typename KEY, typename VALUE>
inline void FlatMap<KEY, VALUE>::clear()
{
  m_items.clear();
}

template <typename KEY, typename VALUE>
inline void FlatMap<KEY, VALUE>::reserve(size_t size)
{
  m_items.reserve(size);
}

template <typename KEY, typename VALUE>
inline size_t FlatMap<KEY, VALUE>::size() const
{
  return m_items.size();
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::empty() const
{
  return m_items.empty();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::iterator FlatMap<KEY, VALUE>::begin()
{
  return m_items.begin();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::iterator FlatMap<KEY, VALUE>::end()
{
  return m_items.end();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::const_iterator
FlatMap<KEY, VALUE>::begin() const
{
  return m_items.begin();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::const_iterator
FlatMap<KEY, VALUE>::end() const
{
  return m_items.end();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::const_iterator FlatMap<KEY, VALUE>::lower(
    const KEY &key) const
{
  return std::lower_bound(m_items.begin(),
      m_items.end(),
      key,
      [](const item_t &i, const KEY &k) { return i.first < k; });
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::iterator FlatMap<KEY, VALUE>::lower(
    const KEY &key)
{
  return std::lower_bound(m_items.begin(),
      m_items.end(),
      key,
      [](const item_t &i, const KEY &k) { return i.first < k; });
}

template <typename KEY, typename VALUE>
inline bool operator==(
    const FlatMap<KEY, VALUE> &a, const FlatMap<KEY, VALUE> &b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

template <typename KEY, typename VALUE>
inline bool operator!=(
    const FlatMap<KEY, VALUE> &a, const FlatMap<KEY, VALUE> &b)
{
  return !(a == b);
}

} // namespace cosync::core
