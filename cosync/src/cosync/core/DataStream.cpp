// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/DataStream.hpp"
// std
#include <algorithm>
#include <limits>

namespace cosync::core {

// Strings and blobs larger than this are rejected on read
constexpr uint32_t MAX_SEGMENT_BYTES = 1u << 30;

// BufferWriter definitions ///////////////////////////////////////////////////

BufferWriter::BufferWriter(size_t initial_size)
{
  m_buffer.reserve(initial_size);
}

size_t BufferWriter::write(const void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0)
    return 0;

  const size_t total_bytes = size * count;
  const auto *data = static_cast<const std::byte *>(ptr);

  m_buffer.insert(m_buffer.end(), data, data + total_bytes);

  return count;
}

const ByteBuffer &BufferWriter::buffer() const
{
  return m_buffer;
}

ByteBuffer BufferWriter::take()
{
  return std::move(m_buffer);
}

void BufferWriter::clear()
{
  m_buffer.clear();
}

// FileWriter definitions /////////////////////////////////////////////////////

FileWriter::FileWriter(const char *filename, const char *mode)
{
  m_file = std::fopen(filename, mode);
}

FileWriter::~FileWriter()
{
  if (m_file != nullptr)
    std::fclose(m_file);
}

size_t FileWriter::write(const void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0 || m_file == nullptr)
    return 0;

  return std::fwrite(ptr, size, count, m_file);
}

bool FileWriter::flush()
{
  return m_file != nullptr && std::fflush(m_file) == 0;
}

bool FileWriter::valid() const
{
  return m_file != nullptr;
}

FileWriter::operator bool() const
{
  return valid();
}

// BufferReader definitions ///////////////////////////////////////////////////

BufferReader::BufferReader(const ByteBuffer &buffer, size_t offset)
    : m_buffer(buffer), m_offset(offset)
{}

size_t BufferReader::read(void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0
      || m_offset >= m_buffer.size()) {
    return 0;
  }

  // Only whole elements are consumed
  const size_t elements = std::min(count, remaining() / size);
  const size_t total_bytes = elements * size;

  std::memcpy(ptr, m_buffer.data() + m_offset, total_bytes);
  m_offset += total_bytes;

  return elements;
}

size_t BufferReader::position() const
{
  return m_offset;
}

size_t BufferReader::remaining() const
{
  return m_offset >= m_buffer.size() ? 0 : m_buffer.size() - m_offset;
}

void BufferReader::reset(size_t offset)
{
  m_offset = offset;
}

// FileReader definitions /////////////////////////////////////////////////////

FileReader::FileReader(const char *filename, const char *mode)
{
  m_file = std::fopen(filename, mode);
}

FileReader::~FileReader()
{
  if (m_file != nullptr)
    std::fclose(m_file);
}

size_t FileReader::read(void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0 || m_file == nullptr)
    return 0;

  return std::fread(ptr, size, count, m_file);
}

bool FileReader::valid() const
{
  return m_file != nullptr;
}

FileReader::operator bool() const
{
  return valid();
}

// Primitive definitions //////////////////////////////////////////////////////

template <typename UINT_T>
static bool writeLittleEndian(DataWriter &w, UINT_T v)
{
  uint8_t bytes[sizeof(UINT_T)];
  for (size_t i = 0; i < sizeof(UINT_T); i++)
    bytes[i] = uint8_t((v >> (8 * i)) & 0xFF);
  return w.write(bytes, 1, sizeof(bytes)) == sizeof(bytes);
}

template <typename UINT_T>
static bool readLittleEndian(DataReader &r, UINT_T &v)
{
  uint8_t bytes[sizeof(UINT_T)];
  if (r.read(bytes, 1, sizeof(bytes)) != sizeof(bytes))
    return false;
  v = 0;
  for (size_t i = 0; i < sizeof(UINT_T); i++)
    v |= UINT_T(bytes[i]) << (8 * i);
  return true;
}

bool writeU8(DataWriter &w, uint8_t v)
{
  return w.write(&v, 1, 1) == 1;
}

bool writeU32(DataWriter &w, uint32_t v)
{
  return writeLittleEndian(w, v);
}

bool writeU64(DataWriter &w, uint64_t v)
{
  return writeLittleEndian(w, v);
}

bool writeI64(DataWriter &w, int64_t v)
{
  return writeLittleEndian(w, static_cast<uint64_t>(v));
}

bool writeF32(DataWriter &w, float v)
{
  static_assert(std::numeric_limits<float>::is_iec559, "IEEE-754 required");
  uint32_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  return writeLittleEndian(w, bits);
}

bool writeF64(DataWriter &w, double v)
{
  static_assert(std::numeric_limits<double>::is_iec559, "IEEE-754 required");
  uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  return writeLittleEndian(w, bits);
}

bool writeString(DataWriter &w, const std::string &s)
{
  if (s.size() > MAX_SEGMENT_BYTES)
    return false;
  return writeU32(w, uint32_t(s.size())) && writeBytes(w, s.data(), s.size());
}

bool writeBlob(DataWriter &w, const std::vector<uint8_t> &b)
{
  if (b.size() > MAX_SEGMENT_BYTES)
    return false;
  return writeU32(w, uint32_t(b.size())) && writeBytes(w, b.data(), b.size());
}

bool writeBytes(DataWriter &w, const void *data, size_t size)
{
  if (size == 0)
    return true;
  return w.write(data, 1, size) == size;
}

bool readU8(DataReader &r, uint8_t &v)
{
  return r.read(&v, 1, 1) == 1;
}

bool readU32(DataReader &r, uint32_t &v)
{
  return readLittleEndian(r, v);
}

bool readU64(DataReader &r, uint64_t &v)
{
  return readLittleEndian(r, v);
}

bool readI64(DataReader &r, int64_t &v)
{
  uint64_t bits = 0;
  if (!readLittleEndian(r, bits))
    return false;
  v = static_cast<int64_t>(bits);
  return true;
}

bool readF32(DataReader &r, float &v)
{
  uint32_t bits = 0;
  if (!readLittleEndian(r, bits))
    return false;
  std::memcpy(&v, &bits, sizeof(v));
  return true;
}

bool readF64(DataReader &r, double &v)
{
  uint64_t bits = 0;
  if (!readLittleEndian(r, bits))
    return false;
  std::memcpy(&v, &bits, sizeof(v));
  return true;
}

// Grows 'out' only as bytes actually arrive, so a corrupt length cannot make
// us allocate more than the input holds (plus one chunk).
template <typename CONTAINER_T>
static bool readSegment(DataReader &r, CONTAINER_T &out)
{
  constexpr size_t CHUNK_BYTES = 64 * 1024;

  uint32_t length = 0;
  if (!readU32(r, length) || length > MAX_SEGMENT_BYTES)
    return false;

  out.clear();
  size_t done = 0;
  while (done < length) {
    const size_t n = std::min<size_t>(CHUNK_BYTES, length - done);
    out.resize(done + n);
    if (!readBytes(r, out.data() + done, n))
      return false;
    done += n;
  }
  return true;
}

bool readString(DataReader &r, std::string &s)
{
  return readSegment(r, s);
}

bool readBlob(DataReader &r, std::vector<uint8_t> &b)
{
  return readSegment(r, b);
}

bool readBytes(DataReader &r, void *data, size_t size)
{
  if (size == 0)
    return true;
  return r.read(data, 1, size) == size;
}

} // namespace cosync::core
