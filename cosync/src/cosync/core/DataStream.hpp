// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace cosync::core {

using ByteBuffer = std::vector<std::byte>;

///////////////////////////////////////////////////////////////////////////////
// Data writers ///////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

struct DataWriter
{
  virtual ~DataWriter() = default;

  // Write data to the writer (like std::fwrite)
  virtual size_t write(const void *ptr, size_t size, size_t count) = 0;
};

struct BufferWriter : public DataWriter
{
  explicit BufferWriter(size_t initial_size = 0);

  size_t write(const void *ptr, size_t size, size_t count) override;

  const ByteBuffer &buffer() const;
  ByteBuffer take();
  void clear();

 private:
  ByteBuffer m_buffer;
};

struct FileWriter : public DataWriter
{
  explicit FileWriter(const char *filename, const char *mode = "ab");
  ~FileWriter();

  FileWriter(const FileWriter &) = delete;
  FileWriter &operator=(const FileWriter &) = delete;

  size_t write(const void *ptr, size_t size, size_t count) override;
  bool flush();

  bool valid() const;
  operator bool() const;

 private:
  std::FILE *m_file{nullptr};
};

///////////////////////////////////////////////////////////////////////////////
// Data readers ///////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

struct DataReader
{
  virtual ~DataReader() = default;

  // Read data from the reader (like std::fread)
  virtual size_t read(void *ptr, size_t size, size_t count) = 0;
};

struct BufferReader : public DataReader
{
  explicit BufferReader(const ByteBuffer &buffer, size_t offset = 0);

  size_t read(void *ptr, size_t size, size_t count) override;

  size_t position() const;
  size_t remaining() const;
  void reset(size_t offset = 0);

 private:
  const ByteBuffer &m_buffer;
  size_t m_offset{0};
};

struct FileReader : public DataReader
{
  explicit FileReader(const char *filename, const char *mode = "rb");
  ~FileReader();

  FileReader(const FileReader &) = delete;
  FileReader &operator=(const FileReader &) = delete;

  size_t read(void *ptr, size_t size, size_t count) override;

  bool valid() const;
  operator bool() const;

 private:
  std::FILE *m_file{nullptr};
};

///////////////////////////////////////////////////////////////////////////////
// Fixed-width little-endian primitives ///////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

// Writers return false if the underlying stream accepted fewer bytes.
// Readers return false on a short read, leaving 'v' unspecified.

bool writeU8(DataWriter &w, uint8_t v);
bool writeU32(DataWriter &w, uint32_t v);
bool writeU64(DataWriter &w, uint64_t v);
bool writeI64(DataWriter &w, int64_t v);
bool writeF32(DataWriter &w, float v);
bool writeF64(DataWriter &w, double v);
bool writeString(DataWriter &w, const std::string &s); // u32 length + bytes
bool writeBlob(DataWriter &w, const std::vector<uint8_t> &b); // same layout
bool writeBytes(DataWriter &w, const void *data, size_t size);

bool readU8(DataReader &r, uint8_t &v);
bool readU32(DataReader &r, uint32_t &v);
bool readU64(DataReader &r, uint64_t &v);
bool readI64(DataReader &r, int64_t &v);
bool readF32(DataReader &r, float &v);
bool readF64(DataReader &r, double &v);
bool readString(DataReader &r, std::string &s);
bool readBlob(DataReader &r, std::vector<uint8_t> &b);
bool readBytes(DataReader &r, void *data, size_t size);

} // namespace cosync::core
