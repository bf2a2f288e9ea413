// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cosync::core {

enum class ValueType : uint8_t
{
  NONE = 0,
  INT = 1,
  FLOAT = 2,
  BOOL = 3,
  STRING = 4,
  BLOB = 5,
  FLOAT_ARRAY = 6,
  REFERENCE = 7,
  UNSUPPORTED = 255
};

using Blob = std::vector<uint8_t>;
using FloatArray = std::vector<float>;

// Named pointer to another data-block. An empty 'name' is a null reference
// which still records the type it is allowed to point at.
struct Reference
{
  std::string type;
  std::string name;

  bool isNull() const;
};

bool operator==(const Reference &a, const Reference &b);
bool operator!=(const Reference &a, const Reference &b);

// Host value the core has no encoding for; keeps the host's type name for logs
struct Unsupported
{
  std::string typeName;
};

bool operator==(const Unsupported &a, const Unsupported &b);

struct Value
{
  Value() = default;
  Value(int v);
  Value(int64_t v);
  Value(float v);
  Value(double v);
  Value(bool v);
  Value(const char *v);
  Value(std::string v);
  Value(Blob v);
  Value(FloatArray v);
  Value(Reference v);
  Value(Unsupported v);

  static Value reference(std::string type, std::string name);
  static Value nullReference(std::string type);

  ValueType type() const;
  bool valid() const; // anything but NONE
  bool holdsReference() const; // non-null reference only

  int64_t getInt() const;
  double getFloat() const;
  bool getBool() const;
  const std::string &getString() const;
  const Blob &getBlob() const;
  const FloatArray &getFloatArray() const;
  const Reference &getReference() const;
  const Unsupported &getUnsupported() const;

  std::string toString() const; // human readable, for logs and tools

 private:
  friend bool operator==(const Value &a, const Value &b);

  std::variant<std::monostate,
      int64_t,
      double,
      bool,
      std::string,
      Blob,
      FloatArray,
      Reference,
      Unsupported>
      m_data;
};

bool operator==(const Value &a, const Value &b);
bool operator!=(const Value &a, const Value &b);

const char *toString(ValueType type);

} // namespace cosync::core
