// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/Value.hpp"
// std
#include <sstream>

namespace cosync::core {

// Reference //////////////////////////////////////////////////////////////////

bool Reference::isNull() const
{
  return name.empty();
}

bool operator==(const Reference &a, const Reference &b)
{
  return a.type == b.type && a.name == b.name;
}

bool operator!=(const Reference &a, const Reference &b)
{
  return !(a == b);
}

bool operator==(const Unsupported &a, const Unsupported &b)
{
  return a.typeName == b.typeName;
}

// Value //////////////////////////////////////////////////////////////////////

Value::Value(int v) : m_data(int64_t(v)) {}

Value::Value(int64_t v) : m_data(v) {}

Value::Value(float v) : m_data(double(v)) {}

Value::Value(double v) : m_data(v) {}

Value::Value(bool v) : m_data(v) {}

Value::Value(const char *v) : m_data(std::string(v ? v : "")) {}

Value::Value(std::string v) : m_data(std::move(v)) {}

Value::Value(Blob v) : m_data(std::move(v)) {}

Value::Value(FloatArray v) : m_data(std::move(v)) {}

Value::Value(Reference v) : m_data(std::move(v)) {}

Value::Value(Unsupported v) : m_data(std::move(v)) {}

Value Value::reference(std::string type, std::string name)
{
  return Value(Reference{std::move(type), std::move(name)});
}

Value Value::nullReference(std::string type)
{
  return Value(Reference{std::move(type), {}});
}

ValueType Value::type() const
{
  switch (m_data.index()) {
  case 1:
    return ValueType::INT;
  case 2:
    return ValueType::FLOAT;
  case 3:
    return ValueType::BOOL;
  case 4:
    return ValueType::STRING;
  case 5:
    return ValueType::BLOB;
  case 6:
    return ValueType::FLOAT_ARRAY;
  case 7:
    return ValueType::REFERENCE;
  case 8:
    return ValueType::UNSUPPORTED;
  default:
    break;
  }
  return ValueType::NONE;
}

bool Value::valid() const
{
  return type() != ValueType::NONE;
}

bool Value::holdsReference() const
{
  return type() == ValueType::REFERENCE && !getReference().isNull();
}

int64_t Value::getInt() const
{
  return std::get<int64_t>(m_data);
}

double Value::getFloat() const
{
  return std::get<double>(m_data);
}

bool Value::getBool() const
{
  return std::get<bool>(m_data);
}

const std::string &Value::getString() const
{
  return std::get<std::string>(m_data);
}

const Blob &Value::getBlob() const
{
  return std::get<Blob>(m_data);
}

const FloatArray &Value::getFloatArray() const
{
  return std::get<FloatArray>(m_data);
}

const Reference &Value::getReference() const
{
  return std::get<Reference>(m_data);
}

const Unsupported &Value::getUnsupported() const
{
  return std::get<Unsupported>(m_data);
}

std::string Value::toString() const
{
  std::stringstream ss;
  switch (type()) {
  case ValueType::INT:
    ss << getInt();
    break;
  case ValueType::FLOAT:
    ss << getFloat();
    break;
  case ValueType::BOOL:
    ss << (getBool() ? "true" : "false");
    break;
  case ValueType::STRING:
    ss << '"' << getString() << '"';
    break;
  case ValueType::BLOB:
    ss << "<blob " << getBlob().size() << " bytes>";
    break;
  case ValueType::FLOAT_ARRAY: {
    ss << '[';
    const auto &a = getFloatArray();
    for (size_t i = 0; i < a.size(); i++)
      ss << (i > 0 ? ", " : "") << a[i];
    ss << ']';
    break;
  }
  case ValueType::REFERENCE: {
    const auto &r = getReference();
    ss << "-> " << r.type << '/' << (r.isNull() ? "<null>" : r.name);
    break;
  }
  case ValueType::UNSUPPORTED:
    ss << "<unsupported " << getUnsupported().typeName << '>';
    break;
  default:
    ss << "<none>";
    break;
  }
  return ss.str();
}

bool operator==(const Value &a, const Value &b)
{
  return a.m_data == b.m_data;
}

bool operator!=(const Value &a, const Value &b)
{
  return !(a == b);
}

const char *toString(ValueType type)
{
  switch (type) {
  case ValueType::NONE:
    return "none";
  case ValueType::INT:
    return "int";
  case ValueType::FLOAT:
    return "float";
  case ValueType::BOOL:
    return "bool";
  case ValueType::STRING:
    return "string";
  case ValueType::BLOB:
    return "blob";
  case ValueType::FLOAT_ARRAY:
    return "float[]";
  case ValueType::REFERENCE:
    return "reference";
  case ValueType::UNSUPPORTED:
    return "unsupported";
  }
  return "unknown";
}

} // namespace cosync::core
