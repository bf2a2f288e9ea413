// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/Codec.hpp"
#include "cosync/core/Error.hpp"
// std
#include <algorithm>

namespace cosync::core {

// Helper functions ///////////////////////////////////////////////////////////

static void check(bool ok, const char *what)
{
  if (!ok) {
    throw SyncError(
        ErrorCode::ENCODING_ERROR, std::string("malformed data: ") + what);
  }
}

// Values /////////////////////////////////////////////////////////////////////

void encodeValue(DataWriter &w, const Value &v)
{
  const auto type = v.type();
  if (type == ValueType::UNSUPPORTED) {
    throw SyncError(ErrorCode::ENCODING_ERROR,
        "no encoding for host value of type '" + v.getUnsupported().typeName
            + "'");
  }

  bool ok = writeU8(w, uint8_t(type));

  switch (type) {
  case ValueType::INT:
    ok = ok && writeI64(w, v.getInt());
    break;
  case ValueType::FLOAT:
    ok = ok && writeF64(w, v.getFloat());
    break;
  case ValueType::BOOL:
    ok = ok && writeU8(w, v.getBool() ? 1 : 0);
    break;
  case ValueType::STRING:
    ok = ok && writeString(w, v.getString());
    break;
  case ValueType::BLOB: {
    ok = ok && writeBlob(w, v.getBlob());
    break;
  }
  case ValueType::FLOAT_ARRAY: {
    const auto &a = v.getFloatArray();
    ok = ok && writeU32(w, uint32_t(a.size()));
    for (size_t i = 0; ok && i < a.size(); i++)
      ok = writeF32(w, a[i]);
    break;
  }
  case ValueType::REFERENCE: {
    const auto &r = v.getReference();
    ok = ok && writeString(w, r.type) && writeString(w, r.name);
    break;
  }
  default:
    break;
  }

  check(ok, "value write failed");
}

Value decodeValue(DataReader &r)
{
  uint8_t tag = 0;
  check(readU8(r, tag), "value tag");

  switch (ValueType(tag)) {
  case ValueType::NONE:
    return {};
  case ValueType::INT: {
    int64_t i = 0;
    check(readI64(r, i), "int value");
    return Value(i);
  }
  case ValueType::FLOAT: {
    double d = 0.0;
    check(readF64(r, d), "float value");
    return Value(d);
  }
  case ValueType::BOOL: {
    uint8_t b = 0;
    check(readU8(r, b) && b <= 1, "bool value");
    return Value(b != 0);
  }
  case ValueType::STRING: {
    std::string s;
    check(readString(r, s), "string value");
    return Value(std::move(s));
  }
  case ValueType::BLOB: {
    Blob b;
    check(readBlob(r, b), "blob");
    return Value(std::move(b));
  }
  case ValueType::FLOAT_ARRAY: {
    uint32_t count = 0;
    check(readU32(r, count), "array length");
    FloatArray a;
    a.reserve(std::min<uint32_t>(count, 4096));
    for (uint32_t i = 0; i < count; i++) {
      float f = 0.f;
      check(readF32(r, f), "array element");
      a.push_back(f);
    }
    return Value(std::move(a));
  }
  case ValueType::REFERENCE: {
    Reference ref;
    check(readString(r, ref.type) && readString(r, ref.name), "reference");
    return Value(std::move(ref));
  }
  default:
    break;
  }

  throw SyncError(ErrorCode::ENCODING_ERROR,
      "unknown value tag " + std::to_string(int(tag)));
}

ByteBuffer encodeValue(const Value &v)
{
  BufferWriter w;
  encodeValue(w, v);
  return w.take();
}

// Field maps /////////////////////////////////////////////////////////////////

void encodeFields(DataWriter &w, const FieldMap &fields)
{
  check(writeU32(w, uint32_t(fields.size())), "field count");
  for (const auto &f : fields) {
    check(writeString(w, f.first), "field name");
    encodeValue(w, f.second);
  }
}

FieldMap decodeFields(DataReader &r)
{
  uint32_t count = 0;
  check(readU32(r, count), "field count");

  FieldMap fields;
  fields.reserve(std::min<uint32_t>(count, 1024));
  for (uint32_t i = 0; i < count; i++) {
    std::string name;
    check(readString(r, name), "field name");
    fields[name] = decodeValue(r);
  }
  return fields;
}

// Change records /////////////////////////////////////////////////////////////

void encodeRecord(DataWriter &w, const ChangeRecord &record)
{
  const bool ok = writeU64(w, record.sequence)
      && writeString(w, record.originClientId)
      && writeU8(w, uint8_t(record.operation))
      && writeString(w, record.blockType) && writeString(w, record.blockName)
      && writeString(w, record.newName);
  check(ok, "record header");
  encodeFields(w, record.payload);
}

ChangeRecord decodeRecord(DataReader &r)
{
  ChangeRecord record;
  uint8_t op = 0;
  const bool ok = readU64(r, record.sequence)
      && readString(r, record.originClientId) && readU8(r, op)
      && readString(r, record.blockType) && readString(r, record.blockName)
      && readString(r, record.newName);
  check(ok, "record header");
  check(op <= uint8_t(Operation::RENAME), "record operation");
  record.operation = Operation(op);
  record.payload = decodeFields(r);
  return record;
}

ByteBuffer encodeRecord(const ChangeRecord &record)
{
  BufferWriter w;
  encodeRecord(w, record);
  return w.take();
}

ChangeRecord decodeRecord(const ByteBuffer &bytes)
{
  BufferReader r(bytes);
  auto record = decodeRecord(r);
  check(r.remaining() == 0, "trailing bytes after record");
  return record;
}

void encodeRecords(DataWriter &w, const std::vector<ChangeRecord> &records)
{
  check(writeU32(w, uint32_t(records.size())), "record count");
  for (const auto &rec : records)
    encodeRecord(w, rec);
}

std::vector<ChangeRecord> decodeRecords(DataReader &r)
{
  uint32_t count = 0;
  check(readU32(r, count), "record count");

  std::vector<ChangeRecord> records;
  records.reserve(std::min<uint32_t>(count, 1024));
  for (uint32_t i = 0; i < count; i++)
    records.push_back(decodeRecord(r));
  return records;
}

} // namespace cosync::core
