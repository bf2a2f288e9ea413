// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/ChangeRecord.hpp"
#include "cosync/core/DataStream.hpp"
// std
#include <vector>

namespace cosync::core {

// Canonical binary encoding shared by snapshots, the wire protocol and the
// relay log. All integers are fixed-width little-endian, floats are written
// by IEEE-754 bit pattern, variable length data is u32 length prefixed.
//
// Every function throws SyncError{ENCODING_ERROR} on an UNSUPPORTED value,
// a short read or a malformed tag.

// Values //

void encodeValue(DataWriter &w, const Value &v);
Value decodeValue(DataReader &r);
ByteBuffer encodeValue(const Value &v);

// Field maps (u32 count, then name + value in ascending name order) //

void encodeFields(DataWriter &w, const FieldMap &fields);
FieldMap decodeFields(DataReader &r);

// Change records //

void encodeRecord(DataWriter &w, const ChangeRecord &record);
ChangeRecord decodeRecord(DataReader &r);
ByteBuffer encodeRecord(const ChangeRecord &record);
ChangeRecord decodeRecord(const ByteBuffer &bytes);

void encodeRecords(DataWriter &w, const std::vector<ChangeRecord> &records);
std::vector<ChangeRecord> decodeRecords(DataReader &r);

} // namespace cosync::core
