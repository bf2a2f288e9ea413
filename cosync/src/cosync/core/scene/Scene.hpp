// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "cosync/core/scene/HostScene.hpp"

namespace cosync::core {

// In-memory HostScene, used by the demo client, the tools and the tests
struct Scene : public HostScene
{
  Scene() = default;
  explicit Scene(const std::vector<std::string> &types);
  ~Scene() override = default;

  Scene(const Scene &) = delete;
  Scene &operator=(const Scene &) = delete;
  Scene(Scene &&) = delete;
  Scene &operator=(Scene &&) = delete;

  void registerType(const std::string &type);

  // Edit batches //

  void beginEdit();
  void endEdit();

  // Convenience for local edits //

  bool setField(const BlockId &id, const std::string &field, const Value &v);
  const Value *getField(const BlockId &id, const std::string &field) const;
  size_t numberOfBlocks() const;
  size_t numberOfBlocks(const std::string &type) const;

  // HostScene interface //

  std::vector<std::string> blockTypes() const override;
  void enumerateBlocks(
      const std::string &type, const BlockVisitor &visitor) const override;
  std::optional<FieldMap> findBlock(const BlockId &id) const override;
  bool hasBlock(const BlockId &id) const override;

  bool createBlock(const BlockId &id) override;
  bool updateBlock(const BlockId &id,
      const std::string &field,
      const Value &value) override;
  bool deleteBlock(const BlockId &id) override;
  bool renameBlock(const BlockId &id, const std::string &newName) override;

  bool isStable() const override;
  uint64_t editVersion() const override;

 private:
  using BlockMap = FlatMap<std::string, FieldMap>; // name -> fields

  FieldMap *block(const BlockId &id);
  const FieldMap *block(const BlockId &id) const;

  FlatMap<std::string, BlockMap> m_blocks; // type -> blocks
  int m_editDepth{0};
  uint64_t m_editVersion{0};
};

} // namespace cosync::core
