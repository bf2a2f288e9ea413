// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cosync/core/scene/Scene.hpp"
#include "cosync/core/Logging.hpp"

namespace cosync::core {

Scene::Scene(const std::vector<std::string> &types)
{
  for (const auto &t : types)
    registerType(t);
}

void Scene::registerType(const std::string &type)
{
  m_blocks[type];
}

void Scene::beginEdit()
{
  m_editDepth++;
}

void Scene::endEdit()
{
  if (m_editDepth == 0) {
    logWarning("[Scene] endEdit() called without matching beginEdit()");
    return;
  }
  m_editDepth--;
}

bool Scene::setField(
    const BlockId &id, const std::string &field, const Value &v)
{
  return updateBlock(id, field, v);
}

const Value *Scene::getField(const BlockId &id, const std::string &field) const
{
  const auto *fields = block(id);
  return fields ? fields->at(field) : nullptr;
}

size_t Scene::numberOfBlocks() const
{
  size_t count = 0;
  for (const auto &t : m_blocks)
    count += t.second.size();
  return count;
}

size_t Scene::numberOfBlocks(const std::string &type) const
{
  const auto *blocks = m_blocks.at(type);
  return blocks ? blocks->size() : 0;
}

// HostScene interface ////////////////////////////////////////////////////////

std::vector<std::string> Scene::blockTypes() const
{
  std::vector<std::string> types;
  types.reserve(m_blocks.size());
  for (const auto &t : m_blocks)
    types.push_back(t.first);
  return types;
}

void Scene::enumerateBlocks(
    const std::string &type, const BlockVisitor &visitor) const
{
  const auto *blocks = m_blocks.at(type);
  if (!blocks)
    return;
  for (const auto &b : *blocks)
    visitor(b.first, b.second);
}

std::optional<FieldMap> Scene::findBlock(const BlockId &id) const
{
  const auto *fields = block(id);
  if (!fields)
    return std::nullopt;
  return *fields;
}

bool Scene::hasBlock(const BlockId &id) const
{
  return block(id) != nullptr;
}

bool Scene::createBlock(const BlockId &id)
{
  if (id.name.empty() || hasBlock(id))
    return false;
  m_blocks[id.type][id.name] = {};
  m_editVersion++;
  return true;
}

bool Scene::updateBlock(
    const BlockId &id, const std::string &field, const Value &value)
{
  auto *fields = block(id);
  if (!fields)
    return false;

  if (value.valid())
    (*fields)[field] = value;
  else
    fields->erase(field);

  m_editVersion++;
  return true;
}

bool Scene::deleteBlock(const BlockId &id)
{
  auto *blocks = m_blocks.at(id.type);
  if (!blocks || !blocks->erase(id.name))
    return false;
  m_editVersion++;
  return true;
}

bool Scene::renameBlock(const BlockId &id, const std::string &newName)
{
  if (newName.empty() || newName == id.name)
    return false;

  auto *blocks = m_blocks.at(id.type);
  if (!blocks || blocks->contains(newName))
    return false;

  auto *fields = blocks->at(id.name);
  if (!fields)
    return false;

  FieldMap moved = std::move(*fields);
  blocks->erase(id.name);
  (*blocks)[newName] = std::move(moved);
  m_editVersion++;
  return true;
}

bool Scene::isStable() const
{
  return m_editDepth == 0;
}

uint64_t Scene::editVersion() const
{
  return m_editVersion;
}

// Helper functions ///////////////////////////////////////////////////////////

FieldMap *Scene::block(const BlockId &id)
{
  auto *blocks = m_blocks.at(id.type);
  return blocks ? blocks->at(id.name) : nullptr;
}

const FieldMap *Scene::block(const BlockId &id) const
{
  const auto *blocks = m_blocks.at(id.type);
  return blocks ? blocks->at(id.name) : nullptr;
}

} // namespace cosync::core
