/*
  ==============================================================================
    Source/Services/MappingStore.h
    Role: Trigger Key -> Request Template table. Read-copy-update: every
    write publishes a new immutable snapshot; readers never lock.
  ==============================================================================
*/
#pragma once

#include "../Core/TriggerKey.h"
#include "../Network/RequestTemplate.h"
#include <atomic>
#include <cstdint>
#include <juce_core/juce_core.h>
#include <map>
#include <memory>
#include <optional>
#include <vector>

struct MappingEntry {
  TriggerKey key;
  RequestTemplate request;

  bool operator==(const MappingEntry &other) const {
    return key == other.key && request == other.request;
  }
  bool operator!=(const MappingEntry &other) const { return !(*this == other); }
};

// Insertion order; a replaced key keeps its position.
using MappingTable = std::vector<MappingEntry>;

struct MappingSnapshot {
  uint64_t generation = 0;
  MappingTable entries;
  std::map<TriggerKey, size_t> index; // key -> position in entries

  const RequestTemplate *find(const TriggerKey &key) const {
    auto it = index.find(key);
    return it != index.end() ? &entries[it->second].request : nullptr;
  }
};

class MappingStore {
public:
  MappingStore();

  void set(const TriggerKey &key, const RequestTemplate &request);
  std::optional<RequestTemplate> get(const TriggerKey &key) const;
  bool remove(const TriggerKey &key);
  MappingTable all() const;

  /** Later duplicates of a key replace earlier ones. */
  void replaceAll(const MappingTable &table);
  void clear();

  size_t size() const;
  bool contains(const TriggerKey &key) const;
  uint64_t getGeneration() const;

  /** Hot path: lock-free read of the current table. */
  std::shared_ptr<const MappingSnapshot> snapshot() const {
    return std::atomic_load(&current);
  }

private:
  void publish(MappingTable entries);

  juce::CriticalSection writeLock;
  std::shared_ptr<const MappingSnapshot> current;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MappingStore)
};
