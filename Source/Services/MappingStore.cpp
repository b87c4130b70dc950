#include "../Services/MappingStore.h"

MappingStore::MappingStore() {
  std::atomic_store(&current, std::shared_ptr<const MappingSnapshot>(
                                  std::make_shared<MappingSnapshot>()));
}

void MappingStore::publish(MappingTable entries) {
  auto next = std::make_shared<MappingSnapshot>();
  next->generation = snapshot()->generation + 1;
  next->entries = std::move(entries);
  for (size_t i = 0; i < next->entries.size(); ++i)
    next->index[next->entries[i].key] = i;
  std::atomic_store(&current, std::shared_ptr<const MappingSnapshot>(next));
}

void MappingStore::set(const TriggerKey &key, const RequestTemplate &request) {
  const juce::ScopedLock sl(writeLock);
  auto snap = snapshot();
  auto entries = snap->entries;
  auto it = snap->index.find(key);
  if (it != snap->index.end())
    entries[it->second].request = request;
  else
    entries.push_back({key, request});
  publish(std::move(entries));
}

std::optional<RequestTemplate> MappingStore::get(const TriggerKey &key) const {
  auto snap = snapshot();
  if (auto *request = snap->find(key))
    return *request;
  return std::nullopt;
}

bool MappingStore::remove(const TriggerKey &key) {
  const juce::ScopedLock sl(writeLock);
  auto snap = snapshot();
  auto it = snap->index.find(key);
  if (it == snap->index.end())
    return false;
  auto entries = snap->entries;
  entries.erase(entries.begin() + (std::ptrdiff_t)it->second);
  publish(std::move(entries));
  return true;
}

MappingTable MappingStore::all() const { return snapshot()->entries; }

void MappingStore::replaceAll(const MappingTable &table) {
  MappingTable entries;
  std::map<TriggerKey, size_t> seen;
  for (auto &e : table) {
    auto it = seen.find(e.key);
    if (it != seen.end()) {
      entries[it->second].request = e.request;
      continue;
    }
    seen[e.key] = entries.size();
    entries.push_back(e);
  }

  const juce::ScopedLock sl(writeLock);
  publish(std::move(entries));
}

void MappingStore::clear() {
  const juce::ScopedLock sl(writeLock);
  publish({});
}

size_t MappingStore::size() const { return snapshot()->entries.size(); }

bool MappingStore::contains(const TriggerKey &key) const {
  return snapshot()->find(key) != nullptr;
}

uint64_t MappingStore::getGeneration() const {
  return snapshot()->generation;
}
