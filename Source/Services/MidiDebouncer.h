/*
  ==============================================================================
    Source/Services/MidiDebouncer.h
    Per-signal repeat suppression for continuous controls. Listener thread only.
  ==============================================================================
*/
#pragma once
#include "../Core/MidiEvent.h"
#include <unordered_map>

struct MidiDebouncer {
  // Returns false for a non-edge repeat of the same (type, channel, data1)
  // inside windowMs of the last accepted one. Edges always pass.
  bool accept(const MidiEvent &e, double windowMs) {
    if (e.isEdge())
      return true;

    const int key = signalKey(e);
    auto it = lastAccepted.find(key);
    if (it != lastAccepted.end() && windowMs > 0.0 &&
        e.timestampMs - it->second < windowMs)
      return false;

    lastAccepted[key] = e.timestampMs;
    return true;
  }

  void reset() { lastAccepted.clear(); }

  size_t size() const { return lastAccepted.size(); }

private:
  static int signalKey(const MidiEvent &e) {
    return (static_cast<int>(e.type) << 16) | ((e.channel & 0x0F) << 8) |
           (e.data1 & 0xFF);
  }

  std::unordered_map<int, double> lastAccepted;
};
