/*
  ==============================================================================
    Source/Services/SignalMatcher.h
    Role: Raw event -> canonical Trigger Key -> mapped template.
  ==============================================================================
*/
#pragma once

#include "../Core/MidiEvent.h"
#include "../Core/TriggerKey.h"
#include "../Services/MappingStore.h"
#include <optional>

struct SignalMatcher {
  /** A zero-velocity note-on is a note-off. Other message types have no key. */
  static std::optional<TriggerKey> toTriggerKey(const MidiEvent &event);

  /** nullopt on a miss; misses are not errors. */
  static std::optional<RequestTemplate> match(const MidiEvent &event,
                                              const MappingSnapshot &table);
  static std::optional<RequestTemplate> match(const MidiEvent &event,
                                              const MappingStore &store);
};
