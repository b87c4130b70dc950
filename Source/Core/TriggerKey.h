/*
  ==============================================================================
    Source/Core/TriggerKey.h
    Role: Canonical identity of a matchable MIDI signal (kind, channel, index)
    and its persisted string form "<kind>:<channel>:<index>".
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <tuple>

enum class SignalKind { NoteOn, NoteOff, ControlChange };

struct TriggerKey {
  SignalKind kind = SignalKind::NoteOn;
  int channel = 0; // 0-15
  int index = 0;   // note or controller number, 0-127

  bool isValid() const {
    return juce::isPositiveAndBelow(channel, 16) &&
           juce::isPositiveAndBelow(index, 128);
  }

  bool operator==(const TriggerKey &other) const {
    return kind == other.kind && channel == other.channel &&
           index == other.index;
  }
  bool operator!=(const TriggerKey &other) const { return !(*this == other); }
  bool operator<(const TriggerKey &other) const {
    return std::make_tuple(static_cast<int>(kind), channel, index) <
           std::make_tuple(static_cast<int>(other.kind), other.channel,
                           other.index);
  }

  juce::String toString() const;
  static std::optional<TriggerKey> fromString(const juce::String &text);

  static juce::String kindToString(SignalKind kind);
  static std::optional<SignalKind> kindFromString(const juce::String &text);
};
