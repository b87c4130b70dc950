#include "../Core/TriggerKey.h"

juce::String TriggerKey::kindToString(SignalKind kind) {
  switch (kind) {
  case SignalKind::NoteOn:
    return "note_on";
  case SignalKind::NoteOff:
    return "note_off";
  case SignalKind::ControlChange:
    return "control_change";
  default:
    return {};
  }
}

std::optional<SignalKind> TriggerKey::kindFromString(const juce::String &text) {
  if (text == "note_on")
    return SignalKind::NoteOn;
  if (text == "note_off")
    return SignalKind::NoteOff;
  if (text == "control_change")
    return SignalKind::ControlChange;
  return std::nullopt;
}

juce::String TriggerKey::toString() const {
  return kindToString(kind) + ":" + juce::String(channel) + ":" +
         juce::String(index);
}

std::optional<TriggerKey> TriggerKey::fromString(const juce::String &text) {
  juce::StringArray parts;
  parts.addTokens(text.trim(), ":", "");
  if (parts.size() != 3)
    return std::nullopt;

  auto kind = kindFromString(parts[0]);
  if (!kind)
    return std::nullopt;

  // Strict integers only: "1.5", "", "+3" and "0x10" are rejected
  for (int i = 1; i < 3; ++i)
    if (parts[i].isEmpty() || !parts[i].containsOnly("0123456789") ||
        parts[i].length() > 3)
      return std::nullopt;

  TriggerKey key{*kind, parts[1].getIntValue(), parts[2].getIntValue()};
  if (!key.isValid())
    return std::nullopt;
  return key;
}
