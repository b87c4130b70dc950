#include "../Services/SignalMatcher.h"

std::optional<TriggerKey> SignalMatcher::toTriggerKey(const MidiEvent &event) {
  TriggerKey key;
  key.channel = event.channel;
  key.index = event.data1;

  switch (event.type) {
  case MidiEvent::Type::NoteOn:
    key.kind = event.data2 > 0 ? SignalKind::NoteOn : SignalKind::NoteOff;
    break;
  case MidiEvent::Type::NoteOff:
    key.kind = SignalKind::NoteOff;
    break;
  case MidiEvent::Type::ControlChange:
    key.kind = SignalKind::ControlChange;
    break;
  default:
    return std::nullopt;
  }

  if (!key.isValid())
    return std::nullopt;
  return key;
}

std::optional<RequestTemplate>
SignalMatcher::match(const MidiEvent &event, const MappingSnapshot &table) {
  auto key = toTriggerKey(event);
  if (!key)
    return std::nullopt;
  if (auto *request = table.find(*key))
    return *request;
  return std::nullopt;
}

std::optional<RequestTemplate> SignalMatcher::match(const MidiEvent &event,
                                                    const MappingStore &store) {
  auto snap = store.snapshot();
  return match(event, *snap);
}
