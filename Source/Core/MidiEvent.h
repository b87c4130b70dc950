/*
  ==============================================================================
    Source/Core/MidiEvent.h
    Role: Raw hardware event as read from the port (transient, POD so it can
    live in the lock-free queue).
  ==============================================================================
*/
#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>

struct MidiEvent {
  enum class Type { NoteOn, NoteOff, ControlChange, Other };

  Type type = Type::Other;
  int channel = 0; // 0-15
  int data1 = 0;   // note or controller number
  int data2 = 0;   // velocity or controller value
  double timestampMs = 0.0;

  static MidiEvent noteOn(int channel, int note, int velocity,
                          double timeMs = 0.0) {
    return {Type::NoteOn, channel, note, velocity, timeMs};
  }
  static MidiEvent noteOff(int channel, int note, double timeMs = 0.0) {
    return {Type::NoteOff, channel, note, 0, timeMs};
  }
  static MidiEvent controlChange(int channel, int control, int value,
                                 double timeMs = 0.0) {
    return {Type::ControlChange, channel, control, value, timeMs};
  }

  /** juce::MidiMessage channels are 1-16; ours are 0-15. A zero-velocity
   * note-on stays a NoteOn here: the matcher owns that convention. */
  static MidiEvent fromMidiMessage(const juce::MidiMessage &m,
                                   double arrivalMs) {
    MidiEvent e;
    e.timestampMs = arrivalMs;
    e.channel = juce::jmax(0, m.getChannel() - 1);
    if (m.isNoteOn(true)) {
      e.type = Type::NoteOn;
      e.data1 = m.getNoteNumber();
      e.data2 = m.getVelocity();
    } else if (m.isNoteOff(false)) {
      e.type = Type::NoteOff;
      e.data1 = m.getNoteNumber();
      e.data2 = m.getVelocity();
    } else if (m.isController()) {
      e.type = Type::ControlChange;
      e.data1 = m.getControllerNumber();
      e.data2 = m.getControllerValue();
    } else {
      auto *raw = m.getRawData();
      const int size = m.getRawDataSize();
      e.data1 = size > 1 ? raw[1] : 0;
      e.data2 = size > 2 ? raw[2] : 0;
    }
    return e;
  }

  /** Discrete press/release edges are never debounced. */
  bool isEdge() const { return type == Type::NoteOn || type == Type::NoteOff; }

  juce::String describe() const {
    switch (type) {
    case Type::NoteOn:
      return "note_on ch=" + juce::String(channel) +
             " note=" + juce::String(data1) + " vel=" + juce::String(data2);
    case Type::NoteOff:
      return "note_off ch=" + juce::String(channel) +
             " note=" + juce::String(data1) + " vel=" + juce::String(data2);
    case Type::ControlChange:
      return "control_change ch=" + juce::String(channel) +
             " control=" + juce::String(data1) +
             " value=" + juce::String(data2);
    default:
      return "other ch=" + juce::String(channel);
    }
  }
};
