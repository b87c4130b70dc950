/*
  ==============================================================================
    Source/Core/DispatchError.h
    Role: Error kinds of the dispatch pipeline and the status value returned
    across module boundaries.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>

enum class DispatchError {
  None,
  Connectivity, // API unreachable or non-2xx
  Template,     // path placeholder without value, missing required field
  Device,       // MIDI port failed to open or faulted
  Parse,        // malformed array/JSON parameter text or mapping file
  Storage       // mapping file missing, unreadable or not writable
};

inline juce::String toString(DispatchError e) {
  switch (e) {
  case DispatchError::None:
    return "none";
  case DispatchError::Connectivity:
    return "ConnectivityError";
  case DispatchError::Template:
    return "TemplateError";
  case DispatchError::Device:
    return "DeviceError";
  case DispatchError::Parse:
    return "ParseError";
  case DispatchError::Storage:
    return "StorageError";
  default:
    return "unknown";
  }
}

/** Like juce::Result, but carries which kind of failure occurred. */
struct DispatchStatus {
  DispatchError error = DispatchError::None;
  juce::String message;

  static DispatchStatus ok() { return {}; }
  static DispatchStatus fail(DispatchError e, const juce::String &msg) {
    return {e, msg};
  }

  bool wasOk() const { return error == DispatchError::None; }
  bool failed() const { return !wasOk(); }

  juce::String describe() const {
    return wasOk() ? juce::String("ok") : toString(error) + ": " + message;
  }
};
