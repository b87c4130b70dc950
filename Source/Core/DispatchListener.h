#pragma once
#include "../Core/DispatchError.h"
#include "../Core/MidiEvent.h"
#include "../Network/EndpointDescriptor.h"
#include <juce_core/juce_core.h>
#include <vector>

struct DispatchOutcome {
  bool success = false;
  DispatchError error = DispatchError::None;
  juce::String message;
  int statusCode = 0;
  juce::var payload;
};

// All callbacks arrive on the message thread (see UiNotifier).
class DispatchListener {
public:
  virtual ~DispatchListener() = default;
  virtual void onMidiDevicesChanged(const juce::StringArray &devices) {
    juce::ignoreUnused(devices);
  }
  virtual void onApiStatusChanged(bool success, const juce::String &message) {
    juce::ignoreUnused(success, message);
  }
  virtual void onDispatchResult(const juce::String &endpoint,
                                const DispatchOutcome &outcome) {
    juce::ignoreUnused(endpoint, outcome);
  }
  virtual void onRawMidiEvent(const MidiEvent &event) {
    juce::ignoreUnused(event);
  }
  virtual void onClientsLoaded(const juce::Array<juce::var> &clients) {
    juce::ignoreUnused(clients);
  }
  virtual void
  onEndpointsLoaded(const std::vector<EndpointDescriptor> &endpoints) {
    juce::ignoreUnused(endpoints);
  }
  virtual void onDeviceError(const juce::String &message) {
    juce::ignoreUnused(message);
  }
};
