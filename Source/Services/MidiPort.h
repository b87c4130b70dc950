/*
  ==============================================================================
    Source/Services/MidiPort.h
    Role: Input port seam. JuceMidiPortFactory opens hardware through
    juce::MidiInput; tests hand the listener an in-memory factory.
  ==============================================================================
*/
#pragma once
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_core/juce_core.h>
#include <memory>

class MidiPort {
public:
  virtual ~MidiPort() = default;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual juce::String getName() const = 0;

  /** False once the device has gone from the system device list. */
  virtual bool isStillAvailable() const = 0;
};

class MidiPortFactory {
public:
  virtual ~MidiPortFactory() = default;

  virtual juce::StringArray getAvailableDevices() = 0;

  /** nullptr if no device matches or it cannot be opened. The callback must
   * outlive the returned port. */
  virtual std::unique_ptr<MidiPort> open(const juce::String &nameOrIdentifier,
                                         juce::MidiInputCallback &callback) = 0;
};

class JuceMidiPortFactory : public MidiPortFactory {
public:
  JuceMidiPortFactory() = default;

  juce::StringArray getAvailableDevices() override;
  std::unique_ptr<MidiPort> open(const juce::String &nameOrIdentifier,
                                 juce::MidiInputCallback &callback) override;

private:
  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceMidiPortFactory)
};
