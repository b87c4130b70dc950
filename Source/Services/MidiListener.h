/*
  ==============================================================================
    Source/Services/MidiListener.h
    Role: Owns one input port session at a time. Driver callbacks stamp and
    queue events; a dedicated thread drains, debounces and forwards them to
    the handler bound at connect().
  ==============================================================================
*/
#pragma once
#include "../Core/Constants.h"
#include "../Core/MidiEvent.h"
#include "../Services/MidiDebouncer.h"
#include "../Services/MidiEventQueue.h"
#include "../Services/MidiPort.h"
#include <atomic>
#include <functional>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_core/juce_core.h>
#include <memory>
#include <mutex>

class MidiListener : public juce::MidiInputCallback {
public:
  using EventHandler = std::function<void(const MidiEvent &)>;

  /** nullptr factory = JuceMidiPortFactory (hardware). */
  explicit MidiListener(std::unique_ptr<MidiPortFactory> portFactory = nullptr);
  ~MidiListener() override;

  /** Stops any previous session, then opens the device (identifier or name).
   * The handler is the only receiver of this session's events and runs on
   * the listener thread. False if the device could not be opened. */
  bool connect(const juce::String &deviceName, EventHandler handler);

  /** Blocks until the listener thread has exited. After it returns no event
   * of the old session is delivered. */
  void disconnect();

  bool isConnected() const { return connected.load(); }
  juce::String getCurrentDevice() const;

  /** Empty when enumeration fails. */
  juce::StringArray getAvailableDevices();

  /** 0 disables debouncing; negative values restore the default. */
  void setDebounceWindowMs(double ms) {
    debounceWindowMs.store(ms >= 0.0 ? ms : Constants::kDebounceWindowMs);
  }
  double getDebounceWindowMs() const { return debounceWindowMs.load(); }

  /** Open failures (caller's thread) and device loss (listener thread).
   * Set before connect(). */
  void setOnDeviceError(std::function<void(const juce::String &)> fn) {
    onDeviceError = std::move(fn);
  }

  // Driver thread
  void handleIncomingMidiMessage(juce::MidiInput *source,
                                 const juce::MidiMessage &message) override;

  /** Driver-side entry for an already stamped event. Ignored between
   * sessions. */
  void pushEvent(const MidiEvent &e);

  /** One listener cycle: wait up to 1 ms, drain, debounce, forward, health
   * check. Returns false when the session is over. Listener thread only. */
  bool runListenLoop();

  int getNumDroppedEvents() const { return eventQueue.getNumDropped(); }
  int getNumDebouncedEvents() const { return debounced.load(); }

private:
  void stopSession();
  void reportDeviceError(const juce::String &message);

  std::unique_ptr<MidiPortFactory> factory;
  std::mutex sessionMutex; // serializes connect/disconnect

  std::unique_ptr<MidiPort> port;
  std::unique_ptr<juce::Thread> listenerThread;
  EventHandler handler; // written only while no listener thread runs

  MidiEventQueue eventQueue;
  MidiDebouncer debouncer; // listener thread only
  juce::uint32 lastHealthCheckMs = 0;

  std::atomic<bool> accepting{false};
  std::atomic<bool> connected{false};
  std::atomic<double> debounceWindowMs;
  std::atomic<int> debounced{0};

  mutable juce::CriticalSection nameLock;
  juce::String currentDevice;

  std::function<void(const juce::String &)> onDeviceError;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MidiListener)
};
