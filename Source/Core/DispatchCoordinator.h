/*
  ==============================================================================
    Source/Core/DispatchCoordinator.h
    Role: Wires MidiListener -> SignalMatcher -> RequestBuilder -> ApiGateway
    and owns the mapping table, the connection snapshot and learn mode.
    UI-facing calls come from the message thread; listener notifications are
    delivered there through the UiNotifier.
  ==============================================================================
*/
#pragma once

#include "../Core/DispatchError.h"
#include "../Core/DispatchListener.h"
#include "../Core/MidiEvent.h"
#include "../Core/TriggerKey.h"
#include "../Core/UiNotifier.h"
#include "../Network/ApiGateway.h"
#include "../Network/HttpTransport.h"
#include "../Network/RequestTemplate.h"
#include "../Services/MappingStore.h"
#include "../Services/MidiListener.h"
#include "../Services/MidiPort.h"
#include <atomic>
#include <functional>
#include <juce_core/juce_core.h>
#include <memory>
#include <mutex>

class DispatchCoordinator {
public:
  using LearnCallback = std::function<void(const TriggerKey &)>;

  /** nullptr seams fall back to hardware MIDI and juce::URL HTTP. */
  DispatchCoordinator(std::unique_ptr<MidiPortFactory> portFactory = nullptr,
                      std::unique_ptr<HttpTransport> transport = nullptr,
                      UiNotifier uiNotifier = UiNotifier());
  ~DispatchCoordinator();

  void addListener(DispatchListener *l) { listeners.add(l); }
  void removeListener(DispatchListener *l) { listeners.remove(l); }

  // --- API configuration ---
  /** Replaces the connection snapshot. When url and key are set, probes the
   * API, then loads clients and endpoints, all off the calling thread. */
  void setApiConfig(const juce::String &url, const juce::String &key,
                    const juce::String &clientId);
  std::shared_ptr<const ConnectionState> getConnection() const {
    return std::atomic_load(&connection);
  }

  void setDebounceWindowMs(double ms);
  void setRequestTimeoutMs(int ms);

  // --- Mappings ---
  void setMappings(const MappingTable &table);
  void addMapping(const TriggerKey &key, const RequestTemplate &request);
  bool removeMapping(const TriggerKey &key);
  MappingTable getMappings() const { return store.all(); }

  DispatchStatus loadMappings(const juce::File &file);
  DispatchStatus saveMappings(const juce::File &file) const;

  // --- MIDI device ---
  bool connectDevice(const juce::String &deviceName);
  void disconnectDevice();
  bool isDeviceConnected() const { return midiListener.isConnected(); }
  juce::String getCurrentDevice() const {
    return midiListener.getCurrentDevice();
  }
  juce::StringArray refreshDevices();

  // --- MIDI learn ---
  /** The next qualifying event is captured instead of dispatched; the
   * callback runs once, through the UiNotifier. */
  void startLearn(LearnCallback onCaptured);
  void cancelLearn();
  bool isLearning() const { return learning.load(); }

  /** Listener thread entry for every debounced event. */
  void handleMidiEvent(const MidiEvent &event);

  /** Build and send one request. Outcome arrives via onDispatchResult. */
  void dispatch(const RequestTemplate &request);

  const MappingStore &getStore() const { return store; }
  ApiGateway &getGateway() { return gateway; }

private:
  template <typename Callback> void notifyListeners(Callback &&callback) {
    auto guard = aliveGuard;
    notifier.post([guard, callback] {
      if (auto *self = guard->load())
        self->listeners.call(callback);
    });
  }

  void reportDispatch(const juce::String &endpoint,
                      const DispatchOutcome &outcome);
  bool captureLearnedKey(const MidiEvent &event);

  std::shared_ptr<std::atomic<DispatchCoordinator *>> aliveGuard;

  UiNotifier notifier;
  juce::ListenerList<DispatchListener,
                     juce::Array<DispatchListener *, juce::CriticalSection>>
      listeners;

  MappingStore store;
  std::shared_ptr<const ConnectionState> connection;

  std::mutex learnMutex;
  LearnCallback learnCallback;
  std::atomic<bool> learning{false};

  // Destroyed first: no listener thread or worker outlives the state above.
  ApiGateway gateway;
  MidiListener midiListener;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DispatchCoordinator)
};
