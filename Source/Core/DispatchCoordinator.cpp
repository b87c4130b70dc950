#include "../Core/DispatchCoordinator.h"
#include "../Core/LogService.h"
#include "../Network/RequestBuilder.h"
#include "../Services/MappingSerializer.h"
#include "../Services/SignalMatcher.h"

DispatchCoordinator::DispatchCoordinator(
    std::unique_ptr<MidiPortFactory> portFactory,
    std::unique_ptr<HttpTransport> transport, UiNotifier uiNotifier)
    : aliveGuard(std::make_shared<std::atomic<DispatchCoordinator *>>(this)),
      notifier(std::move(uiNotifier)), gateway(std::move(transport)),
      midiListener(std::move(portFactory)) {
  std::atomic_store(&connection, std::make_shared<const ConnectionState>());

  auto guard = aliveGuard;
  midiListener.setOnDeviceError([guard](const juce::String &message) {
    if (auto *self = guard->load())
      self->notifyListeners([message](DispatchListener &l) {
        l.onDeviceError(message);
      });
  });
}

DispatchCoordinator::~DispatchCoordinator() {
  // Late callbacks become no-ops from here on
  aliveGuard->store(nullptr);
  midiListener.disconnect();
  gateway.shutdown();
}

//==============================================================================
void DispatchCoordinator::setApiConfig(const juce::String &url,
                                       const juce::String &key,
                                       const juce::String &clientId) {
  auto next = std::make_shared<const ConnectionState>(
      ConnectionState::create(url, key, clientId));
  std::atomic_store(&connection, next);

  LogService::instance().info(
      "API config updated: " +
      (next->baseUrl.isNotEmpty() ? next->baseUrl : juce::String("<no url>")) +
      (next->hasClientId() ? " (client " + next->clientId + ")"
                           : juce::String()));

  if (!next->isConfigured()) {
    notifyListeners([](DispatchListener &l) {
      l.onApiStatusChanged(false, "API URL and API key are required");
    });
    return;
  }

  auto guard = aliveGuard;
  gateway.runAsync([guard, next] {
    // Stop before the next request once the coordinator is gone or a newer
    // config has been set.
    auto current = [guard, next]() -> DispatchCoordinator * {
      auto *self = guard->load();
      if (self == nullptr || std::atomic_load(&self->connection) != next)
        return nullptr;
      return self;
    };

    auto *self = current();
    if (self == nullptr)
      return;
    auto probe = self->gateway.probe(next);

    if ((self = current()) == nullptr)
      return;
    const bool ok = probe.succeeded();
    const auto message = ok ? "Connected to " + next->baseUrl
                            : probe.status.message;
    if (ok)
      LogService::instance().info("API reachable at " + next->baseUrl);
    else
      LogService::instance().warning("API probe failed: " + message);
    self->notifyListeners([ok, message](DispatchListener &l) {
      l.onApiStatusChanged(ok, message);
    });
    if (!ok)
      return;

    juce::Array<juce::var> clients;
    auto clientsResult = self->gateway.fetchClients(next, clients);
    if ((self = current()) == nullptr)
      return;
    if (clientsResult.succeeded()) {
      self->notifyListeners(
          [clients](DispatchListener &l) { l.onClientsLoaded(clients); });
    } else {
      const auto error = clientsResult.status.message;
      LogService::instance().warning("Could not load clients: " + error);
      self->notifyListeners([error](DispatchListener &l) {
        l.onApiStatusChanged(false, error);
      });
    }

    std::vector<EndpointDescriptor> endpoints;
    auto docsResult = self->gateway.fetchEndpoints(next, endpoints);
    if ((self = current()) == nullptr)
      return;
    if (docsResult.succeeded()) {
      LogService::instance().info("Loaded " +
                                  juce::String((int)endpoints.size()) +
                                  " endpoint(s) from " + next->baseUrl);
      self->notifyListeners([endpoints](DispatchListener &l) {
        l.onEndpointsLoaded(endpoints);
      });
    } else {
      LogService::instance().warning("Could not load endpoints: " +
                                     docsResult.status.message);
    }
  });
}

void DispatchCoordinator::setDebounceWindowMs(double ms) {
  midiListener.setDebounceWindowMs(ms);
  LogService::instance().info("Debounce window set to " +
                              juce::String(midiListener.getDebounceWindowMs()) +
                              " ms");
}

void DispatchCoordinator::setRequestTimeoutMs(int ms) {
  gateway.setRequestTimeoutMs(ms);
  LogService::instance().info("Request timeout set to " +
                              juce::String(gateway.getRequestTimeoutMs()) +
                              " ms");
}

//==============================================================================
void DispatchCoordinator::setMappings(const MappingTable &table) {
  store.replaceAll(table);
  LogService::instance().info("Mapping table replaced (" +
                              juce::String((int)store.size()) + " entries)");
}

void DispatchCoordinator::addMapping(const TriggerKey &key,
                                     const RequestTemplate &request) {
  store.set(key, request);
  LogService::instance().info("Mapped " + key.toString() + " -> " +
                              request.describe());
}

bool DispatchCoordinator::removeMapping(const TriggerKey &key) {
  const bool removed = store.remove(key);
  if (removed)
    LogService::instance().info("Removed mapping " + key.toString());
  return removed;
}

DispatchStatus DispatchCoordinator::loadMappings(const juce::File &file) {
  MappingTable table;
  int skipped = 0;
  auto status = MappingSerializer::loadFromFile(file, table, skipped);
  if (status.wasOk())
    store.replaceAll(table);
  return status;
}

DispatchStatus DispatchCoordinator::saveMappings(const juce::File &file) const {
  return MappingSerializer::saveToFile(store.all(), file);
}

//==============================================================================
bool DispatchCoordinator::connectDevice(const juce::String &deviceName) {
  auto guard = aliveGuard;
  return midiListener.connect(deviceName, [guard](const MidiEvent &e) {
    if (auto *self = guard->load())
      self->handleMidiEvent(e);
  });
}

void DispatchCoordinator::disconnectDevice() { midiListener.disconnect(); }

juce::StringArray DispatchCoordinator::refreshDevices() {
  auto devices = midiListener.getAvailableDevices();
  notifyListeners(
      [devices](DispatchListener &l) { l.onMidiDevicesChanged(devices); });
  return devices;
}

//==============================================================================
void DispatchCoordinator::startLearn(LearnCallback onCaptured) {
  std::lock_guard<std::mutex> lock(learnMutex);
  learnCallback = std::move(onCaptured);
  learning.store(true);
  LogService::instance().info("MIDI learn armed");
}

void DispatchCoordinator::cancelLearn() {
  std::lock_guard<std::mutex> lock(learnMutex);
  if (learning.exchange(false))
    LogService::instance().info("MIDI learn cancelled");
  learnCallback = nullptr;
}

bool DispatchCoordinator::captureLearnedKey(const MidiEvent &event) {
  auto key = SignalMatcher::toTriggerKey(event);
  if (!key)
    return false;

  LearnCallback callback;
  {
    std::lock_guard<std::mutex> lock(learnMutex);
    if (!learning.exchange(false))
      return false;
    callback = std::move(learnCallback);
    learnCallback = nullptr;
  }

  auto guard = aliveGuard;
  const auto captured = *key;
  notifier.post([guard, callback, captured] {
    LogService::instance().info("MIDI learn captured " + captured.toString());
    if (callback && guard->load() != nullptr)
      callback(captured);
  });
  return true;
}

void DispatchCoordinator::handleMidiEvent(const MidiEvent &event) {
  notifyListeners([event](DispatchListener &l) { l.onRawMidiEvent(event); });

  if (learning.load() && captureLearnedKey(event))
    return;

  auto snap = store.snapshot();
  auto request = SignalMatcher::match(event, *snap);
  if (!request)
    return;

  dispatch(*request);
}

void DispatchCoordinator::dispatch(const RequestTemplate &request) {
  auto conn = getConnection();
  const auto endpoint = request.pathPattern;

  if (!conn->isConfigured()) {
    DispatchOutcome outcome;
    outcome.error = DispatchError::Connectivity;
    outcome.message = "API URL and API key are not configured";
    reportDispatch(endpoint, outcome);
    return;
  }

  auto built = RequestBuilder::build(request, conn);
  if (!built.wasOk()) {
    DispatchOutcome outcome;
    outcome.error = built.status.error;
    outcome.message = built.status.message;
    reportDispatch(endpoint, outcome);
    return;
  }

  auto guard = aliveGuard;
  gateway.executeAsync(std::move(built.request),
                       [guard, endpoint](const ApiResult &result) {
                         auto *self = guard->load();
                         if (self == nullptr)
                           return;
                         DispatchOutcome outcome;
                         outcome.success = result.succeeded();
                         outcome.error = result.status.error;
                         outcome.message = result.status.message;
                         outcome.statusCode = result.statusCode;
                         outcome.payload = result.payload;
                         self->reportDispatch(endpoint, outcome);
                       });
}

// Called on the listener thread or a gateway worker. Logs only from the
// notifier's side: the listener thread never writes the log.
void DispatchCoordinator::reportDispatch(const juce::String &endpoint,
                                         const DispatchOutcome &outcome) {
  auto guard = aliveGuard;
  notifier.post([guard, endpoint, outcome] {
    if (outcome.success)
      LogService::instance().info("API call to " + endpoint + " succeeded (" +
                                  juce::String(outcome.statusCode) + ")");
    else
      LogService::instance().warning("API call to " + endpoint + " failed: " +
                                     toString(outcome.error) + ": " +
                                     outcome.message);

    if (auto *self = guard->load())
      self->listeners.call([&endpoint, &outcome](DispatchListener &l) {
        l.onDispatchResult(endpoint, outcome);
      });
  });
}
