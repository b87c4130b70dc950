#include "../Services/MidiListener.h"
#include "../Core/Constants.h"
#include "../Core/LogService.h"
#include <chrono>

namespace {

class MidiListenerThread : public juce::Thread {
public:
  explicit MidiListenerThread(MidiListener *l)
      : juce::Thread("MIDI listener"), listener(l) {}

  void run() override {
    while (!threadShouldExit() && listener != nullptr &&
           listener->runListenLoop()) {
    }
  }

private:
  MidiListener *listener = nullptr;
};

} // namespace

MidiListener::MidiListener(std::unique_ptr<MidiPortFactory> portFactory)
    : factory(portFactory ? std::move(portFactory)
                          : std::make_unique<JuceMidiPortFactory>()),
      debounceWindowMs(Constants::kDebounceWindowMs) {}

MidiListener::~MidiListener() {
  std::lock_guard<std::mutex> lock(sessionMutex);
  stopSession();
}

juce::String MidiListener::getCurrentDevice() const {
  const juce::ScopedLock sl(nameLock);
  return currentDevice;
}

juce::StringArray MidiListener::getAvailableDevices() {
  auto devices = factory->getAvailableDevices();
  if (devices.isEmpty())
    LogService::instance().debug("No MIDI input devices found");
  return devices;
}

bool MidiListener::connect(const juce::String &deviceName,
                           EventHandler eventHandler) {
  std::lock_guard<std::mutex> lock(sessionMutex);
  stopSession();

  if (deviceName.trim().isEmpty()) {
    reportDeviceError("No MIDI device selected");
    return false;
  }

  auto newPort = factory->open(deviceName.trim(), *this);
  if (newPort == nullptr) {
    reportDeviceError("Failed to open MIDI device \"" + deviceName + "\"");
    return false;
  }

  port = std::move(newPort);
  handler = std::move(eventHandler);
  debouncer.reset();
  eventQueue.clear();
  lastHealthCheckMs = juce::Time::getMillisecondCounter();
  {
    const juce::ScopedLock sl(nameLock);
    currentDevice = port->getName().isNotEmpty() ? port->getName()
                                                 : deviceName.trim();
  }

  accepting.store(true);
  connected.store(true);
  port->start();

  listenerThread = std::make_unique<MidiListenerThread>(this);
  listenerThread->startThread(juce::Thread::Priority::high);

  LogService::instance().info("Connected to MIDI device: " +
                              getCurrentDevice());
  return true;
}

void MidiListener::disconnect() {
  std::lock_guard<std::mutex> lock(sessionMutex);
  stopSession();
}

void MidiListener::stopSession() {
  if (port == nullptr && listenerThread == nullptr)
    return;

  accepting.store(false);

  if (listenerThread != nullptr) {
    listenerThread->signalThreadShouldExit();
    eventQueue.wakeDrain();
  }
  if (port != nullptr)
    port->stop();

  if (listenerThread != nullptr) {
    if (!listenerThread->waitForThreadToExit(
            Constants::kListenerJoinTimeoutMs)) {
      LogService::instance().error(
          "MIDI listener thread did not stop within " +
          juce::String(Constants::kListenerJoinTimeoutMs) + " ms; waiting");
      listenerThread->waitForThreadToExit(-1);
    }
    listenerThread.reset();
  }

  // Releasing the port ends its driver callbacks; only then is the queue
  // guaranteed to stay empty.
  port.reset();
  eventQueue.clear();
  handler = nullptr;

  const auto name = getCurrentDevice();
  {
    const juce::ScopedLock sl(nameLock);
    currentDevice.clear();
  }
  connected.store(false);
  LogService::instance().info("Disconnected from MIDI device: " + name);
}

void MidiListener::handleIncomingMidiMessage(juce::MidiInput *,
                                             const juce::MidiMessage &message) {
  pushEvent(MidiEvent::fromMidiMessage(
      message, juce::Time::getMillisecondCounterHiRes()));
}

void MidiListener::pushEvent(const MidiEvent &e) {
  if (!accepting.load())
    return;
  if (!eventQueue.push(e))
    LogService::instance().debug("MIDI event queue full, dropped " +
                                 e.describe());
}

bool MidiListener::runListenLoop() {
  eventQueue.waitForData(
      std::chrono::milliseconds(Constants::kListenerPollIntervalMs));
  if (!accepting.load())
    return false;

  const double window = debounceWindowMs.load();
  eventQueue.process([this, window](const MidiEvent &e) {
    if (!accepting.load())
      return;
    if (!debouncer.accept(e, window)) {
      debounced.fetch_add(1);
      return;
    }
    if (handler)
      handler(e);
  });

  const auto now = juce::Time::getMillisecondCounter();
  if (now - lastHealthCheckMs >=
      (juce::uint32)Constants::kDeviceHealthCheckIntervalMs) {
    lastHealthCheckMs = now;
    if (port != nullptr && !port->isStillAvailable()) {
      accepting.store(false);
      connected.store(false);
      reportDeviceError("MIDI device \"" + getCurrentDevice() +
                        "\" is no longer available");
      return false;
    }
  }
  return true;
}

void MidiListener::reportDeviceError(const juce::String &message) {
  LogService::instance().error(message);
  if (onDeviceError)
    onDeviceError(message);
}
