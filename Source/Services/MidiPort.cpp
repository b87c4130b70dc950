#include "../Services/MidiPort.h"
#include "../Core/LogService.h"

namespace {

class JuceMidiPort : public MidiPort {
public:
  JuceMidiPort(std::unique_ptr<juce::MidiInput> in,
               const juce::MidiDeviceInfo &info)
      : input(std::move(in)), deviceInfo(info) {}

  ~JuceMidiPort() override { stop(); }

  void start() override {
    if (input && !running) {
      input->start();
      running = true;
    }
  }

  void stop() override {
    if (input && running) {
      input->stop();
      running = false;
    }
  }

  juce::String getName() const override { return deviceInfo.name; }

  bool isStillAvailable() const override {
    for (auto &d : juce::MidiInput::getAvailableDevices())
      if (d.identifier == deviceInfo.identifier)
        return true;
    return false;
  }

private:
  std::unique_ptr<juce::MidiInput> input;
  juce::MidiDeviceInfo deviceInfo;
  bool running = false;
};

} // namespace

juce::StringArray JuceMidiPortFactory::getAvailableDevices() {
  juce::StringArray names;
  for (auto &d : juce::MidiInput::getAvailableDevices())
    names.add(d.name);
  return names;
}

std::unique_ptr<MidiPort>
JuceMidiPortFactory::open(const juce::String &nameOrIdentifier,
                          juce::MidiInputCallback &callback) {
  for (auto &d : juce::MidiInput::getAvailableDevices()) {
    if (d.identifier != nameOrIdentifier && d.name != nameOrIdentifier)
      continue;

    auto input = juce::MidiInput::openDevice(d.identifier, &callback);
    if (input == nullptr) {
      LogService::instance().warning("MIDI input \"" + d.name +
                                     "\" could not be opened. It may be in "
                                     "use elsewhere.");
      return nullptr;
    }
    return std::make_unique<JuceMidiPort>(std::move(input), d);
  }
  return nullptr;
}
