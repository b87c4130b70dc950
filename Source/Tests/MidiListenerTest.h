/*
  ==============================================================================
    Source/Tests/MidiListenerTest.h
    Role: Listener sessions against fake hardware: open failures, debouncing
    on the listener thread, clean reconnects and device loss.
  ==============================================================================
*/
#pragma once
#include "../Services/MidiListener.h"
#include "TestFakes.h"
#include <atomic>
#include <thread>

struct MidiListenerTest {
  struct Recorder {
    std::mutex lock;
    std::vector<MidiEvent> events;

    MidiListener::EventHandler handler() {
      return [this](const MidiEvent &e) {
        std::lock_guard<std::mutex> l(lock);
        events.push_back(e);
      };
    }
    size_t size() {
      std::lock_guard<std::mutex> l(lock);
      return events.size();
    }
  };

  static bool runConnectFailure() {
    auto hw = std::make_shared<FakeMidiHardware>();
    hw->addDevice("Busy", true);
    MidiListener listener(std::make_unique<FakeMidiPortFactory>(hw));

    juce::StringArray errors;
    listener.setOnDeviceError([&](const juce::String &m) { errors.add(m); });

    Recorder rec;
    if (listener.connect("Busy", rec.handler())) return false;
    if (listener.connect("Nowhere", rec.handler())) return false;
    if (listener.isConnected() || errors.size() != 2) return false;
    if (!errors[1].contains("Nowhere")) return false;

    auto devices = listener.getAvailableDevices();
    return devices.size() == 1 && devices[0] == "Busy";
  }

  static bool runDebounceOnListenerThread() {
    auto hw = std::make_shared<FakeMidiHardware>();
    hw->addDevice("Pad");
    MidiListener listener(std::make_unique<FakeMidiPortFactory>(hw));

    Recorder rec;
    if (!listener.connect("Pad", rec.handler())) return false;
    if (!listener.isConnected() || listener.getCurrentDevice() != "Pad") return false;

    listener.pushEvent(MidiEvent::controlChange(0, 7, 1, 1000.0));
    listener.pushEvent(MidiEvent::controlChange(0, 7, 2, 1050.0)); // dropped
    listener.pushEvent(MidiEvent::controlChange(0, 7, 3, 1150.0));
    listener.pushEvent(MidiEvent::noteOn(0, 60, 100, 1151.0));
    listener.pushEvent(MidiEvent::noteOff(0, 60, 1152.0));

    if (!TestUtil::waitUntil([&] { return rec.size() == 4; })) return false;
    juce::Thread::sleep(30);
    if (rec.size() != 4 || listener.getNumDebouncedEvents() != 1) return false;
    {
      std::lock_guard<std::mutex> l(rec.lock);
      if (rec.events[1].data2 != 3 || rec.events[2].type != MidiEvent::Type::NoteOn ||
          rec.events[3].type != MidiEvent::Type::NoteOff)
        return false;
    }

    // Through the driver callback: a burst of one controller collapses
    for (int v = 0; v < 5; ++v)
      hw->send("Pad", juce::MidiMessage::controllerEvent(2, 10, v));
    if (!TestUtil::waitUntil([&] { return rec.size() == 5; })) return false;
    juce::Thread::sleep(30);
    if (rec.size() != 5) return false;

    listener.disconnect();
    return !listener.isConnected() && !hw->isRunning("Pad");
  }

  // No event of the old session reaches anyone once disconnect() returns
  static bool runReconnectLeavesNoStaleEvents() {
    auto hw = std::make_shared<FakeMidiHardware>();
    hw->addDevice("A");
    hw->addDevice("B");
    MidiListener listener(std::make_unique<FakeMidiPortFactory>(hw));

    std::atomic<bool> disconnectReturned{false};
    std::atomic<bool> stale{false};
    std::atomic<int> fromA{0};
    std::atomic<int> fromB{0};

    if (!listener.connect("A", [&](const MidiEvent &) {
          if (disconnectReturned.load())
            stale = true;
          ++fromA;
        }))
      return false;

    std::atomic<bool> stopSending{false};
    std::thread driver([&] {
      int note = 0;
      while (!stopSending.load()) {
        hw->send("A", juce::MidiMessage::noteOn(1, note, (juce::uint8)100));
        note = (note + 1) % 128;
        juce::Thread::sleep(0);
      }
    });

    if (!TestUtil::waitUntil([&] { return fromA.load() > 50; })) {
      stopSending = true;
      driver.join();
      return false;
    }

    listener.disconnect();
    disconnectReturned = true;
    const int countAtDisconnect = fromA.load();

    if (!listener.connect("B", [&](const MidiEvent &) { ++fromB; })) {
      stopSending = true;
      driver.join();
      return false;
    }
    hw->send("B", juce::MidiMessage::noteOn(1, 1, (juce::uint8)100));
    bool ok = TestUtil::waitUntil([&] { return fromB.load() == 1; });
    juce::Thread::sleep(20);

    stopSending = true;
    driver.join();
    listener.disconnect();

    return ok && !stale.load() && fromA.load() == countAtDisconnect && fromB.load() == 1 &&
           hw->getOpenCount("A") == 1 && hw->getOpenCount("B") == 1;
  }

  static bool runDeviceLossReportedOnce() {
    auto hw = std::make_shared<FakeMidiHardware>();
    hw->addDevice("Pad");
    MidiListener listener(std::make_unique<FakeMidiPortFactory>(hw));

    std::atomic<int> errors{0};
    listener.setOnDeviceError([&](const juce::String &) { ++errors; });

    Recorder rec;
    if (!listener.connect("Pad", rec.handler())) return false;
    hw->setAvailable("Pad", false);

    if (!TestUtil::waitUntil([&] { return errors.load() == 1; }, 3000)) return false;
    if (listener.isConnected()) return false;
    juce::Thread::sleep(1200);
    if (errors.load() != 1) return false;

    listener.disconnect();
    return errors.load() == 1 && !hw->isRunning("Pad");
  }
};
