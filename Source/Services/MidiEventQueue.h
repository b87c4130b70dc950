/*
  ==============================================================================
    Source/Services/MidiEventQueue.h
    Role: Hand-off between the MIDI driver callback and the listener thread.
  ==============================================================================
*/
#pragma once
#include "../Core/Constants.h"
#include "../Core/MidiEvent.h"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <juce_core/juce_core.h>
#include <mutex>

// Multi-producer (driver callbacks), single-consumer (listener thread).
// Wake-on-data + short timeout so the listener cycles at least every 1 ms.
class MidiEventQueue {
public:
  static constexpr int capacity = Constants::kMidiEventQueueCapacity;

  // Driver thread: enqueue. Drops (and counts) if full. Wakes the listener.
  bool push(const MidiEvent &e) {
    const juce::SpinLock::ScopedLockType sl(writeLock);
    int s1, n1, s2, n2;
    fifo.prepareToWrite(1, s1, n1, s2, n2);
    if (n1 == 0) {
      dropped.fetch_add(1);
      return false;
    }
    buffer[(size_t)s1] = e;
    fifo.finishedWrite(1);
    notifyCond.notify_one();
    return true;
  }

  // Listener thread: wait up to timeout for data, then return.
  void waitForData(std::chrono::microseconds timeout) {
    std::unique_lock<std::mutex> lock(notifyMutex);
    if (fifo.getNumReady() > 0)
      return;
    notifyCond.wait_for(lock, timeout);
  }

  // Any thread (e.g. for shutdown).
  void wakeDrain() { notifyCond.notify_one(); }

  // Listener thread only.
  template <typename ProcessFunction>
  int process(ProcessFunction &&processFn) {
    int s1, n1, s2, n2;
    fifo.prepareToRead(fifo.getNumReady(), s1, n1, s2, n2);
    for (int i = 0; i < n1; ++i)
      processFn(buffer[(size_t)(s1 + i)]);
    for (int i = 0; i < n2; ++i)
      processFn(buffer[(size_t)(s2 + i)]);
    fifo.finishedRead(n1 + n2);
    return n1 + n2;
  }

  // Only when neither side is running (between sessions).
  void clear() {
    const juce::SpinLock::ScopedLockType sl(writeLock);
    fifo.reset();
  }

  int getNumReady() const { return fifo.getNumReady(); }
  int getNumDropped() const { return dropped.load(); }

private:
  juce::AbstractFifo fifo{capacity};
  std::array<MidiEvent, (size_t)capacity> buffer;
  juce::SpinLock writeLock;
  std::mutex notifyMutex;
  std::condition_variable notifyCond;
  std::atomic<int> dropped{0};
};
