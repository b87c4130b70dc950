/*
  ==============================================================================
    Source/Core/UiNotifier.h
    Role: Hands notifications from listener/worker threads to the message
    thread. Tests swap the executor to run callbacks inline.
  ==============================================================================
*/
#pragma once

#include "../Core/LogService.h"
#include <functional>
#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

class UiNotifier {
public:
  using Executor = std::function<void(std::function<void()>)>;

  UiNotifier() : executor(&UiNotifier::postToMessageThread) {}
  explicit UiNotifier(Executor e)
      : executor(e ? std::move(e) : Executor(&UiNotifier::postToMessageThread)) {}

  /** Never blocks the calling thread. */
  void post(std::function<void()> fn) const {
    if (fn)
      executor(std::move(fn));
  }

  static void postToMessageThread(std::function<void()> fn) {
    if (!juce::MessageManager::callAsync(std::move(fn)))
      LogService::instance().debug("No message thread; notification dropped");
  }

  /** Runs on the posting thread. */
  static void runImmediately(std::function<void()> fn) { fn(); }

private:
  Executor executor;
};
