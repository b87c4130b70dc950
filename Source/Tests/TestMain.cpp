#include "../Core/LogService.h"
#include "RunAll.h"
#include <juce_events/juce_events.h>

int main() {
  juce::ScopedJuceInitialiser_GUI juceInit;
  // Pipeline logs would drown the test report
  LogService::instance().setMinimumLevel(LogService::Level::Error);
  LogService::instance().setConsoleEnabled(false);
  return RunAllTests::run() ? 0 : 1;
}
