/*
  ==============================================================================
    Source/Tests/RunAll.h
    Role: Run all unit tests. Invoked by MidiRestBridgeTests and by the app
    with --run-tests.
  ==============================================================================
*/
#pragma once
#include "ApiGatewayTest.h"
#include "AppSettingsTest.h"
#include "DispatchCoordinatorTest.h"
#include "MappingSerializerTest.h"
#include "MappingStoreTest.h"
#include "MidiDebouncerTest.h"
#include "MidiListenerTest.h"
#include "RequestBuilderTest.h"
#include "SignalMatcherTest.h"
#include "TriggerKeyTest.h"
#include <juce_core/juce_core.h>

struct RunAllTests {
  using TestFn = bool (*)();

  /** Run all tests. Returns true if all pass. Logs to juce::Logger. */
  static bool run() {
    juce::Logger::writeToLog("Running unit tests...");

    const std::pair<const char *, TestFn> tests[] = {
        {"TriggerKeyTest::run", &TriggerKeyTest::run},
        {"TriggerKeyTest::runZeroVelocityNoteOn", &TriggerKeyTest::runZeroVelocityNoteOn},
        {"TriggerKeyTest::runFromMidiMessage", &TriggerKeyTest::runFromMidiMessage},
        {"SignalMatcherTest::run", &SignalMatcherTest::run},
        {"MappingStoreTest::run", &MappingStoreTest::run},
        {"MappingStoreTest::runSnapshotIsolation", &MappingStoreTest::runSnapshotIsolation},
        {"MappingStoreTest::runConcurrentReaders", &MappingStoreTest::runConcurrentReaders},
        {"MappingSerializerTest::runLegacy", &MappingSerializerTest::runLegacy},
        {"MappingSerializerTest::runStructured", &MappingSerializerTest::runStructured},
        {"MappingSerializerTest::runSkipsInvalidEntries", &MappingSerializerTest::runSkipsInvalidEntries},
        {"MappingSerializerTest::runFileRoundTrip", &MappingSerializerTest::runFileRoundTrip},
        {"MidiDebouncerTest::run", &MidiDebouncerTest::run},
        {"MidiDebouncerTest::runConfigurableWindow", &MidiDebouncerTest::runConfigurableWindow},
        {"RequestBuilderTest::runPathSubstitution", &RequestBuilderTest::runPathSubstitution},
        {"RequestBuilderTest::runClientIdOverride", &RequestBuilderTest::runClientIdOverride},
        {"RequestBuilderTest::runQueryAndBody", &RequestBuilderTest::runQueryAndBody},
        {"RequestBuilderTest::runCoercion", &RequestBuilderTest::runCoercion},
        {"RequestBuilderTest::runFromDescriptor", &RequestBuilderTest::runFromDescriptor},
        {"ApiGatewayTest::runHeadersAndStatus", &ApiGatewayTest::runHeadersAndStatus},
        {"ApiGatewayTest::runResponseParsing", &ApiGatewayTest::runResponseParsing},
        {"ApiGatewayTest::runDiscovery", &ApiGatewayTest::runDiscovery},
        {"ApiGatewayTest::runAsyncConcurrency", &ApiGatewayTest::runAsyncConcurrency},
        {"ApiGatewayTest::runShutdownWaitsForRunningRequest", &ApiGatewayTest::runShutdownWaitsForRunningRequest},
        {"MidiListenerTest::runConnectFailure", &MidiListenerTest::runConnectFailure},
        {"MidiListenerTest::runDebounceOnListenerThread", &MidiListenerTest::runDebounceOnListenerThread},
        {"MidiListenerTest::runReconnectLeavesNoStaleEvents", &MidiListenerTest::runReconnectLeavesNoStaleEvents},
        {"MidiListenerTest::runDeviceLossReportedOnce", &MidiListenerTest::runDeviceLossReportedOnce},
        {"DispatchCoordinatorTest::runEndToEndDispatch", &DispatchCoordinatorTest::runEndToEndDispatch},
        {"DispatchCoordinatorTest::runLearnIsOneShot", &DispatchCoordinatorTest::runLearnIsOneShot},
        {"DispatchCoordinatorTest::runErrorsBecomeNotifications", &DispatchCoordinatorTest::runErrorsBecomeNotifications},
        {"DispatchCoordinatorTest::runApiConfigDiscovery", &DispatchCoordinatorTest::runApiConfigDiscovery},
        {"DispatchCoordinatorTest::runMappingsAndDevices", &DispatchCoordinatorTest::runMappingsAndDevices},
        {"DispatchCoordinatorTest::runInFlightRequestsKeepTheirConnection", &DispatchCoordinatorTest::runInFlightRequestsKeepTheirConnection},
        {"DispatchCoordinatorTest::runShutdownStopsDiscovery", &DispatchCoordinatorTest::runShutdownStopsDiscovery},
        {"DispatchCoordinatorTest::runSupersededDiscoveryIsDropped", &DispatchCoordinatorTest::runSupersededDiscoveryIsDropped},
        {"DispatchCoordinatorTest::runMalformedClientsReported", &DispatchCoordinatorTest::runMalformedClientsReported},
        {"DispatchCoordinatorTest::runListenerThreadDoesNotLog", &DispatchCoordinatorTest::runListenerThreadDoesNotLog},
        {"AppSettingsTest::run", &AppSettingsTest::run},
        {"AppSettingsTest::runDebounceFallback", &AppSettingsTest::runDebounceFallback},
    };

    int failed = 0;
    for (auto &test : tests) {
      juce::Logger::writeToLog("  " + juce::String(test.first));
      try {
        if (!test.second()) {
          juce::Logger::writeToLog("    FAIL: assertion");
          failed++;
        } else
          juce::Logger::writeToLog("    OK");
      } catch (const std::exception &e) {
        juce::Logger::writeToLog("    FAIL: " + juce::String(e.what()));
        failed++;
      }
    }

    if (failed == 0)
      juce::Logger::writeToLog("All tests passed.");
    else
      juce::Logger::writeToLog("FAILED: " + juce::String(failed) + " test(s).");
    return failed == 0;
  }
};
