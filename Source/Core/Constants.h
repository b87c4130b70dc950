/*
  ==============================================================================
    Source/Core/Constants.h
    Role: Named defaults for the dispatch pipeline, wire protocol and settings.
  ==============================================================================
*/
#pragma once

namespace Constants {
  // MIDI Listener
  constexpr double kDebounceWindowMs = 100.0;
  constexpr int kListenerPollIntervalMs = 1;
  constexpr int kListenerJoinTimeoutMs = 2000;
  constexpr int kDeviceHealthCheckIntervalMs = 1000;
  constexpr int kMidiEventQueueCapacity = 1024;
  constexpr int kMaxMidiChannels = 16;
  constexpr int kMaxMidiIndex = 127;

  // HTTP
  constexpr int kRequestTimeoutMs = 8000;
  constexpr int kMinRequestTimeoutMs = 250;
  constexpr int kMaxRequestTimeoutMs = 60000;
  constexpr int kGatewayWorkerThreads = 4;
  constexpr int kGatewayShutdownGraceMs = 2000; // grace beyond the request timeout
  constexpr int kMaxRedirects = 5;

  // Wire protocol
  constexpr const char *kApiKeyHeader = "x-api-key";
  constexpr const char *kClientIdHeader = "Client-ID";
  constexpr const char *kClientIdParam = "clientId";
  constexpr const char *kProbePath = "/";
  constexpr const char *kClientsPath = "/clients";
  constexpr const char *kDocsPath = "/api/docs";
  constexpr const char *kHealthPath = "/health";
  constexpr const char *kStatusPath = "/api/status";

  // Settings / storage
  constexpr const char *kAppName = "MidiRestBridge";
  constexpr const char *kMappingsFileName = "mappings.json";
  constexpr const char *kLogFolderName = "MidiRestBridge/logs";
}
