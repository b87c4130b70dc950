/*
  ==============================================================================
    Source/Network/HttpTransport.h
    Role: The wire seam of the API gateway. JuceHttpTransport talks HTTP via
    juce::URL / WebInputStream; tests substitute an in-memory transport.
  ==============================================================================
*/
#pragma once

#include "../Network/RequestTemplate.h"
#include <juce_core/juce_core.h>

struct HttpResponse {
  bool connected = false; // false when no response was received at all
  int statusCode = 0;
  juce::String body;
  juce::String error;

  bool isSuccessStatus() const {
    return connected && statusCode >= 200 && statusCode < 300;
  }
};

class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  /** Must be safe to call from several worker threads at once. */
  virtual HttpResponse send(const ConcreteRequest &request,
                            const juce::StringPairArray &headers,
                            int timeoutMs) = 0;
};

class JuceHttpTransport : public HttpTransport {
public:
  JuceHttpTransport() = default;

  HttpResponse send(const ConcreteRequest &request,
                    const juce::StringPairArray &headers,
                    int timeoutMs) override;

private:
  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceHttpTransport)
};
