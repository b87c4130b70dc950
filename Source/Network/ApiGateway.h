/*
  ==============================================================================
    Source/Network/ApiGateway.h
    Role: Owns the HTTP transport and the worker pool. Adds the fixed auth
    headers, bounds every call with a timeout, parses responses. No retries.
  ==============================================================================
*/
#pragma once

#include "../Core/DispatchError.h"
#include "../Network/EndpointDescriptor.h"
#include "../Network/HttpTransport.h"
#include "../Network/RequestTemplate.h"
#include <atomic>
#include <functional>
#include <juce_core/juce_core.h>
#include <memory>
#include <vector>

struct ApiResult {
  enum class State { Built, Sent, Succeeded, Failed };

  State state = State::Built;
  int statusCode = 0;
  juce::var payload; // parsed JSON, or {success: true} for empty bodies
  DispatchStatus status;

  bool succeeded() const { return state == State::Succeeded; }
};

class ApiGateway {
public:
  /** nullptr transport = JuceHttpTransport. */
  explicit ApiGateway(std::unique_ptr<HttpTransport> transport = nullptr,
                      int numWorkers = 0);
  ~ApiGateway();

  void setRequestTimeoutMs(int ms);
  int getRequestTimeoutMs() const { return requestTimeoutMs.load(); }

  /** Blocking: Built -> Sent -> Succeeded | Failed in one round trip. */
  ApiResult execute(const ConcreteRequest &request);

  /** Runs execute() on the worker pool; the callback is invoked on the
   * worker thread. */
  void executeAsync(ConcreteRequest request,
                    std::function<void(const ApiResult &)> onComplete);

  /** Any other network-bound job (probes, discovery) goes through the same
   * pool so the caller's thread never waits on the network. */
  void runAsync(std::function<void()> job);

  // --- Ancillary calls ---
  ApiResult probe(std::shared_ptr<const ConnectionState> connection);
  ApiResult fetchClients(std::shared_ptr<const ConnectionState> connection,
                         juce::Array<juce::var> &clientsOut);
  ApiResult fetchEndpoints(std::shared_ptr<const ConnectionState> connection,
                           std::vector<EndpointDescriptor> &endpointsOut);

  juce::StringPairArray headersFor(const ConnectionState &connection,
                                   bool hasBody) const;

  /** Drops queued jobs and waits for running ones to finish their request.
   * Called before teardown. */
  void shutdown();

  int getNumPendingJobs() const { return pool.getNumJobs(); }

  static juce::var parseResponseBody(const juce::String &body);

private:
  ApiResult get(std::shared_ptr<const ConnectionState> connection,
                const juce::String &path);

  std::unique_ptr<HttpTransport> transport;
  std::atomic<int> requestTimeoutMs;
  std::atomic<bool> acceptingJobs{true};
  juce::CriticalSection submitLock; // orders submissions against shutdown
  juce::ThreadPool pool;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ApiGateway)
};
