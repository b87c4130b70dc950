/*
  ==============================================================================
    Source/Network/ApiGateway.cpp
    Role: ApiGateway Implementation
  ==============================================================================
*/

#include "../Network/ApiGateway.h"
#include "../Core/Constants.h"
#include "../Core/LogService.h"
#include "../Network/RequestBuilder.h"

ApiGateway::ApiGateway(std::unique_ptr<HttpTransport> t, int numWorkers)
    : transport(t ? std::move(t) : std::make_unique<JuceHttpTransport>()),
      requestTimeoutMs(Constants::kRequestTimeoutMs),
      pool(numWorkers > 0 ? numWorkers : Constants::kGatewayWorkerThreads) {}

ApiGateway::~ApiGateway() { shutdown(); }

void ApiGateway::setRequestTimeoutMs(int ms) {
  requestTimeoutMs.store(juce::jlimit(Constants::kMinRequestTimeoutMs,
                                      Constants::kMaxRequestTimeoutMs, ms));
}

void ApiGateway::shutdown() {
  {
    const juce::ScopedLock sl(submitLock);
    if (!acceptingJobs.exchange(false))
      return;
  }
  // Queued jobs are dropped. Running ones finish their current request,
  // which the request timeout bounds; workers are never killed mid-request.
  const int waitMs =
      requestTimeoutMs.load() + Constants::kGatewayShutdownGraceMs;
  if (pool.removeAllJobs(false, waitMs))
    return;

  LogService::instance().error("API gateway: requests still in flight after " +
                               juce::String(waitMs) + " ms; waiting");
  while (!pool.removeAllJobs(false, waitMs))
    LogService::instance().warning("API gateway: still waiting for " +
                                   juce::String(pool.getNumJobs()) +
                                   " request(s)");
}

juce::StringPairArray ApiGateway::headersFor(const ConnectionState &connection,
                                             bool hasBody) const {
  juce::StringPairArray headers;
  headers.set(Constants::kApiKeyHeader, connection.apiKey);
  if (connection.hasClientId())
    headers.set(Constants::kClientIdHeader, connection.clientId);
  headers.set("Accept", "application/json");
  headers.set("Connection", "keep-alive");
  if (hasBody)
    headers.set("Content-Type", "application/json");
  return headers;
}

juce::var ApiGateway::parseResponseBody(const juce::String &body) {
  auto text = body.trim();
  if (text.isNotEmpty()) {
    juce::var parsed;
    if (juce::JSON::parse(text, parsed).wasOk() && !parsed.isVoid())
      return parsed;
  }

  juce::DynamicObject::Ptr marker = new juce::DynamicObject();
  marker->setProperty("success", true);
  if (text.isNotEmpty())
    marker->setProperty("raw", text);
  return juce::var(marker.get());
}

ApiResult ApiGateway::execute(const ConcreteRequest &request) {
  ApiResult result;
  const auto what = methodToString(request.method) + " " + request.path;

  if (request.connection == nullptr || request.connection->baseUrl.isEmpty()) {
    result.state = ApiResult::State::Failed;
    result.status = DispatchStatus::fail(DispatchError::Connectivity,
                                         "API URL is not configured");
    return result;
  }

  auto headers =
      headersFor(*request.connection, request.body.isNotEmpty());

  LogService::instance().debug("Sending " + what);
  result.state = ApiResult::State::Sent;
  auto response = transport->send(request, headers, requestTimeoutMs.load());
  result.statusCode = response.statusCode;

  if (!response.connected) {
    result.state = ApiResult::State::Failed;
    result.status = DispatchStatus::fail(
        DispatchError::Connectivity,
        what + " failed: " +
            (response.error.isNotEmpty() ? response.error
                                         : juce::String("no response")));
    return result;
  }

  if (!response.isSuccessStatus()) {
    result.state = ApiResult::State::Failed;
    result.payload = parseResponseBody(response.body);
    result.status = DispatchStatus::fail(
        DispatchError::Connectivity,
        what + " failed with status code " +
            juce::String(response.statusCode));
    return result;
  }

  result.state = ApiResult::State::Succeeded;
  result.payload = parseResponseBody(response.body);
  return result;
}

void ApiGateway::executeAsync(
    ConcreteRequest request,
    std::function<void(const ApiResult &)> onComplete) {
  const juce::ScopedLock sl(submitLock);
  if (!acceptingJobs.load()) {
    ApiResult rejected;
    rejected.state = ApiResult::State::Failed;
    rejected.status = DispatchStatus::fail(DispatchError::Connectivity,
                                           "API gateway is shut down");
    if (onComplete)
      onComplete(rejected);
    return;
  }

  pool.addJob([this, request = std::move(request), onComplete] {
    auto result = execute(request);
    if (onComplete)
      onComplete(result);
  });
}

void ApiGateway::runAsync(std::function<void()> job) {
  const juce::ScopedLock sl(submitLock);
  if (!acceptingJobs.load() || !job)
    return;
  pool.addJob(std::move(job));
}

ApiResult ApiGateway::get(std::shared_ptr<const ConnectionState> connection,
                          const juce::String &path) {
  RequestTemplate t;
  t.method = HttpMethod::Get;
  t.pathPattern = path;
  auto built = RequestBuilder::build(t, std::move(connection));
  if (!built.wasOk()) {
    ApiResult result;
    result.state = ApiResult::State::Failed;
    result.status = built.status;
    return result;
  }
  return execute(built.request);
}

ApiResult ApiGateway::probe(std::shared_ptr<const ConnectionState> connection) {
  return get(std::move(connection), Constants::kProbePath);
}

ApiResult
ApiGateway::fetchClients(std::shared_ptr<const ConnectionState> connection,
                         juce::Array<juce::var> &clientsOut) {
  auto result = get(std::move(connection), Constants::kClientsPath);
  if (!result.succeeded())
    return result;

  auto clients = result.payload.getProperty("clients", {});
  if (!clients.isArray()) {
    result.state = ApiResult::State::Failed;
    result.status =
        DispatchStatus::fail(DispatchError::Parse, "Invalid client data format");
    return result;
  }
  clientsOut = *clients.getArray();
  return result;
}

ApiResult
ApiGateway::fetchEndpoints(std::shared_ptr<const ConnectionState> connection,
                           std::vector<EndpointDescriptor> &endpointsOut) {
  auto result = get(std::move(connection), Constants::kDocsPath);
  if (!result.succeeded())
    return result;

  if (!result.payload.getProperty("endpoints", {}).isArray()) {
    result.state = ApiResult::State::Failed;
    result.status = DispatchStatus::fail(DispatchError::Parse,
                                         "Invalid endpoint documentation");
    return result;
  }
  endpointsOut = EndpointDescriptor::listFromDocs(result.payload);
  return result;
}
