/*
  ==============================================================================
    Source/Tests/ApiGatewayTest.h
    Role: Gateway headers, status handling, response parsing and the
    ancillary discovery calls, against the in-memory server.
  ==============================================================================
*/
#pragma once
#include "../Core/Constants.h"
#include "../Network/ApiGateway.h"
#include "../Network/RequestBuilder.h"
#include "TestFakes.h"
#include <atomic>

struct ApiGatewayTest {
  static std::shared_ptr<const ConnectionState> connection(const juce::String &client = "c1") {
    return std::make_shared<const ConnectionState>(
        ConnectionState::create("http://api.test", "secret-key", client));
  }

  static ConcreteRequest request(HttpMethod method, const juce::String &path,
                                 std::shared_ptr<const ConnectionState> conn) {
    RequestTemplate t;
    t.method = method;
    t.pathPattern = path;
    t.bodyParams["value"] = 1;
    return RequestBuilder::build(t, std::move(conn)).request;
  }

  static bool runHeadersAndStatus() {
    auto server = std::make_shared<FakeHttpServer>();
    server->route("POST", "/play", 200, "{\"played\": true}");
    server->route("POST", "/broken", 500, "oops");
    ApiGateway gateway(std::make_unique<FakeHttpTransport>(server), 2);
    gateway.setRequestTimeoutMs(1234);

    auto ok = gateway.execute(request(HttpMethod::Post, "/play", connection()));
    if (!ok.succeeded() || ok.statusCode != 200 || !(bool)ok.payload["played"]) return false;

    auto sent = server->at(0);
    if (sent.headers["x-api-key"] != "secret-key" || sent.headers["Client-ID"] != "c1") return false;
    if (sent.headers["Content-Type"] != "application/json") return false;
    if (sent.timeoutMs != 1234) return false;

    // No Client-ID header when none is configured
    auto noClient = gateway.execute(request(HttpMethod::Post, "/play", connection({})));
    if (!noClient.succeeded() || server->at(1).headers.getAllKeys().contains("Client-ID", true)) return false;

    // Non-2xx is a connectivity error, never retried
    auto failed = gateway.execute(request(HttpMethod::Post, "/broken", connection()));
    if (failed.succeeded() || failed.status.error != DispatchError::Connectivity) return false;
    if (failed.statusCode != 500 || server->count() != 3) return false;

    // Unreachable host
    server->setUnreachable(true);
    auto down = gateway.execute(request(HttpMethod::Post, "/play", connection()));
    if (down.state != ApiResult::State::Failed || down.status.error != DispatchError::Connectivity)
      return false;

    // Unconfigured connection fails without touching the network
    auto before = server->count();
    auto none = gateway.execute(ConcreteRequest());
    return !none.succeeded() && server->count() == before;
  }

  static bool runResponseParsing() {
    auto empty = ApiGateway::parseResponseBody("");
    if (!(bool)empty["success"] || empty.hasProperty("raw")) return false;

    auto raw = ApiGateway::parseResponseBody("OK, done");
    if (!(bool)raw["success"] || raw["raw"].toString() != "OK, done") return false;

    auto json = ApiGateway::parseResponseBody("{\"count\": 2}");
    if ((int)json["count"] != 2 || json.hasProperty("success")) return false;

    // Timeout is clamped to a sane range
    ApiGateway gateway(std::make_unique<FakeHttpTransport>(std::make_shared<FakeHttpServer>()), 1);
    gateway.setRequestTimeoutMs(1);
    if (gateway.getRequestTimeoutMs() != Constants::kMinRequestTimeoutMs) return false;
    gateway.setRequestTimeoutMs(10000000);
    return gateway.getRequestTimeoutMs() == Constants::kMaxRequestTimeoutMs;
  }

  static bool runDiscovery() {
    auto server = std::make_shared<FakeHttpServer>();
    server->route("GET", "/", 200, "");
    server->route("GET", "/clients", 200, R"({"clients": [{"id": "c1", "name": "Stage"}]})");
    server->route("GET", "/api/docs", 200, R"({"endpoints": [
        {"method": "GET", "path": "/api/docs"},
        {"method": "GET", "path": "/health"},
        {"method": "GET", "path": "/api/status"},
        {"method": "POST", "path": "/actors/:id/move", "description": "Move"}]})");
    ApiGateway gateway(std::make_unique<FakeHttpTransport>(server), 2);

    auto conn = connection();
    if (!gateway.probe(conn).succeeded()) return false;
    if (server->at(0).request.getQueryValue("clientId") != "c1") return false;

    juce::Array<juce::var> clients;
    if (!gateway.fetchClients(conn, clients).succeeded() || clients.size() != 1) return false;
    if (clients[0]["name"].toString() != "Stage") return false;

    std::vector<EndpointDescriptor> endpoints;
    if (!gateway.fetchEndpoints(conn, endpoints).succeeded()) return false;
    if (endpoints.size() != 1 || endpoints[0].pathPattern != "/actors/:id/move") return false;

    // A clients payload without the array is rejected
    server->route("GET", "/clients", 200, R"({"items": []})");
    clients.clear();
    auto bad = gateway.fetchClients(conn, clients);
    return !bad.succeeded() && bad.status.error == DispatchError::Parse && clients.isEmpty();
  }

  // Overlapping requests run on separate workers
  static bool runAsyncConcurrency() {
    auto server = std::make_shared<FakeHttpServer>();
    server->route("POST", "/slow", 200, "{}");
    server->setDelayMs(150);
    ApiGateway gateway(std::make_unique<FakeHttpTransport>(server), 4);

    std::atomic<int> done{0};
    std::atomic<int> succeeded{0};
    const auto start = juce::Time::getMillisecondCounter();
    for (int i = 0; i < 4; ++i)
      gateway.executeAsync(request(HttpMethod::Post, "/slow", connection()),
                           [&](const ApiResult &r) {
                             if (r.succeeded())
                               ++succeeded;
                             ++done;
                           });
    if (!TestUtil::waitUntil([&] { return done.load() == 4; }, 3000)) return false;
    const auto elapsed = juce::Time::getMillisecondCounter() - start;
    if (succeeded.load() != 4 || elapsed >= 550) return false;

    // After shutdown, new work is refused with a failure callback
    gateway.shutdown();
    bool refused = false;
    gateway.executeAsync(request(HttpMethod::Post, "/slow", connection()),
                         [&](const ApiResult &r) { refused = !r.succeeded(); });
    return refused;
  }

  static bool runShutdownWaitsForRunningRequest() {
    auto server = std::make_shared<FakeHttpServer>();
    server->route("POST", "/slow", 200, "{}");
    server->setDelayMs(400);
    ApiGateway gateway(std::make_unique<FakeHttpTransport>(server), 1);
    gateway.setRequestTimeoutMs(Constants::kMinRequestTimeoutMs);

    std::atomic<int> completed{0};
    for (int i = 0; i < 2; ++i)
      gateway.executeAsync(request(HttpMethod::Post, "/slow", connection()),
                           [&](const ApiResult &) { ++completed; });
    if (!TestUtil::waitUntil([&] { return server->count() == 1; })) return false;

    // The running request finishes even though it outlasts the request
    // timeout; the queued one is dropped without being sent.
    gateway.shutdown();
    return completed.load() == 1 && server->count() == 1 && gateway.getNumPendingJobs() == 0;
  }
};
