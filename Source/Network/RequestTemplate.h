/*
  ==============================================================================
    Source/Network/RequestTemplate.h
    Role: Stored HTTP call shape bound to a trigger, the connection snapshot
    and the concrete request produced from both.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

enum class HttpMethod { Get, Post, Put, Delete };

inline juce::String methodToString(HttpMethod m) {
  switch (m) {
  case HttpMethod::Get:
    return "GET";
  case HttpMethod::Post:
    return "POST";
  case HttpMethod::Put:
    return "PUT";
  case HttpMethod::Delete:
    return "DELETE";
  default:
    return "GET";
  }
}

inline std::optional<HttpMethod> methodFromString(const juce::String &text) {
  auto m = text.trim().toUpperCase();
  if (m == "GET")
    return HttpMethod::Get;
  if (m == "POST")
    return HttpMethod::Post;
  if (m == "PUT")
    return HttpMethod::Put;
  if (m == "DELETE")
    return HttpMethod::Delete;
  return std::nullopt;
}

// Values are strings, numbers, booleans or arrays (juce::var)
using ParamMap = std::map<juce::String, juce::var>;

inline bool paramMapsEqual(const ParamMap &a, const ParamMap &b) {
  if (a.size() != b.size())
    return false;
  for (auto ia = a.begin(), ib = b.begin(); ia != a.end(); ++ia, ++ib)
    if (ia->first != ib->first || !ia->second.equalsWithSameType(ib->second))
      return false;
  return true;
}

struct RequestTemplate {
  HttpMethod method = HttpMethod::Post;
  juce::String pathPattern; // e.g. "/actors/:id/items/:itemId"
  ParamMap pathParams;
  ParamMap queryParams;
  ParamMap bodyParams;

  bool operator==(const RequestTemplate &other) const {
    return method == other.method && pathPattern == other.pathPattern &&
           paramMapsEqual(pathParams, other.pathParams) &&
           paramMapsEqual(queryParams, other.queryParams) &&
           paramMapsEqual(bodyParams, other.bodyParams);
  }
  bool operator!=(const RequestTemplate &other) const {
    return !(*this == other);
  }

  juce::String describe() const {
    return methodToString(method) + " " + pathPattern;
  }
};

/** Set once at configuration time; replaced as a whole, never mutated. */
struct ConnectionState {
  juce::String baseUrl;
  juce::String apiKey;
  juce::String clientId;

  static ConnectionState create(const juce::String &url,
                                const juce::String &key,
                                const juce::String &client) {
    ConnectionState s;
    s.baseUrl = url.trim();
    while (s.baseUrl.endsWithChar('/'))
      s.baseUrl = s.baseUrl.dropLastCharacters(1);
    s.apiKey = key.trim();
    s.clientId = client.trim();
    return s;
  }

  bool isConfigured() const {
    return baseUrl.isNotEmpty() && apiKey.isNotEmpty();
  }
  bool hasClientId() const { return clientId.isNotEmpty(); }
};

struct ConcreteRequest {
  HttpMethod method = HttpMethod::Get;
  juce::String endpoint; // path pattern the request was built from
  juce::String path;     // placeholders substituted, escaped
  std::vector<std::pair<juce::String, juce::String>> query; // repeated keys
  juce::String body; // JSON text, empty for GET
  std::shared_ptr<const ConnectionState> connection;

  juce::String getQueryValue(const juce::String &name) const {
    for (auto &kv : query)
      if (kv.first == name)
        return kv.second;
    return {};
  }

  juce::URL toUrl() const {
    juce::URL url((connection ? connection->baseUrl : juce::String()) + path);
    for (auto &kv : query)
      url = url.withParameter(kv.first, kv.second);
    return url;
  }
};
