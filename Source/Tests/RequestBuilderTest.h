/*
  ==============================================================================
    Source/Tests/RequestBuilderTest.h
    Role: Path substitution, clientId routing, query/body assembly, text
    coercion and descriptor-driven templates.
  ==============================================================================
*/
#pragma once
#include "../Network/RequestBuilder.h"

struct RequestBuilderTest {
  static std::shared_ptr<const ConnectionState> connection(const juce::String &client = {}) {
    return std::make_shared<const ConnectionState>(
        ConnectionState::create("http://localhost:3000/", "secret", client));
  }

  static bool runPathSubstitution() {
    RequestTemplate t;
    t.method = HttpMethod::Get;
    t.pathPattern = "/actors/:id/items/:itemId";
    t.pathParams["id"] = "a1";
    t.pathParams["itemId"] = "i2";

    auto built = RequestBuilder::build(t, connection());
    if (!built.wasOk() || built.request.path != "/actors/a1/items/i2") return false;
    if (built.request.body.isNotEmpty()) return false; // GET never has a body
    if (built.request.toUrl().toString(true) != "http://localhost:3000/actors/a1/items/i2")
      return false;

    // Leading slash ensured, values escaped
    t.pathPattern = "actors/:id";
    t.pathParams.erase("itemId");
    t.pathParams["id"] = "a b/c";
    built = RequestBuilder::build(t, connection());
    if (!built.wasOk() || built.request.path != "/actors/a%20b%2Fc") return false;

    // Missing value: TemplateError, no request
    RequestTemplate missing;
    missing.pathPattern = "/actors/:id/items/:itemId";
    missing.pathParams["id"] = "a1";
    built = RequestBuilder::build(missing, connection());
    if (built.status.error != DispatchError::Template) return false;
    if (!built.status.message.contains("itemId")) return false;

    auto names = RequestBuilder::placeholdersIn("/a/:x/b/:y");
    return names.size() == 2 && names[0] == "x" && names[1] == "y";
  }

  static bool runClientIdOverride() {
    RequestTemplate t;
    t.method = HttpMethod::Get;
    t.pathPattern = "/status";
    t.queryParams["clientId"] = "ignored";
    t.queryParams["mode"] = "fast";

    auto built = RequestBuilder::build(t, connection("c1"));
    if (!built.wasOk() || built.request.getQueryValue("clientId") != "c1") return false;
    int clientIds = 0;
    for (auto &kv : built.request.query)
      if (kv.first == "clientId")
        ++clientIds;
    if (clientIds != 1 || built.request.getQueryValue("mode") != "fast") return false;

    // Without a configured client the user value is passed through
    built = RequestBuilder::build(t, connection());
    return built.wasOk() && built.request.getQueryValue("clientId") == "ignored";
  }

  static bool runQueryAndBody() {
    RequestTemplate t;
    t.method = HttpMethod::Post;
    t.pathPattern = "/scene";
    t.queryParams["empty"] = "";
    t.queryParams["on"] = true;
    t.queryParams["off"] = false;
    t.queryParams["zero"] = 0;
    t.queryParams["ids"] = juce::var(juce::Array<juce::var>{"x", "y"});
    t.bodyParams["name"] = "intro";
    t.bodyParams["blank"] = "";
    t.bodyParams["level"] = 3;

    auto built = RequestBuilder::build(t, connection());
    if (!built.wasOk()) return false;
    auto &r = built.request;
    if (r.getQueryValue("on") != "true" || r.getQueryValue("off") != "false") return false;
    if (r.getQueryValue("zero") != "0") return false;
    for (auto &kv : r.query)
      if (kv.first == "empty") return false;

    int ids = 0;
    for (auto &kv : r.query)
      if (kv.first == "ids")
        ++ids;
    if (ids != 2) return false;

    juce::var body;
    if (juce::JSON::parse(r.body, body).failed()) return false;
    if (body["name"].toString() != "intro" || (int)body["level"] != 3) return false;
    if (body.hasProperty("blank")) return false;

    // A POST with nothing to send has no body
    RequestTemplate bare;
    bare.pathPattern = "/ping";
    built = RequestBuilder::build(bare, connection());
    if (!built.wasOk() || built.request.body.isNotEmpty()) return false;

    // GET drops body params entirely
    t.method = HttpMethod::Get;
    built = RequestBuilder::build(t, connection());
    return built.wasOk() && built.request.body.isEmpty();
  }

  static bool runCoercion() {
    juce::var v;
    for (auto *yes : {"true", "1", "yes", "on", "TRUE"})
      if (RequestBuilder::coerceValue(yes, "boolean", v).failed() || !v.isBool() || !(bool)v)
        return false;
    for (auto *no : {"false", "0", "no", "off"})
      if (RequestBuilder::coerceValue(no, "boolean", v).failed() || (bool)v) return false;
    if (RequestBuilder::coerceValue("maybe", "boolean", v).error != DispatchError::Parse)
      return false;

    if (RequestBuilder::coerceValue("42", "integer", v).failed() || !v.isInt() || (int)v != 42)
      return false;
    if (RequestBuilder::coerceValue("-1.5", "number", v).failed() || !v.isDouble()) return false;
    if (RequestBuilder::coerceValue("1.5", "integer", v).error != DispatchError::Parse) return false;
    if (RequestBuilder::coerceValue("abc", "number", v).error != DispatchError::Parse) return false;

    if (RequestBuilder::coerceValue("{\"a\": 1}", "object", v).failed() || !v.isObject())
      return false;
    if (RequestBuilder::coerceValue("{broken", "json", v).error != DispatchError::Parse)
      return false;

    if (RequestBuilder::coerceValue("plain text", "string", v).failed() ||
        v.toString() != "plain text")
      return false;

    // Arrays: JSON first, then comma split with trimming
    auto arr = RequestBuilder::parseArrayText("[1, 2, 3]");
    if (!arr.isArray() || arr.size() != 3 || !arr[0].isInt()) return false;
    arr = RequestBuilder::parseArrayText(" red, green ,blue ");
    if (arr.size() != 3 || arr[1].toString() != "green") return false;
    arr = RequestBuilder::parseArrayText("[red, \"dark blue\"]");
    if (arr.size() != 2 || arr[0].toString() != "red" || arr[1].toString() != "dark blue")
      return false;
    return RequestBuilder::parseArrayText("").size() == 0;
  }

  static bool runFromDescriptor() {
    juce::var docs;
    if (juce::JSON::parse(R"({"endpoints": [{
        "method": "POST", "path": "/actors/:id/move",
        "requiredParameters": [
          {"name": "id", "type": "string", "location": "path"},
          {"name": "x", "type": "number", "location": "body"},
          {"name": "clientId", "type": "string", "location": "query"}
        ],
        "optional_parameters": [
          {"name": "animate", "type": "boolean", "location": "query"},
          {"name": "note", "type": "string", "location": "body"}
        ]}]})", docs).failed())
      return false;

    auto endpoints = EndpointDescriptor::listFromDocs(docs);
    if (endpoints.size() != 1 || endpoints[0].optionalParameters.size() != 2) return false;
    auto &d = endpoints[0];

    RequestTemplate t;
    std::map<juce::String, juce::String> fields{{"id", "a7"}, {"x", "12.5"}, {"animate", "yes"},
                                                {"note", ""}, {"clientId", "user-typed"}};
    if (RequestBuilder::fromDescriptor(d, fields, t).failed()) return false;
    if (t.method != HttpMethod::Post || t.pathParams.at("id").toString() != "a7") return false;
    if (!t.bodyParams.at("x").isDouble() || !t.queryParams.at("animate").isBool()) return false;
    if (t.bodyParams.count("note") != 0 || t.queryParams.count("clientId") != 0) return false;
    if (RequestBuilder::validate(t).failed()) return false;

    // Missing required field
    fields.erase("x");
    if (RequestBuilder::fromDescriptor(d, fields, t).error != DispatchError::Template) return false;

    // Coercion failure carries the parameter name
    fields["x"] = "twelve";
    auto status = RequestBuilder::fromDescriptor(d, fields, t);
    if (status.error != DispatchError::Parse || !status.message.startsWith("x")) return false;

    // validate flags stray path params
    RequestTemplate stray;
    stray.pathPattern = "/a";
    stray.pathParams["id"] = "1";
    return RequestBuilder::validate(stray).error == DispatchError::Template;
  }
};
