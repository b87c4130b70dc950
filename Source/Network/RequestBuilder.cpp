/*
  ==============================================================================
    Source/Network/RequestBuilder.cpp
    Role: RequestBuilder Implementation
  ==============================================================================
*/

#include "../Network/RequestBuilder.h"
#include "../Core/Constants.h"
#include <limits>

namespace {

bool isPlaceholderSegment(const juce::String &segment) {
  return segment.length() > 1 && segment.startsWithChar(':');
}

// sign, digits, optional fraction, optional exponent
bool isNumericText(const juce::String &text) {
  auto p = text.getCharPointer();
  if (*p == '+' || *p == '-')
    ++p;
  int digits = 0;
  while (juce::CharacterFunctions::isDigit(*p)) {
    ++p;
    ++digits;
  }
  if (*p == '.') {
    ++p;
    while (juce::CharacterFunctions::isDigit(*p)) {
      ++p;
      ++digits;
    }
  }
  if (digits == 0)
    return false;
  if (*p == 'e' || *p == 'E') {
    ++p;
    if (*p == '+' || *p == '-')
      ++p;
    if (!juce::CharacterFunctions::isDigit(*p))
      return false;
    while (juce::CharacterFunctions::isDigit(*p))
      ++p;
  }
  return p.isEmpty();
}

juce::var stringArray(const juce::StringArray &items) {
  juce::Array<juce::var> arr;
  for (auto &s : items)
    arr.add(s);
  return juce::var(arr);
}

} // namespace

bool RequestBuilder::shouldOmit(const juce::var &v) {
  return v.isVoid() || v.isUndefined() ||
         (v.isString() && v.toString().isEmpty());
}

juce::String RequestBuilder::valueToQueryString(const juce::var &v) {
  if (v.isBool())
    return static_cast<bool>(v) ? "true" : "false";
  if (v.isInt() || v.isInt64())
    return juce::String(static_cast<juce::int64>(v));
  if (v.isString())
    return v.toString();
  // doubles, arrays and objects go out in their JSON form
  return juce::JSON::toString(v, true);
}

juce::StringArray RequestBuilder::placeholdersIn(const juce::String &pattern) {
  juce::StringArray segments, names;
  segments.addTokens(pattern, "/", "");
  for (auto &s : segments)
    if (isPlaceholderSegment(s))
      names.add(s.substring(1));
  return names;
}

DispatchStatus RequestBuilder::validate(const RequestTemplate &t) {
  auto placeholders = placeholdersIn(t.pathPattern);
  juce::StringArray missing, unused;
  for (auto &name : placeholders) {
    auto it = t.pathParams.find(name);
    if (it == t.pathParams.end() || shouldOmit(it->second))
      missing.addIfNotAlreadyThere(name);
  }
  for (auto &kv : t.pathParams)
    if (!placeholders.contains(kv.first))
      unused.add(kv.first);

  if (!missing.isEmpty())
    return DispatchStatus::fail(DispatchError::Template,
                                "No value for path placeholder(s) " +
                                    missing.joinIntoString(", ") + " in " +
                                    t.pathPattern);
  if (!unused.isEmpty())
    return DispatchStatus::fail(DispatchError::Template,
                                "Path parameter(s) " +
                                    unused.joinIntoString(", ") +
                                    " do not appear in " + t.pathPattern);
  return DispatchStatus::ok();
}

BuildResult
RequestBuilder::build(const RequestTemplate &t,
                      std::shared_ptr<const ConnectionState> connection) {
  BuildResult result;
  auto &req = result.request;
  req.method = t.method;
  req.endpoint = t.pathPattern;
  req.connection =
      connection ? connection : std::make_shared<const ConnectionState>();

  // 1. Path: substitute ":name" segments
  juce::String pattern = t.pathPattern.trim();
  if (!pattern.startsWithChar('/'))
    pattern = "/" + pattern;

  juce::StringArray segments, missing;
  segments.addTokens(pattern, "/", "");
  for (auto &segment : segments) {
    if (!isPlaceholderSegment(segment))
      continue;
    auto name = segment.substring(1);
    auto it = t.pathParams.find(name);
    if (it == t.pathParams.end() || shouldOmit(it->second)) {
      missing.addIfNotAlreadyThere(name);
      continue;
    }
    segment = juce::URL::addEscapeChars(valueToQueryString(it->second), false);
  }
  if (!missing.isEmpty()) {
    result.status = DispatchStatus::fail(
        DispatchError::Template, "No value for path placeholder(s) " +
                                     missing.joinIntoString(", ") + " in " +
                                     t.pathPattern);
    return result;
  }
  req.path = segments.joinIntoString("/");

  // 2. Query: flat key -> string or array (repeated key)
  const bool routeClient = req.connection->hasClientId();
  for (auto &kv : t.queryParams) {
    if (routeClient && kv.first == Constants::kClientIdParam)
      continue;
    if (shouldOmit(kv.second))
      continue;
    if (auto *arr = kv.second.getArray()) {
      for (auto &item : *arr)
        if (!shouldOmit(item))
          req.query.emplace_back(kv.first, valueToQueryString(item));
    } else {
      req.query.emplace_back(kv.first, valueToQueryString(kv.second));
    }
  }
  if (routeClient)
    req.query.emplace_back(Constants::kClientIdParam,
                           req.connection->clientId);

  // 3. Body: JSON object for POST/PUT/DELETE
  if (t.method != HttpMethod::Get) {
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    for (auto &kv : t.bodyParams)
      if (!shouldOmit(kv.second))
        obj->setProperty(kv.first, kv.second);
    if (obj->getProperties().size() > 0)
      req.body = juce::JSON::toString(juce::var(obj.get()), true);
  }

  return result;
}

juce::var RequestBuilder::parseArrayText(const juce::String &text) {
  auto t = text.trim();
  if (t.isEmpty())
    return juce::var(juce::Array<juce::var>());

  if (t.startsWithChar('[')) {
    juce::var parsed;
    if (juce::JSON::parse(t, parsed).wasOk() && parsed.isArray())
      return parsed;
  }

  auto inner = t;
  if (inner.startsWithChar('[') && inner.endsWithChar(']'))
    inner = inner.substring(1, inner.length() - 1);

  juce::StringArray tokens, items;
  tokens.addTokens(inner, ",", "\"");
  for (auto &token : tokens) {
    auto item = token.trim().unquoted().trim();
    if (item.isNotEmpty())
      items.add(item);
  }
  return stringArray(items);
}

DispatchStatus RequestBuilder::coerceValue(const juce::String &text,
                                           const juce::String &type,
                                           juce::var &out) {
  auto t = text.trim();
  auto kind = type.trim().toLowerCase();

  if (kind == "boolean" || kind == "bool") {
    auto lower = t.toLowerCase();
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
      out = true;
    else if (lower == "false" || lower == "0" || lower == "no" ||
             lower == "off")
      out = false;
    else
      return DispatchStatus::fail(DispatchError::Parse,
                                  "'" + t + "' is not a boolean");
    return DispatchStatus::ok();
  }

  if (kind == "number" || kind == "integer" || kind == "int" ||
      kind == "float" || kind == "double") {
    if (!isNumericText(t))
      return DispatchStatus::fail(DispatchError::Parse,
                                  "'" + t + "' is not a number");
    const bool integral = !t.containsAnyOf(".eE");
    if (integral) {
      auto v = t.getLargeIntValue();
      if (v >= std::numeric_limits<int>::min() &&
          v <= std::numeric_limits<int>::max())
        out = static_cast<int>(v);
      else
        out = v;
    } else if (kind == "integer" || kind == "int") {
      return DispatchStatus::fail(DispatchError::Parse,
                                  "'" + t + "' is not an integer");
    } else {
      out = t.getDoubleValue();
    }
    return DispatchStatus::ok();
  }

  if (kind == "array" || kind == "list") {
    out = parseArrayText(t);
    return DispatchStatus::ok();
  }

  if (kind == "object" || kind == "json" || kind == "dict") {
    juce::var parsed;
    auto r = juce::JSON::parse(t, parsed);
    if (r.failed() || !(parsed.isObject() || parsed.isArray()))
      return DispatchStatus::fail(
          DispatchError::Parse,
          "'" + t + "' is not valid JSON" +
              (r.failed() ? " (" + r.getErrorMessage() + ")" : juce::String()));
    out = parsed;
    return DispatchStatus::ok();
  }

  out = t;
  return DispatchStatus::ok();
}

DispatchStatus RequestBuilder::fromDescriptor(
    const EndpointDescriptor &descriptor,
    const std::map<juce::String, juce::String> &fieldValues,
    RequestTemplate &out) {
  RequestTemplate t;
  t.method = methodFromString(descriptor.method).value_or(HttpMethod::Post);
  t.pathPattern = descriptor.pathPattern;

  juce::StringArray missing;
  auto collect = [&](const std::vector<ParameterDescriptor> &params,
                     bool required) -> DispatchStatus {
    for (auto &p : params) {
      if (p.name == Constants::kClientIdParam)
        continue; // injected from the connection settings

      auto it = fieldValues.find(p.name);
      auto text = it != fieldValues.end() ? it->second.trim() : juce::String();
      if (text.isEmpty()) {
        if (required)
          missing.add(p.name);
        continue;
      }

      juce::var value;
      auto status = coerceValue(text, p.type, value);
      if (status.failed())
        return DispatchStatus::fail(status.error,
                                    p.name + ": " + status.message);

      switch (p.location) {
      case ParameterDescriptor::Location::Path:
        t.pathParams[p.name] = value;
        break;
      case ParameterDescriptor::Location::Body:
        t.bodyParams[p.name] = value;
        break;
      default:
        t.queryParams[p.name] = value;
        break;
      }
    }
    return DispatchStatus::ok();
  };

  auto status = collect(descriptor.requiredParameters, true);
  if (status.failed())
    return status;
  status = collect(descriptor.optionalParameters, false);
  if (status.failed())
    return status;

  if (!missing.isEmpty())
    return DispatchStatus::fail(DispatchError::Template,
                                "Missing required parameter(s): " +
                                    missing.joinIntoString(", "));

  out = t;
  return DispatchStatus::ok();
}
