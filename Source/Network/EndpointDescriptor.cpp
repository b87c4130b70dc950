#include "../Network/EndpointDescriptor.h"
#include "../Core/Constants.h"

namespace {

// Docs have been seen with both camelCase and snake_case keys
juce::var propertyEither(const juce::var &obj, const char *camel,
                         const char *snake) {
  if (obj.hasProperty(camel))
    return obj.getProperty(camel, {});
  return obj.getProperty(snake, {});
}

ParameterDescriptor::Location parseLocation(const juce::String &text) {
  auto l = text.trim().toLowerCase();
  if (l == "path")
    return ParameterDescriptor::Location::Path;
  if (l == "body")
    return ParameterDescriptor::Location::Body;
  return ParameterDescriptor::Location::Query;
}

std::vector<ParameterDescriptor> parseParameters(const juce::var &list) {
  std::vector<ParameterDescriptor> out;
  auto *arr = list.getArray();
  if (arr == nullptr)
    return out;
  for (auto &p : *arr) {
    if (!p.isObject())
      continue;
    ParameterDescriptor d;
    d.name = p.getProperty("name", {}).toString().trim();
    if (d.name.isEmpty())
      continue;
    d.type = p.getProperty("type", "string").toString().trim().toLowerCase();
    d.description = p.getProperty("description", {}).toString();
    d.location = parseLocation(p.getProperty("location", "query").toString());
    out.push_back(d);
  }
  return out;
}

} // namespace

juce::String ParameterDescriptor::locationToString(Location l) {
  switch (l) {
  case Location::Path:
    return "path";
  case Location::Body:
    return "body";
  default:
    return "query";
  }
}

std::optional<EndpointDescriptor>
EndpointDescriptor::fromVar(const juce::var &v) {
  if (!v.isObject())
    return std::nullopt;

  EndpointDescriptor d;
  d.pathPattern = v.getProperty("path", {}).toString().trim();
  if (d.pathPattern.isEmpty())
    return std::nullopt;
  d.method = v.getProperty("method", "GET").toString().trim().toUpperCase();
  d.description = v.getProperty("description", {}).toString();
  d.requiredParameters = parseParameters(
      propertyEither(v, "requiredParameters", "required_parameters"));
  d.optionalParameters = parseParameters(
      propertyEither(v, "optionalParameters", "optional_parameters"));
  return d;
}

bool EndpointDescriptor::isExcludedPath(const juce::String &path) {
  return path == Constants::kDocsPath || path == Constants::kHealthPath ||
         path == Constants::kStatusPath;
}

std::vector<EndpointDescriptor>
EndpointDescriptor::listFromDocs(const juce::var &docs) {
  std::vector<EndpointDescriptor> out;
  auto *arr = docs.getProperty("endpoints", {}).getArray();
  if (arr == nullptr)
    return out;
  for (auto &entry : *arr) {
    auto d = fromVar(entry);
    if (d && !isExcludedPath(d->pathPattern))
      out.push_back(*d);
  }
  return out;
}
