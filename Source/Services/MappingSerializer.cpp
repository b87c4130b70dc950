#include "../Services/MappingSerializer.h"
#include "../Core/LogService.h"

ParamMap MappingSerializer::paramsFromVar(const juce::var &v) {
  ParamMap params;
  if (auto *obj = v.getDynamicObject())
    for (auto &prop : obj->getProperties())
      params[prop.name.toString()] = prop.value;
  return params;
}

juce::var MappingSerializer::paramsToVar(const ParamMap &params) {
  juce::DynamicObject::Ptr obj = new juce::DynamicObject();
  for (auto &kv : params)
    obj->setProperty(kv.first, kv.second);
  return juce::var(obj.get());
}

std::optional<PersistedMapping>
MappingSerializer::parseValue(const juce::var &value) {
  if (value.isString()) {
    auto endpoint = value.toString().trim();
    if (endpoint.isEmpty())
      return std::nullopt;
    return PersistedMapping(LegacyMapping{endpoint});
  }

  auto *obj = value.getDynamicObject();
  if (obj == nullptr)
    return std::nullopt;

  StructuredMapping m;
  m.endpoint = obj->getProperty("endpoint").toString().trim();
  if (m.endpoint.isEmpty())
    return std::nullopt;

  auto methodText = obj->getProperty("method").toString();
  if (methodText.isNotEmpty()) {
    auto method = methodFromString(methodText);
    if (!method)
      return std::nullopt;
    m.method = *method;
  }

  m.queryParams = paramsFromVar(obj->getProperty("query_params"));
  m.bodyParams = paramsFromVar(obj->getProperty("body_params"));
  m.pathParams = paramsFromVar(obj->getProperty("path_params"));
  return PersistedMapping(std::move(m));
}

RequestTemplate MappingSerializer::normalize(const PersistedMapping &mapping) {
  RequestTemplate t;
  if (auto *legacy = std::get_if<LegacyMapping>(&mapping)) {
    t.method = HttpMethod::Post;
    t.pathPattern = legacy->endpoint;
    return t;
  }

  auto &s = std::get<StructuredMapping>(mapping);
  t.method = s.method;
  t.pathPattern = s.endpoint;
  t.queryParams = s.queryParams;
  t.bodyParams = s.bodyParams;
  t.pathParams = s.pathParams;
  return t;
}

juce::var MappingSerializer::templateToVar(const RequestTemplate &request) {
  juce::DynamicObject::Ptr obj = new juce::DynamicObject();
  obj->setProperty("endpoint", request.pathPattern);
  obj->setProperty("method", methodToString(request.method));
  obj->setProperty("query_params", paramsToVar(request.queryParams));
  obj->setProperty("body_params", paramsToVar(request.bodyParams));
  obj->setProperty("path_params", paramsToVar(request.pathParams));
  return juce::var(obj.get());
}

juce::var MappingSerializer::toJson(const MappingTable &table) {
  juce::DynamicObject::Ptr root = new juce::DynamicObject();
  for (auto &e : table)
    root->setProperty(e.key.toString(), templateToVar(e.request));
  return juce::var(root.get());
}

DispatchStatus MappingSerializer::fromJson(const juce::var &root,
                                           MappingTable &out, int &skipped) {
  skipped = 0;
  auto *obj = root.getDynamicObject();
  if (obj == nullptr)
    return DispatchStatus::fail(DispatchError::Parse,
                                "Mapping file must contain a JSON object");

  MappingTable table;
  for (auto &prop : obj->getProperties()) {
    auto keyText = prop.name.toString();
    auto key = TriggerKey::fromString(keyText);
    if (!key) {
      LogService::instance().warning("Skipping mapping with invalid key: " +
                                     keyText);
      ++skipped;
      continue;
    }
    auto mapping = parseValue(prop.value);
    if (!mapping) {
      LogService::instance().warning("Skipping malformed mapping for " +
                                     keyText);
      ++skipped;
      continue;
    }
    table.push_back({*key, normalize(*mapping)});
  }

  out = std::move(table);
  return DispatchStatus::ok();
}

juce::String MappingSerializer::toJsonString(const MappingTable &table) {
  return juce::JSON::toString(toJson(table));
}

DispatchStatus MappingSerializer::fromJsonString(const juce::String &text,
                                                 MappingTable &out,
                                                 int &skipped) {
  skipped = 0;
  juce::var root;
  auto parsed = juce::JSON::parse(text, root);
  if (parsed.failed())
    return DispatchStatus::fail(DispatchError::Parse,
                                "Mapping file is not valid JSON: " +
                                    parsed.getErrorMessage());
  return fromJson(root, out, skipped);
}

DispatchStatus MappingSerializer::saveToFile(const MappingTable &table,
                                             const juce::File &file) {
  auto parent = file.getParentDirectory();
  if (!parent.exists() && !parent.createDirectory())
    return DispatchStatus::fail(DispatchError::Storage,
                                "Could not create folder " +
                                    parent.getFullPathName());

  auto tempFile = file.withFileExtension(".tmp");
  bool ok = tempFile.replaceWithText(toJsonString(table)) &&
            tempFile.moveFileTo(file);
  if (!ok) {
    tempFile.deleteFile();
    LogService::instance().error("Failed to save mappings to " +
                                 file.getFullPathName());
    return DispatchStatus::fail(DispatchError::Storage,
                                "Could not write " + file.getFullPathName());
  }

  LogService::instance().info("Saved " + juce::String((int)table.size()) +
                              " mapping(s) to " + file.getFullPathName());
  return DispatchStatus::ok();
}

DispatchStatus MappingSerializer::loadFromFile(const juce::File &file,
                                               MappingTable &out,
                                               int &skipped) {
  skipped = 0;
  if (!file.existsAsFile())
    return DispatchStatus::fail(DispatchError::Storage,
                                "Mapping file not found: " +
                                    file.getFullPathName());

  auto status = fromJsonString(file.loadFileAsString(), out, skipped);
  if (status.failed()) {
    LogService::instance().error("Failed to load mappings from " +
                                 file.getFullPathName() + ": " +
                                 status.message);
    return status;
  }

  LogService::instance().info(
      "Loaded " + juce::String((int)out.size()) + " mapping(s) from " +
      file.getFullPathName() +
      (skipped > 0 ? " (" + juce::String(skipped) + " skipped)"
                   : juce::String()));
  return status;
}
