/*
  ==============================================================================
    Source/Services/MappingSerializer.h
    Role: Persisted mapping file codec.

    File shape: one JSON object keyed by "<kind>:<channel>:<index>". A value
    is either a bare endpoint string (legacy) or
      { "endpoint", "method", "query_params", "body_params", "path_params" }.
    Both are normalized to RequestTemplate on load; saving always writes the
    structured form.
  ==============================================================================
*/
#pragma once

#include "../Core/DispatchError.h"
#include "../Network/RequestTemplate.h"
#include "../Services/MappingStore.h"
#include <juce_core/juce_core.h>
#include <optional>
#include <variant>

struct LegacyMapping {
  juce::String endpoint;
};

struct StructuredMapping {
  juce::String endpoint;
  HttpMethod method = HttpMethod::Post;
  ParamMap queryParams;
  ParamMap bodyParams;
  ParamMap pathParams;
};

using PersistedMapping = std::variant<LegacyMapping, StructuredMapping>;

class MappingSerializer {
public:
  /** nullopt for values that are neither shape (or carry an unknown method). */
  static std::optional<PersistedMapping> parseValue(const juce::var &value);

  /** Legacy entries become a POST with empty parameter maps. */
  static RequestTemplate normalize(const PersistedMapping &mapping);

  static juce::var templateToVar(const RequestTemplate &request);
  static juce::var toJson(const MappingTable &table);

  /** Bad keys or values are skipped and counted; only a non-object root is
   * an error. */
  static DispatchStatus fromJson(const juce::var &root, MappingTable &out,
                                 int &skipped);

  static juce::String toJsonString(const MappingTable &table);
  static DispatchStatus fromJsonString(const juce::String &text,
                                       MappingTable &out, int &skipped);

  /** Temp file then move, so an existing file survives a failed write. */
  static DispatchStatus saveToFile(const MappingTable &table,
                                   const juce::File &file);
  static DispatchStatus loadFromFile(const juce::File &file, MappingTable &out,
                                     int &skipped);

private:
  static ParamMap paramsFromVar(const juce::var &v);
  static juce::var paramsToVar(const ParamMap &params);
};
