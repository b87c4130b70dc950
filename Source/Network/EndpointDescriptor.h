/*
  ==============================================================================
    Source/Network/EndpointDescriptor.h
    Role: Remote API's self-declared route shape (parsed from GET /api/docs).
    Immutable capability list used to drive template construction.
  ==============================================================================
*/
#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <vector>

struct ParameterDescriptor {
  enum class Location { Path, Query, Body };

  juce::String name;
  juce::String type; // "string", "number", "boolean", "array", "object"...
  juce::String description;
  Location location = Location::Query;

  static juce::String locationToString(Location l);
};

struct EndpointDescriptor {
  juce::String method;
  juce::String pathPattern;
  juce::String description;
  std::vector<ParameterDescriptor> requiredParameters;
  std::vector<ParameterDescriptor> optionalParameters;

  /** "GET /path" as shown in endpoint pickers. */
  juce::String getDisplayName() const { return method + " " + pathPattern; }

  static std::optional<EndpointDescriptor> fromVar(const juce::var &v);

  /** Parses the "endpoints" array of a docs payload, dropping housekeeping
   * routes (docs, health, status). */
  static std::vector<EndpointDescriptor> listFromDocs(const juce::var &docs);

  static bool isExcludedPath(const juce::String &path);
};
