/*
  ==============================================================================
    Source/Network/RequestBuilder.h
    Role: Turns a request template plus the connection snapshot into a concrete
    HTTP request (path substitution, query/body assembly, clientId routing),
    and builds templates from endpoint descriptors and text fields.
  ==============================================================================
*/
#pragma once

#include "../Core/DispatchError.h"
#include "../Network/EndpointDescriptor.h"
#include "../Network/RequestTemplate.h"
#include <map>
#include <memory>

struct BuildResult {
  ConcreteRequest request;
  DispatchStatus status;

  bool wasOk() const { return status.wasOk(); }
};

class RequestBuilder {
public:
  /** Fails with a Template error when a placeholder has no bound value; no
   * default is ever substituted. */
  static BuildResult build(const RequestTemplate &t,
                           std::shared_ptr<const ConnectionState> connection);

  /** Placeholder names (without the ':' sigil) in path order. */
  static juce::StringArray placeholdersIn(const juce::String &pathPattern);

  /** Checks that path_params keys equal the placeholder set. */
  static DispatchStatus validate(const RequestTemplate &t);

  /** JSON array first, then comma split with whitespace trimmed. */
  static juce::var parseArrayText(const juce::String &text);

  /** Text field -> typed value according to the descriptor's type. */
  static DispatchStatus coerceValue(const juce::String &text,
                                    const juce::String &type, juce::var &out);

  /** Builds a template from descriptor-driven text fields keyed by parameter
   * name. Empty optional fields are omitted; clientId is never taken from
   * the fields. */
  static DispatchStatus
  fromDescriptor(const EndpointDescriptor &descriptor,
                 const std::map<juce::String, juce::String> &fieldValues,
                 RequestTemplate &out);

  /** Empty strings and void values are never sent. */
  static bool shouldOmit(const juce::var &v);

  static juce::String valueToQueryString(const juce::var &v);
};
