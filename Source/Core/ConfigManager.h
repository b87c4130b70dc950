/*
  ==============================================================================
    Source/Core/ConfigManager.h
    Role: Typed get/set and per-key change listeners over the settings
    ValueTree owned by AppSettings.
  ==============================================================================
*/
#pragma once

#include "../Core/Constants.h"
#include <functional>
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include <map>
#include <optional>
#include <type_traits>
#include <vector>

namespace ConfigKeys {
  inline const juce::Identifier apiUrl{"apiUrl"};
  inline const juce::Identifier apiKey{"apiKey"};
  inline const juce::Identifier clientId{"clientId"};
  inline const juce::Identifier lastMidiDevice{"lastMidiDevice"};
  inline const juce::Identifier debounceWindowMs{"debounceWindowMs"};
  inline const juce::Identifier requestTimeoutMs{"requestTimeoutMs"};
  inline const juce::Identifier mappingsFile{"mappingsFile"};
}

class ConfigManager : public juce::ValueTree::Listener {
public:
  using ChangeCallback = std::function<void(const juce::var &)>;

  explicit ConfigManager(juce::ValueTree &tree) : configTree(tree) {
    configTree.addListener(this);
  }

  ~ConfigManager() override {
    if (configTree.isValid())
      configTree.removeListener(this);
  }

  void valueTreePropertyChanged(juce::ValueTree &tree,
                                const juce::Identifier &id) override {
    if (tree != configTree)
      return;
    auto it = listeners.find(id);
    if (it == listeners.end())
      return;
    const auto value = configTree.getProperty(id);
    for (auto &fn : it->second)
      if (fn)
        fn(value);
  }

  template <typename T> T get(const juce::Identifier &key, T defaultVal) const {
    if (!configTree.isValid())
      return defaultVal;
    auto v = configTree.getProperty(key);
    if (v.isVoid())
      return defaultVal;
    if constexpr (std::is_same_v<T, int>)
      return static_cast<int>(v);
    else if constexpr (std::is_same_v<T, double>)
      return static_cast<double>(v);
    else if constexpr (std::is_same_v<T, bool>)
      return static_cast<bool>(v);
    else if constexpr (std::is_same_v<T, juce::String>)
      return v.toString();
    return defaultVal;
  }

  template <typename T> void set(const juce::Identifier &key, T value) {
    configTree.setProperty(key, value, nullptr);
  }

  /** Several callbacks may watch one key; they run on the setter's thread. */
  void addListener(const juce::Identifier &key, ChangeCallback onChange) {
    listeners[key].push_back(std::move(onChange));
  }

  void removeListeners(const juce::Identifier &key) { listeners.erase(key); }

  // --- Typed settings ---
  juce::String getApiUrl() const { return get<juce::String>(ConfigKeys::apiUrl, {}); }
  juce::String getApiKey() const { return get<juce::String>(ConfigKeys::apiKey, {}); }
  juce::String getClientId() const { return get<juce::String>(ConfigKeys::clientId, {}); }
  juce::String getLastMidiDevice() const {
    return get<juce::String>(ConfigKeys::lastMidiDevice, {});
  }

  /** Negative or non-numeric values read as the default window. */
  double getDebounceWindowMs() const {
    if (!configTree.isValid())
      return Constants::kDebounceWindowMs;
    auto v = configTree.getProperty(ConfigKeys::debounceWindowMs);
    if (v.isString())
      return parseDebounceWindowMs(v.toString())
          .value_or(Constants::kDebounceWindowMs);
    if (!(v.isDouble() || v.isInt() || v.isInt64()))
      return Constants::kDebounceWindowMs;
    const double ms = v;
    return ms >= 0.0 ? ms : Constants::kDebounceWindowMs;
  }

  /** "40", "12.5" or "0"; nullopt for anything else (signs, units, text). */
  static std::optional<double> parseDebounceWindowMs(const juce::String &text) {
    auto t = text.trim();
    if (t.isEmpty() || !t.containsOnly("0123456789.") ||
        t.indexOfChar('.') != t.lastIndexOfChar('.') || t == ".")
      return std::nullopt;
    return t.getDoubleValue();
  }

  int getRequestTimeoutMs() const {
    return juce::jlimit(Constants::kMinRequestTimeoutMs,
                        Constants::kMaxRequestTimeoutMs,
                        get<int>(ConfigKeys::requestTimeoutMs,
                                 Constants::kRequestTimeoutMs));
  }

  juce::ValueTree &getTree() { return configTree; }
  const juce::ValueTree &getTree() const { return configTree; }

private:
  juce::ValueTree &configTree;
  std::map<juce::Identifier, std::vector<ChangeCallback>> listeners;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ConfigManager)
};
