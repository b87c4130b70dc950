/*
  ==============================================================================
    Source/Core/AppSettings.h
    Role: Owns the settings ValueTree and its juce::PropertiesFile (XML) under
    the user application data folder "MidiRestBridge".
  ==============================================================================
*/
#pragma once

#include "../Core/ConfigManager.h"
#include "../Core/Constants.h"
#include "../Core/LogService.h"
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include <memory>

class AppSettings : public juce::ValueTree::Listener {
public:
  static juce::PropertiesFile::Options defaultOptions() {
    juce::PropertiesFile::Options options;
    options.applicationName = Constants::kAppName;
    options.folderName = Constants::kAppName;
    options.filenameSuffix = ".settings";
    options.osxLibrarySubFolder = "Application Support";
    options.storageFormat = juce::PropertiesFile::storeAsXML;
    options.commonToAllUsers = false;
    return options;
  }

  AppSettings() : AppSettings(defaultOptions().getDefaultFile()) {}

  /** Explicit file, e.g. a temp file in tests. */
  explicit AppSettings(const juce::File &settingsFile)
      : state("MIDI_REST_BRIDGE"),
        props(std::make_unique<juce::PropertiesFile>(settingsFile,
                                                     defaultOptions())) {
    applyDefaults();
    load();
    state.addListener(this);
  }

  ~AppSettings() override {
    state.removeListener(this);
    if (dirty)
      save();
  }

  juce::ValueTree &getState() { return state; }
  const juce::ValueTree &getState() const { return state; }

  juce::File getSettingsFile() const { return props->getFile(); }

  /** mappings.json beside the settings file unless overridden. */
  juce::File getMappingsFile() const {
    auto custom = state.getProperty(ConfigKeys::mappingsFile).toString();
    if (custom.isNotEmpty() && juce::File::isAbsolutePath(custom))
      return juce::File(custom);
    return getSettingsFile().getSiblingFile(Constants::kMappingsFileName);
  }

  void valueTreePropertyChanged(juce::ValueTree &tree,
                                const juce::Identifier &id) override {
    juce::ignoreUnused(tree, id);
    if (!isLoading)
      dirty = true;
  }

  bool save() {
    auto xml = state.createXml();
    if (xml == nullptr)
      return false;
    props->setValue("settings", xml.get());
    if (!props->saveIfNeeded()) {
      LogService::instance().error("Settings could not be saved to " +
                                   getSettingsFile().getFullPathName());
      return false;
    }
    dirty = false;
    return true;
  }

  bool isDirty() const { return dirty; }

private:
  void applyDefaults() {
    state.setProperty(ConfigKeys::apiUrl, "", nullptr);
    state.setProperty(ConfigKeys::apiKey, "", nullptr);
    state.setProperty(ConfigKeys::clientId, "", nullptr);
    state.setProperty(ConfigKeys::lastMidiDevice, "", nullptr);
    state.setProperty(ConfigKeys::debounceWindowMs,
                      Constants::kDebounceWindowMs, nullptr);
    state.setProperty(ConfigKeys::requestTimeoutMs,
                      Constants::kRequestTimeoutMs, nullptr);
  }

  void load() {
    isLoading = true;
    if (auto xml = props->getXmlValue("settings")) {
      auto loaded = juce::ValueTree::fromXml(*xml);
      if (loaded.isValid() && loaded.hasType(state.getType()))
        state.copyPropertiesFrom(loaded, nullptr);
      else
        LogService::instance().warning(
            "Settings file has an unexpected format; using defaults.");
    }

    // Out-of-range values fall back to defaults
    auto debounce = ConfigManager::parseDebounceWindowMs(
        state.getProperty(ConfigKeys::debounceWindowMs).toString());
    state.setProperty(ConfigKeys::debounceWindowMs,
                      debounce.value_or(Constants::kDebounceWindowMs), nullptr);

    int timeout = state.getProperty(ConfigKeys::requestTimeoutMs);
    if (timeout < Constants::kMinRequestTimeoutMs ||
        timeout > Constants::kMaxRequestTimeoutMs)
      state.setProperty(ConfigKeys::requestTimeoutMs,
                        Constants::kRequestTimeoutMs, nullptr);

    isLoading = false;
  }

  juce::ValueTree state;
  std::unique_ptr<juce::PropertiesFile> props;
  bool isLoading = false;
  bool dirty = false;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AppSettings)
};
