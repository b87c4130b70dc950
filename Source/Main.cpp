/*
  ==============================================================================
    Source/Main.cpp
    Role: Headless application shell. Loads settings and mappings, connects
    the MIDI device and the API, then runs the message loop.

    MidiRestBridge [--url=<u>] [--key=<k>] [--client=<id>] [--device=<name>]
                   [--mappings=<file>] [--import=<file>] [--export=<file>]
                   [--learn=<endpoint>] [--debounce=<ms>] [--timeout=<ms>]
                   [--list-devices] [--run-tests]
  ==============================================================================
*/
#include "Core/AppSettings.h"
#include "Core/ConfigManager.h"
#include "Core/Constants.h"
#include "Core/DispatchCoordinator.h"
#include "Core/LogService.h"
#include "Tests/RunAll.h"
#include <iostream>
#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

namespace {

class ShellListener : public DispatchListener {
public:
  void onMidiDevicesChanged(const juce::StringArray &devices) override {
    LogService::instance().info("MIDI inputs: " +
                                (devices.isEmpty()
                                     ? juce::String("(none)")
                                     : devices.joinIntoString(", ")));
  }

  void onApiStatusChanged(bool success, const juce::String &message) override {
    if (success)
      LogService::instance().info("API: " + message);
    else
      LogService::instance().warning("API: " + message);
  }

  void onDispatchResult(const juce::String &endpoint,
                        const DispatchOutcome &outcome) override {
    if (outcome.success)
      LogService::instance().info(endpoint + " -> " +
                                  juce::JSON::toString(outcome.payload, true));
  }

  void onClientsLoaded(const juce::Array<juce::var> &clients) override {
    juce::StringArray names;
    for (auto &c : clients)
      names.add(c.getProperty("name", c.getProperty("id", "?")).toString());
    LogService::instance().info(juce::String(clients.size()) +
                                " client(s): " + names.joinIntoString(", "));
  }

  void onEndpointsLoaded(
      const std::vector<EndpointDescriptor> &endpoints) override {
    for (auto &e : endpoints)
      LogService::instance().debug("  " + e.getDisplayName() +
                                   (e.description.isNotEmpty()
                                        ? " - " + e.description
                                        : juce::String()));
  }

  void onDeviceError(const juce::String &message) override {
    LogService::instance().error("MIDI: " + message);
  }
};

} // namespace

class MidiRestBridgeApplication : public juce::JUCEApplicationBase {
public:
  MidiRestBridgeApplication() {}

  const juce::String getApplicationName() override {
    return Constants::kAppName;
  }
  const juce::String getApplicationVersion() override { return "1.0.0"; }
  bool moreThanOneInstanceAllowed() override { return false; }

  void initialise(const juce::String &commandLine) override {
    juce::ArgumentList args(getApplicationName(), commandLine);
    auto &log = LogService::instance();

    if (args.containsOption("--run-tests")) {
      setApplicationReturnValue(RunAllTests::run() ? 0 : 1);
      quit();
      return;
    }

    log.installFileLogger(Constants::kLogFolderName, Constants::kAppName);
    log.info(getApplicationName() + " " + getApplicationVersion());

    settings = std::make_unique<AppSettings>();
    config = std::make_unique<ConfigManager>(settings->getState());
    applyCommandLine(args);

    coordinator = std::make_unique<DispatchCoordinator>();
    coordinator->addListener(&shellListener);
    coordinator->setDebounceWindowMs(config->getDebounceWindowMs());
    coordinator->setRequestTimeoutMs(config->getRequestTimeoutMs());
    config->addListener(ConfigKeys::debounceWindowMs, [this](const juce::var &) {
      coordinator->setDebounceWindowMs(config->getDebounceWindowMs());
    });
    config->addListener(ConfigKeys::requestTimeoutMs, [this](const juce::var &) {
      coordinator->setRequestTimeoutMs(config->getRequestTimeoutMs());
    });

    if (args.containsOption("--list-devices")) {
      for (auto &name : coordinator->refreshDevices())
        std::cout << name << std::endl;
      quit();
      return;
    }

    if (!loadMappings(args)) {
      setApplicationReturnValue(1);
      quit();
      return;
    }

    if (args.containsOption("--export")) {
      auto target = fileOption(args, "--export");
      auto status = target == juce::File()
                        ? DispatchStatus::fail(DispatchError::Parse,
                                               "--export needs a file name")
                        : coordinator->saveMappings(target);
      if (status.failed())
        log.error(status.describe());
      setApplicationReturnValue(status.wasOk() ? 0 : 1);
      quit();
      return;
    }

    coordinator->setApiConfig(config->getApiUrl(), config->getApiKey(),
                              config->getClientId());

    auto device = config->getLastMidiDevice();
    if (device.isNotEmpty()) {
      if (!coordinator->connectDevice(device))
        coordinator->refreshDevices();
    } else {
      log.warning("No MIDI device configured; use --device=<name>");
      coordinator->refreshDevices();
    }

    auto learnEndpoint = args.getValueForOption("--learn").trim();
    if (learnEndpoint.isNotEmpty())
      armLearn(learnEndpoint);

    if (!settings->save())
      log.warning("Settings were not saved");
  }

  void shutdown() override {
    if (coordinator != nullptr) {
      coordinator->removeListener(&shellListener);
      coordinator.reset();
    }
    config.reset();
    if (settings != nullptr && settings->isDirty() && !settings->save())
      LogService::instance().error("Settings could not be saved on exit");
    settings.reset();
  }

  void anotherInstanceStarted(const juce::String &commandLine) override {
    juce::ignoreUnused(commandLine);
  }
  void systemRequestedQuit() override { quit(); }
  void suspended() override {}
  void resumed() override {}

  void unhandledException(const std::exception *e,
                          const juce::String &sourceFilename,
                          int lineNumber) override {
    LogService::instance().error(
        "Unhandled exception" +
        (e != nullptr ? ": " + juce::String(e->what()) : juce::String()) +
        " (" + sourceFilename + ":" + juce::String(lineNumber) + ")");
  }

private:
  // "--option=<path>", relative to the working directory
  static juce::File fileOption(const juce::ArgumentList &args,
                               const char *option) {
    auto text = args.getValueForOption(option).trim().unquoted();
    if (text.isEmpty())
      return {};
    return juce::File::getCurrentWorkingDirectory().getChildFile(text);
  }

  // Command-line values override the stored settings and are written back
  void applyCommandLine(const juce::ArgumentList &args) {
    auto setString = [&](const char *option, const juce::Identifier &key) {
      if (args.containsOption(option))
        config->set(key, args.getValueForOption(option).trim());
    };
    setString("--url", ConfigKeys::apiUrl);
    setString("--key", ConfigKeys::apiKey);
    setString("--client", ConfigKeys::clientId);
    setString("--device", ConfigKeys::lastMidiDevice);

    auto mappings = fileOption(args, "--mappings");
    if (mappings != juce::File())
      config->set(ConfigKeys::mappingsFile, mappings.getFullPathName());
    if (args.containsOption("--debounce")) {
      auto text = args.getValueForOption("--debounce");
      if (auto ms = ConfigManager::parseDebounceWindowMs(text))
        config->set(ConfigKeys::debounceWindowMs, *ms);
      else
        LogService::instance().warning(
            "Ignoring --debounce=" + text + "; keeping " +
            juce::String(config->getDebounceWindowMs()) + " ms");
    }
    if (args.containsOption("--timeout"))
      config->set(ConfigKeys::requestTimeoutMs,
                  args.getValueForOption("--timeout").getIntValue());
  }

  bool loadMappings(const juce::ArgumentList &args) {
    auto mappingsFile = settings->getMappingsFile();

    if (args.containsOption("--import")) {
      auto source = fileOption(args, "--import");
      if (source == juce::File()) {
        LogService::instance().error("--import needs a file name");
        return false;
      }
      auto status = coordinator->loadMappings(source);
      if (status.failed())
        return false;
      return coordinator->saveMappings(mappingsFile).wasOk();
    }

    if (!mappingsFile.existsAsFile()) {
      LogService::instance().info("No mapping file yet at " +
                                  mappingsFile.getFullPathName());
      return true;
    }
    // A broken mapping file is reported but does not stop the bridge
    auto status = coordinator->loadMappings(mappingsFile);
    if (status.failed())
      LogService::instance().warning("Starting with an empty mapping table");
    return true;
  }

  void armLearn(const juce::String &endpoint) {
    LogService::instance().info("Waiting for a MIDI control to bind to " +
                                endpoint);
    coordinator->startLearn([this, endpoint](const TriggerKey &key) {
      if (coordinator == nullptr)
        return;
      RequestTemplate request;
      request.method = HttpMethod::Post;
      request.pathPattern = endpoint;
      coordinator->addMapping(key, request);
      auto status = coordinator->saveMappings(settings->getMappingsFile());
      if (status.failed())
        LogService::instance().error(status.describe());
    });
  }

  ShellListener shellListener;
  std::unique_ptr<AppSettings> settings;
  std::unique_ptr<ConfigManager> config;
  std::unique_ptr<DispatchCoordinator> coordinator;
};

START_JUCE_APPLICATION(MidiRestBridgeApplication)
