#include "../Network/HttpTransport.h"
#include "../Core/Constants.h"

HttpResponse JuceHttpTransport::send(const ConcreteRequest &request,
                                     const juce::StringPairArray &headers,
                                     int timeoutMs) {
  HttpResponse response;

  juce::URL url = request.toUrl();
  if (request.body.isNotEmpty())
    url = url.withPOSTData(request.body);

  juce::String headerText;
  for (int i = 0; i < headers.size(); ++i)
    headerText << headers.getAllKeys()[i] << ": "
               << headers.getAllValues()[i] << "\r\n";

  int statusCode = 0;
  auto options =
      juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
          .withExtraHeaders(headerText)
          .withConnectionTimeoutMs(timeoutMs)
          .withStatusCode(&statusCode)
          .withNumRedirectsToFollow(Constants::kMaxRedirects)
          .withHttpRequestCmd(methodToString(request.method));

  std::unique_ptr<juce::InputStream> stream = url.createInputStream(options);
  if (stream == nullptr) {
    response.statusCode = statusCode;
    response.connected = statusCode != 0;
    response.error = statusCode != 0
                         ? "HTTP " + juce::String(statusCode)
                         : "Could not connect to " + url.toString(false);
    return response;
  }

  response.connected = true;
  response.statusCode = statusCode;
  response.body = stream->readEntireStreamAsString();
  return response;
}
