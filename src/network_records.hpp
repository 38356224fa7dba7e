#pragma once
#include <vector>
#include <string>
#include <string_view>
#include "model.hpp"

// Build resource records from a DevTools protocol log ([{ "method", "params" }, ...]).
// One record per Network.requestWillBeSent (a redirect opens a new record for the same
// requestId); Network.responseReceived updates the latest record of its requestId.
// Records keep request order.
bool parse_devtools_log(const std::string& jsonText, std::vector<ResourceRecord>& out, std::string* outError = nullptr);

// "Script" -> ResourceType::Script; unknown names -> Other
ResourceType resource_type_from_string(std::string_view name);
const char* resource_type_name(ResourceType t);

// Type guessed from a MIME type when the protocol did not send one
ResourceType resource_type_from_mime(std::string_view mimeType);
