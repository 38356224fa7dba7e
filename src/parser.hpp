#pragma once
#include <vector>
#include <string>
#include "model.hpp"

// Parse a Chrome trace payload into events.
// Accepted roots:
//  1) {"traceEvents":[...], ...}
//  2) [ event, ... ]
//  3) a single event object
// - jsonText: file content
// - out: parsed events, in file order
// - outError: readable error optionnal.
//
// True in success
bool parse_trace_payload(const std::string& jsonText, std::vector<TraceEvent>& out, std::string* outError = nullptr);
bool read_file(const std::string& path, std::string& out);
