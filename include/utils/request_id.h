// request_id.h - request and W3C trace ids for the HTTP server
#pragma once

#include <string>

namespace lswitch {

// Random 16-hex-character request id.
std::string generate_request_id();

// W3C trace context: 32-hex trace id, 16-hex span id.
std::string generate_trace_id();
std::string generate_span_id();

// Build the traceparent for a response: keep the caller's trace id when
// `incoming` is a well-formed traceparent, start a new trace otherwise.
// The span id is always new.
std::string next_traceparent(const std::string& incoming);

}  // namespace lswitch
