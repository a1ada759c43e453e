#include "utils/request_id.h"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace lswitch {

namespace {

std::string random_hex(int words) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < words; ++i) {
        oss << std::setw(16) << static_cast<uint64_t>(rng());
    }
    return oss.str();
}

bool is_hex(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) return false;
    }
    return !s.empty();
}

}  // namespace

std::string generate_request_id() { return random_hex(1); }

std::string generate_trace_id() { return random_hex(2); }

std::string generate_span_id() { return random_hex(1); }

std::string next_traceparent(const std::string& incoming) {
    // format: 00-<32 hex trace id>-<16 hex span id>-<flags>
    std::string trace_id;
    if (incoming.size() >= 55 && incoming[2] == '-' && incoming[35] == '-') {
        trace_id = incoming.substr(3, 32);
    }
    if (!is_hex(trace_id)) {
        trace_id = generate_trace_id();
    }
    return "00-" + trace_id + "-" + generate_span_id() + "-01";
}

}  // namespace lswitch
