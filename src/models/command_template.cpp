#include "models/command_template.h"

#include <array>
#include <utility>

namespace lswitch {

namespace {

bool replaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return false;
    bool replaced = false;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
        replaced = true;
    }
    return replaced;
}

}  // namespace

CommandSubstitution substituteCommand(const std::string& command_template,
                                      const TemplateValues& values) {
    CommandSubstitution out;
    out.command = command_template;

    const std::string port = std::to_string(values.port);
    const std::string ctx = std::to_string(values.ctx);

    // Braced forms first so "$PORT" never eats the inside of "${PORT}".
    const std::array<std::pair<const char*, const std::string*>, 6> rules{{
        {"${PORT}", &port},
        {"${CTX}", &ctx},
        {"${HOST}", &values.host},
        {"$PORT", &port},
        {"$CTX", &ctx},
        {"$HOST", &values.host},
    }};

    for (size_t i = 0; i < rules.size(); ++i) {
        if (!replaceAll(out.command, rules[i].first, *rules[i].second)) {
            continue;
        }
        switch (i % 3) {
            case 0: out.has_port = true; break;
            case 1: out.has_ctx = true; break;
            default: out.has_host = true; break;
        }
    }

    out.unresolved = findPlaceholders(out.command);
    return out;
}

std::vector<std::string> findPlaceholders(const std::string& text) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = text.find("${", pos)) != std::string::npos) {
        const size_t close = text.find('}', pos + 2);
        if (close == std::string::npos) {
            break;
        }
        names.push_back(text.substr(pos + 2, close - pos - 2));
        pos = close + 1;
    }
    return names;
}

}  // namespace lswitch
