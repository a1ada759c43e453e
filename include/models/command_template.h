#pragma once

#include <string>
#include <vector>

namespace lswitch {

// Values substituted into a model's command template.
struct TemplateValues {
    int port{0};
    int ctx{0};
    std::string host;
};

struct CommandSubstitution {
    std::string command;
    bool has_port{false};
    bool has_ctx{false};
    bool has_host{false};
    // Names of ${...} placeholders left in `command` after substitution.
    std::vector<std::string> unresolved;

    bool complete() const { return has_port && unresolved.empty(); }
};

// Replace ${PORT}, ${CTX}, ${HOST} and then the bare $PORT, $CTX, $HOST forms.
// No other text in the template is interpreted.
CommandSubstitution substituteCommand(const std::string& command_template,
                                      const TemplateValues& values);

// Collect ${NAME} placeholder names occurring in `text`, in order of appearance.
std::vector<std::string> findPlaceholders(const std::string& text);

}  // namespace lswitch
