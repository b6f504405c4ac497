// CommandTemplate.cpp
#include "CommandTemplate.hpp"
#include <fmt/args.h>
#include <fmt/format.h>

namespace MidiFlow {

const std::vector<std::string>& commandTemplateKeys() {
    static const std::vector<std::string> keys = {
        "value", "trigger", "device", "channel", "control", "node", "timestamp", "workspace"};
    return keys;
}

std::string renderCommandTemplate(const std::string& tmpl, const std::map<std::string, std::string>& values) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    // Names must outlive vformat; keys() and `values` both do.
    for (const auto& key : commandTemplateKeys()) {
        auto it = values.find(key);
        store.push_back(fmt::arg(key.c_str(), it == values.end() ? std::string() : it->second));
    }
    return fmt::vformat(tmpl, store);
}

std::string quoteForShell(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (char c : value) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string renderShellCommand(const std::string& tmpl, const std::map<std::string, std::string>& values) {
    std::map<std::string, std::string> quoted;
    for (const auto& key : commandTemplateKeys()) {
        auto it = values.find(key);
        quoted[key] = quoteForShell(it == values.end() ? std::string() : it->second);
    }
    return renderCommandTemplate(tmpl, quoted);
}

bool checkCommandTemplate(const std::string& tmpl, std::string& error) {
    try {
        (void)renderCommandTemplate(tmpl, {});
        return true;
    } catch (const fmt::format_error& e) {
        error = e.what();
        return false;
    }
}

} // namespace MidiFlow
