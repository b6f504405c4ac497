// CommandTemplate.hpp
//
// Command templates use fmt replacement fields with named arguments:
//   "notify-send midiflow CC{control}={value}"
// Literal braces are written doubled ("{{" and "}}"), so shell expansions
// such as ${HOME} must be written as $HOME or ${{HOME}}.
#pragma once
#include <map>
#include <string>
#include <vector>

namespace MidiFlow {

// Names every template may reference
const std::vector<std::string>& commandTemplateKeys();

// Returns false and fills `error` if the template references an unknown
// name or is malformed.
bool checkCommandTemplate(const std::string& tmpl, std::string& error);

// Renders the template. Missing keys render as empty strings; throws
// fmt::format_error on a malformed template.
std::string renderCommandTemplate(const std::string& tmpl, const std::map<std::string, std::string>& values);

// Wraps `value` in single quotes so /bin/sh reads it as one literal word
std::string quoteForShell(const std::string& value);

// Renders a command line for `sh -c`: every substituted value is a quoted
// word, so event and workspace strings never run as shell code. Values
// placed inside double quotes keep their single quotes literally.
std::string renderShellCommand(const std::string& tmpl, const std::map<std::string, std::string>& values);

} // namespace MidiFlow
