#pragma once

#include <functional>
#include <string>

namespace lazyverdi::tui {

using Formatter = std::function<std::string(const std::string&)>;

// Drops a trailing "$ verdi ..." echo line.
std::string strip_command_echo(const std::string& text);

// Echo strip plus removal of trailing blank lines. Leading whitespace is kept
// so column alignment survives.
std::string format_table_output(const std::string& text);
std::string format_process_list(const std::string& text);

// Echo strip plus trim, for free text (config, profile, daemon, storage).
std::string format_status_output(const std::string& text);

std::string no_format(const std::string& text);

} // namespace lazyverdi::tui
