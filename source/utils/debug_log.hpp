#ifndef WKMUX_DEBUG_LOG_HPP
#define WKMUX_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if WKMUX_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [wkmux] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [wkmux] prefix unconditionally.
void log_always(const std::string &message);

} // namespace debug_log

#endif // WKMUX_DEBUG_LOG_HPP
