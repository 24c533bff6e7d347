#ifndef SMCPC_DEBUG_LOG_HPP
#define SMCPC_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if SMCPC_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [smcpc] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [smcpc] prefix unconditionally.
// Used for lifecycle events and failures the operator should always see.
void info(const std::string &message);

} // namespace debug_log

#endif // SMCPC_DEBUG_LOG_HPP
