#ifndef MCPDISPATCH_DEBUG_LOG_HPP
#define MCPDISPATCH_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if MCPDISPATCH_DEBUG env is set to a truthy value (1, true, yes).
// Read on first use.
bool is_debug_enabled();

// Writes message to stderr with [mcpdispatch] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [mcpdispatch] prefix unconditionally.
// stdout carries protocol frames only, so operator messages go here.
void notice(const std::string &message);

} // namespace debug_log

#endif // MCPDISPATCH_DEBUG_LOG_HPP
