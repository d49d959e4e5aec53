#ifndef MCPDISPATCH_MCP_STDIO_HPP
#define MCPDISPATCH_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on stdin, out on stdout.

#include <iostream>
#include <string>

namespace mcp_stdio {

// Read one complete JSON object. Framing is brace counting with string and
// escape awareness, so both newline-delimited and streamed JSON work. An
// object over 16 MiB is skipped. Returns an empty string on EOF.
std::string read_message(std::istream &input = std::cin);

// Write a JSON message followed by a newline, then flush.
void write_message(const std::string &json_string, std::ostream &output = std::cout);

// Operator message on stderr.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // MCPDISPATCH_MCP_STDIO_HPP
