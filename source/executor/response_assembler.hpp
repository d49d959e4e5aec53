#ifndef MCPDISPATCH_RESPONSE_ASSEMBLER_HPP
#define MCPDISPATCH_RESPONSE_ASSEMBLER_HPP

// Incremental assembly of a provider's terminal response from its stdout.
//
// Framing: newline-delimited JSON. A frame is terminal when it is an object
// and either its "id" equals the request id, or it carries no "method" and
// has a "result" or "error" member. Everything else (notifications, log
// lines, unparseable text) is incidental and dropped once its line is
// complete. The unterminated tail is tried as a whole document after every
// chunk, so a provider may also answer with one document and no newline.

#include <nlohmann/json.hpp>
#include <string>

namespace executor {

using json = nlohmann::json;

enum class AssemblerState {
    collecting,
    complete
};

bool is_terminal_frame(const json &frame, const std::string &request_id);

class ResponseAssembler {
public:
    explicit ResponseAssembler(std::string request_id);

    // Append a chunk of stdout. Returns true once a terminal response is held;
    // further chunks are ignored after that.
    bool feed(const std::string &chunk);

    // Called after a clean (zero) exit. Returns the terminal response if one
    // was assembled, else the tail parsed as-is, else {"result": <raw tail>},
    // else {"result": null} when nothing is left.
    json finish();

    AssemblerState state() const { return state_; }
    bool is_complete() const { return state_ == AssemblerState::complete; }
    const json &response() const { return response_; }

    // Unconsumed partial line.
    const std::string &pending_text() const { return buffer_; }

    // Complete lines dropped as incidental output.
    size_t discarded_line_count() const { return discarded_lines_; }

private:
    bool accept_if_terminal(const json &frame);

    std::string request_id_;
    std::string buffer_;
    AssemblerState state_ = AssemblerState::collecting;
    json response_;
    size_t discarded_lines_ = 0;
};

} // namespace executor

#endif // MCPDISPATCH_RESPONSE_ASSEMBLER_HPP
