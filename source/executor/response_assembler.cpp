#include "executor/response_assembler.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/utf8_sanitize.hpp"

#include <cctype>

namespace executor {

static std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool is_terminal_frame(const json &frame, const std::string &request_id) {
    if (!frame.is_object()) {
        return false;
    }
    if (frame.contains("id") && frame["id"].is_string() && frame["id"].get<std::string>() == request_id) {
        return true;
    }
    if (frame.contains("method")) {
        return false;
    }
    return frame.contains("result") || frame.contains("error");
}

ResponseAssembler::ResponseAssembler(std::string request_id)
    : request_id_(std::move(request_id)) {}

bool ResponseAssembler::accept_if_terminal(const json &frame) {
    if (!is_terminal_frame(frame, request_id_)) {
        return false;
    }
    response_ = frame;
    state_ = AssemblerState::complete;
    buffer_.clear();
    return true;
}

bool ResponseAssembler::feed(const std::string &chunk) {
    if (state_ == AssemblerState::complete) {
        return true;
    }
    buffer_ += chunk;

    // Whole buffer first: one document, possibly spread over several lines.
    json whole_document;
    if (json_rpc::try_parse(buffer_, whole_document) && accept_if_terminal(whole_document)) {
        return true;
    }

    // Then every complete line on its own; the last piece may still be growing.
    size_t line_start = 0;
    size_t newline_position = buffer_.find('\n', line_start);
    while (newline_position != std::string::npos) {
        std::string line = trim(buffer_.substr(line_start, newline_position - line_start));
        line_start = newline_position + 1;

        if (!line.empty()) {
            json frame;
            if (json_rpc::try_parse(line, frame) && accept_if_terminal(frame)) {
                return true;
            }
            ++discarded_lines_;
        }
        newline_position = buffer_.find('\n', line_start);
    }

    buffer_.erase(0, line_start);
    return false;
}

json ResponseAssembler::finish() {
    if (state_ == AssemblerState::complete) {
        return response_;
    }

    std::string tail = trim(buffer_);
    buffer_.clear();

    json result;
    if (tail.empty()) {
        result["result"] = nullptr;
        return result;
    }

    json parsed;
    if (json_rpc::try_parse(tail, parsed)) {
        return parsed;
    }

    utf8_sanitize::sanitize(tail);
    result["result"] = tail;
    return result;
}

} // namespace executor
