#include "mcp/mcp_stdio.hpp"
#include "utils/debug_log.hpp"

namespace mcp_stdio {

namespace {

// A client bug must not make us buffer without bound.
constexpr size_t kMaximumMessageBytes = 16 * 1024 * 1024;

// Tracks where one top-level JSON object ends.
class FrameScanner {
public:
    // Feed one character of an object that has already started. Returns true
    // when it closes the outermost brace.
    bool closes_frame(char character) {
        if (escaped_) {
            escaped_ = false;
            return false;
        }
        if (in_string_) {
            if (character == '\\') {
                escaped_ = true;
            } else if (character == '"') {
                in_string_ = false;
            }
            return false;
        }
        switch (character) {
        case '"':
            in_string_ = true;
            break;
        case '{':
            ++depth_;
            break;
        case '}':
            return --depth_ == 0;
        default:
            break;
        }
        return false;
    }

    void reset() {
        depth_ = 1;
        in_string_ = false;
        escaped_ = false;
    }

private:
    int depth_ = 1;
    bool in_string_ = false;
    bool escaped_ = false;
};

} // namespace

std::string read_message(std::istream &input) {
    std::string frame;
    FrameScanner scanner;
    bool inside_frame = false;
    bool discarding = false;

    char character;
    while (input.get(character)) {
        if (!inside_frame) {
            // Whitespace and stray bytes between messages are skipped.
            if (character == '{') {
                inside_frame = true;
                scanner.reset();
                frame.assign(1, character);
            }
            continue;
        }

        if (!discarding) {
            frame.push_back(character);
            if (frame.size() > kMaximumMessageBytes) {
                debug_log::notice("Incoming message exceeds " + std::to_string(kMaximumMessageBytes) +
                                  " bytes, dropped.");
                discarding = true;
                frame.clear();
            }
        }

        if (scanner.closes_frame(character)) {
            if (!discarding) {
                return frame;
            }
            inside_frame = false;
            discarding = false;
        }
    }

    // EOF in the middle of a message drops the partial text.
    return "";
}

void write_message(const std::string &json_string, std::ostream &output) {
    output << json_string << '\n' << std::flush;
}

void log_message(const std::string &message) {
    debug_log::notice(message);
}

} // namespace mcp_stdio
