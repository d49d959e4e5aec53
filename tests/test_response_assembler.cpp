// Tests for the incremental assembly of provider responses from stdout chunks.

#include "executor/response_assembler.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;
using executor::ResponseAssembler;
using test_support::check;

namespace test_response_assembler {

static const std::string REQUEST_ID = "7f1c2d6e-0000-4000-8000-000000000001";

// Test: a single document split across chunks is assembled once complete.
static bool test_document_split_across_chunks() {
    ResponseAssembler assembler(REQUEST_ID);
    bool first = assembler.feed("{\"jsonrpc\":\"2.0\",\"id\":\"" + REQUEST_ID + "\",\"res");
    bool second = assembler.feed("ult\":{\"value\":42}}");
    return check(!first && second && assembler.response()["result"]["value"] == 42,
                 "document split across chunks assembles on the last chunk");
}

// Test: notifications before the answer are discarded, not taken as terminal.
static bool test_notification_then_response() {
    ResponseAssembler assembler(REQUEST_ID);
    bool done = assembler.feed(
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"result\":1}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"" + REQUEST_ID + "\",\"result\":{\"ok\":true}}\n");
    return check(done && assembler.response()["result"]["ok"] == true && assembler.discarded_line_count() == 1,
                 "notification line is discarded and the matching id line is terminal");
}

// Test: a notification that itself carries an id-less "result" member is still not terminal.
static bool test_notification_is_never_terminal() {
    json notification = {{"jsonrpc", "2.0"}, {"method", "progress"}, {"result", 3}};
    json answer = {{"jsonrpc", "2.0"}, {"id", "other"}, {"result", 3}};
    json matching_notification = {{"id", REQUEST_ID}, {"method", "x"}};
    bool success = !executor::is_terminal_frame(notification, REQUEST_ID) &&
                   executor::is_terminal_frame(answer, REQUEST_ID) &&
                   executor::is_terminal_frame(matching_notification, REQUEST_ID) &&
                   !executor::is_terminal_frame(json::array(), REQUEST_ID);
    return check(success, "terminal frame rule: matching id, or result/error without method");
}

// Test: log noise lines are dropped and the partial tail is kept.
static bool test_noise_and_partial_tail() {
    ResponseAssembler assembler(REQUEST_ID);
    bool done = assembler.feed("starting up...\n{\"partial\":");
    bool success = !done && assembler.discarded_line_count() == 1 && assembler.pending_text() == "{\"partial\":";
    done = assembler.feed("true}\n{\"error\":{\"code\":-1,\"message\":\"boom\"}}\n");
    success = success && done && assembler.response()["error"]["message"] == "boom";
    return check(success, "noise is dropped, partial tail kept, error frame is terminal");
}

// Test: an error-carrying line with CRLF endings is accepted.
static bool test_crlf_lines() {
    ResponseAssembler assembler(REQUEST_ID);
    bool done = assembler.feed("{\"result\":\"done\"}\r\n");
    return check(done && assembler.response()["result"] == "done", "CRLF-terminated frame is parsed");
}

// Test: finish() after a clean exit with unparseable leftovers wraps the raw text.
static bool test_finish_raw_text() {
    ResponseAssembler assembler(REQUEST_ID);
    assembler.feed("plain output without newline");
    json response = assembler.finish();
    return check(response["result"] == "plain output without newline", "raw leftover text becomes {result: text}");
}

// Test: finish() with nothing buffered yields a null result.
static bool test_finish_empty() {
    ResponseAssembler assembler(REQUEST_ID);
    json response = assembler.finish();
    return check(response.contains("result") && response["result"].is_null(), "empty output becomes {result: null}");
}

// Test: finish() accepts a parseable leftover document as-is, even if not terminal.
static bool test_finish_parses_leftover() {
    ResponseAssembler assembler(REQUEST_ID);
    assembler.feed("{\"value\": [1, 2]}");
    json response = assembler.finish();
    return check(response["value"] == json::array({1, 2}), "parseable leftover is returned as-is");
}

// Test: chunks after completion are ignored.
static bool test_ignores_after_complete() {
    ResponseAssembler assembler(REQUEST_ID);
    assembler.feed("{\"result\":1}\n");
    assembler.feed("{\"result\":2}\n");
    return check(assembler.is_complete() && assembler.response()["result"] == 1,
                 "first terminal frame wins, later chunks are ignored");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_document_split_across_chunks();
    all_passed &= test_notification_then_response();
    all_passed &= test_notification_is_never_terminal();
    all_passed &= test_noise_and_partial_tail();
    all_passed &= test_crlf_lines();
    all_passed &= test_finish_raw_text();
    all_passed &= test_finish_empty();
    all_passed &= test_finish_parses_leftover();
    all_passed &= test_ignores_after_complete();
    return all_passed;
}

} // namespace test_response_assembler
