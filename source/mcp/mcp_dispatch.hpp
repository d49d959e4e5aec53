#ifndef MCPDISPATCH_MCP_DISPATCH_HPP
#define MCPDISPATCH_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

constexpr const char *PROTOCOL_VERSION = "2024-11-05";
constexpr const char *SERVER_NAME = "mcpdispatch";
constexpr const char *SERVER_VERSION = "1.0.0";

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message);

// Parse then dispatch. Unparseable text yields a -32700 error response.
json dispatch_raw_message(const std::string &raw_message);

// Answers incoming messages through a writer. tools/call requests run on
// their own task so a slow provider does not hold up ping or tools/list;
// everything else is answered inline. Writes are serialized, and responses
// to concurrent calls may arrive in any order.
class RequestScheduler {
public:
    using ResponseWriter = std::function<void(const json &response)>;

    explicit RequestScheduler(ResponseWriter writer);
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler &) = delete;
    RequestScheduler &operator=(const RequestScheduler &) = delete;

    void submit(const std::string &raw_message);

    // Block until every submitted tools/call has been answered.
    void wait_idle();

    size_t in_flight() const;

private:
    void write(const json &response);
    void reap_finished();

    ResponseWriter writer_;
    std::mutex writer_mutex_;

    mutable std::mutex calls_mutex_;
    std::list<std::future<void>> calls_;
};

} // namespace mcp_dispatch

#endif // MCPDISPATCH_MCP_DISPATCH_HPP
