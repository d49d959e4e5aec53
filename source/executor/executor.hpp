#ifndef MCPDISPATCH_EXECUTOR_HPP
#define MCPDISPATCH_EXECUTOR_HPP

// Provider executor.
// Spawns one provider process per call, writes the request line, assembles
// the response from its stdout, and enforces a concurrency ceiling (FIFO
// wait queue) and a per-call timeout (SIGTERM, then SIGKILL after a grace
// period).
//
// All process bookkeeping lives on one event-loop thread driven by
// libwebsockets: provider pipes are adopted as raw file descriptors and
// timers are lws_sul entries. Callers on any thread hand requests in through
// a mutex-guarded inbox and get a future back.

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct lws_context;
struct lws_vhost;
struct lws_sorted_usec_list;

namespace executor {

using json = nlohmann::json;
using EnvironmentMap = std::map<std::string, std::string>;

constexpr int kDefaultTimeoutMilliseconds = 30000;
constexpr size_t kDefaultMaxConcurrentProcesses = 100;
constexpr int kKillGraceMilliseconds = 1000;
constexpr int kLingerMilliseconds = 5000;

// What to run and what to ask it.
struct ExecuteRequest {
    std::string server;               // provider entry point (path or PATH-resolvable command)
    std::string tool;                 // tool name for tools/call
    json params = json::object();     // tool arguments
    std::string method = "tools/call";
};

enum class ExecuteErrorKind {
    none,
    validation,         // rejected before anything was spawned
    provider_not_found, // the executable does not exist
    provider_crashed,   // non-zero exit, stderr_text holds the diagnostics
    timeout,
    spawn_failed,       // any other spawn-time or pipe error
    shutdown            // the executor was destroyed before the call finished
};

const char *error_kind_name(ExecuteErrorKind kind);

struct ExecuteResult {
    bool success = false;
    json response;                  // terminal response from the provider
    ExecuteErrorKind error_kind = ExecuteErrorKind::none;
    std::string error_message;
    std::string stderr_text;        // sanitized, set for provider_crashed
    int exit_code = 0;
    std::string invocation_id;      // also the JSON-RPC id sent to the provider
    uint64_t spawn_sequence = 0;    // 1-based spawn order, 0 when never spawned
};

struct ExecutorOptions {
    size_t max_concurrent_processes = kDefaultMaxConcurrentProcesses;
    // Interpreter placed before the entry point ("node" for npm packaged
    // providers). Empty runs the entry point directly.
    std::string launcher;
    int kill_grace_milliseconds = kKillGraceMilliseconds;
    // How long a child may keep running after it answered before it is
    // terminated.
    int linger_milliseconds = kLingerMilliseconds;
};

// Rejects identifiers containing a parent-directory traversal.
bool is_valid_server_path(const std::string &server);

class Executor {
public:
    explicit Executor(const ExecutorOptions &options = ExecutorOptions());
    ~Executor();

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;

    // Queue a call. Validation failures resolve immediately without spawning.
    std::future<ExecuteResult> execute_async(const ExecuteRequest &request,
                                             const EnvironmentMap &environment = EnvironmentMap(),
                                             int timeout_milliseconds = kDefaultTimeoutMilliseconds);

    // Blocking form of execute_async.
    ExecuteResult execute(const ExecuteRequest &request,
                          const EnvironmentMap &environment = EnvironmentMap(),
                          int timeout_milliseconds = kDefaultTimeoutMilliseconds);

    // Kill every child, fail every in-flight and queued call with
    // ExecuteErrorKind::shutdown, and stop the event loop. Idempotent.
    void destroy();

    size_t active_count() const { return active_count_.load(); }
    size_t queued_count() const { return queued_count_.load(); }
    uint64_t spawned_count() const { return spawned_count_.load(); }
    const ExecutorOptions &options() const { return options_; }

private:
    friend class ExecutorCallbacks;

    struct PendingCall;
    struct Invocation;
    struct PipeBinding;
    struct RetiringChild;
    struct TimerSlot;

    void run_event_loop(std::promise<bool> ready);
    void drain_inbox();
    void pump_wait_queue();
    void start_invocation(std::unique_ptr<PendingCall> call);
    bool adopt_pipe(Invocation &invocation, PipeBinding &binding);

    bool handle_readable(PipeBinding &binding);
    bool handle_writable(PipeBinding &binding);
    void handle_pipe_closed(PipeBinding &binding);
    void check_exit(Invocation &invocation);
    void handle_timeout(Invocation &invocation);

    void complete(Invocation &invocation, ExecuteResult result);
    void detach_pipes(Invocation &invocation);
    void retire_child(int process_id, int terminate_after_milliseconds);
    void sweep_retiring_children();
    void schedule_timer(lws_sorted_usec_list *timer, void (*callback)(lws_sorted_usec_list *),
                        int delay_milliseconds);
    void cancel_timer(lws_sorted_usec_list *timer);
    void perform_shutdown();
    void update_counters();

    ExecutorOptions options_;

    // Owned by the loop thread; read elsewhere only under inbox_mutex_.
    lws_context *context_ = nullptr;
    lws_vhost *vhost_ = nullptr;
    std::thread loop_thread_;
    bool loop_stopped_ = false;

    mutable std::mutex inbox_mutex_;
    std::vector<std::unique_ptr<PendingCall>> inbox_;
    bool accepting_calls_ = false;
    bool shutdown_requested_ = false;

    // Loop-thread state.
    std::deque<std::unique_ptr<PendingCall>> wait_queue_;
    std::map<std::string, std::unique_ptr<Invocation>> active_;
    std::vector<std::unique_ptr<RetiringChild>> retiring_;
    std::unique_ptr<TimerSlot> sweep_timer_;
    bool sweep_scheduled_ = false;
    bool pumping_ = false;
    uint64_t next_spawn_sequence_ = 1;

    std::atomic<size_t> active_count_{0};
    std::atomic<size_t> queued_count_{0};
    std::atomic<uint64_t> spawned_count_{0};
};

} // namespace executor

#endif // MCPDISPATCH_EXECUTOR_HPP
