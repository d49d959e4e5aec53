#include "executor/executor.hpp"
#include "executor/response_assembler.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"
#include "utils/uuid.hpp"

#include <libwebsockets.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace executor {

namespace {

const char PIPE_PROTOCOL_NAME[] = "mcpdispatch-provider-pipe";

constexpr size_t kReadChunkBytes = 65536;
// Reads per readable event, so one chatty provider cannot starve the loop.
constexpr int kMaximumReadsPerEvent = 16;
constexpr size_t kMaximumStderrBytes = 1024 * 1024;
constexpr size_t kMaximumReportedStderrBytes = 8192;
constexpr int kExitPollMilliseconds = 5;
constexpr int kSweepIntervalMilliseconds = 50;
constexpr int kServiceTimeoutMilliseconds = 50;

using Clock = std::chrono::steady_clock;

} // namespace

const char *error_kind_name(ExecuteErrorKind kind) {
    switch (kind) {
    case ExecuteErrorKind::none: return "none";
    case ExecuteErrorKind::validation: return "validation";
    case ExecuteErrorKind::provider_not_found: return "provider_not_found";
    case ExecuteErrorKind::provider_crashed: return "provider_crashed";
    case ExecuteErrorKind::timeout: return "timeout";
    case ExecuteErrorKind::spawn_failed: return "spawn_failed";
    case ExecuteErrorKind::shutdown: return "shutdown";
    }
    return "unknown";
}

bool is_valid_server_path(const std::string &server) {
    return !server.empty() && server.find("..") == std::string::npos;
}

struct Executor::PendingCall {
    ExecuteRequest request;
    EnvironmentMap environment;
    int timeout_milliseconds = kDefaultTimeoutMilliseconds;
    std::promise<ExecuteResult> promise;
};

// lws hands timer callbacks the sul pointer only; it is the first member so
// the slot can be recovered from it.
struct Executor::TimerSlot {
    TimerSlot() { std::memset(&sul, 0, sizeof(sul)); }

    lws_sorted_usec_list_t sul;
    Executor *owner = nullptr;
    Invocation *invocation = nullptr;
};

struct Executor::PipeBinding {
    enum class Kind { standard_input, standard_output, standard_error };

    Invocation *invocation = nullptr;
    Kind kind = Kind::standard_output;
    int descriptor = -1;
    // Once adopted, lws owns the descriptor and closes it with the wsi.
    bool adopted = false;
    bool closed = false;
    struct lws *connection = nullptr;
};

struct Executor::Invocation {
    Invocation(Executor &executor, std::unique_ptr<PendingCall> pending_call, std::string invocation_id)
        : owner(&executor), call(std::move(pending_call)), id(std::move(invocation_id)), assembler(id) {
        stdin_pipe.invocation = this;
        stdin_pipe.kind = PipeBinding::Kind::standard_input;
        stdout_pipe.invocation = this;
        stdout_pipe.kind = PipeBinding::Kind::standard_output;
        stderr_pipe.invocation = this;
        stderr_pipe.kind = PipeBinding::Kind::standard_error;
        timeout_timer.owner = owner;
        timeout_timer.invocation = this;
        exit_poll_timer.owner = owner;
        exit_poll_timer.invocation = this;
    }

    Executor *owner;
    std::unique_ptr<PendingCall> call;
    std::string id;
    ResponseAssembler assembler;

    int process_id = -1;
    bool reaped = false;
    uint64_t spawn_sequence = 0;

    PipeBinding stdin_pipe;
    PipeBinding stdout_pipe;
    PipeBinding stderr_pipe;

    std::string request_line;
    size_t request_offset = 0;
    std::string stderr_text;

    TimerSlot timeout_timer;
    TimerSlot exit_poll_timer;
    bool done = false;
};

struct Executor::RetiringChild {
    int process_id = -1;
    Clock::time_point terminate_at;
    Clock::time_point kill_at;
    bool terminate_sent = false;
    bool kill_sent = false;
};

// Static entry points handed to libwebsockets.
class ExecutorCallbacks {
public:
    static int pipe_callback(struct lws *connection, enum lws_callback_reasons reason,
                             void *user_data, void *incoming_data, size_t incoming_length);
    static void timeout_fired(lws_sorted_usec_list_t *timer);
    static void exit_poll_fired(lws_sorted_usec_list_t *timer);
    static void sweep_fired(lws_sorted_usec_list_t *timer);
};

namespace {

const struct lws_protocols provider_protocols[] = {
    {PIPE_PROTOCOL_NAME, ExecutorCallbacks::pipe_callback, 0, 0},
    {nullptr, nullptr, 0, 0}
};

ExecuteResult make_failure(ExecuteErrorKind kind, const std::string &message) {
    ExecuteResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

} // namespace

int ExecutorCallbacks::pipe_callback(struct lws *connection, enum lws_callback_reasons reason,
                                     void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    (void)incoming_data;
    (void)incoming_length;

    switch (reason) {
    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        auto *executor = static_cast<Executor *>(lws_context_user(lws_get_context(connection)));
        if (executor != nullptr) {
            executor->drain_inbox();
        }
        break;
    }

    case LWS_CALLBACK_RAW_RX_FILE: {
        auto *binding = static_cast<Executor::PipeBinding *>(lws_get_opaque_user_data(connection));
        if (binding == nullptr) {
            return -1;
        }
        return binding->invocation->owner->handle_readable(*binding) ? 0 : -1;
    }

    case LWS_CALLBACK_RAW_WRITEABLE_FILE: {
        auto *binding = static_cast<Executor::PipeBinding *>(lws_get_opaque_user_data(connection));
        if (binding == nullptr) {
            return -1;
        }
        return binding->invocation->owner->handle_writable(*binding) ? 0 : -1;
    }

    case LWS_CALLBACK_RAW_CLOSE_FILE: {
        auto *binding = static_cast<Executor::PipeBinding *>(lws_get_opaque_user_data(connection));
        if (binding != nullptr) {
            lws_set_opaque_user_data(connection, nullptr);
            binding->invocation->owner->handle_pipe_closed(*binding);
        }
        break;
    }

    default:
        break;
    }
    return 0;
}

void ExecutorCallbacks::timeout_fired(lws_sorted_usec_list_t *timer) {
    auto *slot = reinterpret_cast<Executor::TimerSlot *>(timer);
    slot->owner->handle_timeout(*slot->invocation);
}

void ExecutorCallbacks::exit_poll_fired(lws_sorted_usec_list_t *timer) {
    auto *slot = reinterpret_cast<Executor::TimerSlot *>(timer);
    slot->owner->check_exit(*slot->invocation);
}

void ExecutorCallbacks::sweep_fired(lws_sorted_usec_list_t *timer) {
    auto *slot = reinterpret_cast<Executor::TimerSlot *>(timer);
    slot->owner->sweep_retiring_children();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Executor::Executor(const ExecutorOptions &options)
    : options_(options), sweep_timer_(std::make_unique<TimerSlot>()) {
    if (options_.max_concurrent_processes < 1) {
        options_.max_concurrent_processes = 1;
    }
    sweep_timer_->owner = this;

    std::promise<bool> ready;
    std::future<bool> ready_future = ready.get_future();
    loop_thread_ = std::thread(&Executor::run_event_loop, this, std::move(ready));
    bool started = ready_future.get();

    std::lock_guard<std::mutex> lock(inbox_mutex_);
    accepting_calls_ = started && !shutdown_requested_;
    if (!started) {
        debug_log::notice("Executor event loop failed to start; provider calls will fail.");
    }
}

Executor::~Executor() {
    destroy();
}

void Executor::run_event_loop(std::promise<bool> ready) {
    // A provider that exits before reading its request must not take us down.
    std::signal(SIGPIPE, SIG_IGN);
    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN;
    context_info.protocols = provider_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        debug_log::log("Executor: lws_create_context failed");
        ready.set_value(false);
        return;
    }

    lws_vhost *vhost = lws_get_vhost_by_name(context, "default");
    if (vhost == nullptr) {
        debug_log::log("Executor: no default vhost");
        lws_context_destroy(context);
        ready.set_value(false);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        context_ = context;
        vhost_ = vhost;
    }
    ready.set_value(true);

    while (!loop_stopped_) {
        if (lws_service(context, kServiceTimeoutMilliseconds) < 0) {
            debug_log::notice("Executor event loop stopped on a service error.");
            break;
        }
    }
    if (!loop_stopped_) {
        perform_shutdown();
    }

    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        context_ = nullptr;
        vhost_ = nullptr;
        accepting_calls_ = false;
    }
    lws_context_destroy(context);
    debug_log::log("Executor event loop exited");
}

void Executor::destroy() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        shutdown_requested_ = true;
        accepting_calls_ = false;
        if (context_ != nullptr) {
            lws_cancel_service(context_);
        }
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

std::future<ExecuteResult> Executor::execute_async(const ExecuteRequest &request,
                                                   const EnvironmentMap &environment,
                                                   int timeout_milliseconds) {
    auto call = std::make_unique<PendingCall>();
    call->request = request;
    call->environment = environment;
    call->timeout_milliseconds = timeout_milliseconds > 0 ? timeout_milliseconds : kDefaultTimeoutMilliseconds;
    std::future<ExecuteResult> future = call->promise.get_future();

    if (!is_valid_server_path(request.server)) {
        call->promise.set_value(make_failure(ExecuteErrorKind::validation,
                                             "Invalid server path: " + request.server));
        return future;
    }

    std::lock_guard<std::mutex> lock(inbox_mutex_);
    if (!accepting_calls_ || context_ == nullptr) {
        call->promise.set_value(make_failure(ExecuteErrorKind::shutdown, "Executor is not running"));
        return future;
    }
    inbox_.push_back(std::move(call));
    lws_cancel_service(context_);
    return future;
}

ExecuteResult Executor::execute(const ExecuteRequest &request, const EnvironmentMap &environment,
                                int timeout_milliseconds) {
    return execute_async(request, environment, timeout_milliseconds).get();
}

void Executor::drain_inbox() {
    std::vector<std::unique_ptr<PendingCall>> arrived;
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        arrived.swap(inbox_);
        stopping = shutdown_requested_;
    }
    for (auto &call : arrived) {
        wait_queue_.push_back(std::move(call));
    }
    if (stopping) {
        perform_shutdown();
        return;
    }
    pump_wait_queue();
}

void Executor::pump_wait_queue() {
    if (pumping_ || loop_stopped_) {
        return;
    }
    pumping_ = true;
    while (!wait_queue_.empty() && active_.size() < options_.max_concurrent_processes) {
        std::unique_ptr<PendingCall> call = std::move(wait_queue_.front());
        wait_queue_.pop_front();
        start_invocation(std::move(call));
    }
    pumping_ = false;
    update_counters();
}

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

void Executor::start_invocation(std::unique_ptr<PendingCall> call) {
    const std::string server = call->request.server;

    if (server.find('/') != std::string::npos) {
        std::error_code error;
        if (!std::filesystem::exists(server, error)) {
            call->promise.set_value(make_failure(ExecuteErrorKind::provider_not_found,
                                                 "MCP server not found: " + server));
            return;
        }
    }

    std::vector<std::string> argv;
    if (!options_.launcher.empty()) {
        argv.push_back(options_.launcher);
    }
    argv.push_back(server);

    auto owned = std::make_unique<Invocation>(*this, std::move(call), uuid::generate());
    Invocation &invocation = *owned;
    const ExecuteRequest &request = invocation.call->request;

    platform::SpawnResult spawn = platform::spawn_piped_process(argv, invocation.call->environment);
    if (!spawn.success) {
        ExecuteResult result;
        if (spawn.error_number == ENOENT) {
            result = make_failure(ExecuteErrorKind::provider_not_found, "MCP server not found: " + server);
        } else {
            result = make_failure(ExecuteErrorKind::spawn_failed,
                                  "Failed to start MCP server " + server + ": " + spawn.error_message);
        }
        result.invocation_id = invocation.id;
        invocation.call->promise.set_value(std::move(result));
        return;
    }

    invocation.process_id = spawn.process_id;
    invocation.spawn_sequence = next_spawn_sequence_++;
    invocation.stdin_pipe.descriptor = spawn.stdin_descriptor;
    invocation.stdout_pipe.descriptor = spawn.stdout_descriptor;
    invocation.stderr_pipe.descriptor = spawn.stderr_descriptor;
    invocation.request_line =
        json_rpc::build_provider_request(invocation.id, request.method, request.tool, request.params)
            .dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    active_[invocation.id] = std::move(owned);
    spawned_count_++;
    update_counters();
    debug_log::log("Spawned " + server + " pid=" + std::to_string(invocation.process_id) +
                   " id=" + invocation.id + " seq=" + std::to_string(invocation.spawn_sequence));

    schedule_timer(&invocation.timeout_timer.sul, ExecutorCallbacks::timeout_fired,
                   invocation.call->timeout_milliseconds);

    if (!adopt_pipe(invocation, invocation.stdout_pipe) ||
        !adopt_pipe(invocation, invocation.stderr_pipe) ||
        !adopt_pipe(invocation, invocation.stdin_pipe)) {
        complete(invocation, make_failure(ExecuteErrorKind::spawn_failed,
                                          "Failed to watch pipes of MCP server " + server));
        return;
    }
    lws_callback_on_writable(invocation.stdin_pipe.connection);
}

bool Executor::adopt_pipe(Invocation &invocation, PipeBinding &binding) {
    lws_sock_file_fd_type descriptor;
    descriptor.filefd = binding.descriptor;

    struct lws *connection = lws_adopt_descriptor_vhost(vhost_, LWS_ADOPT_RAW_FILE_DESC, descriptor,
                                                        PIPE_PROTOCOL_NAME, nullptr);
    // lws closes the descriptor itself when adoption fails.
    binding.adopted = true;
    if (connection == nullptr) {
        debug_log::log("Executor: failed to adopt pipe of " + invocation.id);
        binding.closed = true;
        return false;
    }
    binding.connection = connection;
    lws_set_opaque_user_data(connection, &binding);
    return true;
}

// ---------------------------------------------------------------------------
// Pipe events
// ---------------------------------------------------------------------------

bool Executor::handle_readable(PipeBinding &binding) {
    // POLLIN/POLLHUP on the write end of stdin: the provider closed its side.
    if (binding.kind == PipeBinding::Kind::standard_input) {
        return false;
    }

    Invocation &invocation = *binding.invocation;
    char buffer[kReadChunkBytes];
    for (int reads = 0; reads < kMaximumReadsPerEvent; ++reads) {
        ssize_t bytes_read = read(binding.descriptor, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            std::string chunk(buffer, static_cast<size_t>(bytes_read));
            if (binding.kind == PipeBinding::Kind::standard_output) {
                if (invocation.assembler.feed(chunk)) {
                    ExecuteResult result;
                    result.success = true;
                    result.response = invocation.assembler.response();
                    complete(invocation, std::move(result));
                    // The binding went away with the invocation.
                    return false;
                }
            } else if (invocation.stderr_text.size() < kMaximumStderrBytes) {
                invocation.stderr_text.append(chunk);
            }
            continue;
        }
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        // EOF or a read error.
        return false;
    }
    return true;
}

bool Executor::handle_writable(PipeBinding &binding) {
    Invocation &invocation = *binding.invocation;
    while (invocation.request_offset < invocation.request_line.size()) {
        ssize_t written = write(binding.descriptor,
                                invocation.request_line.data() + invocation.request_offset,
                                invocation.request_line.size() - invocation.request_offset);
        if (written > 0) {
            invocation.request_offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            lws_callback_on_writable(binding.connection);
            return true;
        }
        // EPIPE: the provider is not reading. Its exit status decides the outcome.
        debug_log::log("Executor: request write failed for " + invocation.id + ": " + std::strerror(errno));
        return false;
    }
    return true;
}

void Executor::handle_pipe_closed(PipeBinding &binding) {
    binding.connection = nullptr;
    binding.closed = true;
    if (binding.kind == PipeBinding::Kind::standard_input) {
        return;
    }
    Invocation &invocation = *binding.invocation;
    if (invocation.stdout_pipe.closed && invocation.stderr_pipe.closed) {
        check_exit(invocation);
    }
}

void Executor::check_exit(Invocation &invocation) {
    if (invocation.done) {
        return;
    }
    int exit_code = 0;
    if (!platform::try_reap_process(invocation.process_id, exit_code)) {
        schedule_timer(&invocation.exit_poll_timer.sul, ExecutorCallbacks::exit_poll_fired,
                       kExitPollMilliseconds);
        return;
    }
    invocation.reaped = true;

    ExecuteResult result;
    result.exit_code = exit_code;
    if (exit_code != 0) {
        const std::string &server = invocation.call->request.server;
        result.error_kind = ExecuteErrorKind::provider_crashed;
        result.stderr_text = utf8_sanitize::sanitize(
            utf8_sanitize::truncate(invocation.stderr_text, kMaximumReportedStderrBytes));
        result.error_message = "MCP server crashed: " + server + ". Error: " + result.stderr_text;
    } else {
        result.success = true;
        result.response = invocation.assembler.finish();
    }
    complete(invocation, std::move(result));
}

void Executor::handle_timeout(Invocation &invocation) {
    debug_log::log("Executor: " + invocation.id + " timed out after " +
                   std::to_string(invocation.call->timeout_milliseconds) + "ms");
    complete(invocation, make_failure(ExecuteErrorKind::timeout,
                                      "MCP server timeout: " + invocation.call->request.server));
}

// ---------------------------------------------------------------------------
// Completion and cleanup
// ---------------------------------------------------------------------------

void Executor::complete(Invocation &invocation, ExecuteResult result) {
    if (invocation.done) {
        return;
    }
    invocation.done = true;

    cancel_timer(&invocation.timeout_timer.sul);
    cancel_timer(&invocation.exit_poll_timer.sul);
    detach_pipes(invocation);

    result.invocation_id = invocation.id;
    result.spawn_sequence = invocation.spawn_sequence;
    int unreaped_process = invocation.reaped ? -1 : invocation.process_id;
    bool succeeded = result.success;

    debug_log::log("Executor: " + invocation.id + " finished: " +
                   (succeeded ? std::string("ok") : std::string(error_kind_name(result.error_kind))));

    // Keeps the invocation alive until this function returns.
    std::unique_ptr<Invocation> owned;
    auto found = active_.find(invocation.id);
    if (found != active_.end()) {
        owned = std::move(found->second);
        active_.erase(found);
    }
    invocation.call->promise.set_value(std::move(result));

    if (unreaped_process > 0) {
        retire_child(unreaped_process, succeeded ? options_.linger_milliseconds : 0);
    }
    update_counters();
    pump_wait_queue();
}

void Executor::detach_pipes(Invocation &invocation) {
    for (PipeBinding *binding : {&invocation.stdin_pipe, &invocation.stdout_pipe, &invocation.stderr_pipe}) {
        if (binding->connection != nullptr) {
            lws_set_opaque_user_data(binding->connection, nullptr);
            lws_set_timeout(binding->connection, PENDING_TIMEOUT_USER_OK, LWS_TO_KILL_ASYNC);
            binding->connection = nullptr;
        } else if (!binding->adopted) {
            platform::close_descriptor(binding->descriptor);
        }
        binding->closed = true;
    }
}

void Executor::retire_child(int process_id, int terminate_after_milliseconds) {
    auto child = std::make_unique<RetiringChild>();
    Clock::time_point now = Clock::now();
    child->process_id = process_id;
    child->terminate_at = now + std::chrono::milliseconds(std::max(terminate_after_milliseconds, 0));
    child->kill_at = child->terminate_at + std::chrono::milliseconds(options_.kill_grace_milliseconds);
    if (terminate_after_milliseconds <= 0) {
        platform::signal_process(process_id, SIGTERM);
        child->terminate_sent = true;
    }
    retiring_.push_back(std::move(child));

    if (!sweep_scheduled_ && !loop_stopped_) {
        sweep_scheduled_ = true;
        schedule_timer(&sweep_timer_->sul, ExecutorCallbacks::sweep_fired, kSweepIntervalMilliseconds);
    }
}

void Executor::sweep_retiring_children() {
    sweep_scheduled_ = false;
    Clock::time_point now = Clock::now();

    for (auto child_iterator = retiring_.begin(); child_iterator != retiring_.end();) {
        RetiringChild &child = **child_iterator;
        int exit_code = 0;
        if (platform::try_reap_process(child.process_id, exit_code)) {
            debug_log::log("Executor: reaped pid " + std::to_string(child.process_id) +
                           " exit=" + std::to_string(exit_code));
            child_iterator = retiring_.erase(child_iterator);
            continue;
        }
        if (!child.terminate_sent && now >= child.terminate_at) {
            platform::signal_process(child.process_id, SIGTERM);
            child.terminate_sent = true;
        } else if (child.terminate_sent && !child.kill_sent && now >= child.kill_at) {
            platform::signal_process(child.process_id, SIGKILL);
            child.kill_sent = true;
        }
        ++child_iterator;
    }

    if (!retiring_.empty() && !loop_stopped_) {
        sweep_scheduled_ = true;
        schedule_timer(&sweep_timer_->sul, ExecutorCallbacks::sweep_fired, kSweepIntervalMilliseconds);
    }
}

void Executor::schedule_timer(lws_sorted_usec_list *timer, void (*callback)(lws_sorted_usec_list *),
                              int delay_milliseconds) {
    lws_usec_t delay = static_cast<lws_usec_t>(std::max(delay_milliseconds, 0)) * LWS_US_PER_MS;
    lws_sul_schedule(context_, 0, timer, callback, delay);
}

void Executor::cancel_timer(lws_sorted_usec_list *timer) {
    lws_sul_cancel(timer);
}

void Executor::perform_shutdown() {
    loop_stopped_ = true;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        accepting_calls_ = false;
        for (auto &call : inbox_) {
            wait_queue_.push_back(std::move(call));
        }
        inbox_.clear();
    }

    while (!wait_queue_.empty()) {
        std::unique_ptr<PendingCall> call = std::move(wait_queue_.front());
        wait_queue_.pop_front();
        call->promise.set_value(make_failure(ExecuteErrorKind::shutdown,
                                             "Executor shut down before the call started"));
    }

    std::vector<Invocation *> in_flight;
    for (auto &entry : active_) {
        in_flight.push_back(entry.second.get());
    }
    for (Invocation *invocation : in_flight) {
        platform::signal_process(invocation->process_id, SIGKILL);
        complete(*invocation, make_failure(ExecuteErrorKind::shutdown,
                                           "Executor shut down during the call to " +
                                               invocation->call->request.server));
    }

    for (auto &child : retiring_) {
        platform::signal_process(child->process_id, SIGKILL);
        platform::reap_process(child->process_id);
    }
    retiring_.clear();
    cancel_timer(&sweep_timer_->sul);
    sweep_scheduled_ = false;
    update_counters();
    debug_log::log("Executor shut down");
}

void Executor::update_counters() {
    active_count_ = active_.size();
    queued_count_ = wait_queue_.size();
}

} // namespace executor
