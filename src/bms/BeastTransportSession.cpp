//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/bms/BeastTransportSession.cpp
// Purpose: HTTP/HTTPS transport session using Boost.Beast coroutines
//==========================================================================================================

//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "bms/BeastTransportSession.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace bms {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace detail {

struct TaskOutcome {
    std::optional<HttpResponse> response;
    std::optional<errors::SessionError> error;
};

//==========================================================================================================
// SessionState
// Purpose: Parts of the session shared with its tasks. Tasks hold it weakly.
//==========================================================================================================
struct SessionState {
    SessionConfiguration config;
    std::shared_ptr<ISessionDelegate> delegate;
    net::io_context ioc;
    std::shared_ptr<ssl::context> sslCtx;
    std::optional<std::string> tlsInitError;
    std::atomic<bool> valid{true};
};

class BeastSessionTask final : public ISessionTask, public std::enable_shared_from_this<BeastSessionTask> {
public:
    BeastSessionTask(std::weak_ptr<SessionState> session,
                     std::uint64_t identifier,
                     HttpRequest request,
                     RequestBody uploadBody,
                     CompletionHandler handler,
                     std::shared_ptr<ISessionDelegate> delegate)
        : session(std::move(session)),
          identifier(identifier),
          request(std::move(request)),
          upload(std::move(uploadBody)),
          handler(std::move(handler)),
          delegate(std::move(delegate)) {}

    void resume() override;
    void cancel() override;
    TaskState state() const override { return taskState.load(); }
    std::uint64_t taskIdentifier() const override { return identifier; }
    const HttpRequest& originalRequest() const override { return request; }

    const RequestBody& uploadBody() const { return upload; }
    bool cancelRequested() const { return cancelled.load(); }

    // Stream currently carrying the exchange; touched only on the I/O thread
    void attachStream(beast::tcp_stream* stream) { activeStream = stream; }

    void notifyBodySent(std::uint64_t bytes);
    void finish(TaskOutcome outcome);

private:
    std::weak_ptr<SessionState> session;
    std::uint64_t identifier;
    HttpRequest request;
    RequestBody upload;
    CompletionHandler handler;
    std::shared_ptr<ISessionDelegate> delegate;

    std::atomic<TaskState> taskState{TaskState::Suspended};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> finished{false};
    beast::tcp_stream* activeStream{nullptr};
};

// Binds a stream to a task for the lifetime of one exchange so cancel() can abort it
class StreamAttachment {
public:
    StreamAttachment(BeastSessionTask& task, beast::tcp_stream& stream) : task(task) { task.attachStream(&stream); }
    ~StreamAttachment() { task.attachStream(nullptr); }
    StreamAttachment(const StreamAttachment&) = delete;
    StreamAttachment& operator=(const StreamAttachment&) = delete;

private:
    BeastSessionTask& task;
};

static void throwIfCancelled(const BeastSessionTask& task) {
    if (task.cancelRequested()) {
        throw boost::system::system_error(net::error::operation_aborted);
    }
}

// Upload body wins over the request body
static std::optional<errors::SessionError> loadPayload(const HttpRequest& request,
                                                       const RequestBody& upload,
                                                       std::string& out) {
    out.clear();
    const RequestBody& source = std::holds_alternative<std::monostate>(upload) ? request.body : upload;
    if (const auto* bytes = std::get_if<std::string>(&source)) {
        out = *bytes;
        return std::nullopt;
    }
    if (const auto* file = std::get_if<std::filesystem::path>(&source)) {
        std::ifstream in(*file, std::ios::binary);
        if (!in) {
            return errors::makeError(errors::ErrorCategory::InvalidRequest,
                                     "cannot open upload file " + file->string());
        }
        std::ostringstream oss;
        oss << in.rdbuf();
        out = oss.str();
    }
    return std::nullopt;
}

static HttpResponse toHttpResponse(const http::response<http::string_body>& res) {
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        out.headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    out.body = res.body();
    return out;
}

template <class Stream>
static net::awaitable<HttpResponse> coExchange(Stream& stream,
                                               beast::tcp_stream& lowest,
                                               http::request<http::string_body>& req,
                                               const SessionConfiguration& config,
                                               BeastSessionTask& task) {
    lowest.expires_after(std::chrono::milliseconds(config.readTimeoutMs));
    co_await http::async_write(stream, req, net::use_awaitable);
    if (!req.body().empty()) {
        task.notifyBodySent(req.body().size());
    }
    throwIfCancelled(task);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(config.maxResponseBodyBytes);
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }
    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
    const auto declared = parser.content_length();
    if (declared && *declared > config.maxResponseBodyBytes) {
        throw boost::system::system_error(http::error::body_limit, "response Content-Length " +
                                          std::to_string(*declared) + " exceeds limit");
    }
    if (!parser.is_done()) {
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    }
    if (parser.get().body().size() > config.maxResponseBodyBytes) {
        throw boost::system::system_error(http::error::body_limit, "response body exceeds limit");
    }
    co_return toHttpResponse(parser.get());
}

// Coroutine: execute one task end to end and report its outcome
static net::awaitable<TaskOutcome> coExecute(SessionConfiguration config,
                                             std::shared_ptr<ssl::context> sslCtx,
                                             std::optional<std::string> tlsInitError,
                                             std::shared_ptr<BeastSessionTask> task) {
    TaskOutcome outcome;
    const HttpRequest& request = task->originalRequest();

    const auto url = parseUrl(request.url);
    if (!url) {
        outcome.error = errors::makeError(errors::ErrorCategory::InvalidRequest,
                                          "unsupported or malformed URL: " + request.url);
        co_return outcome;
    }
    const http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        outcome.error = errors::makeError(errors::ErrorCategory::InvalidRequest,
                                          "unsupported HTTP method: " + request.method);
        co_return outcome;
    }
    std::string payload;
    if (auto loadError = loadPayload(request, task->uploadBody(), payload)) {
        outcome.error = std::move(loadError);
        co_return outcome;
    }
    if (url->scheme == "https" && tlsInitError) {
        outcome.error = errors::makeError(errors::ErrorCategory::Tls, *tlsInitError);
        co_return outcome;
    }

    http::request<http::string_body> req{verb, url->target, 11};
    req.set(http::field::host, url->hostHeader());
    if (!config.userAgent.empty()) {
        req.set(http::field::user_agent, config.userAgent);
    }
    for (const auto& h : request.headers.entries()) {
        req.set(h.name, h.value);
    }
    req.set(http::field::connection, "close");
    req.body() = std::move(payload);
    req.prepare_payload();

    std::optional<errors::SessionError> failure;
    try {
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        throwIfCancelled(*task);
        auto results = co_await resolver.async_resolve(url->host, url->port, net::use_awaitable);
        throwIfCancelled(*task);
        LOG_DEBUG("Task {}: resolved {}:{}", task->taskIdentifier(), url->host, url->port);

        if (url->scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            StreamAttachment attachment(*task, stream.next_layer());
            const std::string sni = config.serverName.empty() ? url->host : config.serverName;
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "SNI");
            }
            if (config.verifyPeer && ::SSL_set1_host(stream.native_handle(), sni.c_str()) != 1) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "hostname verification setup");
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(config.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            LOG_DEBUG("Task {}: TLS handshake complete with {}", task->taskIdentifier(), sni);

            outcome.response = co_await coExchange(stream, stream.next_layer(), req, config, *task);
            boost::system::error_code ec;
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            beast::tcp_stream stream(executor);
            StreamAttachment attachment(*task, stream);
            stream.expires_after(std::chrono::milliseconds(config.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            outcome.response = co_await coExchange(stream, stream, req, config, *task);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    } catch (const boost::system::system_error& e) {
        failure = errors::fromBoostError(e.code(), request.method + " " + request.url);
    } catch (const std::exception& e) {
        failure = errors::makeError(errors::ErrorCategory::Transport, e.what());
    }

    if (failure) {
        if (task->cancelRequested()) {
            failure->category = errors::ErrorCategory::Cancelled;
        }
        outcome.response.reset();
        outcome.error = std::move(failure);
    }
    co_return outcome;
}

void BeastSessionTask::resume() {
    FUNC_SCOPE();
    auto expected = TaskState::Suspended;
    if (!taskState.compare_exchange_strong(expected, TaskState::Running)) {
        return;
    }
    auto state = session.lock();
    if (!state || !state->valid.load()) {
        finish(TaskOutcome{std::nullopt, errors::makeError(errors::ErrorCategory::Cancelled, "session invalidated")});
        return;
    }
    auto self = shared_from_this();
    net::co_spawn(state->ioc, coExecute(state->config, state->sslCtx, state->tlsInitError, self),
        [self](std::exception_ptr eptr, TaskOutcome outcome) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    outcome.response.reset();
                    outcome.error = errors::makeError(errors::ErrorCategory::Transport, e.what());
                }
            }
            self->finish(std::move(outcome));
        });
}

void BeastSessionTask::cancel() {
    FUNC_SCOPE();
    cancelled.store(true);
    auto expected = TaskState::Suspended;
    if (taskState.compare_exchange_strong(expected, TaskState::Canceling)) {
        finish(TaskOutcome{std::nullopt, errors::makeError(errors::ErrorCategory::Cancelled, "task cancelled")});
        return;
    }
    expected = TaskState::Running;
    if (!taskState.compare_exchange_strong(expected, TaskState::Canceling)) {
        return;
    }
    auto state = session.lock();
    if (!state) {
        return;
    }
    auto self = shared_from_this();
    net::post(state->ioc, [self]() {
        if (self->activeStream) {
            self->activeStream->cancel();
        }
    });
}

void BeastSessionTask::notifyBodySent(std::uint64_t bytes) {
    if (!delegate) {
        return;
    }
    try {
        delegate->onBodySent(*this, bytes, bytes);
    } catch (const std::exception& e) {
        LOG_ERROR("Task {}: delegate onBodySent threw: {}", identifier, e.what());
    }
}

void BeastSessionTask::finish(TaskOutcome outcome) {
    if (finished.exchange(true)) {
        return;
    }
    taskState.store(TaskState::Completed);
    if (outcome.error) {
        LOG_DEBUG("Task {}: {} {} failed: {}", identifier, request.method, request.url, errors::describe(*outcome.error));
    } else if (outcome.response) {
        LOG_DEBUG("Task {}: {} {} -> {}", identifier, request.method, request.url, outcome.response->status);
    }

    CompletionHandler callback = std::move(handler);
    handler = nullptr;
    try {
        if (callback) {
            callback(std::move(outcome.response), std::move(outcome.error));
            return;
        }
        if (delegate) {
            if (outcome.response) {
                delegate->onResponse(*this, *outcome.response);
                if (!outcome.response->body.empty()) {
                    delegate->onData(*this, outcome.response->body);
                }
            }
            delegate->onComplete(*this, outcome.error);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Task {}: completion callback threw: {}", identifier, e.what());
    }
}

} // namespace detail

class BeastTransportSession::Impl {
public:
    std::shared_ptr<detail::SessionState> state;
    std::string id;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::atomic<std::uint64_t> taskCounter{0};
    std::mutex tasksMutex;
    std::vector<std::weak_ptr<detail::BeastSessionTask>> liveTasks;

    Impl(const SessionConfiguration& config, std::shared_ptr<ISessionDelegate> delegate)
        : state(std::make_shared<detail::SessionState>()) {
        state->config = config;
        state->delegate = std::move(delegate);

        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        id = "beast-" + std::to_string(dis(gen));

        initTls();

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
            net::make_work_guard(state->ioc));
        // io_context must outlive run(), even when a handler drops the last session reference
        const std::string sessionName = id;
        ioThread = std::thread([s = state, sessionName]() {
            try {
                s->ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: I/O loop terminated: {}", sessionName, e.what());
            }
        });
    }

    // Running tasks are cancelled and the loop drains so every one of them reports Cancelled;
    // suspended tasks complete as cancelled when resumed
    ~Impl() {
        state->valid.store(false);
        for (auto& task : takeLiveTasks()) {
            if (task->state() == TaskState::Running) {
                task->cancel();
            }
        }
        workGuard.reset();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    void initTls() {
        const SessionConfiguration& config = state->config;
        state->sslCtx = std::make_shared<ssl::context>(ssl::context::tls_client);
        const int minVersion = config.minTlsVersion == "1.3" ? TLS1_3_VERSION : TLS1_2_VERSION;
        ::SSL_CTX_set_min_proto_version(state->sslCtx->native_handle(), minVersion);
        ::ERR_clear_error();
        const bool userProvidedCA = !config.caFile.empty() || !config.caPath.empty();
        if (userProvidedCA) {
            try {
                if (!config.caFile.empty()) { state->sslCtx->load_verify_file(config.caFile); }
                if (!config.caPath.empty()) { state->sslCtx->add_verify_path(config.caPath); }
            } catch (const std::exception& e) {
                state->tlsInitError = std::string("failed to load user-provided CA file/path: ") + e.what();
                LOG_ERROR("Session {}: {}", id, *state->tlsInitError);
            }
        } else {
            try {
                state->sslCtx->set_default_verify_paths();
            } catch (const std::exception& e) {
                LOG_DEBUG("Session {}: set_default_verify_paths failed: {}", id, e.what());
            }
        }
        state->sslCtx->set_verify_mode(config.verifyPeer ? ssl::verify_peer : ssl::verify_none);
    }

    std::vector<std::shared_ptr<detail::BeastSessionTask>> takeLiveTasks() {
        std::vector<std::shared_ptr<detail::BeastSessionTask>> outstanding;
        std::lock_guard<std::mutex> lk(tasksMutex);
        for (auto& weak : liveTasks) {
            if (auto task = weak.lock()) {
                outstanding.push_back(std::move(task));
            }
        }
        liveTasks.clear();
        return outstanding;
    }

    SessionTaskPtr makeTask(const HttpRequest& request, RequestBody upload, CompletionHandler handler) {
        auto task = std::make_shared<detail::BeastSessionTask>(
            state, ++taskCounter, request, std::move(upload), std::move(handler), state->delegate);
        if (!state->valid.load()) {
            LOG_WARN("Session {}: task {} created after invalidation; it will complete as cancelled", id,
                     task->taskIdentifier());
        }
        std::lock_guard<std::mutex> lk(tasksMutex);
        liveTasks.erase(std::remove_if(liveTasks.begin(), liveTasks.end(),
                                       [](const std::weak_ptr<detail::BeastSessionTask>& w) { return w.expired(); }),
                        liveTasks.end());
        liveTasks.push_back(task);
        return task;
    }
};

BeastTransportSession::BeastTransportSession(const SessionConfiguration& config,
                                             std::shared_ptr<ISessionDelegate> delegate)
    : pImpl(std::make_shared<Impl>(config, std::move(delegate))) {}

BeastTransportSession::~BeastTransportSession() = default;

SessionTaskPtr BeastTransportSession::dataTask(const HttpRequest& request, CompletionHandler handler) {
    FUNC_SCOPE();
    return pImpl->makeTask(request, RequestBody{}, std::move(handler));
}

SessionTaskPtr BeastTransportSession::uploadTask(const HttpRequest& request, const std::string& bodyData,
                                                 CompletionHandler handler) {
    FUNC_SCOPE();
    return pImpl->makeTask(request, RequestBody{bodyData}, std::move(handler));
}

SessionTaskPtr BeastTransportSession::uploadTask(const HttpRequest& request, const std::filesystem::path& file,
                                                 CompletionHandler handler) {
    FUNC_SCOPE();
    return pImpl->makeTask(request, RequestBody{file}, std::move(handler));
}

void BeastTransportSession::invalidateAndCancel() {
    FUNC_SCOPE();
    if (!pImpl->state->valid.exchange(false)) {
        return;
    }
    auto outstanding = pImpl->takeLiveTasks();
    LOG_DEBUG("Session {}: invalidating; cancelling {} task(s)", pImpl->id, outstanding.size());
    for (auto& task : outstanding) {
        task->cancel();
    }
    if (auto delegate = pImpl->state->delegate) {
        const std::string sessionName = pImpl->id;
        net::post(pImpl->state->ioc, [delegate, sessionName]() {
            try {
                delegate->onInvalidated(std::nullopt);
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: delegate onInvalidated threw: {}", sessionName, e.what());
            }
        });
    }
    pImpl->workGuard.reset();
}

std::string BeastTransportSession::sessionId() const {
    return pImpl->id;
}

const SessionConfiguration& BeastTransportSession::configuration() const {
    return pImpl->state->config;
}

std::shared_ptr<ITransportSession> BeastTransportSessionFactory::CreateSession(
    const std::string& config, std::shared_ptr<ISessionDelegate> delegate) {
    return std::make_shared<BeastTransportSession>(parseSessionConfiguration(config), std::move(delegate));
}

} // namespace bms
