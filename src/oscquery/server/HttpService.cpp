#include "HttpService.hpp"
#include "log/TaggedLogger.hpp"
#include "query/QueryParam.hpp"
#include "query/QueryResolver.hpp"

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace OQ {

namespace {

auto normalize_request_path(std::string path) -> std::string {
    if (path.empty())
        return "/";
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    return path;
}

auto write_error(httplib::Response& res, Error const& error) -> void {
    res.status = HttpService::statusFor(error.code);
    if (res.status == 204)
        return;
    res.set_content(HttpService::errorBody(error), "application/json");
}

} // namespace

HttpService::HttpService(QueryResolver const& resolver, Options options)
    : resolver_(resolver), options_(std::move(options)) {}

HttpService::~HttpService() {
    this->stop();
    this->join();
}

auto HttpService::statusFor(Error::Code code) -> int {
    switch (code) {
        case Error::Code::NotFound:
            return 404;
        case Error::Code::BadRequest:
        case Error::Code::TypeMismatch:
        case Error::Code::Validation:
        case Error::Code::InvalidPath:
        case Error::Code::MalformedInput:
            return 400;
        case Error::Code::Access:
            return 403;
        case Error::Code::UnsupportedParam:
            return 204;
        case Error::Code::Conflict:
            return 409;
        case Error::Code::ShuttingDown:
            return 503;
        case Error::Code::Reentrancy:
        case Error::Code::UnknownError:
            return 500;
    }
    return 500;
}

auto HttpService::errorBody(Error const& error) -> std::string {
    nlohmann::json json{
        {"ERROR", std::string{errorCodeToString(error.code)}},
        {"MESSAGE", error.message.value_or("")},
    };
    return json.dump();
}

auto HttpService::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(Error{Error::Code::Conflict, "HTTP service already running"});
    }

    server_ = std::make_unique<httplib::Server>();
    this->configure_routes(*server_);

    auto requested_port = options_.port;
    if (requested_port < 0) {
        requested_port = 0;
    }

    int bound_port = requested_port;
    if (requested_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(Error{Error::Code::UnknownError, "Failed to bind HTTP service on " + options_.host});
        }
    } else {
        if (!server_->bind_to_port(options_.host, requested_port)) {
            server_.reset();
            return std::unexpected(Error{Error::Code::UnknownError,
                                         "Failed to bind HTTP service on " + options_.host + ":"
                                             + std::to_string(requested_port)});
        }
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    server_thread_ = std::thread([this]() {
#ifdef OQ_LOG_DEBUG
        set_thread_name("Http");
#endif
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_ || !server_->is_running()) {
        if (server_)
            server_->stop();
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(Error{Error::Code::UnknownError, "HTTP service failed to start listening"});
    }

    oq_log("HTTP service listening on " + options_.host + ":" + std::to_string(bound_port_), "Http");
    return {};
}

auto HttpService::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto HttpService::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto HttpService::is_running() const -> bool {
    return running_.load();
}

auto HttpService::port() const -> std::uint16_t {
    return bound_port_;
}

auto HttpService::configure_routes(httplib::Server& server) -> void {
    server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});
    server.Get(R"(/.*)", [this](httplib::Request const& req, httplib::Response& res) { this->handle_query(req, res); });
}

auto HttpService::handle_query(httplib::Request const& req, httplib::Response& res) const -> void {
    std::vector<std::string> keys;
    keys.reserve(req.params.size());
    for (auto const& [key, value] : req.params) {
        keys.push_back(key);
    }

    auto param = parseQueryParams(keys);
    if (!param) {
        oq_log("GET " + req.path + ": " + describeError(param.error()), "Http");
        write_error(res, param.error());
        return;
    }

    auto result = resolver_.query(normalize_request_path(req.path), *param);
    if (!result) {
        oq_log("GET " + req.path + ": " + describeError(result.error()), "Http");
        write_error(res, result.error());
        return;
    }
    res.status = 200;
    res.set_content(result->dump(), "application/json");
}

} // namespace OQ
