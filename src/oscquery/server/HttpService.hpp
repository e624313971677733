#pragma once

#include "core/Error.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include <httplib.h>

namespace OQ {

class QueryResolver;

// HTTP query surface: GET <osc path>[?<PARAM>] answered by the QueryResolver.
class HttpService {
public:
    struct Options {
        std::string host = "0.0.0.0";
        int         port = 5678; // 0 binds an ephemeral port
    };

    HttpService(QueryResolver const& resolver, Options options);
    ~HttpService();

    HttpService(HttpService const&)                        = delete;
    auto operator=(HttpService const&) -> HttpService&     = delete;
    HttpService(HttpService&&) noexcept                    = delete;
    auto operator=(HttpService&&) noexcept -> HttpService& = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;
    auto join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;

    [[nodiscard]] static auto statusFor(Error::Code code) -> int;
    [[nodiscard]] static auto errorBody(Error const& error) -> std::string;

private:
    auto configure_routes(httplib::Server& server) -> void;
    auto handle_query(httplib::Request const& req, httplib::Response& res) const -> void;

    QueryResolver const&             resolver_;
    Options                          options_;
    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_ = 0;
    mutable std::mutex               mutex_;
};

} // namespace OQ
