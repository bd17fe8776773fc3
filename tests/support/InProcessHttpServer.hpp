//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/InProcessHttpServer.hpp
// Purpose: Minimal blocking Boost.Beast HTTP server on 127.0.0.1 for socket-level tests
//==========================================================================================================
#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace bms::test {

//==========================================================================================================
// InProcessHttpServer
// Purpose: Serves one connection at a time on an ephemeral port. Every request is recorded and answered
//          by the route function; responses always carry `Connection: close`.
//==========================================================================================================
class InProcessHttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Route = std::function<Response(const Request&)>;

    explicit InProcessHttpServer(Route route) : route(std::move(route)) {}
    ~InProcessHttpServer() { stop(); }

    InProcessHttpServer(const InProcessHttpServer&) = delete;
    InProcessHttpServer& operator=(const InProcessHttpServer&) = delete;

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                serveOne();
            }
        });
    }

    void stop() {
        using boost::asio::ip::tcp;
        if (!running.exchange(false)) {
            return;
        }
        boost::system::error_code ec;
        // Poke the blocking accept
        tcp::socket poke{io};
        poke.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port) + target;
    }

    std::vector<Request> received() const {
        std::lock_guard<std::mutex> lk(mtx);
        return requests;
    }

    static Response reply(const Request& req, boost::beast::http::status status, std::string body,
                          const std::string& contentType = "application/json") {
        Response res{status, req.version()};
        res.set(boost::beast::http::field::server, "bms-test-server");
        res.set(boost::beast::http::field::content_type, contentType);
        res.body() = std::move(body);
        return res;
    }

    unsigned short port{0};

private:
    void serveOne() {
        using boost::asio::ip::tcp;
        namespace http = boost::beast::http;
        boost::system::error_code ec;
        tcp::socket socket{io};
        acceptor.accept(socket, ec);
        if (ec || !running.load()) {
            return;
        }
        boost::beast::flat_buffer buffer;
        Request req;
        http::read(socket, buffer, req, ec);
        if (ec) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mtx);
            requests.push_back(req);
        }
        Response res = route(req);
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    Route route;
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    mutable std::mutex mtx;
    std::vector<Request> requests;
};

} // namespace bms::test
