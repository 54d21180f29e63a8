/*
 * Scriptable in-process Stratum pool for end-to-end tests
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cminer::test {

struct PoolScript {
    std::string extranonce1{"54686520"};
    int extranonce2_size{4};
    bool authorize_ok{true};
    bool accept_shares{true};
    double difficulty{1.0};
    // mining.notify params sent right after a successful authorize
    std::vector<nlohmann::json> jobs;
    // Send set_difficulty and the jobs ahead of the authorize result
    bool work_before_authorize{false};
};

// Listens on 127.0.0.1 and answers one JSON line at a time on its own thread.
class FakePool {
public:
    explicit FakePool(PoolScript script, unsigned short port = 0)
        : script_(std::move(script))
        , acceptor_(ioc_) {
        asio::ip::tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), port);
        acceptor_.open(ep.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        accept_();
        thread_ = std::thread([this]{ ioc_.run(); });
    }

    ~FakePool() {
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
        std::error_code ignored;
        acceptor_.close(ignored);
        for (auto& s : sessions_) s->close();
        sessions_.clear();
    }

    // Closes every miner connection; the listener stays up.
    void drop_all() {
        asio::post(ioc_, [this]{
            for (auto& s : sessions_) s->close();
            sessions_.clear();
        });
    }

    FakePool(const FakePool&) = delete;
    FakePool& operator=(const FakePool&) = delete;

    unsigned short port() const { return port_; }
    std::string url() const { return "127.0.0.1:" + std::to_string(port_); }

    int connections() const { return connections_.load(); }
    int authorizations() const { return authorizations_.load(); }

    std::vector<nlohmann::json> submits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submits_;
    }

    // Sends one line to every connected miner.
    void send_all(const nlohmann::json& message) {
        auto line = message.dump() + "\n";
        asio::post(ioc_, [this, line]{
            for (auto& s : sessions_) s->send(line);
        });
    }

    void notify(const nlohmann::json& params) {
        send_all({{"id", nullptr}, {"method", "mining.notify"}, {"params", params}});
    }

    // Sends 'line' plus a newline as is, without JSON encoding.
    void send_raw(const std::string& line) {
        auto data = line + "\n";
        asio::post(ioc_, [this, data]{
            for (auto& s : sessions_) s->send(data);
        });
    }

    void set_accept_shares(bool accept) { accept_shares_.store(accept); }
    void set_authorize_ok(bool ok) { authorize_ok_.store(ok); }

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(FakePool& pool, asio::ip::tcp::socket socket)
            : pool_(pool), socket_(std::move(socket)) {}

        void start() { read_(); }

        void send(const std::string& line) {
            outbox_.push_back(line);
            if (outbox_.size() == 1) write_();
        }

        void close() {
            std::error_code ignored;
            socket_.close(ignored);
        }

    private:
        void read_() {
            auto self = shared_from_this();
            asio::async_read_until(socket_, buf_, '\n',
                [this, self](const std::error_code& ec, std::size_t) {
                    if (ec) return;
                    std::istream in(&buf_);
                    std::string line;
                    std::getline(in, line);
                    pool_.handle_(*this, line);
                    read_();
                });
        }

        void write_() {
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(outbox_.front()),
                [this, self](const std::error_code& ec, std::size_t) {
                    if (ec) return;
                    outbox_.pop_front();
                    if (!outbox_.empty()) write_();
                });
        }

        FakePool& pool_;
        asio::ip::tcp::socket socket_;
        asio::streambuf buf_;
        std::deque<std::string> outbox_;
    };

    void accept_() {
        acceptor_.async_accept([this](const std::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) return;
            ++connections_;
            auto session = std::make_shared<Session>(*this, std::move(socket));
            sessions_.push_back(session);
            session->start();
            accept_();
        });
    }

    void handle_(Session& session, const std::string& line) {
        auto req = nlohmann::json::parse(line, nullptr, false);
        if (req.is_discarded() || !req.is_object() || !req.contains("method")) return;

        const auto method = req["method"].get<std::string>();
        const auto id = req["id"];
        if (method == "mining.subscribe") {
            nlohmann::json result = nlohmann::json::array({
                nlohmann::json::array({nlohmann::json::array({"mining.notify", "1"})}),
                script_.extranonce1,
                script_.extranonce2_size
            });
            session.send(nlohmann::json{{"id", id}, {"result", result}, {"error", nullptr}}.dump() + "\n");
        } else if (method == "mining.authorize") {
            if (!authorize_ok_.load()) {
                session.send(nlohmann::json{{"id", id}, {"result", false},
                                            {"error", nlohmann::json::array({24, "Unauthorized worker", nullptr})}}.dump() + "\n");
                return;
            }
            ++authorizations_;
            const auto result = nlohmann::json{{"id", id}, {"result", true}, {"error", nullptr}}.dump() + "\n";
            if (!script_.work_before_authorize) session.send(result);
            session.send(nlohmann::json{{"id", nullptr}, {"method", "mining.set_difficulty"},
                                        {"params", nlohmann::json::array({script_.difficulty})}}.dump() + "\n");
            for (const auto& job : script_.jobs) {
                session.send(nlohmann::json{{"id", nullptr}, {"method", "mining.notify"}, {"params", job}}.dump() + "\n");
            }
            if (script_.work_before_authorize) session.send(result);
        } else if (method == "mining.submit") {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                submits_.push_back(req["params"]);
            }
            if (accept_shares_.load()) {
                session.send(nlohmann::json{{"id", id}, {"result", true}, {"error", nullptr}}.dump() + "\n");
            } else {
                session.send(nlohmann::json{{"id", id}, {"result", nullptr},
                                            {"error", nlohmann::json::array({23, "Low difficulty share", nullptr})}}.dump() + "\n");
            }
        }
    }

    PoolScript script_;
    asio::io_context ioc_;
    asio::ip::tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::thread thread_;
    std::vector<std::shared_ptr<Session>> sessions_;

    std::atomic<int> connections_{0};
    std::atomic<int> authorizations_{0};
    std::atomic<bool> accept_shares_{script_.accept_shares};
    std::atomic<bool> authorize_ok_{script_.authorize_ok};
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> submits_;
};

// Polls 'pred' every 10 ms until it holds or 'timeout' passes.
inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace cminer::test
