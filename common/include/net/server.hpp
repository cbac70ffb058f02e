#pragma once

#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <functional>
#include <set>
#include <mutex>
#include <type_traits>
#include <utility>
#include <boost/asio.hpp>

#include "session.hpp"
#include "logger.hpp"

namespace minimail {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Accepts connections on one endpoint and runs each as a SessionType on its own
// strand over a shared thread pool.
template<typename SessionType>
class Server {
public:
    Server(const std::string& name, const std::string& bind_address,
           uint16_t port, size_t thread_count = 4);

    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and listens; throws boost::system::system_error when the endpoint
    // cannot be bound.
    void start();
    void stop();

    bool is_running() const { return running_; }
    size_t connection_count() const;

    // Port actually bound, useful when started with port 0.
    uint16_t local_port() const;

    void set_max_connections(size_t max) { max_connections_ = max; }
    void set_connection_timeout(std::chrono::seconds timeout) { connection_timeout_ = timeout; }

    // Callback for session creation customization
    using SessionFactory = std::function<std::shared_ptr<SessionType>(tcp::socket)>;
    void set_session_factory(SessionFactory factory) { session_factory_ = std::move(factory); }

protected:
    virtual std::shared_ptr<SessionType> create_session(tcp::socket socket);

    virtual void on_session_start(std::shared_ptr<SessionType> session);
    virtual void on_session_end(std::shared_ptr<SessionType> session);

private:
    void do_accept();
    void remove_session(std::shared_ptr<SessionType> session);

    std::string name_;
    std::string bind_address_;
    uint16_t port_;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;

    std::atomic<bool> running_{false};
    size_t thread_count_;
    size_t max_connections_ = 1000;
    std::chrono::seconds connection_timeout_{300};

    std::set<std::shared_ptr<SessionType>> sessions_;
    mutable std::mutex sessions_mutex_;

    SessionFactory session_factory_;
};

// Template implementation

template<typename SessionType>
Server<SessionType>::Server(const std::string& name, const std::string& bind_address,
                            uint16_t port, size_t thread_count)
    : name_(name)
    , bind_address_(bind_address)
    , port_(port)
    , acceptor_(io_context_)
    , thread_count_(thread_count == 0 ? 1 : thread_count) {
}

template<typename SessionType>
Server<SessionType>::~Server() {
    stop();
}

template<typename SessionType>
void Server<SessionType>::start() {
    if (running_) return;

    tcp::endpoint endpoint(asio::ip::make_address(bind_address_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    running_ = true;
    do_accept();

    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    LOG_INFO_FMT("{} listening on {}:{}", name_, bind_address_, local_port());
}

template<typename SessionType>
void Server<SessionType>::stop() {
    if (!running_) return;

    running_ = false;

    boost::system::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Sessions remove themselves on stop, so stop them outside the lock
    std::set<std::shared_ptr<SessionType>> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        remaining.swap(sessions_);
    }
    for (auto& session : remaining) {
        session->stop();
    }

    LOG_INFO_FMT("{} stopped", name_);
}

template<typename SessionType>
size_t Server<SessionType>::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

template<typename SessionType>
uint16_t Server<SessionType>::local_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

template<typename SessionType>
void Server<SessionType>::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                if (connection_count() < max_connections_) {
                    auto session = create_session(std::move(socket));
                    if (session) {
                        {
                            std::lock_guard<std::mutex> lock(sessions_mutex_);
                            sessions_.insert(session);
                        }
                        std::weak_ptr<SessionType> weak = session;
                        session->set_close_handler([this, weak]() {
                            if (auto s = weak.lock()) {
                                on_session_end(s);
                            }
                        });
                        session->set_timeout(connection_timeout_);
                        on_session_start(session);
                        session->start();
                    }
                } else {
                    LOG_WARNING_FMT("{}: connection limit {} reached, refusing connection",
                                    name_, max_connections_);
                }
            } else if (ec && ec != asio::error::operation_aborted) {
                LOG_ERROR_FMT("{}: accept failed: {}", name_, ec.message());
            }

            if (running_) {
                do_accept();
            }
        });
}

template<typename SessionType>
std::shared_ptr<SessionType> Server<SessionType>::create_session(tcp::socket socket) {
    if (session_factory_) {
        return session_factory_(std::move(socket));
    }
    if constexpr (std::is_constructible_v<SessionType, tcp::socket>) {
        return std::make_shared<SessionType>(std::move(socket));
    } else {
        LOG_ERROR_FMT("{}: no session factory configured", name_);
        return nullptr;
    }
}

template<typename SessionType>
void Server<SessionType>::on_session_start(std::shared_ptr<SessionType> /* session */) {
    // Override in derived class if needed
}

template<typename SessionType>
void Server<SessionType>::on_session_end(std::shared_ptr<SessionType> session) {
    remove_session(session);
}

template<typename SessionType>
void Server<SessionType>::remove_session(std::shared_ptr<SessionType> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

}  // namespace minimail
