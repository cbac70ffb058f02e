#include "pop3_server.hpp"
#include "logger.hpp"

namespace minimail::pop3 {

POP3Server::POP3Server(const POP3Config& config,
                       std::shared_ptr<const UserDirectory> users,
                       std::shared_ptr<MailboxStore> store)
    : config_(config)
    , users_(std::move(users))
    , store_(std::move(store)) {
}

POP3Server::~POP3Server() {
    stop();
}

void POP3Server::start() {
    if (server_) return;

    server_ = std::make_unique<Server<POP3Session>>(
        "POP3",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    server_->set_session_factory(
        [this](tcp::socket socket) {
            return std::make_shared<POP3Session>(std::move(socket), users_, store_, config_);
        }
    );

    server_->set_max_connections(config_.max_connections);
    server_->set_connection_timeout(config_.connection_timeout);

    LOG_INFO_FMT("Starting POP3 server on {}:{}", config_.bind_address, config_.port);
    try {
        server_->start();
    } catch (...) {
        server_.reset();
        throw;
    }
}

void POP3Server::stop() {
    if (!server_) return;

    server_->stop();
    server_.reset();

    LOG_INFO("POP3 server stopped");
}

bool POP3Server::is_running() const {
    return server_ && server_->is_running();
}

uint16_t POP3Server::local_port() const {
    return server_ ? server_->local_port() : 0;
}

size_t POP3Server::connection_count() const {
    return server_ ? server_->connection_count() : 0;
}

}  // namespace minimail::pop3
