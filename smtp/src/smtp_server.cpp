#include "smtp_server.hpp"
#include "logger.hpp"

namespace minimail::smtp {

SMTPServer::SMTPServer(const SMTPConfig& config,
                       std::shared_ptr<const UserDirectory> users,
                       std::shared_ptr<MailboxStore> store)
    : config_(config)
    , users_(std::move(users))
    , store_(std::move(store)) {
}

SMTPServer::~SMTPServer() {
    stop();
}

void SMTPServer::start() {
    if (server_) return;

    server_ = std::make_unique<Server<SMTPSession>>(
        "SMTP",
        config_.bind_address,
        config_.port,
        config_.thread_pool_size
    );

    server_->set_session_factory(
        [this](tcp::socket socket) {
            return std::make_shared<SMTPSession>(std::move(socket), users_, store_, config_);
        }
    );

    server_->set_max_connections(config_.max_connections);
    server_->set_connection_timeout(config_.connection_timeout);

    LOG_INFO_FMT("Starting SMTP server on {}:{}", config_.bind_address, config_.port);
    try {
        server_->start();
    } catch (...) {
        server_.reset();
        throw;
    }
}

void SMTPServer::stop() {
    if (!server_) return;

    server_->stop();
    server_.reset();

    LOG_INFO("SMTP server stopped");
}

bool SMTPServer::is_running() const {
    return server_ && server_->is_running();
}

uint16_t SMTPServer::local_port() const {
    return server_ ? server_->local_port() : 0;
}

size_t SMTPServer::connection_count() const {
    return server_ ? server_->connection_count() : 0;
}

}  // namespace minimail::smtp
