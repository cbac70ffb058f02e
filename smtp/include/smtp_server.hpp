#pragma once

#include "net/server.hpp"
#include "config.hpp"
#include "smtp_session.hpp"
#include <memory>

namespace minimail::smtp {

class SMTPServer {
public:
    SMTPServer(const SMTPConfig& config,
               std::shared_ptr<const UserDirectory> users,
               std::shared_ptr<MailboxStore> store);

    ~SMTPServer();

    void start();
    void stop();

    bool is_running() const;
    uint16_t local_port() const;
    size_t connection_count() const;

private:
    SMTPConfig config_;
    std::shared_ptr<const UserDirectory> users_;
    std::shared_ptr<MailboxStore> store_;

    std::unique_ptr<Server<SMTPSession>> server_;
};

}  // namespace minimail::smtp
