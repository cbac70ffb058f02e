#pragma once

#include "net/server.hpp"
#include "config.hpp"
#include "pop3_session.hpp"
#include <memory>

namespace minimail::pop3 {

class POP3Server {
public:
    POP3Server(const POP3Config& config,
               std::shared_ptr<const UserDirectory> users,
               std::shared_ptr<MailboxStore> store);

    ~POP3Server();

    void start();
    void stop();

    bool is_running() const;
    uint16_t local_port() const;
    size_t connection_count() const;

private:
    POP3Config config_;
    std::shared_ptr<const UserDirectory> users_;
    std::shared_ptr<MailboxStore> store_;

    std::unique_ptr<Server<POP3Session>> server_;
};

}  // namespace minimail::pop3
