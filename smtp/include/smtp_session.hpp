#pragma once

#include "net/session.hpp"
#include "config.hpp"
#include "smtp_state_machine.hpp"
#include <memory>

namespace minimail::smtp {

class SMTPSession : public Session {
public:
    SMTPSession(tcp::socket socket,
                std::shared_ptr<const UserDirectory> users,
                std::shared_ptr<MailboxStore> store,
                const SMTPConfig& config);

    ~SMTPSession() override = default;

    const SMTPStateMachine& machine() const { return machine_; }

protected:
    void on_connect() override;
    void on_line(const std::string& line) override;
    void on_disconnect() override;
    void on_line_too_long() override;

private:
    void deliver(const Reply& reply);

    SMTPStateMachine machine_;
};

}  // namespace minimail::smtp
