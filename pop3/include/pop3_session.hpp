#pragma once

#include "net/session.hpp"
#include "config.hpp"
#include "pop3_state_machine.hpp"
#include <memory>

namespace minimail::pop3 {

class POP3Session : public Session {
public:
    POP3Session(tcp::socket socket,
                std::shared_ptr<const UserDirectory> users,
                std::shared_ptr<MailboxStore> store,
                const POP3Config& config);

    ~POP3Session() override = default;

    const POP3StateMachine& machine() const { return machine_; }

protected:
    void on_connect() override;
    void on_line(const std::string& line) override;
    void on_disconnect() override;
    void on_line_too_long() override;

private:
    void deliver(const Reply& reply);

    POP3StateMachine machine_;
};

}  // namespace minimail::pop3
