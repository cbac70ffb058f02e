#include <catch2/catch.hpp>
#include "smtp_commands.hpp"
#include "smtp_state_machine.hpp"
#include "auth/user_directory.hpp"
#include "storage/mailbox_store.hpp"
#include "temp_directory.hpp"

using namespace minimail;
using namespace minimail::smtp;
using minimail::testing::TempDirectory;

namespace {

struct SmtpFixture {
    TempDirectory temp;
    std::shared_ptr<UserDirectory> users = std::make_shared<UserDirectory>();
    std::shared_ptr<MailboxStore> store;
    SMTPStateMachine machine;

    SmtpFixture()
        : store(make_store())
        , machine(users, store, "mail.test") {
    }

    std::shared_ptr<MailboxStore> make_store() {
        users->load_from_string("alice a\nbob b\ncarol c\n");
        auto s = std::make_shared<MailboxStore>(temp.path() / "users", users);
        s->set_sync_writes(false);
        return s;
    }

    std::string send(const std::string& line) {
        return machine.on_line(line).text;
    }

    void open_transaction(const std::string& sender = "alice") {
        REQUIRE(send("HELO client.test") == "250 mail.test Hello client.test");
        REQUIRE(send("MAIL FROM:<" + sender + ">") == "250 <" + sender + "> Sender OK");
    }

    size_t stored(const std::string& user) {
        return store->read_all(user)->size();
    }
};

}  // namespace

TEST_CASE("SMTP command parsing", "[smtp][commands]") {
    SECTION("Parse HELO command") {
        auto cmd = Command::parse("HELO client.example.com");
        REQUIRE(cmd.type == CommandType::HELO);
        REQUIRE(cmd.argument == "client.example.com");
    }

    SECTION("Verbs are case-insensitive") {
        auto cmd = Command::parse("mail FROM:<alice>");
        REQUIRE(cmd.type == CommandType::MAIL);
        REQUIRE(cmd.name == "MAIL");
        REQUIRE(cmd.argument == "FROM:<alice>");
    }

    SECTION("Unknown verb") {
        auto cmd = Command::parse("XYZZY now");
        REQUIRE(cmd.type == CommandType::UNKNOWN);
        REQUIRE(cmd.name == "XYZZY");
    }

    SECTION("Empty line") {
        auto cmd = Command::parse("");
        REQUIRE(cmd.type == CommandType::UNKNOWN);
        REQUIRE(cmd.name.empty());
    }
}

TEST_CASE("SMTP mail path parsing", "[smtp][commands]") {
    SECTION("Bracketed address") {
        auto path = MailPath::parse("FROM:<alice@example.com>", "FROM:");
        REQUIRE(path.has_value());
        REQUIRE(path->address == "alice@example.com");
        REQUIRE(path->parameters.empty());
    }

    SECTION("Keyword case and spacing") {
        auto path = MailPath::parse("to: <bob>", "TO:");
        REQUIRE(path.has_value());
        REQUIRE(path->address == "bob");
    }

    SECTION("Bare address") {
        auto path = MailPath::parse("TO:bob", "TO:");
        REQUIRE(path.has_value());
        REQUIRE(path->address == "bob");
    }

    SECTION("Parameters are separated") {
        auto path = MailPath::parse("FROM:<alice> SIZE=100", "FROM:");
        REQUIRE(path.has_value());
        REQUIRE(path->address == "alice");
        REQUIRE(path->parameters == "SIZE=100");
    }

    SECTION("Null reverse path") {
        auto path = MailPath::parse("FROM:<>", "FROM:");
        REQUIRE(path.has_value());
        REQUIRE(path->address.empty());
    }

    SECTION("Malformed paths") {
        REQUIRE_FALSE(MailPath::parse("alice", "FROM:").has_value());
        REQUIRE_FALSE(MailPath::parse("FROM:", "FROM:").has_value());
        REQUIRE_FALSE(MailPath::parse("FROM:<alice", "FROM:").has_value());
        REQUIRE_FALSE(MailPath::parse("TO:<bob>", "FROM:").has_value());
    }

    SECTION("VRFY argument") {
        REQUIRE(bare_address(" <bob> ") == "bob");
        REQUIRE(bare_address("bob") == "bob");
    }
}

TEST_CASE("SMTP reply formatting", "[smtp][replies]") {
    REQUIRE(reply::make(250, "OK") == "250 OK");
    REQUIRE(reply::make_multi(250, {"first", "second", "third"}) ==
            "250-first\r\n250-second\r\n250 third");
}

TEST_CASE("SMTP session greeting and HELO", "[smtp][session]") {
    SmtpFixture f;

    SECTION("Greeting") {
        auto greeting = f.machine.greeting();
        REQUIRE(greeting.text == "220 mail.test Service Ready");
        REQUIRE_FALSE(greeting.close);
        REQUIRE(f.machine.state() == SessionState::GREETING);
    }

    SECTION("HELO moves to sender state") {
        REQUIRE(f.send("HELO client.test") == "250 mail.test Hello client.test");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
        REQUIRE(f.machine.client_hostname() == "client.test");
    }

    SECTION("EHLO lists extensions") {
        auto text = f.send("EHLO client.test");
        REQUIRE(text.rfind("250-mail.test Hello client.test\r\n", 0) == 0);
        REQUIRE(text.find("250-SIZE ") != std::string::npos);
        REQUIRE(text.find("250-PIPELINING") != std::string::npos);
        REQUIRE(text.find("250 HELP") != std::string::npos);
    }

    SECTION("HELO needs a hostname") {
        REQUIRE(f.send("HELO") == "501 Syntax: HELO hostname");
        REQUIRE(f.machine.state() == SessionState::GREETING);
    }

    SECTION("Second HELO is refused") {
        f.send("HELO client.test");
        REQUIRE(f.send("HELO again") == "503 Duplicate HELO");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
    }

    SECTION("Unknown command and empty line") {
        REQUIRE(f.send("XYZZY") == "500 Error: command \"XYZZY\" not recognized");
        REQUIRE(f.send("") == "500 Error: bad syntax");
        REQUIRE(f.machine.state() == SessionState::GREETING);
    }
}

TEST_CASE("SMTP command sequencing", "[smtp][session]") {
    SmtpFixture f;

    SECTION("MAIL before HELO") {
        REQUIRE(f.send("MAIL FROM:<alice>") == "503 Error: send HELO first");
    }

    SECTION("RCPT before MAIL") {
        f.send("HELO client.test");
        REQUIRE(f.send("RCPT TO:<bob>") == "503 Error: need MAIL command");
    }

    SECTION("DATA before RCPT") {
        f.open_transaction();
        REQUIRE(f.send("DATA") == "503 Error: need RCPT command");
        REQUIRE(f.machine.state() == SessionState::RECIPIENTS_SET);
    }

    SECTION("Nested MAIL") {
        f.open_transaction();
        REQUIRE(f.send("MAIL FROM:<carol>") == "503 Error: nested MAIL command");
        REQUIRE(f.machine.envelope().mail_from == "alice");
    }

    SECTION("Malformed MAIL") {
        f.send("HELO client.test");
        REQUIRE(f.send("MAIL alice") == "501 Syntax: MAIL FROM:<address>");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
    }

    SECTION("MAIL parameters are not supported") {
        f.send("HELO client.test");
        REQUIRE(f.send("MAIL FROM:<alice> SIZE=10").rfind("555 ", 0) == 0);
    }

    SECTION("NOOP in any state") {
        REQUIRE(f.send("NOOP") == "250 OK");
        f.open_transaction();
        REQUIRE(f.send("NOOP") == "250 OK");
        REQUIRE(f.machine.state() == SessionState::RECIPIENTS_SET);
    }

    SECTION("RSET before HELO stays in greeting") {
        REQUIRE(f.send("RSET") == "250 OK");
        REQUIRE(f.machine.state() == SessionState::GREETING);
    }

    SECTION("RSET drops the envelope") {
        f.open_transaction();
        f.send("RCPT TO:<bob>");
        REQUIRE(f.send("RSET") == "250 OK");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
        REQUIRE(f.machine.envelope().rcpt_to.empty());
        REQUIRE(f.machine.envelope().mail_from.empty());

        // A new transaction can begin without another HELO
        REQUIRE(f.send("MAIL FROM:<carol>") == "250 <carol> Sender OK");
    }

    SECTION("QUIT closes") {
        auto reply = f.machine.on_line("QUIT");
        REQUIRE(reply.text == "221 mail.test Closing connection");
        REQUIRE(reply.close);
        REQUIRE(f.machine.state() == SessionState::DONE);
        REQUIRE(f.machine.on_line("NOOP").empty());
    }
}

TEST_CASE("SMTP recipients", "[smtp][session]") {
    SmtpFixture f;
    f.open_transaction();

    SECTION("Known and unknown recipients") {
        REQUIRE(f.send("RCPT TO:<bob>") == "250 Recipient Ok");
        REQUIRE(f.send("RCPT TO:<nonexistent>") == "550 No such user <nonexistent>");
        REQUIRE(f.send("RCPT TO:<carol>") == "250 Recipient Ok");
        REQUIRE(f.machine.envelope().rcpt_to == std::vector<std::string>{"bob", "carol"});
    }

    SECTION("Duplicate recipient is kept once") {
        REQUIRE(f.send("RCPT TO:<bob>") == "250 Recipient Ok");
        REQUIRE(f.send("RCPT TO:<bob>") == "250 Recipient Ok");
        REQUIRE(f.machine.envelope().rcpt_to.size() == 1);
    }

    SECTION("Recipient limit") {
        f.machine.set_max_recipients(1);
        REQUIRE(f.send("RCPT TO:<bob>") == "250 Recipient Ok");
        REQUIRE(f.send("RCPT TO:<carol>") == "452 Too many recipients");
    }

    SECTION("Only unknown recipients leaves DATA refused") {
        REQUIRE(f.send("RCPT TO:<nobody>").rfind("550 ", 0) == 0);
        REQUIRE(f.send("DATA") == "503 Error: need RCPT command");
    }

    SECTION("Malformed RCPT") {
        REQUIRE(f.send("RCPT bob") == "501 Syntax: RCPT TO:<address>");
        REQUIRE(f.send("RCPT TO:<>") == "501 Syntax: RCPT TO:<address>");
    }

    SECTION("VRFY") {
        REQUIRE(f.send("VRFY <bob>") == "250 <bob>");
        REQUIRE(f.send("VRFY nobody").rfind("252 ", 0) == 0);
        REQUIRE(f.send("VRFY").rfind("501 ", 0) == 0);
    }
}

TEST_CASE("SMTP message delivery", "[smtp][session]") {
    SmtpFixture f;
    f.open_transaction();

    SECTION("Single recipient") {
        f.send("RCPT TO:<bob>");
        REQUIRE(f.send("DATA") == "354 End data with <CR><LF>.<CR><LF>");
        REQUIRE(f.machine.state() == SessionState::RECEIVING_DATA);

        REQUIRE(f.machine.on_line("hello").empty());
        REQUIRE(f.send(".") == "250 OK: message accepted for delivery");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);

        auto messages = f.store->read_all("bob");
        REQUIRE(messages->size() == 1);
        REQUIRE((*messages)[0].body == "hello\r\n");
        REQUIRE((*messages)[0].sender == "alice");
        REQUIRE((*messages)[0].recipients == std::vector<std::string>{"bob"});
    }

    SECTION("Fan-out to every accepted recipient") {
        f.send("RCPT TO:<bob>");
        f.send("RCPT TO:<nonexistent>");
        f.send("RCPT TO:<carol>");
        f.send("DATA");
        f.send("Subject: hi");
        f.send("");
        f.send("body");
        REQUIRE(f.send(".") == "250 OK: message accepted for delivery");

        REQUIRE(f.stored("bob") == 1);
        REQUIRE(f.stored("carol") == 1);
        REQUIRE(f.stored("alice") == 0);
        REQUIRE(f.store->read_all("carol")->front().body == "Subject: hi\r\n\r\nbody\r\n");
    }

    SECTION("Dot-stuffed lines are unstuffed") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        f.send("..");
        f.send("..leading dot");
        f.send("trailing .");
        f.send(".");

        REQUIRE(f.store->read_all("bob")->front().body == ".\r\n.leading dot\r\ntrailing .\r\n");
    }

    SECTION("Commands inside DATA are content") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        REQUIRE(f.machine.on_line("QUIT").empty());
        REQUIRE(f.machine.state() == SessionState::RECEIVING_DATA);
        f.send(".");

        REQUIRE(f.store->read_all("bob")->front().body == "QUIT\r\n");
    }

    SECTION("Empty message") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        REQUIRE(f.send(".") == "250 OK: message accepted for delivery");
        REQUIRE(f.store->read_all("bob")->front().body.empty());
    }

    SECTION("Second message on the same connection") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        f.send("one");
        f.send(".");

        REQUIRE(f.send("MAIL FROM:<carol>") == "250 <carol> Sender OK");
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        f.send("two");
        f.send(".");

        auto messages = f.store->read_all("bob");
        REQUIRE(messages->size() == 2);
        REQUIRE((*messages)[1].sender == "carol");
        REQUIRE((*messages)[1].body == "two\r\n");
    }

    SECTION("Oversize message is refused after the terminator") {
        f.machine.set_max_message_size(16);
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        REQUIRE(f.machine.on_line("0123456789").empty());
        REQUIRE(f.machine.on_line("0123456789").empty());
        REQUIRE(f.send(".") == "552 Message exceeds fixed maximum message size");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
        REQUIRE(f.stored("bob") == 0);
    }

    SECTION("Connection loss during DATA appends nothing") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        f.send("partial");
        f.machine.abort();

        REQUIRE(f.machine.state() == SessionState::DONE);
        REQUIRE(f.stored("bob") == 0);
        REQUIRE(f.machine.on_line(".").empty());
        REQUIRE(f.stored("bob") == 0);
    }

    SECTION("Storage failure reports a local error") {
        f.send("RCPT TO:<bob>");
        f.send("DATA");
        f.send("hello");

        // A regular file where bob's mailbox directory should be
        std::filesystem::create_directories(f.temp.path() / "users");
        f.temp.write_file("users/bob", "not a directory");

        REQUIRE(f.send(".") == "451 Requested action aborted: local error in processing");
        REQUIRE(f.machine.state() == SessionState::SENDER_SET);
    }
}

TEST_CASE("SMTP HELP", "[smtp][session]") {
    SmtpFixture f;

    REQUIRE(f.send("HELP").rfind("214-", 0) == 0);
    REQUIRE(f.send("HELP mail") == "214 Syntax: MAIL FROM:<address>");
    REQUIRE(f.send("HELP bogus").rfind("501 ", 0) == 0);
}
