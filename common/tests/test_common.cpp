#include <catch2/catch.hpp>
#include "auth/user_directory.hpp"
#include "storage/mailbox_store.hpp"
#include "protocol/command_line.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "temp_directory.hpp"
#include <thread>
#include <future>

using namespace minimail;
using minimail::testing::TempDirectory;

namespace {

std::shared_ptr<UserDirectory> make_users(const std::string& registry) {
    auto users = std::make_shared<UserDirectory>();
    users->load_from_string(registry);
    return users;
}

Message make_message(const std::string& body, const std::string& sender = "alice") {
    Message msg;
    msg.sender = sender;
    msg.recipients = {"bob"};
    msg.body = body;
    return msg;
}

}  // namespace

TEST_CASE("User directory", "[common][auth]") {
    SECTION("Load registry lines") {
        auto users = make_users("alice secret\n"
                                "bob hunter2\n"
                                "\n"
                                "# comment line\n");
        REQUIRE(users->size() == 2);
        REQUIRE(users->exists("alice"));
        REQUIRE(users->exists("bob"));
        REQUIRE_FALSE(users->exists("carol"));
        REQUIRE(users->lookup("alice") == std::optional<std::string>("secret"));
        REQUIRE_FALSE(users->lookup("carol").has_value());
    }

    SECTION("First entry for a username wins") {
        auto users = make_users("alice first\nalice second\n");
        REQUIRE(users->size() == 1);
        REQUIRE(users->verify("alice", "first"));
        REQUIRE_FALSE(users->verify("alice", "second"));
    }

    SECTION("Malformed lines are skipped") {
        auto users = make_users("onlyname\n"
                                "too many fields here\n"
                                "../etc pw\n"
                                "carol pw\n");
        REQUIRE(users->size() == 1);
        REQUIRE(users->exists("carol"));
        REQUIRE_FALSE(users->exists("../etc"));
    }

    SECTION("CRLF registry lines") {
        auto users = make_users("alice secret\r\nbob pw\r\n");
        REQUIRE(users->verify("alice", "secret"));
        REQUIRE(users->verify("bob", "pw"));
    }

    SECTION("Password verification") {
        auto users = make_users("alice secret\n");
        REQUIRE(users->verify("alice", "secret"));
        REQUIRE_FALSE(users->verify("alice", "Secret"));
        REQUIRE_FALSE(users->verify("alice", "secre"));
        REQUIRE_FALSE(users->verify("alice", ""));
        REQUIRE_FALSE(users->verify("nobody", "secret"));
    }

    SECTION("Usernames keep registry order") {
        auto users = make_users("zed a\nalice b\nmike c\n");
        REQUIRE(users->usernames() == std::vector<std::string>{"zed", "alice", "mike"});
    }

    SECTION("Username validation") {
        REQUIRE(UserDirectory::is_valid_username("alice"));
        REQUIRE(UserDirectory::is_valid_username("alice@example.com"));
        REQUIRE_FALSE(UserDirectory::is_valid_username(""));
        REQUIRE_FALSE(UserDirectory::is_valid_username("."));
        REQUIRE_FALSE(UserDirectory::is_valid_username(".."));
        REQUIRE_FALSE(UserDirectory::is_valid_username("a/b"));
    }

    SECTION("Missing registry file") {
        TempDirectory temp;
        UserDirectory users(temp.path() / "missing.txt");
        REQUIRE_FALSE(users.load());
        REQUIRE_FALSE(users.last_error().empty());
    }

    SECTION("Load from file") {
        TempDirectory temp;
        auto path = temp.write_file("userinfo.txt", "alice secret\n");
        UserDirectory users(path);
        REQUIRE(users.load());
        REQUIRE(users.verify("alice", "secret"));
    }
}

TEST_CASE("Protocol line helpers", "[common][protocol]") {
    SECTION("Split command verb and argument") {
        auto cmd = protocol::split_command("  mail FROM:<alice>  ");
        REQUIRE(cmd.verb == "MAIL");
        REQUIRE(cmd.argument == "FROM:<alice>");

        auto bare = protocol::split_command("quit");
        REQUIRE(bare.verb == "QUIT");
        REQUIRE(bare.argument.empty());

        auto empty = protocol::split_command("   ");
        REQUIRE(empty.verb.empty());
    }

    SECTION("Message number parsing") {
        REQUIRE(protocol::parse_index("1") == std::optional<size_t>(1));
        REQUIRE(protocol::parse_index("42") == std::optional<size_t>(42));
        REQUIRE_FALSE(protocol::parse_index("0").has_value());
        REQUIRE_FALSE(protocol::parse_index("-1").has_value());
        REQUIRE_FALSE(protocol::parse_index("+1").has_value());
        REQUIRE_FALSE(protocol::parse_index("1x").has_value());
        REQUIRE_FALSE(protocol::parse_index("").has_value());
        REQUIRE_FALSE(protocol::parse_index("99999999999999999999999").has_value());
    }

    SECTION("Dot stuffing") {
        REQUIRE(protocol::dot_stuff("hello\n") == "hello\r\n");
        REQUIRE(protocol::dot_stuff("a\n.b\n..c\n") == "a\r\n..b\r\n...c\r\n");
        REQUIRE(protocol::dot_stuff("a\r\nb\r\n") == "a\r\nb\r\n");
        REQUIRE(protocol::dot_stuff("no newline") == "no newline\r\n");
        REQUIRE(protocol::dot_stuff(".") == "..\r\n");
        REQUIRE(protocol::dot_stuff("").empty());
    }

    SECTION("Unstuffing and terminator") {
        REQUIRE(protocol::is_terminator("."));
        REQUIRE_FALSE(protocol::is_terminator(".."));
        REQUIRE_FALSE(protocol::is_terminator(". "));
        REQUIRE(protocol::unstuff_line("..") == ".");
        REQUIRE(protocol::unstuff_line("..x") == ".x");
        REQUIRE(protocol::unstuff_line("x.") == "x.");
    }

    SECTION("SHA-256 digest") {
        REQUIRE(protocol::sha256_hex("") ==
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        REQUIRE(protocol::sha256_hex("abc") ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
}

TEST_CASE("Configuration", "[common][config]") {
    Config config;

    SECTION("Defaults") {
        REQUIRE(config.smtp().port == 2525);
        REQUIRE(config.pop3().port == 1110);
        REQUIRE(config.storage().lock_wait.count() == 0);
        REQUIRE(config.storage().registry_path() == std::filesystem::path("/var/lib/minimail/userinfo.txt"));
    }

    SECTION("Load sections") {
        REQUIRE(config.load_from_string(
            "# minimail\n"
            "[storage]\n"
            "root = /srv/mail\n"
            "lock_wait_ms = 250\n"
            "sync_writes = no\n"
            "\n"
            "[smtp]\n"
            "port = 2626\n"
            "hostname = \"mx.example.com\"\n"
            "max_message_size = 1024\n"
            "\n"
            "[POP3]\n"
            "port=1111\n"
            "connection_timeout = 60\n"
            "\n"
            "[log]\n"
            "level = debug\n"
            "\n"
            "[custom]\n"
            "colour = blue\n"));

        REQUIRE(config.storage().root == std::filesystem::path("/srv/mail"));
        REQUIRE(config.storage().mailbox_root() == std::filesystem::path("/srv/mail/users"));
        REQUIRE(config.storage().lock_wait.count() == 250);
        REQUIRE_FALSE(config.storage().sync_writes);
        REQUIRE(config.smtp().port == 2626);
        REQUIRE(config.smtp().hostname == "mx.example.com");
        REQUIRE(config.smtp().max_message_size == 1024);
        REQUIRE(config.pop3().port == 1111);
        REQUIRE(config.pop3().connection_timeout.count() == 60);
        REQUIRE(config.log().level == LogLevel::Debug);
        REQUIRE(config.get("custom.colour") == std::optional<std::string>("blue"));
    }

    SECTION("Set overrides typed keys") {
        config.set("smtp.port", "25");
        config.set("pop3.bind_address", "0.0.0.0");
        config.set("storage.registry", "/etc/minimail/users");
        config.set("plain", "value");

        REQUIRE(config.smtp().port == 25);
        REQUIRE(config.pop3().bind_address == "0.0.0.0");
        REQUIRE(config.storage().registry_path() == std::filesystem::path("/etc/minimail/users"));
        REQUIRE(config.get("plain") == std::optional<std::string>("value"));
        REQUIRE_FALSE(config.get("smtp.port").has_value());
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(config.load("/nonexistent/minimail.conf"));
        REQUIRE_FALSE(config.last_error().empty());
    }
}

TEST_CASE("Logger", "[common][logger]") {
    SECTION("Level names") {
        REQUIRE(parse_log_level("WARN") == std::optional<LogLevel>(LogLevel::Warning));
        REQUIRE(parse_log_level("debug") == std::optional<LogLevel>(LogLevel::Debug));
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("File output rotates") {
        TempDirectory temp;
        auto file = temp.path() / "log" / "minimail.log";
        auto& logger = Logger::instance();
        logger.init(LogLevel::Info, false, file, 64, 3);

        LOG_DEBUG_FMT("filtered {}", 0);
        for (int i = 0; i < 10; ++i) {
            LOG_INFO_FMT("rotation line {}", i);
        }
        logger.init(LogLevel::Info, true);

        auto live = TempDirectory::read_file(file);
        REQUIRE(live.find("rotation line 9") != std::string::npos);
        REQUIRE(live.find("[INFO ]") != std::string::npos);
        REQUIRE(TempDirectory::read_file(temp.path() / "log" / "minimail.log.1")
                    .find("rotation line 8") != std::string::npos);
        REQUIRE(std::filesystem::exists(temp.path() / "log" / "minimail.log.2"));
        REQUIRE_FALSE(std::filesystem::exists(temp.path() / "log" / "minimail.log.3"));
    }
}

TEST_CASE("Mailbox record framing", "[common][storage]") {
    Message first = make_message("first\r\n");
    first.uid = "uid-1";
    first.recipients = {"bob", "carol"};
    Message second = make_message("second\r\n.\r\n");
    second.uid = "uid-2";

    std::string content = MailboxStore::encode_record(first) + MailboxStore::encode_record(second);

    SECTION("Decode intact records") {
        auto messages = MailboxStore::decode_records(content);
        REQUIRE(messages.size() == 2);
        REQUIRE(messages[0].uid == "uid-1");
        REQUIRE(messages[0].sender == "alice");
        REQUIRE(messages[0].recipients == std::vector<std::string>{"bob", "carol"});
        REQUIRE(messages[0].body == "first\r\n");
        REQUIRE(messages[1].body == "second\r\n.\r\n");
    }

    SECTION("Truncated tail is ignored") {
        auto messages = MailboxStore::decode_records(content.substr(0, content.size() - 5));
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0].uid == "uid-1");
    }

    SECTION("Truncated header is ignored") {
        std::string partial = MailboxStore::encode_record(first) + "MMSG/1 1700000000";
        auto messages = MailboxStore::decode_records(partial);
        REQUIRE(messages.size() == 1);
    }

    SECTION("Leading garbage is skipped") {
        auto messages = MailboxStore::decode_records("garbage line\n" + content);
        REQUIRE(messages.size() == 2);
    }

    SECTION("Corrupted body fails digest check") {
        std::string corrupted = content;
        auto pos = corrupted.find("first\r\n");
        REQUIRE(pos != std::string::npos);
        corrupted[pos] = 'F';

        auto messages = MailboxStore::decode_records(corrupted);
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0].uid == "uid-2");
    }

    SECTION("Sender with line breaks stays on one line") {
        Message odd = make_message("x\r\n", "evil\nMMSG/1 sender");
        odd.uid = "uid-3";
        auto messages = MailboxStore::decode_records(MailboxStore::encode_record(odd));
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0].sender == "evil MMSG/1 sender");
    }
}

TEST_CASE("Mailbox store", "[common][storage]") {
    TempDirectory temp;
    auto users = make_users("alice a\nbob b\n");
    MailboxStore store(temp.path() / "users", users);
    store.set_sync_writes(false);

    SECTION("Unknown user") {
        REQUIRE(store.append("mallory", make_message("x\r\n")) == StoreStatus::NoSuchUser);
        REQUIRE(store.acquire("mallory").status == StoreStatus::NoSuchUser);
        REQUIRE_FALSE(store.read_all("mallory").has_value());
    }

    SECTION("Empty mailbox before first delivery") {
        auto messages = store.read_all("bob");
        REQUIRE(messages.has_value());
        REQUIRE(messages->empty());

        auto result = store.acquire("bob");
        REQUIRE(result.status == StoreStatus::Ok);
        REQUIRE(result.handle->count() == 0);
        REQUIRE(result.handle->total_size() == 0);
    }

    SECTION("Append preserves order and content") {
        REQUIRE(store.append("bob", make_message("one\r\n")) == StoreStatus::Ok);
        REQUIRE(store.append("bob", make_message("two\r\n")) == StoreStatus::Ok);

        auto messages = store.read_all("bob");
        REQUIRE(messages.has_value());
        REQUIRE(messages->size() == 2);
        REQUIRE((*messages)[0].body == "one\r\n");
        REQUIRE((*messages)[1].body == "two\r\n");
        REQUIRE((*messages)[0].uid != (*messages)[1].uid);
        REQUIRE(std::filesystem::exists(store.mailbox_path("bob")));
    }

    SECTION("Second acquire fails fast") {
        auto first = store.acquire("bob");
        REQUIRE(first.status == StoreStatus::Ok);

        auto second = store.acquire("bob");
        REQUIRE(second.status == StoreStatus::AlreadyLocked);
        REQUIRE_FALSE(second.handle);

        // Other mailboxes are unaffected
        REQUIRE(store.acquire("alice").status == StoreStatus::Ok);

        first.handle->release();
        REQUIRE(store.acquire("bob").status == StoreStatus::Ok);
    }

    SECTION("Destroying a handle releases the lock") {
        {
            auto result = store.acquire("bob");
            REQUIRE(result.status == StoreStatus::Ok);
        }
        REQUIRE(store.acquire("bob").status == StoreStatus::Ok);
    }

    SECTION("Acquire waits for a release") {
        store.set_lock_wait(std::chrono::milliseconds(5000));

        auto first = store.acquire("bob");
        REQUIRE(first.status == StoreStatus::Ok);

        auto waiter = std::async(std::launch::async, [&store] {
            return store.acquire("bob").status;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        first.handle.reset();

        REQUIRE(waiter.get() == StoreStatus::Ok);
    }

    SECTION("Bounded wait gives up") {
        store.set_lock_wait(std::chrono::milliseconds(50));

        auto first = store.acquire("bob");
        REQUIRE(store.acquire("bob").status == StoreStatus::AlreadyLocked);
    }

    SECTION("Marks are staged until commit") {
        store.append("bob", make_message("one\r\n"));
        store.append("bob", make_message("two\r\n"));
        store.append("bob", make_message("three\r\n"));

        auto result = store.acquire("bob");
        REQUIRE(result.status == StoreStatus::Ok);
        auto& handle = *result.handle;

        REQUIRE(handle.count() == 3);
        REQUIRE(handle.mark_delete(2) == StoreStatus::Ok);
        REQUIRE(handle.mark_delete(2) == StoreStatus::AlreadyDeleted);
        REQUIRE(handle.mark_delete(4) == StoreStatus::NoSuchIndex);
        REQUIRE(handle.mark_delete(0) == StoreStatus::NoSuchIndex);

        REQUIRE(handle.count() == 2);
        REQUIRE(handle.total_size() == 5 + 7);
        REQUIRE(handle.snapshot_size() == 3);

        auto listed = handle.list();
        REQUIRE(listed.size() == 2);
        REQUIRE(listed[0].index == 1);
        REQUIRE(listed[1].index == 3);

        // Nothing on disk changes before commit
        REQUIRE(store.read_all("bob")->size() == 3);

        handle.clear_marks();
        REQUIRE(handle.count() == 3);
    }

    SECTION("Commit removes marked messages and renumbers") {
        store.append("bob", make_message("one\r\n"));
        store.append("bob", make_message("two\r\n"));
        store.append("bob", make_message("three\r\n"));

        std::string third_uid;
        {
            auto result = store.acquire("bob");
            third_uid = *result.handle->uid(3);
            result.handle->mark_delete(1);
            result.handle->mark_delete(2);
            REQUIRE(result.handle->commit() == StoreStatus::Ok);
            REQUIRE(result.handle->released());
        }

        auto result = store.acquire("bob");
        REQUIRE(result.status == StoreStatus::Ok);
        REQUIRE(result.handle->count() == 1);
        REQUIRE(result.handle->fetch(1)->body == "three\r\n");
        REQUIRE(result.handle->uid(1) == std::optional<std::string>(third_uid));
        REQUIRE_FALSE(std::filesystem::exists(temp.path() / "users" / "bob" / "mailbox.tmp"));
    }

    SECTION("Commit keeps messages appended after acquire") {
        store.append("bob", make_message("old\r\n"));

        auto result = store.acquire("bob");
        REQUIRE(result.handle->count() == 1);

        REQUIRE(store.append("bob", make_message("new\r\n")) == StoreStatus::Ok);

        result.handle->mark_delete(1);
        REQUIRE(result.handle->commit() == StoreStatus::Ok);

        auto messages = store.read_all("bob");
        REQUIRE(messages->size() == 1);
        REQUIRE((*messages)[0].body == "new\r\n");
    }

    SECTION("Dropped handle leaves storage untouched") {
        store.append("bob", make_message("one\r\n"));
        store.append("bob", make_message("two\r\n"));
        auto before = TempDirectory::read_file(store.mailbox_path("bob"));

        {
            auto result = store.acquire("bob");
            result.handle->mark_delete(1);
            result.handle->mark_delete(2);
        }

        REQUIRE(TempDirectory::read_file(store.mailbox_path("bob")) == before);
        REQUIRE(store.read_all("bob")->size() == 2);
    }

    SECTION("Snapshot ignores later appends") {
        store.append("bob", make_message("one\r\n"));
        auto result = store.acquire("bob");

        store.append("bob", make_message("two\r\n"));
        REQUIRE(result.handle->count() == 1);
        REQUIRE_FALSE(result.handle->fetch(2).has_value());
    }

    SECTION("Torn tail on disk is ignored and appended past") {
        store.append("bob", make_message("one\r\n"));
        {
            std::ofstream out(store.mailbox_path("bob"), std::ios::binary | std::ios::app);
            out << "MMSG/1 1700000000000 1 100 ";
        }

        REQUIRE(store.read_all("bob")->size() == 1);

        REQUIRE(store.append("bob", make_message("two\r\n")) == StoreStatus::Ok);
        auto messages = store.read_all("bob");
        REQUIRE(messages->size() == 2);
        REQUIRE((*messages)[1].body == "two\r\n");
    }

    SECTION("Crash inside a record body does not hide later deliveries") {
        std::string long_body;
        for (int i = 0; i < 40; ++i) {
            long_body += "line " + std::to_string(i) + "\r\n";
        }
        const auto path = store.mailbox_path("bob");
        size_t recoveries = 0;

        // Cut the long record at every point of its body and trailer
        for (size_t cut = 1; cut < long_body.size(); ++cut) {
            std::filesystem::remove(path);
            REQUIRE(store.append("bob", make_message("keep me\r\n")) == StoreStatus::Ok);
            REQUIRE(store.append("bob", make_message(long_body)) == StoreStatus::Ok);

            auto full = std::filesystem::file_size(path);
            std::filesystem::resize_file(path, full - cut - 1);
            REQUIRE(store.append("bob", make_message("after crash\r\n")) == StoreStatus::Ok);

            auto messages = store.read_all("bob");
            REQUIRE(messages->size() == 2);
            REQUIRE((*messages)[0].body == "keep me\r\n");
            REQUIRE((*messages)[1].body == "after crash\r\n");

            auto result = store.acquire("bob");
            REQUIRE(result.status == StoreStatus::Ok);
            REQUIRE(result.handle->count() == 2);
            REQUIRE(result.handle->mark_delete(1) == StoreStatus::Ok);
            REQUIRE(result.handle->commit() == StoreStatus::Ok);

            messages = store.read_all("bob");
            REQUIRE(messages->size() == 1);
            REQUIRE((*messages)[0].body == "after crash\r\n");
            ++recoveries;
        }
        REQUIRE(recoveries == long_body.size() - 1);
    }

    SECTION("Failed commit leaves the mailbox and the lock in place") {
        store.append("bob", make_message("one\r\n"));
        store.append("bob", make_message("two\r\n"));
        const auto path = store.mailbox_path("bob");
        auto before = TempDirectory::read_file(path);

        // A directory in the way of the temp file makes the rewrite fail
        auto blocker = path;
        blocker += ".tmp";
        std::filesystem::create_directories(blocker);

        auto result = store.acquire("bob");
        REQUIRE(result.handle->mark_delete(1) == StoreStatus::Ok);
        REQUIRE(result.handle->commit() == StoreStatus::IOError);

        REQUIRE(TempDirectory::read_file(path) == before);
        REQUIRE(result.handle->marks() == std::set<size_t>{1});
        REQUIRE_FALSE(result.handle->released());
        REQUIRE(store.acquire("bob").status == StoreStatus::AlreadyLocked);

        SECTION("Commit succeeds once the obstacle is gone") {
            std::filesystem::remove(blocker);
            REQUIRE(result.handle->commit() == StoreStatus::Ok);
            REQUIRE(result.handle->released());

            auto messages = store.read_all("bob");
            REQUIRE(messages->size() == 1);
            REQUIRE((*messages)[0].body == "two\r\n");
        }

        SECTION("Dropping the handle frees the lock") {
            result.handle.reset();
            auto again = store.acquire("bob");
            REQUIRE(again.status == StoreStatus::Ok);
            REQUIRE(again.handle->count() == 2);
        }
    }

    SECTION("Concurrent appends to one mailbox") {
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&store, t] {
                for (int i = 0; i < 10; ++i) {
                    store.append("bob", make_message("writer " + std::to_string(t) + "\r\n"));
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }

        REQUIRE(store.read_all("bob")->size() == 40);
    }
}
