#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <vector>
#include <optional>
#include <chrono>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace minimail {

class UserDirectory;
class MailboxStore;

struct Message {
    std::string sender;
    std::vector<std::string> recipients;
    std::string body;
    std::chrono::system_clock::time_point received_at;
    std::string uid;       // Assigned on append, stable across commits
    std::string digest;    // SHA-256 of body, verified on read

    size_t size() const { return body.size(); }
};

struct MessageSummary {
    size_t index;          // 1-based
    size_t size;
};

enum class StoreStatus {
    Ok,
    NoSuchUser,
    AlreadyLocked,
    NoSuchIndex,
    AlreadyDeleted,
    IOError
};

std::string_view to_string(StoreStatus status);

// Exclusive view of one mailbox for the length of a retrieval transaction.
// Indices are fixed at acquire time; deletion marks stay in memory until
// commit(). Destroying an uncommitted handle releases the lock and leaves the
// mailbox untouched.
class MailboxHandle {
    // Only MailboxStore::acquire can build a handle
    class AcquireKey {
        friend class MailboxStore;
        AcquireKey() {}
    };

public:
    MailboxHandle(AcquireKey, MailboxStore& store, std::string username,
                  std::vector<Message> messages);
    ~MailboxHandle();

    MailboxHandle(const MailboxHandle&) = delete;
    MailboxHandle& operator=(const MailboxHandle&) = delete;

    const std::string& username() const { return username_; }

    std::vector<MessageSummary> list() const;
    std::optional<Message> fetch(size_t index) const;
    std::optional<std::string> uid(size_t index) const;

    StoreStatus mark_delete(size_t index);
    bool is_marked(size_t index) const { return marks_.count(index) > 0; }
    bool valid_index(size_t index) const { return index >= 1 && index <= messages_.size(); }
    void clear_marks() { marks_.clear(); }
    const std::set<size_t>& marks() const { return marks_; }

    // Totals exclude messages marked for deletion.
    size_t count() const;
    size_t total_size() const;
    size_t snapshot_size() const { return messages_.size(); }

    // Applies the marks and releases the lock. On IOError the lock is kept
    // and the marks are preserved.
    StoreStatus commit();
    void release();
    bool released() const { return released_; }

private:
    friend class MailboxStore;

    MailboxStore& store_;
    std::string username_;
    std::vector<Message> messages_;
    std::set<size_t> marks_;
    bool released_ = false;
};

struct AcquireResult {
    StoreStatus status = StoreStatus::IOError;
    std::unique_ptr<MailboxHandle> handle;
};

class MailboxStore {
public:
    MailboxStore(const std::filesystem::path& root,
                 std::shared_ptr<const UserDirectory> users);

    MailboxStore(const MailboxStore&) = delete;
    MailboxStore& operator=(const MailboxStore&) = delete;

    // Waiting time for acquire() when the mailbox is held; zero fails fast.
    void set_lock_wait(std::chrono::milliseconds wait) { lock_wait_ = wait; }
    std::chrono::milliseconds lock_wait() const { return lock_wait_; }

    void set_sync_writes(bool sync) { sync_writes_ = sync; }

    StoreStatus append(const std::string& username, const Message& message);

    AcquireResult acquire(const std::string& username);

    // Unlocked read of every intact record, for inspection and tests.
    std::optional<std::vector<Message>> read_all(const std::string& username);

    std::filesystem::path mailbox_path(const std::string& username) const;
    const std::filesystem::path& root() const { return root_; }

    // Record framing
    static std::string encode_record(const Message& message);
    static std::vector<Message> decode_records(const std::string& content);

private:
    friend class MailboxHandle;

    struct MailboxState {
        std::mutex io_mutex;
        bool locked = false;
    };

    MailboxState& state_for(const std::string& username);
    bool user_known(const std::string& username) const;

    StoreStatus commit(MailboxHandle& handle);
    void release(MailboxHandle& handle);

    std::optional<std::string> locked_read(MailboxState& state, const std::filesystem::path& path) const;
    std::optional<std::string> read_file(const std::filesystem::path& path) const;
    bool write_file_atomically(const std::filesystem::path& path, const std::string& content) const;
    static std::string generate_uid();

    std::filesystem::path root_;
    std::shared_ptr<const UserDirectory> users_;
    std::chrono::milliseconds lock_wait_{0};
    bool sync_writes_ = true;

    std::mutex states_mutex_;
    std::condition_variable lock_released_;
    std::map<std::string, std::unique_ptr<MailboxState>> states_;
};

}  // namespace minimail
