#include "storage/mailbox_store.hpp"
#include "auth/user_directory.hpp"
#include "protocol/command_line.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <random>
#include <atomic>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace minimail {

namespace {

constexpr std::string_view kRecordMagic = "MMSG/1 ";
constexpr size_t kMaxRecipientsPerRecord = 10000;

std::string single_line(const std::string& value) {
    std::string out = value;
    std::replace(out.begin(), out.end(), '\r', ' ');
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

int64_t to_unix_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool write_all(int fd, const std::string& data) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Advisory lock on "<mailbox>.lock", serialising file access with other
// processes sharing the storage root.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& mailbox) {
        auto path = mailbox;
        path += ".lock";
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            LOG_ERROR_FMT("Unable to open lock file {}: {}", path.string(), std::strerror(errno));
            return;
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            LOG_ERROR_FMT("Unable to lock {}: {}", path.string(), std::strerror(errno));
            ::close(fd_);
            fd_ = -1;
            return;
        }
    }

    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

}  // namespace

std::string_view to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:             return "ok";
        case StoreStatus::NoSuchUser:     return "no such user";
        case StoreStatus::AlreadyLocked:  return "mailbox already locked";
        case StoreStatus::NoSuchIndex:    return "no such message";
        case StoreStatus::AlreadyDeleted: return "message already deleted";
        case StoreStatus::IOError:        return "I/O error";
    }
    return "unknown";
}

// MailboxHandle

MailboxHandle::MailboxHandle(AcquireKey, MailboxStore& store, std::string username,
                             std::vector<Message> messages)
    : store_(store)
    , username_(std::move(username))
    , messages_(std::move(messages)) {
}

MailboxHandle::~MailboxHandle() {
    release();
}

std::vector<MessageSummary> MailboxHandle::list() const {
    std::vector<MessageSummary> summaries;
    for (size_t i = 0; i < messages_.size(); ++i) {
        if (marks_.count(i + 1) == 0) {
            summaries.push_back({i + 1, messages_[i].size()});
        }
    }
    return summaries;
}

std::optional<Message> MailboxHandle::fetch(size_t index) const {
    if (!valid_index(index)) {
        return std::nullopt;
    }
    return messages_[index - 1];
}

std::optional<std::string> MailboxHandle::uid(size_t index) const {
    if (!valid_index(index)) {
        return std::nullopt;
    }
    return messages_[index - 1].uid;
}

StoreStatus MailboxHandle::mark_delete(size_t index) {
    if (!valid_index(index)) {
        return StoreStatus::NoSuchIndex;
    }
    if (!marks_.insert(index).second) {
        return StoreStatus::AlreadyDeleted;
    }
    return StoreStatus::Ok;
}

size_t MailboxHandle::count() const {
    return messages_.size() - marks_.size();
}

size_t MailboxHandle::total_size() const {
    size_t total = 0;
    for (size_t i = 0; i < messages_.size(); ++i) {
        if (marks_.count(i + 1) == 0) {
            total += messages_[i].size();
        }
    }
    return total;
}

StoreStatus MailboxHandle::commit() {
    if (released_) {
        return StoreStatus::IOError;
    }

    StoreStatus status = store_.commit(*this);
    if (status == StoreStatus::Ok) {
        release();
    }
    return status;
}

void MailboxHandle::release() {
    if (released_) return;
    released_ = true;
    store_.release(*this);
}

// MailboxStore

MailboxStore::MailboxStore(const std::filesystem::path& root,
                           std::shared_ptr<const UserDirectory> users)
    : root_(root)
    , users_(std::move(users)) {
}

std::filesystem::path MailboxStore::mailbox_path(const std::string& username) const {
    return root_ / username / "mailbox";
}

bool MailboxStore::user_known(const std::string& username) const {
    return users_ && UserDirectory::is_valid_username(username) && users_->exists(username);
}

MailboxStore::MailboxState& MailboxStore::state_for(const std::string& username) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto& state = states_[username];
    if (!state) {
        state = std::make_unique<MailboxState>();
    }
    return *state;
}

StoreStatus MailboxStore::append(const std::string& username, const Message& message) {
    if (!user_known(username)) {
        return StoreStatus::NoSuchUser;
    }

    Message record = message;
    if (record.received_at == std::chrono::system_clock::time_point{}) {
        record.received_at = std::chrono::system_clock::now();
    }
    record.uid = generate_uid();

    std::string encoded;
    try {
        encoded = encode_record(record);
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("Unable to encode message for {}: {}", username, e.what());
        return StoreStatus::IOError;
    }

    auto& state = state_for(username);
    std::lock_guard<std::mutex> io_lock(state.io_mutex);

    auto path = mailbox_path(username);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_ERROR_FMT("Unable to create mailbox directory {}: {}",
                      path.parent_path().string(), ec.message());
        return StoreStatus::IOError;
    }

    FileLock file_lock(path);
    if (!file_lock.locked()) {
        return StoreStatus::IOError;
    }

    int fd = ::open(path.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_ERROR_FMT("Unable to open {}: {}", path.string(), std::strerror(errno));
        return StoreStatus::IOError;
    }

    off_t original_size = ::lseek(fd, 0, SEEK_END);

    // A torn record left by a crash may lack its final newline; start on a fresh
    // line so the reader can resynchronise on this record's header
    if (original_size > 0) {
        char last = '\n';
        if (::pread(fd, &last, 1, original_size - 1) == 1 && last != '\n') {
            encoded.insert(encoded.begin(), '\n');
        }
    }

    bool ok = original_size >= 0 && write_all(fd, encoded);
    if (ok && sync_writes_) {
        ok = ::fsync(fd) == 0;
    }

    if (!ok) {
        int saved_errno = errno;
        // Roll back a partial record so the next append starts on a record boundary
        if (original_size >= 0 && ::ftruncate(fd, original_size) != 0) {
            LOG_ERROR_FMT("Unable to roll back partial append to {}", path.string());
        }
        ::close(fd);
        LOG_ERROR_FMT("Append to {} failed: {}", path.string(), std::strerror(saved_errno));
        return StoreStatus::IOError;
    }

    if (::close(fd) != 0) {
        LOG_ERROR_FMT("Closing {} failed: {}", path.string(), std::strerror(errno));
        return StoreStatus::IOError;
    }

    LOG_DEBUG_FMT("Appended message {} ({} bytes) to {}", record.uid, record.body.size(), username);
    return StoreStatus::Ok;
}

AcquireResult MailboxStore::acquire(const std::string& username) {
    AcquireResult result;

    if (!user_known(username)) {
        result.status = StoreStatus::NoSuchUser;
        return result;
    }

    auto& state = state_for(username);

    {
        std::unique_lock<std::mutex> lock(states_mutex_);
        if (state.locked && lock_wait_.count() > 0) {
            lock_released_.wait_for(lock, lock_wait_, [&state] { return !state.locked; });
        }
        if (state.locked) {
            result.status = StoreStatus::AlreadyLocked;
            return result;
        }
        state.locked = true;
    }

    std::optional<std::string> content = locked_read(state, mailbox_path(username));
    if (!content) {
        {
            std::lock_guard<std::mutex> lock(states_mutex_);
            state.locked = false;
        }
        lock_released_.notify_all();
        result.status = StoreStatus::IOError;
        return result;
    }

    auto messages = decode_records(*content);
    LOG_DEBUG_FMT("Mailbox {} locked with {} messages", username, messages.size());

    result.status = StoreStatus::Ok;
    result.handle = std::make_unique<MailboxHandle>(MailboxHandle::AcquireKey{}, *this, username,
                                                    std::move(messages));
    return result;
}

std::optional<std::vector<Message>> MailboxStore::read_all(const std::string& username) {
    if (!user_known(username)) {
        return std::nullopt;
    }

    auto content = locked_read(state_for(username), mailbox_path(username));
    if (!content) {
        return std::nullopt;
    }
    return decode_records(*content);
}

StoreStatus MailboxStore::commit(MailboxHandle& handle) {
    if (handle.marks_.empty()) {
        return StoreStatus::Ok;
    }

    std::set<std::string> doomed;
    for (size_t index : handle.marks_) {
        doomed.insert(handle.messages_[index - 1].uid);
    }

    auto& state = state_for(handle.username_);
    std::lock_guard<std::mutex> io_lock(state.io_mutex);

    auto path = mailbox_path(handle.username_);
    FileLock file_lock(path);
    if (!file_lock.locked()) {
        return StoreStatus::IOError;
    }

    auto content = read_file(path);
    if (!content) {
        return StoreStatus::IOError;
    }

    // Records appended since acquire are not in the snapshot and always survive
    std::string rewritten;
    size_t removed = 0;
    size_t kept = 0;
    try {
        for (const auto& record : decode_records(*content)) {
            if (doomed.count(record.uid) > 0) {
                ++removed;
                continue;
            }
            rewritten += encode_record(record);
            ++kept;
        }
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("Unable to rebuild mailbox {}: {}", handle.username_, e.what());
        return StoreStatus::IOError;
    }

    if (!write_file_atomically(path, rewritten)) {
        return StoreStatus::IOError;
    }

    LOG_INFO_FMT("Mailbox {} committed: {} deleted, {} kept", handle.username_, removed, kept);
    return StoreStatus::Ok;
}

void MailboxStore::release(MailboxHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(states_mutex_);
        auto it = states_.find(handle.username_);
        if (it != states_.end()) {
            it->second->locked = false;
        }
    }
    lock_released_.notify_all();
    LOG_DEBUG_FMT("Mailbox {} released", handle.username_);
}

std::optional<std::string> MailboxStore::locked_read(MailboxState& state,
                                                     const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> io_lock(state.io_mutex);

    std::error_code ec;
    if (!std::filesystem::exists(path.parent_path(), ec)) {
        if (ec) {
            LOG_ERROR_FMT("Unable to stat {}: {}", path.parent_path().string(), ec.message());
            return std::nullopt;
        }
        return std::string();  // never delivered to
    }

    FileLock file_lock(path);
    if (!file_lock.locked()) {
        return std::nullopt;
    }
    return read_file(path);
}

std::optional<std::string> MailboxStore::read_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            LOG_ERROR_FMT("Unable to stat {}: {}", path.string(), ec.message());
            return std::nullopt;
        }
        return std::string();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR_FMT("Unable to open {}", path.string());
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        LOG_ERROR_FMT("Error reading {}", path.string());
        return std::nullopt;
    }
    return oss.str();
}

bool MailboxStore::write_file_atomically(const std::filesystem::path& path,
                                         const std::string& content) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_ERROR_FMT("Unable to create {}: {}", tmp_path.string(), std::strerror(errno));
        return false;
    }

    bool ok = write_all(fd, content);
    if (ok && sync_writes_) {
        ok = ::fsync(fd) == 0;
    }
    int saved_errno = errno;
    if (::close(fd) != 0) {
        ok = false;
        saved_errno = errno;
    }

    std::error_code ec;
    if (!ok) {
        LOG_ERROR_FMT("Writing {} failed: {}", tmp_path.string(), std::strerror(saved_errno));
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        LOG_ERROR_FMT("Unable to replace {}: {}", path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    if (sync_writes_) {
        sync_directory(path.parent_path());
    }
    return true;
}

std::string MailboxStore::generate_uid() {
    static std::atomic<uint64_t> sequence{0};

    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count() % 1000000;

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 999999);

    return fmt::format("{}.M{}P{}Q{}R{}", seconds, micros, ::getpid(),
                       sequence.fetch_add(1), dis(gen));
}

std::string MailboxStore::encode_record(const Message& message) {
    std::string record = fmt::format("{}{} {} {} {} {}\n",
                                     kRecordMagic,
                                     to_unix_ms(message.received_at),
                                     message.recipients.size(),
                                     message.body.size(),
                                     protocol::sha256_hex(message.body),
                                     message.uid.empty() ? "-" : message.uid);
    record += single_line(message.sender);
    record += '\n';
    for (const auto& rcpt : message.recipients) {
        record += single_line(rcpt);
        record += '\n';
    }
    record += message.body;
    record += '\n';
    return record;
}

std::vector<Message> MailboxStore::decode_records(const std::string& content) {
    std::vector<Message> messages;

    auto resync = [&content](size_t from) -> size_t {
        size_t next = content.find("\n" + std::string(kRecordMagic), from);
        return next == std::string::npos ? content.size() : next + 1;
    };

    size_t pos = 0;
    while (pos < content.size()) {
        if (content.compare(pos, kRecordMagic.size(), kRecordMagic) != 0) {
            LOG_WARNING_FMT("No record header at offset {}, resynchronising", pos);
            pos = resync(pos);
            continue;
        }

        size_t eol = content.find('\n', pos);
        if (eol == std::string::npos) {
            LOG_WARNING_FMT("Truncated record header at offset {} ignored", pos);
            break;
        }

        auto fields = protocol::split_words(
            content.substr(pos + kRecordMagic.size(), eol - pos - kRecordMagic.size()));

        Message msg;
        size_t recipient_count = 0;
        size_t body_length = 0;
        try {
            if (fields.size() != 5) {
                throw std::invalid_argument("field count");
            }
            msg.received_at = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(std::stoll(fields[0])));
            recipient_count = std::stoull(fields[1]);
            body_length = std::stoull(fields[2]);
            msg.digest = fields[3];
            msg.uid = fields[4];
        } catch (const std::exception&) {
            LOG_WARNING_FMT("Malformed record header at offset {}, resynchronising", pos);
            pos = resync(eol);
            continue;
        }

        size_t cursor = eol + 1;
        auto next_line = [&content, &cursor](std::string& out) {
            size_t end = content.find('\n', cursor);
            if (end == std::string::npos) return false;
            out = content.substr(cursor, end - cursor);
            cursor = end + 1;
            return true;
        };

        bool intact = recipient_count <= kMaxRecipientsPerRecord && next_line(msg.sender);
        for (size_t i = 0; intact && i < recipient_count; ++i) {
            std::string rcpt;
            intact = next_line(rcpt);
            msg.recipients.push_back(std::move(rcpt));
        }

        if (!intact || body_length > content.size() - std::min(cursor, content.size()) ||
            cursor + body_length >= content.size() || content[cursor + body_length] != '\n') {
            LOG_WARNING_FMT("Incomplete record at offset {} ignored", pos);
            pos = resync(eol);
            continue;
        }

        msg.body = content.substr(cursor, body_length);

        // The declared length of a torn record can reach into the record
        // appended after it, so a failed digest resumes from the header line
        if (protocol::sha256_hex(msg.body) != msg.digest) {
            LOG_WARNING_FMT("Record {} failed digest check, resynchronising", msg.uid);
            pos = resync(eol);
            continue;
        }

        pos = cursor + body_length + 1;
        messages.push_back(std::move(msg));
    }

    return messages;
}

}  // namespace minimail
