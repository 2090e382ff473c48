#include "chatvault/remote/sqlite_store.hpp"
#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/crypto/random.hpp"
#include <sqlite3.h>

namespace chatvault::remote {

using core::VaultError;
using core::VaultResult;

namespace {
    StoredMessage read_message_row(sqlite3_stmt* stmt) {
        // Column order: ref, text, is_blob, pinned, reply_to, filename, length(blob)
        StoredMessage message;
        message.ref = sqlite3_column_int64(stmt, 0);
        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
            message.text = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        }
        message.is_blob = sqlite3_column_int(stmt, 2) != 0;
        message.pinned = sqlite3_column_int(stmt, 3) != 0;
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            message.reply_to = sqlite3_column_int64(stmt, 4);
        }
        if (auto filename = sqlite3_column_text(stmt, 5)) {
            message.filename = reinterpret_cast<const char*>(filename);
        }
        message.blob_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        return message;
    }
}

SqliteStore::SqliteStore(const std::filesystem::path& database_path, std::string session)
    : db_path_(database_path)
    , session_(std::move(session))
    , db_(nullptr)
    , authorized_(false) {
}

SqliteStore::~SqliteStore() {
    disconnect();
}

VaultResult SqliteStore::sql_error(const std::string& what) const {
    return VaultResult(VaultError::REMOTE_ERROR, what + ": " + (db_ ? sqlite3_errmsg(db_) : "no database"));
}

VaultResult SqliteStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return VaultResult();
    }

    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }

    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        auto result = sql_error("Cannot open store database " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return result;
    }

    if (!create_tables()) {
        auto result = sql_error("Cannot initialize store schema");
        sqlite3_close(db_);
        db_ = nullptr;
        return result;
    }

    authorized_ = !session_.empty() && session_exists_locked(session_);
    LOG_DEBUG("Opened local store {} (authorized: {})", db_path_.string(), authorized_);
    return VaultResult();
}

void SqliteStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool SqliteStore::is_authorized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr && authorized_;
}

bool SqliteStore::create_tables() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            token TEXT PRIMARY KEY,
            created_at REAL NOT NULL
        );
        CREATE TABLE IF NOT EXISTS channels (
            id INTEGER PRIMARY KEY,
            title TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS messages (
            ref INTEGER PRIMARY KEY AUTOINCREMENT,
            channel_id INTEGER NOT NULL,
            text TEXT,
            is_blob INTEGER NOT NULL DEFAULT 0,
            pinned INTEGER NOT NULL DEFAULT 0,
            reply_to INTEGER,
            filename TEXT,
            blob BLOB
        );
        CREATE INDEX IF NOT EXISTS idx_messages_channel ON messages(channel_id, ref);
        CREATE INDEX IF NOT EXISTS idx_messages_reply ON messages(channel_id, reply_to);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, schema, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Store schema setup failed: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool SqliteStore::session_exists_locked(const std::string& token) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sessions WHERE token = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_STATIC);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

VaultResult SqliteStore::authorize(const std::string& credential, std::string& out_session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return VaultResult(VaultError::NOT_CONNECTED, "Store is not connected");
    }
    if (credential.empty()) {
        return VaultResult(VaultError::NOT_AUTHENTICATED, "Empty credential");
    }

    auto token = crypto::SecureRandom::generate_bytes(16);
    std::string session = crypto::hash_utils::to_hex(token.span());

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "INSERT INTO sessions (token, created_at) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare session insert");
    }

    sqlite3_bind_text(stmt, 1, session.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, core::utils::TimeUtils::to_unix_seconds(core::utils::TimeUtils::now()));
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot store session");
    }

    session_ = session;
    authorized_ = true;
    out_session = session;
    return VaultResult();
}

VaultResult SqliteStore::check_channel_locked(ChannelId channel) {
    if (!db_) {
        return VaultResult(VaultError::NOT_CONNECTED, "Store is not connected");
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM channels WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare channel lookup");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    if (!found) {
        return VaultResult(VaultError::REMOTE_ERROR, "Unknown channel " + std::to_string(channel));
    }
    return VaultResult();
}

VaultResult SqliteStore::create_channel(const std::string& title, ChannelId& out_channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return VaultResult(VaultError::NOT_CONNECTED, "Store is not connected");
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "INSERT INTO channels (title) VALUES (?);", -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare channel insert");
    }

    sqlite3_bind_text(stmt, 1, title.c_str(), -1, SQLITE_STATIC);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot create channel");
    }

    out_channel = sqlite3_last_insert_rowid(db_);
    return VaultResult();
}

VaultResult SqliteStore::open_channel(ChannelId channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_channel_locked(channel);
}

VaultResult SqliteStore::send_text(ChannelId channel, const std::string& text, MessageRef& out_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "INSERT INTO messages (channel_id, text) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare text insert");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    sqlite3_bind_text(stmt, 2, text.c_str(), -1, SQLITE_STATIC);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot send text");
    }

    out_ref = sqlite3_last_insert_rowid(db_);
    return VaultResult();
}

VaultResult SqliteStore::edit_text(ChannelId channel, MessageRef ref, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    sqlite3_stmt* stmt;
    const char* update_sql = "UPDATE messages SET text = ? WHERE channel_id = ? AND ref = ? AND is_blob = 0;";
    if (sqlite3_prepare_v2(db_, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare text update");
    }

    sqlite3_bind_text(stmt, 1, text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, channel);
    sqlite3_bind_int64(stmt, 3, ref);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot edit text");
    }

    if (sqlite3_changes(db_) == 0) {
        return VaultResult(VaultError::REMOTE_ERROR, "No text message " + std::to_string(ref));
    }
    return VaultResult();
}

VaultResult SqliteStore::get_message(ChannelId channel, MessageRef ref, StoredMessage& out_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    const char* select_sql = R"(
        SELECT ref, text, is_blob, pinned, reply_to, filename, length(blob)
        FROM messages WHERE channel_id = ? AND ref = ?;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare message lookup");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    sqlite3_bind_int64(stmt, 2, ref);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return VaultResult(VaultError::FILE_NOT_FOUND, "No message " + std::to_string(ref));
    }

    out_message = read_message_row(stmt);
    sqlite3_finalize(stmt);
    return VaultResult();
}

VaultResult SqliteStore::send_blob(ChannelId channel,
                                   std::span<const uint8_t> data,
                                   const std::string& filename,
                                   std::optional<MessageRef> reply_to,
                                   MessageRef& out_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    const char* insert_sql = R"(
        INSERT INTO messages (channel_id, is_blob, reply_to, filename, blob)
        VALUES (?, 1, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare blob insert");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    if (reply_to) {
        sqlite3_bind_int64(stmt, 2, *reply_to);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, filename.c_str(), -1, SQLITE_STATIC);
    // A zero-length blob must still read back as a blob, not NULL.
    sqlite3_bind_zeroblob(stmt, 4, 0);
    if (!data.empty()) {
        sqlite3_bind_blob64(stmt, 4, data.data(), data.size(), SQLITE_STATIC);
    }

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot send blob");
    }

    out_ref = sqlite3_last_insert_rowid(db_);
    return VaultResult();
}

VaultResult SqliteStore::get_blob(ChannelId channel, MessageRef ref, std::vector<uint8_t>& out_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    const char* select_sql = "SELECT blob FROM messages WHERE channel_id = ? AND ref = ? AND is_blob = 1;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare blob lookup");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    sqlite3_bind_int64(stmt, 2, ref);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return VaultResult(VaultError::FILE_NOT_FOUND, "No blob message " + std::to_string(ref));
    }

    auto blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
    int size = sqlite3_column_bytes(stmt, 0);
    if (blob && size > 0) {
        out_data.assign(blob, blob + size);
    } else {
        out_data.clear();
    }

    sqlite3_finalize(stmt);
    return VaultResult();
}

VaultResult SqliteStore::list_messages(ChannelId channel,
                                       const MessageFilter& filter,
                                       std::vector<StoredMessage>& out_messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    std::string select_sql =
        "SELECT ref, text, is_blob, pinned, reply_to, filename, length(blob) "
        "FROM messages WHERE channel_id = ?";
    if (filter.reply_to) {
        select_sql += " AND reply_to = ?";
    }
    if (filter.pinned_only) {
        select_sql += " AND pinned = 1";
    }
    select_sql += " ORDER BY ref DESC";
    if (filter.limit > 0) {
        select_sql += " LIMIT " + std::to_string(filter.limit);
    }
    select_sql += ";";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare message listing");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    if (filter.reply_to) {
        sqlite3_bind_int64(stmt, 2, *filter.reply_to);
    }

    out_messages.clear();
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        out_messages.push_back(read_message_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        return sql_error("Cannot list messages");
    }
    return VaultResult();
}

VaultResult SqliteStore::pin(ChannelId channel, MessageRef ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "UPDATE messages SET pinned = 1 WHERE channel_id = ? AND ref = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return sql_error("Cannot prepare pin");
    }

    sqlite3_bind_int64(stmt, 1, channel);
    sqlite3_bind_int64(stmt, 2, ref);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return sql_error("Cannot pin message");
    }

    if (sqlite3_changes(db_) == 0) {
        return VaultResult(VaultError::REMOTE_ERROR, "No message " + std::to_string(ref));
    }
    return VaultResult();
}

VaultResult SqliteStore::delete_messages(ChannelId channel, const std::vector<MessageRef>& refs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = check_channel_locked(channel);
    if (!check) {
        return check;
    }

    for (auto ref : refs) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM messages WHERE channel_id = ? AND ref = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
            return sql_error("Cannot prepare delete");
        }

        sqlite3_bind_int64(stmt, 1, channel);
        sqlite3_bind_int64(stmt, 2, ref);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            return sql_error("Cannot delete message " + std::to_string(ref));
        }
    }

    return VaultResult();
}

}
