#include "chatvault/storage/resume_manager.hpp"
#include "chatvault/core/logger.hpp"
#include <sqlite3.h>

namespace chatvault::storage {

namespace {
    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
        return text ? std::string(text) : std::string();
    }
}

ResumeManager::ResumeManager(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

ResumeManager::~ResumeManager() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool ResumeManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot open resume database {}: {}", db_path_.string(), sqlite3_errmsg(db_));
        return false;
    }

    return create_tables();
}

bool ResumeManager::create_tables() {
    const char* create_uploads_table = R"(
        CREATE TABLE IF NOT EXISTS uploads (
            file_id TEXT PRIMARY KEY,
            file_name TEXT NOT NULL,
            file_hash TEXT NOT NULL,
            chunk_size INTEGER NOT NULL,
            compressed INTEGER NOT NULL,
            encrypted INTEGER NOT NULL,
            metadata_ref INTEGER NOT NULL,
            progress TEXT NOT NULL
        );
    )";

    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS landed_chunks (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            remote_ref INTEGER NOT NULL,
            size INTEGER NOT NULL,
            hash TEXT NOT NULL,
            PRIMARY KEY (file_id, chunk_index),
            FOREIGN KEY (file_id) REFERENCES uploads(file_id) ON DELETE CASCADE
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_uploads_key ON uploads(file_name, file_hash);
        PRAGMA foreign_keys = ON;
    )";

    for (const char* sql : {create_uploads_table, create_chunks_table, create_indexes}) {
        char* error_msg = nullptr;
        int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (result != SQLITE_OK) {
            LOG_ERROR("Resume schema setup failed: {}", error_msg ? error_msg : "unknown error");
            sqlite3_free(error_msg);
            return false;
        }
    }

    return true;
}

bool ResumeManager::save_resume_state(const ResumeInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* insert_sql = R"(
        INSERT OR REPLACE INTO uploads
        (file_id, file_name, file_hash, chunk_size, compressed, encrypted, metadata_ref, progress)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    auto progress_json = info.progress.to_json();
    sqlite3_bind_text(stmt, 1, info.progress.file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, info.key.file_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, info.key.file_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(info.key.chunk_size));
    sqlite3_bind_int(stmt, 5, info.key.compressed ? 1 : 0);
    sqlite3_bind_int(stmt, 6, info.key.encrypted ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, info.metadata_ref);
    sqlite3_bind_text(stmt, 8, progress_json.c_str(), -1, SQLITE_STATIC);

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        LOG_WARN("Failed to save resume state for {}: {}", info.progress.file_id, sqlite3_errmsg(db_));
        return false;
    }

    for (const auto& [index, chunk] : info.landed_chunks) {
        const char* chunk_sql = R"(
            INSERT OR REPLACE INTO landed_chunks (file_id, chunk_index, remote_ref, size, hash)
            VALUES (?, ?, ?, ?, ?);
        )";

        sqlite3_stmt* chunk_stmt;
        if (sqlite3_prepare_v2(db_, chunk_sql, -1, &chunk_stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(chunk_stmt, 1, info.progress.file_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(chunk_stmt, 2, index);
        sqlite3_bind_int64(chunk_stmt, 3, chunk.remote_ref);
        sqlite3_bind_int64(chunk_stmt, 4, static_cast<sqlite3_int64>(chunk.size));
        sqlite3_bind_text(chunk_stmt, 5, chunk.hash.c_str(), -1, SQLITE_STATIC);

        result = sqlite3_step(chunk_stmt);
        sqlite3_finalize(chunk_stmt);
        if (result != SQLITE_DONE) {
            return false;
        }
    }

    return true;
}

std::optional<ResumeInfo> ResumeManager::find_upload(const UploadKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* select_sql = R"(
        SELECT file_id FROM uploads
        WHERE file_name = ? AND file_hash = ? AND chunk_size = ? AND compressed = ? AND encrypted = ?
        LIMIT 1;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.file_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, key.file_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(key.chunk_size));
    sqlite3_bind_int(stmt, 4, key.compressed ? 1 : 0);
    sqlite3_bind_int(stmt, 5, key.encrypted ? 1 : 0);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    std::string file_id = column_text(stmt, 0);
    sqlite3_finalize(stmt);

    return load_locked(file_id);
}

std::optional<ResumeInfo> ResumeManager::load_resume_state(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked(file_id);
}

std::optional<ResumeInfo> ResumeManager::load_locked(const std::string& file_id) {
    const char* select_sql = R"(
        SELECT file_name, file_hash, chunk_size, compressed, encrypted, metadata_ref, progress
        FROM uploads WHERE file_id = ?;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    ResumeInfo info;
    info.key.file_name = column_text(stmt, 0);
    info.key.file_hash = column_text(stmt, 1);
    info.key.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    info.key.compressed = sqlite3_column_int(stmt, 3) != 0;
    info.key.encrypted = sqlite3_column_int(stmt, 4) != 0;
    info.metadata_ref = sqlite3_column_int64(stmt, 5);
    auto progress_json = column_text(stmt, 6);
    sqlite3_finalize(stmt);

    auto parsed = TransferProgress::from_json(progress_json, info.progress);
    if (!parsed) {
        LOG_WARN("Discarding unreadable resume state for {}: {}", file_id, parsed.message);
        return std::nullopt;
    }

    info.landed_chunks = load_chunks_locked(file_id);
    for (const auto& [index, chunk] : info.landed_chunks) {
        info.progress.mark_completed(index);
    }

    return info;
}

std::map<uint32_t, ChunkInfo> ResumeManager::load_chunks_locked(const std::string& file_id) {
    std::map<uint32_t, ChunkInfo> chunks;

    const char* select_sql = R"(
        SELECT chunk_index, remote_ref, size, hash FROM landed_chunks
        WHERE file_id = ? ORDER BY chunk_index;
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return chunks;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ChunkInfo chunk;
        chunk.index = static_cast<uint32_t>(sqlite3_column_int64(stmt, 0));
        chunk.remote_ref = sqlite3_column_int64(stmt, 1);
        chunk.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        chunk.hash = column_text(stmt, 3);
        chunks[chunk.index] = chunk;
    }

    sqlite3_finalize(stmt);
    return chunks;
}

bool ResumeManager::record_chunk(const std::string& file_id, const ChunkInfo& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* insert_sql = R"(
        INSERT OR REPLACE INTO landed_chunks (file_id, chunk_index, remote_ref, size, hash)
        VALUES (?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, chunk.index);
    sqlite3_bind_int64(stmt, 3, chunk.remote_ref);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(chunk.size));
    sqlite3_bind_text(stmt, 5, chunk.hash.c_str(), -1, SQLITE_STATIC);

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return result == SQLITE_DONE;
}

bool ResumeManager::remove_resume_state(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const char* sql : {"DELETE FROM landed_chunks WHERE file_id = ?;",
                            "DELETE FROM uploads WHERE file_id = ?;"}) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            return false;
        }
    }

    return true;
}

std::vector<ResumeInfo> ResumeManager::list_resumable_transfers() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT file_id FROM uploads ORDER BY file_id;", -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ids.push_back(column_text(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }

    std::vector<ResumeInfo> transfers;
    for (const auto& id : ids) {
        if (auto info = load_locked(id)) {
            transfers.push_back(std::move(*info));
        }
    }
    return transfers;
}

size_t ResumeManager::get_resume_state_count() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM uploads;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

}
