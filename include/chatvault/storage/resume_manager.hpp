#pragma once

#include "chatvault/remote/message.hpp"
#include "chatvault/storage/file_metadata.hpp"
#include "chatvault/storage/transfer_progress.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace chatvault::storage {

// Identifies an upload that may be resumed: same file content, same chunking
// and same codec flags.
struct UploadKey {
    std::string file_name;
    std::string file_hash;
    uint64_t chunk_size = 0;
    bool compressed = false;
    bool encrypted = false;
};

struct ResumeInfo {
    UploadKey key;
    TransferProgress progress;
    remote::MessageRef metadata_ref = 0;
    // Chunks that already landed remotely, by index.
    std::map<uint32_t, ChunkInfo> landed_chunks;
};

/**
 * Local SQLite record of in-flight uploads.
 *
 * Every chunk that lands is written through, so a crashed or cancelled upload
 * can be continued against the same placeholder metadata record.
 * Safe to call from several upload workers at once.
 */
class ResumeManager {
public:
    explicit ResumeManager(const std::filesystem::path& database_path);
    ~ResumeManager();

    ResumeManager(const ResumeManager&) = delete;
    ResumeManager& operator=(const ResumeManager&) = delete;

    bool initialize();

    bool save_resume_state(const ResumeInfo& info);
    std::optional<ResumeInfo> find_upload(const UploadKey& key);
    std::optional<ResumeInfo> load_resume_state(const std::string& file_id);

    bool record_chunk(const std::string& file_id, const ChunkInfo& chunk);
    bool remove_resume_state(const std::string& file_id);

    std::vector<ResumeInfo> list_resumable_transfers();
    size_t get_resume_state_count();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;

    bool create_tables();
    std::optional<ResumeInfo> load_locked(const std::string& file_id);
    std::map<uint32_t, ChunkInfo> load_chunks_locked(const std::string& file_id);
};

}
