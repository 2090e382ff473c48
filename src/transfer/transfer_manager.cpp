#include "chatvault/transfer/transfer_manager.hpp"
#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/storage/compression.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>

namespace chatvault::transfer {

using core::VaultError;
using core::VaultResult;
using core::utils::FileUtils;
using core::utils::StringUtils;
using core::utils::TimeUtils;

struct TransferManager::UploadState {
    std::filesystem::path file_path;
    std::string file_name;
    uint64_t file_size = 0;
    bool compressed = false;
    bool encrypted = false;
    // Nominal chunk count for progress; 1 for an empty file.
    uint32_t total_chunks = 0;
    storage::FileMetadata metadata;
    std::map<uint32_t, storage::ChunkInfo> landed;

    std::mutex mutex;
    std::condition_variable slot_freed;
    std::map<uint32_t, storage::ChunkInfo> chunks;
    uint32_t completed = 0;
    uint32_t in_flight = 0;
    VaultResult failure;
};

namespace {
    bool is_cancelled(const std::shared_ptr<CancellationToken>& token) {
        return token && token->is_cancelled();
    }

    std::optional<double> modification_time(const std::filesystem::path& path) {
        std::error_code ec;
        auto file_time = std::filesystem::last_write_time(path, ec);
        if (ec) {
            return std::nullopt;
        }
        auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(file_time));
        return TimeUtils::to_unix_seconds(system_time);
    }
}

TransferManager::TransferManager(remote::RemoteStore& store,
                                 remote::ChannelId channel,
                                 const storage::VaultConfig& config,
                                 storage::ResumeManager* resume)
    : store_(store)
    , channel_(channel)
    , config_(config)
    , resume_(resume)
    , index_manager_(store, channel)
    , retry_policy_(config.max_retries, config.retry_delay, config.max_backoff)
    , cipher_(config.kdf) {
}

TransferManager::~TransferManager() = default;

VaultResult TransferManager::prepare_upload(const std::filesystem::path& file_path,
                                            const UploadOptions& options,
                                            UploadState& state) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return VaultResult(VaultError::FILE_NOT_FOUND, "No such file: " + file_path.string());
    }

    auto size = FileUtils::file_size(file_path);
    auto hash = crypto::hash_utils::file_digest_hex(file_path);
    if (!size || !hash) {
        return VaultResult(VaultError::IO_ERROR, "Cannot read " + file_path.string());
    }

    state.file_path = file_path;
    state.file_name = file_path.filename().string();
    state.file_size = *size;
    state.compressed = config_.compression && storage::should_compress(state.file_name);
    state.encrypted = config_.encryption && options.password && !options.password->empty();
    state.total_chunks = static_cast<uint32_t>(
        std::max<uint64_t>(1, storage::count_chunks(state.file_size, config_.chunk_size)));

    storage::UploadKey key{state.file_name, *hash, config_.chunk_size, state.compressed, state.encrypted};

    if (resume_) {
        if (auto info = resume_->find_upload(key)) {
            storage::FileMetadata placeholder;
            auto fetched = index_manager_.fetch_metadata(info->metadata_ref, placeholder);
            if (fetched) {
                placeholder.remote_ref = info->metadata_ref;
                state.metadata = std::move(placeholder);
                state.landed = std::move(info->landed_chunks);
                LOG_INFO("Resuming upload of {} as {}: {}/{} chunks already stored",
                         state.file_name, state.metadata.id, state.landed.size(), state.total_chunks);
                return VaultResult();
            }

            LOG_WARN("Placeholder for interrupted upload {} is gone ({}), starting over",
                     info->progress.file_id, fetched.message);
            if (!resume_->remove_resume_state(info->progress.file_id)) {
                LOG_WARN("Could not clear stale resume state for {}", info->progress.file_id);
            }
        }
    }

    auto& metadata = state.metadata;
    metadata.id = storage::generate_file_id(state.file_name, state.file_size);
    metadata.name = state.file_name;
    metadata.size = state.file_size;
    metadata.hash = *hash;
    metadata.encrypted = state.encrypted;
    metadata.compressed = state.compressed;
    metadata.mime_type = FileUtils::guess_mime_type(state.file_name);
    metadata.created_at = TimeUtils::to_unix_seconds(TimeUtils::now());
    metadata.modified_at = modification_time(file_path);
    metadata.chunk_size = config_.chunk_size;

    // The placeholder must exist before any chunk so chunks can reply to it.
    remote::MessageRef metadata_ref = 0;
    auto text = metadata.to_json();
    auto result = retry_policy_.run("publish metadata for " + state.file_name, [&]() {
        return store_.send_text(channel_, text, metadata_ref);
    }, options.cancel.get());
    if (!result) {
        return result;
    }
    metadata.remote_ref = metadata_ref;

    if (resume_) {
        storage::ResumeInfo info;
        info.key = key;
        info.metadata_ref = metadata_ref;
        info.progress.operation = storage::TransferOperation::UPLOAD;
        info.progress.file_id = metadata.id;
        info.progress.file_name = state.file_name;
        info.progress.total_chunks = state.total_chunks;
        info.progress.started_at = metadata.created_at;
        if (!resume_->save_resume_state(info)) {
            LOG_WARN("Could not record resume state for {}", metadata.id);
        }
    }

    return VaultResult();
}

VaultResult TransferManager::process_chunk(const storage::Chunk& chunk,
                                           const UploadState& state,
                                           const UploadOptions& options,
                                           storage::ChunkInfo& out_info) {
    std::vector<uint8_t> payload = chunk.data;

    if (state.compressed) {
        std::vector<uint8_t> packed;
        auto result = storage::compress(payload, packed, config_.compression_level);
        if (!result) {
            return result;
        }
        payload = std::move(packed);
    }

    if (state.encrypted) {
        std::vector<uint8_t> sealed;
        auto crypto_result = cipher_.encrypt(payload, *options.password, sealed);
        if (!crypto_result) {
            return VaultResult(VaultError::IO_ERROR,
                               "Encrypting chunk " + std::to_string(chunk.index) + " failed: " +
                               crypto_result.message);
        }
        payload = std::move(sealed);
    }

    auto filename = state.metadata.id + "_" + chunk.filename();
    remote::MessageRef ref = 0;
    auto result = retry_policy_.run("upload " + filename, [&]() {
        return store_.send_blob(channel_, payload, filename, state.metadata.remote_ref, ref);
    }, options.cancel.get());
    if (!result) {
        return result;
    }

    out_info.index = chunk.index;
    out_info.remote_ref = ref;
    out_info.size = payload.size();
    out_info.hash = crypto::hash_utils::digest_hex(payload);

    LOG_DEBUG("Stored chunk {} of {} ({} -> {} bytes)", chunk.index, state.file_name, chunk.size, payload.size());
    return VaultResult();
}

VaultResult TransferManager::upload(const std::filesystem::path& file_path,
                                    const UploadOptions& options,
                                    storage::FileMetadata& out_metadata) {
    auto result = config_.validate();
    if (!result) {
        return result;
    }

    UploadState state;
    result = prepare_upload(file_path, options, state);
    if (!result) {
        return result;
    }

    LOG_INFO("Uploading {} ({}) as {} in {} chunk(s), compressed={}, encrypted={}",
             state.file_name, StringUtils::format_bytes(state.file_size), state.metadata.id,
             state.total_chunks, state.compressed, state.encrypted);

    if (state.file_size == 0) {
        // Nothing to split; report the single nominal unit.
        if (options.progress) {
            options.progress(1, 1);
        }
        return publish(state, out_metadata);
    }

    storage::ChunkSplitter splitter(file_path, config_.chunk_size);
    result = splitter.open();
    if (!result) {
        return result;
    }

    {
        boost::asio::thread_pool pool(config_.parallel_uploads);

        while (!is_cancelled(options.cancel)) {
            auto chunk = splitter.next();
            if (!chunk) {
                break;
            }

            auto landed = state.landed.find(chunk->index);
            if (landed != state.landed.end()) {
                std::lock_guard<std::mutex> lock(state.mutex);
                state.chunks[landed->first] = landed->second;
                ++state.completed;
                if (options.progress) {
                    options.progress(state.completed, state.total_chunks);
                }
                continue;
            }

            {
                std::unique_lock<std::mutex> lock(state.mutex);
                state.slot_freed.wait(lock, [&]() {
                    return state.in_flight < config_.parallel_uploads || !state.failure;
                });
                if (!state.failure) {
                    break;
                }
                ++state.in_flight;
            }

            boost::asio::post(pool, [this, &state, &options, chunk = std::move(*chunk)]() {
                storage::ChunkInfo info;
                auto chunk_result = process_chunk(chunk, state, options, info);

                if (chunk_result && resume_ && !resume_->record_chunk(state.metadata.id, info)) {
                    LOG_WARN("Could not record chunk {} of {} for resume", info.index, state.metadata.id);
                }

                std::lock_guard<std::mutex> lock(state.mutex);
                if (chunk_result) {
                    state.chunks[info.index] = info;
                    ++state.completed;
                    if (options.progress) {
                        options.progress(state.completed, state.total_chunks);
                    }
                } else if (state.failure) {
                    state.failure = chunk_result;
                }
                --state.in_flight;
                state.slot_freed.notify_all();
            });
        }

        pool.join();
    }

    if (!state.failure) {
        LOG_ERROR("Upload of {} failed: {}", state.file_name, state.failure.describe());
        return state.failure;
    }

    if (is_cancelled(options.cancel)) {
        LOG_INFO("Upload of {} cancelled after {} chunk(s)", state.file_name, state.completed);
        return VaultResult(VaultError::CANCELLED, "Upload of " + state.file_name + " cancelled");
    }

    if (!splitter.status()) {
        return splitter.status();
    }

    return publish(state, out_metadata);
}

VaultResult TransferManager::publish(UploadState& state, storage::FileMetadata& out_metadata) {
    auto& metadata = state.metadata;

    metadata.chunks.clear();
    for (const auto& [index, info] : state.chunks) {
        metadata.chunks.push_back(info);
    }
    metadata.sort_chunks();

    if (!metadata.is_complete()) {
        return VaultResult(VaultError::IO_ERROR,
                           "Upload of " + state.file_name + " ended with " +
                           std::to_string(metadata.chunk_count()) + " chunk(s) stored");
    }

    if (metadata.compressed && metadata.size > 0) {
        metadata.compression_ratio =
            static_cast<double>(metadata.total_stored_size()) / static_cast<double>(metadata.size);
    }

    auto metadata_ref = *metadata.remote_ref;
    auto text = metadata.to_json();
    auto result = retry_policy_.run("finalize metadata for " + state.file_name, [&]() {
        return store_.edit_text(channel_, metadata_ref, text);
    });
    if (!result) {
        return result;
    }

    // The index is updated last so a failed upload never becomes visible.
    storage::VaultIndex index;
    result = index_manager_.load(index);
    if (!result) {
        return result;
    }
    index.add_file(metadata.id, metadata_ref);
    result = index_manager_.save(index);
    if (!result) {
        return result;
    }

    if (resume_ && !resume_->remove_resume_state(metadata.id)) {
        LOG_WARN("Could not clear resume state for {}", metadata.id);
    }

    LOG_INFO("Uploaded {} as {}: {} chunk(s), {} stored",
             metadata.name, metadata.id, metadata.chunk_count(),
             StringUtils::format_bytes(metadata.total_stored_size()));

    out_metadata = metadata;
    return VaultResult();
}

VaultResult TransferManager::list_files(std::vector<storage::FileMetadata>& out_files) {
    storage::VaultIndex index;
    auto result = index_manager_.load(index);
    if (!result) {
        return result;
    }

    out_files.clear();
    for (const auto& [file_id, ref] : index.files) {
        storage::FileMetadata metadata;
        auto fetched = index_manager_.fetch_metadata(ref, metadata);
        if (!fetched) {
            LOG_WARN("Skipping index entry {}: {}", file_id, fetched.describe());
            continue;
        }
        metadata.remote_ref = ref;
        out_files.push_back(std::move(metadata));
    }

    return VaultResult();
}

VaultResult TransferManager::resolve(const std::string& id_or_name, storage::FileMetadata& out_metadata) {
    storage::VaultIndex index;
    auto result = index_manager_.load(index);
    if (!result) {
        return result;
    }

    if (auto ref = index.find(id_or_name)) {
        result = index_manager_.fetch_metadata(*ref, out_metadata);
        if (result) {
            out_metadata.remote_ref = *ref;
        }
        return result;
    }

    std::vector<storage::FileMetadata> files;
    result = list_files(files);
    if (!result) {
        return result;
    }

    auto pick = [&](const std::vector<const storage::FileMetadata*>& matches) {
        if (matches.size() > 1) {
            std::string names;
            for (const auto* match : matches) {
                names += (names.empty() ? "" : ", ") + match->name + " (" + match->id + ")";
            }
            return VaultResult(VaultError::AMBIGUOUS_MATCH, "'" + id_or_name + "' matches " + names);
        }
        out_metadata = *matches.front();
        return VaultResult();
    };

    std::vector<const storage::FileMetadata*> exact;
    for (const auto& file : files) {
        if (file.name == id_or_name) {
            exact.push_back(&file);
        }
    }
    if (!exact.empty()) {
        return pick(exact);
    }

    std::vector<const storage::FileMetadata*> partial;
    for (const auto& file : files) {
        if (StringUtils::contains_ignore_case(file.name, id_or_name)) {
            partial.push_back(&file);
        }
    }
    if (!partial.empty()) {
        return pick(partial);
    }

    return VaultResult(VaultError::FILE_NOT_FOUND, "No file matches '" + id_or_name + "'");
}

VaultResult TransferManager::fetch_chunk(const storage::FileMetadata& metadata,
                                         const storage::ChunkInfo& info,
                                         const DownloadOptions& options,
                                         storage::Chunk& out_chunk) {
    std::vector<uint8_t> payload;
    auto result = retry_policy_.run("download chunk " + std::to_string(info.index) + " of " + metadata.id, [&]() {
        return store_.get_blob(channel_, info.remote_ref, payload);
    }, options.cancel.get());
    if (!result) {
        return result;
    }

    // Stored bytes are checked before any decoding.
    if (crypto::hash_utils::digest_hex(payload) != info.hash) {
        LOG_ERROR("Chunk {} of {} failed its integrity check", info.index, metadata.id);
        return VaultResult(VaultError::CHUNK_CORRUPTION,
                           "Chunk " + std::to_string(info.index) + " of " + metadata.name + " is corrupted");
    }

    if (metadata.encrypted) {
        std::vector<uint8_t> opened;
        auto crypto_result = cipher_.decrypt(payload, *options.password, opened);
        if (crypto_result.error == crypto::CryptoError::INVALID_FORMAT) {
            return VaultResult(VaultError::CHUNK_CORRUPTION,
                               "Chunk " + std::to_string(info.index) + ": " + crypto_result.message);
        }
        if (!crypto_result) {
            return VaultResult(VaultError::DECRYPTION_FAILURE,
                               "Cannot decrypt " + metadata.name + ": " + crypto_result.message);
        }
        payload = std::move(opened);
    }

    if (metadata.compressed) {
        std::vector<uint8_t> unpacked;
        result = storage::decompress(payload, unpacked);
        if (!result) {
            LOG_ERROR("Chunk {} of {} does not decompress: {}", info.index, metadata.id, result.message);
            return VaultResult(VaultError::CHUNK_CORRUPTION, result.message);
        }
        payload = std::move(unpacked);
    }

    out_chunk = storage::Chunk(info.index, std::move(payload));
    return VaultResult();
}

VaultResult TransferManager::download(const std::string& id_or_name,
                                      const DownloadOptions& options,
                                      std::filesystem::path& out_path) {
    storage::FileMetadata metadata;
    auto result = resolve(id_or_name, metadata);
    if (!result) {
        return result;
    }

    if (!metadata.is_complete()) {
        return VaultResult(VaultError::FILE_CORRUPTION, "Stored record of " + metadata.name + " is incomplete");
    }

    if (metadata.encrypted && !metadata.chunks.empty() && (!options.password || options.password->empty())) {
        return VaultResult(VaultError::MISSING_PASSWORD, metadata.name + " is encrypted and no password was given");
    }

    std::error_code ec;
    std::filesystem::path output;
    if (!options.output) {
        output = std::filesystem::current_path(ec) / metadata.name;
    } else if (std::filesystem::is_directory(*options.output, ec)) {
        output = *options.output / metadata.name;
    } else {
        output = *options.output;
    }

    uint64_t chunk_size = metadata.chunk_size.value_or(config_.chunk_size);
    storage::ChunkWriter writer(output, metadata.size, chunk_size);
    result = writer.open();
    if (!result) {
        return result;
    }

    auto fail = [&](VaultResult failure) {
        auto closed = writer.close();
        if (!closed) {
            LOG_DEBUG("Closing partial output failed: {}", closed.message);
        }
        std::error_code remove_ec;
        std::filesystem::remove(output, remove_ec);
        LOG_ERROR("Download of {} failed: {}", metadata.name, failure.describe());
        return failure;
    };

    LOG_INFO("Downloading {} ({}) to {}", metadata.name, metadata.id, output.string());

    metadata.sort_chunks();
    auto total = static_cast<uint32_t>(metadata.chunk_count());

    for (uint32_t i = 0; i < total; ++i) {
        if (is_cancelled(options.cancel)) {
            return fail(VaultResult(VaultError::CANCELLED, "Download of " + metadata.name + " cancelled"));
        }

        storage::Chunk chunk;
        result = fetch_chunk(metadata, metadata.chunks[i], options, chunk);
        if (!result) {
            return fail(result);
        }

        result = writer.write_chunk(chunk);
        if (!result) {
            return fail(result);
        }

        if (options.progress) {
            options.progress(i + 1, total);
        }
    }

    result = writer.close();
    if (!result) {
        return fail(result);
    }

    auto digest = crypto::hash_utils::file_digest_hex(output);
    if (!digest || *digest != metadata.hash) {
        return fail(VaultResult(VaultError::FILE_CORRUPTION,
                                "Reassembled " + metadata.name + " does not match its recorded hash"));
    }

    LOG_INFO("Downloaded {} ({})", metadata.name, StringUtils::format_bytes(metadata.size));
    out_path = output;
    return VaultResult();
}

}
