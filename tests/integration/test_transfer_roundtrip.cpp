#include <gtest/gtest.h>
#include "chatvault/core/vault.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/remote/memory_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <tuple>

using namespace chatvault;
using chatvault::core::VaultError;

namespace {
    std::vector<uint8_t> text_bytes(size_t size) {
        const std::string line = "id,name,amount\n42,widget,19.99\n";
        std::vector<uint8_t> data;
        while (data.size() < size) {
            data.insert(data.end(), line.begin(), line.end());
        }
        data.resize(size);
        return data;
    }

    std::vector<uint8_t> read_bytes(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    }
}

class TransferFixture : public ::testing::Test {
protected:
    void SetUp() override {
        std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::replace(test_name.begin(), test_name.end(), '/', '_');
        work_dir = std::filesystem::temp_directory_path() / ("chatvault_it_" + test_name);
        std::filesystem::remove_all(work_dir);
        std::filesystem::create_directories(work_dir / "in");
        std::filesystem::create_directories(work_dir / "out");

        config.chunk_size = 100;
        config.kdf = crypto::KdfParams::minimal();
        config.retry_delay = std::chrono::milliseconds(0);
        config.max_backoff = std::chrono::milliseconds(0);

        ASSERT_TRUE(store.connect());
    }

    void TearDown() override {
        vault.reset();
        std::filesystem::remove_all(work_dir);
    }

    void open_vault() {
        vault = std::make_unique<core::Vault>(store, config);
        if (config.channel_id) {
            return;
        }
        remote::ChannelId created = 0;
        ASSERT_TRUE(vault->setup_channel(std::nullopt, created));
        channel = created;
        config.channel_id = created;
    }

    std::filesystem::path write_input(const std::string& name, const std::vector<uint8_t>& data,
                                      const std::string& subdir = "in") {
        auto path = work_dir / subdir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return path;
    }

    transfer::UploadOptions with_password(const std::string& password) {
        transfer::UploadOptions options;
        options.password = password;
        return options;
    }

    transfer::DownloadOptions download_to(const std::string& name,
                                          std::optional<std::string> password = std::nullopt) {
        transfer::DownloadOptions options;
        options.output = work_dir / "out" / name;
        options.password = std::move(password);
        return options;
    }

    remote::MemoryStore store;
    storage::VaultConfig config;
    std::unique_ptr<core::Vault> vault;
    remote::ChannelId channel = 0;
    std::filesystem::path work_dir;
};

class CodecGridTest : public TransferFixture,
                      public ::testing::WithParamInterface<std::tuple<bool, bool>> {};

TEST_P(CodecGridTest, RoundTripRestoresExactBytes) {
    auto [compression, encryption] = GetParam();
    config.compression = compression;
    config.encryption = encryption;
    open_vault();

    auto data = text_bytes(250);
    auto input = write_input("table.csv", data);

    transfer::UploadOptions upload_options;
    if (encryption) {
        upload_options.password = "pw";
    }

    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, upload_options, metadata));
    EXPECT_EQ(metadata.chunk_count(), 3u);
    EXPECT_EQ(metadata.size, 250u);
    EXPECT_EQ(metadata.compressed, compression);
    EXPECT_EQ(metadata.encrypted, encryption);
    EXPECT_EQ(metadata.compression_ratio.has_value(), compression);
    EXPECT_EQ(metadata.id.size(), 12u);

    std::filesystem::path output;
    auto options = download_to("table.csv", encryption ? std::optional<std::string>("pw") : std::nullopt);
    ASSERT_TRUE(vault->download(metadata.id, options, output));
    EXPECT_EQ(read_bytes(output), data);
}

INSTANTIATE_TEST_SUITE_P(Codecs, CodecGridTest,
                         ::testing::Combine(::testing::Bool(), ::testing::Bool()));

TEST_F(TransferFixture, ChunksAreLinkedToMetadataRecord) {
    config.compression = false;
    config.encryption = false;
    open_vault();

    auto input = write_input("raw.bin", text_bytes(250));
    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, {}, metadata));

    ASSERT_TRUE(metadata.remote_ref.has_value());
    std::vector<remote::StoredMessage> replies;
    ASSERT_TRUE(store.list_messages(channel, remote::MessageFilter::replies_to(*metadata.remote_ref), replies));
    ASSERT_EQ(replies.size(), 3u);

    std::vector<std::string> names;
    for (const auto& reply : replies) {
        names.push_back(reply.filename);
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names[0], metadata.id + "_0000.chunk");
    EXPECT_EQ(names[2], metadata.id + "_0002.chunk");
    EXPECT_EQ(metadata.chunks[2].size, 50u);
}

TEST_F(TransferFixture, ProgressIsMonotonic) {
    config.compression = false;
    config.encryption = false;
    config.chunk_size = 10;
    open_vault();

    auto input = write_input("many.txt", text_bytes(95));

    std::mutex mutex;
    std::vector<std::pair<uint32_t, uint32_t>> calls;
    transfer::UploadOptions options;
    options.progress = [&](uint32_t done, uint32_t total) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.emplace_back(done, total);
    };

    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, options, metadata));

    ASSERT_EQ(calls.size(), 10u);
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].first, i + 1);
        EXPECT_EQ(calls[i].second, 10u);
    }
}

TEST_F(TransferFixture, CorruptedChunkIsDetected) {
    config.compression = false;
    config.encryption = false;
    open_vault();

    auto input = write_input("ledger.txt", text_bytes(250));
    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, {}, metadata));

    metadata.sort_chunks();
    ASSERT_TRUE(store.corrupt_blob(channel, metadata.chunks[1].remote_ref, 0));

    std::filesystem::path output;
    auto options = download_to("ledger.txt");
    auto result = vault->download("ledger.txt", options, output);

    EXPECT_EQ(result.error, VaultError::CHUNK_CORRUPTION);
    EXPECT_FALSE(std::filesystem::exists(*options.output));
}

TEST_F(TransferFixture, WholeFileMismatchRemovesOutput) {
    config.compression = false;
    config.encryption = false;
    open_vault();

    auto input = write_input("ledger.txt", text_bytes(250));
    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, {}, metadata));
    ASSERT_TRUE(metadata.remote_ref.has_value());

    // Chunks stay intact; only the recorded whole-file hash changes.
    remote::StoredMessage record;
    ASSERT_TRUE(store.get_message(channel, *metadata.remote_ref, record));
    auto json = nlohmann::json::parse(record.text.value_or("{}"));
    json["hash"] = crypto::hash_utils::digest_hex(text_bytes(251));
    ASSERT_TRUE(store.edit_text(channel, *metadata.remote_ref, json.dump()));

    std::filesystem::path output;
    auto options = download_to("ledger.txt");
    auto result = vault->download(metadata.id, options, output);

    EXPECT_EQ(result.error, VaultError::FILE_CORRUPTION);
    EXPECT_FALSE(std::filesystem::exists(*options.output));
}

TEST_F(TransferFixture, EmptyFile) {
    open_vault();

    auto input = write_input("empty.txt", {});

    std::vector<std::pair<uint32_t, uint32_t>> calls;
    transfer::UploadOptions options = with_password("pw");
    options.progress = [&](uint32_t done, uint32_t total) { calls.emplace_back(done, total); };

    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, options, metadata));
    EXPECT_EQ(metadata.chunk_count(), 0u);
    EXPECT_EQ(metadata.size, 0u);
    EXPECT_EQ(calls, (std::vector<std::pair<uint32_t, uint32_t>>{{1, 1}}));

    std::filesystem::path output;
    ASSERT_TRUE(vault->download("empty.txt", download_to("empty.txt"), output));
    EXPECT_TRUE(std::filesystem::exists(output));
    EXPECT_EQ(std::filesystem::file_size(output), 0u);
}

TEST_F(TransferFixture, NameResolution) {
    config.encryption = false;
    open_vault();

    storage::FileMetadata report_a;
    storage::FileMetadata report_b;
    ASSERT_TRUE(vault->upload(write_input("report_a.txt", text_bytes(20)), {}, report_a));
    ASSERT_TRUE(vault->upload(write_input("report_b.txt", text_bytes(30)), {}, report_b));

    storage::FileMetadata resolved;
    auto& transfers = *vault->transfers();

    EXPECT_EQ(transfers.resolve("report", resolved).error, VaultError::AMBIGUOUS_MATCH);
    EXPECT_EQ(transfers.resolve("missing", resolved).error, VaultError::FILE_NOT_FOUND);

    ASSERT_TRUE(transfers.resolve("report_b.txt", resolved));
    EXPECT_EQ(resolved.id, report_b.id);

    ASSERT_TRUE(transfers.resolve("REPORT_A", resolved));
    EXPECT_EQ(resolved.id, report_a.id);

    ASSERT_TRUE(transfers.resolve(report_a.id, resolved));
    EXPECT_EQ(resolved.name, "report_a.txt");

    storage::FileMetadata duplicate;
    ASSERT_TRUE(vault->upload(write_input("report_a.txt", text_bytes(40), "other"), {}, duplicate));
    EXPECT_EQ(transfers.resolve("report_a.txt", resolved).error, VaultError::AMBIGUOUS_MATCH);
    ASSERT_TRUE(transfers.resolve(duplicate.id, resolved));
    EXPECT_EQ(resolved.size, 40u);
}

TEST_F(TransferFixture, PasswordHandling) {
    open_vault();

    auto input = write_input("secret.txt", text_bytes(250));
    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(input, with_password("right"), metadata));
    EXPECT_TRUE(metadata.encrypted);

    std::filesystem::path output;
    EXPECT_EQ(vault->download("secret.txt", download_to("secret.txt"), output).error,
              VaultError::MISSING_PASSWORD);

    auto wrong = download_to("secret.txt", "wrong");
    EXPECT_EQ(vault->download("secret.txt", wrong, output).error, VaultError::DECRYPTION_FAILURE);
    EXPECT_FALSE(std::filesystem::exists(*wrong.output));

    ASSERT_TRUE(vault->download("secret.txt", download_to("secret.txt", "right"), output));
    EXPECT_EQ(read_bytes(output), text_bytes(250));
}

TEST_F(TransferFixture, DownloadIntoDirectoryUsesStoredName) {
    config.encryption = false;
    open_vault();

    storage::FileMetadata metadata;
    ASSERT_TRUE(vault->upload(write_input("notes.md", text_bytes(120)), {}, metadata));

    transfer::DownloadOptions options;
    options.output = work_dir / "out";

    std::filesystem::path output;
    ASSERT_TRUE(vault->download("notes.md", options, output));
    EXPECT_EQ(output, work_dir / "out" / "notes.md");
    EXPECT_EQ(read_bytes(output), text_bytes(120));
}

TEST_F(TransferFixture, CancelledUploadIsInvisible) {
    config.encryption = false;
    open_vault();

    transfer::UploadOptions options;
    options.cancel = transfer::CancellationToken::create();
    options.cancel->cancel();

    storage::FileMetadata metadata;
    auto result = vault->upload(write_input("draft.txt", text_bytes(250)), options, metadata);
    EXPECT_EQ(result.error, VaultError::CANCELLED);

    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(vault->list_files(files));
    EXPECT_TRUE(files.empty());
}

TEST_F(TransferFixture, InterruptedUploadResumes) {
    config.encryption = false;
    config.compression = false;
    config.parallel_uploads = 1;
    config.resume_database = work_dir / "resume.db";
    open_vault();

    auto input = write_input("big.log", text_bytes(250));

    transfer::UploadOptions first;
    first.cancel = transfer::CancellationToken::create();
    first.progress = [&first](uint32_t done, uint32_t) {
        if (done == 1) {
            first.cancel->cancel();
        }
    };

    storage::FileMetadata metadata;
    EXPECT_EQ(vault->upload(input, first, metadata).error, VaultError::CANCELLED);
    EXPECT_EQ(store.message_count(channel), 3u);

    std::string interrupted_id;
    {
        storage::ResumeManager resume(config.resume_database);
        ASSERT_TRUE(resume.initialize());
        auto pending = resume.list_resumable_transfers();
        ASSERT_EQ(pending.size(), 1u);
        EXPECT_EQ(pending[0].landed_chunks.size(), 1u);
        interrupted_id = pending[0].progress.file_id;
    }

    std::vector<uint32_t> seen;
    transfer::UploadOptions second;
    second.progress = [&seen](uint32_t done, uint32_t) { seen.push_back(done); };

    ASSERT_TRUE(vault->upload(input, second, metadata));
    EXPECT_EQ(metadata.id, interrupted_id);
    EXPECT_EQ(metadata.chunk_count(), 3u);
    EXPECT_EQ(seen, (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_EQ(store.message_count(channel), 5u);

    storage::ResumeManager resume(config.resume_database);
    ASSERT_TRUE(resume.initialize());
    EXPECT_EQ(resume.get_resume_state_count(), 0u);

    std::filesystem::path output;
    ASSERT_TRUE(vault->download(metadata.id, download_to("big.log"), output));
    EXPECT_EQ(read_bytes(output), text_bytes(250));
}

TEST_F(TransferFixture, IndexFoundAfterLongUpload) {
    config.encryption = false;
    config.compression = false;
    config.chunk_size = 10;
    open_vault();

    storage::FileMetadata big;
    storage::FileMetadata small;
    ASSERT_TRUE(vault->upload(write_input("big.bin", text_bytes(200)), {}, big));
    ASSERT_TRUE(vault->upload(write_input("small.bin", text_bytes(5)), {}, small));

    core::Vault fresh(store, config);
    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(fresh.list_files(files));
    ASSERT_EQ(files.size(), 2u);

    std::vector<remote::StoredMessage> pinned;
    ASSERT_TRUE(store.list_messages(channel, remote::MessageFilter::pinned(), pinned));
    EXPECT_EQ(pinned.size(), 1u);
}

TEST_F(TransferFixture, MalformedPinnedNoteDoesNotHideIndex) {
    config.encryption = false;
    open_vault();

    storage::FileMetadata first;
    ASSERT_TRUE(vault->upload(write_input("first.txt", text_bytes(120)), {}, first));

    remote::MessageRef note = 0;
    ASSERT_TRUE(store.send_text(channel, R"({"note":"x","files":{"k":"not-a-ref"}})", note));
    ASSERT_TRUE(store.pin(channel, note));

    core::Vault fresh(store, config);
    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(fresh.list_files(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].id, first.id);

    storage::FileMetadata second;
    ASSERT_TRUE(fresh.upload(write_input("second.txt", text_bytes(30)), {}, second));
    ASSERT_TRUE(fresh.list_files(files));
    EXPECT_EQ(files.size(), 2u);

    // The note and the original index; no replacement index was pinned.
    std::vector<remote::StoredMessage> pinned;
    ASSERT_TRUE(store.list_messages(channel, remote::MessageFilter::pinned(), pinned));
    EXPECT_EQ(pinned.size(), 2u);
}
