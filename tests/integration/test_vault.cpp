#include <gtest/gtest.h>
#include "chatvault/core/vault.hpp"
#include "chatvault/remote/memory_store.hpp"
#include <filesystem>
#include <fstream>

using namespace chatvault;
using chatvault::core::VaultError;

class VaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir = std::filesystem::temp_directory_path() /
                   ("chatvault_vault_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(work_dir);
        std::filesystem::create_directories(work_dir / "a");
        std::filesystem::create_directories(work_dir / "b");

        config.chunk_size = 64;
        config.encryption = false;
        config.retry_delay = std::chrono::milliseconds(0);
        config.max_backoff = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        std::filesystem::remove_all(work_dir);
    }

    std::unique_ptr<core::Vault> ready_vault() {
        EXPECT_TRUE(store.connect());
        auto vault = std::make_unique<core::Vault>(store, config);
        remote::ChannelId created = 0;
        EXPECT_TRUE(vault->setup_channel(std::nullopt, created));
        channel = created;
        return vault;
    }

    std::filesystem::path write_file(const std::string& relative, const std::string& content) {
        auto path = work_dir / relative;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    storage::FileMetadata upload(core::Vault& vault, const std::filesystem::path& path) {
        storage::FileMetadata metadata;
        EXPECT_TRUE(vault.upload(path, transfer::UploadOptions{}, metadata));
        return metadata;
    }

    remote::MemoryStore store;
    storage::VaultConfig config;
    remote::ChannelId channel = 0;
    std::filesystem::path work_dir;
};

TEST_F(VaultTest, SetupNeedsConnection) {
    core::Vault vault(store, config);
    remote::ChannelId created = 0;
    EXPECT_EQ(vault.setup_channel(std::nullopt, created).error, VaultError::NOT_CONNECTED);
}

TEST_F(VaultTest, SetupNeedsAuthorization) {
    ASSERT_TRUE(store.connect());
    store.set_authorized(false);

    core::Vault vault(store, config);
    remote::ChannelId created = 0;
    EXPECT_EQ(vault.setup_channel(std::nullopt, created).error, VaultError::NOT_AUTHENTICATED);
}

TEST_F(VaultTest, LoginConnectsAndAuthorizes) {
    store.set_authorized(false);
    core::Vault vault(store, config);

    std::string session;
    EXPECT_EQ(vault.login("", session).error, VaultError::NOT_AUTHENTICATED);

    ASSERT_TRUE(vault.login("token", session));
    EXPECT_FALSE(session.empty());
    EXPECT_TRUE(store.is_connected());
    EXPECT_TRUE(store.is_authorized());
    EXPECT_EQ(vault.config().store_session, session);
}

TEST_F(VaultTest, OperationsNeedChannel) {
    ASSERT_TRUE(store.connect());
    core::Vault vault(store, config);

    std::vector<storage::FileMetadata> files;
    EXPECT_EQ(vault.list_files(files).error, VaultError::NO_CHANNEL_CONFIGURED);

    bool deleted = true;
    EXPECT_EQ(vault.delete_file("x", deleted).error, VaultError::NO_CHANNEL_CONFIGURED);
    EXPECT_FALSE(deleted);

    core::VaultStatus status;
    EXPECT_EQ(vault.status(status).error, VaultError::NO_CHANNEL_CONFIGURED);

    storage::FileMetadata metadata;
    auto input = write_file("a/data.txt", "hello");
    EXPECT_EQ(vault.upload(input, transfer::UploadOptions{}, metadata).error, VaultError::NO_CHANNEL_CONFIGURED);
    EXPECT_EQ(vault.transfers(), nullptr);
}

TEST_F(VaultTest, OperationsNeedConnection) {
    auto vault = ready_vault();
    vault->disconnect();

    std::vector<storage::FileMetadata> files;
    EXPECT_EQ(vault->list_files(files).error, VaultError::NOT_CONNECTED);
}

TEST_F(VaultTest, ExistingChannelIsAdopted) {
    storage::FileMetadata uploaded;
    {
        auto vault = ready_vault();
        uploaded = upload(*vault, write_file("a/report.txt", "quarterly numbers"));
    }

    core::Vault adopted(store, config);
    remote::ChannelId opened = 0;
    ASSERT_TRUE(adopted.setup_channel(channel, opened));
    EXPECT_EQ(opened, channel);
    EXPECT_EQ(adopted.config().channel_id.value_or(0), channel);

    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(adopted.list_files(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].id, uploaded.id);

    // Only one index exists after adopting.
    std::vector<remote::StoredMessage> pinned;
    ASSERT_TRUE(store.list_messages(channel, remote::MessageFilter::pinned(), pinned));
    EXPECT_EQ(pinned.size(), 1u);
}

TEST_F(VaultTest, SetupRejectsUnknownChannel) {
    ASSERT_TRUE(store.connect());
    core::Vault vault(store, config);
    remote::ChannelId opened = 0;
    EXPECT_EQ(vault.setup_channel(424242, opened).error, VaultError::REMOTE_ERROR);
}

TEST_F(VaultTest, ConfiguredChannelIsUsedWithoutSetup) {
    {
        auto vault = ready_vault();
        upload(*vault, write_file("a/notes.md", "# notes"));
    }

    config.channel_id = channel;
    core::Vault vault(store, config);
    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(vault.list_files(files));
    EXPECT_EQ(files.size(), 1u);
}

TEST_F(VaultTest, DeleteByIdRemovesRecordAndChunks) {
    auto vault = ready_vault();
    auto baseline = store.message_count(channel);

    auto metadata = upload(*vault, write_file("a/big.txt", std::string(200, 'x')));
    EXPECT_EQ(metadata.chunk_count(), 4u);
    EXPECT_EQ(store.message_count(channel), baseline + 5);

    bool deleted = false;
    ASSERT_TRUE(vault->delete_file(metadata.id, deleted));
    EXPECT_TRUE(deleted);
    EXPECT_EQ(store.message_count(channel), baseline);

    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(vault->list_files(files));
    EXPECT_TRUE(files.empty());
}

TEST_F(VaultTest, DeleteByExactName) {
    auto vault = ready_vault();
    upload(*vault, write_file("a/keep.txt", "keep"));
    upload(*vault, write_file("a/drop.txt", "drop"));

    bool deleted = false;
    ASSERT_TRUE(vault->delete_file("drop.txt", deleted));
    EXPECT_TRUE(deleted);

    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(vault->list_files(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "keep.txt");
}

TEST_F(VaultTest, DeleteOfUnknownTargetReportsNothingDeleted) {
    auto vault = ready_vault();
    upload(*vault, write_file("a/keep.txt", "keep"));

    bool deleted = true;
    ASSERT_TRUE(vault->delete_file("missing.txt", deleted));
    EXPECT_FALSE(deleted);

    // Substrings are not enough to delete.
    ASSERT_TRUE(vault->delete_file("keep", deleted));
    EXPECT_FALSE(deleted);
}

TEST_F(VaultTest, DeleteOfDuplicateNameIsAmbiguous) {
    auto vault = ready_vault();
    auto first = upload(*vault, write_file("a/same.txt", "first"));
    upload(*vault, write_file("b/same.txt", "second"));

    bool deleted = true;
    EXPECT_EQ(vault->delete_file("same.txt", deleted).error, VaultError::AMBIGUOUS_MATCH);
    EXPECT_FALSE(deleted);

    ASSERT_TRUE(vault->delete_file(first.id, deleted));
    EXPECT_TRUE(deleted);

    std::vector<storage::FileMetadata> files;
    ASSERT_TRUE(vault->list_files(files));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_NE(files[0].id, first.id);
}

TEST_F(VaultTest, SearchIsCaseInsensitiveSubstring) {
    auto vault = ready_vault();
    upload(*vault, write_file("a/Annual_Report.pdf", "pdf bytes"));
    upload(*vault, write_file("a/report-draft.txt", "draft"));
    upload(*vault, write_file("a/photo.jpg", "jpeg bytes"));

    std::vector<storage::FileMetadata> found;
    ASSERT_TRUE(vault->search("REPORT", found));
    EXPECT_EQ(found.size(), 2u);

    ASSERT_TRUE(vault->search("photo", found));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "photo.jpg");

    ASSERT_TRUE(vault->search("nothing", found));
    EXPECT_TRUE(found.empty());
}

TEST_F(VaultTest, StatusOfEmptyVault) {
    auto vault = ready_vault();

    core::VaultStatus status;
    ASSERT_TRUE(vault->status(status));
    EXPECT_EQ(status.channel_id, channel);
    EXPECT_EQ(status.file_count, 0u);
    EXPECT_EQ(status.total_size, 0u);
    EXPECT_EQ(status.stored_size, 0u);
    EXPECT_DOUBLE_EQ(status.ratio, 1.0);
}

TEST_F(VaultTest, StatusSumsFiles) {
    config.compression = true;
    auto vault = ready_vault();
    upload(*vault, write_file("a/one.txt", std::string(100, 'a')));
    upload(*vault, write_file("a/two.txt", std::string(50, 'b')));

    core::VaultStatus status;
    ASSERT_TRUE(vault->status(status));
    EXPECT_EQ(status.file_count, 2u);
    EXPECT_EQ(status.total_size, 150u);
    EXPECT_GT(status.stored_size, 0u);
    EXPECT_LT(status.ratio, 1.0);
}
