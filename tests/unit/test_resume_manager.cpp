#include <gtest/gtest.h>
#include "chatvault/storage/resume_manager.hpp"
#include <filesystem>

using namespace chatvault::storage;

class ResumeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = std::filesystem::temp_directory_path() / "chatvault_resume_test.db";
        std::filesystem::remove(db_path);
        manager = std::make_unique<ResumeManager>(db_path);
        ASSERT_TRUE(manager->initialize());
    }

    void TearDown() override {
        manager.reset();
        std::filesystem::remove(db_path);
    }

    ResumeInfo make_info(const std::string& file_id, const std::string& name) {
        ResumeInfo info;
        info.key = UploadKey{name, "hash-" + name, 100, true, false};
        info.metadata_ref = 42;
        info.progress.operation = TransferOperation::UPLOAD;
        info.progress.file_id = file_id;
        info.progress.file_name = name;
        info.progress.total_chunks = 3;
        info.progress.started_at = 1700000000.0;
        return info;
    }

    std::filesystem::path db_path;
    std::unique_ptr<ResumeManager> manager;
};

TEST_F(ResumeManagerTest, SaveAndLoad) {
    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "data.csv")));

    auto loaded = manager->load_resume_state("abc");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->key.file_name, "data.csv");
    EXPECT_EQ(loaded->key.chunk_size, 100u);
    EXPECT_TRUE(loaded->key.compressed);
    EXPECT_FALSE(loaded->key.encrypted);
    EXPECT_EQ(loaded->metadata_ref, 42);
    EXPECT_EQ(loaded->progress.total_chunks, 3u);
    EXPECT_TRUE(loaded->landed_chunks.empty());

    EXPECT_FALSE(manager->load_resume_state("missing").has_value());
}

TEST_F(ResumeManagerTest, RecordedChunksMarkProgress) {
    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "data.csv")));
    ASSERT_TRUE(manager->record_chunk("abc", ChunkInfo{0, 501, 80, "h0"}));
    ASSERT_TRUE(manager->record_chunk("abc", ChunkInfo{2, 503, 40, "h2"}));
    ASSERT_TRUE(manager->record_chunk("abc", ChunkInfo{2, 503, 40, "h2"}));

    auto loaded = manager->load_resume_state("abc");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->landed_chunks.size(), 2u);
    EXPECT_EQ(loaded->landed_chunks.at(2), (ChunkInfo{2, 503, 40, "h2"}));
    EXPECT_EQ(loaded->progress.pending_chunks(), (std::vector<uint32_t>{1}));
}

TEST_F(ResumeManagerTest, FindUploadMatchesWholeKey) {
    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "data.csv")));

    UploadKey key{"data.csv", "hash-data.csv", 100, true, false};
    auto found = manager->find_upload(key);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->progress.file_id, "abc");

    auto other_chunking = key;
    other_chunking.chunk_size = 200;
    EXPECT_FALSE(manager->find_upload(other_chunking).has_value());

    auto other_codec = key;
    other_codec.encrypted = true;
    EXPECT_FALSE(manager->find_upload(other_codec).has_value());

    auto other_content = key;
    other_content.file_hash = "different";
    EXPECT_FALSE(manager->find_upload(other_content).has_value());
}

TEST_F(ResumeManagerTest, RemoveAndList) {
    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "a.txt")));
    ASSERT_TRUE(manager->save_resume_state(make_info("def", "b.txt")));
    ASSERT_TRUE(manager->record_chunk("abc", ChunkInfo{0, 1, 1, "x"}));
    EXPECT_EQ(manager->get_resume_state_count(), 2u);

    auto transfers = manager->list_resumable_transfers();
    ASSERT_EQ(transfers.size(), 2u);
    EXPECT_EQ(transfers[0].progress.file_id, "abc");
    EXPECT_EQ(transfers[0].landed_chunks.size(), 1u);

    ASSERT_TRUE(manager->remove_resume_state("abc"));
    EXPECT_EQ(manager->get_resume_state_count(), 1u);
    EXPECT_FALSE(manager->load_resume_state("abc").has_value());

    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "a.txt")));
    EXPECT_TRUE(manager->load_resume_state("abc")->landed_chunks.empty());
}

TEST_F(ResumeManagerTest, SurvivesReopen) {
    ASSERT_TRUE(manager->save_resume_state(make_info("abc", "a.txt")));
    ASSERT_TRUE(manager->record_chunk("abc", ChunkInfo{1, 7, 9, "y"}));
    manager.reset();

    ResumeManager reopened(db_path);
    ASSERT_TRUE(reopened.initialize());
    auto loaded = reopened.load_resume_state("abc");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->landed_chunks.count(1), 1u);
}
