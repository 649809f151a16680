#include <gtest/gtest.h>
#include "GenerationStore.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <csignal>
#include <sys/resource.h>

namespace fs = std::filesystem;

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (fs::temp_directory_path() / (std::string("lifechain_") + info->name() + ".dat")).string();
        fs::remove(path_);
    }

    void TearDown() override {
        fs::remove(path_);
    }

    static Generation sample(int seed) {
        BitBoard board;
        board.setBit(seed % BitBoard::WIDTH, (seed * 3) % BitBoard::HEIGHT, true);
        board.setBit((seed + 5) % BitBoard::WIDTH, 15, true);
        return Generation(board, 1000 + seed, 500 + seed);
    }

    void writeRaw(const std::string& bytes) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::string path_;
};

TEST_F(FileStoreTest, MissingFileIsUninitialized) {
    FileStore store(path_);
    EXPECT_FALSE(store.isInitialized());
    EXPECT_FALSE(fs::exists(path_));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(FileStoreTest, InitializeCreatesEmptyFile) {
    FileStore store(path_);
    store.initialize();

    EXPECT_TRUE(store.isInitialized());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(fs::file_size(path_), FileStore::HEADER_SIZE);
}

TEST_F(FileStoreTest, AppendAndLoad) {
    FileStore store(path_);
    store.initialize();
    store.append(sample(1));
    store.append(sample(2));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.load(0), sample(1));
    EXPECT_EQ(store.load(1), sample(2));
    EXPECT_EQ(fs::file_size(path_), FileStore::HEADER_SIZE + 2 * FileStore::RECORD_SIZE);
}

TEST_F(FileStoreTest, SurvivesReopen) {
    {
        FileStore store(path_);
        store.initialize();
        store.append(sample(1));
        store.append(sample(2));
        store.replace(0, sample(7));
    }

    FileStore reopened(path_);
    EXPECT_TRUE(reopened.isInitialized());
    ASSERT_EQ(reopened.size(), 2u);
    EXPECT_EQ(reopened.load(0), sample(7));
    EXPECT_EQ(reopened.load(1), sample(2));
}

TEST_F(FileStoreTest, InitializeKeepsExistingEntries) {
    {
        FileStore store(path_);
        store.initialize();
        store.append(sample(3));
    }

    FileStore reopened(path_);
    reopened.initialize();
    EXPECT_EQ(reopened.size(), 1u);
    EXPECT_EQ(reopened.load(0), sample(3));
}

TEST_F(FileStoreTest, OutOfRangeAccessThrows) {
    FileStore store(path_);
    store.initialize();
    store.append(sample(1));

    EXPECT_THROW(store.load(1), IndexNotFound);
    EXPECT_THROW(store.replace(1, sample(2)), IndexNotFound);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(FileStoreTest, AppendBeforeInitializeThrows) {
    FileStore store(path_);
    EXPECT_THROW(store.append(sample(1)), StorageError);
}

TEST_F(FileStoreTest, RejectsBadMagic) {
    writeRaw(std::string("XXXX") + std::string(FileStore::HEADER_SIZE - 4, '\0'));
    EXPECT_THROW(FileStore store(path_), StorageError);
}

TEST_F(FileStoreTest, RejectsShortHeader) {
    writeRaw("LGEN");
    EXPECT_THROW(FileStore store(path_), StorageError);
}

TEST_F(FileStoreTest, RejectsTruncatedRecords) {
    {
        FileStore store(path_);
        store.initialize();
        store.append(sample(1));
        store.append(sample(2));
    }
    fs::resize_file(path_, FileStore::HEADER_SIZE + FileStore::RECORD_SIZE + 3);

    EXPECT_THROW(FileStore store(path_), StorageError);
}

TEST_F(FileStoreTest, RejectsOtherFieldLength) {
    {
        FileStore store(path_);
        store.initialize();
    }
    // Patch the field length (offset 8) from 32 to 64
    {
        std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(8);
        char len = 64;
        file.write(&len, 1);
    }

    EXPECT_THROW(FileStore store(path_), StorageError);
}

TEST_F(FileStoreTest, FailedAppendKeepsCount) {
    FileStore store(path_);
    store.initialize();
    store.append(sample(1));

    // Cap the file size at its current length so the next record write fails
    rlimit saved{};
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
    auto previousHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit capped = saved;
    capped.rlim_cur = FileStore::HEADER_SIZE + FileStore::RECORD_SIZE;
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);

    EXPECT_THROW(store.append(sample(2)), StorageError);

    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, previousHandler);

    EXPECT_EQ(store.size(), 1u);
    EXPECT_THROW(store.load(1), IndexNotFound);

    FileStore reopened(path_);
    EXPECT_EQ(reopened.size(), 1u);
    EXPECT_EQ(reopened.load(0), sample(1));

    // The store stays usable once writes succeed again
    store.append(sample(3));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.load(1), sample(3));
}

TEST(MemoryStoreTest, AppendBeforeInitializeThrows) {
    MemoryStore store;
    EXPECT_THROW(store.append(Generation()), StorageError);
    EXPECT_EQ(store.size(), 0u);
}

TEST(MemoryStoreTest, AppendReplaceLoad) {
    MemoryStore store;
    EXPECT_FALSE(store.isInitialized());
    store.initialize();
    EXPECT_TRUE(store.isInitialized());

    BitBoard board;
    board.setBit(1, 1, true);
    store.append(Generation(board, 3));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.load(0).board, board);

    store.replace(0, Generation(BitBoard(), 4, 3));
    EXPECT_EQ(store.load(0), Generation(BitBoard(), 4, 3));

    EXPECT_THROW(store.load(1), IndexNotFound);
    EXPECT_THROW(store.replace(1, Generation()), IndexNotFound);
}
