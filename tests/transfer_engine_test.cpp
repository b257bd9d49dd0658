#include "test_base.hpp"
#include "core/file_utils.hpp"
#include "core/transfer_engine.hpp"
#include <chrono>
#include <vector>

class TransferEngineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        settings_.chunk_size_bytes = 4096;
        settings_.max_attempts = 3;
        settings_.backoff_base_ms = 10;
        settings_.max_backoff_ms = 40;
        destination_ = getShareDir() + "/Movies";
    }

    TransferEngine makeEngine(bool verify_mount = true)
    {
        return TransferEngine(settings_, getShareDir(), verify_mount,
                              [this](std::chrono::milliseconds delay)
                              { sleeps_.push_back(delay); });
    }

    bool hasTemporaries() const
    {
        std::error_code ec;
        if (!fs::exists(destination_, ec))
            return false;
        for (const auto &entry : fs::directory_iterator(destination_))
        {
            if (FileUtils::isTransferTemporary(entry.path().filename().string()))
                return true;
        }
        return false;
    }

    TransferSettings settings_;
    std::string destination_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(TransferEngineTest, CopiesFileWithSameSizeAndNoTemporary)
{
    const size_t size = 4096 * 5 + 123;
    std::string source = createFile("Heat.1995.mkv", size);

    auto engine = makeEngine();
    auto result = engine.copy(1, source, destination_, "Heat (1995).mkv");

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.bytes_copied, size);
    EXPECT_EQ(result.destination_path, destination_ + "/Heat (1995).mkv");
    EXPECT_EQ(fs::file_size(result.destination_path), size);
    EXPECT_TRUE(fs::exists(source)) << "source must not be modified";
    EXPECT_FALSE(hasTemporaries());
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(TransferEngineTest, ChecksumVerificationPasses)
{
    settings_.verify_checksum = true;
    std::string source = createFile("Ronin.mkv", 10000, 'r');

    auto engine = makeEngine();
    auto result = engine.copy(2, source, destination_, "Ronin (1998).mkv");

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(FileUtils::computeFileHash(source), FileUtils::computeFileHash(result.destination_path));
}

TEST_F(TransferEngineTest, ExistingDestinationIsAConflictAndNotOverwritten)
{
    std::string source = createFile("Alien.mkv", 2048, 'a');
    fs::create_directories(destination_);
    {
        std::ofstream existing(destination_ + "/Alien (1979).mkv");
        existing << "keep me";
    }

    auto engine = makeEngine();
    auto result = engine.copy(3, source, destination_, "Alien (1979).mkv");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::DESTINATION_CONFLICT);
    EXPECT_EQ(result.attempts, 1) << "conflicts are not retried";
    EXPECT_EQ(fs::file_size(destination_ + "/Alien (1979).mkv"), 7u);
    EXPECT_FALSE(hasTemporaries());
}

TEST_F(TransferEngineTest, MissingSourceIsNotRetried)
{
    auto engine = makeEngine();
    auto result = engine.copy(4, getDownloadsDir() + "/gone.mkv", destination_, "Gone.mkv");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::SOURCE_UNAVAILABLE);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(TransferEngine::isRetryable(result.error));
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(TransferEngineTest, InjectedFaultIsRetriedThenSucceeds)
{
    const size_t size = 4096 * 3;
    std::string source = createFile("Arrival.mkv", size);

    auto engine = makeEngine();
    engine.setFaultInjector([](int attempt, uint64_t chunk_index)
                            { return attempt == 1 && chunk_index == 2; });
    auto result = engine.copy(5, source, destination_, "Arrival (2016).mkv");

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.attempts, 2);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0].count(), 10);
    EXPECT_EQ(fs::file_size(result.destination_path), size);
    EXPECT_FALSE(hasTemporaries());
}

TEST_F(TransferEngineTest, PersistentFaultExhaustsAttemptsWithBackoff)
{
    std::string source = createFile("Sicario.mkv", 4096 * 2);

    auto engine = makeEngine();
    engine.setFaultInjector([](int, uint64_t)
                            { return true; });
    auto result = engine.copy(6, source, destination_, "Sicario (2015).mkv");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::IO_ERROR);
    EXPECT_EQ(result.attempts, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 10);
    EXPECT_EQ(sleeps_[1].count(), 20);
    EXPECT_FALSE(fs::exists(destination_ + "/Sicario (2015).mkv"));
    EXPECT_FALSE(hasTemporaries());
}

TEST_F(TransferEngineTest, UnreachableShareIsRetryable)
{
    std::string source = createFile("Dune.mkv", 1024);
    TransferEngine engine(settings_, getTestRoot() + "/not_mounted", true,
                          [this](std::chrono::milliseconds delay)
                          { sleeps_.push_back(delay); });

    auto result = engine.copy(7, source, getTestRoot() + "/not_mounted/Movies", "Dune (2021).mkv");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TransferErrorCode::DESTINATION_UNAVAILABLE);
    EXPECT_TRUE(TransferEngine::isRetryable(result.error));
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(TransferEngineTest, EmptyFileCopies)
{
    std::string source = createFile("Empty.mkv", 0);

    auto engine = makeEngine();
    auto result = engine.copy(8, source, destination_, "Empty.mkv");

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(fs::file_size(result.destination_path), 0u);
}

TEST_F(TransferEngineTest, DeleteSource)
{
    std::string source = createFile("Delete.mkv", 10);
    EXPECT_TRUE(TransferEngine::deleteSource(source));
    EXPECT_FALSE(fs::exists(source));
    EXPECT_FALSE(TransferEngine::deleteSource(source));
}
