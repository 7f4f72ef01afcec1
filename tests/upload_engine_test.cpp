#include <gtest/gtest.h>

#include "core/upload_engine/upload_engine.hpp"
#include "extensions/state_persistor.hpp"
#include "infra/interrupt.hpp"
#include "test_helpers.hpp"

using vaultup::core::UploadEngine;
using vaultup::core::UploadRequest;
using vaultup::core::UploadState;
using vaultup::extensions::YamlStatePersistor;
using vaultup::infra::ErrorCode;
using vaultup::test::FakeRemoteSession;
using vaultup::test::MiB;
using vaultup::test::TempDir;

namespace {

// Запоминает вызовы, но ничего не сохраняет
class FailingPersistor final : public vaultup::extensions::StatePersistor {
public:
    int dump_calls = 0;

    auto dump(const vaultup::core::UploadJob&) -> std::optional<std::filesystem::path> override {
        ++dump_calls;
        return std::nullopt;
    }
    auto load(const std::filesystem::path& location)
        -> vaultup::infra::Result<vaultup::extensions::ResumeRecord> override
    {
        return std::unexpected(vaultup::infra::make_error(ErrorCode::FileNotFound, location.string()));
    }
    void discard(const std::filesystem::path&) override {}
};

class UploadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        vaultup::infra::clear_interrupt();
        file_ = dir_ / "archive.bin";
        data_ = vaultup::test::write_file(file_, 10 * MiB);
    }

    void TearDown() override {
        vaultup::infra::clear_interrupt();
    }

    auto request(std::uint64_t chunk_size_mb = 4) const -> UploadRequest {
        return UploadRequest{
            .file_path = file_,
            .vault_name = "photos",
            .description = "archive.bin",
            .chunk_size_mb = chunk_size_mb
        };
    }

    auto make_engine(vaultup::adapters::RemoteSession& remote,
                     vaultup::extensions::StatePersistor& persistor) -> UploadEngine {
        return UploadEngine(remote, persistor, monitor_, &vaultup::infra::XXHashDigest::file_checksum);
    }

    auto state_records() const -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> records;
        for (const auto& entry : std::filesystem::directory_iterator(state_dir_.path())) {
            records.push_back(entry.path());
        }
        return records;
    }

    TempDir dir_;
    TempDir state_dir_;
    std::filesystem::path file_;
    std::vector<char> data_;
    vaultup::infra::ProgressMonitor monitor_{false};
};

} // namespace

TEST(ChunkSizeValidationTest, AcceptsPowersOfTwoInRange)
{
    for (std::uint64_t mb : {1u, 2u, 4u, 128u, 1024u, 4096u}) {
        EXPECT_TRUE(UploadEngine::validate_chunk_size_mb(mb).has_value()) << mb;
    }
}

TEST(ChunkSizeValidationTest, RejectsOutOfRangeOrNotPowerOfTwo)
{
    for (std::uint64_t mb : {0u, 3u, 129u, 5000u, 8192u}) {
        auto valid = UploadEngine::validate_chunk_size_mb(mb);
        ASSERT_FALSE(valid.has_value()) << mb;
        EXPECT_EQ(valid.error().code, ErrorCode::InvalidChunkSize);
        EXPECT_EQ(valid.error().kind(), vaultup::infra::ErrorKind::Validation);
    }
}

TEST(ChunkSizeValidationTest, MessagesDescribeTheProblem)
{
    EXPECT_EQ(UploadEngine::validate_chunk_size_mb(5000).error().message,
              "Illegal chunk size: expected value between 1 MiB and 4 GiB, received 5000.");
    EXPECT_EQ(UploadEngine::validate_chunk_size_mb(129).error().message,
              "Illegal chunk size: size must be a power of 2.");
}

TEST_F(UploadEngineTest, UploadsTenMiBInThreeChunks)
{
    FakeRemoteSession remote;
    YamlStatePersistor persistor(state_dir_.path());
    auto engine = make_engine(remote, persistor);

    ASSERT_TRUE(engine.start(request()).has_value());
    EXPECT_EQ(engine.state(), UploadState::Initiating);
    EXPECT_EQ(engine.job().chunk_count, 3u);
    EXPECT_EQ(engine.job().session.session_id, "upload-1");

    auto result = engine.run();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(engine.state(), UploadState::Done);

    EXPECT_EQ(remote.range_headers, (std::vector<std::string>{
        "bytes 0-4194303/*",
        "bytes 4194304-8388607/*",
        "bytes 8388608-10485759/*",
    }));
    EXPECT_EQ(remote.parts.at(0).size(), 4 * MiB);
    EXPECT_EQ(remote.parts.at(4 * MiB).size(), 4 * MiB);
    EXPECT_EQ(remote.parts.at(8 * MiB).size(), 2 * MiB);

    const auto& job = engine.job();
    EXPECT_EQ(job.cur_byte, 10485760u);
    EXPECT_EQ(job.cur_chunk, 3u);
    ASSERT_EQ(job.part_checksums.size(), 3u);
    EXPECT_EQ(job.part_checksums.begin()->first, 1u);
    EXPECT_EQ(job.part_checksums.rbegin()->first, 3u);

    EXPECT_EQ(remote.completed_size, 10485760u);
    EXPECT_EQ(remote.completed_checksum, vaultup::infra::XXHashDigest::file_checksum(file_).value());
    EXPECT_EQ(remote.assembled(), data_);
    EXPECT_TRUE(state_records().empty());
}

TEST_F(UploadEngineTest, InvalidChunkSizeRejectedBeforeAnyIo)
{
    FakeRemoteSession remote;
    YamlStatePersistor persistor(state_dir_.path());
    auto engine = make_engine(remote, persistor);

    auto req = request(129);
    req.file_path = dir_ / "does-not-exist";
    auto started = engine.start(req);

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::InvalidChunkSize);
    EXPECT_EQ(remote.initiate_calls, 0u);
    EXPECT_TRUE(state_records().empty());
}

TEST_F(UploadEngineTest, RemoteFailureOnSecondChunkWritesResumeRecord)
{
    FakeRemoteSession remote;
    remote.fail_upload_call = 2;
    YamlStatePersistor persistor(state_dir_.path());
    auto engine = make_engine(remote, persistor);

    ASSERT_TRUE(engine.start(request()).has_value());
    auto result = engine.run();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RemoteFailure);
    EXPECT_EQ(result.error().message, "connection reset by peer");
    EXPECT_EQ(engine.state(), UploadState::Aborted);
    EXPECT_EQ(remote.complete_calls, 0u);

    ASSERT_TRUE(engine.last_resume_record().has_value());
    auto record = persistor.load(*engine.last_resume_record());
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->cur_chunk, 1u);
    EXPECT_EQ(record->cur_byte, 4194304u);
    ASSERT_EQ(record->part_checksums.size(), 1u);
    EXPECT_EQ(record->part_checksums.count(1), 1u);
    EXPECT_EQ(record->upload_id, "upload-1");
    EXPECT_EQ(record->vault_name, "photos");
    EXPECT_EQ(record->chunk_size_mb, 4u);
}

TEST_F(UploadEngineTest, ResumeSendsOnlyRemainingChunks)
{
    FakeRemoteSession remote;
    YamlStatePersistor persistor(state_dir_.path());

    // Эталон: непрерывная загрузка того же файла
    FakeRemoteSession reference_remote;
    auto reference = make_engine(reference_remote, persistor);
    ASSERT_TRUE(reference.start(request()).has_value());
    ASSERT_TRUE(reference.run().has_value());

    remote.fail_upload_call = 2;
    std::filesystem::path record_path;
    {
        auto engine = make_engine(remote, persistor);
        ASSERT_TRUE(engine.start(request()).has_value());
        ASSERT_FALSE(engine.run().has_value());
        ASSERT_TRUE(engine.last_resume_record().has_value());
        record_path = *engine.last_resume_record();
    }

    remote.fail_upload_call.reset();
    remote.range_headers.clear();

    auto resumed = make_engine(remote, persistor);
    auto bound = resumed.resume(record_path);
    ASSERT_TRUE(bound.has_value()) << bound.error().message;
    EXPECT_EQ(resumed.state(), UploadState::Resuming);
    EXPECT_EQ(remote.initiate_calls, 1u);
    EXPECT_EQ(remote.resume_calls, 1u);

    auto result = resumed.run();
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(remote.range_headers, (std::vector<std::string>{
        "bytes 4194304-8388607/*",
        "bytes 8388608-10485759/*",
    }));
    EXPECT_EQ(resumed.job().cur_byte, 10 * MiB);
    EXPECT_EQ(resumed.job().part_checksums, reference.job().part_checksums);
    EXPECT_EQ(remote.completed_checksum, reference_remote.completed_checksum);
    EXPECT_EQ(remote.assembled(), data_);

    // Использованная запись удаляется
    EXPECT_FALSE(std::filesystem::exists(record_path));
    EXPECT_TRUE(state_records().empty());
}

TEST_F(UploadEngineTest, FailedResumeReplacesConsumedRecord)
{
    FakeRemoteSession remote;
    remote.fail_upload_call = 2;
    YamlStatePersistor persistor(state_dir_.path());

    std::filesystem::path first_record;
    {
        auto engine = make_engine(remote, persistor);
        ASSERT_TRUE(engine.start(request(1)).has_value());
        ASSERT_FALSE(engine.run().has_value());
        first_record = engine.last_resume_record().value();
    }

    // Второй запуск падает на следующем чанке
    remote.fail_upload_call = remote.upload_calls + 2;
    auto resumed = make_engine(remote, persistor);
    ASSERT_TRUE(resumed.resume(first_record).has_value());
    ASSERT_FALSE(resumed.run().has_value());

    ASSERT_TRUE(resumed.last_resume_record().has_value());
    EXPECT_FALSE(std::filesystem::exists(first_record));

    auto record = persistor.load(*resumed.last_resume_record());
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->cur_chunk, 2u);
    EXPECT_EQ(record->cur_byte, 2 * MiB);
    EXPECT_EQ(state_records().size(), 1u);
}

TEST_F(UploadEngineTest, InterruptBetweenChunksLeavesResumeRecord)
{
    FakeRemoteSession remote;
    remote.on_upload = [](std::size_t call) {
        if (call == 1) vaultup::infra::request_interrupt();
    };
    YamlStatePersistor persistor(state_dir_.path());
    auto engine = make_engine(remote, persistor);

    ASSERT_TRUE(engine.start(request()).has_value());
    auto result = engine.run();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(result.error().to_exit_code(), 130);
    EXPECT_EQ(remote.upload_calls, 1u);

    auto record = persistor.load(engine.last_resume_record().value());
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->cur_chunk, 1u);
    EXPECT_EQ(record->cur_byte, 4 * MiB);
}

TEST_F(UploadEngineTest, DumpFailureDoesNotMaskOriginalError)
{
    FakeRemoteSession remote;
    remote.fail_upload_call = 1;
    FailingPersistor persistor;
    auto engine = make_engine(remote, persistor);

    ASSERT_TRUE(engine.start(request()).has_value());
    auto result = engine.run();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RemoteFailure);
    EXPECT_EQ(persistor.dump_calls, 1);
    EXPECT_FALSE(engine.last_resume_record().has_value());
}

TEST_F(UploadEngineTest, InitiateFailurePropagatesWithoutDump)
{
    FakeRemoteSession remote;
    remote.fail_initiate = ErrorCode::VaultNotFound;
    FailingPersistor persistor;
    auto engine = make_engine(remote, persistor);

    auto started = engine.start(request());
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::VaultNotFound);
    EXPECT_EQ(started.error().kind(), vaultup::infra::ErrorKind::Remote);
    EXPECT_EQ(engine.state(), UploadState::Aborted);
    EXPECT_EQ(persistor.dump_calls, 0);

    // После неудачи передача невозможна
    auto sent = engine.transmit();
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::InvalidState);
}

TEST_F(UploadEngineTest, ChecksumMismatchAtCompletionIsFatal)
{
    FakeRemoteSession remote;
    FailingPersistor persistor;
    UploadEngine engine(remote, persistor, monitor_,
                        [](const std::filesystem::path&) -> vaultup::infra::Result<std::string> {
                            return std::string("0000000000000000");
                        });

    ASSERT_TRUE(engine.start(request()).has_value());
    auto result = engine.run();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(result.error().to_exit_code(), 22);
    EXPECT_EQ(engine.state(), UploadState::Aborted);
    EXPECT_EQ(remote.upload_calls, 3u);
    EXPECT_EQ(persistor.dump_calls, 0);
}

TEST_F(UploadEngineTest, MissingFileIsIoError)
{
    FakeRemoteSession remote;
    FailingPersistor persistor;
    auto engine = make_engine(remote, persistor);

    auto req = request();
    req.file_path = dir_ / "does-not-exist";
    auto started = engine.start(req);

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(remote.initiate_calls, 0u);
}

TEST_F(UploadEngineTest, EmptyFileCompletesWithoutParts)
{
    const auto empty = dir_ / "empty.bin";
    vaultup::test::write_file(empty, 0);

    FakeRemoteSession remote;
    FailingPersistor persistor;
    auto engine = make_engine(remote, persistor);

    auto req = request();
    req.file_path = empty;
    ASSERT_TRUE(engine.start(req).has_value());
    EXPECT_EQ(engine.job().chunk_count, 0u);

    ASSERT_TRUE(engine.run().has_value());
    EXPECT_EQ(remote.upload_calls, 0u);
    EXPECT_EQ(remote.completed_size, 0u);
}

TEST_F(UploadEngineTest, ResumeRejectsRecordInconsistentWithFile)
{
    YamlStatePersistor persistor(state_dir_.path());
    vaultup::extensions::ResumeRecord record{
        .account_id = "123456789012",
        .vault_name = "photos",
        .upload_id = "upload-1",
        .file_path = file_,
        .chunk_size_mb = 4,
        .cur_chunk = 1,
        .cur_byte = 3 * MiB,
        .part_checksums = {{1, "aa"}},
    };
    auto location = persistor.write_record(record);
    ASSERT_TRUE(location.has_value());

    FakeRemoteSession remote;
    auto engine = make_engine(remote, persistor);
    auto bound = engine.resume(*location);

    ASSERT_FALSE(bound.has_value());
    EXPECT_EQ(bound.error().code, ErrorCode::MalformedRecord);
    EXPECT_EQ(remote.resume_calls, 0u);
    EXPECT_EQ(engine.state(), UploadState::Aborted);
}

TEST_F(UploadEngineTest, ResumeRejectsMoreChunksThanFileHas)
{
    YamlStatePersistor persistor(state_dir_.path());
    // 10 MiB в чанках по 4 MiB дают 3 чанка, а не 4
    vaultup::extensions::ResumeRecord record{
        .account_id = "123456789012",
        .vault_name = "photos",
        .upload_id = "upload-1",
        .file_path = file_,
        .chunk_size_mb = 4,
        .cur_chunk = 4,
        .cur_byte = 10 * MiB,
        .part_checksums = {{1, "aa"}, {2, "bb"}, {3, "cc"}, {4, "dd"}},
    };
    auto location = persistor.write_record(record);
    ASSERT_TRUE(location.has_value());

    FakeRemoteSession remote;
    auto engine = make_engine(remote, persistor);
    auto bound = engine.resume(*location);

    ASSERT_FALSE(bound.has_value());
    EXPECT_EQ(bound.error().code, ErrorCode::MalformedRecord);
    EXPECT_EQ(remote.resume_calls, 0u);
    EXPECT_EQ(remote.complete_calls, 0u);
    EXPECT_EQ(engine.state(), UploadState::Aborted);
}

TEST_F(UploadEngineTest, ResumeRejectsRecordWithIllegalChunkSize)
{
    YamlStatePersistor persistor(state_dir_.path());
    vaultup::extensions::ResumeRecord record{
        .account_id = "1",
        .vault_name = "photos",
        .upload_id = "upload-1",
        .file_path = file_,
        .chunk_size_mb = 3,
    };
    auto location = persistor.write_record(record);
    ASSERT_TRUE(location.has_value());

    FakeRemoteSession remote;
    auto engine = make_engine(remote, persistor);
    auto bound = engine.resume(*location);

    ASSERT_FALSE(bound.has_value());
    EXPECT_EQ(bound.error().code, ErrorCode::InvalidChunkSize);
}

TEST_F(UploadEngineTest, TransmitRequiresBoundSession)
{
    FakeRemoteSession remote;
    FailingPersistor persistor;
    auto engine = make_engine(remote, persistor);

    auto sent = engine.transmit();
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(engine.state(), UploadState::Fresh);
}
