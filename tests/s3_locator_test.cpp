// SPDX-License-Identifier: MIT

// tests/s3_locator_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "dbxfer/drivers/redshift_locator.hpp"
#include "dbxfer/drivers/s3_locator.hpp"
#include "test_helpers.hpp"

namespace dbxfer {
namespace {

using ::testing::_;
using testing::ChunkStream;
using testing::Done;
using testing::FakeObjectStoreClient;
using testing::ReadString;
using testing::RunSync;

using Partitions = std::vector<std::pair<std::string, std::string>>;

asio::awaitable<Partitions> ReadPartitions(BoxStream<CsvStream> streams) {
    Partitions out;
    while (auto stream = co_await streams->Next()) {
        auto contents = co_await ReadString(std::move(stream->data));
        out.emplace_back(stream->name, std::move(contents));
    }
    co_return out;
}

asio::awaitable<void> FinishAll(BoxStream<asio::awaitable<void>> completions) {
    while (auto completion = co_await completions->Next()) {
        co_await std::move(*completion);
    }
}

TEST(S3ParseTest, Prefix) {
    auto locator = S3Locator::Parse("s3://bucket/exports/2024/");
    ASSERT_TRUE(locator.has_value());
    EXPECT_EQ(locator->url(), "s3://bucket/exports/2024/");
    EXPECT_EQ(locator->ToString(), "s3://bucket/exports/2024/");
    EXPECT_EQ(locator->Scheme(), "s3:");
}

TEST(S3ParseTest, Errors) {
    struct Case {
        std::string_view locator;
        std::string_view message;
    };
    for (const auto& c : std::vector<Case>{
             {"gs://bucket/", "expected gs://bucket/ to begin with s3://"},
             {"s3:bucket/", "s3:bucket/ must start with s3://"},
             {"s3://bucket", "s3://bucket must start with s3://"},
             {"s3:///key/", "s3:///key/ must start with s3://"},
             {"s3://bucket/exports", "s3://bucket/exports must end with a '/'"},
         }) {
        auto locator = S3Locator::Parse(c.locator);
        ASSERT_FALSE(locator.has_value()) << c.locator;
        EXPECT_EQ(locator.error().code, ErrorCode::InvalidLocator);
        EXPECT_EQ(locator.error().message, c.message);
    }
}

class S3LocatorTest : public ::testing::Test {
protected:
    Context NewContext() {
        auto [ctx, supervisor] = Context::CreateForTest(io_.get_executor(), "s3");
        return ctx;
    }

    S3Locator At(std::string url) const { return S3Locator(std::move(url), client_); }

    Partitions Read(const S3Locator& locator, SourceArguments source = {}) {
        auto streams = RunSync(io_, locator.LocalData(NewContext(), {}, std::move(source)));
        if (!streams) return {};
        return RunSync(io_, ReadPartitions(std::move(*streams)));
    }

    void Write(const S3Locator& locator, const Partitions& partitions, IfExists if_exists) {
        std::vector<CsvStream> streams;
        for (const auto& [name, contents] : partitions) {
            streams.push_back({.name = name, .data = ChunkStream({contents})});
        }
        auto completions = RunSync(
            io_, locator.WriteLocalData(NewContext(), MakeVectorStream(std::move(streams)), {},
                                        DestinationArguments{.if_exists = if_exists}));
        RunSync(io_, FinishAll(std::move(completions)));
    }

    asio::io_context io_;
    std::shared_ptr<FakeObjectStoreClient> client_ = std::make_shared<FakeObjectStoreClient>();
};

TEST_F(S3LocatorTest, LocalDataSortedPartitions) {
    client_->objects = {
        {"s3://bucket/in/b.csv", "id\n2\n"},
        {"s3://bucket/in/a/1.CSV", "id\n1\n"},
        {"s3://bucket/other/c.csv", "id\n3\n"},
    };
    EXPECT_EQ(Read(At("s3://bucket/in/")),
              (Partitions{{"a/1", "id\n1\n"}, {"b", "id\n2\n"}}));
    EXPECT_EQ(client_->list_calls, 1);
}

TEST_F(S3LocatorTest, LocalDataEmptyPrefix) {
    EXPECT_TRUE(Read(At("s3://bucket/in/")).empty());
}

TEST_F(S3LocatorTest, LocalDataRejectsOtherObjectsBeforeDownloading) {
    client_->objects = {
        {"s3://bucket/in/a.csv", "id\n1\n"},
        {"s3://bucket/in/manifest.json", "{}"},
    };
    try {
        Read(At("s3://bucket/in/"));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StructuralError);
        EXPECT_STREQ(e.what(), "s3://bucket/in/manifest.json must end in *.csv or *.CSV");
    }
    EXPECT_EQ(client_->read_calls, 0);
}

TEST_F(S3LocatorTest, LocalDataRejectsWhereClause) {
    SourceArguments source{.query = {.where_clause = "id > 1"}};
    try {
        Read(At("s3://bucket/in/"), std::move(source));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedFeature);
    }
    EXPECT_EQ(client_->list_calls, 0);
}

TEST_F(S3LocatorTest, LocalDataRejectsDriverArgs) {
    SourceArguments source;
    source.driver_args.Add("region", "us-east-1");
    try {
        Read(At("s3://bucket/in/"), std::move(source));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_STREQ(e.what(), "s3: does not accept --from-arg");
    }
}

TEST_F(S3LocatorTest, WriteOnePerPartition) {
    Write(At("s3://bucket/out/"), {{"a/1", "id\n1\n"}, {"b", "id\n2\n"}}, IfExists());
    EXPECT_EQ(client_->written,
              (std::vector<std::string>{"s3://bucket/out/a/1.csv", "s3://bucket/out/b.csv"}));
    EXPECT_EQ(client_->objects["s3://bucket/out/b.csv"], "id\n2\n");
}

TEST_F(S3LocatorTest, WriteErrorPolicyRefusesExistingData) {
    client_->objects = {{"s3://bucket/out/old.csv", "id\n0\n"}};
    try {
        Write(At("s3://bucket/out/"), {{"a", "id\n1\n"}}, IfExists());
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IoError);
        EXPECT_EQ(e.error().os_errno, EEXIST);
    }
    EXPECT_TRUE(client_->written.empty());
}

TEST_F(S3LocatorTest, WriteOverwriteRemovesPrefix) {
    client_->objects = {{"s3://bucket/out/old.csv", "id\n0\n"},
                        {"s3://bucket/keep/x.csv", "id\n9\n"}};
    Write(At("s3://bucket/out/"), {{"a", "id\n1\n"}}, IfExists::Policy::Overwrite);
    EXPECT_EQ(client_->removed_prefixes, (std::vector<std::string>{"s3://bucket/out/"}));
    EXPECT_EQ(client_->objects.count("s3://bucket/out/old.csv"), 0u);
    EXPECT_EQ(client_->objects.count("s3://bucket/keep/x.csv"), 1u);
    EXPECT_EQ(client_->objects["s3://bucket/out/a.csv"], "id\n1\n");
}

TEST_F(S3LocatorTest, WriteAppendUnsupported) {
    try {
        Write(At("s3://bucket/out/"), {{"a", "id\n1\n"}}, IfExists::Policy::Append);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedFeature);
    }
}

TEST_F(S3LocatorTest, UploadFailureSurfaces) {
    client_->fail_writes_to = "s3://bucket/out/b.csv";
    try {
        Write(At("s3://bucket/out/"), {{"a", "id\n1\n"}, {"b", "id\n2\n"}}, IfExists());
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ProcessFailed);
    }
    EXPECT_EQ(client_->written, (std::vector<std::string>{"s3://bucket/out/a.csv"}));
}

TEST_F(S3LocatorTest, UnloadFromRedshift) {
    auto db = testing::MakeMockDatabase();
    std::vector<std::string> executed;
    ON_CALL(*db, Execute(_)).WillByDefault([&executed](std::string_view sql) {
        executed.emplace_back(sql);
        return Done();
    });
    BoxLocator source = std::make_shared<const RedshiftLocator>(
        PostgresConfig{.host = "cluster", .port = 5439, .database = "db", .user = "u"}, "public",
        "trades", testing::FactoryFor(db));
    auto dest = At("s3://bucket/out/");
    ASSERT_TRUE(dest.SupportsWriteRemoteData(*source));

    SourceArguments source_args;
    source_args.driver_args.Add("iam_role", "r");
    Table schema{.name = "trades", .columns = {{.name = "id", .data_type = DataType::Int64}}};
    RunSync(io_, dest.WriteRemoteData(NewContext(), source, SharedArguments{.schema = schema},
                                      std::move(source_args), DestinationArguments{}));

    EXPECT_EQ(client_->list_calls, 1);
    ASSERT_EQ(executed.size(), 1u);
    EXPECT_EQ(executed[0],
              "UNLOAD ('SELECT \"id\" FROM \"public\".\"trades\"') TO 's3://bucket/out/' "
              "IAM_ROLE 'r' FORMAT AS CSV HEADER");
}

TEST_F(S3LocatorTest, OnlyRedshiftIsARemoteSource) {
    auto dest = At("s3://bucket/out/");
    EXPECT_FALSE(dest.SupportsWriteRemoteData(At("s3://bucket/in/")));
}

TEST_F(S3LocatorTest, RemoteWriteRejectsDriverArgs) {
    BoxLocator source = std::make_shared<const RedshiftLocator>(
        PostgresConfig{.database = "db", .user = "u"}, "public", "trades",
        testing::FactoryFor(testing::MakeMockDatabase()));
    DestinationArguments dest_args;
    dest_args.driver_args.Add("region", "us-east-1");
    auto dest = At("s3://bucket/out/");
    try {
        RunSync(io_, dest.WriteRemoteData(NewContext(), source, {}, {}, std::move(dest_args)));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_STREQ(e.what(), "s3: does not accept --to-arg");
    }
}

}  // namespace
}  // namespace dbxfer
