#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "result_builder.hpp"

using ingest::models::ResultBuilder;
namespace json = boost::json;

namespace {

IngestResult sample() {
    IngestResult result;
    result.status = IngestStatus::Success;
    result.message = "Data ingestion completed: 1 successful, 1 failed";
    result.request_id = "req-1";
    result.summary = {2, 1, 1, 2048, 1.5};

    FileResult ok;
    ok.source_url = "https://x.example/units";
    ok.suffix = "units.csv";
    ok.destination_key = "raw/2024/03/05/units.csv";
    ok.status = TransferStatus::Completed;
    ok.bytes = 2048;
    ok.parts = 1;

    FileResult failed;
    failed.source_url = "https://x.example/projects";
    failed.suffix = "projects.csv";
    failed.destination_key = "raw/2024/03/05/projects.csv";
    failed.status = TransferStatus::Error;
    failed.error = "HTTP 404";

    result.results = {ok, failed};
    result.counters = {{"create_multipart", 1}, {"total", 1}};
    return result;
}

}  // namespace

TEST(ResultBuilderTest, StatusCodes) {
    EXPECT_EQ(ResultBuilder::status_code(IngestStatus::Success), 200U);
    EXPECT_EQ(ResultBuilder::status_code(IngestStatus::EmptyInput), 400U);
    EXPECT_EQ(ResultBuilder::status_code(IngestStatus::ConfigurationFailure), 500U);
    EXPECT_EQ(ResultBuilder::status_code(IngestStatus::OrchestrationFailure), 500U);
}

TEST(ResultBuilderTest, BuildsSummaryResultsAndCounters) {
    auto out = ResultBuilder::build_result(sample());

    EXPECT_EQ(out.at("status").as_string(), "success");
    EXPECT_EQ(out.at("status_code").to_number<unsigned>(), 200U);
    EXPECT_EQ(out.at("request_id").as_string(), "req-1");

    const auto& summary = out.at("summary").as_object();
    EXPECT_EQ(summary.at("total_files").to_number<std::size_t>(), 2U);
    EXPECT_EQ(summary.at("successful").to_number<std::size_t>(), 1U);
    EXPECT_EQ(summary.at("failed").to_number<std::size_t>(), 1U);
    EXPECT_EQ(summary.at("total_bytes").to_number<uint64_t>(), 2048U);

    const auto& files = out.at("results").as_array();
    ASSERT_EQ(files.size(), 2U);
    const auto& ok = files[0].as_object();
    EXPECT_EQ(ok.at("status").as_string(), "success");
    EXPECT_EQ(ok.at("s3_key").as_string(), "raw/2024/03/05/units.csv");
    EXPECT_EQ(ok.at("size_bytes").to_number<uint64_t>(), 2048U);
    EXPECT_FALSE(ok.contains("error"));

    const auto& failed = files[1].as_object();
    EXPECT_EQ(failed.at("status").as_string(), "error");
    EXPECT_EQ(failed.at("error").as_string(), "HTTP 404");
    EXPECT_FALSE(failed.contains("s3_key"));

    const auto& counters = out.at("counters").as_object();
    EXPECT_EQ(counters.at("create_multipart").to_number<uint64_t>(), 1U);
    EXPECT_EQ(counters.at("total").to_number<uint64_t>(), 1U);
}

TEST(ResultBuilderTest, SerializesToParsableJson) {
    auto text = ResultBuilder::serialize(sample());
    auto parsed = json::parse(text);
    EXPECT_EQ(parsed.as_object().at("message").as_string(),
              "Data ingestion completed: 1 successful, 1 failed");
}
