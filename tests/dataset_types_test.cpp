#include <gtest/gtest.h>
#include "core/dataset_types.hpp"

using json = nlohmann::json;

class DatasetCodecTest : public ::testing::Test
{
};

TEST_F(DatasetCodecTest, ParsesStandaloneAndFrameRecords)
{
    json data = json::parse(R"({
        "pairs": [
            {"imagePath": "u/a.png", "maskPath": "u/a_mask.png", "uploadIndex": 0},
            {"imagePath": "u/f2.png", "maskPath": "u/f2_mask.png", "uploadIndex": 7, "frameIndex": 2},
            {"imagePath": "u/f1.png", "maskPath": "u/f1_mask.png", "uploadIndex": "7", "frameIndex": 1}
        ]
    })");

    auto batch = DatasetCodec::parseDatasetBatch(data);

    ASSERT_TRUE(batch.success) << batch.error_message;
    ASSERT_EQ(batch.value.pairs.size(), 3u);
    EXPECT_TRUE(batch.value.malformed.empty());

    const auto &standalone = batch.value.pairs[0];
    EXPECT_FALSE(standalone.isFrame());
    EXPECT_EQ(standalone.upload_index, "0");
    EXPECT_EQ(standalone.submission_order, 0u);

    // Integer and string upload indices share one key space
    EXPECT_EQ(batch.value.pairs[1].upload_index, "7");
    EXPECT_EQ(batch.value.pairs[2].upload_index, "7");
    EXPECT_EQ(*batch.value.pairs[1].frame_index, 2);
    EXPECT_EQ(batch.value.pairs[2].submission_order, 2u);
}

TEST_F(DatasetCodecTest, NullFrameIndexMeansStandalone)
{
    auto record = DatasetCodec::parsePairRecord(
        json{{"imagePath", "a.png"}, {"maskPath", "m.png"}, {"uploadIndex", 3}, {"frameIndex", nullptr}}, 0);

    ASSERT_TRUE(record.success);
    EXPECT_FALSE(record.value.isFrame());
}

TEST_F(DatasetCodecTest, FrameIndexBeyondSignedRangeIsMalformed)
{
    json node = {{"imagePath", "a.png"}, {"maskPath", "m.png"}, {"uploadIndex", 1},
                 {"frameIndex", 18446744073709551615ULL}};

    auto record = DatasetCodec::parsePairRecord(node, 3);
    EXPECT_FALSE(record.success);
    EXPECT_EQ(record.error_kind, ErrorKind::MALFORMED_RECORD);
    EXPECT_EQ(record.error_message, "pairs[3] has an out-of-range frameIndex");

    node["frameIndex"] = 9223372036854775807ULL;
    auto largest = DatasetCodec::parsePairRecord(node, 3);
    ASSERT_TRUE(largest.success);
    EXPECT_EQ(*largest.value.frame_index, 9223372036854775807LL);
}

TEST_F(DatasetCodecTest, MalformedRecordsAreCollectedNotFatal)
{
    json data = json::parse(R"({
        "pairs": [
            {"imagePath": "a.png", "maskPath": "a_mask.png"},
            {"imagePath": "b.png"},
            {"imagePath": "c.png", "maskPath": "c_mask.png", "frameIndex": 1},
            {"imagePath": "d.png", "maskPath": "d_mask.png", "uploadIndex": 1, "frameIndex": "first"},
            42
        ]
    })");

    auto batch = DatasetCodec::parseDatasetBatch(data);

    ASSERT_TRUE(batch.success);
    EXPECT_EQ(batch.value.pairs.size(), 1u);
    ASSERT_EQ(batch.value.malformed.size(), 4u);
    EXPECT_EQ(batch.value.submittedCount(), 5u);
    EXPECT_EQ(batch.value.malformed[0].subject, "pairs[1]");
    EXPECT_EQ(batch.value.malformed[0].message, "pairs[1] is missing maskPath");
    EXPECT_EQ(batch.value.malformed[1].message, "pairs[2] is a frame without uploadIndex");
    for (const auto &failure : batch.value.malformed)
    {
        EXPECT_EQ(failure.kind, ErrorKind::MALFORMED_RECORD);
    }
}

TEST_F(DatasetCodecTest, MissingOrEmptyPairsIsEmptyBatch)
{
    auto missing = DatasetCodec::parseDatasetBatch(json::object());
    ASSERT_TRUE(missing.success);
    EXPECT_EQ(missing.value.submittedCount(), 0u);

    auto empty = DatasetCodec::parseDatasetBatch(json{{"pairs", json::array()}});
    ASSERT_TRUE(empty.success);
    EXPECT_EQ(empty.value.submittedCount(), 0u);
}

TEST_F(DatasetCodecTest, StructuralProblemsFailTheBatch)
{
    auto not_array = DatasetCodec::parseDatasetBatch(json{{"pairs", {{"imagePath", "a.png"}}}});
    EXPECT_FALSE(not_array.success);
    EXPECT_EQ(not_array.error_message, "Malformed dataset: pairs must be an array");

    auto not_object = DatasetCodec::parseDatasetBatch(json::array());
    EXPECT_FALSE(not_object.success);
    EXPECT_EQ(not_object.error_message, "Malformed dataset: data must be an object");
}

TEST_F(DatasetCodecTest, RequestEnvelopeValidation)
{
    auto ok = DatasetCodec::parseDatasetRequest(json{{"userId", "u1"}, {"data", {{"pairs", json::array()}}}});
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(ok.value.user_id, "u1");
    EXPECT_TRUE(ok.value.data.contains("pairs"));

    auto no_body = DatasetCodec::parseDatasetRequest(json());
    EXPECT_EQ(no_body.error_message, DatasetCodec::NO_JSON_DATA);

    for (const json &body : {json{{"data", {{"pairs", json::array()}}}},
                             json{{"userId", "u1"}},
                             json{{"userId", ""}, {"data", json::object()}},
                             json{{"userId", "u1"}, {"data", nullptr}},
                             json{{"userId", "u1"}, {"data", json::object()}},
                             json{{"userId", "u1"}, {"data", json::array()}},
                             json{{"userId", "u1"}, {"data", false}},
                             json{{"userId", "u1"}, {"data", 0}},
                             json{{"userId", "u1"}, {"data", ""}}})
    {
        auto rejected = DatasetCodec::parseDatasetRequest(body);
        EXPECT_FALSE(rejected.success) << body.dump();
        EXPECT_EQ(rejected.error_message, DatasetCodec::MISSING_USER_OR_DATA) << body.dump();
    }

    auto unsafe = DatasetCodec::parseDatasetRequest(json{{"userId", "../root"}, {"data", {{"pairs", json::array()}}}});
    EXPECT_FALSE(unsafe.success);
    EXPECT_EQ(unsafe.error_message, "Invalid userId: ../root");
}

TEST_F(DatasetCodecTest, SafeUserIds)
{
    EXPECT_TRUE(DatasetCodec::isSafeUserId("user-42"));
    EXPECT_TRUE(DatasetCodec::isSafeUserId("a.b"));
    EXPECT_FALSE(DatasetCodec::isSafeUserId(""));
    EXPECT_FALSE(DatasetCodec::isSafeUserId(".."));
    EXPECT_FALSE(DatasetCodec::isSafeUserId("a/b"));
    EXPECT_FALSE(DatasetCodec::isSafeUserId("a\\b"));
}

TEST_F(DatasetCodecTest, ReportJsonShapes)
{
    BatchReport report;
    report.success = true;
    report.images.push_back({"u/a.png", "inferences/u1/x_processed_a.png"});
    report.videos.push_back({"7", "inferences/u1/y_video_7.mp4"});
    report.failures.push_back({"u/b.png", ErrorKind::DECODE_ERROR, "bad"});

    json body = DatasetCodec::toJson(report);
    EXPECT_EQ(body, json::parse(R"({
        "success": true,
        "images": [{"originalPath": "u/a.png", "outputPath": "inferences/u1/x_processed_a.png"}],
        "videos": [{"originalVideoId": "7", "outputPath": "inferences/u1/y_video_7.mp4"}]
    })"));

    EXPECT_EQ(DatasetCodec::toJson(BatchReport::fatal("boom")), json::parse(R"({"success": false, "error": "boom"})"));
}

TEST_F(DatasetCodecTest, ErrorKindNames)
{
    EXPECT_STREQ(errorKindName(ErrorKind::DECODE_ERROR), "DecodeError");
    EXPECT_STREQ(errorKindName(ErrorKind::EMPTY_SEQUENCE), "EmptySequenceError");
    EXPECT_STREQ(errorKindName(ErrorKind::TIMEOUT), "TimeoutError");
}
