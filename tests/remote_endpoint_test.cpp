#include <gtest/gtest.h>
#include "adapters/remote/remote_endpoint.hpp"

using chunkup::adapters::remote::error_from_status;
using chunkup::infra::ErrorCode;

TEST(ErrorFromStatusTest, ServerSideAndThrottlingAreTransient) {
    for (int status : {408, 429, 500, 502, 503, 504}) {
        EXPECT_EQ(error_from_status(status, "x").code, ErrorCode::TransientUploadError) << status;
    }
}

TEST(ErrorFromStatusTest, MissingChunksAtMergeAreIncompleteUpload) {
    EXPECT_EQ(error_from_status(409, "x").code, ErrorCode::IncompleteUpload);
    EXPECT_EQ(error_from_status(412, "x").code, ErrorCode::IncompleteUpload);
}

TEST(ErrorFromStatusTest, OtherClientErrorsAreFinal) {
    for (int status : {400, 401, 403, 404, 413}) {
        EXPECT_EQ(error_from_status(status, "x").code, ErrorCode::NonRetryableUploadError) << status;
    }
}

TEST(ErrorFromStatusTest, MessageCarriesStatus) {
    auto err = error_from_status(503, "maintenance");
    EXPECT_NE(err.message.find("503"), std::string::npos);
    EXPECT_NE(err.message.find("maintenance"), std::string::npos);
}
