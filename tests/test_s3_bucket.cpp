#include "duet/s3_bucket.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <aws/s3/S3Errors.h>

using namespace duet;
using namespace duet::testing;
using Aws::Http::HttpResponseCode;

TEST(S3Errors, HttpStatusMapsToKinds) {
    EXPECT_EQ(kind_from_http(HttpResponseCode::NOT_FOUND), ErrorKind::NotFound);
    EXPECT_EQ(kind_from_http(HttpResponseCode::FORBIDDEN), ErrorKind::PermissionDenied);
    EXPECT_EQ(kind_from_http(HttpResponseCode::UNAUTHORIZED), ErrorKind::PermissionDenied);
    EXPECT_EQ(kind_from_http(HttpResponseCode::REQUEST_NOT_MADE), ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(kind_from_http(HttpResponseCode::REQUEST_TIMEOUT), ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(kind_from_http(HttpResponseCode::TOO_MANY_REQUESTS), ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(kind_from_http(HttpResponseCode::SERVICE_UNAVAILABLE), ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(kind_from_http(HttpResponseCode::BAD_REQUEST), ErrorKind::Io);
}

TEST(S3Errors, SdkErrorsCarryKindAndMessage) {
    Aws::Client::AWSError<Aws::S3::S3Errors> missing(Aws::S3::S3Errors::NO_SUCH_KEY, "NoSuchKey",
                                                     "The specified key does not exist.", false);
    missing.SetResponseCode(HttpResponseCode::NOT_FOUND);
    auto err = error_from_aws(missing, "media/a.txt");
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
    EXPECT_EQ(str(err.message), "media/a.txt: The specified key does not exist.");

    Aws::Client::AWSError<Aws::Client::CoreErrors> offline(Aws::Client::CoreErrors::NETWORK_CONNECTION, "", "", true);
    offline.SetResponseCode(HttpResponseCode::BAD_REQUEST);
    auto net = error_from_aws(offline, "media/");
    EXPECT_EQ(net.kind, ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(str(net.message), "media/");
}

TEST(S3Ranges, RangeCoversExactlyTheRequestedBytes) {
    EXPECT_EQ(range_header(0, 1024), "bytes=0-1023");
    EXPECT_EQ(range_header(4096, 1), "bytes=4096-4096");
    EXPECT_EQ(range_header(5'000'000'000ULL, 10), "bytes=5000000000-5000000009");
}

TEST(S3Parts, PartSizeMeetsTheMultipartMinimum) { EXPECT_GE(S3_PART_SIZE, dp::usize{5} * 1024 * 1024); }
