#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include "filevault/authenticator.hpp"
#include "test_helpers.hpp"

using namespace filevault;

namespace {

// Median nanoseconds of a batch of verify() calls.
double medianBatchNanos(const Authenticator& auth, const std::string& submitted, int batches, int perBatch) {
    std::vector<double> samples;
    samples.reserve(batches);
    volatile bool sink = false;

    for (int b = 0; b < batches; ++b) {
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < perBatch; ++i) {
            sink = auth.verify(submitted);
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        samples.push_back(static_cast<double>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
    }
    (void)sink;

    std::nth_element(samples.begin(), samples.begin() + samples.size() / 2, samples.end());
    return samples[samples.size() / 2];
}

} // namespace

class AuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
    }
};

TEST_F(AuthenticatorTest, AcceptsOnlyTheConfiguredSecret) {
    Authenticator auth("correct horse battery staple");

    EXPECT_TRUE(auth.isConfigured());
    EXPECT_TRUE(auth.verify("correct horse battery staple"));
    EXPECT_FALSE(auth.verify(""));
    EXPECT_FALSE(auth.verify("wrong"));
    EXPECT_FALSE(auth.verify("correct horse battery stapl"));
    EXPECT_FALSE(auth.verify("correct horse battery staple "));
    EXPECT_FALSE(auth.verify("Correct horse battery staple"));
}

TEST_F(AuthenticatorTest, FailsClosedWithoutConfiguredSecret) {
    Authenticator auth("");

    EXPECT_FALSE(auth.isConfigured());
    EXPECT_FALSE(auth.verify(""));
    EXPECT_FALSE(auth.verify("anything"));
    EXPECT_FALSE(auth.verify("123456"));
}

TEST_F(AuthenticatorTest, HandlesEmbeddedNulBytes) {
    std::string secret("pa\0ss", 5);
    Authenticator auth(secret);

    EXPECT_TRUE(auth.verify(secret));
    EXPECT_FALSE(auth.verify("pa"));
}

TEST_F(AuthenticatorTest, WrongAndUnconfiguredPathsTakeSimilarTime) {
    Authenticator configured("s3cret-value-with-some-length");
    Authenticator unconfigured("");

    const std::string attempt = "guess-value-with-some-length!";
    // Warm up caches and the digest implementation
    medianBatchNanos(configured, attempt, 5, 200);
    medianBatchNanos(unconfigured, attempt, 5, 200);

    double wrong = medianBatchNanos(configured, attempt, 41, 500);
    double missing = medianBatchNanos(unconfigured, attempt, 41, 500);

    double ratio = wrong / missing;
    EXPECT_GT(ratio, 0.5) << "wrong=" << wrong << " missing=" << missing;
    EXPECT_LT(ratio, 2.0) << "wrong=" << wrong << " missing=" << missing;
}

TEST_F(AuthenticatorTest, MismatchPositionDoesNotChangeTiming) {
    const std::string secret(64, 'k');
    Authenticator auth(secret);

    std::string firstByteWrong = secret;
    firstByteWrong.front() = 'x';
    std::string lastByteWrong = secret;
    lastByteWrong.back() = 'x';

    medianBatchNanos(auth, firstByteWrong, 5, 200);

    double early = medianBatchNanos(auth, firstByteWrong, 41, 500);
    double late = medianBatchNanos(auth, lastByteWrong, 41, 500);

    double ratio = early / late;
    EXPECT_GT(ratio, 0.5) << "early=" << early << " late=" << late;
    EXPECT_LT(ratio, 2.0) << "early=" << early << " late=" << late;
}
