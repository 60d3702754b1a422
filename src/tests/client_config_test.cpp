#include <gtest/gtest.h>
#include <stdexcept>
#include "config/client_config.hpp"
#include "test_utils.hpp"

using namespace sevault::config;

class ClientConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }

    ClientConfig config_;
};

TEST_F(ClientConfigTest, DefaultsMatchDeployedApplet) {
    EXPECT_EQ(config_.cla, 0x80);
    EXPECT_EQ(config_.store_ins.init, 0x10);
    EXPECT_EQ(config_.store_ins.cont, 0x11);
    EXPECT_EQ(config_.store_ins.finalize, 0x12);
    EXPECT_EQ(config_.read_ins.init, 0x20);
    EXPECT_EQ(config_.read_ins.cont, 0x21);
    EXPECT_EQ(config_.read_ins.finalize, 0x22);
    EXPECT_EQ(config_.fixed_delete_ins, 0x30);
    EXPECT_EQ(config_.store_chunk_size, 200u);
    EXPECT_EQ(config_.digest_policy, DigestPolicy::MESSAGE);
    EXPECT_EQ(config_.identity_encoding, IdentityEncoding::ZERO_PAD);
    EXPECT_NO_THROW(config_.validate());
}

TEST_F(ClientConfigTest, ChunkSizeBounds) {
    config_.store_chunk_size = 0;
    EXPECT_THROW(config_.validate(), std::invalid_argument);

    config_.store_chunk_size = 256;
    EXPECT_THROW(config_.validate(), std::invalid_argument);

    config_.store_chunk_size = 1;
    EXPECT_NO_THROW(config_.validate());

    config_.store_chunk_size = 255;
    EXPECT_NO_THROW(config_.validate());
}

TEST_F(ClientConfigTest, FixedRecordMustFitOneFrame) {
    config_.fixed_message_width = 200;
    EXPECT_THROW(config_.validate(), std::invalid_argument);

    config_.fixed_message_width = 0;
    EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ClientConfigTest, SignatureBounds) {
    config_.min_signature_length = 80;
    EXPECT_THROW(config_.validate(), std::invalid_argument);

    config_.min_signature_length = 8;
    config_.max_signature_length = 200;
    EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ClientConfigTest, Sha256IdentityNeedsRoomForDigest) {
    config_.identity_encoding = IdentityEncoding::SHA256;
    EXPECT_NO_THROW(config_.validate());

    config_.fixed_username_width = 16;
    EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ClientConfigTest, ParseAndFormatNames) {
    EXPECT_EQ(parse_digest_policy("message"), DigestPolicy::MESSAGE);
    EXPECT_EQ(parse_digest_policy("sha256"), DigestPolicy::SHA256_DIGEST);
    EXPECT_THROW(parse_digest_policy("SHA256"), std::invalid_argument);

    EXPECT_EQ(parse_identity_encoding("pad"), IdentityEncoding::ZERO_PAD);
    EXPECT_EQ(parse_identity_encoding("sha256"), IdentityEncoding::SHA256);
    EXPECT_THROW(parse_identity_encoding(""), std::invalid_argument);

    EXPECT_STREQ(to_string(DigestPolicy::SHA256_DIGEST), "sha256");
    EXPECT_STREQ(to_string(IdentityEncoding::ZERO_PAD), "pad");
}
