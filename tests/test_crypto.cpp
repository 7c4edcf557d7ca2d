#include <gtest/gtest.h>
#include "clawchat_crypto.hpp"

using namespace clawchat;

class CryptoTest : public ::testing::Test {
protected:
    Crypto crypto;
};

TEST_F(CryptoTest, GenerateKeypair) {
    auto kp = crypto.generate_keypair();

    EXPECT_EQ(kp.public_key.size(), 32);
    EXPECT_EQ(kp.secret_key.size(), 64);
    EXPECT_FALSE(kp.public_key.empty());
    EXPECT_FALSE(kp.secret_key.empty());
}

TEST_F(CryptoTest, SignAndVerifyMessage) {
    auto kp = crypto.generate_keypair();
    std::string message = "Test message";

    auto signature = crypto.sign_ed25519(message, kp.secret_key);
    EXPECT_EQ(signature.size(), 64);

    EXPECT_TRUE(crypto.verify_ed25519(message, signature, kp.public_key));
}

TEST_F(CryptoTest, VerifyFailsWithModifiedMessage) {
    auto kp = crypto.generate_keypair();
    auto signature = crypto.sign_ed25519("Test message", kp.secret_key);

    EXPECT_FALSE(crypto.verify_ed25519("Modified message", signature, kp.public_key));
}

TEST_F(CryptoTest, VerifyRejectsTruncatedSignature) {
    auto kp = crypto.generate_keypair();
    auto signature = crypto.sign_ed25519("m", kp.secret_key);
    signature.pop_back();

    EXPECT_FALSE(crypto.verify_ed25519("m", signature, kp.public_key));
}

TEST_F(CryptoTest, SignRejectsWrongKeySize) {
    SecureMemory short_key(32);
    EXPECT_THROW(crypto.sign_ed25519("m", short_key), std::runtime_error);
}

TEST_F(CryptoTest, Sha256KnownVector) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(Crypto::bytes_to_hex(crypto.hash_sha256(abc)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(CryptoTest, Base64UrlHasNoPaddingOrStandardAlphabet) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xfe, 0x01};
    std::string encoded = Crypto::to_base64url(data);

    EXPECT_EQ(encoded, "-__-AQ");
    EXPECT_EQ(encoded.find('='), std::string::npos);

    auto decoded = Crypto::from_base64url(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST_F(CryptoTest, Base64UrlRejectsGarbage) {
    EXPECT_FALSE(Crypto::from_base64url("not*base64").has_value());
    EXPECT_FALSE(Crypto::from_base64url("AAAA+/").has_value());
}
