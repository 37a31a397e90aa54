#include <gtest/gtest.h>
#include "../src/hash.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        set_quiet_mode(true);
    }

    void TearDown() override {
        set_quiet_mode(false);
    }
};

TEST_F(HashTest, CalculateSHA256) {
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256("hello world"), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, EmptyInput) {
    EXPECT_EQ(calculate_sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, BinaryInput) {
    const std::string data("a\0b", 3);
    EXPECT_EQ(calculate_sha256(data).size(), 64u);
    EXPECT_NE(calculate_sha256(data), calculate_sha256("ab"));
}

TEST_F(HashTest, VerifyAcceptsAnyCase) {
    EXPECT_NO_THROW(verify_sha256("hello world", " B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9\n", "Packages"));
}

TEST_F(HashTest, VerifyRejectsMismatch) {
    EXPECT_THROW(verify_sha256("hello world", "wronghashvalue", "Packages"), PkgtreeException);
}
