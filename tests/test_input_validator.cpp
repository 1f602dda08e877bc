#include <gtest/gtest.h>
#include "input_validator.hpp"
#include <string>

using namespace keydir;

TEST(InputValidatorTest, ValidUserId) {
    EXPECT_TRUE(InputValidator::is_valid_user_id("alice"));
    EXPECT_TRUE(InputValidator::is_valid_user_id("user123_test-name"));
    EXPECT_TRUE(InputValidator::is_valid_user_id("3f2c1a9e-7b4d-4e8a-9c1f-2d5b6a7e8f90"));
    EXPECT_TRUE(InputValidator::is_valid_user_id(std::string(64, 'a')));
}

TEST(InputValidatorTest, InvalidUserId) {
    EXPECT_FALSE(InputValidator::is_valid_user_id(""));
    EXPECT_FALSE(InputValidator::is_valid_user_id(std::string(65, 'a')));
    EXPECT_FALSE(InputValidator::is_valid_user_id("user!@#"));
    EXPECT_FALSE(InputValidator::is_valid_user_id("a/b"));
    EXPECT_FALSE(InputValidator::is_valid_user_id("a b"));
    EXPECT_FALSE(InputValidator::is_valid_user_id("{tag}"));
    EXPECT_FALSE(InputValidator::is_valid_user_id("caf\xc3\xa9"));
}

TEST(InputValidatorTest, WithinSizeLimit) {
    EXPECT_TRUE(InputValidator::is_within_size_limit(100, 200));
    EXPECT_TRUE(InputValidator::is_within_size_limit(200, 200));
    EXPECT_FALSE(InputValidator::is_within_size_limit(201, 200));
}

TEST(InputValidatorTest, SafeParseJson) {
    std::string json_str = "{\"key\": \"value\", \"number\": 123}";
    auto val = InputValidator::safe_parse_json(json_str);
    EXPECT_TRUE(val.is_object());
    EXPECT_EQ(val.as_object()["key"].as_string(), "value");
    EXPECT_EQ(val.as_object()["number"].as_int64(), 123);
}

TEST(InputValidatorTest, SafeParseJsonInvalid) {
    EXPECT_THROW(InputValidator::safe_parse_json("{invalid}"), boost::system::system_error);
}

TEST(InputValidatorTest, SafeParseJsonDepthLimit) {
    std::string nested = std::string(20, '[') + std::string(20, ']');
    EXPECT_THROW(InputValidator::safe_parse_json(nested, 16), boost::system::system_error);
    EXPECT_NO_THROW(InputValidator::safe_parse_json(nested, 32));
}
