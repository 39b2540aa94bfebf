#include <core/model/enrollment_error.h>
#include <core/security/token.h>
#include <core/security/token_validator.h>
#include <gtest/gtest.h>
#include <test_pki.h>

using namespace edgegate;
using namespace edgegate::core;

class TokenValidatorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { ca_ = std::make_unique<pki::TestCa>(pki::MakeCa()); }

    static void TearDownTestSuite() { ca_.reset(); }

    static std::string expectAuthError(const TokenValidator& validator, std::string_view header) {
        try {
            validator.Verify(header);
        } catch (const AuthError& e) {
            EXPECT_EQ(e.status(), boost::beast::http::status::unauthorized);
            return e.what();
        }
        ADD_FAILURE() << "expected AuthError for \"" << header << "\"";
        return {};
    }

    static std::unique_ptr<pki::TestCa> ca_;
};

std::unique_ptr<pki::TestCa> TokenValidatorTest::ca_;

TEST_F(TokenValidatorTest, AcceptsTokenSignedWithCaKey) {
    TokenValidator validator(*ca_->root);
    std::string jwt = token::Create(ca_->root->private_key_der(), std::chrono::hours(1));

    EXPECT_NO_THROW(validator.Verify("Bearer " + jwt));
}

TEST_F(TokenValidatorTest, EmptyHeader) {
    TokenValidator validator(*ca_->root);

    EXPECT_EQ(expectAuthError(validator, ""), "token validation failure, token is empty");
}

TEST_F(TokenValidatorTest, SchemeWithoutToken) {
    TokenValidator validator(*ca_->root);

    EXPECT_EQ(expectAuthError(validator, "Bearer"),
              "token validation failure, token cannot be splited");
}

TEST_F(TokenValidatorTest, DoubleSpaceIsNotSplit) {
    TokenValidator validator(*ca_->root);
    std::string jwt = token::Create(ca_->root->private_key_der(), std::chrono::hours(1));

    EXPECT_EQ(expectAuthError(validator, "Bearer  " + jwt),
              "token validation failure, token cannot be splited");
}

TEST_F(TokenValidatorTest, MalformedToken) {
    TokenValidator validator(*ca_->root);

    std::string message = expectAuthError(validator, "Bearer not-a-jwt");
    EXPECT_EQ(message.rfind("token validation failure, err: ", 0), 0u) << message;
}

TEST_F(TokenValidatorTest, TokenSignedWithOtherKey) {
    TokenValidator validator(*ca_->root);
    std::string jwt = token::Create(ToBinary("some other secret"), std::chrono::hours(1));

    EXPECT_EQ(expectAuthError(validator, "Bearer " + jwt),
              "token validation failure, valid is false");
}

TEST_F(TokenValidatorTest, ExpiredToken) {
    TokenValidator validator(*ca_->root);
    std::string jwt = token::Create(ca_->root->private_key_der(), std::chrono::seconds(-1));

    EXPECT_EQ(expectAuthError(validator, "Bearer " + jwt),
              "token validation failure, valid is false");
}
