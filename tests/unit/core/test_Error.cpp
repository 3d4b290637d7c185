#include <t9s/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace T9;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError); i <= static_cast<int>(Error::Code::Unavailable); ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when the message is empty.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::NotFoundError, "workflow order-1"};
        CHECK(describeError(withMsg) == "not_found:workflow order-1");

        CHECK(errorCodeToString(Error::Code::ConnectionError) == "connection");
        CHECK(errorCodeToString(Error::Code::InvalidConfiguration) == "invalid_configuration");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Only transport-level failures are retryable") {
        CHECK(isRetryable(Error::Code::ConnectionError));
        CHECK(isRetryable(Error::Code::TimeoutError));
        CHECK(isRetryable(Error::Code::ServerError));
        CHECK_FALSE(isRetryable(Error::Code::AuthError));
        CHECK_FALSE(isRetryable(Error::Code::NotFoundError));
        CHECK_FALSE(isRetryable(Error::Code::ValidationError));
        CHECK_FALSE(isRetryable(Error::Code::MalformedResponse));
    }

    TEST_CASE("Expected carries either a value or an Error") {
        Expected<int> ok{7};
        REQUIRE(ok.has_value());
        CHECK(*ok == 7);

        Expected<int> failed = std::unexpected(Error{Error::Code::AuthError, "token expired"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::AuthError);
        CHECK(failed.error() == Error{Error::Code::AuthError, "token expired"});
    }
}
