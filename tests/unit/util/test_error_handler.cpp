#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "cardlink/util/error_handler.hpp"

using namespace cardlink;
using namespace cardlink::util;

TEST(ErrorHandlerTest, FullDescriptionIncludesContext) {
  ContextualError error(ErrorCode::kFileReadError, "cannot read card",
                        ErrorContext{}.withFile("/tmp/card.md").withOperation("normalize"));

  auto description = error.fullDescription();
  EXPECT_NE(description.find("cannot read card"), std::string::npos);
  EXPECT_NE(description.find("(during normalize)"), std::string::npos);
  EXPECT_NE(description.find("[file: /tmp/card.md]"), std::string::npos);
}

TEST(ErrorHandlerTest, FullDescriptionWithoutContext) {
  ContextualError error(ErrorCode::kNotFound, "card 7 not found");

  auto description = error.fullDescription();
  EXPECT_NE(description.find("card 7 not found"), std::string::npos);
  EXPECT_EQ(description.find("during"), std::string::npos);
}

TEST(ErrorHandlerTest, Recoverability) {
  EXPECT_TRUE(ContextualError(ErrorCode::kNotFound, "x").isRecoverable());
  EXPECT_TRUE(ContextualError(ErrorCode::kStoreError, "x").isRecoverable());
  EXPECT_FALSE(ContextualError(ErrorCode::kDatabaseError, "x", ErrorSeverity::kCritical).isRecoverable());
  EXPECT_FALSE(ContextualError(ErrorCode::kConfigError, "x").isRecoverable());
  EXPECT_TRUE(ContextualError(ErrorCode::kConfigError, "x", ErrorSeverity::kWarning).isRecoverable());
}

TEST(ErrorHandlerTest, JsonFormat) {
  ContextualError error(Error(ErrorCode::kNotFound, "card 7 not found"),
                        ErrorContext{}.withOperation("show"));

  auto parsed = nlohmann::json::parse(ErrorHandler::instance().formatUserError(error, true));
  EXPECT_TRUE(parsed["error"].get<bool>());
  EXPECT_EQ(parsed["message"], "card 7 not found");
  EXPECT_EQ(parsed["operation"], "show");
  EXPECT_EQ(parsed["severity"], "Error");
  EXPECT_TRUE(parsed["recoverable"].get<bool>());
}

TEST(ErrorHandlerTest, TextFormatAddsSuggestion) {
  ContextualError error(ErrorCode::kInvalidReference, "broken markup");

  auto text = ErrorHandler::instance().formatUserError(error);
  EXPECT_NE(text.find("broken markup"), std::string::npos);
  EXPECT_NE(text.find("cardlink normalize"), std::string::npos);
}

TEST(ErrorHandlerTest, ReportForwardsToLogger) {
  auto& handler = ErrorHandler::instance();
  int calls = 0;
  handler.setErrorLogger([&calls](const ContextualError&) { ++calls; });

  handler.report(ContextualError(ErrorCode::kStoreError, "write failed"));
  EXPECT_EQ(calls, 1);

  handler.setErrorLogger(nullptr);
  handler.report(ContextualError(ErrorCode::kStoreError, "write failed"));
  EXPECT_EQ(calls, 1);
}
