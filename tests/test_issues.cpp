#include <gtest/gtest.h>
#include <string>

#include "core/issues.hpp"

using namespace MLC;

// Tests for the Issues accumulator
// Tests pour l'accumulateur Issues
class IssuesTest : public ::testing::Test {
protected:
    Issues issues;
};

TEST_F(IssuesTest, StartsEmpty) {
    EXPECT_FALSE(issues.hasErrors());
    EXPECT_FALSE(issues.hasWarnings());
    EXPECT_EQ(issues.report(), "");
    EXPECT_NO_THROW(issues.raiseIfErrors());
}

TEST_F(IssuesTest, ContextPrefixesMessage) {
    issues.addError("Property \"https://schema.org/name\" is mandatory, but does not exist.",
                    "[dataset(mydataset) > distribution()]");
    ASSERT_EQ(issues.getErrors().size(), 1u);
    EXPECT_EQ(issues.getErrors()[0].toString(),
              "[dataset(mydataset) > distribution()] Property \"https://schema.org/name\" is mandatory, "
              "but does not exist.");
}

TEST_F(IssuesTest, WarningsNeverRaise) {
    issues.addWarning("Property \"https://schema.org/license\" is recommended, but does not exist.", "[dataset(d)]");
    EXPECT_TRUE(issues.hasWarnings());
    EXPECT_NO_THROW(issues.raiseIfErrors());
    EXPECT_NE(issues.report().find("1 warning(s)"), std::string::npos);
}

TEST_F(IssuesTest, DuplicatesAreRecordedOnce) {
    issues.addError("same message", "[dataset(d)]");
    issues.addError("same message", "[dataset(d)]");
    issues.addError("same message", "[dataset(other)]");
    EXPECT_EQ(issues.getErrors().size(), 2u);
}

TEST_F(IssuesTest, RaiseCarriesEveryIssue) {
    issues.addError("first error", "[dataset(d)]");
    issues.addError("second error");
    issues.addWarning("a warning");
    
    try {
        issues.raiseIfErrors();
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Found the following 2 error(s) during the validation:"), std::string::npos);
        EXPECT_NE(message.find("  -  [dataset(d)] first error"), std::string::npos);
        EXPECT_NE(message.find("  -  second error"), std::string::npos);
        EXPECT_NE(message.find("  -  a warning"), std::string::npos);
        EXPECT_EQ(e.getErrors().size(), 2u);
    }
}

TEST_F(IssuesTest, ErrorsAreListedBeforeWarnings) {
    issues.addWarning("the warning");
    issues.addError("the error");
    std::string report = issues.report();
    EXPECT_LT(report.find("the error"), report.find("the warning"));
}
