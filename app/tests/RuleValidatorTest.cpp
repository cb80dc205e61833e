#include <gtest/gtest.h>

#include "RuleValidator.hpp"

namespace {

Rule valid_rule() {
    Rule rule;
    rule.name = "Invoices";
    rule.source_dir = "/inbox";
    rule.destination_dir = "/archive";
    rule.filters.extensions = QStringList({"pdf"});
    return rule;
}

} // namespace

TEST(RuleValidatorTest, AcceptsCompleteRule) {
    EXPECT_TRUE(RuleValidator::validate(valid_rule()).ok());
}

TEST(RuleValidatorTest, RequiresNameAndFolders) {
    Rule rule = valid_rule();
    rule.name = "  ";
    rule.source_dir.clear();
    rule.destination_dir.clear();
    
    ValidationReport report = RuleValidator::validate(rule);
    EXPECT_EQ(report.errors.size(), 3);
    EXPECT_TRUE(report.message().contains("name is required"));
    EXPECT_TRUE(report.message().contains("; "));
}

TEST(RuleValidatorTest, RequiresAtLeastOneFilter) {
    Rule rule = valid_rule();
    rule.filters = Filters();
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
    
    rule.filters.extensions = QStringList();
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
    
    rule.filters.modified_at = DateTimeRange{QDateTime(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC), std::nullopt};
    EXPECT_TRUE(RuleValidator::validate(rule).ok());
}

TEST(RuleValidatorTest, TemplateVariablesNeedRegex) {
    Rule rule = valid_rule();
    rule.destination_dir = "/archive/{year}";
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
    
    rule.filters.filename = FilenameFilter{MatchType::Glob, "*.pdf"};
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
    
    rule.filters.filename = FilenameFilter{MatchType::Regex, R"((?P<year>\d{4}))"};
    EXPECT_TRUE(RuleValidator::validate(rule).ok());
}

TEST(RuleValidatorTest, RejectsBadRegex) {
    Rule rule = valid_rule();
    rule.filters.filename = FilenameFilter{MatchType::Regex, "(unclosed"};
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
}

TEST(RuleValidatorTest, RejectsEmptyGlob) {
    Rule rule = valid_rule();
    rule.filters.filename = FilenameFilter{MatchType::Glob, ""};
    EXPECT_FALSE(RuleValidator::validate(rule).ok());
}

TEST(RuleValidatorTest, RejectsInvertedOrInvalidRange) {
    Rule rule = valid_rule();
    const QDateTime early(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);
    const QDateTime late(QDate(2024, 6, 1), QTime(0, 0), Qt::UTC);
    
    rule.filters.created_at = DateTimeRange{late, early};
    ValidationReport inverted = RuleValidator::validate(rule);
    ASSERT_FALSE(inverted.ok());
    EXPECT_TRUE(inverted.message().contains("created"));
    
    rule.filters.created_at = DateTimeRange{early, late};
    EXPECT_TRUE(RuleValidator::validate(rule).ok());
    
    rule.filters.modified_at = DateTimeRange{QDateTime(), std::nullopt};
    ValidationReport invalid = RuleValidator::validate(rule);
    ASSERT_FALSE(invalid.ok());
    EXPECT_TRUE(invalid.message().contains("modified"));
}
