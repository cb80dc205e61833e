#include <gtest/gtest.h>

#include "RulesetCodec.hpp"
#include <QFile>
#include <QTemporaryDir>

namespace {

Rule sample_rule() {
    Rule rule;
    rule.id = "b4c1";
    rule.name = "Labels";
    rule.enabled = false;
    rule.source_dir = "/inbox";
    rule.destination_dir = "/sorted/{label}";
    rule.action = TransferAction::Copy;
    rule.overwrite = true;
    rule.filters.extensions = QStringList({".pdf"});
    rule.filters.filename = FilenameFilter{MatchType::Regex, R"(^(?P<label>\d+)_)"};
    rule.filters.modified_at = DateTimeRange{
        QDateTime(QDate(2024, 3, 1), QTime(8, 30, 0, 250), Qt::UTC), std::nullopt};
    return rule;
}

} // namespace

TEST(RulesetCodecTest, ExportsExpectedShape) {
    const QJsonObject object = RulesetCodec::rule_to_json(sample_rule());
    
    EXPECT_EQ(object.value("action").toString(), "copy");
    EXPECT_FALSE(object.value("enabled").toBool());
    const QJsonObject filters = object.value("filters").toObject();
    EXPECT_EQ(filters.value("filename").toObject().value("match_type").toString(), "regex");
    EXPECT_TRUE(filters.value("created_at").isNull());
    EXPECT_TRUE(filters.value("modified_at").toObject().value("end").isNull());
}

TEST(RulesetCodecTest, FileSurvivesSaveAndLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("export/rules.json");
    
    RulesetFile out;
    out.rulesets.push_back(sample_rule());
    QString error;
    ASSERT_TRUE(RulesetCodec::save(path, out, error)) << error.toStdString();
    
    RulesetFile in;
    ASSERT_TRUE(RulesetCodec::load(path, in, error)) << error.toStdString();
    ASSERT_EQ(in.rulesets.size(), 1u);
    const Rule& rule = in.rulesets[0];
    EXPECT_EQ(rule.id, "b4c1");
    EXPECT_EQ(rule.action, TransferAction::Copy);
    EXPECT_TRUE(rule.overwrite);
    EXPECT_FALSE(rule.enabled);
    ASSERT_TRUE(rule.filters.filename.has_value());
    EXPECT_EQ(rule.filters.filename->pattern, sample_rule().filters.filename->pattern);
    ASSERT_TRUE(rule.filters.modified_at.has_value());
    EXPECT_EQ(*rule.filters.modified_at->start, *sample_rule().filters.modified_at->start);
    EXPECT_FALSE(rule.filters.modified_at->end.has_value());
    EXPECT_FALSE(rule.filters.created_at.has_value());
}

TEST(RulesetCodecTest, MissingOptionalFieldsTakeDefaults) {
    const QByteArray json = R"({"rulesets": [{"name": "n", "source_dir": "/a",
        "destination_dir": "/b", "filters": {"extensions": ["txt"]}}]})";
    
    RulesetFile file;
    QString error;
    ASSERT_TRUE(RulesetCodec::from_json(json, file, error)) << error.toStdString();
    ASSERT_EQ(file.rulesets.size(), 1u);
    EXPECT_EQ(file.version, 1);
    EXPECT_TRUE(file.rulesets[0].enabled);
    EXPECT_FALSE(file.rulesets[0].overwrite);
    EXPECT_EQ(file.rulesets[0].action, TransferAction::Move);
    EXPECT_FALSE(file.rulesets[0].filters.filename.has_value());
}

TEST(RulesetCodecTest, RejectsMalformedInput) {
    RulesetFile file;
    QString error;
    
    EXPECT_FALSE(RulesetCodec::from_json("{not json", file, error));
    EXPECT_FALSE(RulesetCodec::from_json("[]", file, error));
    
    EXPECT_FALSE(RulesetCodec::from_json(R"({"version": 2, "rulesets": []})", file, error));
    EXPECT_TRUE(error.contains("version"));
    
    EXPECT_FALSE(RulesetCodec::from_json(
        R"({"rulesets": [{"name": "x", "action": "shred", "filters": {}}]})", file, error));
    EXPECT_TRUE(error.startsWith("rulesets[0]"));
    
    EXPECT_FALSE(RulesetCodec::from_json(
        R"({"rulesets": [{"name": "x", "filters": {"modified_at": {"start": "yesterday"}}}]})", file, error));
    EXPECT_TRUE(error.contains("filters.modified_at.start"));
}

TEST(RulesetCodecTest, LoadOfMissingFileFails) {
    RulesetFile file;
    QString error;
    EXPECT_FALSE(RulesetCodec::load("/definitely/not/here.json", file, error));
    EXPECT_FALSE(error.isEmpty());
}
