// RulesetCodec.hpp
// JSON import/export of rule sets:
//   { "version": 1, "rulesets": [ { "id", "name", "enabled", "source_dir",
//     "destination_dir", "action", "overwrite", "filters": { ... } } ] }

#ifndef RULESET_CODEC_HPP
#define RULESET_CODEC_HPP

#include "RuleTypes.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <vector>

struct RulesetFile {
    int version = 1;
    std::vector<Rule> rulesets;
};

class RulesetCodec {
public:
    static constexpr int kFormatVersion = 1;
    
    static QJsonObject rule_to_json(const Rule& rule);
    static bool rule_from_json(const QJsonObject& object, Rule& rule, QString& error);
    
    static QJsonObject filters_to_json(const Filters& filters);
    static bool filters_from_json(const QJsonObject& object, Filters& filters, QString& error);
    
    static QByteArray to_json(const RulesetFile& file);
    static bool from_json(const QByteArray& data, RulesetFile& file, QString& error);
    
    static bool load(const QString& path, RulesetFile& file, QString& error);
    // Creates the parent folder when needed.
    static bool save(const QString& path, const RulesetFile& file, QString& error);
    
private:
    static QJsonValue range_to_json(const std::optional<DateTimeRange>& range);
    static bool range_from_json(const QJsonValue& value, const QString& field,
                                std::optional<DateTimeRange>& range, QString& error);
};

#endif // RULESET_CODEC_HPP
