#include "RulesetCodec.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

namespace {

QJsonValue datetime_to_json(const std::optional<QDateTime>& value) {
    if (!value) {
        return QJsonValue(QJsonValue::Null);
    }
    return value->toString(Qt::ISODateWithMs);
}

bool datetime_from_json(const QJsonValue& value, const QString& field,
                        std::optional<QDateTime>& out, QString& error) {
    if (value.isUndefined() || value.isNull()) {
        out.reset();
        return true;
    }
    if (!value.isString()) {
        error = QString("%1 must be a date/time string").arg(field);
        return false;
    }
    const QDateTime parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        error = QString("invalid datetime format for %1: '%2'").arg(field, value.toString());
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

QJsonValue RulesetCodec::range_to_json(const std::optional<DateTimeRange>& range) {
    if (!range) {
        return QJsonValue(QJsonValue::Null);
    }
    QJsonObject object;
    object["start"] = datetime_to_json(range->start);
    object["end"] = datetime_to_json(range->end);
    return object;
}

bool RulesetCodec::range_from_json(const QJsonValue& value, const QString& field,
                                   std::optional<DateTimeRange>& range, QString& error) {
    if (value.isUndefined() || value.isNull()) {
        range.reset();
        return true;
    }
    if (!value.isObject()) {
        error = QString("%1 must be an object").arg(field);
        return false;
    }
    const QJsonObject object = value.toObject();
    DateTimeRange parsed;
    if (!datetime_from_json(object.value("start"), field + ".start", parsed.start, error)
        || !datetime_from_json(object.value("end"), field + ".end", parsed.end, error)) {
        return false;
    }
    range = parsed;
    return true;
}

QJsonObject RulesetCodec::filters_to_json(const Filters& filters) {
    QJsonObject object;
    
    if (filters.extensions) {
        object["extensions"] = QJsonArray::fromStringList(*filters.extensions);
    } else {
        object["extensions"] = QJsonValue(QJsonValue::Null);
    }
    
    if (filters.filename) {
        QJsonObject filename;
        filename["pattern"] = filters.filename->pattern;
        filename["match_type"] = match_type_name(filters.filename->match_type);
        object["filename"] = filename;
    } else {
        object["filename"] = QJsonValue(QJsonValue::Null);
    }
    
    object["created_at"] = range_to_json(filters.created_at);
    object["modified_at"] = range_to_json(filters.modified_at);
    return object;
}

bool RulesetCodec::filters_from_json(const QJsonObject& object, Filters& filters, QString& error) {
    Filters parsed;
    
    const QJsonValue extensions = object.value("extensions");
    if (extensions.isArray()) {
        QStringList list;
        for (const QJsonValue& item : extensions.toArray()) {
            if (!item.isString()) {
                error = "filters.extensions must contain strings";
                return false;
            }
            list.append(item.toString());
        }
        parsed.extensions = list;
    } else if (!extensions.isUndefined() && !extensions.isNull()) {
        error = "filters.extensions must be a list";
        return false;
    }
    
    const QJsonValue filename = object.value("filename");
    if (filename.isObject()) {
        const QJsonObject filename_object = filename.toObject();
        FilenameFilter filter;
        filter.pattern = filename_object.value("pattern").toString();
        if (!match_type_from_name(filename_object.value("match_type").toString(), filter.match_type)) {
            error = QString("unknown filters.filename.match_type '%1'")
                .arg(filename_object.value("match_type").toString());
            return false;
        }
        parsed.filename = filter;
    } else if (!filename.isUndefined() && !filename.isNull()) {
        error = "filters.filename must be an object";
        return false;
    }
    
    if (!range_from_json(object.value("created_at"), "filters.created_at", parsed.created_at, error)
        || !range_from_json(object.value("modified_at"), "filters.modified_at", parsed.modified_at, error)) {
        return false;
    }
    
    filters = parsed;
    return true;
}

QJsonObject RulesetCodec::rule_to_json(const Rule& rule) {
    QJsonObject object;
    object["id"] = rule.id;
    object["name"] = rule.name;
    object["enabled"] = rule.enabled;
    object["source_dir"] = rule.source_dir;
    object["destination_dir"] = rule.destination_dir;
    object["action"] = action_name(rule.action);
    object["overwrite"] = rule.overwrite;
    object["filters"] = filters_to_json(rule.filters);
    return object;
}

bool RulesetCodec::rule_from_json(const QJsonObject& object, Rule& rule, QString& error) {
    Rule parsed;
    parsed.id = object.value("id").toString();
    parsed.name = object.value("name").toString();
    parsed.enabled = object.value("enabled").toBool(true);
    parsed.source_dir = object.value("source_dir").toString();
    parsed.destination_dir = object.value("destination_dir").toString();
    parsed.overwrite = object.value("overwrite").toBool(false);
    
    const QString action = object.value("action").toString("move");
    if (!action_from_name(action, parsed.action)) {
        error = QString("unknown action '%1'").arg(action);
        return false;
    }
    
    const QJsonValue filters = object.value("filters");
    if (!filters.isObject()) {
        error = "filters must be an object";
        return false;
    }
    if (!filters_from_json(filters.toObject(), parsed.filters, error)) {
        return false;
    }
    
    rule = parsed;
    return true;
}

QByteArray RulesetCodec::to_json(const RulesetFile& file) {
    QJsonArray rulesets;
    for (const Rule& rule : file.rulesets) {
        rulesets.append(rule_to_json(rule));
    }
    QJsonObject root;
    root["version"] = file.version;
    root["rulesets"] = rulesets;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool RulesetCodec::from_json(const QByteArray& data, RulesetFile& file, QString& error) {
    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        error = QString("JSON error at offset %1: %2").arg(parse_error.offset).arg(parse_error.errorString());
        return false;
    }
    if (!doc.isObject()) {
        error = "top level must be an object";
        return false;
    }
    
    const QJsonObject root = doc.object();
    RulesetFile parsed;
    parsed.version = root.value("version").toInt(kFormatVersion);
    if (parsed.version > kFormatVersion) {
        error = QString("unsupported format version %1").arg(parsed.version);
        return false;
    }
    
    const QJsonArray rulesets = root.value("rulesets").toArray();
    for (int i = 0; i < rulesets.size(); ++i) {
        Rule rule;
        QString rule_error;
        if (!rulesets.at(i).isObject() || !rule_from_json(rulesets.at(i).toObject(), rule, rule_error)) {
            error = QString("rulesets[%1]: %2").arg(i).arg(rule_error.isEmpty() ? "must be an object" : rule_error);
            return false;
        }
        parsed.rulesets.push_back(rule);
    }
    
    file = parsed;
    return true;
}

bool RulesetCodec::load(const QString& path, RulesetFile& file, QString& error) {
    QFile in(path);
    if (!in.open(QIODevice::ReadOnly)) {
        error = QString("Cannot open %1: %2").arg(path, in.errorString());
        return false;
    }
    if (!from_json(in.readAll(), file, error)) {
        error = QString("%1: %2").arg(path, error);
        return false;
    }
    LOG_INFO("Codec", QString("Loaded %1 rule set(s) from %2").arg(file.rulesets.size()).arg(path));
    return true;
}

bool RulesetCodec::save(const QString& path, const RulesetFile& file, QString& error) {
    const QString parent = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parent)) {
        error = QString("Cannot create folder %1").arg(parent);
        return false;
    }
    
    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly)) {
        error = QString("Cannot write %1: %2").arg(path, out.errorString());
        return false;
    }
    const QByteArray data = to_json(file);
    if (out.write(data) != data.size() || !out.commit()) {
        error = QString("Cannot write %1: %2").arg(path, out.errorString());
        return false;
    }
    LOG_INFO("Codec", QString("Exported %1 rule set(s) to %2").arg(file.rulesets.size()).arg(path));
    return true;
}
