#include "RulesetStore.hpp"
#include "AppLogger.hpp"
#include "AppSettings.hpp"
#include "FilterEngine.hpp"
#include "RuleValidator.hpp"
#include "RulesetCodec.hpp"
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>
#include <QVariant>

namespace {

Rule rule_from_row(const QSqlQuery& query) {
    Rule rule;
    rule.id = query.value(0).toString();
    rule.name = query.value(1).toString();
    rule.enabled = query.value(2).toBool();
    rule.source_dir = query.value(3).toString();
    rule.destination_dir = query.value(4).toString();
    if (!action_from_name(query.value(5).toString(), rule.action)) {
        LOG_WARN("Store", QString("Rule %1 has unknown action '%2', using move")
                 .arg(rule.id, query.value(5).toString()));
    }
    rule.overwrite = query.value(6).toBool();
    
    QString error;
    const QJsonDocument filters = QJsonDocument::fromJson(query.value(7).toString().toUtf8());
    if (!RulesetCodec::filters_from_json(filters.object(), rule.filters, error)) {
        LOG_WARN("Store", QString("Rule %1 has unreadable filters: %2").arg(rule.id, error));
    }
    return rule;
}

const char* kSelectColumns =
    "SELECT id, name, enabled, source_dir, destination_dir, action, overwrite, filters FROM rulesets";

} // namespace

RulesetStore::RulesetStore(const QString& db_path)
    : db_path_(db_path)
    , connection_name_("RuleSorterDB_" + QString::number(reinterpret_cast<quintptr>(this))) {
    if (db_path_.isEmpty()) {
        db_path_ = AppSettings::default_data_dir() + "/rule_sorter.db";
    }
}

RulesetStore::~RulesetStore() {
    if (db_.isOpen()) {
        db_.close();
    }
    db_ = QSqlDatabase();
    QSqlDatabase::removeDatabase(connection_name_);
}

bool RulesetStore::initialize() {
    QDir().mkpath(QFileInfo(db_path_).absolutePath());
    
    db_ = QSqlDatabase::addDatabase("QSQLITE", connection_name_);
    db_.setDatabaseName(db_path_);
    
    if (!db_.open()) {
        LOG_ERROR("Store", QString("Failed to open database %1: %2").arg(db_path_, db_.lastError().text()));
        return false;
    }
    
    return create_tables();
}

bool RulesetStore::is_open() const {
    return db_.isOpen();
}

bool RulesetStore::create_tables() {
    return execute_query(R"(
        CREATE TABLE IF NOT EXISTS rulesets (
            id TEXT PRIMARY KEY,
            sort_order INTEGER NOT NULL,
            name TEXT NOT NULL,
            enabled INTEGER NOT NULL DEFAULT 1,
            source_dir TEXT NOT NULL,
            destination_dir TEXT NOT NULL,
            action TEXT NOT NULL CHECK (action IN ('move', 'copy')),
            overwrite INTEGER NOT NULL DEFAULT 0,
            filters TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

bool RulesetStore::execute_query(const QString& query) {
    QSqlQuery q(db_);
    if (!q.exec(query)) {
        LOG_ERROR("Store", QString("Query failed: %1").arg(q.lastError().text()));
        LOG_DEBUG("Store", QString("Query: %1").arg(query));
        return false;
    }
    return true;
}

int RulesetStore::next_sort_order() {
    QSqlQuery query(db_);
    if (query.exec("SELECT MAX(sort_order) FROM rulesets") && query.next() && !query.value(0).isNull()) {
        return query.value(0).toInt() + 1;
    }
    return 0;
}

std::vector<Rule> RulesetStore::get_rulesets() {
    std::vector<Rule> rules;
    
    QSqlQuery query(db_);
    if (!query.exec(QString(kSelectColumns) + " ORDER BY sort_order")) {
        LOG_ERROR("Store", QString("Failed to read rule sets: %1").arg(query.lastError().text()));
        return rules;
    }
    while (query.next()) {
        rules.push_back(rule_from_row(query));
    }
    
    return rules;
}

std::optional<Rule> RulesetStore::find_ruleset(const QString& id) {
    QSqlQuery query(db_);
    query.prepare(QString(kSelectColumns) + " WHERE id = ?");
    query.addBindValue(id);
    
    if (query.exec() && query.next()) {
        return rule_from_row(query);
    }
    return std::nullopt;
}

bool RulesetStore::save_ruleset(Rule& rule, QString& error) {
    if (rule.filters.extensions) {
        rule.filters.extensions = FilterEngine::normalize_extensions(*rule.filters.extensions);
    }
    
    ValidationReport report = RuleValidator::validate(rule);
    if (!report.ok()) {
        error = report.message();
        return false;
    }
    
    if (rule.id.isEmpty()) {
        rule.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    
    const QByteArray filters = QJsonDocument(RulesetCodec::filters_to_json(rule.filters))
        .toJson(QJsonDocument::Compact);
    
    QSqlQuery query(db_);
    const bool existing = find_ruleset(rule.id).has_value();
    if (existing) {
        query.prepare(R"(
            UPDATE rulesets
            SET name = ?, enabled = ?, source_dir = ?, destination_dir = ?,
                action = ?, overwrite = ?, filters = ?, updated_at = datetime('now')
            WHERE id = ?
        )");
    } else {
        query.prepare(R"(
            INSERT INTO rulesets
            (name, enabled, source_dir, destination_dir, action, overwrite, filters, id, sort_order)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
    }
    query.addBindValue(rule.name);
    query.addBindValue(rule.enabled ? 1 : 0);
    query.addBindValue(rule.source_dir);
    query.addBindValue(rule.destination_dir);
    query.addBindValue(action_name(rule.action));
    query.addBindValue(rule.overwrite ? 1 : 0);
    query.addBindValue(QString::fromUtf8(filters));
    query.addBindValue(rule.id);
    if (!existing) {
        query.addBindValue(next_sort_order());
    }
    
    if (!query.exec()) {
        error = QString("Failed to save rule set: %1").arg(query.lastError().text());
        LOG_ERROR("Store", error);
        return false;
    }
    
    LOG_INFO("Store", QString("Saved rule set '%1' (%2)").arg(rule.name, rule.id));
    return true;
}

bool RulesetStore::delete_ruleset(const QString& id) {
    QSqlQuery query(db_);
    query.prepare("DELETE FROM rulesets WHERE id = ?");
    query.addBindValue(id);
    if (!query.exec()) {
        LOG_ERROR("Store", QString("Failed to delete rule set %1: %2").arg(id, query.lastError().text()));
        return false;
    }
    return query.numRowsAffected() > 0;
}

bool RulesetStore::reorder_rulesets(const QStringList& ids) {
    if (!db_.transaction()) {
        LOG_ERROR("Store", QString("Cannot start transaction: %1").arg(db_.lastError().text()));
        return false;
    }
    
    QStringList kept;
    for (const QString& id : ids) {
        if (!kept.contains(id)) {
            kept.append(id);
        }
    }
    
    bool ok = true;
    for (const Rule& rule : get_rulesets()) {
        if (kept.contains(rule.id)) {
            continue;
        }
        QSqlQuery remove(db_);
        remove.prepare("DELETE FROM rulesets WHERE id = ?");
        remove.addBindValue(rule.id);
        ok = ok && remove.exec();
    }
    
    for (int i = 0; ok && i < kept.size(); ++i) {
        QSqlQuery update(db_);
        update.prepare("UPDATE rulesets SET sort_order = ? WHERE id = ?");
        update.addBindValue(i);
        update.addBindValue(kept[i]);
        ok = update.exec();
    }
    
    if (!ok || !db_.commit()) {
        LOG_ERROR("Store", QString("Reorder failed: %1").arg(db_.lastError().text()));
        if (!db_.rollback()) {
            LOG_ERROR("Store", QString("Rollback failed: %1").arg(db_.lastError().text()));
        }
        return false;
    }
    return true;
}

bool RulesetStore::set_enabled(const QString& id, bool enabled) {
    QSqlQuery query(db_);
    query.prepare("UPDATE rulesets SET enabled = ?, updated_at = datetime('now') WHERE id = ?");
    query.addBindValue(enabled ? 1 : 0);
    query.addBindValue(id);
    if (!query.exec()) {
        LOG_ERROR("Store", QString("Failed to update rule set %1: %2").arg(id, query.lastError().text()));
        return false;
    }
    return query.numRowsAffected() > 0;
}
