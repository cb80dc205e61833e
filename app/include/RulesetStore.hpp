#ifndef RULESET_STORE_HPP
#define RULESET_STORE_HPP

#include "RuleTypes.hpp"
#include <QString>
#include <QStringList>
#include <QSqlDatabase>
#include <optional>
#include <vector>

// Ordered rule list kept in SQLite. Filters are stored as a JSON column in the
// same shape RulesetCodec exports.
class RulesetStore {
public:
    explicit RulesetStore(const QString& db_path = "");
    ~RulesetStore();
    
    bool initialize();
    bool is_open() const;
    QString database_path() const { return db_path_; }
    
    std::vector<Rule> get_rulesets();
    std::optional<Rule> find_ruleset(const QString& id);
    
    // Validates, assigns a UUID when rule.id is empty, then inserts at the end
    // or replaces in place.
    bool save_ruleset(Rule& rule, QString& error);
    bool delete_ruleset(const QString& id);
    // Rules whose ids are not listed are removed.
    bool reorder_rulesets(const QStringList& ids);
    bool set_enabled(const QString& id, bool enabled);
    
private:
    QSqlDatabase db_;
    QString db_path_;
    QString connection_name_;
    
    bool create_tables();
    bool execute_query(const QString& query);
    int next_sort_order();
};

#endif // RULESET_STORE_HPP
