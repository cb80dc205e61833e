#ifndef RULE_VALIDATOR_HPP
#define RULE_VALIDATOR_HPP

#include "RuleTypes.hpp"
#include <QString>
#include <QStringList>

struct ValidationReport {
    QStringList errors;
    
    bool ok() const { return errors.isEmpty(); }
    QString message() const { return errors.join("; "); }
};

class RuleValidator {
public:
    static ValidationReport validate(const Rule& rule);
    
private:
    static void check_range(const char* label, const DateTimeRange& range, QStringList& errors);
};

#endif // RULE_VALIDATOR_HPP
