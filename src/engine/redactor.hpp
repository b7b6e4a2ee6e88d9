#pragma once

#include <map>
#include <string>
#include <vector>

#include <QRegularExpression>
#include <QString>

#include "common/config.hpp"

namespace promptrail {

struct RedactionResult {
    std::string text;
    // Category -> number of substitutions.
    std::map<std::string, int> counts;

    int total() const
    {
        int sum = 0;
        for (const auto &entry : counts) {
            sum += entry.second;
        }
        return sum;
    }
};

// Redactor scrubs secrets from free text before anything is staged.
// Built-in rules run first, then custom rules, then the entropy check.
class Redactor {
public:
    Redactor(const RedactionConfig &config, std::string salt);

    RedactionResult redact(const std::string &text) const;

    // Custom patterns that failed to compile and were skipped.
    const std::vector<std::string> &warnings() const
    {
        return m_warnings;
    }

    // True when any enabled built-in rule still matches the text.
    bool containsSecret(const std::string &text) const;

    static std::vector<std::string> builtinCategories();
    static double shannonEntropy(const QString &token);

private:
    struct Rule {
        std::string category;
        QRegularExpression regex;
        QString replacement;
    };

    QString substitute(const Rule &rule, const QString &input,
                       std::map<std::string, int> &counts) const;
    QString substituteHighEntropy(const QString &input,
                                  std::map<std::string, int> &counts) const;
    QString hashedPlaceholder(const QString &secret) const;

    RedactionMode m_mode;
    bool m_entropyCheck;
    double m_entropyThreshold;
    std::string m_salt;
    std::vector<Rule> m_builtin;
    std::vector<Rule> m_custom;
    std::vector<std::string> m_warnings;
};

} // namespace promptrail
