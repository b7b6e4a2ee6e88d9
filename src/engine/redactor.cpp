#include "engine/redactor.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include <QCryptographicHash>

#include "common/logging.hpp"

namespace promptrail {

namespace {

struct BuiltinRule {
    const char *category;
    const char *pattern;
    const char *replacement;
    bool caseInsensitive;
};

// Order matters: multi-line key blocks go first so their bodies are not
// picked apart by the narrower rules.
constexpr BuiltinRule kBuiltinRules[] = {
    {"PRIVATE_KEY",
     R"(-----BEGIN [A-Z ]*PRIVATE KEY-----[\s\S]*?(?:-----END [A-Z ]*PRIVATE KEY-----|$))",
     "[REDACTED_PRIVATE_KEY]", false},
    {"API_KEY", R"(sk-[A-Za-z0-9_-]{20,})", "[REDACTED_API_KEY]", false},
    {"API_KEY", R"(key-[A-Za-z0-9_-]{20,})", "[REDACTED_API_KEY]", false},
    {"AWS_KEY", R"((?:AKIA|ASIA)[A-Z0-9]{16})", "[REDACTED_AWS_KEY]", false},
    {"CLOUD_TOKEN", R"(AIza[0-9A-Za-z_-]{35})", "[REDACTED_CLOUD_TOKEN]", false},
    {"CLOUD_TOKEN", R"(gh[pousr]_[A-Za-z0-9]{36,})", "[REDACTED_CLOUD_TOKEN]", false},
    {"CLOUD_TOKEN", R"(github_pat_[A-Za-z0-9_]{22,})", "[REDACTED_CLOUD_TOKEN]", false},
    {"PASSWORD", R"((password|passwd|secret)\s*[=:]\s*"[^"]*")", "[REDACTED_SECRET]", true},
    {"PASSWORD", R"((password|passwd|secret)\s*[=:]\s*'[^']*')", "[REDACTED_SECRET]", true},
    {"BEARER_TOKEN", R"(Bearer\s+[A-Za-z0-9_.~+/=-]{10,})", "Bearer [REDACTED]", true},
    {"TOKEN", R"((token|auth)\s*[=:]\s*[A-Za-z0-9_.~+/=-]{40,})", "[REDACTED_TOKEN]", true},
    {"SHELL_PROMPT", R"([a-zA-Z0-9_.-]+@[a-zA-Z0-9._-]{2,})", "[REDACTED_HOST]", false},
    {"HOME_PATH", R"((?:/Users/|/home/)[a-zA-Z0-9_.-]+)", "[REDACTED_HOME]", false},
};

const QRegularExpression &entropyTokenRegex()
{
    static const QRegularExpression regex(QStringLiteral("[A-Za-z0-9+/=_\\-]{20,}"));
    return regex;
}

constexpr int kMaxVerificationPasses = 2;

} // namespace

Redactor::Redactor(const RedactionConfig &config, std::string salt)
    : m_mode(config.mode)
    , m_entropyCheck(config.entropyCheck)
    , m_entropyThreshold(config.entropyThreshold)
    , m_salt(std::move(salt))
{
    const auto &disabled = config.disabledCategories;
    for (const auto &builtin : kBuiltinRules) {
        if (std::find(disabled.begin(), disabled.end(), builtin.category) != disabled.end()) {
            continue;
        }
        QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption;
        if (builtin.caseInsensitive) {
            options |= QRegularExpression::CaseInsensitiveOption;
        }
        m_builtin.push_back(Rule{builtin.category,
                                 QRegularExpression(QString::fromUtf8(builtin.pattern), options),
                                 QString::fromUtf8(builtin.replacement)});
    }
    if (std::find(disabled.begin(), disabled.end(), "HIGH_ENTROPY") != disabled.end()) {
        m_entropyCheck = false;
    }

    for (const auto &custom : config.customPatterns) {
        QRegularExpression regex(QString::fromStdString(custom.pattern));
        if (!regex.isValid()) {
            const std::string message = "invalid custom pattern '" + custom.pattern
                + "': " + regex.errorString().toStdString();
            m_warnings.push_back(message);
            PRLOG_WARN(QStringLiteral("Redactor"),
                       QStringLiteral("Redactor"),
                       QStringLiteral("custom_pattern_skipped"),
                       QStringLiteral("regex_compile_failed"),
                       QStringLiteral("skip_pattern"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"pattern", custom.pattern},
                                       {"error", regex.errorString().toStdString()}}));
            continue;
        }
        m_custom.push_back(Rule{"CUSTOM", regex, QString::fromStdString(custom.replacement)});
    }
}

RedactionResult Redactor::redact(const std::string &text) const
{
    RedactionResult result;
    QString working = QString::fromStdString(text);

    for (const auto &rule : m_builtin) {
        working = substitute(rule, working, result.counts);
    }
    for (const auto &rule : m_custom) {
        working = substitute(rule, working, result.counts);
    }
    if (m_entropyCheck) {
        working = substituteHighEntropy(working, result.counts);
    }

    // A custom replacement may reintroduce a built-in shape.
    for (int pass = 0; pass < kMaxVerificationPasses; ++pass) {
        if (!containsSecret(working.toStdString())) {
            break;
        }
        for (const auto &rule : m_builtin) {
            working = substitute(rule, working, result.counts);
        }
    }

    result.text = working.toStdString();
    return result;
}

bool Redactor::containsSecret(const std::string &text) const
{
    const QString input = QString::fromStdString(text);
    for (const auto &rule : m_builtin) {
        if (rule.regex.match(input).hasMatch()) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Redactor::builtinCategories()
{
    std::vector<std::string> categories;
    for (const auto &builtin : kBuiltinRules) {
        if (std::find(categories.begin(), categories.end(), builtin.category) == categories.end()) {
            categories.push_back(builtin.category);
        }
    }
    categories.push_back("HIGH_ENTROPY");
    return categories;
}

double Redactor::shannonEntropy(const QString &token)
{
    if (token.isEmpty()) {
        return 0.0;
    }
    std::unordered_map<char16_t, int> frequency;
    for (const QChar ch : token) {
        ++frequency[ch.unicode()];
    }
    const double length = static_cast<double>(token.size());
    double entropy = 0.0;
    for (const auto &entry : frequency) {
        const double p = entry.second / length;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

QString Redactor::substitute(const Rule &rule, const QString &input,
                             std::map<std::string, int> &counts) const
{
    QString output;
    int last = 0;
    int hits = 0;
    auto it = rule.regex.globalMatch(input);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        if (match.capturedLength() == 0) {
            continue;
        }
        output += input.mid(last, match.capturedStart() - last);
        if (m_mode == RedactionMode::Hash) {
            output += hashedPlaceholder(match.captured());
        } else {
            output += rule.replacement;
        }
        last = match.capturedEnd();
        ++hits;
    }
    if (hits == 0) {
        return input;
    }
    output += input.mid(last);
    counts[rule.category] += hits;
    return output;
}

QString Redactor::substituteHighEntropy(const QString &input,
                                        std::map<std::string, int> &counts) const
{
    QString output;
    int last = 0;
    int hits = 0;
    auto it = entropyTokenRegex().globalMatch(input);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const QString token = match.captured();
        if (token.contains(QLatin1String("REDACTED")) || token.contains(QLatin1String("SHA256"))) {
            continue;
        }
        if (shannonEntropy(token) <= m_entropyThreshold) {
            continue;
        }
        output += input.mid(last, match.capturedStart() - last);
        output += m_mode == RedactionMode::Hash
            ? hashedPlaceholder(token)
            : QStringLiteral("[REDACTED_HIGH_ENTROPY]");
        last = match.capturedEnd();
        ++hits;
    }
    if (hits == 0) {
        return input;
    }
    output += input.mid(last);
    counts["HIGH_ENTROPY"] += hits;
    return output;
}

QString Redactor::hashedPlaceholder(const QString &secret) const
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(QByteArray::fromStdString(m_salt));
    hash.addData(secret.toUtf8());
    const QString digest = QString::fromLatin1(hash.result().toHex().left(12));
    return QStringLiteral("[SHA256:%1]").arg(digest);
}

} // namespace promptrail
