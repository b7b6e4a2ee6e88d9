#include "common/config.hpp"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QRandomGenerator>
#include <QSaveFile>

#include <optional>

#include "common/logging.hpp"

namespace promptrail {

namespace {

constexpr const char *kConfigFileName = ".promptrail.json";

RedactionMode parseMode(const std::string &value)
{
    if (value == "hash") {
        return RedactionMode::Hash;
    }
    if (value != "replace") {
        PRLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("parseMode"),
                   QStringLiteral("unknown_redaction_mode"),
                   QStringLiteral("config_value"),
                   QStringLiteral("fallback_replace"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"mode", value}}));
    }
    return RedactionMode::Replace;
}

std::optional<PromptrailConfig> readConfigFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        PRLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("readConfigFile"),
                   QStringLiteral("config_unreadable"),
                   QStringLiteral("io_error"),
                   QStringLiteral("fallback_defaults"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}}));
        return PromptrailConfig{};
    }

    const QByteArray data = file.readAll();
    try {
        return configFromJson(nlohmann::json::parse(data.toStdString()));
    } catch (const nlohmann::json::exception &ex) {
        PRLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("readConfigFile"),
                   QStringLiteral("config_parse_failed"),
                   QStringLiteral("malformed_json"),
                   QStringLiteral("fallback_defaults"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        return PromptrailConfig{};
    }
}

} // namespace

PromptrailConfig configFromJson(const nlohmann::json &j)
{
    PromptrailConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("redaction") && j.at("redaction").is_object()) {
        const auto &redaction = j.at("redaction");
        if (redaction.contains("mode") && redaction.at("mode").is_string()) {
            config.redaction.mode = parseMode(redaction.at("mode").get<std::string>());
        }
        if (redaction.contains("custom_patterns") && redaction.at("custom_patterns").is_array()) {
            for (const auto &item : redaction.at("custom_patterns")) {
                if (!item.is_object()) {
                    continue;
                }
                CustomPattern pattern;
                pattern.pattern = item.value("pattern", "");
                pattern.replacement = item.value("replacement", "[REDACTED_CUSTOM]");
                if (!pattern.pattern.empty()) {
                    config.redaction.customPatterns.push_back(pattern);
                }
            }
        }
        if (redaction.contains("disable_patterns") && redaction.at("disable_patterns").is_array()) {
            for (const auto &item : redaction.at("disable_patterns")) {
                if (item.is_string()) {
                    config.redaction.disabledCategories.push_back(item.get<std::string>());
                }
            }
        }
        config.redaction.entropyCheck = redaction.value("entropy_check", true);
        config.redaction.entropyThreshold = redaction.value("entropy_threshold", 4.5);
    }

    if (j.contains("capture") && j.at("capture").is_object()) {
        const auto &capture = j.at("capture");
        const int maxLength = capture.value("max_prompt_length", 2000);
        config.capture.maxPromptLength = maxLength > 0 ? maxLength : 2000;
        config.capture.storeFullConversation = capture.value("store_full_conversation", false);
    }

    if (j.contains("sync") && j.at("sync").is_object()) {
        const std::string remote = j.at("sync").value("remote", "origin");
        config.sync.remote = remote.empty() ? "origin" : remote;
    }

    return config;
}

PromptrailConfig loadConfig(const QString &repoRoot)
{
    if (!repoRoot.isEmpty()) {
        if (auto config = readConfigFile(QDir(repoRoot).filePath(QLatin1String(kConfigFileName)))) {
            return *config;
        }
    }

    const QString home = qEnvironmentVariable("HOME");
    if (!home.isEmpty()) {
        if (auto config = readConfigFile(QDir(home).filePath(QLatin1String(kConfigFileName)))) {
            return *config;
        }
    }
    return PromptrailConfig{};
}

std::string loadOrCreateSalt(const QString &stateDir)
{
    const QString path = QDir(stateDir).filePath(QStringLiteral("redaction.salt"));
    QFile existing(path);
    if (existing.open(QIODevice::ReadOnly)) {
        const QByteArray salt = existing.readAll().trimmed();
        if (!salt.isEmpty()) {
            return salt.toStdString();
        }
    }

    QByteArray seed(32, Qt::Uninitialized);
    for (char &byte : seed) {
        byte = static_cast<char>(QRandomGenerator::system()->bounded(256));
    }
    const QByteArray salt = QCryptographicHash::hash(seed, QCryptographicHash::Sha256).toHex();

    QDir().mkpath(stateDir);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(salt) != salt.size() || !file.commit()) {
        // Still usable for this run; the next run will try to persist again.
        PRLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("loadOrCreateSalt"),
                   QStringLiteral("salt_persist_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qsavefile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}}));
    }
    return salt.toStdString();
}

} // namespace promptrail
