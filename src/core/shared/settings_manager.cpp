#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace pl {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback, int minimum)
{
    const QString name = QLatin1String(key);
    if (!json.contains(name)) {
        return fallback;
    }
    return std::max(minimum, json.value(name).toInt(fallback));
}

double readDouble(const QJsonObject& json, const char* key, double fallback, double minimum)
{
    const QString name = QLatin1String(key);
    if (!json.contains(name)) {
        return fallback;
    }
    return std::max(minimum, json.value(name).toDouble(fallback));
}

QJsonObject retrievalToJson(const RetrievalSettings& r)
{
    QJsonObject json;
    json.insert(QStringLiteral("topK"), r.topK);
    json.insert(QStringLiteral("neighborRadius"), r.neighborRadius);
    json.insert(QStringLiteral("baseScoreFactor"), r.baseScoreFactor);
    json.insert(QStringLiteral("sentWindow"), r.sentWindow);
    json.insert(QStringLiteral("maxSentChars"), r.maxSentChars);
    json.insert(QStringLiteral("dedupKeyChars"), r.dedupKeyChars);
    json.insert(QStringLiteral("lenientScoreFloor"), r.lenientScoreFloor);
    json.insert(QStringLiteral("charBudget"), r.charBudget);
    json.insert(QStringLiteral("maxBlocks"), r.maxBlocks);
    json.insert(QStringLiteral("overageMultiplier"), r.overageMultiplier);
    json.insert(QStringLiteral("overageChunkLimit"), r.overageChunkLimit);
    json.insert(QStringLiteral("minPackedChunks"), r.minPackedChunks);
    json.insert(QStringLiteral("fallbackPageLimit"), r.fallbackPageLimit);
    json.insert(QStringLiteral("concurrency"), r.concurrency);
    return json;
}

RetrievalSettings retrievalFromJson(const QJsonObject& json)
{
    RetrievalSettings r;
    r.topK = readInt(json, "topK", r.topK, 1);
    r.neighborRadius = readInt(json, "neighborRadius", r.neighborRadius, 0);
    r.baseScoreFactor = readDouble(json, "baseScoreFactor", r.baseScoreFactor, 0.0);
    r.sentWindow = readInt(json, "sentWindow", r.sentWindow, 0);
    r.maxSentChars = readInt(json, "maxSentChars", r.maxSentChars, 1);
    r.dedupKeyChars = readInt(json, "dedupKeyChars", r.dedupKeyChars, 1);
    r.lenientScoreFloor = readDouble(json, "lenientScoreFloor", r.lenientScoreFloor, 0.0);
    r.charBudget = readInt(json, "charBudget", r.charBudget, 1);
    r.maxBlocks = readInt(json, "maxBlocks", r.maxBlocks, 1);
    r.overageMultiplier = readDouble(json, "overageMultiplier", r.overageMultiplier, 1.0);
    r.overageChunkLimit = readInt(json, "overageChunkLimit", r.overageChunkLimit, 0);
    r.minPackedChunks = readInt(json, "minPackedChunks", r.minPackedChunks, 0);
    r.fallbackPageLimit = readInt(json, "fallbackPageLimit", r.fallbackPageLimit, 1);
    r.concurrency = readInt(json, "concurrency", r.concurrency, 1);
    return r;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFromFile(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(plCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(plCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    Settings settings = fromJson(doc.object());

    // Relative store paths are resolved against the settings file location
    const QDir baseDir = QFileInfo(filePath).absoluteDir();
    for (QString* path : {&settings.pagesDbPath, &settings.pagesJsonPath,
                          &settings.embeddingsPath}) {
        if (!path->isEmpty() && QFileInfo(*path).isRelative()) {
            *path = QDir::cleanPath(baseDir.absoluteFilePath(*path));
        }
    }
    return settings;
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString target = filePath.isEmpty() ? settingsFilePath() : filePath;
    const QFileInfo fileInfo(target);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(plCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(plCore, "Failed to open settings file for write: %s", qUtf8Printable(target));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(plCore, "Failed to write settings file: %s", qUtf8Printable(target));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("POLICYLENS_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/policylens/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject embedding;
    embedding.insert(QStringLiteral("endpoint"), settings.embedding.endpoint);
    embedding.insert(QStringLiteral("model"), settings.embedding.model);
    embedding.insert(QStringLiteral("apiKeyEnv"), settings.embedding.apiKeyEnv);
    embedding.insert(QStringLiteral("taskType"), settings.embedding.taskType);
    embedding.insert(QStringLiteral("requestTimeoutMs"), settings.embedding.requestTimeoutMs);

    QJsonObject json;
    json.insert(QStringLiteral("pagesDbPath"), settings.pagesDbPath);
    json.insert(QStringLiteral("pagesJsonPath"), settings.pagesJsonPath);
    json.insert(QStringLiteral("embeddingsPath"), settings.embeddingsPath);
    json.insert(QStringLiteral("embedding"), embedding);
    json.insert(QStringLiteral("retrieval"), retrievalToJson(settings.retrieval));
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.pagesDbPath = json.value(QStringLiteral("pagesDbPath")).toString(settings.pagesDbPath);
    settings.pagesJsonPath = json.value(QStringLiteral("pagesJsonPath")).toString(settings.pagesJsonPath);
    settings.embeddingsPath = json.value(QStringLiteral("embeddingsPath")).toString(settings.embeddingsPath);

    const QJsonObject embedding = json.value(QStringLiteral("embedding")).toObject();
    EmbeddingProviderSettings& e = settings.embedding;
    e.endpoint = embedding.value(QStringLiteral("endpoint")).toString(e.endpoint);
    e.model = embedding.value(QStringLiteral("model")).toString(e.model);
    e.apiKeyEnv = embedding.value(QStringLiteral("apiKeyEnv")).toString(e.apiKeyEnv);
    e.taskType = embedding.value(QStringLiteral("taskType")).toString(e.taskType);
    e.requestTimeoutMs = readInt(embedding, "requestTimeoutMs", e.requestTimeoutMs, 0);

    if (json.value(QStringLiteral("retrieval")).isObject()) {
        settings.retrieval = retrievalFromJson(json.value(QStringLiteral("retrieval")).toObject());
    }

    return settings;
}

} // namespace pl
