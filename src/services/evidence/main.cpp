#include "evidence_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("policylens-evidence"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Retrieval and evidence packing service"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOption(
        {QStringLiteral("s"), QStringLiteral("settings")},
        QStringLiteral("Settings file (default: %1).").arg(pl::SettingsManager::settingsFilePath()),
        QStringLiteral("path"));
    parser.addOption(settingsOption);
    parser.process(app);

    const std::optional<pl::Settings> settings =
        parser.isSet(settingsOption)
            ? pl::SettingsManager::loadFromFile(parser.value(settingsOption))
            : pl::SettingsManager::load();
    if (!settings) {
        LOG_ERROR(plCore, "No usable settings file; see --help");
        return 1;
    }

    std::unique_ptr<pl::EvidenceService> service = pl::EvidenceService::create(*settings);
    if (!service) {
        return 1;
    }
    return service->run();
}
