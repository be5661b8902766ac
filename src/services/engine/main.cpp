#include "engine_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("learnpulse-engine"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    lp::EngineSettings settings = lp::SettingsManager::load().value_or(lp::EngineSettings{});

    const QString dbOverride = qEnvironmentVariable("LEARNPULSE_DB_PATH").trimmed();
    if (!dbOverride.isEmpty()) {
        settings.dbPath = dbOverride;
    }
    if (settings.dbPath.isEmpty()) {
        const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
            + QStringLiteral("/learnpulse");
        QDir().mkpath(dataDir);
        settings.dbPath = dataDir + QStringLiteral("/engine.db");
    }

    lp::EngineService service(settings);
    QString error;
    if (!service.start(&error)) {
        LOG_ERROR(lpCore, "Engine failed to start: %s", qPrintable(error));
        return 1;
    }

    const int rc = service.run();
    service.stop();
    return rc;
}
