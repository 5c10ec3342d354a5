#include <QCoreApplication>
#include <QDir>
#include <QProcessEnvironment>

#include "adapters/executor/qt_executor.h"
#include "adapters/outbound/copilot_api.h"
#include "auth/credential_manager.h"
#include "catalog/catalog_cache.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "naming/model_renamer.h"
#include "pipeline/pipeline.h"
#include "proxy/proxy_server.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("msgbridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Config ---
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    ConfigStore configStore;
    const QString configPath = env.value(QStringLiteral("MSGBRIDGE_CONFIG"));
    if (!configPath.isEmpty() && !configStore.load(configPath)) {
        LOG_WARNING(QStringLiteral("Config file %1 not loaded, using defaults").arg(configPath));
    }
    configStore.applyEnvironment(env);
    const AppConfig& config = configStore.config();

    // --- 2. Log ---
    LogManager& logManager = LogManager::instance();
    logManager.setMinimumLevel(LogManager::parseLevel(config.logLevel));
    if (!config.logDir.isEmpty()) {
        QDir().mkpath(config.logDir);
        logManager.initialize(config.logDir);
    }
    LOG_INFO(QStringLiteral("msgbridge v%1 starting").arg(app.applicationVersion()));

    // --- 3. Transport + backend API ---
    QtExecutor executor;
    executor.setRequestTimeout(config.requestTimeout);
    executor.setConnectionTimeout(config.connectionTimeout);

    CopilotApi api(config.accountType, config.vscodeVersion);
    LOG_INFO(QStringLiteral("Backend: %1 (account type %2)").arg(api.baseUrl(), api.accountType()));

    // --- 4. Shared state ---
    ModelRenamer renamer(config.modelRenameMap, config.modelRenameAuto);

    CredentialManager credentials(&executor, &api, config.githubToken,
                                  config.tokenRefreshMargin, systemNow, &app);

    CatalogCache catalog(Pipeline::makeModelFetcher(&executor, &credentials, &api),
                         &renamer, config.modelsCacheTtl, systemNow, &app);

    // --- 5. Pipeline ---
    RequestTranslatorOptions translatorOptions;
    translatorOptions.emulateThinking = config.emulateThinking;
    Pipeline pipeline(&executor, &credentials, &catalog, &renamer, &api,
                      translatorOptions, &app);

    // --- 6. Operator credential + catalog warm-up ---
    if (credentials.hasOperatorToken()) {
        auto credential = credentials.acquire();
        if (!credential) {
            LOG_ERROR(QStringLiteral("Failed to acquire initial backend token: %1")
                          .arg(credential.error().message));
            return 1;
        }

        catalog.getModels().then(&app, [](Result<ModelList> models) {
            if (models)
                LOG_INFO(QStringLiteral("Model catalog warmed with %1 models").arg(models->size()));
            else
                LOG_ERROR(QStringLiteral("Failed to fetch models (continuing without cache): %1")
                              .arg(models.error().message));
        });
    } else {
        LOG_INFO(QStringLiteral("No GH_TOKEN configured; callers must supply their own token"));
    }

    // --- 7. HTTP server ---
    ProxyServer server(&app);
    server.setPipeline(&pipeline);
    server.setMaxBodyBytes(config.maxBodyBytes);
    if (!server.start(static_cast<quint16>(config.port))) {
        return 1;
    }

    return app.exec();
}
