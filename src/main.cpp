#include <QCoreApplication>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>
#include <memory>

#include "ai/OpenCvEmbeddingProvider.hpp"
#include "api/ApiEndpoints.hpp"
#include "api/HttpServer.hpp"
#include "config/ServiceConfig.hpp"
#include "index/IndexRegistry.hpp"
#include "log/SystemLogger.hpp"
#include "log/eventface_logging.hpp"
#include "match/MatchService.hpp"
#include "services/ImageFetcher.hpp"
#include "services/IngestService.hpp"
#include "store/SqlCommon.hpp"
#include "store/SqliteVectorStore.hpp"

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("eventface"));
				QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));

				// ── 1) 설정 ──
				ServiceConfig cfg;
				QString cfgError;
				if (!ServiceConfig::load(app.arguments(), &cfg, &cfgError)) {
						const QStringList args = app.arguments();
						if (args.contains(QStringLiteral("--help")) || args.contains(QStringLiteral("-h"))) {
								qInfo().noquote() << cfgError;
								return 0;
						}
						qCritical().noquote() << "[Main] invalid configuration:" << cfgError;
						return 2;
				}
				if (!cfg.logRules.isEmpty()) {
						QString rules = cfg.logRules;
						QLoggingCategory::setFilterRules(rules.replace(QLatin1Char(';'), QLatin1Char('\n')));
				}

				// ── 2) 임베딩 모델 (없어도 임베딩 인제스트/매칭은 동작) ──
				OpenCvEmbeddingProvider::Options popt;
				popt.detectorModel   = cfg.detectorModel;
				popt.recognizerModel = cfg.recognizerModel;
				popt.detectThr       = static_cast<float>(cfg.detectThreshold);
				popt.minFacePx       = cfg.minFacePx;
				popt.maxFaces        = cfg.maxFacesPerPhoto;
				auto provider = std::make_shared<OpenCvEmbeddingProvider>(popt);
				if (!provider->load())
						qWarning() << "[Main] embedding models not loaded; image ingest will fail";

				// ── 3) 차원 D 결정 ──
				int dim = cfg.dimension;
				if (provider->isReady()) {
						if (dim == 0) {
								dim = provider->dimension();
						} else if (dim != provider->dimension()) {
								qCritical() << "[Main] configured dimension" << dim
											<< "does not match model output" << provider->dimension();
								return 2;
						}
				}
				if (dim <= 0) {
						qCritical() << "[Main] embedding dimension is unknown (set store/dimension or load a model)";
						return 2;
				}

				// ── 4) DB 준비 ──
				const QString dbPath = cfg.dbPath.isEmpty() ? SqlCommon::defaultDbFilePath() : cfg.dbPath;
				auto store = std::make_shared<SqliteVectorStore>(dbPath, dim);
				if (!store->initializeDatabase()) {
						qCritical() << "[Main] database initialization failed:" << dbPath;
						return -1;
				}

				// ── 5) 시스템로거 ──
				SystemLogger::init(store);
				SystemLogger::info("APP", QStringLiteral("starting"),
								   QStringLiteral("dim=%1 db=%2").arg(dim).arg(dbPath));

				// ── 6) 서비스 조립 ──
				IndexRegistry::Options ropt;
				ropt.idleTtlMs       = cfg.idleTtlMs;
				ropt.maxLiveIndexes  = cfg.maxLiveIndexes;
				ropt.maxTotalEntries = cfg.maxTotalEntries;
				auto registry = std::make_shared<IndexRegistry>(store, ropt);
				registry->startSweep(cfg.sweepIntervalMs);

				auto fetcher = std::make_shared<NetworkImageFetcher>(cfg.fetchTimeoutMs);

				IngestService::Options iopt;
				iopt.embedTimeoutMs   = cfg.embedTimeoutMs;
				iopt.batchParallelism = cfg.batchParallelism;
				auto ingest = std::make_shared<IngestService>(store, registry, provider, fetcher, iopt);
				auto match  = std::make_shared<MatchService>(registry);

				ApiEndpoints::Defaults defaults;
				defaults.topK           = cfg.defaultTopK;
				defaults.threshold      = cfg.defaultThreshold;
				defaults.queryTimeoutMs = cfg.queryTimeoutMs;
				auto api = std::make_shared<ApiEndpoints>(ingest, match, registry, store, provider, defaults);

				// ── 7) HTTP ──
				HttpServer http(api, cfg.workerThreads);
				if (!http.listen(cfg.host, static_cast<quint16>(cfg.port))) {
						SystemLogger::critical("APP", QStringLiteral("bind failed"),
											   QStringLiteral("%1:%2").arg(cfg.host).arg(cfg.port));
						SystemLogger::shutdown();
						return -1;
				}
				SystemLogger::info("APP", QStringLiteral("listening"),
								   QStringLiteral("%1:%2").arg(cfg.host).arg(http.serverPort()));

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [registry]{
						registry->stopSweep();
						SystemLogger::info("APP", "aboutToQuit");
						SystemLogger::shutdown();
				});

				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		} catch (...) {
				qCritical() << "[" << __func__ << "] Unknown fatal exception!";
		}

		return -1;
}
