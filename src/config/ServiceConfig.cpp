#include "config/ServiceConfig.hpp"
#include "include/common_path.hpp"
#include "log/eventface_logging.hpp"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QSettings>
#include <QDebug>
#include <cmath>

bool ServiceConfig::loadIni(const QString& path)
{
	if (path.isEmpty() || !QFileInfo::exists(path)) return false;

	QSettings s(path, QSettings::IniFormat);
	if (s.status() != QSettings::NoError) {
		qCWarning(LC_CONFIG) << "[Config] cannot read" << path;
		return false;
	}

	s.beginGroup(QStringLiteral("server"));
	host          = s.value(QStringLiteral("host"), host).toString();
	port          = s.value(QStringLiteral("port"), port).toInt();
	workerThreads = s.value(QStringLiteral("worker_threads"), workerThreads).toInt();
	s.endGroup();

	s.beginGroup(QStringLiteral("store"));
	dbPath    = s.value(QStringLiteral("db_path"), dbPath).toString();
	dimension = s.value(QStringLiteral("dimension"), dimension).toInt();
	s.endGroup();

	s.beginGroup(QStringLiteral("index"));
	idleTtlMs        = s.value(QStringLiteral("idle_ttl_ms"), idleTtlMs).toInt();
	sweepIntervalMs  = s.value(QStringLiteral("sweep_interval_ms"), sweepIntervalMs).toInt();
	maxLiveIndexes   = s.value(QStringLiteral("max_live_indexes"), maxLiveIndexes).toInt();
	maxTotalEntries  = s.value(QStringLiteral("max_total_entries"), maxTotalEntries).toInt();
	defaultTopK      = s.value(QStringLiteral("default_top_k"), defaultTopK).toInt();
	defaultThreshold = s.value(QStringLiteral("default_threshold"), defaultThreshold).toDouble();
	queryTimeoutMs   = s.value(QStringLiteral("query_timeout_ms"), queryTimeoutMs).toInt();
	s.endGroup();

	s.beginGroup(QStringLiteral("ingest"));
	embedTimeoutMs   = s.value(QStringLiteral("embed_timeout_ms"), embedTimeoutMs).toInt();
	fetchTimeoutMs   = s.value(QStringLiteral("fetch_timeout_ms"), fetchTimeoutMs).toInt();
	batchParallelism = s.value(QStringLiteral("batch_parallelism"), batchParallelism).toInt();
	s.endGroup();

	s.beginGroup(QStringLiteral("models"));
	detectorModel    = s.value(QStringLiteral("detector"), detectorModel).toString();
	recognizerModel  = s.value(QStringLiteral("recognizer"), recognizerModel).toString();
	detectThreshold  = s.value(QStringLiteral("detect_threshold"), detectThreshold).toDouble();
	minFacePx        = s.value(QStringLiteral("min_face_px"), minFacePx).toInt();
	maxFacesPerPhoto = s.value(QStringLiteral("max_faces_per_photo"), maxFacesPerPhoto).toInt();
	s.endGroup();

	s.beginGroup(QStringLiteral("logging"));
	// 쉼표가 들어간 값은 QSettings 가 리스트로 돌려준다
	const QVariant rules = s.value(QStringLiteral("rules"), logRules);
	logRules = rules.typeId() == QMetaType::QStringList
			 ? rules.toStringList().join(QLatin1Char(';'))
			 : rules.toString();
	s.endGroup();

	configFile = path;
	qCInfo(LC_CONFIG) << "[Config] loaded" << path;
	return true;
}

void ServiceConfig::applyEnvironment()
{
	bool ok = false;
	const int envPort = qEnvironmentVariableIntValue("EVENTFACE_PORT", &ok);
	if (ok) port = envPort;
	if (qEnvironmentVariableIsSet("EVENTFACE_DB"))
		dbPath = qEnvironmentVariable("EVENTFACE_DB");
}

bool ServiceConfig::applyCommandLine(const QStringList& args, QString* errorOut)
{
	QCommandLineParser p;
	p.setApplicationDescription(QStringLiteral("EventFace per-event face matching service"));
	p.addHelpOption();

	const QCommandLineOption optConfig(QStringLiteral("config"), QStringLiteral("INI file"), QStringLiteral("path"));
	const QCommandLineOption optHost(QStringLiteral("host"), QStringLiteral("Listen address"), QStringLiteral("addr"));
	const QCommandLineOption optPort(QStringLiteral("port"), QStringLiteral("Listen port"), QStringLiteral("port"));
	const QCommandLineOption optDb(QStringLiteral("db"), QStringLiteral("SQLite database file"), QStringLiteral("path"));
	const QCommandLineOption optDim(QStringLiteral("dim"), QStringLiteral("Embedding dimension (0 = model's)"), QStringLiteral("n"));
	p.addOptions({optConfig, optHost, optPort, optDb, optDim});

	if (!p.parse(args)) {
		if (errorOut) *errorOut = p.errorText();
		return false;
	}
	if (p.isSet(QStringLiteral("help"))) {
		if (errorOut) *errorOut = p.helpText();
		return false;
	}

	// --config 는 load() 에서 먼저 처리된다
	if (p.isSet(optHost)) host = p.value(optHost);
	if (p.isSet(optDb))   dbPath = p.value(optDb);

	bool ok = true;
	if (p.isSet(optPort)) {
		port = p.value(optPort).toInt(&ok);
		if (!ok) { if (errorOut) *errorOut = QStringLiteral("invalid --port"); return false; }
	}
	if (p.isSet(optDim)) {
		dimension = p.value(optDim).toInt(&ok);
		if (!ok) { if (errorOut) *errorOut = QStringLiteral("invalid --dim"); return false; }
	}
	return true;
}

QStringList ServiceConfig::validate() const
{
	QStringList errs;
	if (port <= 0 || port > 65535)        errs << QStringLiteral("server.port must be in 1..65535");
	if (workerThreads <= 0)               errs << QStringLiteral("server.worker_threads must be positive");
	if (dimension < 0)                    errs << QStringLiteral("store.dimension must be >= 0");
	if (idleTtlMs < 0)                    errs << QStringLiteral("index.idle_ttl_ms must be >= 0");
	if (sweepIntervalMs <= 0)             errs << QStringLiteral("index.sweep_interval_ms must be positive");
	if (maxLiveIndexes < 0)               errs << QStringLiteral("index.max_live_indexes must be >= 0");
	if (maxTotalEntries < 0)              errs << QStringLiteral("index.max_total_entries must be >= 0");
	if (defaultTopK <= 0)                 errs << QStringLiteral("index.default_top_k must be positive");
	if (!std::isfinite(defaultThreshold) || defaultThreshold < -1.0 || defaultThreshold > 1.0)
		errs << QStringLiteral("index.default_threshold must be in [-1, 1]");
	if (queryTimeoutMs <= 0)              errs << QStringLiteral("index.query_timeout_ms must be positive");
	if (embedTimeoutMs <= 0)              errs << QStringLiteral("ingest.embed_timeout_ms must be positive");
	if (fetchTimeoutMs <= 0)              errs << QStringLiteral("ingest.fetch_timeout_ms must be positive");
	if (batchParallelism <= 0)            errs << QStringLiteral("ingest.batch_parallelism must be positive");
	if (detectThreshold < 0.0 || detectThreshold > 1.0)
		errs << QStringLiteral("models.detect_threshold must be in [0, 1]");
	if (minFacePx < 0)                    errs << QStringLiteral("models.min_face_px must be >= 0");
	if (maxFacesPerPhoto <= 0)            errs << QStringLiteral("models.max_faces_per_photo must be positive");
	return errs;
}

bool ServiceConfig::load(const QStringList& args, ServiceConfig* out, QString* errorOut)
{
	ServiceConfig cfg;
	cfg.detectorModel   = QStringLiteral(YNMODEL_PATH YNMODEL);
	cfg.recognizerModel = QStringLiteral(RECOGNIZER_PATH RECOGNIZER);

	// ── 1) INI: --config > EVENTFACE_CONFIG > 기본 경로 ──
	QString iniPath = QStringLiteral(CONFIG_PATH CONFIG);
	if (qEnvironmentVariableIsSet("EVENTFACE_CONFIG"))
		iniPath = qEnvironmentVariable("EVENTFACE_CONFIG");
	const int ci = args.indexOf(QStringLiteral("--config"));
	if (ci >= 0 && ci + 1 < args.size()) iniPath = args.at(ci + 1);
	for (const auto& a : args) {
		if (a.startsWith(QStringLiteral("--config="))) iniPath = a.mid(9);
	}
	if (!cfg.loadIni(iniPath))
		qCInfo(LC_CONFIG) << "[Config] no config file at" << iniPath << "- using defaults";

	// ── 2) 환경변수, 3) 명령행 ──
	cfg.applyEnvironment();
	if (!cfg.applyCommandLine(args, errorOut)) return false;

	const QStringList errs = cfg.validate();
	if (!errs.isEmpty()) {
		if (errorOut) *errorOut = errs.join(QLatin1Char('\n'));
		return false;
	}

	*out = cfg;
	return true;
}
