#pragma once
#include <QString>
#include <QStringList>
#include "include/match_params.hpp"

class QCoreApplication;

// 서비스 설정: 기본값 < INI(QSettings) < 환경변수 < 명령행
struct ServiceConfig {
	// [server]
	QString host = QStringLiteral("0.0.0.0");
	int     port = 5000;
	int     workerThreads = 8;

	// [store]
	QString dbPath;							// 비어 있으면 SqlCommon::defaultDbFilePath()
	int     dimension = matchparams::DEFAULT_DIM;	// 0 = 임베딩 모델 출력 차원 채택

	// [index]
	int     idleTtlMs       = matchparams::IDLE_TTL_MS;
	int     sweepIntervalMs = matchparams::SWEEP_INTERVAL_MS;
	int     maxLiveIndexes  = matchparams::MAX_LIVE_INDEXES;
	int     maxTotalEntries = matchparams::MAX_TOTAL_ENTRIES;
	int     defaultTopK     = matchparams::DEFAULT_TOP_K;
	double  defaultThreshold = matchparams::DEFAULT_MIN_SCORE;
	int     queryTimeoutMs  = 10000;

	// [ingest]
	int     embedTimeoutMs   = matchparams::EMBED_TIMEOUT_MS;
	int     fetchTimeoutMs   = matchparams::FETCH_TIMEOUT_MS;
	int     batchParallelism = matchparams::BATCH_PARALLELISM;

	// [models]
	QString detectorModel;
	QString recognizerModel;
	double  detectThreshold = matchparams::DETECT_THR;
	int     minFacePx       = matchparams::MIN_FACE_PX;
	int     maxFacesPerPhoto = matchparams::MAX_FACES_PER_PHOTO;

	// [logging]
	QString logRules;						// QLoggingCategory 필터 (';' 구분)

	QString configFile;						// 실제로 읽은 파일 (없으면 빈 값)

	// INI 파일 값 덮어쓰기. 파일이 없으면 false (기본값 유지)
	bool loadIni(const QString& path);
	void applyEnvironment();
	// 명령행 처리. 잘못된 인자는 errorOut 에 사유를 담고 false
	bool applyCommandLine(const QStringList& args, QString* errorOut);

	// 값 검증. 문제 목록 (비어 있으면 OK)
	QStringList validate() const;

	// 전체 로드 순서 실행 (main 용)
	static bool load(const QStringList& args, ServiceConfig* out, QString* errorOut);
};
