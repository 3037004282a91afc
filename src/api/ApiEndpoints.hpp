#pragma once
#include <memory>
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QUrlQuery>

#include "include/match_params.hpp"

class EventFaceError;
class IngestService;
class MatchService;
class IndexRegistry;
class SqliteVectorStore;
class IEmbeddingProvider;

struct ApiResponse {
	int status = 200;
	QJsonObject body;
};

// HTTP 엔드포인트 로직 (JSON in, status + JSON out). 소켓 없이 테스트 가능
class ApiEndpoints {
public:
	struct Defaults {
		int    topK           = matchparams::DEFAULT_TOP_K;
		double threshold      = matchparams::DEFAULT_MIN_SCORE;
		int    queryTimeoutMs = 10000;
	};

	ApiEndpoints(std::shared_ptr<IngestService> ingest,
				 std::shared_ptr<MatchService> match,
				 std::shared_ptr<IndexRegistry> registry,
				 std::shared_ptr<SqliteVectorStore> store,			// 로그 조회용, null 허용
				 std::shared_ptr<IEmbeddingProvider> provider,		// health 용, null 허용
				 const Defaults& defaults);

	ApiResponse health() const;
	ApiResponse ingest(const QByteArray& body);
	ApiResponse ingestBatch(const QByteArray& body);
	ApiResponse match(const QByteArray& body);
	ApiResponse embed(const QByteArray& body);
	ApiResponse compare(const QByteArray& body);
	ApiResponse indexStatus(const QString& eventId) const;
	ApiResponse rebuild(const QString& eventId);
	ApiResponse deleteEvent(const QString& eventId);
	ApiResponse deletePhoto(const QString& eventId, const QString& photoId);
	ApiResponse logs(const QUrlQuery& query) const;
	ApiResponse clearLogs();

	static int httpStatusFor(const EventFaceError& e);
	static ApiResponse errorResponse(const EventFaceError& e);

private:
	template <typename Fn>
	ApiResponse guarded(const char* route, Fn&& fn) const;

	std::shared_ptr<IngestService> ingest_;
	std::shared_ptr<MatchService> match_;
	std::shared_ptr<IndexRegistry> registry_;
	std::shared_ptr<SqliteVectorStore> store_;
	std::shared_ptr<IEmbeddingProvider> provider_;
	Defaults defaults_;
};
