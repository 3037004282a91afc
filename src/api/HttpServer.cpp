#include "api/HttpServer.hpp"
#include "log/eventface_logging.hpp"

#include <QHostAddress>
#include <QHttpServerRequest>
#include <QTcpServer>
#include <QElapsedTimer>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

using Method = QHttpServerRequest::Method;

HttpServer::HttpServer(std::shared_ptr<ApiEndpoints> api, int workerThreads, QObject* parent)
	: QObject(parent), api_(std::move(api))
{
	pool_.setMaxThreadCount(std::max(1, workerThreads));
	pool_.setObjectName(QStringLiteral("http-workers"));
	setupRoutes();
}

HttpServer::~HttpServer()
{
	pool_.waitForDone();
}

QHttpServerResponse HttpServer::toResponse(const ApiResponse& r)
{
	return QHttpServerResponse(r.body, static_cast<QHttpServerResponse::StatusCode>(r.status));
}

template <typename Fn>
QFuture<QHttpServerResponse> HttpServer::dispatch(const char* route, Fn&& fn)
{
	return QtConcurrent::run(&pool_, [route, fn = std::forward<Fn>(fn)]() {
		QElapsedTimer t; t.start();
		const ApiResponse r = fn();
		qCDebug(LC_HTTP) << "[Http]" << route << r.status << "elapsed(ms)=" << t.elapsed();
		return toResponse(r);
	});
}

void HttpServer::setupRoutes()
{
	auto api = api_;

	server_.route("/health", Method::Get, [this, api](const QHttpServerRequest&) {
		return dispatch("GET /health", [api] { return api->health(); });
	});

	server_.route("/api/v2/ingest", Method::Post, [this, api](const QHttpServerRequest& req) {
		const QByteArray body = req.body();
		return dispatch("POST /api/v2/ingest", [api, body] { return api->ingest(body); });
	});

	server_.route("/api/v2/ingest/batch", Method::Post, [this, api](const QHttpServerRequest& req) {
		const QByteArray body = req.body();
		return dispatch("POST /api/v2/ingest/batch", [api, body] { return api->ingestBatch(body); });
	});

	server_.route("/api/v2/match", Method::Post, [this, api](const QHttpServerRequest& req) {
		const QByteArray body = req.body();
		return dispatch("POST /api/v2/match", [api, body] { return api->match(body); });
	});

	server_.route("/api/v2/embed", Method::Post, [this, api](const QHttpServerRequest& req) {
		const QByteArray body = req.body();
		return dispatch("POST /api/v2/embed", [api, body] { return api->embed(body); });
	});

	server_.route("/api/face/compare", Method::Post, [this, api](const QHttpServerRequest& req) {
		const QByteArray body = req.body();
		return dispatch("POST /api/face/compare", [api, body] { return api->compare(body); });
	});

	server_.route("/api/v2/events/<arg>/index", Method::Get,
				  [this, api](const QString& eventId, const QHttpServerRequest&) {
		return dispatch("GET index", [api, eventId] { return api->indexStatus(eventId); });
	});

	server_.route("/api/v2/events/<arg>/rebuild", Method::Post,
				  [this, api](const QString& eventId, const QHttpServerRequest&) {
		return dispatch("POST rebuild", [api, eventId] { return api->rebuild(eventId); });
	});

	server_.route("/api/v2/events/<arg>", Method::Delete,
				  [this, api](const QString& eventId, const QHttpServerRequest&) {
		return dispatch("DELETE event", [api, eventId] { return api->deleteEvent(eventId); });
	});

	server_.route("/api/v2/events/<arg>/photos/<arg>", Method::Delete,
				  [this, api](const QString& eventId, const QString& photoId, const QHttpServerRequest&) {
		return dispatch("DELETE photo", [api, eventId, photoId] { return api->deletePhoto(eventId, photoId); });
	});

	server_.route("/api/v2/logs", Method::Get, [this, api](const QHttpServerRequest& req) {
		const QUrlQuery query = req.query();
		return dispatch("GET logs", [api, query] { return api->logs(query); });
	});

	server_.route("/api/v2/logs", Method::Delete, [this, api](const QHttpServerRequest&) {
		return dispatch("DELETE logs", [api] { return api->clearLogs(); });
	});
}

bool HttpServer::listen(const QString& host, quint16 port)
{
	auto tcp = new QTcpServer;
	if (!tcp->listen(QHostAddress(host), port) || !server_.bind(tcp)) {
		qCCritical(LC_HTTP) << "[Http] listen failed on" << host << port << ":" << tcp->errorString();
		delete tcp;
		return false;
	}
	tcp_ = tcp;
	qCInfo(LC_HTTP) << "[Http] listening on" << host << tcp_->serverPort();
	return true;
}

quint16 HttpServer::serverPort() const
{
	return tcp_ ? tcp_->serverPort() : 0;
}
