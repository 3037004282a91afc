#pragma once
#include <QObject>
#include <QHttpServer>
#include <QHttpServerResponse>
#include <QFuture>
#include <QThreadPool>
#include <memory>

#include "api/ApiEndpoints.hpp"

class QTcpServer;

// QHttpServer 라우팅만 담당. 핸들러는 워커 풀에서 돌고 QFuture 로 응답
class HttpServer : public QObject {
	Q_OBJECT
public:
	HttpServer(std::shared_ptr<ApiEndpoints> api, int workerThreads, QObject* parent = nullptr);
	~HttpServer() override;

	bool listen(const QString& host, quint16 port);
	quint16 serverPort() const;

	static QHttpServerResponse toResponse(const ApiResponse& r);

private:
	void setupRoutes();

	template <typename Fn>
	QFuture<QHttpServerResponse> dispatch(const char* route, Fn&& fn);

	std::shared_ptr<ApiEndpoints> api_;
	QHttpServer server_;
	QThreadPool pool_;
	QTcpServer* tcp_ = nullptr;		// server_ 소유
};
