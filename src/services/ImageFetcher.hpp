#pragma once
#include <QByteArray>
#include <QString>
#include "include/match_params.hpp"

// image_ref -> 이미지 바이트. 실패 시 ImageFetchError
class IImageFetcher {
public:
	virtual ~IImageFetcher() = default;
	virtual QByteArray fetch(const QString& imageRef) = 0;
};

// 로컬 경로 / file:// 는 QFile, http(s) 는 QNetworkAccessManager
// 호출 스레드에서 동기로 동작 (요청마다 매니저 생성, 로컬 이벤트 루프)
class NetworkImageFetcher : public IImageFetcher {
public:
	explicit NetworkImageFetcher(int timeoutMs = matchparams::FETCH_TIMEOUT_MS,
								 qint64 maxBytes = 32 * 1024 * 1024);

	QByteArray fetch(const QString& imageRef) override;

	// Cloudinary 업로드 URL에 폭 변환이 없으면 축소 변환 삽입
	static QString optimizeUrl(const QString& url);

private:
	QByteArray readLocal(const QString& path) const;
	QByteArray download(const QString& url) const;

	int timeoutMs_;
	qint64 maxBytes_;
};
