#include "services/ImageFetcher.hpp"
#include "include/errors.hpp"
#include "log/eventface_logging.hpp"

#include <QFile>
#include <QUrl>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QElapsedTimer>
#include <QDebug>

NetworkImageFetcher::NetworkImageFetcher(int timeoutMs, qint64 maxBytes)
	: timeoutMs_(timeoutMs), maxBytes_(maxBytes)
{
}

QString NetworkImageFetcher::optimizeUrl(const QString& url)
{
	static const QString kUpload = QStringLiteral("/image/upload/");
	if (url.contains(QStringLiteral("res.cloudinary.com")) && url.contains(kUpload)
		&& !url.contains(QStringLiteral("/w_"))) {
		QString out = url;
		out.replace(kUpload, kUpload + QStringLiteral("w_640,q_75,c_limit,fl_lossy/"));
		return out;
	}
	return url;
}

QByteArray NetworkImageFetcher::fetch(const QString& imageRef)
{
	const QString ref = imageRef.trimmed();
	if (ref.isEmpty()) throw ValidationError(QStringLiteral("image_url is required"));

	const QUrl url(ref);
	const QString scheme = url.scheme().toLower();
	if (scheme == QLatin1String("http") || scheme == QLatin1String("https"))
		return download(optimizeUrl(ref));
	if (scheme == QLatin1String("file"))
		return readLocal(url.toLocalFile());
	if (scheme.isEmpty() || ref.startsWith(QLatin1Char('/')))
		return readLocal(ref);

	throw ImageFetchError(QStringLiteral("unsupported image reference scheme: %1").arg(scheme));
}

QByteArray NetworkImageFetcher::readLocal(const QString& path) const
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly))
		throw ImageFetchError(QStringLiteral("cannot open %1: %2").arg(path, f.errorString()));
	if (f.size() > maxBytes_)
		throw ImageFetchError(QStringLiteral("image too large: %1 bytes").arg(f.size()));
	return f.readAll();
}

QByteArray NetworkImageFetcher::download(const QString& url) const
{
	QElapsedTimer t; t.start();

	QNetworkAccessManager nam;
	QNetworkRequest req{QUrl(url)};
	req.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("EventFace/1.0"));
	req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
	req.setTransferTimeout(timeoutMs_);

	QNetworkReply* reply = nam.get(req);
	QEventLoop loop;
	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	loop.exec();

	const auto err = reply->error();
	const int http = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	const QString errStr = reply->errorString();
	const QByteArray body = (err == QNetworkReply::NoError) ? reply->readAll() : QByteArray();
	reply->deleteLater();

	if (err == QNetworkReply::OperationCanceledError || err == QNetworkReply::TimeoutError)
		throw ImageFetchError(QStringLiteral("download timed out after %1 ms").arg(timeoutMs_));
	if (err != QNetworkReply::NoError)
		throw ImageFetchError(QStringLiteral("download failed (http %1): %2").arg(http).arg(errStr));
	if (body.isEmpty())
		throw ImageFetchError(QStringLiteral("download returned no data"));
	if (body.size() > maxBytes_)
		throw ImageFetchError(QStringLiteral("image too large: %1 bytes").arg(body.size()));

	qCDebug(LC_INGEST) << "[Fetcher]" << url << "bytes=" << body.size() << "elapsed(ms)=" << t.elapsed();
	return body;
}
