#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QUrl>

#include "services/ImageFetcher.hpp"
#include "include/errors.hpp"

class TestImageFetcher : public QObject {
	Q_OBJECT

	QTemporaryDir tmp_;

private slots:
	void initTestCase()
	{
		QVERIFY(tmp_.isValid());
		QFile f(tmp_.filePath("photo.jpg"));
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write("\xff\xd8\xff\xe0 fake jpeg");
	}

	void readsLocalPathAndFileUrl()
	{
		NetworkImageFetcher fetcher;
		const QString path = tmp_.filePath("photo.jpg");
		QVERIFY(fetcher.fetch(path).startsWith("\xff\xd8"));
		QCOMPARE(fetcher.fetch(QUrl::fromLocalFile(path).toString()), fetcher.fetch(path));
	}

	void missingFileIsFetchError()
	{
		NetworkImageFetcher fetcher;
		QVERIFY_THROWS_EXCEPTION(ImageFetchError, fetcher.fetch(tmp_.filePath("missing.jpg")));
		QVERIFY_THROWS_EXCEPTION(ImageFetchError, fetcher.fetch("ftp://host/a.jpg"));
		QVERIFY_THROWS_EXCEPTION(ValidationError, fetcher.fetch("  "));
	}

	void sizeLimit()
	{
		NetworkImageFetcher fetcher(1000, 4);
		QVERIFY_THROWS_EXCEPTION(ImageFetchError, fetcher.fetch(tmp_.filePath("photo.jpg")));
	}

	void cloudinaryUrlsAreDownscaled()
	{
		QCOMPARE(NetworkImageFetcher::optimizeUrl("https://res.cloudinary.com/demo/image/upload/v1/e/p.jpg"),
				 QStringLiteral("https://res.cloudinary.com/demo/image/upload/w_640,q_75,c_limit,fl_lossy/v1/e/p.jpg"));
		// 이미 변환이 있으면 그대로
		const QString sized = "https://res.cloudinary.com/demo/image/upload/w_300/v1/p.jpg";
		QCOMPARE(NetworkImageFetcher::optimizeUrl(sized), sized);
		const QString other = "https://example.com/image/upload/p.jpg";
		QCOMPARE(NetworkImageFetcher::optimizeUrl(other), other);
	}
};

QTEST_GUILESS_MAIN(TestImageFetcher)
#include "tst_imagefetcher.moc"
