#pragma once
#include <QHash>
#include <QMutex>
#include "services/ImageFetcher.hpp"
#include "include/errors.hpp"

// ref -> 바이트. 등록되지 않은 ref 는 ImageFetchError
class FakeImageFetcher : public IImageFetcher {
public:
	void put(const QString& ref, const QByteArray& bytes) {
		QMutexLocker lk(&mu_);
		images_.insert(ref, bytes);
	}

	QByteArray fetch(const QString& imageRef) override {
		QMutexLocker lk(&mu_);
		auto it = images_.constFind(imageRef);
		if (it == images_.constEnd())
			throw ImageFetchError(QStringLiteral("404 for %1").arg(imageRef));
		return *it;
	}

private:
	QMutex mu_;
	QHash<QString, QByteArray> images_;
};
