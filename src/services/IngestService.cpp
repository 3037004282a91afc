#include "services/IngestService.hpp"
#include "services/ImageFetcher.hpp"
#include "ai/IEmbeddingProvider.hpp"
#include "index/IndexRegistry.hpp"
#include "store/IVectorRecordStore.hpp"
#include "include/errors.hpp"
#include "log/eventface_logging.hpp"
#include "log/SystemLogger.hpp"

#include <QElapsedTimer>
#include <QtConcurrent/QtConcurrentMap>
#include <QDebug>
#include <chrono>
#include <future>
#include <numeric>

IngestService::IngestService(std::shared_ptr<IVectorRecordStore> store,
							 std::shared_ptr<IndexRegistry> registry,
							 std::shared_ptr<IEmbeddingProvider> provider,
							 std::shared_ptr<IImageFetcher> fetcher,
							 const Options& opt)
	: store_(std::move(store)), registry_(std::move(registry)),
	  provider_(std::move(provider)), fetcher_(std::move(fetcher)), opt_(opt)
{
	embedPool_.setMaxThreadCount(std::max(1, opt_.embedThreads));
	embedPool_.setObjectName(QStringLiteral("embed-pool"));
}

IngestService::~IngestService()
{
	embedPool_.waitForDone();
}

bool IngestService::providerReady() const
{
	return provider_ && provider_->isReady();
}

void IngestService::requireIds(const QString& eventId, const QString& photoId)
{
	if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
	if (photoId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("photo_id is required"));
}

std::vector<FaceEmbedding> IngestService::embedWithTimeout(const QByteArray& bytes)
{
	if (!providerReady()) throw EmbeddingProviderError(QStringLiteral("embedding provider is not ready"));

	// 타임아웃 후에도 작업은 끝까지 돌 수 있으므로 provider/bytes 는 값으로 잡는다
	auto promise = std::make_shared<std::promise<std::vector<FaceEmbedding>>>();
	auto future = promise->get_future();
	auto provider = provider_;
	embedPool_.start([promise, provider, bytes]() {
		try {
			promise->set_value(provider->embed(bytes));
		} catch (...) {
			promise->set_exception(std::current_exception());
		}
	});

	if (future.wait_for(std::chrono::milliseconds(opt_.embedTimeoutMs)) != std::future_status::ready) {
		throw EmbeddingProviderError(QStringLiteral("embedding timed out after %1 ms").arg(opt_.embedTimeoutMs));
	}

	try {
		return future.get();
	} catch (const EmbeddingProviderError&) {
		throw;
	} catch (const EventFaceError& e) {
		throw EmbeddingProviderError(e.message());
	} catch (const std::exception& e) {
		throw EmbeddingProviderError(QStringLiteral("provider failure: %1").arg(QString::fromUtf8(e.what())));
	}
}

std::vector<FaceEmbedding> IngestService::fetchAndEmbed(const QString& imageRef)
{
	if (!fetcher_) throw ImageFetchError(QStringLiteral("no image fetcher configured"));

	const QByteArray bytes = fetcher_->fetch(imageRef);
	auto faces = embedWithTimeout(bytes);

	// 차원이 다른 출력은 저장 전에 거른다 (가짜 벡터를 만들지 않는다)
	const int dim = store_->dimension();
	for (const auto& f : faces) {
		if (static_cast<int>(f.vector.size()) != dim) {
			throw EmbeddingProviderError(QStringLiteral("provider returned dimension %1, expected %2")
										 .arg(f.vector.size()).arg(dim));
		}
	}
	return faces;
}

std::vector<FaceEmbedding> IngestService::computeEmbeddings(const QString& imageRef)
{
	try {
		return fetchAndEmbed(imageRef);
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("embed %1").arg(imageRef));
		throw;
	}
}

void IngestService::commitPhoto(const QString& eventId, const QString& photoId,
								const std::vector<FaceEmbedding>& faces, const QString& sourceRef)
{
	// 같은 (event, photo) 에 대한 store upsert + index 반영은 한 단위
	const auto guard = photoLocks_.lock(eventId + QChar(0x1f) + photoId);

	store_->upsert(eventId, photoId, faces, sourceRef);

	std::vector<IndexEntry> entries;
	entries.reserve(faces.size());
	for (size_t i = 0; i < faces.size(); ++i) {
		entries.push_back(IndexEntry{RecordKey{eventId, photoId, static_cast<int>(i)}, faces[i].vector});
	}
	registry_->onPhotoReplaced(eventId, photoId, entries);
}

IngestResult IngestService::ingestPhoto(const QString& eventId, const QString& photoId,
										const QString& imageRef)
{
	QElapsedTimer t; t.start();
	try {
		requireIds(eventId, photoId);
		if (imageRef.trimmed().isEmpty()) throw ValidationError(QStringLiteral("image_url is required"));

		// ── 1) fetch + embed (lock 밖) ──
		const auto faces = fetchAndEmbed(imageRef);

		// ── 2) 저장 + 인덱스 ──
		commitPhoto(eventId, photoId, faces, imageRef);

		qCInfo(LC_INGEST) << "[Ingest]" << eventId << photoId
						  << "faces=" << int(faces.size()) << "elapsed(ms)=" << t.elapsed();
		return IngestResult{eventId, photoId, static_cast<int>(faces.size())};
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("event=%1 photo=%2").arg(eventId, photoId));
		qCWarning(LC_INGEST) << "[Ingest] failed:" << e.code() << e.message();
		SystemLogger::warn("INGEST", e.message(), QString::fromLatin1(e.code()));
		throw;
	}
}

IngestResult IngestService::ingestEmbedding(const QString& eventId, const QString& photoId,
											const std::vector<float>& vector, const QString& sourceRef)
{
	try {
		requireIds(eventId, photoId);
		if (vector.empty()) throw ValidationError(QStringLiteral("embedding is empty"));
		const int dim = store_->dimension();
		if (static_cast<int>(vector.size()) != dim)
			throw DimensionMismatchError(dim, static_cast<int>(vector.size()));

		FaceEmbedding face;
		face.vector = vector;
		face.detScore = 1.0f;
		commitPhoto(eventId, photoId, {face}, sourceRef);

		qCInfo(LC_INGEST) << "[Ingest] embedding" << eventId << photoId;
		return IngestResult{eventId, photoId, 1};
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("event=%1 photo=%2").arg(eventId, photoId));
		qCWarning(LC_INGEST) << "[Ingest] failed:" << e.code() << e.message();
		throw;
	}
}

void IngestService::deletePhoto(const QString& eventId, const QString& photoId)
{
	try {
		requireIds(eventId, photoId);
		const auto guard = photoLocks_.lock(eventId + QChar(0x1f) + photoId);
		store_->deletePhoto(eventId, photoId);
		registry_->onPhotoRemoved(eventId, photoId);
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("event=%1 photo=%2").arg(eventId, photoId));
		throw;
	}
	qCInfo(LC_INGEST) << "[Ingest] deleted photo" << eventId << photoId;
}

void IngestService::deleteEvent(const QString& eventId)
{
	try {
		if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
		store_->deleteEvent(eventId);
		registry_->invalidate(eventId);
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("event=%1").arg(eventId));
		throw;
	}
	qCInfo(LC_INGEST) << "[Ingest] deleted event" << eventId;
	SystemLogger::info("INGEST", QStringLiteral("event deleted: %1").arg(eventId));
}

BatchReport IngestService::ingestBatch(const QString& eventId, const std::vector<BatchItem>& items,
									   int parallelism)
{
	if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));

	struct Outcome {
		enum class Kind { Ok, Failed, Skipped } kind = Kind::Skipped;
		int faces = 0;
		QString code;
		QString message;
	};

	QElapsedTimer t; t.start();
	std::vector<Outcome> outcomes(items.size());
	std::vector<size_t> order(items.size());
	std::iota(order.begin(), order.end(), size_t{0});

	QThreadPool pool;
	pool.setMaxThreadCount(std::max(1, parallelism > 0 ? parallelism : opt_.batchParallelism));

	QtConcurrent::blockingMap(&pool, order, [&](size_t i) {
		const BatchItem& it = items[i];
		Outcome& o = outcomes[i];
		if (it.photoId.trimmed().isEmpty() || it.imageRef.trimmed().isEmpty()) {
			o.kind = Outcome::Kind::Skipped;
			return;
		}
		try {
			o.faces = ingestPhoto(eventId, it.photoId, it.imageRef).facesIndexed;
			o.kind = Outcome::Kind::Ok;
		} catch (const EventFaceError& e) {
			o.kind = Outcome::Kind::Failed;
			o.code = QString::fromLatin1(e.code());
			o.message = e.message();
		} catch (const std::exception& e) {
			o.kind = Outcome::Kind::Failed;
			o.code = QStringLiteral("internal_error");
			o.message = QString::fromUtf8(e.what());
		}
	});

	BatchReport r;
	r.total = static_cast<int>(items.size());
	for (size_t i = 0; i < items.size(); ++i) {
		const Outcome& o = outcomes[i];
		switch (o.kind) {
		case Outcome::Kind::Ok:
			++r.success;
			r.facesIndexed += o.faces;
			break;
		case Outcome::Kind::Failed:
			++r.failed;
			r.failures.push_back(BatchFailure{items[i].photoId, o.code, o.message});
			break;
		case Outcome::Kind::Skipped:
			++r.skipped;
			break;
		}
	}

	qCInfo(LC_INGEST) << "[Ingest] batch" << eventId
					  << "total=" << r.total << "success=" << r.success
					  << "failed=" << r.failed << "skipped=" << r.skipped
					  << "elapsed(ms)=" << t.elapsed();
	SystemLogger::info("INGEST", QStringLiteral("batch ingest: %1").arg(eventId),
					   QStringLiteral("total=%1 success=%2 failed=%3 skipped=%4")
					   .arg(r.total).arg(r.success).arg(r.failed).arg(r.skipped));
	return r;
}
