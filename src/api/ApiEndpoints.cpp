#include "api/ApiEndpoints.hpp"
#include "ai/IEmbeddingProvider.hpp"
#include "index/IndexRegistry.hpp"
#include "match/MatchService.hpp"
#include "services/IngestService.hpp"
#include "store/SqliteVectorStore.hpp"
#include "include/errors.hpp"
#include "include/states.hpp"
#include "log/eventface_logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDeadlineTimer>
#include <QDebug>
#include <algorithm>

namespace {

QJsonObject parseObject(const QByteArray& body)
{
	QJsonParseError pe{};
	const QJsonDocument doc = QJsonDocument::fromJson(body, &pe);
	if (pe.error != QJsonParseError::NoError || !doc.isObject())
		throw ValidationError(QStringLiteral("request body must be a JSON object"));
	return doc.object();
}

QString requireString(const QJsonObject& o, const char* key)
{
	const QString v = o.value(QLatin1String(key)).toString().trimmed();
	if (v.isEmpty()) throw ValidationError(QStringLiteral("%1 is required").arg(QLatin1String(key)));
	return v;
}

std::vector<float> toVector(const QJsonValue& v, const char* key)
{
	if (!v.isArray()) throw ValidationError(QStringLiteral("%1 must be an array of numbers").arg(QLatin1String(key)));
	const QJsonArray arr = v.toArray();
	std::vector<float> out;
	out.reserve(static_cast<size_t>(arr.size()));
	for (const auto& x : arr) {
		if (!x.isDouble()) throw ValidationError(QStringLiteral("%1 must be an array of numbers").arg(QLatin1String(key)));
		out.push_back(static_cast<float>(x.toDouble()));
	}
	return out;
}

QJsonArray fromVector(const std::vector<float>& v)
{
	QJsonArray a;
	for (float x : v) a.append(static_cast<double>(x));
	return a;
}

QJsonObject statusJson(const IndexStatus& st)
{
	return QJsonObject{
		{"event_id", st.eventId},
		{"state",    indexStateName(st.state)},
		{"entries",  st.entries},
		{"version",  static_cast<qint64>(st.version)},
		{"idle_ms",  st.state == IndexState::Absent ? QJsonValue() : QJsonValue(st.idleMs)},
	};
}

ApiResponse ok(QJsonObject body)
{
	body.insert(QStringLiteral("success"), true);
	return ApiResponse{200, body};
}

} // namespace

ApiEndpoints::ApiEndpoints(std::shared_ptr<IngestService> ingest,
						   std::shared_ptr<MatchService> match,
						   std::shared_ptr<IndexRegistry> registry,
						   std::shared_ptr<SqliteVectorStore> store,
						   std::shared_ptr<IEmbeddingProvider> provider,
						   const Defaults& defaults)
	: ingest_(std::move(ingest)), match_(std::move(match)), registry_(std::move(registry)),
	  store_(std::move(store)), provider_(std::move(provider)), defaults_(defaults)
{
}

int ApiEndpoints::httpStatusFor(const EventFaceError& e)
{
	if (dynamic_cast<const ValidationError*>(&e))         return 400;
	if (dynamic_cast<const ImageFetchError*>(&e))         return 502;
	if (dynamic_cast<const EmbeddingProviderError*>(&e))  return 502;
	if (dynamic_cast<const StoreUnavailableError*>(&e))   return 503;
	if (dynamic_cast<const OperationTimeoutError*>(&e))   return 504;
	if (dynamic_cast<const OperationCancelledError*>(&e)) return 499;
	return 500;
}

ApiResponse ApiEndpoints::errorResponse(const EventFaceError& e)
{
	return ApiResponse{httpStatusFor(e), QJsonObject{
		{"success", false},
		{"error",   QString::fromLatin1(e.code())},
		{"message", e.message()},
	}};
}

template <typename Fn>
ApiResponse ApiEndpoints::guarded(const char* route, Fn&& fn) const
{
	try {
		return fn();
	} catch (const EventFaceError& e) {
		qCDebug(LC_HTTP) << "[Api]" << route << "->" << httpStatusFor(e) << e.code();
		return errorResponse(e);
	} catch (const std::exception& e) {
		qCCritical(LC_HTTP) << "[Api]" << route << "unexpected:" << e.what();
		return ApiResponse{500, QJsonObject{
			{"success", false},
			{"error",   QStringLiteral("internal_error")},
			{"message", QString::fromUtf8(e.what())},
		}};
	}
}

ApiResponse ApiEndpoints::health() const
{
	const bool ready = provider_ && provider_->isReady();
	return ApiResponse{200, QJsonObject{
		{"status",         QStringLiteral("ok")},
		{"provider_ready", ready},
		{"provider",       provider_ ? provider_->name() : QString()},
		{"dimension",      registry_->dimension()},
		{"live_indexes",   registry_->liveCount()},
	}};
}

ApiResponse ApiEndpoints::ingest(const QByteArray& body)
{
	return guarded("ingest", [&]() {
		const QJsonObject o = parseObject(body);
		const QString eventId = requireString(o, "event_id");
		const QString photoId = requireString(o, "photo_id");
		const QString imageUrl = o.value(QStringLiteral("image_url")).toString().trimmed();

		IngestResult r;
		const QJsonValue emb = o.value(QStringLiteral("embedding"));
		if (!emb.isUndefined() && !emb.isNull()) {
			r = ingest_->ingestEmbedding(eventId, photoId, toVector(emb, "embedding"), imageUrl);
		} else {
			if (imageUrl.isEmpty()) throw ValidationError(QStringLiteral("image_url is required"));
			r = ingest_->ingestPhoto(eventId, photoId, imageUrl);
		}
		return ok(QJsonObject{{"faces_indexed", r.facesIndexed}});
	});
}

ApiResponse ApiEndpoints::ingestBatch(const QByteArray& body)
{
	return guarded("ingest/batch", [&]() {
		const QJsonObject o = parseObject(body);
		const QString eventId = requireString(o, "event_id");
		const QJsonValue photos = o.value(QStringLiteral("photos"));
		if (!photos.isArray()) throw ValidationError(QStringLiteral("photos must be an array"));

		std::vector<BatchItem> items;
		for (const auto& p : photos.toArray()) {
			const QJsonObject po = p.toObject();
			items.push_back(BatchItem{po.value(QStringLiteral("photo_id")).toString(),
									  po.value(QStringLiteral("image_url")).toString()});
		}
		const int parallelism = o.value(QStringLiteral("parallelism")).toInt(0);

		const BatchReport r = ingest_->ingestBatch(eventId, items, parallelism);

		QJsonArray failures;
		for (const auto& f : r.failures) {
			failures.append(QJsonObject{{"photo_id", f.photoId}, {"error", f.code}, {"message", f.message}});
		}
		return ok(QJsonObject{
			{"total",         r.total},
			{"successful",    r.success},
			{"failed",        r.failed},
			{"skipped",       r.skipped},
			{"faces_indexed", r.facesIndexed},
			{"failures",      failures},
		});
	});
}

ApiResponse ApiEndpoints::match(const QByteArray& body)
{
	return guarded("match", [&]() {
		const QJsonObject o = parseObject(body);
		const QString eventId = requireString(o, "event_id");
		const std::vector<float> query = toVector(o.value(QStringLiteral("user_embedding")), "user_embedding");

		const QJsonValue kv = o.value(QStringLiteral("top_k"));
		const QJsonValue tv = o.value(QStringLiteral("threshold"));
		if (!kv.isUndefined() && !kv.isNull() && !kv.isDouble())
			throw ValidationError(QStringLiteral("top_k must be a number"));
		if (!tv.isUndefined() && !tv.isNull() && !tv.isDouble())
			throw ValidationError(QStringLiteral("threshold must be a number"));
		const int topK = kv.isDouble() ? kv.toInt() : defaults_.topK;
		const double threshold = tv.isDouble() ? tv.toDouble() : defaults_.threshold;

		QueryControl ctl;
		ctl.deadline = QDeadlineTimer(defaults_.queryTimeoutMs);
		const auto matches = match_->match(eventId, query, topK, static_cast<float>(threshold), ctl);

		QJsonArray arr;
		for (const auto& m : matches) {
			arr.append(QJsonObject{{"photo_id", m.photoId}, {"score", static_cast<double>(m.score)}});
		}
		return ok(QJsonObject{{"matches", arr}, {"threshold_used", threshold}});
	});
}

ApiResponse ApiEndpoints::embed(const QByteArray& body)
{
	return guarded("embed", [&]() {
		const QJsonObject o = parseObject(body);
		const QString imageUrl = requireString(o, "image_url");
		const auto faces = ingest_->computeEmbeddings(imageUrl);

		QJsonArray arr;
		for (const auto& f : faces) {
			arr.append(QJsonObject{
				{"embedding", fromVector(f.vector)},
				{"det_score", static_cast<double>(f.detScore)},
				{"box", QJsonObject{{"x", f.box.x}, {"y", f.box.y}, {"w", f.box.width}, {"h", f.box.height}}},
			});
		}
		return ok(QJsonObject{{"faces", arr}, {"face_count", static_cast<int>(faces.size())}});
	});
}

ApiResponse ApiEndpoints::compare(const QByteArray& body)
{
	return guarded("compare", [&]() {
		const QJsonObject o = parseObject(body);
		const auto a = toVector(o.value(QStringLiteral("embedding1")), "embedding1");
		const auto b = toVector(o.value(QStringLiteral("embedding2")), "embedding2");
		const double threshold = o.value(QStringLiteral("threshold")).toDouble(defaults_.threshold);

		const CompareResult r = match_->compare(a, b, static_cast<float>(threshold));
		return ok(QJsonObject{
			{"similarity",     static_cast<double>(r.similarity)},
			{"is_match",       r.isMatch},
			{"threshold_used", threshold},
		});
	});
}

ApiResponse ApiEndpoints::indexStatus(const QString& eventId) const
{
	return guarded("index", [&]() {
		if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
		return ok(statusJson(registry_->status(eventId)));
	});
}

ApiResponse ApiEndpoints::rebuild(const QString& eventId)
{
	return guarded("rebuild", [&]() {
		if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
		registry_->rebuild(eventId, QDeadlineTimer(defaults_.queryTimeoutMs));
		return ok(statusJson(registry_->status(eventId)));
	});
}

ApiResponse ApiEndpoints::deleteEvent(const QString& eventId)
{
	return guarded("delete event", [&]() {
		ingest_->deleteEvent(eventId);
		return ok(QJsonObject{{"event_id", eventId}});
	});
}

ApiResponse ApiEndpoints::deletePhoto(const QString& eventId, const QString& photoId)
{
	return guarded("delete photo", [&]() {
		ingest_->deletePhoto(eventId, photoId);
		return ok(QJsonObject{{"event_id", eventId}, {"photo_id", photoId}});
	});
}

ApiResponse ApiEndpoints::logs(const QUrlQuery& query) const
{
	return guarded("logs", [&]() {
		if (!store_) throw StoreUnavailableError(QStringLiteral("log store is not available"));

		const int limit    = std::clamp(query.queryItemValue(QStringLiteral("limit")).toInt(), 0, 1000);
		const int offset   = std::max(0, query.queryItemValue(QStringLiteral("offset")).toInt());
		const int minLevel = std::clamp(query.queryItemValue(QStringLiteral("min_level")).toInt(), 0, 4);
		const QString tag   = query.queryItemValue(QStringLiteral("tag"));
		const QString since = query.queryItemValue(QStringLiteral("since"));

		QVector<SystemLogRow> rows;
		int total = 0;
		if (!store_->selectSystemLogs(offset, limit > 0 ? limit : 100, minLevel, tag, since, &rows, &total))
			throw StoreUnavailableError(QStringLiteral("cannot read system logs"));

		QJsonArray arr;
		for (const auto& r : rows) {
			arr.append(QJsonObject{
				{"id",        r.id},
				{"level",     static_cast<int>(r.level)},
				{"tag",       r.tag},
				{"message",   r.message},
				{"timestamp", r.timestamp.toString(Qt::ISODateWithMs)},
				{"extra",     r.extra},
			});
		}
		return ok(QJsonObject{{"total", total}, {"logs", arr}});
	});
}

ApiResponse ApiEndpoints::clearLogs()
{
	return guarded("logs clear", [&]() {
		if (!store_ || !store_->deleteSysLogs())
			throw StoreUnavailableError(QStringLiteral("cannot clear system logs"));
		return ok(QJsonObject{});
	});
}
