#include "index/IndexRegistry.hpp"
#include "include/errors.hpp"
#include "store/IVectorRecordStore.hpp"
#include "log/eventface_logging.hpp"
#include "log/SystemLogger.hpp"

#include <QMutexLocker>
#include <QDebug>
#include <algorithm>
#include <mutex>

IndexRegistry::IndexRegistry(std::shared_ptr<IVectorRecordStore> store, const Options& opt,
							 QObject* parent)
	: QObject(parent), store_(std::move(store)), opt_(opt)
{
	monotonic_.start();
	connect(&sweepTimer_, &QTimer::timeout, this, &IndexRegistry::sweep);
}

IndexRegistry::~IndexRegistry()
{
	sweepTimer_.stop();
}

void IndexRegistry::setClock(Clock clock)
{
	clock_ = std::move(clock);
}

qint64 IndexRegistry::now() const
{
	return clock_ ? clock_() : monotonic_.elapsed();
}

int IndexRegistry::dimension() const
{
	return store_->dimension();
}

std::shared_ptr<IndexRegistry::Slot> IndexRegistry::acquireSlot(const QString& eventId)
{
	QMutexLocker lk(&mapMutex_);
	auto it = slots_.find(eventId);
	if (it != slots_.end()) return *it;
	auto s = std::make_shared<Slot>();
	slots_.insert(eventId, s);
	return s;
}

std::shared_ptr<IndexRegistry::Slot> IndexRegistry::findSlot(const QString& eventId) const
{
	QMutexLocker lk(&mapMutex_);
	return slots_.value(eventId);
}

void IndexRegistry::detach(Slot& s)
{
	s.detached = true;
	s.state = IndexState::Absent;
	s.index.reset();
	s.pending.clear();
}

std::shared_ptr<FaceIndex> IndexRegistry::getOrBuild(const QString& eventId, QDeadlineTimer deadline)
{
	if (eventId.isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));

	for (;;) {
		auto slot = acquireSlot(eventId);

		{   // fast path
			QMutexLocker lk(&slot->mu);
			if (slot->state == IndexState::Ready && slot->index) {
				slot->lastUsedMs = now();
				return slot->index;
			}
		}

		// 같은 이벤트의 동시 빌드는 여기서 직렬화
		if (!slot->buildMutex.tryLock(deadline)) {
			throw OperationTimeoutError(QStringLiteral("timed out waiting for index build (%1)").arg(eventId));
		}
		std::unique_lock<QMutex> buildLock(slot->buildMutex, std::adopt_lock);

		{
			QMutexLocker lk(&slot->mu);
			if (slot->detached) continue;		// 대기 중 invalidate/evict -> 새 슬롯으로 재시도
			if (slot->state == IndexState::Ready && slot->index) {
				slot->lastUsedMs = now();
				return slot->index;
			}
			slot->state = IndexState::Building;
		}

		auto idx = buildInto(eventId, slot);
		buildLock.unlock();

		const int evicted = reclaim(eventId);
		if (evicted > 0) {
			qCInfo(LC_REGISTRY) << "[Registry] reclaimed" << evicted << "indexes after building" << eventId;
		}
		return idx;
	}
}

std::shared_ptr<FaceIndex> IndexRegistry::buildInto(const QString& eventId, const std::shared_ptr<Slot>& slot)
{
	QElapsedTimer t; t.start();
	std::shared_ptr<FaceIndex> idx;
	try {
		std::vector<IndexEntry> entries;
		store_->listVectors(eventId, [&entries](const RecordKey& key, const std::vector<float>& vec) {
			entries.push_back(IndexEntry{key, vec});
		});
		idx = std::make_shared<FaceIndex>(eventId, store_->dimension());
		idx->build(entries);
	} catch (...) {
		// 실패한 빌드는 캐시하지 않는다 -> ABSENT, 다음 호출에서 재시도
		{
			QMutexLocker lk(&slot->mu);
			if (slot->state == IndexState::Building) slot->state = IndexState::Absent;
			slot->pending.clear();
		}
		qCWarning(LC_REGISTRY) << "[Registry] build failed for" << eventId;
		SystemLogger::error("REG", QStringLiteral("index build failed: %1").arg(eventId));
		throw;
	}

	int replayed = 0;
	{
		QMutexLocker lk(&slot->mu);
		for (const auto& op : slot->pending) {
			switch (op.kind) {
			case PendingOp::Kind::Add:          idx->add(op.key, op.vec); break;
			case PendingOp::Kind::RemovePhoto:  idx->removePhoto(op.key.photoId); break;
			case PendingOp::Kind::ReplacePhoto: idx->replacePhoto(op.key.photoId, op.entries); break;
			}
			++replayed;
		}
		slot->pending.clear();

		if (!slot->detached) {
			slot->index = idx;
			slot->state = IndexState::Ready;
			slot->lastUsedMs = now();
		}
	}

	qCInfo(LC_REGISTRY) << "[Registry] built" << eventId
						<< "entries=" << idx->size()
						<< "replayed=" << replayed
						<< "elapsed(ms)=" << t.elapsed();
	SystemLogger::info("REG", QStringLiteral("index built: %1").arg(eventId),
					   QStringLiteral("entries=%1 ms=%2").arg(idx->size()).arg(t.elapsed()));
	return idx;
}

std::shared_ptr<FaceIndex> IndexRegistry::peek(const QString& eventId) const
{
	auto slot = findSlot(eventId);
	if (!slot) return nullptr;
	QMutexLocker lk(&slot->mu);
	return slot->state == IndexState::Ready ? slot->index : nullptr;
}

void IndexRegistry::onIngest(const QString& eventId, const RecordKey& key, const std::vector<float>& vec)
{
	const int dim = store_->dimension();
	if (static_cast<int>(vec.size()) != dim) throw DimensionMismatchError(dim, static_cast<int>(vec.size()));

	auto slot = findSlot(eventId);
	if (!slot) return;		// 다음 접근 시 저장소에서 빌드

	QMutexLocker lk(&slot->mu);
	if (slot->state == IndexState::Ready && slot->index) {
		slot->index->add(key, vec);
	} else if (slot->state == IndexState::Building) {
		slot->pending.push_back(PendingOp{PendingOp::Kind::Add, key, vec});
	}
}

void IndexRegistry::onPhotoRemoved(const QString& eventId, const QString& photoId)
{
	auto slot = findSlot(eventId);
	if (!slot) return;

	QMutexLocker lk(&slot->mu);
	if (slot->state == IndexState::Ready && slot->index) {
		slot->index->removePhoto(photoId);
	} else if (slot->state == IndexState::Building) {
		PendingOp op;
		op.kind = PendingOp::Kind::RemovePhoto;
		op.key = RecordKey{eventId, photoId, 0};
		slot->pending.push_back(std::move(op));
	}
}

void IndexRegistry::onPhotoReplaced(const QString& eventId, const QString& photoId,
									const std::vector<IndexEntry>& entries)
{
	const int dim = store_->dimension();
	for (const auto& e : entries) {
		if (static_cast<int>(e.vector.size()) != dim)
			throw DimensionMismatchError(dim, static_cast<int>(e.vector.size()));
	}

	auto slot = findSlot(eventId);
	if (!slot) return;

	QMutexLocker lk(&slot->mu);
	if (slot->state == IndexState::Ready && slot->index) {
		slot->index->replacePhoto(photoId, entries);
	} else if (slot->state == IndexState::Building) {
		PendingOp op;
		op.kind = PendingOp::Kind::ReplacePhoto;
		op.key = RecordKey{eventId, photoId, 0};
		op.entries = entries;
		slot->pending.push_back(std::move(op));
	}
}

void IndexRegistry::invalidate(const QString& eventId)
{
	std::shared_ptr<Slot> slot;
	{
		QMutexLocker lk(&mapMutex_);
		slot = slots_.take(eventId);
	}
	if (!slot) return;

	QMutexLocker lk(&slot->mu);
	detach(*slot);
	qCInfo(LC_REGISTRY) << "[Registry] invalidated" << eventId;
}

std::shared_ptr<FaceIndex> IndexRegistry::rebuild(const QString& eventId, QDeadlineTimer deadline)
{
	invalidate(eventId);
	return getOrBuild(eventId, deadline);
}

int IndexRegistry::evictIdle()
{
	if (opt_.idleTtlMs <= 0) return 0;

	const qint64 t = now();
	QStringList evicted;
	{
		QMutexLocker lk(&mapMutex_);
		for (auto it = slots_.begin(); it != slots_.end();) {
			Slot& s = **it;
			QMutexLocker sl(&s.mu);
			const bool idle = (s.state == IndexState::Ready) && (t - s.lastUsedMs > opt_.idleTtlMs);
			// 빌드 실패로 ABSENT 상태인 빈 슬롯도 정리
			const bool stale = (s.state == IndexState::Absent) && (t - s.lastUsedMs > opt_.idleTtlMs);
			if (idle || stale) {
				if (idle) evicted << it.key();
				detach(s);
				sl.unlock();
				it = slots_.erase(it);
			} else {
				++it;
			}
		}
	}

	for (const auto& e : evicted) {
		qCInfo(LC_REGISTRY) << "[Registry] evicted idle index" << e;
		SystemLogger::info("REG", QStringLiteral("index evicted (idle): %1").arg(e));
	}
	return static_cast<int>(evicted.size());
}

int IndexRegistry::reclaim(const QString& keep)
{
	struct Cand { QString eventId; qint64 lastUsed; int entries; };

	QStringList evicted;
	{
		QMutexLocker lk(&mapMutex_);

		std::vector<Cand> ready;
		qint64 total = 0;
		for (auto it = slots_.cbegin(); it != slots_.cend(); ++it) {
			QMutexLocker sl(&(*it)->mu);
			if ((*it)->state != IndexState::Ready || !(*it)->index) continue;
			const int n = (*it)->index->size();
			total += n;
			ready.push_back({it.key(), (*it)->lastUsedMs, n});
		}

		int live = static_cast<int>(ready.size());
		const bool over = (opt_.maxLiveIndexes > 0 && live > opt_.maxLiveIndexes)
					   || (opt_.maxTotalEntries > 0 && total > opt_.maxTotalEntries);
		if (!over) return 0;

		// 오래 안 쓴 것부터
		std::sort(ready.begin(), ready.end(),
				  [](const Cand& a, const Cand& b) { return a.lastUsed < b.lastUsed; });

		for (const auto& c : ready) {
			const bool stillOver = (opt_.maxLiveIndexes > 0 && live > opt_.maxLiveIndexes)
								|| (opt_.maxTotalEntries > 0 && total > opt_.maxTotalEntries);
			if (!stillOver) break;
			if (c.eventId == keep) continue;

			auto slot = slots_.take(c.eventId);
			if (!slot) continue;
			QMutexLocker sl(&slot->mu);
			detach(*slot);
			--live;
			total -= c.entries;
			evicted << c.eventId;
		}
	}

	for (const auto& e : evicted) {
		qCInfo(LC_REGISTRY) << "[Registry] evicted over memory limit" << e;
		SystemLogger::warn("REG", QStringLiteral("index evicted (limit): %1").arg(e));
	}
	return static_cast<int>(evicted.size());
}

IndexStatus IndexRegistry::status(const QString& eventId) const
{
	IndexStatus st;
	st.eventId = eventId;

	auto slot = findSlot(eventId);
	if (!slot) return st;

	QMutexLocker lk(&slot->mu);
	st.state = slot->state;
	if (slot->index) {
		st.entries = slot->index->size();
		st.version = slot->index->version();
	}
	st.idleMs = now() - slot->lastUsedMs;
	return st;
}

std::vector<IndexStatus> IndexRegistry::statuses() const
{
	QStringList ids;
	{
		QMutexLocker lk(&mapMutex_);
		ids = slots_.keys();
	}
	ids.sort();

	std::vector<IndexStatus> out;
	out.reserve(static_cast<size_t>(ids.size()));
	for (const auto& id : ids) out.push_back(status(id));
	return out;
}

int IndexRegistry::liveCount() const
{
	QMutexLocker lk(&mapMutex_);
	int n = 0;
	for (const auto& s : slots_) {
		QMutexLocker sl(&s->mu);
		if (s->state == IndexState::Ready) ++n;
	}
	return n;
}

void IndexRegistry::startSweep(int intervalMs)
{
	sweepTimer_.setInterval(intervalMs);
	sweepTimer_.start();
	qCInfo(LC_REGISTRY) << "[Registry] sweep every" << intervalMs << "ms, idle ttl=" << opt_.idleTtlMs << "ms";
}

void IndexRegistry::stopSweep()
{
	sweepTimer_.stop();
}

void IndexRegistry::sweep()
{
	evictIdle();
	reclaim();
}
