#include "index/FaceIndex.hpp"
#include "include/errors.hpp"
#include "include/match_params.hpp"
#include "log/eventface_logging.hpp"

#include <QReadLocker>
#include <QWriteLocker>
#include <QDebug>
#include <algorithm>
#include <cmath>

FaceIndex::FaceIndex(const QString& eventId, int dim)
	: eventId_(eventId), dim_(dim)
{
	if (dim_ <= 0) throw ValidationError(QStringLiteral("index dimension must be positive"));
}

int FaceIndex::size() const
{
	QReadLocker lk(&lock_);
	return static_cast<int>(entries_.size());
}

void FaceIndex::checkDim(int n) const
{
	if (n != dim_) throw DimensionMismatchError(dim_, n);
}

FaceIndex::Entry FaceIndex::makeEntry(const RecordKey& key, const std::vector<float>& vec)
{
	Entry e;
	e.key  = key;
	e.row  = cv::Mat(1, dim_, CV_32F, const_cast<float*>(vec.data())).clone();
	e.norm = cv::norm(e.row, cv::NORM_L2);
	return e;
}

float FaceIndex::cosine(const cv::Mat& a, double na, const cv::Mat& b, double nb)
{
	// zero norm -> 유사도 0
	if (!(na > 0.0) || !(nb > 0.0)) return 0.0f;
	const double s = a.dot(b) / (na * nb);
	return static_cast<float>(std::max(-1.0, std::min(1.0, s)));
}

void FaceIndex::build(const std::vector<IndexEntry>& entries)
{
	for (const auto& in : entries) checkDim(static_cast<int>(in.vector.size()));

	std::vector<Entry> fresh;
	QHash<RecordKey, qsizetype> pos;
	fresh.reserve(entries.size());
	pos.reserve(static_cast<qsizetype>(entries.size()));

	quint64 seq = 0;
	for (const auto& in : entries) {
		Entry e = makeEntry(in.key, in.vector);
		auto it = pos.find(in.key);
		if (it != pos.end()) {
			// 입력 중복 키: 마지막 값 유지
			e.seq = fresh[static_cast<size_t>(*it)].seq;
			fresh[static_cast<size_t>(*it)] = std::move(e);
			continue;
		}
		e.seq = seq++;
		pos.insert(in.key, static_cast<qsizetype>(fresh.size()));
		fresh.push_back(std::move(e));
	}

	{
		QWriteLocker lk(&lock_);
		entries_.swap(fresh);
		pos_.swap(pos);
		nextSeq_ = seq;
		version_.fetch_add(1, std::memory_order_acq_rel);
	}
	qCDebug(LC_INDEX) << "[FaceIndex] build" << eventId_ << "entries=" << int(entries.size());
}

void FaceIndex::eraseAt(qsizetype pos)
{
	const size_t i = static_cast<size_t>(pos);
	const size_t last = entries_.size() - 1;
	pos_.remove(entries_[i].key);
	if (i != last) {
		entries_[i] = std::move(entries_[last]);
		pos_[entries_[i].key] = pos;
	}
	entries_.pop_back();
}

void FaceIndex::append(Entry e)
{
	auto it = pos_.constFind(e.key);
	if (it != pos_.constEnd()) eraseAt(*it);

	e.seq = nextSeq_++;
	pos_.insert(e.key, static_cast<qsizetype>(entries_.size()));
	entries_.push_back(std::move(e));
}

void FaceIndex::add(const RecordKey& key, const std::vector<float>& vec)
{
	checkDim(static_cast<int>(vec.size()));
	Entry e = makeEntry(key, vec);

	QWriteLocker lk(&lock_);
	append(std::move(e));
	version_.fetch_add(1, std::memory_order_acq_rel);
}

void FaceIndex::remove(const RecordKey& key)
{
	QWriteLocker lk(&lock_);
	auto it = pos_.constFind(key);
	if (it != pos_.constEnd()) eraseAt(*it);
	version_.fetch_add(1, std::memory_order_acq_rel);
}

int FaceIndex::erasePhoto(const QString& photoId)
{
	std::vector<RecordKey> victims;
	for (const auto& e : entries_) {
		if (e.key.photoId == photoId) victims.push_back(e.key);
	}
	for (const auto& k : victims) {
		auto it = pos_.constFind(k);
		if (it != pos_.constEnd()) eraseAt(*it);
	}
	return static_cast<int>(victims.size());
}

int FaceIndex::removePhoto(const QString& photoId)
{
	QWriteLocker lk(&lock_);
	const int n = erasePhoto(photoId);
	version_.fetch_add(1, std::memory_order_acq_rel);
	return n;
}

void FaceIndex::replacePhoto(const QString& photoId, const std::vector<IndexEntry>& entries)
{
	std::vector<Entry> fresh;
	fresh.reserve(entries.size());
	for (const auto& in : entries) {
		if (in.key.photoId != photoId)
			throw ValidationError(QStringLiteral("entry photo_id %1 does not match %2").arg(in.key.photoId, photoId));
		checkDim(static_cast<int>(in.vector.size()));
		fresh.push_back(makeEntry(in.key, in.vector));
	}

	QWriteLocker lk(&lock_);
	erasePhoto(photoId);
	for (auto& e : fresh) append(std::move(e));
	version_.fetch_add(1, std::memory_order_acq_rel);
}

bool FaceIndex::contains(const RecordKey& key) const
{
	QReadLocker lk(&lock_);
	return pos_.contains(key);
}

std::vector<IndexHit> FaceIndex::query(const std::vector<float>& vec, int topK, float minScore,
									   const QueryControl& ctl) const
{
	checkDim(static_cast<int>(vec.size()));
	if (topK <= 0) throw ValidationError(QStringLiteral("top_k must be positive"));

	const cv::Mat q(1, dim_, CV_32F, const_cast<float*>(vec.data()));
	const double nq = cv::norm(q, cv::NORM_L2);

	struct Cand { float score; quint64 seq; size_t idx; };
	std::vector<Cand> cands;
	std::vector<IndexHit> hits;

	QReadLocker lk(&lock_);
	if (entries_.empty()) return hits;

	cands.reserve(entries_.size());
	for (size_t i = 0; i < entries_.size(); ++i) {
		if ((i % matchparams::CANCEL_CHECK_EVERY) == 0 && i > 0) {
			if (ctl.cancel && ctl.cancel->load(std::memory_order_relaxed))
				throw OperationCancelledError(QStringLiteral("query cancelled (%1)").arg(eventId_));
			if (ctl.deadline.hasExpired())
				throw OperationTimeoutError(QStringLiteral("query deadline exceeded (%1)").arg(eventId_));
		}
		const Entry& e = entries_[i];
		const float s = cosine(q, nq, e.row, e.norm);
		if (s >= minScore) cands.push_back({s, e.seq, i});
	}

	const auto better = [](const Cand& a, const Cand& b) {
		if (a.score != b.score) return a.score > b.score;
		return a.seq < b.seq;
	};
	const size_t k = std::min(static_cast<size_t>(topK), cands.size());
	std::partial_sort(cands.begin(), cands.begin() + static_cast<std::ptrdiff_t>(k), cands.end(), better);

	hits.reserve(k);
	for (size_t i = 0; i < k; ++i) {
		hits.push_back(IndexHit{entries_[cands[i].idx].key, cands[i].score});
	}
	return hits;
}
