#include "match/MatchService.hpp"
#include "index/IndexRegistry.hpp"
#include "include/errors.hpp"
#include "log/eventface_logging.hpp"
#include "log/SystemLogger.hpp"

#include <QElapsedTimer>
#include <QSet>
#include <QDebug>
#include <cmath>
#include <limits>
#include <opencv2/core.hpp>

MatchService::MatchService(std::shared_ptr<IndexRegistry> registry)
	: registry_(std::move(registry))
{
}

void MatchService::validateQuery(const std::vector<float>& v, int dim) const
{
	if (v.empty()) throw ValidationError(QStringLiteral("query embedding is empty"));
	if (static_cast<int>(v.size()) != dim) throw DimensionMismatchError(dim, static_cast<int>(v.size()));
	for (float x : v) {
		if (!std::isfinite(x)) throw ValidationError(QStringLiteral("query embedding has non-finite values"));
	}
}

std::vector<PhotoMatch> MatchService::match(const QString& eventId, const std::vector<float>& query,
											int topK, float minScore, const QueryControl& ctl)
{
	QElapsedTimer t; t.start();
	std::vector<PhotoMatch> out;
	try {
		// ── 1) 입력 검증 (빌드 전에) ──
		if (eventId.trimmed().isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
		if (topK <= 0) throw ValidationError(QStringLiteral("top_k must be positive"));
		if (!std::isfinite(minScore)) throw ValidationError(QStringLiteral("threshold must be a number"));
		validateQuery(query, registry_->dimension());

		// ── 2) 인덱스 (질의 중에는 handle 이 수명을 붙잡는다) ──
		const std::shared_ptr<FaceIndex> index = registry_->getOrBuild(eventId, ctl.deadline);
		const int n = index->size();
		if (n == 0) {
			qCDebug(LC_MATCH) << "[Match]" << eventId << "no faces indexed";
			return out;
		}

		// ── 3) threshold 이상 전체를 받아서 사진 단위로 중복 제거 ──
		const auto hits = index->query(query, std::numeric_limits<int>::max(), minScore, ctl);
		QSet<QString> seen;
		for (const auto& h : hits) {
			if (seen.contains(h.key.photoId)) continue;		// 이미 더 높은 점수로 들어감
			seen.insert(h.key.photoId);
			out.push_back(PhotoMatch{h.key.photoId, h.score});
			if (static_cast<int>(out.size()) >= topK) break;
		}
	} catch (EventFaceError& e) {
		e.addContext(QStringLiteral("match event=%1").arg(eventId));
		qCWarning(LC_MATCH) << "[Match] failed:" << e.code() << e.message();
		SystemLogger::warn("MATCH", e.message(), QString::fromLatin1(e.code()));
		throw;
	}

	qCInfo(LC_MATCH) << "[Match]" << eventId << "photos=" << int(out.size())
					 << "thr=" << minScore << "elapsed(ms)=" << t.elapsed();
	return out;
}

CompareResult MatchService::compare(const std::vector<float>& a, const std::vector<float>& b,
									float threshold) const
{
	if (a.empty() || b.empty()) throw ValidationError(QStringLiteral("both embeddings are required"));
	if (a.size() != b.size())
		throw DimensionMismatchError(static_cast<int>(a.size()), static_cast<int>(b.size()));
	validateQuery(a, static_cast<int>(a.size()));
	validateQuery(b, static_cast<int>(b.size()));

	const cv::Mat ma(1, static_cast<int>(a.size()), CV_32F, const_cast<float*>(a.data()));
	const cv::Mat mb(1, static_cast<int>(b.size()), CV_32F, const_cast<float*>(b.data()));

	CompareResult r;
	r.similarity = FaceIndex::cosine(ma, cv::norm(ma, cv::NORM_L2), mb, cv::norm(mb, cv::NORM_L2));
	r.isMatch = r.similarity >= threshold;
	return r;
}
