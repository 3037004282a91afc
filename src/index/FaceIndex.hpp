#pragma once
#include <atomic>
#include <vector>
#include <QHash>
#include <QString>
#include <QReadWriteLock>
#include <QDeadlineTimer>
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 질의 제어: 호출측 취소 플래그 + 데드라인
struct QueryControl {
	const std::atomic<bool>* cancel = nullptr;
	QDeadlineTimer deadline{QDeadlineTimer::Forever};
};

// 이벤트 1개의 최근접 이웃 인덱스 (정확한 brute-force 코사인)
//  - 엔트리마다 1xD CV_32F 행과 L2 norm을 미리 계산해 둔다
//  - 질의는 read lock, 변경은 write lock
//  - 동점은 삽입 순서(seq) 오름차순
class FaceIndex {
public:
	FaceIndex(const QString& eventId, int dim);

	const QString& eventId() const { return eventId_; }
	int dim() const { return dim_; }
	int size() const;
	quint64 version() const { return version_.load(std::memory_order_acquire); }

	// 전체 스냅샷으로 새로 구성 (기존 엔트리 폐기)
	void build(const std::vector<IndexEntry>& entries);

	// 삽입 또는 교체. 교체된 엔트리는 삽입 순서상 맨 뒤로 간다
	void add(const RecordKey& key, const std::vector<float>& vec);

	// 없으면 no-op (version은 증가)
	void remove(const RecordKey& key);

	// photoId의 모든 슬롯 제거, 제거 개수 반환
	int removePhoto(const QString& photoId);

	// photoId의 슬롯 전체를 entries로 교체 (한 번의 write lock, version 1 증가)
	// entries의 key.photoId는 모두 photoId여야 한다
	void replacePhoto(const QString& photoId, const std::vector<IndexEntry>& entries);

	bool contains(const RecordKey& key) const;

	// score >= minScore 인 상위 topK (score 내림차순, 동점은 삽입 순서)
	std::vector<IndexHit> query(const std::vector<float>& vec, int topK, float minScore,
								const QueryControl& ctl = QueryControl()) const;

	static float cosine(const cv::Mat& a, double na, const cv::Mat& b, double nb);

private:
	struct Entry {
		RecordKey key;
		cv::Mat   row;		// 1xD CV_32F
		double    norm = 0.0;
		quint64   seq  = 0;
	};

	void checkDim(int n) const;
	Entry makeEntry(const RecordKey& key, const std::vector<float>& vec);
	void eraseAt(qsizetype pos);		// write lock 보유 상태에서 호출
	int erasePhoto(const QString& photoId);
	void append(Entry e);

	QString eventId_;
	int dim_;

	mutable QReadWriteLock lock_;
	std::vector<Entry> entries_;
	QHash<RecordKey, qsizetype> pos_;
	quint64 nextSeq_ = 0;
	std::atomic<quint64> version_{0};
};
