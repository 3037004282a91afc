#pragma once
#include <vector>
#include <QString>
#include <QStringList>
#include <QHash>
#include <QDateTime>
#include <opencv2/core.hpp>

// (event_id, photo_id, face_slot) 레코드 키
struct RecordKey {
	QString eventId;
	QString photoId;
	int     faceSlot = 0;

	bool operator==(const RecordKey& o) const {
		return faceSlot == o.faceSlot && photoId == o.photoId && eventId == o.eventId;
	}
	bool operator!=(const RecordKey& o) const { return !(*this == o); }

	QString toString() const {
		return QStringLiteral("%1/%2#%3").arg(eventId, photoId).arg(faceSlot);
	}
};

inline size_t qHash(const RecordKey& k, size_t seed = 0) noexcept
{
	return qHashMulti(seed, k.eventId, k.photoId, k.faceSlot);
}

// 임베딩 제공자 출력: 검출된 얼굴 1개
struct FaceEmbedding {
	std::vector<float> vector;
	float              detScore = 0.0f;		// 검출 점수 (best-effort)
	cv::Rect           box;					// 원본 좌표계
};

// 저장소 1행
struct EmbeddingRecord {
	RecordKey          key;
	std::vector<float> vector;
	QString            sourceRef;			// 원본 사진 위치 (인덱스는 해석하지 않음)
	float              detScore = 0.0f;
	QDateTime          createdAt;
};

// 인덱스 빌드 입력
struct IndexEntry {
	RecordKey          key;
	std::vector<float> vector;
};

// 인덱스 질의 결과
struct IndexHit {
	RecordKey key;
	float     score = 0.0f;		// cosine, [-1, 1]
};

// 사진 단위 매칭 결과 (얼굴 슬롯 중복 제거)
struct PhotoMatch {
	QString photoId;
	float   score = 0.0f;
};

struct IngestResult {
	QString eventId;
	QString photoId;
	int     facesIndexed = 0;
};

// 배치 인제스트 입력/결과
struct BatchItem {
	QString photoId;
	QString imageRef;
};

struct BatchFailure {
	QString photoId;
	QString code;
	QString message;
};

struct BatchReport {
	int total   = 0;
	int success = 0;
	int failed  = 0;
	int skipped = 0;
	int facesIndexed = 0;
	std::vector<BatchFailure> failures;
};
