#pragma once
#include <functional>
#include <vector>
#include <QString>
#include <QStringList>
#include "include/types.hpp"

// 영속 벡터 저장소 인터페이스. 모든 변경은 반환 전에 기록된다(write-through).
// 실패 시 StoreUnavailableError, 차원 불일치 시 DimensionMismatchError.
class IVectorRecordStore {
public:
	using Visitor = std::function<void(const RecordKey&, const std::vector<float>&)>;

	virtual ~IVectorRecordStore() = default;

	virtual int dimension() const = 0;

	// photoId의 모든 슬롯을 faces로 교체 (slot = 리스트 위치). 빈 리스트는 기존 레코드 삭제.
	virtual void upsert(const QString& eventId, const QString& photoId,
						const std::vector<FaceEmbedding>& faces,
						const QString& sourceRef = QString()) = 0;

	virtual void deletePhoto(const QString& eventId, const QString& photoId) = 0;
	virtual void deleteEvent(const QString& eventId) = 0;

	// 이벤트의 전체 레코드를 (photo_id, face_slot) 순으로 순회. 다시 호출하면 처음부터.
	virtual void listVectors(const QString& eventId, const Visitor& visit) const = 0;

	virtual std::vector<EmbeddingRecord> photoRecords(const QString& eventId,
													  const QString& photoId) const = 0;
	virtual int countVectors(const QString& eventId) const = 0;
	virtual QStringList listEvents() const = 0;
};

// 벡터 리스트 -> FaceEmbedding 리스트
inline std::vector<FaceEmbedding> toFaces(const std::vector<std::vector<float>>& vectors)
{
	std::vector<FaceEmbedding> faces;
	faces.reserve(vectors.size());
	for (const auto& v : vectors) {
		FaceEmbedding f;
		f.vector = v;
		faces.push_back(std::move(f));
	}
	return faces;
}
