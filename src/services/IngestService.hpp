#pragma once
#include <memory>
#include <vector>
#include <QThreadPool>
#include <QString>

#include "include/match_params.hpp"
#include "include/types.hpp"
#include "util/KeyedMutex.hpp"

class IVectorRecordStore;
class IndexRegistry;
class IEmbeddingProvider;
class IImageFetcher;

// 사진 인제스트: fetch -> embed -> store upsert -> live index 반영
//  - fetch/embed 는 lock 밖에서, (event, photo) 단위로 upsert + index 반영을 직렬화
//  - 협력자 에러는 event/photo 문맥을 붙여 그대로 다시 던진다
class IngestService {
public:
	struct Options {
		int embedTimeoutMs   = matchparams::EMBED_TIMEOUT_MS;
		int batchParallelism = matchparams::BATCH_PARALLELISM;
		int embedThreads     = 2;
	};

	IngestService(std::shared_ptr<IVectorRecordStore> store,
				  std::shared_ptr<IndexRegistry> registry,
				  std::shared_ptr<IEmbeddingProvider> provider,
				  std::shared_ptr<IImageFetcher> fetcher,
				  const Options& opt);
	~IngestService();

	IngestResult ingestPhoto(const QString& eventId, const QString& photoId, const QString& imageRef);

	// 임베딩을 이미 가진 경우 (얼굴 1개)
	IngestResult ingestEmbedding(const QString& eventId, const QString& photoId,
								 const std::vector<float>& vector,
								 const QString& sourceRef = QString());

	void deletePhoto(const QString& eventId, const QString& photoId);
	void deleteEvent(const QString& eventId);

	// 대량 백필. 항목별 결과 집계, 첫 실패에서 멈추지 않는다
	BatchReport ingestBatch(const QString& eventId, const std::vector<BatchItem>& items,
							int parallelism = 0);

	// 저장 없이 fetch + embed (셀피 경로)
	std::vector<FaceEmbedding> computeEmbeddings(const QString& imageRef);

	bool providerReady() const;

private:
	std::vector<FaceEmbedding> fetchAndEmbed(const QString& imageRef);
	std::vector<FaceEmbedding> embedWithTimeout(const QByteArray& bytes);
	void commitPhoto(const QString& eventId, const QString& photoId,
					 const std::vector<FaceEmbedding>& faces, const QString& sourceRef);
	static void requireIds(const QString& eventId, const QString& photoId);

	std::shared_ptr<IVectorRecordStore> store_;
	std::shared_ptr<IndexRegistry> registry_;
	std::shared_ptr<IEmbeddingProvider> provider_;
	std::shared_ptr<IImageFetcher> fetcher_;
	Options opt_;

	KeyedMutex photoLocks_;
	QThreadPool embedPool_;
};
