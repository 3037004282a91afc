#pragma once
#include <memory>
#include <QString>
#include "ai/IEmbeddingProvider.hpp"
#include "ai/Embedder.hpp"
#include "detect/FaceDetector.hpp"
#include "include/match_params.hpp"

// YuNet 검출 -> 5점 정렬 -> ONNX 임베더
class OpenCvEmbeddingProvider : public IEmbeddingProvider {
public:
	struct Options {
		QString detectorModel;
		QString recognizerModel;
		float   detectThr = static_cast<float>(matchparams::DETECT_THR);
		int     minFacePx = matchparams::MIN_FACE_PX;
		int     maxFaces  = matchparams::MAX_FACES_PER_PHOTO;
	};

	explicit OpenCvEmbeddingProvider(const Options& opt);

	// 모델 로드. 실패해도 객체는 유효 (isReady() == false, embed()는 에러)
	bool load();

	std::vector<FaceEmbedding> embed(const QByteArray& imageBytes) override;
	int dimension() const override;
	bool isReady() const override;
	QString name() const override;

private:
	Options opt_;
	FaceDetector detector_;
	std::unique_ptr<Embedder> embedder_;
};
