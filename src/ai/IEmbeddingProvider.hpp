#pragma once
#include <vector>
#include <QByteArray>
#include <QString>
#include "include/types.hpp"

// 이미지 바이트 -> 얼굴별 임베딩
// 얼굴이 없으면 빈 리스트(정상). 디코드/추론 실패는 EmbeddingProviderError.
class IEmbeddingProvider {
public:
	virtual ~IEmbeddingProvider() = default;

	virtual std::vector<FaceEmbedding> embed(const QByteArray& imageBytes) = 0;

	virtual int dimension() const = 0;		// 준비 전이면 0
	virtual bool isReady() const = 0;
	virtual QString name() const = 0;
};
