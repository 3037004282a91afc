#pragma once
#include <memory>
#include <vector>
#include <QString>

#include "include/match_params.hpp"
#include "include/types.hpp"
#include "index/FaceIndex.hpp"

class IndexRegistry;

// 1:1 비교 결과
struct CompareResult {
	float similarity = 0.0f;
	bool  isMatch    = false;
};

// 이벤트 인덱스 질의 -> 사진 단위 결과 (사진마다 best 점수 1개)
class MatchService {
public:
	explicit MatchService(std::shared_ptr<IndexRegistry> registry);

	// top_k 는 사진 수 기준. 인덱스가 비어 있으면 빈 리스트
	std::vector<PhotoMatch> match(const QString& eventId, const std::vector<float>& query,
								  int topK = matchparams::DEFAULT_TOP_K,
								  float minScore = static_cast<float>(matchparams::DEFAULT_MIN_SCORE),
								  const QueryControl& ctl = QueryControl());

	CompareResult compare(const std::vector<float>& a, const std::vector<float>& b,
						  float threshold = static_cast<float>(matchparams::DEFAULT_MIN_SCORE)) const;

private:
	void validateQuery(const std::vector<float>& v, int dim) const;

	std::shared_ptr<IndexRegistry> registry_;
};
