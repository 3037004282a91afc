#pragma once
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <QString>
#include <vector>
#include <mutex>

// ONNX 얼굴 임베더 (ArcFace 512 / SFace 128)
class Embedder {
public:
		struct Options {
				QString modelPath;
				int inputSize = 112;		// 112x112 정렬 얼굴
				bool useRGB = true;			// 모델이 RGB 입력 모델
				bool externalNorm = true;	// (x-127.5)/128 을 blob 단계에서 적용
				bool flipTTA = true;		// 좌우반전 평균
		};

		explicit Embedder(const Options& opt);
		bool isReady() const;

		// 로드 시 더미 입력으로 확인한 출력 차원 (실패 시 0)
		int dimension() const { return dim_; }

		// 정렬된 BGR 얼굴 -> L2 정규화된 D차원 벡터
		bool extract(const cv::Mat& faceBgr, std::vector<float>& out) const;

private:
		Options opt_;
		mutable std::mutex mtx_;
		mutable cv::dnn::Net net_;
		bool ready_ = false;
		int dim_ = 0;

		cv::Mat preprocess(const cv::Mat& src) const;
		cv::Mat forwardRow(const cv::Mat& faceBgr) const;		// mtx_ 보유 상태
		static void l2normalize(cv::Mat& row);
};
