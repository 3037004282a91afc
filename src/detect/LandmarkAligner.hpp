#pragma once
#include <array>
#include <opencv2/core.hpp>

class LandmarkAligner {
	public:
		// 5점 기준 정렬. 성공 시 정렬된 BGR 얼굴(outSize), 실패 시 빈 Mat
		// lmk 순서: [LE, RE, Nose, LM, RM]  (YuNet 출력과 동일)
		static cv::Mat alignBy5pts(const cv::Mat& srcBgr,
								   const std::array<cv::Point2f,5>& src5_in,
								   const cv::Size& outSize = {112, 112});

		// 랜드마크 정렬 실패 시: 박스를 정사각형으로 넓혀 잘라낸 뒤 리사이즈
		static cv::Mat cropSquare(const cv::Mat& srcBgr, const cv::Rect& box,
								  const cv::Size& outSize = {112, 112});

	private:
		// 기준 좌표(ArcFace 112x112)
		static const std::array<cv::Point2f,5> kDst5_112;
};
