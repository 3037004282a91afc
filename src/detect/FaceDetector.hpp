#pragma once
#include <array>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN

// YuNet 검출 1건 (원본 좌표계)
struct FaceDet {
	cv::Rect box;
	float score = 0.0f;
	std::array<cv::Point2f, 5> lmk{};		// [LE, RE, Nose, LM, RM]
};

class FaceDetector {
	public:
		struct Options {
			std::string modelPath;
			int inputW = 320;
			int inputH = 320;
			float scoreThr = 0.6f;
			float nmsThr = 0.3f;
			int topK = 5000;
			int minFacePx = 24;				// 짧은 변 기준
			int backend = cv::dnn::DNN_BACKEND_OPENCV;
			int target  = cv::dnn::DNN_TARGET_CPU;
		};

		FaceDetector() = default;
		~FaceDetector() = default;

		// YuNet 초기화 (modelPath 필수)
		bool init(const Options& opt);
		bool isReady() const { return ready_; }

		// 이미지의 전체 얼굴, 점수 내림차순. 최소 크기 미만은 제외
		// YuNet 예외는 cv::Exception 그대로 전달
		std::vector<FaceDet> detectAll(const cv::Mat& bgr) const;

	private:
		// score는 맨 끝(14), lmk는 4~13
		static std::vector<FaceDet> parseYuNet(const cv::Mat& dets, float scoreThresh);

	private:
		bool ready_ = false;
		Options opt_;

		mutable std::mutex mtx_;					// YuNet 핸들은 스레드 안전하지 않음
		cv::Ptr<cv::FaceDetectorYN> yunet_;
		mutable cv::Size yunet_InputSize_{0, 0};  // setInputSize cache
};
