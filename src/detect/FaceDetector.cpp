#include "detect/FaceDetector.hpp"
#include "log/eventface_logging.hpp"
#include <QtCore/QDebug>
#include <algorithm>

bool FaceDetector::init(const Options& opt)
{
	opt_ = opt;

	try {
		yunet_ = cv::FaceDetectorYN::create(
				opt_.modelPath, /*config=*/"", cv::Size(opt_.inputW, opt_.inputH),
				opt_.scoreThr, opt_.nmsThr, opt_.topK, opt_.backend, opt_.target);
	} catch (const cv::Exception& e) {
		qCWarning(LC_EMBED) << "[FaceDetector] YuNet create failed:" << e.what();
		ready_ = false;
		return false;
	}

	ready_ = (yunet_ != nullptr);
	yunet_InputSize_ = cv::Size(0, 0);
	if (!ready_) {
		qCWarning(LC_EMBED) << "[FaceDetector] YuNet not ready";
		return false;
	}

	qCInfo(LC_EMBED) << "[FaceDetector] YuNet init Ok"
					 << "model=" << QString::fromStdString(opt_.modelPath)
					 << "thr="   << opt_.scoreThr << "/" << opt_.nmsThr
					 << "minFace=" << opt_.minFacePx;
	return true;
}

std::vector<FaceDet> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh)
{
	std::vector<FaceDet> out;
	if (dets.empty() || dets.cols < 15) return out;

	for (int i = 0; i < dets.rows; ++i) {
		const float score = dets.at<float>(i, 14);
		if (score < scoreThresh) continue;

		FaceDet f;
		f.box   = cv::Rect(cv::Point2f(dets.at<float>(i, 0), dets.at<float>(i, 1)),
						   cv::Size2f(dets.at<float>(i, 2), dets.at<float>(i, 3)));
		f.score = score;
		for (int k = 0; k < 5; ++k) {
			f.lmk[k] = cv::Point2f(dets.at<float>(i, 4 + 2 * k), dets.at<float>(i, 5 + 2 * k));
		}
		out.push_back(std::move(f));
	}
	return out;
}

std::vector<FaceDet> FaceDetector::detectAll(const cv::Mat& bgr) const
{
	std::vector<FaceDet> out;
	if (!ready_ || bgr.empty()) return out;

	cv::Mat dets;
	{
		std::lock_guard<std::mutex> lk(mtx_);
		// 입력 크기 갱신 (이미지 크기 변경 시 필수)
		const cv::Size cur = bgr.size();
		if (cur != yunet_InputSize_) {
			yunet_->setInputSize(cur);
			yunet_InputSize_ = cur;
		}
		yunet_->detect(bgr, dets);		// BGR 그대로 입력
	}

	out = parseYuNet(dets, opt_.scoreThr);

	// 이미지 밖으로 나간 박스 자르기 + 작은 얼굴 제외
	const cv::Rect frame(0, 0, bgr.cols, bgr.rows);
	out.erase(std::remove_if(out.begin(), out.end(), [&](FaceDet& f) {
		f.box &= frame;
		return std::min(f.box.width, f.box.height) < opt_.minFacePx;
	}), out.end());

	std::stable_sort(out.begin(), out.end(),
					 [](const FaceDet& a, const FaceDet& b) { return a.score > b.score; });

	qCDebug(LC_EMBED) << "[FaceDetector] rows=" << dets.rows << "kept=" << int(out.size());
	return out;
}
