#include "detect/LandmarkAligner.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <vector>

const std::array<cv::Point2f, 5> LandmarkAligner::kDst5_112 = {{
	{38.2946f, 51.6963f},			// LE
	{73.5318f, 50.5014f},			// RE
	{56.0252f, 71.7366f},			// Nose
	{41.5493f, 92.3655f},			// LM
	{70.7299f, 92.2041f}			// RM
}};

cv::Mat LandmarkAligner::alignBy5pts(const cv::Mat& srcBgr,
									 const std::array<cv::Point2f,5>& src5_in,
									 const cv::Size& outSize)
{
	if (srcBgr.empty() || outSize.width <= 0 || outSize.height <= 0)
		return cv::Mat();

	// 좌우 뒤바뀐 랜드마크 보정
	std::array<cv::Point2f, 5> s = src5_in;
	if (s[0].x > s[1].x) std::swap(s[0], s[1]);
	if (s[3].x > s[4].x) std::swap(s[3], s[4]);

	std::vector<cv::Point2f> src(s.begin(), s.end());
	std::vector<cv::Point2f> dst(kDst5_112.begin(), kDst5_112.end());

	// 5점 전부 사용 (사진 한 장당 1회라 RANSAC 불필요)
	cv::Mat M = cv::estimateAffinePartial2D(src, dst, cv::noArray(), cv::LMEDS);
	if (M.empty()) return {};

	const cv::Size warpSize(112, 112);
	cv::Mat aligned112;
	cv::warpAffine(srcBgr, aligned112, M, warpSize,
				   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(127, 127, 127));

	if (outSize == warpSize) return aligned112;

	cv::Mat out;
	cv::resize(aligned112, out, outSize, 0, 0, cv::INTER_LINEAR);
	return out;
}

cv::Mat LandmarkAligner::cropSquare(const cv::Mat& srcBgr, const cv::Rect& box,
									const cv::Size& outSize)
{
	if (srcBgr.empty() || box.area() <= 0) return cv::Mat();

	const int side = std::max(box.width, box.height);
	cv::Rect sq(box.x + box.width / 2 - side / 2, box.y + box.height / 2 - side / 2, side, side);
	sq &= cv::Rect(0, 0, srcBgr.cols, srcBgr.rows);
	if (sq.area() <= 0) return cv::Mat();

	cv::Mat out;
	cv::resize(srcBgr(sq), out, outSize, 0, 0, cv::INTER_LINEAR);
	return out;
}
