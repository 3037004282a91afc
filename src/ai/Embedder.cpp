#include "ai/Embedder.hpp"
#include "log/eventface_logging.hpp"
#include <QFileInfo>
#include <QDebug>
#include <cstring>

// #define DEBUG

Embedder::Embedder(const Options& opt) : opt_(opt)
{
	qCDebug(LC_EMBED) << "[Embedder] ctor path=" << opt_.modelPath;

	if (!QFileInfo::exists(opt_.modelPath)) {
		qCWarning(LC_EMBED) << "[Embedder] model file not found:" << opt_.modelPath;
		return;
	}

	try {
		net_ = cv::dnn::readNetFromONNX(opt_.modelPath.toStdString());
		net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
		net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

		// 출력 차원 확인: 회색 더미 얼굴 1장
		cv::Mat probe(opt_.inputSize, opt_.inputSize, CV_8UC3, cv::Scalar(127, 127, 127));
		std::lock_guard<std::mutex> lk(mtx_);
		cv::Mat row = forwardRow(probe);
		dim_ = row.empty() ? 0 : row.cols;
		ready_ = dim_ > 0;
	} catch (const cv::Exception& e) {
		qCCritical(LC_EMBED) << "[Embedder] readNetFromONNX failed:" << e.what();
		ready_ = false;
		dim_ = 0;
	}

	qCInfo(LC_EMBED) << "[Embedder] ready=" << ready_ << "dim=" << dim_;
}

bool Embedder::isReady() const { return ready_; }

cv::Mat Embedder::preprocess(const cv::Mat& src) const
{
    // ── 0) 기본 유효성 검사 ──────────────────────────────────────────────
    if (src.empty() || src.type() != CV_8UC3) {
        qCWarning(LC_EMBED) << "[preprocess] ERR: src invalid"
                            << " type=" << src.type() << " ch=" << src.channels();
        return cv::Mat();
    }

    // ── 1) blob 생성 (ArcFace 계열: (img-127.5)/128, RGB, 112x112) ──────
    const int S = opt_.inputSize;
    const double scale = opt_.externalNorm ? 1.0 / 128 : 1.0;
    const cv::Scalar mean = opt_.externalNorm ? cv::Scalar(127.5, 127.5, 127.5) : cv::Scalar(0, 0, 0);

    cv::Mat blob = cv::dnn::blobFromImage(src, scale, cv::Size(S, S), mean,
                                          opt_.useRGB, /*crop=*/false, CV_32F);

    // ── 2) NCHW 1x3xSxS 확인 ─────────────────────────────────────────────
    if (blob.dims != 4 || blob.size[0] != 1 || blob.size[1] != 3
        || blob.size[2] != S || blob.size[3] != S) {
        qCWarning(LC_EMBED) << "[preprocess] ERR: unexpected blob shape dims=" << blob.dims;
        return cv::Mat();
    }
    return blob;
}

cv::Mat Embedder::forwardRow(const cv::Mat& faceBgr) const
{
	cv::Mat blob = preprocess(faceBgr);
	if (blob.empty()) return cv::Mat();

	net_.setInput(blob);
	cv::Mat emb = net_.forward();
	if (emb.empty() || emb.total() == 0) {
		qCCritical(LC_EMBED) << "[extract] forward empty.";
		return cv::Mat();
	}

	// 1xD 평탄화 & dtype 보정
	emb = emb.reshape(1, 1).clone();
	if (emb.type() != CV_32F) emb.convertTo(emb, CV_32F);
	return emb;
}

void Embedder::l2normalize(cv::Mat& row)
{
	const double n = cv::norm(row, cv::NORM_L2);
	if (n > 1e-12) row /= static_cast<float>(n);
}

bool Embedder::extract(const cv::Mat& faceBgr, std::vector<float>& out) const
{
    if (!ready_) return false;
    std::lock_guard<std::mutex> lk(mtx_);

    try {
        // ── 1) 원본 추론 ─────────────────────────────────────────────────
        cv::Mat emb = forwardRow(faceBgr);
        if (emb.empty()) return false;

        // ── 2) 좌우반전 추론 후 평균 (Flip-TTA) ───────────────────────────
        if (opt_.flipTTA) {
            cv::Mat flipped; cv::flip(faceBgr, flipped, 1);
            cv::Mat emb2 = forwardRow(flipped);
            if (emb2.empty()) return false;
            if (emb.cols != emb2.cols) {
                qCCritical(LC_EMBED) << "[extract] dim mismatch:" << emb.cols << "vs" << emb2.cols;
                return false;
            }
            emb = 0.5f * (emb + emb2);
        }

        // ── 3) L2 정규화 ─────────────────────────────────────────────────
        l2normalize(emb);

#ifdef DEBUG
        double minv, maxv; cv::minMaxLoc(emb, &minv, &maxv);
        qCDebug(LC_EMBED) << "[extract] L2=" << cv::norm(emb, cv::NORM_L2)
                          << " min/max=" << minv << maxv << " dim=" << emb.cols;
#endif

        out.resize(static_cast<size_t>(emb.cols));
        std::memcpy(out.data(), emb.ptr<float>(0), static_cast<size_t>(emb.cols) * sizeof(float));
        return true;
    }
    catch (const cv::Exception& e) {
        qCCritical(LC_EMBED) << "[extract][cv::Exception]" << e.what();
        return false;
    }
}
