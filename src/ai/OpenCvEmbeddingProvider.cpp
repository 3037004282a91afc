#include "ai/OpenCvEmbeddingProvider.hpp"
#include "detect/LandmarkAligner.hpp"
#include "include/errors.hpp"
#include "log/eventface_logging.hpp"

#include <QFileInfo>
#include <QElapsedTimer>
#include <QDebug>
#include <opencv2/imgcodecs.hpp>

OpenCvEmbeddingProvider::OpenCvEmbeddingProvider(const Options& opt) : opt_(opt) {}

bool OpenCvEmbeddingProvider::load()
{
	// ── 1) 검출기 ──
	FaceDetector::Options dopt;
	dopt.modelPath = opt_.detectorModel.toStdString();
	dopt.scoreThr  = opt_.detectThr;
	dopt.minFacePx = opt_.minFacePx;
	if (!QFileInfo::exists(opt_.detectorModel) || !detector_.init(dopt)) {
		qCWarning(LC_EMBED) << "[Provider] detector unavailable:" << opt_.detectorModel;
		return false;
	}

	// ── 2) 임베더 ──
	Embedder::Options eopt;
	eopt.modelPath = opt_.recognizerModel;
	embedder_ = std::make_unique<Embedder>(eopt);
	if (!embedder_->isReady()) {
		qCWarning(LC_EMBED) << "[Provider] recognizer unavailable:" << opt_.recognizerModel;
		embedder_.reset();
		return false;
	}

	qCInfo(LC_EMBED) << "[Provider] ready dim=" << embedder_->dimension();
	return true;
}

bool OpenCvEmbeddingProvider::isReady() const
{
	return detector_.isReady() && embedder_ && embedder_->isReady();
}

int OpenCvEmbeddingProvider::dimension() const
{
	return embedder_ ? embedder_->dimension() : 0;
}

QString OpenCvEmbeddingProvider::name() const
{
	return QStringLiteral("opencv-yunet+%1").arg(QFileInfo(opt_.recognizerModel).completeBaseName());
}

std::vector<FaceEmbedding> OpenCvEmbeddingProvider::embed(const QByteArray& imageBytes)
{
	if (!isReady()) throw EmbeddingProviderError(QStringLiteral("embedding models are not loaded"));
	if (imageBytes.isEmpty()) throw EmbeddingProviderError(QStringLiteral("empty image"));

	QElapsedTimer t; t.start();
	std::vector<FaceEmbedding> out;
	try {
		// ── 1) 디코드 ──
		const cv::Mat buf(1, static_cast<int>(imageBytes.size()), CV_8UC1,
						  const_cast<char*>(imageBytes.constData()));
		cv::Mat bgr = cv::imdecode(buf, cv::IMREAD_COLOR);
		if (bgr.empty()) throw EmbeddingProviderError(QStringLiteral("cannot decode image"));

		// ── 2) 검출 (점수 내림차순, 최대 maxFaces) ──
		auto faces = detector_.detectAll(bgr);
		if (opt_.maxFaces > 0 && static_cast<int>(faces.size()) > opt_.maxFaces)
			faces.resize(static_cast<size_t>(opt_.maxFaces));

		// ── 3) 정렬 + 임베딩 ──
		for (const auto& f : faces) {
			cv::Mat aligned = LandmarkAligner::alignBy5pts(bgr, f.lmk);
			if (aligned.empty()) aligned = LandmarkAligner::cropSquare(bgr, f.box);
			if (aligned.empty()) {
				qCDebug(LC_EMBED) << "[Provider] skip face, cannot align";
				continue;
			}

			FaceEmbedding e;
			if (!embedder_->extract(aligned, e.vector))
				throw EmbeddingProviderError(QStringLiteral("embedding inference failed"));
			e.detScore = f.score;
			e.box = f.box;
			out.push_back(std::move(e));
		}
	} catch (const cv::Exception& e) {
		throw EmbeddingProviderError(QStringLiteral("opencv: %1").arg(QString::fromStdString(e.what())));
	}

	qCDebug(LC_EMBED) << "[Provider] faces=" << int(out.size()) << "elapsed(ms)=" << t.elapsed();
	return out;
}
