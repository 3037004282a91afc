#include <QtTest>
#include <QTemporaryDir>
#include <cmath>

#include "match/MatchService.hpp"
#include "services/IngestService.hpp"
#include "index/IndexRegistry.hpp"
#include "store/SqliteVectorStore.hpp"
#include "include/errors.hpp"
#include "fakes/FakeEmbeddingProvider.hpp"
#include "fakes/FakeImageFetcher.hpp"
#include "fakes/TestVectors.hpp"

using testvec::unit;
using testvec::mix;

class TestMatchService : public QObject {
	Q_OBJECT

	static constexpr int D = 512;
	QTemporaryDir tmp_;
	int seq_ = 0;

	std::shared_ptr<SqliteVectorStore> store_;
	std::shared_ptr<IndexRegistry> registry_;
	std::shared_ptr<FakeEmbeddingProvider> provider_;
	std::shared_ptr<FakeImageFetcher> fetcher_;
	std::unique_ptr<IngestService> ingest_;
	std::unique_ptr<MatchService> match_;

	void stage(const QString& ref, const std::vector<std::vector<float>>& faces) {
		const QByteArray bytes = ref.toUtf8();
		fetcher_->put(ref, bytes);
		provider_->setFaces(bytes, faces);
	}

private slots:
	void initTestCase()
	{
		QVERIFY(tmp_.isValid());
	}

	void init()
	{
		store_ = std::make_shared<SqliteVectorStore>(tmp_.filePath(QStringLiteral("m%1.db").arg(++seq_)), D);
		QVERIFY(store_->initializeDatabase());
		registry_ = std::make_shared<IndexRegistry>(store_, IndexRegistry::Options());
		provider_ = std::make_shared<FakeEmbeddingProvider>(D);
		fetcher_ = std::make_shared<FakeImageFetcher>();
		ingest_ = std::make_unique<IngestService>(store_, registry_, provider_, fetcher_, IngestService::Options());
		match_ = std::make_unique<MatchService>(registry_);
	}

	void cleanup()
	{
		ingest_.reset();
	}

	// 얼굴 1개 사진 -> 같은 벡터로 질의
	void singleFaceExactMatch()
	{
		stage("u1", {unit(D, 0)});
		ingest_->ingestPhoto("E1", "p1", "u1");

		const auto m = match_->match("E1", unit(D, 0));
		QCOMPARE(int(m.size()), 1);
		QCOMPARE(m[0].photoId, QStringLiteral("p1"));
		QVERIFY(qAbs(m[0].score - 1.0f) < 1e-5f);
	}

	// 얼굴 2개(직교) 중 두 번째와만 일치 -> 사진 1번, 두 번째 얼굴 점수
	void multiFacePhotoReturnedOnceWithBestScore()
	{
		stage("u1", {unit(D, 0), unit(D, 1)});
		ingest_->ingestPhoto("E1", "p1", "u1");

		const auto m = match_->match("E1", mix(D, 1, 2, 0.2), 20, -1.0f);
		QCOMPARE(int(m.size()), 1);
		QCOMPARE(m[0].photoId, QStringLiteral("p1"));
		QVERIFY(qAbs(m[0].score - float(std::cos(0.2))) < 1e-5f);
	}

	void emptyEventReturnsEmptyList()
	{
		const auto m = match_->match("E-empty", unit(D, 0));
		QVERIFY(m.empty());
		QCOMPARE(registry_->status("E-empty").state, IndexState::Ready);
	}

	void removedPhotoNoLongerMatches()
	{
		stage("u1", {unit(D, 0)});
		stage("none", {});
		ingest_->ingestPhoto("E1", "p1", "u1");
		QCOMPARE(int(match_->match("E1", unit(D, 0)).size()), 1);

		ingest_->ingestPhoto("E1", "p1", "none");		// 빈 리스트로 재등록
		QVERIFY(match_->match("E1", unit(D, 0)).empty());

		// 재빌드 후에도 동일
		registry_->invalidate("E1");
		QVERIFY(match_->match("E1", unit(D, 0)).empty());
	}

	void replacementLeavesNoResidualEntries()
	{
		stage("v1", {unit(D, 0), unit(D, 1)});
		stage("v2", {unit(D, 5)});
		ingest_->ingestPhoto("E1", "p1", "v1");
		ingest_->ingestPhoto("E1", "p1", "v2");

		QVERIFY(match_->match("E1", unit(D, 0)).empty());
		QVERIFY(match_->match("E1", unit(D, 1)).empty());
		QCOMPARE(int(match_->match("E1", unit(D, 5)).size()), 1);
	}

	void topKCountsPhotosAndThresholdHolds()
	{
		for (int i = 0; i < 10; ++i) {
			ingest_->ingestEmbedding("E1", QStringLiteral("p%1").arg(i), mix(D, 0, 1, 0.1 * i));
		}
		const auto m = match_->match("E1", unit(D, 0), 3, 0.0f);
		QCOMPARE(int(m.size()), 3);
		QCOMPARE(m[0].photoId, QStringLiteral("p0"));
		QCOMPARE(m[1].photoId, QStringLiteral("p1"));
		QCOMPARE(m[2].photoId, QStringLiteral("p2"));

		const auto strict = match_->match("E1", unit(D, 0), 20, 0.9f);
		for (const auto& pm : strict) QVERIFY(pm.score >= 0.9f);
		QCOMPARE(int(strict.size()), 5);		// cos(0.4)=0.921, cos(0.5)=0.878
	}

	void eventsAreIsolated()
	{
		ingest_->ingestEmbedding("A", "pa", unit(D, 0));
		QVERIFY(match_->match("B", unit(D, 0)).empty());
		ingest_->ingestEmbedding("B", "pb", unit(D, 0));
		const auto a = match_->match("A", unit(D, 0));
		QCOMPARE(int(a.size()), 1);
		QCOMPARE(a[0].photoId, QStringLiteral("pa"));
	}

	void invalidQueriesRejected()
	{
		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError, match_->match("E1", unit(D + 1, 0)));
		QVERIFY_THROWS_EXCEPTION(ValidationError, match_->match("E1", {}));
		QVERIFY_THROWS_EXCEPTION(ValidationError, match_->match("", unit(D, 0)));
		QVERIFY_THROWS_EXCEPTION(ValidationError, match_->match("E1", unit(D, 0), 0));

		auto nan = unit(D, 0);
		nan[3] = std::nanf("");
		QVERIFY_THROWS_EXCEPTION(ValidationError, match_->match("E1", nan));

		// 검증 실패는 빌드를 일으키지 않는다
		QCOMPARE(registry_->status("E1").state, IndexState::Absent);
	}

	void expiredDeadlineTimesOut()
	{
		for (int i = 0; i < 3000; ++i)
			ingest_->ingestEmbedding("big", QStringLiteral("p%1").arg(i), mix(D, 0, 1, 0.0005 * i));

		QueryControl ctl;
		ctl.deadline = QDeadlineTimer(0);
		registry_->getOrBuild("big");
		QVERIFY_THROWS_EXCEPTION(OperationTimeoutError, match_->match("big", unit(D, 0), 5, 0.0f, ctl));
	}

	void compareTwoEmbeddings()
	{
		const auto same = match_->compare(unit(D, 0), unit(D, 0, 2.0f));
		QVERIFY(qAbs(same.similarity - 1.0f) < 1e-5f);
		QVERIFY(same.isMatch);

		const auto diff = match_->compare(unit(D, 0), unit(D, 1), 0.35f);
		QCOMPARE(diff.similarity, 0.0f);
		QVERIFY(!diff.isMatch);

		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError, match_->compare(unit(4, 0), unit(5, 0)));
	}
};

QTEST_GUILESS_MAIN(TestMatchService)
#include "tst_matchservice.moc"
