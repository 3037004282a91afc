#include <QtTest>
#include <QTemporaryDir>
#include <QtConcurrent/QtConcurrentRun>
#include <QFuture>
#include <atomic>

#include "index/IndexRegistry.hpp"
#include "store/SqliteVectorStore.hpp"
#include "include/errors.hpp"
#include "fakes/FlakyStore.hpp"
#include "fakes/TestVectors.hpp"

using testvec::unit;

class TestIndexRegistry : public QObject {
	Q_OBJECT

	static constexpr int D = 8;
	QTemporaryDir tmp_;
	int seq_ = 0;

	std::shared_ptr<SqliteVectorStore> sqlite_;
	std::shared_ptr<FlakyStore> store_;
	std::atomic<qint64> clock_{0};

	std::unique_ptr<IndexRegistry> makeRegistry(IndexRegistry::Options opt = IndexRegistry::Options()) {
		auto r = std::make_unique<IndexRegistry>(store_, opt);
		r->setClock([this] { return clock_.load(); });
		return r;
	}

private slots:
	void initTestCase()
	{
		QVERIFY(tmp_.isValid());
	}

	void init()
	{
		sqlite_ = std::make_shared<SqliteVectorStore>(tmp_.filePath(QStringLiteral("r%1.db").arg(++seq_)), D);
		QVERIFY(sqlite_->initializeDatabase());
		store_ = std::make_shared<FlakyStore>(sqlite_);
		clock_ = 0;
	}

	void buildsLazilyFromStore()
	{
		store_->upsert("E1", "p1", toFaces({unit(D, 0), unit(D, 1)}), QString());
		store_->upsert("E1", "p2", toFaces({unit(D, 2)}), QString());
		auto reg = makeRegistry();

		QCOMPARE(reg->status("E1").state, IndexState::Absent);
		QVERIFY(!reg->peek("E1"));

		auto idx = reg->getOrBuild("E1");
		QVERIFY(idx);
		QCOMPARE(idx->size(), 3);
		QCOMPARE(reg->status("E1").state, IndexState::Ready);
		QCOMPARE(reg->status("E1").entries, 3);
		QCOMPARE(reg->peek("E1"), idx);
		QCOMPARE(reg->getOrBuild("E1"), idx);
		QCOMPARE(store_->listCalls(), 1);
	}

	void emptyEventBuildsEmptyIndex()
	{
		auto reg = makeRegistry();
		auto idx = reg->getOrBuild("nobody");
		QCOMPARE(idx->size(), 0);
		QCOMPARE(reg->status("nobody").state, IndexState::Ready);
	}

	void concurrentFirstAccessBuildsOnce()
	{
		store_->upsert("E1", "p1", toFaces({unit(D, 0)}), QString());
		store_->setListDelayMs(200);
		auto reg = makeRegistry();

		QList<QFuture<std::shared_ptr<FaceIndex>>> fs;
		for (int i = 0; i < 8; ++i) {
			fs << QtConcurrent::run([&reg] { return reg->getOrBuild("E1"); });
		}
		std::shared_ptr<FaceIndex> first;
		for (auto& f : fs) {
			auto idx = f.result();
			QVERIFY(idx);
			if (!first) first = idx;
			QCOMPARE(idx, first);
		}
		QCOMPARE(store_->listCalls(), 1);
	}

	void storeFailureIsNotCached()
	{
		store_->upsert("E1", "p1", toFaces({unit(D, 0)}), QString());
		auto reg = makeRegistry();

		store_->setFailing(true);
		QVERIFY_THROWS_EXCEPTION(StoreUnavailableError, reg->getOrBuild("E1"));
		QCOMPARE(reg->status("E1").state, IndexState::Absent);
		QVERIFY(!reg->peek("E1"));

		store_->setFailing(false);
		auto idx = reg->getOrBuild("E1");
		QCOMPARE(idx->size(), 1);
	}

	void onIngestUpdatesLiveIndexOnly()
	{
		auto reg = makeRegistry();

		// 인덱스 없음: no-op, 슬롯도 만들지 않음
		reg->onIngest("E1", RecordKey{"E1", "p0", 0}, unit(D, 0));
		QCOMPARE(reg->status("E1").state, IndexState::Absent);
		QVERIFY(reg->statuses().empty());

		auto idx = reg->getOrBuild("E1");
		QCOMPARE(idx->size(), 0);
		reg->onIngest("E1", RecordKey{"E1", "p1", 0}, unit(D, 1));
		QCOMPARE(idx->size(), 1);

		reg->onPhotoRemoved("E1", "p1");
		QCOMPARE(idx->size(), 0);

		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError,
								 reg->onIngest("E1", RecordKey{"E1", "p2", 0}, unit(D + 1, 0)));
	}

	void mutationsDuringBuildAreReplayed()
	{
		store_->upsert("E1", "p1", toFaces({unit(D, 0)}), QString());
		store_->upsert("E1", "p2", toFaces({unit(D, 1)}), QString());
		store_->setListDelayMs(300);
		auto reg = makeRegistry();

		auto f = QtConcurrent::run([&reg] { return reg->getOrBuild("E1"); });
		QTRY_COMPARE(reg->status("E1").state, IndexState::Building);

		reg->onIngest("E1", RecordKey{"E1", "p3", 0}, unit(D, 2));
		reg->onPhotoRemoved("E1", "p1");
		reg->onPhotoReplaced("E1", "p2", {{RecordKey{"E1", "p2", 0}, unit(D, 4)},
										  {RecordKey{"E1", "p2", 1}, unit(D, 5)}});

		auto idx = f.result();
		QCOMPARE(idx->size(), 3);
		QVERIFY(idx->contains(RecordKey{"E1", "p3", 0}));
		QVERIFY(idx->contains(RecordKey{"E1", "p2", 1}));
		QVERIFY(!idx->contains(RecordKey{"E1", "p1", 0}));
		QCOMPARE(idx->query(unit(D, 4), 1, 0.99f)[0].key, (RecordKey{"E1", "p2", 0}));
	}

	void waitingForBuildHonoursDeadline()
	{
		store_->setListDelayMs(500);
		auto reg = makeRegistry();

		auto f = QtConcurrent::run([&reg] { return reg->getOrBuild("E1"); });
		QTRY_COMPARE(reg->status("E1").state, IndexState::Building);

		QVERIFY_THROWS_EXCEPTION(OperationTimeoutError, reg->getOrBuild("E1", QDeadlineTimer(50)));
		QVERIFY(f.result());
	}

	void invalidateForcesRebuild()
	{
		store_->upsert("E1", "p1", toFaces({unit(D, 0)}), QString());
		auto reg = makeRegistry();
		auto before = reg->getOrBuild("E1");

		// onIngest 를 거치지 않은 변경
		sqlite_->upsert("E1", "p2", toFaces({unit(D, 1)}));
		QCOMPARE(reg->getOrBuild("E1")->size(), 1);

		reg->invalidate("E1");
		QCOMPARE(reg->status("E1").state, IndexState::Absent);
		auto after = reg->getOrBuild("E1");
		QCOMPARE(after->size(), 2);
		QVERIFY(after != before);
		QCOMPARE(before->size(), 1);		// 예전 handle 은 계속 유효
		QCOMPARE(store_->listCalls(), 2);

		auto rebuilt = reg->rebuild("E1");
		QVERIFY(rebuilt != after);
		QCOMPARE(store_->listCalls(), 3);
	}

	void idleIndexesAreEvicted()
	{
		IndexRegistry::Options opt;
		opt.idleTtlMs = 1000;
		auto reg = makeRegistry(opt);

		store_->upsert("E1", "p1", toFaces({unit(D, 0)}), QString());
		auto held = reg->getOrBuild("E1");
		clock_ = 500;
		reg->getOrBuild("E2");

		clock_ = 1200;
		QCOMPARE(reg->evictIdle(), 1);		// E1 만 idle
		QCOMPARE(reg->status("E1").state, IndexState::Absent);
		QCOMPARE(reg->status("E2").state, IndexState::Ready);

		// 진행 중 질의가 잡고 있는 handle 은 살아 있음
		const auto hits = held->query(unit(D, 0), 1, 0.0f);
		QCOMPARE(int(hits.size()), 1);

		// 저장소는 그대로 -> 재빌드
		QCOMPARE(reg->getOrBuild("E1")->size(), 1);
	}

	void sweepTimerEvicts()
	{
		IndexRegistry::Options opt;
		opt.idleTtlMs = 10;
		auto reg = makeRegistry(opt);
		reg->getOrBuild("E1");
		QCOMPARE(reg->liveCount(), 1);

		clock_ = 100;
		reg->startSweep(20);
		QTRY_COMPARE(reg->liveCount(), 0);
		reg->stopSweep();
	}

	void reclaimEvictsLeastRecentlyUsed()
	{
		IndexRegistry::Options opt;
		opt.maxLiveIndexes = 2;
		auto reg = makeRegistry(opt);

		clock_ = 1; reg->getOrBuild("A");
		clock_ = 2; reg->getOrBuild("B");
		clock_ = 3; reg->getOrBuild("A");		// A 갱신
		clock_ = 4; reg->getOrBuild("C");

		QCOMPARE(reg->liveCount(), 2);
		QCOMPARE(reg->status("B").state, IndexState::Absent);
		QCOMPARE(reg->status("A").state, IndexState::Ready);
		QCOMPARE(reg->status("C").state, IndexState::Ready);
	}

	void reclaimByTotalEntries()
	{
		store_->upsert("A", "p1", toFaces({unit(D, 0), unit(D, 1)}), QString());
		store_->upsert("B", "p1", toFaces({unit(D, 2), unit(D, 3)}), QString());
		IndexRegistry::Options opt;
		opt.maxTotalEntries = 3;
		auto reg = makeRegistry(opt);

		clock_ = 1; reg->getOrBuild("A");
		clock_ = 2; reg->getOrBuild("B");
		QCOMPARE(reg->status("A").state, IndexState::Absent);
		QCOMPARE(reg->status("B").state, IndexState::Ready);
	}

	void statusesListsKnownEvents()
	{
		auto reg = makeRegistry();
		reg->getOrBuild("b");
		reg->getOrBuild("a");
		const auto all = reg->statuses();
		QCOMPARE(int(all.size()), 2);
		QCOMPARE(all[0].eventId, QStringLiteral("a"));
		QCOMPARE(all[1].eventId, QStringLiteral("b"));
		QVERIFY_THROWS_EXCEPTION(ValidationError, reg->getOrBuild(QString()));
	}
};

QTEST_GUILESS_MAIN(TestIndexRegistry)
#include "tst_indexregistry.moc"
