#include <QtTest>
#include <atomic>

#include "index/FaceIndex.hpp"
#include "include/errors.hpp"
#include "fakes/TestVectors.hpp"

using testvec::unit;
using testvec::mix;

class TestFaceIndex : public QObject {
	Q_OBJECT

	static constexpr int D = 8;

	static RecordKey key(const QString& photo, int slot = 0) {
		return RecordKey{QStringLiteral("E1"), photo, slot};
	}

private slots:
	void emptyIndexReturnsNothing()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		QCOMPARE(idx.size(), 0);
		QVERIFY(idx.query(unit(D, 0), 5, -1.0f).empty());
	}

	void selfQueryScoresOne()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("p1"), mix(D, 0, 1, 0.3));
		idx.add(key("p2"), unit(D, 2, 3.0f));
		idx.add(key("p3"), mix(D, 3, 4, 1.0));

		const auto hits = idx.query(unit(D, 2, 3.0f), 1, -1.0f);
		QCOMPARE(int(hits.size()), 1);
		QCOMPARE(hits[0].key, key("p2"));
		QVERIFY(qAbs(hits[0].score - 1.0f) < 1e-5f);
	}

	void thresholdFiltersLowScores()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("a"), mix(D, 0, 1, 0.1));		// cos 0.995
		idx.add(key("b"), mix(D, 0, 1, 1.0));		// cos 0.540
		idx.add(key("c"), unit(D, 1));				// cos 0

		const auto hits = idx.query(unit(D, 0), 10, 0.5f);
		QCOMPARE(int(hits.size()), 2);
		for (const auto& h : hits) QVERIFY(h.score >= 0.5f);
		QCOMPARE(hits[0].key, key("a"));
		QCOMPARE(hits[1].key, key("b"));
	}

	void topKIsPrefixStable()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		for (int i = 0; i < 20; ++i) {
			idx.add(key(QStringLiteral("p%1").arg(i)), mix(D, 0, 1, 0.05 * i));
		}
		const auto small = idx.query(unit(D, 0), 3, -1.0f);
		const auto large = idx.query(unit(D, 0), 10, -1.0f);
		QCOMPARE(int(small.size()), 3);
		QCOMPARE(int(large.size()), 10);
		for (size_t i = 0; i < small.size(); ++i) QCOMPARE(small[i].key, large[i].key);
	}

	void tiesBreakByInsertionOrder()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("second"), unit(D, 0));
		idx.add(key("first"), unit(D, 0));
		idx.add(key("third"), unit(D, 0));

		const auto hits = idx.query(unit(D, 0), 3, 0.0f);
		QCOMPARE(int(hits.size()), 3);
		QCOMPARE(hits[0].key.photoId, QStringLiteral("second"));
		QCOMPARE(hits[1].key.photoId, QStringLiteral("first"));
		QCOMPARE(hits[2].key.photoId, QStringLiteral("third"));
	}

	void buildIsOrderIndependentForResultSet()
	{
		std::vector<IndexEntry> entries = {
			{key("a"), mix(D, 0, 1, 0.2)},
			{key("b"), mix(D, 0, 1, 0.6)},
			{key("c"), mix(D, 0, 1, 1.2)},
		};
		FaceIndex x(QStringLiteral("E1"), D);
		x.build(entries);
		std::reverse(entries.begin(), entries.end());
		FaceIndex y(QStringLiteral("E1"), D);
		y.build(entries);

		const auto hx = x.query(unit(D, 0), 3, -1.0f);
		const auto hy = y.query(unit(D, 0), 3, -1.0f);
		QCOMPARE(hx.size(), hy.size());
		for (size_t i = 0; i < hx.size(); ++i) {
			QCOMPARE(hx[i].key, hy[i].key);
			QCOMPARE(hx[i].score, hy[i].score);
		}
	}

	void buildReplacesPreviousContents()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("old"), unit(D, 0));
		idx.build({{key("new"), unit(D, 1)}});
		QCOMPARE(idx.size(), 1);
		QVERIFY(!idx.contains(key("old")));
		QVERIFY(idx.contains(key("new")));
	}

	void addReplacesSameKey()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("p1"), unit(D, 0));
		idx.add(key("p1"), unit(D, 1));
		QCOMPARE(idx.size(), 1);
		const auto hits = idx.query(unit(D, 0), 5, 0.5f);
		QVERIFY(hits.empty());
	}

	void removeAndVersion()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		const quint64 v0 = idx.version();
		idx.add(key("p1"), unit(D, 0));
		idx.add(key("p2"), unit(D, 1));
		QVERIFY(idx.version() > v0);

		const quint64 v1 = idx.version();
		idx.remove(key("p1"));
		QVERIFY(idx.version() > v1);
		QCOMPARE(idx.size(), 1);

		const quint64 v2 = idx.version();
		idx.remove(key("missing"));			// no-op
		QCOMPARE(idx.size(), 1);
		QVERIFY(idx.version() > v2);
		QVERIFY(idx.contains(key("p2")));
	}

	void removePhotoDropsAllSlots()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("p1", 0), unit(D, 0));
		idx.add(key("p1", 1), unit(D, 1));
		idx.add(key("p2", 0), unit(D, 2));
		QCOMPARE(idx.removePhoto(QStringLiteral("p1")), 2);
		QCOMPARE(idx.size(), 1);
		QVERIFY(idx.contains(key("p2", 0)));
	}

	void replacePhotoSwapsAllSlotsAtOnce()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("p1", 0), unit(D, 0));
		idx.add(key("p1", 1), unit(D, 1));
		idx.add(key("p1", 2), unit(D, 2));
		idx.add(key("p2", 0), unit(D, 3));

		const quint64 v0 = idx.version();
		idx.replacePhoto(QStringLiteral("p1"), {{key("p1", 0), unit(D, 4)}, {key("p1", 1), unit(D, 5)}});
		QCOMPARE(idx.version(), v0 + 1);
		QCOMPARE(idx.size(), 3);
		QVERIFY(!idx.contains(key("p1", 2)));
		QCOMPARE(int(idx.query(unit(D, 0), 5, 0.5f).size()), 0);
		QCOMPARE(idx.query(unit(D, 5), 1, 0.5f)[0].key, key("p1", 1));

		// 빈 목록 = 사진 제거
		idx.replacePhoto(QStringLiteral("p1"), {});
		QCOMPARE(idx.size(), 1);

		QVERIFY_THROWS_EXCEPTION(ValidationError,
								 idx.replacePhoto(QStringLiteral("p1"), {{key("p2", 0), unit(D, 0)}}));
		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError,
								 idx.replacePhoto(QStringLiteral("p1"), {{key("p1", 0), unit(D + 1, 0)}}));
		QCOMPARE(idx.size(), 1);
	}

	void zeroNormScoresZero()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("zero"), std::vector<float>(D, 0.0f));
		const auto hits = idx.query(unit(D, 0), 1, -1.0f);
		QCOMPARE(int(hits.size()), 1);
		QCOMPARE(hits[0].score, 0.0f);

		QVERIFY(idx.query(std::vector<float>(D, 0.0f), 1, 0.1f).empty());
	}

	void dimensionMismatchThrows()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		idx.add(key("p1"), unit(D, 0));
		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError, idx.query(std::vector<float>(D + 1, 1.0f), 1, 0.0f));
		QVERIFY_THROWS_EXCEPTION(DimensionMismatchError, idx.add(key("p2"), std::vector<float>(D - 1, 1.0f)));
		QVERIFY_THROWS_EXCEPTION(ValidationError, idx.query(unit(D, 0), 0, 0.0f));
	}

	void cancelledQueryThrows()
	{
		FaceIndex idx(QStringLiteral("E1"), D);
		std::vector<IndexEntry> entries;
		for (int i = 0; i < 5000; ++i) entries.push_back({key(QString::number(i)), unit(D, i % D)});
		idx.build(entries);

		std::atomic<bool> cancel{true};
		QueryControl ctl;
		ctl.cancel = &cancel;
		QVERIFY_THROWS_EXCEPTION(OperationCancelledError, idx.query(unit(D, 0), 5, 0.0f, ctl));

		QueryControl expired;
		expired.deadline = QDeadlineTimer(0);
		QVERIFY_THROWS_EXCEPTION(OperationTimeoutError, idx.query(unit(D, 0), 5, 0.0f, expired));
	}
};

QTEST_GUILESS_MAIN(TestFaceIndex)
#include "tst_faceindex.moc"
