#pragma once
#include <QObject>
#include <QHash>
#include <QMutex>
#include <QTimer>
#include <QElapsedTimer>
#include <QDeadlineTimer>
#include <functional>
#include <memory>
#include <vector>

#include "include/match_params.hpp"
#include "include/states.hpp"
#include "include/types.hpp"
#include "index/FaceIndex.hpp"

class IVectorRecordStore;

// 이벤트별 FaceIndex 수명 관리
//  - 첫 접근 시 저장소에서 lazy build (이벤트당 1회, 이벤트별 mutex)
//  - idle TTL / 메모리 예산 초과 시 evict (저장소는 그대로, 다음 접근 시 재빌드)
//  - 맵 lock은 조회/삽입/분리에만 잡고, 빌드는 이벤트별 lock에서 수행
class IndexRegistry : public QObject {
	Q_OBJECT
public:
	struct Options {
		int idleTtlMs       = matchparams::IDLE_TTL_MS;
		int maxLiveIndexes  = matchparams::MAX_LIVE_INDEXES;
		int maxTotalEntries = matchparams::MAX_TOTAL_ENTRIES;
	};
	using Clock = std::function<qint64()>;		// 단조 시간(ms)

	IndexRegistry(std::shared_ptr<IVectorRecordStore> store, const Options& opt,
				  QObject* parent = nullptr);
	~IndexRegistry() override;

	void setClock(Clock clock);
	const Options& options() const { return opt_; }
	int dimension() const;

	// READY 인덱스 반환. 없으면 빌드(동시 호출은 한 번의 빌드를 기다림)
	// 저장소 실패: StoreUnavailableError (캐시 안 함), 대기 초과: OperationTimeoutError
	std::shared_ptr<FaceIndex> getOrBuild(const QString& eventId,
										  QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever));

	// 빌드 없이 살아있는 인덱스만
	std::shared_ptr<FaceIndex> peek(const QString& eventId) const;

	// 저장소 반영 후 호출. READY면 바로 반영, BUILDING이면 빌드 완료 시 재적용, 그 외 no-op
	void onIngest(const QString& eventId, const RecordKey& key, const std::vector<float>& vec);
	void onPhotoRemoved(const QString& eventId, const QString& photoId);
	// 사진 단위 교체 (재인제스트). 질의는 교체 전 또는 후 상태만 본다
	void onPhotoReplaced(const QString& eventId, const QString& photoId,
						 const std::vector<IndexEntry>& entries);

	void invalidate(const QString& eventId);
	std::shared_ptr<FaceIndex> rebuild(const QString& eventId,
									   QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever));

	int evictIdle();
	int reclaim(const QString& keep = QString());

	IndexStatus status(const QString& eventId) const;
	std::vector<IndexStatus> statuses() const;
	int liveCount() const;

	void startSweep(int intervalMs = matchparams::SWEEP_INTERVAL_MS);
	void stopSweep();

private:
	struct PendingOp {
		enum class Kind { Add, RemovePhoto, ReplacePhoto } kind = Kind::Add;
		RecordKey key;
		std::vector<float> vec;
		std::vector<IndexEntry> entries;		// ReplacePhoto
	};

	struct Slot {
		QMutex buildMutex;						// 이벤트별 빌드 직렬화
		mutable QMutex mu;						// 아래 필드 보호
		IndexState state = IndexState::Absent;
		std::shared_ptr<FaceIndex> index;
		qint64 lastUsedMs = 0;
		bool detached = false;					// invalidate/evict 후 맵에서 분리됨
		std::vector<PendingOp> pending;			// BUILDING 중 들어온 변경
	};

	std::shared_ptr<Slot> acquireSlot(const QString& eventId);
	std::shared_ptr<Slot> findSlot(const QString& eventId) const;
	std::shared_ptr<FaceIndex> buildInto(const QString& eventId, const std::shared_ptr<Slot>& slot);
	static void detach(Slot& s);		// s.mu 보유 상태
	qint64 now() const;
	void sweep();

	std::shared_ptr<IVectorRecordStore> store_;
	Options opt_;
	Clock clock_;
	QElapsedTimer monotonic_;

	mutable QMutex mapMutex_;
	QHash<QString, std::shared_ptr<Slot>> slots_;

	QTimer sweepTimer_;
};
