#pragma once
#include <QObject>
#include <QString>

// 이벤트별 인덱스 상태: ABSENT -> BUILDING -> READY -> (evicted) -> ABSENT
enum class IndexState {
	Absent = 0,
	Building,
	Ready
};

inline QString indexStateName(IndexState s)
{
	switch (s) {
		case IndexState::Absent:   return QStringLiteral("ABSENT");
		case IndexState::Building: return QStringLiteral("BUILDING");
		case IndexState::Ready:    return QStringLiteral("READY");
	}
	return QStringLiteral("UNKNOWN");
}

struct IndexStatus {
	QString    eventId;
	IndexState state   = IndexState::Absent;
	int        entries = 0;
	quint64    version = 0;
	qint64     idleMs  = 0;
};

Q_DECLARE_METATYPE(IndexState)
