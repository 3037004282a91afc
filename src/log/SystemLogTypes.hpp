#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

struct SystemLogEntry {
    SysLogLevel level;
    QString tag;        // 예: "STORE", "REG", "INGEST", "MATCH", "HTTP"
    QString message;
    QDateTime ts;
    QString extra;
};

// system_logs 테이블에서 읽은 한 행 (/api/v2/logs 응답용)
struct SystemLogRow {
    int id{};
    SysLogLevel level = SysLogLevel::Info;
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

Q_DECLARE_METATYPE(SystemLogEntry)
