#pragma once
#include <QObject>
#include <QThread>
#include <memory>

#include "SystemLogTypes.hpp"

class SqliteVectorStore;
namespace syslog_detail { class SystemLogWriter; }

// 운영 로그: 워커 스레드에서 system_logs 테이블에 비동기 기록
// init() 전에는 호출이 무시된다 (테스트/도구에서 안전)
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(std::shared_ptr<SqliteVectorStore> store);   // 앱 시작시 1회
    static void shutdown();
    static bool isRunning();

    // 어디서든 한 줄로 호출
    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e); // 워커에게 보냄

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
