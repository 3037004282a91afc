#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>
#include <atomic>
#include "store/SqliteVectorStore.hpp"
#include "log/SystemLogTypes.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(std::shared_ptr<SqliteVectorStore> store) : store_(std::move(store)) {}

public slots:
    void append(const SystemLogEntry& e) {
        if (!store_) return;
        if (!store_->insertSystemLog(
                static_cast<int>(e.level),
                e.tag,
                e.message,
                e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
                e.extra)) {
            qWarning() << "[SystemLogger] drop entry:" << e.tag << e.message;
        }
    }

private:
    std::shared_ptr<SqliteVectorStore> store_;
};
} // namespace

static std::atomic<bool> s_running{false};

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(std::shared_ptr<SqliteVectorStore> store)
{
    if (s_running.load()) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	auto& inst = instance();
	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("SystemLogWriter"));
	inst.wr = new syslog_detail::SystemLogWriter(std::move(store));
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
    s_running.store(true);
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

    s_running.store(false);
    QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);

	inst.th->quit();
    if (!inst.th->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not stop in time";
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

bool SystemLogger::isRunning() { return s_running.load(); }

static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
    if (!s_running.load(std::memory_order_relaxed)) return;
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit SystemLogger::instance().appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
