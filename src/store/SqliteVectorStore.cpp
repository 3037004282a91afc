#include "store/SqliteVectorStore.hpp"
#include "store/SqlCommon.hpp"
#include "include/errors.hpp"
#include "log/eventface_logging.hpp"

#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>
#include <cstring>

using namespace SqlCommon;

SqliteVectorStore::SqliteVectorStore(const QString& dbFilePath, int dim)
	: dbPath_(dbFilePath.isEmpty() ? defaultDbFilePath() : dbFilePath), dim_(dim)
{
}

SqliteVectorStore::~SqliteVectorStore()
{
	// 현재 스레드 커넥션만 정리 가능 (다른 스레드 커넥션은 그 스레드 종료 시 정리)
	currentThreadConnections().release(connectionNameForCurrentThread(dbPath_));
}

QSqlDatabase SqliteVectorStore::openConnection() const
{
	const QString name = connectionNameForCurrentThread(dbPath_);
	QSqlDatabase db;

	if (!QSqlDatabase::contains(name)) {
		db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
		db.setDatabaseName(dbPath_);
		currentThreadConnections().track(name);
	} else {
		db = QSqlDatabase::database(name, /*open=*/false);
		if (db.databaseName().isEmpty())
			db.setDatabaseName(dbPath_);
	}

	if (!db.isOpen() && !db.open()) {
		qCCritical(LC_STORE) << "[SQL] DB open failed:" << db.lastError().text()
							 << " path=" << db.databaseName()
							 << " drivers=" << QSqlDatabase::drivers();
	}
	return db;
}

QSqlDatabase SqliteVectorStore::requireConnection(const char* op) const
{
	QSqlDatabase db = openConnection();
	if (!db.isOpen()) {
		throw StoreUnavailableError(QStringLiteral("%1: cannot open %2 (%3)")
										.arg(QLatin1String(op), dbPath_, db.lastError().text()));
	}
	return db;
}

void SqliteVectorStore::checkKey(const QString& eventId, const QString& photoId) const
{
	if (eventId.isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));
	if (photoId.isEmpty()) throw ValidationError(QStringLiteral("photo_id is required"));
}

bool SqliteVectorStore::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
	if (dim_ <= 0) {
		qCCritical(LC_STORE) << "[SQL] invalid embedding dimension:" << dim_;
		return false;
	}
	if (!ensureParentDir(dbPath_)) {
		qCCritical(LC_STORE) << "[SQL] cannot create directory for" << dbPath_;
		return false;
	}

	QSqlDatabase db = openConnection();
	if (!db.isOpen()) {
		qCCritical(LC_STORE) << "[SQL] Open failed:" << db.lastError().text()
							 << " path=" << db.databaseName();
		return false;
	}

	{   // 신뢰성 옵션
		QSqlQuery pragma(db);
		pragma.exec("PRAGMA journal_mode=WAL;");
		pragma.exec("PRAGMA synchronous=NORMAL;");
	}

	QSqlQuery q(db);

	// 얼굴 임베딩
	if (!q.exec(
		"CREATE TABLE IF NOT EXISTS face_embeddings ("
		"event_id   TEXT    NOT NULL, "
		"photo_id   TEXT    NOT NULL, "
		"face_slot  INTEGER NOT NULL, "
		"dim        INTEGER NOT NULL, "
		"vector     BLOB    NOT NULL, "
		"source_ref TEXT, "
		"det_score  REAL, "
		"created_at TEXT    NOT NULL, "
		"PRIMARY KEY (event_id, photo_id, face_slot))"
	)) {
		qCCritical(LC_STORE) << "Failed to create face_embeddings:" << q.lastError().text();
		return false;
	}

	// 시스템로그
	if (!q.exec(
		"CREATE TABLE IF NOT EXISTS system_logs ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"level INTEGER NOT NULL, "
		"tag TEXT, "
		"message TEXT NOT NULL, "
		"timestamp TEXT NOT NULL, "
		"extra TEXT)"
	)) {
		qCCritical(LC_STORE) << "Failed to create system_logs:" << q.lastError().text();
		return false;
	}

	if (!q.exec("CREATE TABLE IF NOT EXISTS store_meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)")) {
		qCCritical(LC_STORE) << "Failed to create store_meta:" << q.lastError().text();
		return false;
	}

	// 인덱스
	q.exec("CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)");
	q.exec("CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)");
	q.exec("CREATE INDEX IF NOT EXISTS idx_sys_tag   ON system_logs(tag)");

	// 배포 단위 차원 고정: 이미 기록된 차원과 다르면 거부
	QSqlQuery qd(db);
	qd.prepare("SELECT value FROM store_meta WHERE key = 'dim'");
	if (!qd.exec()) {
		qCCritical(LC_STORE) << "[SQL] read store_meta failed:" << qd.lastError().text();
		return false;
	}
	if (qd.next()) {
		const int stored = qd.value(0).toInt();
		if (stored != dim_) {
			qCCritical(LC_STORE) << "[SQL] dimension mismatch: store has" << stored
								 << "configured" << dim_ << " path=" << dbPath_;
			return false;
		}
	} else {
		QSqlQuery qi(db);
		qi.prepare("INSERT INTO store_meta (key, value) VALUES ('dim', ?)");
		qi.addBindValue(QString::number(dim_));
		if (!qi.exec()) {
			qCCritical(LC_STORE) << "[SQL] write store_meta failed:" << qi.lastError().text();
			return false;
		}
	}

	qCInfo(LC_STORE) << "[SQL] Database opened & schema ready. path=" << db.databaseName()
					 << " driver=" << db.driverName() << " dim=" << dim_;
	return true;
}

bool SqliteVectorStore::ping() const
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = openConnection();
	if (!db.isOpen()) return false;
	QSqlQuery q(db);
	return q.exec("SELECT 1") && q.next();
}

QByteArray SqliteVectorStore::encodeVector(const std::vector<float>& v)
{
	return QByteArray(reinterpret_cast<const char*>(v.data()),
					  static_cast<qsizetype>(v.size() * sizeof(float)));
}

bool SqliteVectorStore::decodeVector(const QByteArray& blob, int dim, std::vector<float>& out)
{
	if (dim <= 0 || blob.size() != static_cast<qsizetype>(dim * sizeof(float))) return false;
	out.resize(static_cast<size_t>(dim));
	std::memcpy(out.data(), blob.constData(), static_cast<size_t>(blob.size()));
	return true;
}

void SqliteVectorStore::upsert(const QString& eventId, const QString& photoId,
							   const std::vector<FaceEmbedding>& faces,
							   const QString& sourceRef)
{
	checkKey(eventId, photoId);
	for (const auto& f : faces) {
		if (static_cast<int>(f.vector.size()) != dim_)
			throw DimensionMismatchError(dim_, static_cast<int>(f.vector.size()));
	}

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("upsert");

	if (!db.transaction()) {
		throw StoreUnavailableError(QStringLiteral("upsert: begin failed (%1)").arg(db.lastError().text()));
	}

	QSqlQuery del(db);
	del.prepare("DELETE FROM face_embeddings WHERE event_id = ? AND photo_id = ?");
	del.addBindValue(eventId);
	del.addBindValue(photoId);
	if (!del.exec()) {
		const QString err = del.lastError().text();
		db.rollback();
		throw StoreUnavailableError(QStringLiteral("upsert: delete failed (%1)").arg(err));
	}

	const QString now = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
	QSqlQuery ins(db);
	ins.prepare("INSERT INTO face_embeddings "
				"(event_id, photo_id, face_slot, dim, vector, source_ref, det_score, created_at) "
				"VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
	for (int slot = 0; slot < static_cast<int>(faces.size()); ++slot) {
		const auto& f = faces[static_cast<size_t>(slot)];
		ins.bindValue(0, eventId);
		ins.bindValue(1, photoId);
		ins.bindValue(2, slot);
		ins.bindValue(3, dim_);
		ins.bindValue(4, encodeVector(f.vector));
		ins.bindValue(5, sourceRef);
		ins.bindValue(6, double(f.detScore));
		ins.bindValue(7, now);
		if (!ins.exec()) {
			const QString err = ins.lastError().text();
			db.rollback();
			throw StoreUnavailableError(QStringLiteral("upsert: insert failed (%1)").arg(err));
		}
	}

	if (!db.commit()) {
		const QString err = db.lastError().text();
		db.rollback();
		throw StoreUnavailableError(QStringLiteral("upsert: commit failed (%1)").arg(err));
	}

	qCDebug(LC_STORE) << "[SQL] upsert" << eventId << photoId << "faces=" << int(faces.size());
}

void SqliteVectorStore::deletePhoto(const QString& eventId, const QString& photoId)
{
	checkKey(eventId, photoId);

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("deletePhoto");

	QSqlQuery q(db);
	q.prepare("DELETE FROM face_embeddings WHERE event_id = ? AND photo_id = ?");
	q.addBindValue(eventId);
	q.addBindValue(photoId);
	if (!q.exec()) {
		throw StoreUnavailableError(QStringLiteral("deletePhoto failed (%1)").arg(q.lastError().text()));
	}
	qCDebug(LC_STORE) << "[SQL] deletePhoto" << eventId << photoId << "rows=" << q.numRowsAffected();
}

void SqliteVectorStore::deleteEvent(const QString& eventId)
{
	if (eventId.isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("deleteEvent");

	QSqlQuery q(db);
	q.prepare("DELETE FROM face_embeddings WHERE event_id = ?");
	q.addBindValue(eventId);
	if (!q.exec()) {
		throw StoreUnavailableError(QStringLiteral("deleteEvent failed (%1)").arg(q.lastError().text()));
	}
	qCInfo(LC_STORE) << "[SQL] deleteEvent" << eventId << "rows=" << q.numRowsAffected();
}

void SqliteVectorStore::listVectors(const QString& eventId, const Visitor& visit) const
{
	if (eventId.isEmpty()) throw ValidationError(QStringLiteral("event_id is required"));

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("listVectors");

	QSqlQuery q(db);
	q.setForwardOnly(true);
	q.prepare("SELECT photo_id, face_slot, dim, vector FROM face_embeddings "
			  "WHERE event_id = ? ORDER BY photo_id, face_slot");
	q.addBindValue(eventId);
	if (!q.exec()) {
		throw StoreUnavailableError(QStringLiteral("listVectors failed (%1)").arg(q.lastError().text()));
	}

	std::vector<float> vec;
	while (q.next()) {
		RecordKey key{eventId, q.value(0).toString(), q.value(1).toInt()};
		const int dim = q.value(2).toInt();
		if (dim != dim_ || !decodeVector(q.value(3).toByteArray(), dim, vec)) {
			qCWarning(LC_STORE) << "[SQL] skip corrupt row" << key.toString() << "dim=" << dim;
			continue;
		}
		visit(key, vec);
	}
}

std::vector<EmbeddingRecord> SqliteVectorStore::photoRecords(const QString& eventId,
															 const QString& photoId) const
{
	checkKey(eventId, photoId);

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("photoRecords");

	QSqlQuery q(db);
	q.prepare("SELECT face_slot, dim, vector, source_ref, det_score, created_at "
			  "FROM face_embeddings WHERE event_id = ? AND photo_id = ? ORDER BY face_slot");
	q.addBindValue(eventId);
	q.addBindValue(photoId);
	if (!q.exec()) {
		throw StoreUnavailableError(QStringLiteral("photoRecords failed (%1)").arg(q.lastError().text()));
	}

	std::vector<EmbeddingRecord> out;
	while (q.next()) {
		EmbeddingRecord r;
		r.key = RecordKey{eventId, photoId, q.value(0).toInt()};
		if (!decodeVector(q.value(2).toByteArray(), q.value(1).toInt(), r.vector)) continue;
		r.sourceRef = q.value(3).toString();
		r.detScore  = float(q.value(4).toDouble());
		r.createdAt = QDateTime::fromString(q.value(5).toString(), Qt::ISODateWithMs);
		out.push_back(std::move(r));
	}
	return out;
}

int SqliteVectorStore::countVectors(const QString& eventId) const
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("countVectors");

	QSqlQuery q(db);
	q.prepare("SELECT COUNT(*) FROM face_embeddings WHERE event_id = ?");
	q.addBindValue(eventId);
	if (!q.exec() || !q.next()) {
		throw StoreUnavailableError(QStringLiteral("countVectors failed (%1)").arg(q.lastError().text()));
	}
	return q.value(0).toInt();
}

QStringList SqliteVectorStore::listEvents() const
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = requireConnection("listEvents");

	QSqlQuery q(db);
	if (!q.exec("SELECT DISTINCT event_id FROM face_embeddings ORDER BY event_id")) {
		throw StoreUnavailableError(QStringLiteral("listEvents failed (%1)").arg(q.lastError().text()));
	}
	QStringList out;
	while (q.next()) out << q.value(0).toString();
	return out;
}

bool SqliteVectorStore::insertSystemLog(int level, const QString& tag, const QString& message,
										const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = openConnection();
	if (!db.isOpen()) {
		qCCritical(LC_STORE) << "[SQL] DB open failed:" << db.lastError().text();
		return false;
	}

	QSqlQuery q(db);
	q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
			  "VALUES (?, ?, ?, ?, ?)");
	q.addBindValue(level);
	q.addBindValue(tag);
	q.addBindValue(message);
	q.addBindValue(timestamp.toString(Qt::ISODateWithMs));
	q.addBindValue(extra);

	if (!q.exec()) {
		qCCritical(LC_STORE) << "Insert system log failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool SqliteVectorStore::selectSystemLogs(int offset, int limit,
										 int minLevel, const QString& tagLike, const QString& sinceIso,
										 QVector<SystemLogRow>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = openConnection();
	if (!db.isOpen()) return false;

	QString where = "WHERE level >= ?";
	QList<QVariant> binds; binds << minLevel;

	if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";      binds << ("%" + tagLike + "%"); }
	if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?";  binds << sinceIso; }

	// total
	QSqlQuery qc(db);
	qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
	for (auto& v : binds) qc.addBindValue(v);
	if (!qc.exec() || !qc.next()) return false;
	if (outTotal) *outTotal = qc.value(0).toInt();

	// rows
	QSqlQuery q(db);
	q.prepare("SELECT id, level, tag, message, timestamp, extra "
			  "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
	for (auto& v : binds) q.addBindValue(v);
	q.addBindValue(limit);
	q.addBindValue(offset);

	if (!q.exec()) return false;

	if (outRows) {
		outRows->clear();
		while (q.next()) {
			SystemLogRow r;
			r.id        = q.value(0).toInt();
			r.level     = static_cast<SysLogLevel>(q.value(1).toInt());
			r.tag       = q.value(2).toString();
			r.message   = q.value(3).toString();
			r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
			r.extra     = q.value(5).toString();
			outRows->push_back(r);
		}
	}
	return true;
}

bool SqliteVectorStore::deleteSysLogs()
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = openConnection();
	if (!db.isOpen()) {
		qCCritical(LC_STORE) << "[SQL] DB open failed:" << db.lastError().text();
		return false;
	}

	QSqlQuery q(db);
	if (!q.exec("DELETE FROM system_logs;")) {
		qCCritical(LC_STORE) << "[SQL] DELETE FROM system_logs failed:" << q.lastError().text();
		return false;
	}

	if (!q.exec("DELETE FROM sqlite_sequence WHERE name='system_logs';")) {
		qCWarning(LC_STORE) << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
	}
	return true;
}
