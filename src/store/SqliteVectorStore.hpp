#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "log/SystemLogTypes.hpp"
#include "store/IVectorRecordStore.hpp"

class QSqlDatabase;

// QSQLITE 기반 벡터 레코드 저장소 + 운영 로그(system_logs)
// 스레드마다 별도 커넥션, 모든 접근은 dbMutex로 직렬화
class SqliteVectorStore : public IVectorRecordStore {
public:
	SqliteVectorStore(const QString& dbFilePath, int dim);
	~SqliteVectorStore() override;

	// 스키마 생성 + 차원 고정 확인. 실패 시 false
	bool initializeDatabase();
	bool ping() const;

	const QString& dbFilePath() const { return dbPath_; }

	// IVectorRecordStore
	int dimension() const override { return dim_; }
	void upsert(const QString& eventId, const QString& photoId,
				const std::vector<FaceEmbedding>& faces,
				const QString& sourceRef = QString()) override;
	void deletePhoto(const QString& eventId, const QString& photoId) override;
	void deleteEvent(const QString& eventId) override;
	void listVectors(const QString& eventId, const Visitor& visit) const override;
	std::vector<EmbeddingRecord> photoRecords(const QString& eventId,
											  const QString& photoId) const override;
	int countVectors(const QString& eventId) const override;
	QStringList listEvents() const override;

	// 시스템로그
	bool insertSystemLog(int level, const QString& tag, const QString& message,
						 const QDateTime& timestamp, const QString& extra = QString());
	bool selectSystemLogs(int offset, int limit,
						  int minLevel, const QString& tagLike, const QString& sinceIso,
						  QVector<SystemLogRow>* outRows,
						  int* outTotal);
	bool deleteSysLogs();

	static QByteArray encodeVector(const std::vector<float>& v);
	static bool decodeVector(const QByteArray& blob, int dim, std::vector<float>& out);

private:
	QSqlDatabase openConnection() const;
	QSqlDatabase requireConnection(const char* op) const;
	void checkKey(const QString& eventId, const QString& photoId) const;

	QString dbPath_;
	int dim_;
	mutable QMutex dbMutex;
};
