#pragma once
#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QThreadStorage>
#include <atomic>

#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("eventface"); }

	inline QString defaultDbFilePath()
	{
		return QStringLiteral(DB_PATH) + QStringLiteral(DB);
	}

	inline bool ensureParentDir(const QString& dbFilePath)
	{
		const QFileInfo fi(dbFilePath);
		return QDir().mkpath(fi.absolutePath());
	}

	// 스레드 수명 단위 커넥션 목록. 스레드 종료 시 QThreadStorage 가 지우면서
	// 그 스레드가 연 커넥션을 닫고 제거한다 (풀 스레드의 thread id 재사용과 무관)
	class ThreadConnections {
	public:
		ThreadConnections() : token_(nextToken()) {}
		~ThreadConnections()
		{
			for (const auto& name : names_) close(name);
		}

		quint64 token() const { return token_; }
		void track(const QString& name) { if (!names_.contains(name)) names_ << name; }

		void release(const QString& name)
		{
			names_.removeAll(name);
			close(name);
		}

	private:
		static quint64 nextToken()
		{
			static std::atomic<quint64> counter{0};
			return ++counter;
		}

		static void close(const QString& name)
		{
			if (!QSqlDatabase::contains(name)) return;
			{
				QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
				db.close();
			}
			QSqlDatabase::removeDatabase(name);
		}

		quint64 token_;
		QStringList names_;
	};

	inline ThreadConnections& currentThreadConnections()
	{
		static QThreadStorage<ThreadConnections*> storage;
		if (!storage.hasLocalData()) storage.setLocalData(new ThreadConnections);
		return *storage.localData();
	}

	// 같은 스레드에서 여러 DB 파일을 열 수 있도록 경로 해시를 이름에 포함
	inline QString connectionNameForCurrentThread(const QString& dbFilePath)
	{
		const QByteArray h = QCryptographicHash::hash(dbFilePath.toUtf8(), QCryptographicHash::Sha1).toHex().left(12);
		return QString("%1_%2_%3").arg(baseConnName())
								  .arg(QString::fromLatin1(h))
								  .arg(currentThreadConnections().token());
	}
} // namespace SqlCommon
