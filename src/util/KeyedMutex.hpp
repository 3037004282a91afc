#pragma once
#include <QHash>
#include <QMutex>
#include <QString>
#include <memory>

// 키별 mutex. 사용 중인 키만 맵에 남는다 (참조 카운트)
class KeyedMutex {
public:
	class Guard {
	public:
		Guard(KeyedMutex* owner, const QString& key, std::shared_ptr<QMutex> m)
			: owner_(owner), key_(key), m_(std::move(m)) { m_->lock(); }
		~Guard() {
			m_->unlock();
			owner_->release(key_);
		}
		Guard(const Guard&) = delete;
		Guard& operator=(const Guard&) = delete;

	private:
		KeyedMutex* owner_;
		QString key_;
		std::shared_ptr<QMutex> m_;
	};

	std::unique_ptr<Guard> lock(const QString& key) {
		std::shared_ptr<QMutex> m;
		{
			QMutexLocker lk(&mapMutex_);
			auto& e = entries_[key];
			if (!e.m) e.m = std::make_shared<QMutex>();
			++e.refs;
			m = e.m;
		}
		return std::make_unique<Guard>(this, key, std::move(m));
	}

	int size() const {
		QMutexLocker lk(&mapMutex_);
		return static_cast<int>(entries_.size());
	}

private:
	struct Entry {
		std::shared_ptr<QMutex> m;
		int refs = 0;
	};

	void release(const QString& key) {
		QMutexLocker lk(&mapMutex_);
		auto it = entries_.find(key);
		if (it != entries_.end() && --it->refs == 0) entries_.erase(it);
	}

	mutable QMutex mapMutex_;
	QHash<QString, Entry> entries_;
};
