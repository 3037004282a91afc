#pragma once
#include <stdexcept>
#include <string>
#include <QString>

// 에러 분류
//  - ValidationError / DimensionMismatchError : 잘못된 입력, 재시도 없음
//  - EmbeddingProviderError / ImageFetchError : 외부 계산/다운로드 실패, 재시도 가능
//  - StoreUnavailableError                    : 영속 저장소 접근 불가, 재시도 가능
//  - OperationTimeoutError / OperationCancelledError : 호출측 데드라인/취소
class EventFaceError : public std::runtime_error {
public:
	explicit EventFaceError(const QString& msg)
		: std::runtime_error(msg.toStdString()), what_(msg.toStdString()) {}

	const char* what() const noexcept override { return what_.c_str(); }
	virtual const char* code() const noexcept { return "internal_error"; }

	QString message() const { return QString::fromStdString(what_); }

	// 같은 동적 타입으로 다시 던지기 전에 문맥(event/photo) 추가
	void addContext(const QString& ctx) { what_ = ctx.toStdString() + ": " + what_; }

private:
	std::string what_;
};

class ValidationError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "validation_error"; }
};

class DimensionMismatchError : public ValidationError {
public:
	DimensionMismatchError(int expected, int actual)
		: ValidationError(QStringLiteral("dimension mismatch: expected %1, got %2").arg(expected).arg(actual)),
		  expected_(expected), actual_(actual) {}
	const char* code() const noexcept override { return "dimension_mismatch"; }

	int expected() const { return expected_; }
	int actual() const { return actual_; }

private:
	int expected_;
	int actual_;
};

class EmbeddingProviderError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "embedding_provider_error"; }
};

class ImageFetchError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "image_fetch_error"; }
};

class StoreUnavailableError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "store_unavailable"; }
};

class OperationTimeoutError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "timeout"; }
};

class OperationCancelledError : public EventFaceError {
public:
	using EventFaceError::EventFaceError;
	const char* code() const noexcept override { return "cancelled"; }
};
