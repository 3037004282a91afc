#pragma once

namespace matchparams {
	inline constexpr int    DEFAULT_DIM         = 512;		// ArcFace
	inline constexpr int    DEFAULT_TOP_K       = 20;
	inline constexpr double DEFAULT_MIN_SCORE   = 0.35;

	// 레지스트리
	inline constexpr int    IDLE_TTL_MS         = 30 * 60 * 1000;
	inline constexpr int    SWEEP_INTERVAL_MS   = 60 * 1000;
	inline constexpr int    MAX_LIVE_INDEXES    = 256;
	inline constexpr int    MAX_TOTAL_ENTRIES   = 2000000;

	// 인제스트
	inline constexpr int    EMBED_TIMEOUT_MS    = 20000;
	inline constexpr int    FETCH_TIMEOUT_MS    = 20000;
	inline constexpr int    BATCH_PARALLELISM   = 4;

	// 검출
	inline constexpr double DETECT_THR          = 0.6;
	inline constexpr int    MIN_FACE_PX         = 24;
	inline constexpr int    MAX_FACES_PER_PHOTO = 64;

	// 질의 중 취소/데드라인 확인 주기 (엔트리 수)
	inline constexpr int    CANCEL_CHECK_EVERY  = 1024;
}
