#pragma once
#include <cmath>
#include <vector>

namespace testvec {

// i번째 축 단위벡터
inline std::vector<float> unit(int dim, int axis, float scale = 1.0f)
{
	std::vector<float> v(static_cast<size_t>(dim), 0.0f);
	v[static_cast<size_t>(axis)] = scale;
	return v;
}

// 두 축 사이 각도 theta 인 단위벡터 (axis a 와의 cosine = cos(theta))
inline std::vector<float> mix(int dim, int a, int b, double theta)
{
	std::vector<float> v(static_cast<size_t>(dim), 0.0f);
	v[static_cast<size_t>(a)] = static_cast<float>(std::cos(theta));
	v[static_cast<size_t>(b)] = static_cast<float>(std::sin(theta));
	return v;
}

} // namespace testvec
