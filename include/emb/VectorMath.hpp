#pragma once
#include <cstddef>
#include <vector>

namespace semsearch {

using Vector = std::vector<float>;

// 0 when either norm is 0
float cosine(const float* a, const float* b, size_t dim);
float cosine(const Vector& a, const Vector& b);

double dot(const Vector& a, const Vector& b);
double norm(const Vector& v);

// in-place: v -= (v.u) u, u assumed unit length
void remove_projection(Vector& v, const Vector& u);

}  // namespace semsearch
