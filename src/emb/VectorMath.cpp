#include "emb/VectorMath.hpp"
#include <cmath>
#include <stdexcept>

namespace semsearch {

float cosine(const float* a, const float* b, size_t dim) {
    double d = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        d += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    double s = d / (std::sqrt(na) * std::sqrt(nb));
    // rounding can push |s| a hair past 1
    if (s > 1.0) s = 1.0;
    if (s < -1.0) s = -1.0;
    return (float)s;
}

float cosine(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("cosine: dimension mismatch");
    }
    return cosine(a.data(), b.data(), a.size());
}

double dot(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("dot: dimension mismatch");
    }
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) s += (double)a[i] * (double)b[i];
    return s;
}

double norm(const Vector& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    return std::sqrt(ss);
}

void remove_projection(Vector& v, const Vector& u) {
    const double p = dot(v, u);
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = (float)((double)v[i] - p * (double)u[i]);
    }
}

}  // namespace semsearch
