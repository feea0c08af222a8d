#include "search/Pca.hpp"

#include <stdexcept>

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

namespace semsearch {

// eigenvalues at or below this are treated as zero variance
static constexpr double kMinVariance = 1e-12;

std::optional<Vector> principal_component(const std::vector<Vector>& vectors) {
    if (vectors.size() < 2) return std::nullopt;

    const Eigen::Index dim = (Eigen::Index)vectors[0].size();
    const Eigen::Index n = (Eigen::Index)vectors.size();
    if (dim == 0) return std::nullopt;

    Eigen::MatrixXd x(n, dim);
    for (Eigen::Index r = 0; r < n; ++r) {
        const Vector& v = vectors[(size_t)r];
        if ((Eigen::Index)v.size() != dim) throw std::invalid_argument("principal_component: dimension mismatch");
        for (Eigen::Index c = 0; c < dim; ++c) x(r, c) = (double)v[(size_t)c];
    }

    x.rowwise() -= x.colwise().mean();
    const Eigen::MatrixXd cov = (x.transpose() * x) / (double)(n - 1);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("principal_component: eigendecomposition failed");
    }

    // eigenvalues come sorted ascending
    if (solver.eigenvalues()(dim - 1) <= kMinVariance) return std::nullopt;
    Eigen::VectorXd u = solver.eigenvectors().col(dim - 1);

    // sign is arbitrary; fix it so the largest-magnitude entry is positive
    Eigen::Index largest = 0;
    u.cwiseAbs().maxCoeff(&largest);
    if (u(largest) < 0.0) u = -u;

    Vector out((size_t)dim);
    for (Eigen::Index i = 0; i < dim; ++i) out[(size_t)i] = (float)u(i);
    return out;
}

void remove_common_component(std::vector<Vector>& vectors, const Vector& u) {
    for (auto& v : vectors) remove_projection(v, u);
}

}  // namespace semsearch
