#pragma once
#include "emb/VectorMath.hpp"

#include <optional>
#include <vector>

namespace semsearch {

// First principal component (unit length) of the mean-centered vectors.
// std::nullopt for fewer than 2 vectors or when every vector is identical.
std::optional<Vector> principal_component(const std::vector<Vector>& vectors);

// v -= (v.u) u for every vector
void remove_common_component(std::vector<Vector>& vectors, const Vector& u);

}  // namespace semsearch
