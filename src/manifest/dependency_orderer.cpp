/// @file dependency_orderer.cpp
/// @brief Kahn's algorithm with lowest-index tie-break

#include <manifold/manifest/dependency_orderer.hpp>
#include <manifold/core/log.hpp>

#include <functional>
#include <map>
#include <queue>
#include <set>
#include <sstream>

namespace manifold_manifest {

using manifold_core::Resource;

std::string DependencyCycle::format() const {
    std::ostringstream oss;
    oss << "Resource dependency cycle detected among: ";
    for (std::size_t i = 0; i < members.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << members[i];
    }
    return oss.str();
}

manifold_core::Result<std::vector<std::size_t>> DependencyOrderer::order_indices(
    const std::vector<Resource>& resources) {

    const std::size_t n = resources.size();

    std::map<std::string, std::vector<std::size_t>> indices_by_name;
    for (std::size_t i = 0; i < n; ++i) {
        auto name = manifold_core::resource_name(resources[i]);
        if (!name.empty()) {
            indices_by_name[name].push_back(i);
        }
    }

    std::vector<std::set<std::size_t>> edges(n);
    std::vector<std::size_t> indegree(n, 0);

    for (std::size_t i = 0; i < n; ++i) {
        auto kind = manifold_core::resource_kind(resources[i]);
        if (kind.empty()) continue;

        auto definers = indices_by_name.find(kind);
        if (definers == indices_by_name.end()) continue;

        for (std::size_t definer : definers->second) {
            if (definer == i) continue;
            if (edges[definer].insert(i).second) {
                ++indegree[i];
            }
        }
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (indegree[i] == 0) ready.push(i);
    }

    std::vector<std::size_t> ordered;
    ordered.reserve(n);

    while (!ready.empty()) {
        std::size_t index = ready.top();
        ready.pop();
        ordered.push_back(index);

        for (std::size_t dependent : edges[index]) {
            if (--indegree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    if (ordered.size() != n) {
        DependencyCycle cycle;
        for (std::size_t i = 0; i < n; ++i) {
            if (indegree[i] > 0) {
                cycle.members.push_back(manifold_core::resource_id(resources[i]).to_string());
            }
        }
        manifold_core::manifest_logger()->error("{}", cycle.format());
        return manifold_core::Err<std::vector<std::size_t>>(
            manifold_core::Error(manifold_core::ErrorCode::DependencyCycle, cycle.format()));
    }

    return manifold_core::Ok(std::move(ordered));
}

manifold_core::Result<std::vector<Resource>> DependencyOrderer::order(std::vector<Resource> resources) {
    auto indices = order_indices(resources);
    if (!indices) {
        return manifold_core::Err<std::vector<Resource>>(indices.error());
    }

    std::vector<Resource> ordered;
    ordered.reserve(resources.size());
    for (std::size_t index : indices.value()) {
        ordered.push_back(std::move(resources[index]));
    }
    return manifold_core::Ok(std::move(ordered));
}

} // namespace manifold_manifest
