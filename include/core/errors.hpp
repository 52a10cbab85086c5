#pragma once

#include <stdexcept>
#include <string>

namespace netmap {

// Error types shared by every module. The service layer and the CLI
// translate them into responses; engines never catch them.

/**
 * @brief Upstream data source unreachable or read timed out
 */
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Unknown entity id in a path/neighborhood/mutation request
 */
class EntityNotFound : public std::runtime_error {
public:
    explicit EntityNotFound(const std::string& entity_id)
        : std::runtime_error("Entity not found: " + entity_id), entity_id_(entity_id) {}

    const std::string& entity_id() const { return entity_id_; }

private:
    std::string entity_id_;
};

/**
 * @brief Soft size limit exceeded for an expensive sub-computation
 */
class GraphTooLarge : public std::runtime_error {
public:
    GraphTooLarge(const std::string& what, size_t node_count, size_t limit)
        : std::runtime_error(what + ": " + std::to_string(node_count) +
                             " nodes exceeds limit " + std::to_string(limit)),
          node_count_(node_count), limit_(limit) {}

    size_t node_count() const { return node_count_; }
    size_t limit() const { return limit_; }

private:
    size_t node_count_;
    size_t limit_;
};

/**
 * @brief Computation budget exceeded with no usable partial result
 */
class ComputationTimeout : public std::runtime_error {
public:
    explicit ComputationTimeout(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace netmap
