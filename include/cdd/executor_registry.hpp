#pragma once

#include "cdd/executor.hpp"
#include "cdd/log.hpp"
#include "cdd/result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cdd {

using ExecutorFactory = std::function<std::unique_ptr<Executor>(const Logger&)>;

/**
 * @brief Name -> factory table for step executors
 *
 * Registration is explicit. A duplicate name is rejected when it is added,
 * and an unknown name is an error result when an executor is created.
 */
class ExecutorRegistry {
public:
    ExecutorRegistry() = default;

    /// Registry holding native, shell, static and sclang
    static ExecutorRegistry with_builtins();

    Result<void> add(const std::string& name, ExecutorFactory factory);

    Result<std::unique_ptr<Executor>> create(const std::string& name,
                                             const Logger& logger) const;

    bool contains(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> available() const;

private:
    std::map<std::string, ExecutorFactory> factories_;
};

} // namespace cdd
