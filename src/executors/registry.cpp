#include "cdd/executor_registry.hpp"
#include "cdd/native_executor.hpp"
#include "cdd/sclang_executor.hpp"
#include "cdd/shell_executor.hpp"
#include "cdd/static_executor.hpp"

namespace cdd {

ExecutorRegistry ExecutorRegistry::with_builtins() {
    ExecutorRegistry registry;
    // Names are distinct, so none of these can fail
    (void)registry.add("native", [](const Logger& logger) -> std::unique_ptr<Executor> {
        return std::make_unique<NativeExecutor>(logger);
    });
    (void)registry.add("shell", [](const Logger& logger) -> std::unique_ptr<Executor> {
        return std::make_unique<ShellExecutor>(logger);
    });
    (void)registry.add("static", [](const Logger& logger) -> std::unique_ptr<Executor> {
        return std::make_unique<StaticExecutor>(logger);
    });
    (void)registry.add("sclang", [](const Logger& logger) -> std::unique_ptr<Executor> {
        return std::make_unique<SclangExecutor>(logger);
    });
    return registry;
}

Result<void> ExecutorRegistry::add(const std::string& name, ExecutorFactory factory) {
    if (name.empty()) {
        return Result<void>::err(Error(ErrorCode::UNKNOWN_EXECUTOR, "executor name must not be empty"));
    }
    if (!factory) {
        return Result<void>::err(Error(ErrorCode::UNKNOWN_EXECUTOR,
                                       "executor '" + name + "' has no factory"));
    }
    if (factories_.count(name) > 0) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_EXECUTOR,
                                       "executor '" + name + "' is already registered"));
    }
    factories_.emplace(name, std::move(factory));
    return Result<void>::ok();
}

Result<std::unique_ptr<Executor>> ExecutorRegistry::create(const std::string& name,
                                                           const Logger& logger) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& n : available()) {
            if (!known.empty()) known += ", ";
            known += n;
        }
        return Result<std::unique_ptr<Executor>>::err(
            Error(ErrorCode::UNKNOWN_EXECUTOR,
                  "Unknown executor '" + name + "' (available: " + known + ")"));
    }

    auto executor = it->second(logger);
    if (!executor) {
        return Result<std::unique_ptr<Executor>>::err(
            Error(ErrorCode::UNKNOWN_EXECUTOR, "factory for '" + name + "' returned no executor"));
    }
    return Result<std::unique_ptr<Executor>>::ok(std::move(executor));
}

bool ExecutorRegistry::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ExecutorRegistry::available() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& kv : factories_) {
        names.push_back(kv.first);
    }
    return names;
}

} // namespace cdd
