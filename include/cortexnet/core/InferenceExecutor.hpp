#pragma once

#include "cortexnet/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace cortexnet {

// Performs the actual model computation for a whole model or one shard. Failures are thrown.
class InferenceExecutor {
public:
    virtual ~InferenceExecutor() = default;

    virtual Value execute(const std::string& model_id,
                          const std::optional<std::string>& shard_id,
                          const Value& input) = 0;
};

class FunctionExecutor : public InferenceExecutor {
public:
    using Function =
        std::function<Value(const std::string& model_id, const std::optional<std::string>& shard_id, const Value& input)>;

    explicit FunctionExecutor(Function function)
        : function_(std::move(function)) {}

    Value execute(const std::string& model_id,
                  const std::optional<std::string>& shard_id,
                  const Value& input) override {
        return function_(model_id, shard_id, input);
    }

private:
    Function function_;
};

}  // namespace cortexnet
