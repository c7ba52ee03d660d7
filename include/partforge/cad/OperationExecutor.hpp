#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "KernelRouter.hpp"

namespace partforge::cad {

/**
 * @brief Lifecycle of the working shape within one build
 *
 * Failed is terminal.
 */
enum class ShapeState {
    Empty,
    HasSketch,
    HasSolid,
    Failed
};

const char* shapeStateName(ShapeState state);

struct WorkingShape {
    ShapeState state = ShapeState::Empty;
    ShapePtr shape;
};

/**
 * @brief Sequential, fail-fast interpreter of an operation list
 *
 * Owns the working shape for one build and replaces it wholesale after
 * every successful operation. The log is append-only; the first failure
 * is its last entry.
 */
class OperationExecutor {
public:
    /// Called after every operation with its name and duration.
    using TimingCallback = std::function<void(const std::string& operation, double durationMs)>;

    explicit OperationExecutor(KernelRouter& router, bool verbose = false);

    /// Execute the next operation. PRECONDITION_ERROR once Failed.
    Result<bool> execute(const Operation& op);

    /// Execute ops in order, stopping at the first failure.
    Result<bool> run(const std::vector<Operation>& ops);

    void onOperationTimed(TimingCallback callback) { timing_ = std::move(callback); }

    ShapeState state() const { return working_.state; }
    const InternalShape* shape() const { return working_.shape.get(); }
    ShapePtr releaseShape() { return std::move(working_.shape); }

    const std::vector<OperationLogEntry>& log() const { return log_; }
    size_t executedCount() const { return log_.size(); }

    /// 1-based index of the failed operation, if any.
    std::optional<size_t> failedIndex() const;

private:
    Result<bool> checkPrecondition(OperationKind kind) const;
    void record(size_t index, OperationKind kind, const Result<ShapePtr>& outcome,
                double durationMs);

    KernelRouter& router_;
    bool verbose_;
    WorkingShape working_;
    std::vector<OperationLogEntry> log_;
    TimingCallback timing_;
};

} // namespace partforge::cad
