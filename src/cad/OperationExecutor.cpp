/**
 * OperationExecutor.cpp - Shape state machine over the kernel router
 */

#include "partforge/cad/OperationExecutor.hpp"

#include <chrono>
#include <iostream>

namespace partforge::cad {

const char* shapeStateName(ShapeState state) {
    switch (state) {
        case ShapeState::Empty: return "empty";
        case ShapeState::HasSketch: return "has_sketch";
        case ShapeState::HasSolid: return "has_solid";
        case ShapeState::Failed:
        default: return "failed";
    }
}

OperationExecutor::OperationExecutor(KernelRouter& router, bool verbose)
    : router_(router), verbose_(verbose) {}

Result<bool> OperationExecutor::checkPrecondition(OperationKind kind) const {
    if (isSketchKind(kind)) {
        return Result<bool>::ok(true);
    }

    switch (kind) {
        case OperationKind::Extrude:
        case OperationKind::Revolve:
            if (working_.state != ShapeState::HasSketch) {
                return Result<bool>::error(errc::Precondition,
                    std::string(operationKindName(kind)) + ": no profile to transform");
            }
            return Result<bool>::ok(true);
        default:
            if (working_.state != ShapeState::HasSolid) {
                return Result<bool>::error(errc::Precondition,
                    std::string(operationKindName(kind)) + ": no solid to modify");
            }
            return Result<bool>::ok(true);
    }
}

Result<bool> OperationExecutor::execute(const Operation& op) {
    if (working_.state == ShapeState::Failed) {
        return Result<bool>::error(errc::Precondition,
            "Executor has failed; no further operations are accepted");
    }

    const size_t index = log_.size() + 1;
    auto start = std::chrono::high_resolution_clock::now();

    Result<ShapePtr> outcome;
    auto ready = checkPrecondition(op.kind);
    if (ready.success) {
        outcome = router_.dispatch(op, index, working_.shape.get());
    } else {
        outcome = Result<ShapePtr>::errorFrom(ready);
    }

    auto end = std::chrono::high_resolution_clock::now();
    double durationMs = std::chrono::duration<double, std::milli>(end - start).count();

    record(index, op.kind, outcome, durationMs);
    if (timing_) {
        timing_(operationKindName(op.kind), durationMs);
    }

    if (!outcome.success) {
        working_.state = ShapeState::Failed;
        if (verbose_) {
            std::cerr << "[executor] Operation " << index << " (" << operationKindName(op.kind)
                      << ") failed: " << outcome.errorCode << ": " << outcome.errorMessage
                      << std::endl;
        }
        auto failed = Result<bool>::errorFrom(outcome);
        failed.durationMs = durationMs;
        return failed;
    }

    working_.shape = std::move(outcome.value);
    if (isSketchKind(op.kind)) {
        working_.state = ShapeState::HasSketch;
    } else {
        working_.state = ShapeState::HasSolid;
    }

    if (verbose_) {
        std::cerr << "[executor] Operation " << index << " (" << operationKindName(op.kind)
                  << ") ok on " << router_.active().name() << " in " << durationMs << " ms"
                  << std::endl;
    }

    auto result = Result<bool>::ok(true);
    result.durationMs = durationMs;
    return result;
}

Result<bool> OperationExecutor::run(const std::vector<Operation>& ops) {
    double totalMs = 0;
    for (const auto& op : ops) {
        auto step = execute(op);
        totalMs += step.durationMs;
        if (!step.success) {
            return step;
        }
    }
    auto result = Result<bool>::ok(true);
    result.durationMs = totalMs;
    return result;
}

void OperationExecutor::record(size_t index, OperationKind kind,
                               const Result<ShapePtr>& outcome, double durationMs) {
    OperationLogEntry entry;
    entry.index = index;
    entry.kind = kind;
    entry.status = outcome.success ? OperationStatus::Success : OperationStatus::Failed;
    entry.errorCode = outcome.errorCode;
    entry.error = outcome.errorMessage;
    entry.engine = router_.started() ? router_.active().name() : "";
    entry.durationMs = durationMs;
    log_.push_back(std::move(entry));
}

std::optional<size_t> OperationExecutor::failedIndex() const {
    if (!log_.empty() && log_.back().status == OperationStatus::Failed) {
        return log_.back().index;
    }
    return std::nullopt;
}

} // namespace partforge::cad
