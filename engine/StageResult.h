#pragma once

#include <QString>
#include <cstddef>
#include <exception>
#include <utility>
#include <variant>

namespace RailPrecedence::Engine {

enum class StageFailureKind {
    INVALID_INPUT,          // Snapshot data the stage cannot work with
    MODEL_CONSTRUCTION,     // Precedence model could not be built
    INCONSISTENT_ORDER,     // Precedence order does not cover the eligible trains
    UNEXPECTED_EXCEPTION    // Something threw inside the stage
};

QString stageFailureKindToString(StageFailureKind kind);

struct StageFailure {
    StageFailureKind kind = StageFailureKind::UNEXPECTED_EXCEPTION;
    QString stage;
    QString message;

    QString describe() const;
};

// Outcome of one optimizer stage: either the stage's value or the reason it failed.
template <typename T>
class StageResult {
public:
    static StageResult success(T value) {
        return StageResult(std::in_place_index<0>, std::move(value));
    }

    static StageResult failure(StageFailureKind kind, const QString& stage, const QString& message) {
        return StageResult(std::in_place_index<1>, StageFailure{kind, stage, message});
    }

    static StageResult failure(const StageFailure& failure) {
        return StageResult(std::in_place_index<1>, failure);
    }

    bool isSuccess() const { return m_outcome.index() == 0; }
    bool isFailure() const { return m_outcome.index() == 1; }

    const T& value() const { return std::get<0>(m_outcome); }
    T& value() { return std::get<0>(m_outcome); }
    const StageFailure& error() const { return std::get<1>(m_outcome); }

private:
    template <std::size_t Index, typename Arg>
    StageResult(std::in_place_index_t<Index> index, Arg&& arg)
        : m_outcome(index, std::forward<Arg>(arg)) {}

    std::variant<T, StageFailure> m_outcome;
};

// Runs one stage and turns anything it throws into a StageFailure, so the
// orchestrator only ever sees values.
template <typename Fn>
auto runGuardedStage(const QString& stage, Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    try {
        return fn();
    } catch (const std::exception& e) {
        return Result::failure(StageFailureKind::UNEXPECTED_EXCEPTION, stage, QString::fromUtf8(e.what()));
    } catch (...) {
        return Result::failure(StageFailureKind::UNEXPECTED_EXCEPTION, stage, "Non-standard exception");
    }
}

} // namespace RailPrecedence::Engine
