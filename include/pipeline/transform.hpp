#ifndef CHUNKLINE_TRANSFORM_HPP
#define CHUNKLINE_TRANSFORM_HPP

#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace chunkline {
namespace pipeline {

/**
 * Outcome of applying a transform to a single line.
 * A line is either kept with a produced value, skipped (filtered out),
 * or failed, which aborts the chunk that owns the line.
 */
template <typename T>
class TransformOutcome {
public:
    // ---- CONSTRUCTION ----
    static TransformOutcome keep(T value) {
        return TransformOutcome(Storage(std::in_place_index<0>, std::move(value)));
    }

    static TransformOutcome skip() {
        return TransformOutcome(Storage(std::in_place_index<1>, Skipped{}));
    }

    static TransformOutcome fail(std::string message) {
        return TransformOutcome(Storage(std::in_place_index<2>, Failed{std::move(message)}));
    }


    // ---- QUERY METHODS ----
    bool is_kept() const { return outcome_.index() == 0; }
    bool is_skipped() const { return outcome_.index() == 1; }
    bool is_failed() const { return outcome_.index() == 2; }

    const T& value() const& { return std::get<0>(outcome_); }
    T&& value() && { return std::get<0>(std::move(outcome_)); }

    const std::string& error_message() const { return std::get<2>(outcome_).message; }

private:
    struct Skipped {};
    struct Failed {
        std::string message;
    };
    using Storage = std::variant<T, Skipped, Failed>;

    explicit TransformOutcome(Storage outcome) : outcome_(std::move(outcome)) {}

    Storage outcome_;
};

template <typename T>
using TransformFn = std::function<TransformOutcome<T>(const std::string&)>;

// Keeps every line with its trailing newline characters removed
TransformOutcome<std::string> trim_newline(const std::string& line);

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_TRANSFORM_HPP
