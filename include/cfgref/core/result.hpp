#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cfgref {

// Either a T or an E. Accessing the wrong side is a programming error and
// asserts in debug builds; check IsOk()/IsErr() first.
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(std::in_place_index<kValue>, value); }
    static Result Ok(T&& value) { return Result(std::in_place_index<kValue>, std::move(value)); }
    static Result Err(const E& error) { return Result(std::in_place_index<kError>, error); }
    static Result Err(E&& error) { return Result(std::in_place_index<kError>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kError; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return std::get<kValue>(storage_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::get<kValue>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return std::get<kError>(storage_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::get<kError>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<kValue>(storage_) : std::move(fallback);
    }

    // Runs fn(T) -> Result<U, E> on success; an error is forwarded untouched.
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using Next = std::invoke_result_t<Fn, T&&>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(storage_)));
        }
        return std::forward<Fn>(fn)(std::get<kValue>(std::move(storage_)));
    }

    // Runs fn(T) -> U on success.
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using Next = Result<std::invoke_result_t<Fn, T&&>, E>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(storage_)));
        }
        return Next::Ok(std::forward<Fn>(fn)(std::get<kValue>(std::move(storage_))));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> where, Arg&& arg)
        : storage_(where, std::forward<Arg>(arg)) {}

    std::variant<T, E> storage_;
};

// Success carries nothing; only the error side is stored.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(const E& error) { return Result(std::optional<E>(error)); }
    static Result Err(E&& error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// The first five are the resolver's error kinds; any of them aborts the
// whole resolution run. The rest come from the CLI around it.
enum class ErrorCategory {
    TemplateSyntax,
    CircularDependency,
    ReferenceNotFound,
    MaxDepthExceeded,
    NonStringifiableValue,
    DocumentLoad,
    Config,
    Internal,
};

// What failed, where in the document, and the expression involved.
struct Error {
    std::string operation;                 // component that failed, e.g. "ExpressionRenderer"
    std::string path;                      // LeafPath or file path, may be empty
    std::optional<std::string> expression; // raw expression text, when one is involved
    std::string message;
    std::vector<std::string> cycle;        // ordered, first == last
    std::optional<int> depth;
    ErrorCategory category = ErrorCategory::Internal;

    static Error TemplateSyntax(std::string operation, std::string path,
                                std::optional<std::string> expression,
                                std::string message);
    static Error CircularDependency(std::vector<std::string> cycle);
    static Error ReferenceNotFound(std::string path, std::string missing,
                                   std::optional<std::string> expression);
    static Error MaxDepthExceeded(std::string path, int depth, int max_depth);
    static Error NonStringifiable(std::string path, std::string expression,
                                  std::string type_name);

    // Process exit code: 2..6 for resolver errors, 7 load, 8 config, 99 internal.
    [[nodiscard]] int ExitCode() const;
    // snake_case category, e.g. "reference_not_found".
    [[nodiscard]] std::string CategoryName() const;

    // "a → b → c → a"
    [[nodiscard]] std::string CycleString() const;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return std::tie(category, operation, path, expression, message, cycle, depth) ==
               std::tie(other.category, other.operation, other.path, other.expression,
                        other.message, other.cycle, other.depth);
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace cfgref
