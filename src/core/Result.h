#pragma once

#include <expected>
#include <utility>

namespace FallingSand {

/**
 * Result<T, E>: thin wrapper around C++23 std::expected.
 *
 * Used at fallible boundaries outside the simulation core (config loading,
 * scenario lookup). Composition keeps the static okay()/error() factories
 * apart from the isValue()/errorValue() accessors.
 */
template <typename successT, typename failureT>
class Result {
private:
    std::expected<successT, failureT> inner_;

public:
    Result() : inner_(std::unexpected(failureT())) {}

    Result(successT value) : inner_(std::move(value)) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}
    Result(std::expected<successT, failureT> exp) : inner_(std::move(exp)) {}

    static Result<successT, failureT> okay() { return Result<successT, failureT>(successT()); }

    // Suppress false positive -Wmaybe-uninitialized with GCC + -O3.
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
    static Result<successT, failureT> okay(successT value)
    {
        return Result<successT, failureT>(std::move(value));
    }
#pragma GCC diagnostic pop

    static Result<successT, failureT> error()
    {
        return Result<successT, failureT>(std::unexpected(failureT()));
    }

    static Result<successT, failureT> error(failureT err)
    {
        return Result<successT, failureT>(std::unexpected(std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    successT value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    const failureT& errorValue() const& { return inner_.error(); }
    failureT& errorValue() & { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }
};

} // namespace FallingSand
