#pragma once

#include <stdexcept>
#include <optional>
#include <string>
#include <utility>

// Value of a Result that carries nothing on success.
struct Unit {};

template <typename TOk>
struct Result_ok {
    TOk data;
};

template <typename TError>
struct Result_err {
    TError data;
};

struct ResultInit {
    template<typename TOk>
    static Result_ok<TOk> ok(TOk&& data) {
        return Result_ok<TOk> { std::move(data) };
    }

    static Result_ok<Unit> ok() {
        return Result_ok<Unit> { Unit {} };
    }

    template<typename TError>
    static Result_err<TError> err(TError&& data) {
        return Result_err<TError> { std::move(data) };
    }

    static Result_err<std::string> err(const char* message) {
        return Result_err<std::string> { std::string(message) };
    }
};

template <typename TOk, typename TError = std::string>
struct Result {
private:
    bool is_ok;
    std::optional<TOk> ok_data;
    std::optional<TError> error_data;
public:
    Result(Result_ok<TOk>&& data) : is_ok(true), ok_data(std::move(data.data)) {}
    Result(Result_err<TError>&& data) : is_ok(false), error_data(std::move(data.data)) {}

    bool isOk() const {
        return is_ok;
    }

    const TOk& getOkRef() const & {
        if (!is_ok) {
            throw std::logic_error("Result::getOkRef called on errored result");
        }

        return *ok_data;
    }

    const TError& getErrRef() const & {
        if (is_ok) {
            throw std::logic_error("Result::getErrRef called on successful result");
        }

        return *error_data;
    }

    TOk&& getOkRef() && {
        if (!is_ok) {
            throw std::logic_error("Result::getOkRef called on errored result");
        }

        return *std::move(ok_data);
    }

    TError&& getErrRef() && {
        if (is_ok) {
            throw std::logic_error("Result::getErrRef called on successful result");
        }

        return *std::move(error_data);
    }
};

using Status = Result<Unit, std::string>;
