/**
 * @file qbm/apidoc/gen/context.h
 * @brief Generation context governing one document-generation pass.
 *
 * A `GenContext` holds the options of a generation pass (whether responses are inferred,
 * whether adapters document every error response they can produce) and accumulates the
 * documentation errors raised while routes are registered. It is made current for the
 * calling thread by a `GenScope` for the duration of the pass:
 *
 * @code
 * qb::apidoc::GenContext ctx(qb::apidoc::GenOptions().all_error_responses(true));
 * {
 *     qb::apidoc::GenScope scope(ctx);
 *     app.api_route("/users", qb::apidoc::get(list_users).post(create_user));
 *     app.finish_api(doc);
 * }
 * for (const auto& err : ctx.errors()) { ... }
 * @endcode
 *
 * Accessing the context outside a scope, or opening a second scope on a thread that
 * already has one, is a programming error and throws `std::logic_error`. Independent
 * passes on different threads each use their own context and scope.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "../error.h"

#include <functional>
#include <utility>
#include <vector>

namespace qb::apidoc {

/**
 * @brief Options for a generation pass.
 */
class GenOptions {
public:
    using ErrorHook = std::function<void(const Error &)>;

private:
    bool _infer_responses = true;      ///< Add responses inferred from handler types.
    bool _all_error_responses = false; ///< Adapters also document every error they may produce.
    ErrorHook _on_error;               ///< Invoked for each error as it is recorded.

public:
    GenOptions() = default;

    /**
     * @brief Enable or disable response inference.
     * When disabled, only responses added by transforms are documented.
     * @return Reference to this options object
     */
    GenOptions &infer_responses(bool enabled) {
        _infer_responses = enabled;
        return *this;
    }

    /**
     * @brief Enable or disable documentation of every error response an adapter can produce.
     * @return Reference to this options object
     */
    GenOptions &all_error_responses(bool enabled) {
        _all_error_responses = enabled;
        return *this;
    }

    /**
     * @brief Set a hook invoked for each documentation error as it is recorded.
     * @return Reference to this options object
     */
    GenOptions &on_error(ErrorHook hook) {
        _on_error = std::move(hook);
        return *this;
    }

    [[nodiscard]] bool infer_responses() const noexcept { return _infer_responses; }
    [[nodiscard]] bool all_error_responses() const noexcept { return _all_error_responses; }
    [[nodiscard]] const ErrorHook &error_hook() const noexcept { return _on_error; }
};

/**
 * @brief State of one document-generation pass.
 */
class GenContext {
    GenOptions _options;
    std::vector<Error> _errors;

public:
    explicit GenContext(GenOptions options = GenOptions()) : _options(std::move(options)) {}

    GenContext(const GenContext &) = delete;
    GenContext &operator=(const GenContext &) = delete;

    [[nodiscard]] const GenOptions &options() const noexcept { return _options; }
    [[nodiscard]] bool infer_responses() const noexcept { return _options.infer_responses(); }
    [[nodiscard]] bool all_error_responses() const noexcept { return _options.all_error_responses(); }

    void set_infer_responses(bool enabled) { _options.infer_responses(enabled); }
    void set_all_error_responses(bool enabled) { _options.all_error_responses(enabled); }

    /**
     * @brief Records a documentation error. Never throws the error and never aborts the pass.
     */
    void error(Error err);

    /** @brief Errors recorded so far, in the order they were raised. */
    [[nodiscard]] const std::vector<Error> &errors() const noexcept { return _errors; }

    /** @brief Removes and returns every recorded error. */
    std::vector<Error> take_errors() noexcept { return std::exchange(_errors, {}); }

    /**
     * @brief Returns the context made current on this thread by a `GenScope`.
     * @throws std::logic_error if no scope is active on this thread.
     */
    [[nodiscard]] static GenContext &current();

    /** @brief `true` if a `GenScope` is active on this thread. */
    [[nodiscard]] static bool has_current() noexcept;

    friend class GenScope;
};

/**
 * @brief RAII handle making a `GenContext` current on the calling thread.
 *
 * Only one scope may be active per thread; the context must outlive the scope.
 */
class GenScope {
    GenContext *_ctx;

public:
    /** @throws std::logic_error if another scope is already active on this thread. */
    explicit GenScope(GenContext &ctx);
    ~GenScope();

    GenScope(const GenScope &) = delete;
    GenScope &operator=(const GenScope &) = delete;

    [[nodiscard]] GenContext &context() const noexcept { return *_ctx; }
};

/**
 * @brief Runs `fn` with the current generation context.
 * @throws std::logic_error if no `GenScope` is active on this thread.
 */
template <typename Fn>
decltype(auto) in_context(Fn &&fn) {
    return std::forward<Fn>(fn)(GenContext::current());
}

} // namespace qb::apidoc
