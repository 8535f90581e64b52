//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef DEPMAP_ERROR_HPP
#define DEPMAP_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by every depmap layer.
 *
 * An Error carries a category code, a message and an optional context
 * string (usually a path or a module id). Functions that can fail return
 * Result<T, Error>; only PathNotFound, an unsupported single-file root
 * and a broken configuration abort a scan. Per-module ParseFailure
 * errors are recorded on the module and counted instead.
 *
 * @code
 *     auto scanned = depmap::scan("does/not/exist");
 *     if (scanned.is_err()) {
 *         std::cerr << scanned.error() << std::endl;
 *         // [PathNotFound] Scan root does not exist (context: does/not/exist)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace depmap {

    enum class ErrorCode {
        None,
        InvalidArgument,  ///< Bad option value or unsupported input
        NotFound,         ///< Unknown module id or missing resource
        PathNotFound,     ///< Scan root does not exist
        ParseFailure,     ///< A module's source could not be tokenized
        IoError,
        ConfigError,      ///< Configuration file rejected
        InternalError
    };

    [[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::PathNotFound:    return "PathNotFound";
            case ErrorCode::ParseFailure:    return "ParseFailure";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error value. The context names what the error is about,
     * usually a path or a module id; with_context() chains further
     * context as "first; second".
     */
    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        /**
         * The scan root (or an explicitly named file) does not exist.
         */
        static Error path_not_found(std::string message, std::string path) {
            return {ErrorCode::PathNotFound, std::move(message), std::move(path)};
        }

        /**
         * Source text that could not be tokenized, or a malformed import
         * statement.
         */
        static Error parse_failure(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseFailure, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string path) {
            return {ErrorCode::IoError, std::move(message), std::move(path)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const Context& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        [[nodiscard]] Error with_context(std::string more) const {
            Context chained = context_ ? *context_ + "; " + more : std::move(more);
            return {code_, message_, std::move(chained)};
        }

        /**
         * "[Code] message", followed by " (context: ...)" when present.
         */
        [[nodiscard]] std::string to_string() const {
            std::string text;
            text.append("[").append(error_code_name(code_)).append("] ").append(message_);
            if (context_) {
                text.append(" (context: ").append(*context_).append(")");
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_name(code);
    }

}  // namespace depmap

#endif //DEPMAP_ERROR_HPP
