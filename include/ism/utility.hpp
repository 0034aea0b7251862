#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imagesmith {

enum class ErrorKind {
    DuplicateName,
    UnknownUnit,
    DanglingReference,
    CyclicDependency,
    ConflictingBase,
    MissingBase,
    UnreadableFile,
    BuildError,
    Timeout,
    IOError,
    ManifestError,
    InvalidArgument,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Error value carried by every `Result`.
 *
 * `path` holds the unit names involved when the error is about a chain of units
 * (the cycle for `CyclicDependency`, the offending chain for `ConflictingBase`).
 */
struct Error {
    ErrorKind kind;
    std::string message;
    std::vector<std::string> path = {};

    /** @brief True for errors that invalidate the whole manifest. */
    bool structural() const;
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message, std::vector<std::string> path = {}) {
    return std::unexpected(Error{kind, std::move(message), std::move(path)});
}

} // namespace imagesmith
