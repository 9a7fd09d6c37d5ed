#pragma once

#include <cstdint>
#include <string_view>

namespace filefetch::http {

// HTTP status codes reused as the outcome of a file fetch. No HTTP exchange takes place.
using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeMultipleChoices = 300;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeNotFound = 404;
// Non standard (Spring framework), reported when a file cannot be read.
inline constexpr StatusCode StatusCodeMethodFailure = 420;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonMultipleChoices = "Multiple Choices";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodFailure = "Method Failure";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";

// Reason phrase of given status code, or an empty string_view for codes not produced by the file protocol.
constexpr std::string_view ReasonPhrase(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeMultipleChoices:
      return ReasonMultipleChoices;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodFailure:
      return ReasonMethodFailure;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace filefetch::http
