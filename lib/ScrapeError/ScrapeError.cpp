#include "ScrapeError.hpp"

#include <spdlog/fmt/fmt.h>

ScrapeError ScrapeError::timedOut(std::string url, std::chrono::milliseconds timeout) {
    ScrapeError error{ErrorKind::Timeout, std::move(url)};
    error.timeout = timeout;
    return error;
}

ScrapeError ScrapeError::tooManyRedirects(std::string url) {
    return ScrapeError{ErrorKind::TooManyRedirects, std::move(url)};
}

ScrapeError ScrapeError::connectionFailure(std::string url, std::string cause) {
    ScrapeError error{ErrorKind::ConnectionFailure, std::move(url)};
    error.detail = std::move(cause);
    return error;
}

ScrapeError ScrapeError::requestFailure(std::string url, std::string cause) {
    ScrapeError error{ErrorKind::RequestFailure, std::move(url)};
    error.detail = std::move(cause);
    return error;
}

ScrapeError ScrapeError::unexpectedFailure(std::string url, std::string cause) {
    ScrapeError error{ErrorKind::UnexpectedFailure, std::move(url)};
    error.detail = std::move(cause);
    return error;
}

ScrapeError ScrapeError::clientError(std::string url, int status, std::string reason) {
    ScrapeError error{ErrorKind::ClientError, std::move(url)};
    error.status = status;
    error.reason = std::move(reason);
    return error;
}

ScrapeError ScrapeError::serverError(std::string url, int status, std::string reason) {
    ScrapeError error{ErrorKind::ServerError, std::move(url)};
    error.status = status;
    error.reason = std::move(reason);
    return error;
}

ScrapeError ScrapeError::notFoundInPage(std::string url) {
    return ScrapeError{ErrorKind::NotFoundInPage, std::move(url)};
}

int ScrapeError::httpStatus() const {
    switch (kind) {
        case ErrorKind::Timeout:
            return 504;
        case ErrorKind::TooManyRedirects:
        case ErrorKind::NotFoundInPage:
            return 404;
        case ErrorKind::ConnectionFailure:
            return 503;
        case ErrorKind::ClientError:
        case ErrorKind::ServerError:
            return status;
        case ErrorKind::RequestFailure:
        case ErrorKind::UnexpectedFailure:
        default:
            return 500;
    }
}

std::string ScrapeError::message() const {
    switch (kind) {
        case ErrorKind::Timeout:
            if (timeout.count() % 1000 == 0) {
                return fmt::format("Request timeout after {}s for url: {}", timeout.count() / 1000,
                                   url);
            }
            return fmt::format("Request timeout after {}s for url: {}", timeout.count() / 1000.0,
                               url);
        case ErrorKind::TooManyRedirects:
            return fmt::format("Too many redirects for url: {}", url);
        case ErrorKind::ConnectionFailure:
            return fmt::format("Connection error for url: {}. {}", url, detail);
        case ErrorKind::RequestFailure:
            return fmt::format("Request error for url: {}. {}", url, detail);
        case ErrorKind::UnexpectedFailure:
            return fmt::format("Unexpected error for url: {}. {}", url, detail);
        case ErrorKind::ClientError:
            return fmt::format("Client Error. {} for url: {}", reason, url);
        case ErrorKind::ServerError:
            return fmt::format("Server Error. {} for url: {}", reason, url);
        case ErrorKind::NotFoundInPage:
        default:
            return fmt::format("Invalid request (url: {})", url);
    }
}

const char* ScrapeError::kindName() const {
    return toString(kind);
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::TooManyRedirects: return "TooManyRedirects";
        case ErrorKind::ConnectionFailure: return "ConnectionFailure";
        case ErrorKind::RequestFailure: return "RequestFailure";
        case ErrorKind::UnexpectedFailure: return "UnexpectedFailure";
        case ErrorKind::ClientError: return "ClientError";
        case ErrorKind::ServerError: return "ServerError";
        case ErrorKind::NotFoundInPage: return "NotFoundInPage";
    }
    return "Unknown";
}
