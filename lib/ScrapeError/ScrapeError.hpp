#pragma once

#include <chrono>
#include <string>

enum class ErrorKind {
    Timeout,
    TooManyRedirects,
    ConnectionFailure,
    RequestFailure,
    UnexpectedFailure,
    ClientError,
    ServerError,
    NotFoundInPage
};

struct ScrapeError {
    ErrorKind kind;
    std::string url;
    // Upstream HTTP status and reason, set for ClientError and ServerError
    int status = 0;
    std::string reason;
    // Underlying cause for transport failures
    std::string detail;
    // Configured deadline, set for Timeout
    std::chrono::milliseconds timeout{0};

    static ScrapeError timedOut(std::string url, std::chrono::milliseconds timeout);
    static ScrapeError tooManyRedirects(std::string url);
    static ScrapeError connectionFailure(std::string url, std::string cause);
    static ScrapeError requestFailure(std::string url, std::string cause);
    static ScrapeError unexpectedFailure(std::string url, std::string cause);
    static ScrapeError clientError(std::string url, int status, std::string reason);
    static ScrapeError serverError(std::string url, int status, std::string reason);
    static ScrapeError notFoundInPage(std::string url);

    // Status an endpoint layer should answer with
    int httpStatus() const;

    std::string message() const;

    const char* kindName() const;
};

const char* toString(ErrorKind kind);
