#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "Pagination.hpp"
#include "Scraper.hpp"
#include "Session.hpp"
#include "Settings.hpp"

namespace {

int exitCodeFor(const ScrapeError& error) {
    std::cerr << error.message() << "\n";
    return error.httpStatus() / 100;
}

void printQueries(const Page& page, const std::vector<std::string>& paths, bool asList,
                  const std::optional<std::string>& joinWith) {
    for (const auto& path : paths) {
        if (asList) {
            for (const auto& value : page.queryList(path)) {
                std::cout << value << "\n";
            }
            continue;
        }
        TextQuery query;
        query.joinWith = joinWith;
        auto value = page.queryText(path, query);
        std::cout << (value ? *value : "") << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    argparse::ArgumentParser program("fetchly");
    program.add_argument("url")
        .help("Address of the page to fetch");

    program.add_argument("-x", "--xpath")
        .default_value(std::vector<std::string>{})
        .append()
        .help("XPath to print from the page (repeatable)");

    program.add_argument("--list")
        .default_value(false)
        .implicit_value(true)
        .help("Print every match of each --xpath instead of the first");

    program.add_argument("--join")
        .help("Join all matches of each --xpath with this separator");

    program.add_argument("--require")
        .help("Fail unless this XPath yields text");

    program.add_argument("--pages")
        .help("Print the last page number, using this XPath prefix for the pagination block");

    program.add_argument("--env")
        .default_value(std::string(".env"))
        .help("Settings file read before the environment");

    program.add_argument("--timeout")
        .help("Request timeout in seconds")
        .scan<'g', double>();

    program.add_argument("--rate-limit")
        .help("Minimum seconds between requests, 0 disables pacing")
        .scan<'g', double>();

    program.add_argument("--max-retries")
        .help("Maximum retries for failed requests")
        .scan<'i', int>();

    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error or off");

    Settings settings;
    try {
        program.parse_args(argc, argv);
        settings = Settings::load(program.get<std::string>("--env"));

        std::map<std::string, std::string> overrides;
        if (auto timeout = program.present<double>("--timeout")) {
            overrides["REQUEST_TIMEOUT"] = std::to_string(*timeout);
        }
        if (auto rate = program.present<double>("--rate-limit")) {
            overrides["REQUEST_RATE_LIMIT"] = std::to_string(*rate);
        }
        if (auto retries = program.present<int>("--max-retries")) {
            overrides["REQUEST_MAX_RETRIES"] = std::to_string(*retries);
        }
        if (auto level = program.present("--log-level")) {
            overrides["LOG_LEVEL"] = *level;
        }
        settings.apply(overrides);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    spdlog::set_level(spdlog::level::from_str(settings.logLevel));
    spdlog::info("Timeout {}ms", settings.requestTimeout.count());
    spdlog::info("Rate limit {}s", settings.requestRateLimit);
    spdlog::info("Max retries {}", settings.requestMaxRetries);

    Session session(settings);
    Scraper scraper(session, program.get<std::string>("url"));

    PageResult result = scraper.requestPage();
    if (auto* error = std::get_if<ScrapeError>(&result)) {
        return exitCodeFor(*error);
    }
    const Page& page = std::get<Page>(result);

    try {
        if (auto required = program.present("--require")) {
            if (auto error = page.require(*required)) {
                return exitCodeFor(*error);
            }
        }

        printQueries(page, program.get<std::vector<std::string>>("--xpath"),
                     program.get<bool>("--list"), program.present("--join"));

        if (auto prefix = program.present("--pages")) {
            std::cout << page.lastPageNumber(*prefix) << "\n";
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const PageStructureError& e) {
        std::cerr << e.what() << "\n";
        return 5;
    }
    return 0;
}
