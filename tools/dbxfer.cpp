// SPDX-License-Identifier: MIT

// tools/dbxfer.cpp
//
// Command-line front end: copy tables, convert schemas and list locator
// features.

#include <getopt.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <fmt/format.h>

#include "dbxfer/arguments.hpp"
#include "dbxfer/config.hpp"
#include "dbxfer/context.hpp"
#include "dbxfer/copy.hpp"
#include "dbxfer/locator.hpp"
#include "dbxfer/logging.hpp"

using namespace dbxfer;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
    fmt::print(stderr,
               "Usage: dbxfer COMMAND [OPTIONS] ...\n"
               "\n"
               "Move tables between CSV files, S3 and Redshift.\n"
               "\n"
               "Commands:\n"
               "  dbxfer cp [OPTIONS] FROM TO     Copy a table\n"
               "  dbxfer conv [OPTIONS] FROM TO   Copy only a table's schema\n"
               "  dbxfer features [LOC]           Show what a locator supports\n"
               "\n"
               "cp options:\n"
               "  --if-exists=P       error (default), overwrite, append or upsert-on:COLS\n"
               "  --schema=LOC        Read the schema from LOC instead of FROM\n"
               "  --create-schema     Create the destination table before copying\n"
               "  --where=SQL         Only copy rows matching SQL\n"
               "  --from-arg=K=V      Pass an option to the source driver\n"
               "  --to-arg=K=V        Pass an option to the destination driver\n"
               "  --temporary=LOC     Scratch storage for drivers that need it\n"
               "  --max-streams=N     Partitions written at once (default: {})\n"
               "\n"
               "Environment:\n"
               "  DBXFER_LOG          trace, debug, info (default), warn, error or off\n"
               "  DBXFER_MAX_STREAMS  Default for --max-streams\n",
               TransferConfig::Defaults().max_streams);
}

template <typename T>
T OrUsage(std::expected<T, Error> value) {
    if (!value) {
        fmt::print(stderr, "dbxfer: {}\n", value.error().message);
        std::exit(kExitUsage);
    }
    return std::move(*value);
}

// Run a top-level task and report how it ended.
int RunToCompletion(asio::io_context& io, asio::awaitable<void> task) {
    std::exception_ptr failure;
    asio::co_spawn(io, std::move(task), [&failure](std::exception_ptr e) { failure = e; });
    io.run();
    if (failure) {
        fmt::print(stderr, "dbxfer: {}\n", DescribeException(failure));
        return kExitFailure;
    }
    return 0;
}

enum Option {
    kIfExists = 256,
    kSchema,
    kCreateSchema,
    kWhere,
    kFromArg,
    kToArg,
    kTemporary,
    kMaxStreams,
    kHelp,
};

int CopyCommand(int argc, char** argv, const TransferConfig& config) {
    static struct option long_opts[] = {{"if-exists", required_argument, nullptr, kIfExists},
                                        {"schema", required_argument, nullptr, kSchema},
                                        {"create-schema", no_argument, nullptr, kCreateSchema},
                                        {"where", required_argument, nullptr, kWhere},
                                        {"from-arg", required_argument, nullptr, kFromArg},
                                        {"to-arg", required_argument, nullptr, kToArg},
                                        {"temporary", required_argument, nullptr, kTemporary},
                                        {"max-streams", required_argument, nullptr, kMaxStreams},
                                        {"help", no_argument, nullptr, kHelp},
                                        {nullptr, 0, nullptr, 0}};

    CopyRequest request;
    request.max_streams = config.max_streams;
    std::vector<std::string> from_args;
    std::vector<std::string> to_args;
    std::vector<std::string> temporaries;

    int opt;
    while ((opt = getopt_long(argc, argv, "h", long_opts, nullptr)) != -1) {
        switch (opt) {
        case kIfExists:
            request.if_exists = OrUsage(IfExists::Parse(optarg));
            break;
        case kSchema:
            request.schema = OrUsage(ParseLocator(optarg));
            break;
        case kCreateSchema:
            request.create_schema = true;
            break;
        case kWhere:
            request.where_clause = optarg;
            break;
        case kFromArg:
            from_args.emplace_back(optarg);
            break;
        case kToArg:
            to_args.emplace_back(optarg);
            break;
        case kTemporary:
            temporaries.emplace_back(optarg);
            break;
        case kMaxStreams: {
            std::string_view s(optarg);
            std::size_t n = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
            if (ec != std::errc{} || ptr != s.data() + s.size() || n == 0) {
                fmt::print(stderr, "dbxfer: --max-streams must be a positive integer\n");
                return kExitUsage;
            }
            request.max_streams = n;
            break;
        }
        case 'h':
        case kHelp:
            PrintUsage();
            return 0;
        default:
            PrintUsage();
            return kExitUsage;
        }
    }

    if (argc - optind != 2) {
        fmt::print(stderr, "dbxfer: cp expects FROM and TO locators\n");
        return kExitUsage;
    }
    request.from = OrUsage(ParseLocator(argv[optind]));
    request.to = OrUsage(ParseLocator(argv[optind + 1]));
    request.from_args = OrUsage(DriverArgs::Parse(from_args));
    request.to_args = OrUsage(DriverArgs::Parse(to_args));
    request.temporary_storage = TemporaryStorage(std::move(temporaries));

    // Refuse unsupported requests before connecting to anything.
    OrUsage(NegotiateCopy(request));

    asio::io_context io;
    auto logger = MakeLogger("dbxfer", config.log_level);
    return RunToCompletion(io, RunCopy(std::move(logger), std::move(request)));
}

int ConvCommand(int argc, char** argv, const TransferConfig& config) {
    static struct option long_opts[] = {{"if-exists", required_argument, nullptr, kIfExists},
                                        {"help", no_argument, nullptr, kHelp},
                                        {nullptr, 0, nullptr, 0}};

    IfExists if_exists;
    int opt;
    while ((opt = getopt_long(argc, argv, "h", long_opts, nullptr)) != -1) {
        switch (opt) {
        case kIfExists:
            if_exists = OrUsage(IfExists::Parse(optarg));
            break;
        case 'h':
        case kHelp:
            PrintUsage();
            return 0;
        default:
            PrintUsage();
            return kExitUsage;
        }
    }

    if (argc - optind != 2) {
        fmt::print(stderr, "dbxfer: conv expects FROM and TO locators\n");
        return kExitUsage;
    }
    auto from = OrUsage(ParseLocator(argv[optind]));
    auto to = OrUsage(ParseLocator(argv[optind + 1]));

    asio::io_context io;
    auto logger = MakeLogger("dbxfer", config.log_level);
    return RunToCompletion(io, RunConvertSchema(std::move(logger), std::move(from), std::move(to),
                                                std::move(if_exists)));
}

int FeaturesCommand(int argc, char** argv) {
    if (argc > 2) {
        fmt::print(stderr, "dbxfer: features expects at most one locator\n");
        return kExitUsage;
    }
    if (argc == 2) {
        auto locator = OrUsage(ParseLocator(argv[1]));
        fmt::print("{}", locator->GetFeatures().Describe());
        return 0;
    }
    for (const auto& scheme : LocatorSchemes()) {
        fmt::print("{}\n{}\n", scheme.scheme, scheme.features.Describe());
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    std::string_view command(argv[1]);
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }

    auto config = TransferConfig::FromEnvironment();
    if (!config) {
        fmt::print(stderr, "dbxfer: {}\n", config.error().message);
        return kExitUsage;
    }

    // Each command parses its own options, starting after the command name.
    if (command == "cp") return CopyCommand(argc - 1, argv + 1, *config);
    if (command == "conv") return ConvCommand(argc - 1, argv + 1, *config);
    if (command == "features") return FeaturesCommand(argc - 1, argv + 1);

    fmt::print(stderr, "dbxfer: unknown command {}\n", command);
    PrintUsage();
    return kExitUsage;
}
