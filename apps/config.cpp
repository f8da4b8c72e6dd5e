#include "config.hpp"

#include <cstdlib>
#include <map>

#include <CLI/CLI.hpp>

Config::Config(int argc, char *argv[])
{
    CLI::App app{"Splits a TCP byte stream into lines or frames"};

    app.add_option("host", host, "Peer host name")
        ->required();
    app.add_option("port", port, "Peer port")
        ->required();

    app.add_option("--driver", driver, "I/O backend")
        ->check(CLI::IsMember({"openssl", "mbedtls"}))
        ->default_val(driver);

    std::map<std::string, Mode> const modes{
        {"line", Mode::LINE},
        {"frame", Mode::FRAME},
        {"raw", Mode::RAW},
    };
    app.add_option("--mode", mode, "How to split incoming bytes")
        ->transform(CLI::CheckedTransformer(modes, CLI::ignore_case));

    app.add_option("--send", send, "Payload to send once connected");
    app.add_flag("--send-frame", sendFramed, "Send the payload length-prefixed instead of as a line");

    app.add_option("--read-size", readChunkSize, "Maximum bytes per read")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-frame", maxFrame, "Reject frames larger than this (0 for no limit)");

    app.add_flag("--verbose", isVerbose, "Make the operation more talkative");

    try {
        app.parse(argc, argv);
    }
    catch (CLI::ParseError const& e) {
        std::exit(app.exit(e));
    }
}
