#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include <wirebuf/chunk.hpp>
#include <wirebuf/connection.hpp>
#include <wirebuf/connection_config.hpp>
#include <wirebuf/connection_factory.hpp>
#include <wirebuf/exceptions.hpp>
#include <wirebuf/reader.hpp>
#include <wirebuf/sink.hpp>
#include <wirebuf/writer.hpp>

#include "config.hpp"

using namespace wirebuf;

namespace {

void sendPayload(Config const& config, Sink& sink)
{
    Writer writer{sink};
    if (config.sendFramed) {
        writer.writeFrameLengthPrefixed(config.send);
    } else {
        writer.writeLine(config.send);
    }

    // blocking sockets, a stall only happens on transient conditions
    int attempts = 0;
    while (true) {
        try {
            writer.flush();
            return;
        }
        catch (IncompleteFlushError const&) {
            if (++attempts == 100) {
                throw;
            }
            spdlog::debug("Retrying flush");
        }
    }
}

void printToken(Chunk const& token)
{
    std::fwrite(token.data(), 1, token.size(), stdout);
    std::fputc('\n', stdout);
}

// prints every complete token, leaves partial data in the reader
void drain(Config const& config, Reader& reader)
{
    while (true) {
        try {
            switch (config.mode) {
            case Mode::LINE:
                printToken(reader.extractLine());
                break;

            case Mode::FRAME:
                if (config.maxFrame != 0) {
                    auto const length = reader.peekU32(0, ByteOrder::BIG);
                    if (length > config.maxFrame) {
                        spdlog::error("Frame of {} bytes exceeds limit of {}", length, config.maxFrame);
                        throw WirebufException{"frame too large"};
                    }
                }
                printToken(reader.extractFrameLengthPrefixed());
                break;

            case Mode::RAW:
                if (reader.bytesAhead() > 0) {
                    auto const token = reader.extractAll();
                    std::fwrite(token.data(), 1, token.size(), stdout);
                }
                return;
            }
        }
        catch (OutOfDataError const&) {
            return;
        }
    }
}

}  // namespace

int main(int argc, char *argv[])
try {
    Config config{argc, argv};

    spdlog::set_level(config.isVerbose ? spdlog::level::debug : spdlog::level::warn);

    auto const connectionConfig = ConnectionConfig::Builder{}
        .host(config.host)
        .port(config.port)
        .readChunkSize(config.readChunkSize)
        .build();

    auto connection = ConnectionFactory::create(config.driver, connectionConfig);
    if (!connection) {
        throw std::runtime_error{"no such driver: " + config.driver};
    }

    if (!config.send.empty()) {
        sendPayload(config, connection->sink());
    }

    FillableReader reader{config.readChunkSize};
    while (true) {
        try {
            reader.fillFrom(connection->source());
        }
        catch (SourceClosedError const&) {
            spdlog::debug("Peer closed the connection");
            break;
        }
        drain(config, reader);
    }
    std::fflush(stdout);

    if (reader.bytesAhead() > 0) {
        spdlog::warn("{} trailing bytes without a complete token", reader.bytesAhead());
    }
}
catch (WirebufException const& e) {
    spdlog::error("WirebufException: {}", e.what());
    return EXIT_FAILURE;
}
catch (std::exception const& e) {
    spdlog::error("Exception: {}", e.what());
    return EXIT_FAILURE;
}
