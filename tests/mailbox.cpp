#include <catch2/catch.hpp>

#include <string>
#include <thread>

#include <wirebuf/chunked_reader.hpp>
#include <wirebuf/mailbox.hpp>
#include <wirebuf/sink.hpp>
#include <wirebuf/writer.hpp>
using namespace wirebuf;

TEST_CASE("ChunkMailbox/batches", "[mailbox]") {
    ChunkMailbox mailbox;
    ActorSink sink{mailbox};
    Writer writer{sink};
    ChunkedReader reader;

    writer.writeLine("first");
    writer.flush();
    writer.flush();
    REQUIRE(mailbox.pendingBatches() == 1);

    writer.write(std::string(100, 'x'));
    writer.writeLine("");
    writer.flush();
    REQUIRE(mailbox.pendingBatches() == 2);

    REQUIRE(mailbox.drainInto(reader) == 7 + 102);
    REQUIRE(mailbox.pendingBatches() == 0);
    REQUIRE(mailbox.drainInto(reader) == 0);

    REQUIRE(reader.extractLine().view() == "first");
    REQUIRE(reader.extractLine().view() == std::string(100, 'x'));
    REQUIRE(reader.bytesAhead() == 0);
}

TEST_CASE("ChunkMailbox/across-threads", "[mailbox]") {
    constexpr int kFrames = 200;

    ChunkMailbox mailbox;
    std::thread sender{[&mailbox]() {
        ActorSink sink{mailbox};
        Writer writer{sink};
        for (int i = 0; i < kFrames; i++) {
            writer.writeFrameLengthPrefixed(std::to_string(i));
            if (i % 7 == 0) {
                writer.flush();
            }
        }
        writer.flush();
    }};
    sender.join();

    ChunkedReader reader;
    mailbox.drainInto(reader);

    for (int i = 0; i < kFrames; i++) {
        REQUIRE(reader.extractFrameLengthPrefixed().toString() == std::to_string(i));
    }
    REQUIRE(reader.bytesAhead() == 0);
    REQUIRE(reader.chunkCount() == 0);
}
