#ifndef APP_CONFIG_HPP_
#define APP_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

enum class Mode {
    LINE,
    FRAME,
    RAW,
};

struct Config
{
    std::string host;
    std::string port;

    std::string driver{"openssl"};

    Mode mode{Mode::LINE};

    std::string send;
    bool sendFramed{false};

    size_t readChunkSize{4096};
    uint32_t maxFrame{0};  // 0 means unlimited

    bool isVerbose{false};

    Config(int argc, char *argv[]);
};

#endif  // APP_CONFIG_HPP_
