#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <spdlog/spdlog.h>

#include "util/http.hpp"

int main(int argc, char *argv[])
{
    http::CurlGlobal curl;
    spdlog::set_level(spdlog::level::warn);

    return Catch::Session().run(argc, argv);
}
