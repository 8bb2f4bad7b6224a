#include <catch2/catch.hpp>
#include <uidkit/generator.hpp>
#include <uidkit/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 65536, 0)
#else
#include <unistd.h>
#endif

using namespace uidkit;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);

    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (auto lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        log::set_level(lvl);
        REQUIRE(log::get_level() == lvl);
    }
    log::set_level(log::Info);
}

TEST_CASE("parse_level() accepts every level name in any case", "[log]") {
    REQUIRE(log::parse_level("trace").value() == log::Trace);
    REQUIRE(log::parse_level("DEBUG").value() == log::Debug);
    REQUIRE(log::parse_level("Info").value() == log::Info);
    REQUIRE(log::parse_level("warn").value() == log::Warn);
    REQUIRE(log::parse_level("error").value() == log::Error);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = log::parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UidError::Config);
}

TEST_CASE("Colour can be toggled while other threads log", "[log]") {
    log::set_level(log::Info);

    auto output = capture_stderr([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 200; ++i) {
                    if (t % 2 == 0) {
                        log::set_color_enabled(i % 2 == 0);
                        (void)log::is_color_enabled();
                    } else {
                        log::info("line %d", i);
                    }
                }
            });
        }
        for (auto& th : threads) th.join();
    });
    REQUIRE(output.find("line 199") != std::string::npos);

    log::set_color_enabled(false);
    REQUIRE_FALSE(log::is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    log::set_level(log::Warn);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        log::info("should not appear");
    });
    REQUIRE(output.empty());

    log::set_level(log::Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    log::set_level(log::Warn);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        log::warn("counter at %06x", 0x2a);
        log::error("namespace %s rejected", "xyz");
    });
    REQUIRE(output.find("warn: counter at 00002a") != std::string::npos);
    REQUIRE(output.find("error: namespace xyz rejected") != std::string::npos);

    log::set_level(log::Info);
}

TEST_CASE("Per-call machine id mode logs a warning", "[log]") {
    log::set_level(log::Info);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        GeneratorOptions opts;
        opts.machine_id_mode = MachineIdMode::PerCall;
        IdGenerator gen(opts);
    });
    REQUIRE(output.find("warn: machine id is re-drawn") != std::string::npos);
}

TEST_CASE("Counter seeding is logged at debug level", "[log]") {
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        GeneratorOptions opts;
        opts.counter_start = 0x10;
        IdGenerator gen(opts);
        gen.object_id();
    });
    REQUIRE(output.find("debug: object id counter starts at 000010") != std::string::npos);

    log::set_level(log::Info);
}
