#include <catch2/catch.hpp>
#include <stacy/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#include <unistd.h>

using namespace stacy::log;

// Capture what fn writes to stderr
static std::string capture_stderr(const std::function<void()>& fn) {
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

// Restores level and color settings on scope exit
struct LogState {
    Level level = get_level();
    bool color = is_color_enabled();
    LogState() { set_color_enabled(false); }
    ~LogState() {
        set_level(level);
        set_color_enabled(color);
    }
};

TEST_CASE("parse level names", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("WARNING", lvl));
    REQUIRE(lvl == Warn);
    REQUIRE(parse_level("quiet", lvl));
    REQUIRE(lvl == Off);

    lvl = Error;
    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE(lvl == Error);
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Off)) == "off");
}

TEST_CASE("messages below the level are dropped", "[log]") {
    LogState state;
    set_level(Warn);

    auto out = capture_stderr([] {
        info("resolving %s", "estout");
        warn("ignoring %s", "vendor/old.ado");
        error("%d scripts failed", 2);
    });
    REQUIRE(out.find("resolving") == std::string::npos);
    REQUIRE(out.find("warn: ignoring vendor/old.ado\n") != std::string::npos);
    REQUIRE(out.find("error: 2 scripts failed\n") != std::string::npos);
}

TEST_CASE("off silences every level", "[log]") {
    LogState state;
    set_level(Off);
    auto out = capture_stderr([] { error("should not appear"); });
    REQUIRE(out.empty());
}

TEST_CASE("raw lines ignore the level", "[log]") {
    LogState state;
    set_level(Off);
    auto out = capture_stderr([] {
        raw(". display 1");
        raw("1\n");
    });
    REQUIRE(out == ". display 1\n1\n");
}

TEST_CASE("scoped tags prefix this thread's lines", "[log]") {
    LogState state;
    set_level(Info);

    auto out = capture_stderr([] {
        ScopedTag outer("clean.do");
        info("started");
        {
            ScopedTag inner("fit.do");
            warn("slow");
        }
        info("done");
    });
    REQUIRE(out == "info: [clean.do] started\n"
                   "warn: [fit.do] slow\n"
                   "info: [clean.do] done\n");

    auto untagged = capture_stderr([] { info("plain"); });
    REQUIRE(untagged == "info: plain\n");
}

TEST_CASE("enabled follows the level", "[log]") {
    LogState state;
    set_level(Warn);
    REQUIRE_FALSE(enabled(Info));
    REQUIRE(enabled(Error));
    set_level(Off);
    REQUIRE_FALSE(enabled(Error));
}
