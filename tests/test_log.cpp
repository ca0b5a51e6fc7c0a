#include <catch2/catch.hpp>
#include <restorenom/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace restorenom::log;

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
    int n;
    while ((n = static_cast<int>(read(pipefd[0], buf, sizeof(buf)))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

// Collects sink output for the lifetime of the object
struct SinkCapture {
    std::vector<std::pair<Level, std::string>> lines;

    SinkCapture() {
        set_sink([this](Level lvl, const std::string& text) {
            lines.emplace_back(lvl, text);
        });
    }
    ~SinkCapture() { reset_sink(); }
};

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name and parse_level agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == lvl);
    }
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold reach stderr with a prefix", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("unable to find %s", "TargetFramework");
        error("restore failed");
    });
    REQUIRE(output.find("warn: unable to find TargetFramework\n") != std::string::npos);
    REQUIRE(output.find("error: restore failed\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] { info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("Sink receives formatted text instead of stderr", "[log]") {
    set_level(Debug);
    set_color_enabled(false);

    std::string output;
    std::vector<std::pair<Level, std::string>> lines;
    {
        SinkCapture capture;
        output = capture_stderr([] {
            debug("%zu update(s)", static_cast<size_t>(3));
            warn("configuration '%s'", "Debug|net6.0");
            trace("below threshold");
        });
        lines = capture.lines;
    }

    REQUIRE(output.empty());
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].first == Debug);
    REQUIRE(lines[0].second == "3 update(s)");
    REQUIRE(lines[1].first == Warn);
    REQUIRE(lines[1].second == "configuration 'Debug|net6.0'");

    set_level(Info);
}

TEST_CASE("A sink may log from inside the callback", "[log]") {
    set_level(Info);
    std::vector<std::string> lines;
    set_sink([&lines](Level, const std::string& text) {
        lines.push_back(text);
        if (text == "outer") info("nested");
    });
    warn("outer");
    reset_sink();

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "outer");
    REQUIRE(lines[1] == "nested");
}

TEST_CASE("A sink may remove itself", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    int calls = 0;
    set_sink([&calls](Level, const std::string&) {
        ++calls;
        reset_sink();
    });
    warn("first");
    auto output = capture_stderr([] { warn("second"); });

    REQUIRE(calls == 1);
    REQUIRE(output.find("warn: second\n") != std::string::npos);
}

TEST_CASE("reset_sink restores stderr output", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    {
        SinkCapture capture;
    }
    auto output = capture_stderr([] { info("back on stderr"); });
    REQUIRE(output.find("info: back on stderr") != std::string::npos);
}

TEST_CASE("Long messages are not truncated", "[log]") {
    set_level(Info);
    SinkCapture capture;
    std::string long_text(5000, 'x');
    info("%s", long_text.c_str());
    REQUIRE(capture.lines.size() == 1);
    REQUIRE(capture.lines[0].second.size() == 5000);
}
