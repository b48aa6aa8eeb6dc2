#include <catch2/catch.hpp>
#include <stacy/log_parser.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace stacy;
namespace fs = std::filesystem;

static fs::path scratch_dir() {
    const char* src = std::getenv("STACY_SOURCE_DIR");
    fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
    fs::path dir = base / "test_log_parser_tmp";
    fs::create_directories(dir);
    return dir;
}

// ===== Markers =====

TEST_CASE("status marker parsing", "[log_parser]") {
    int code = 0;
    REQUIRE(parse_status_marker("r(199);", code));
    REQUIRE(code == 199);
    REQUIRE(parse_status_marker("   r(601);  ", code));
    REQUIRE(code == 601);
    REQUIRE_FALSE(parse_status_marker("r(abc);", code));
    REQUIRE_FALSE(parse_status_marker("r();", code));
    REQUIRE_FALSE(parse_status_marker("error r(199); here", code));
    REQUIRE_FALSE(parse_status_marker("r(199)", code));
}

TEST_CASE("command echo detection", "[log_parser]") {
    REQUIRE(is_command_echo(". regress y x"));
    REQUIRE(is_command_echo("."));
    REQUIRE(is_command_echo("> , robust"));
    REQUIRE(is_command_echo("2. display 1"));
    REQUIRE(is_command_echo("10."));
    REQUIRE_FALSE(is_command_echo("variable x not found"));
    REQUIRE_FALSE(is_command_echo("3.14 is pi"));
}

// ===== Detection =====

TEST_CASE("trailing status marker is a failure", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        ". use missing.dta\n"
        "file missing.dta not found\n"
        "r(601);\n"
        "\n"
        "end of do-file\n"
        "r(601);\n");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].code.code == 601);
    REQUIRE(r.errors[0].code.name == "file not found");
    REQUIRE(r.errors[0].context == "file missing.dta not found");
    REQUIRE(r.errors[0].line == 6);
    REQUIRE(r.errors[0].lines_from_end == 0);
}

TEST_CASE("clean completion is success", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        ". display 1+1\n"
        "2\n"
        "\n"
        "end of do-file\n");
    REQUIRE(r.success);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.errors.empty());
    REQUIRE_FALSE(r.incomplete);
}

TEST_CASE("displayed status text is not an error", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        ". display \"r(199);\"\n"
        "r(199);\n"
        "\n"
        ". display \"done\"\n"
        "done\n"
        "\n"
        "end of do-file\n");
    REQUIRE(r.success);
    REQUIRE(r.exit_code == 0);
}

TEST_CASE("captured errors report success", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        ". capture use nothere.dta\n"
        "\n"
        ". display _rc\n"
        "601\n"
        "\n"
        "end of do-file\n");
    REQUIRE(r.success);
}

TEST_CASE("nested do-files use the last marker", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        ". do helper.do\n"
        ". foo\n"
        "command foo is unrecognized\n"
        "r(199);\n"
        "\n"
        "end of do-file\n"
        "r(199);\n"
        "\n"
        "end of do-file\n"
        "r(199);\n");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.exit_code == 2);
    REQUIRE(r.errors[0].context == "command foo is unrecognized");
}

TEST_CASE("blank and break lines between marker and status", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        "--Break--\n"
        "r(1);\n"
        "end of do-file\n"
        "\n"
        "--Break--\n"
        "r(1);\n");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.errors[0].code.code == 1);
    REQUIRE(r.exit_code == 1);
}

TEST_CASE("other output after marker stops the scan", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(
        "end of do-file\n"
        "some trailer\n"
        "r(199);\n");
    REQUIRE(r.success);
}

TEST_CASE("missing completion marker is incomplete", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text(". sleep 100000\n");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.incomplete);
    REQUIRE(r.exit_code == 1);
    REQUIRE(r.errors.empty());
}

TEST_CASE("unlisted code uses range fallback", "[log_parser]") {
    LogParser p;
    auto r = p.parse_text("end of do-file\nr(688);\n");
    REQUIRE(r.exit_code == 3);
    REQUIRE_FALSE(r.errors[0].code.known);
}

TEST_CASE("signal result is distinct from code space", "[log_parser]") {
    auto r = DetectionResult::from_signal(9, 1.5, "x.log");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.exit_code == 137);
    REQUIRE(r.signal == 9);
    REQUIRE(r.errors.empty());
}

// ===== Tail window =====

TEST_CASE("ring keeps only the last K lines", "[log_parser]") {
    TailWindow w(3);
    for (int i = 1; i <= 10; ++i) w.push("line " + std::to_string(i));
    REQUIRE(w.size() == 3);
    REQUIRE(w.at(0) == "line 8");
    REQUIRE(w.at(2) == "line 10");
    REQUIRE(w.line_number(0) == 8);
    REQUIRE(w.total_pushed() == 10);
}

TEST_CASE("overlong lines are truncated", "[log_parser]") {
    TailWindow w(2);
    w.push(std::string(TailWindow::kMaxLineLength * 2, 'x'));
    REQUIRE(w.at(0).size() == TailWindow::kMaxLineLength);
}

TEST_CASE("large log reads a bounded window", "[log_parser]") {
    fs::path path = scratch_dir() / "big.log";
    {
        std::ofstream out(path);
        out << ". display \"r(198);\"\nr(198);\n";
        for (int i = 0; i < 50000; ++i) {
            out << "observation " << i << " processed with a fairly long line of text\n";
        }
        out << "file out.csv not found\nr(601);\n\nend of do-file\nr(601);\n";
    }

    auto window = TailWindow::read_file(path.string());
    REQUIRE(window.is_ok());
    REQUIRE(window.value().size() <= TailWindow::kDefaultLines);
    // Window did not reach the start, so absolute numbers are unknown
    REQUIRE(window.value().line_number(0) == 0);

    LogParser p;
    auto r = p.parse_file(path.string());
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().success);
    REQUIRE(r.value().errors[0].code.code == 601);
    REQUIRE(r.value().errors[0].line == 0);
    REQUIRE(r.value().errors[0].context == "file out.csv not found");
    REQUIRE(r.value().log_path == path.string());

    fs::remove(path);
}

TEST_CASE("small log keeps absolute line numbers", "[log_parser]") {
    fs::path path = scratch_dir() / "small.log";
    {
        std::ofstream out(path);
        out << ". foo\ncommand foo is unrecognized\nr(199);\n\nend of do-file\nr(199);\n";
    }
    LogParser p;
    auto r = p.parse_file(path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().errors[0].line == 6);
    fs::remove(path);
}

TEST_CASE("missing log file is an error", "[log_parser]") {
    LogParser p;
    auto r = p.parse_file((scratch_dir() / "does_not_exist.log").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::NotFound);
}
