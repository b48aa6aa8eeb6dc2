#pragma once

#include "test_helpers.hpp"
#include <stacy/runner.hpp>

namespace stacy::testing {

// Stand-in for `stata -b -q do <file>`: copies the do-file (and a file it
// runs with `do "<path>"`) into <stem>.log in the working directory, so a
// script's text is its own log. "* sleep" makes it hang, "* env" records
// S_ADO and STACY_ARG_YEAR at the top of the log.
inline const char* kFakeStata = R"SH(#!/bin/sh
f="$4"
stem=$(basename "$f" .do)
log="$stem.log"
: > "$log"
if grep -q '^\* env' "$f"; then
    printf 'S_ADO=%s\nYEAR=%s\n' "$S_ADO" "$STACY_ARG_YEAR" >> "$log"
fi
if grep -q '^\* sleep' "$f"; then
    sleep 30
fi
cat "$f" >> "$log"
inner=$(sed -n 's/^do "\(.*\)"$/\1/p' "$f")
if [ -n "$inner" ]; then
    cat "$inner" >> "$log"
fi
exit 0
)SH";

inline const char* kPassingDo =
    ". display 1\n"
    "1\n"
    "\n"
    "end of do-file\n";

inline const char* kMissingFileDo =
    ". use survey\n"
    "file survey.dta not found\n"
    "r(601);\n"
    "\n"
    "end of do-file\n"
    "r(601);\n";

// Project directory holding the fake interpreter
struct FakeStata {
    TempDir td;
    std::string interpreter;

    explicit FakeStata(const std::string& prefix = "stacy_fake_stata")
        : td(prefix) {
        interpreter = td.write_executable("bin/stata-mp", kFakeStata).string();
    }

    RunnerOptions options() const {
        RunnerOptions opts;
        opts.interpreter = interpreter;
        opts.kill_grace_seconds = 1;
        return opts;
    }

    ExecutionRequest request(const std::string& script) const {
        ExecutionRequest req;
        req.script = script;
        req.working_dir = td.path.string();
        return req;
    }
};

} // namespace stacy::testing
