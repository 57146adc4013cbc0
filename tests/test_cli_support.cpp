#include <doctest/doctest.h>
#include "ebc/cli_support.hpp"
#include "ebc/measurement.hpp"
#include "ebc/sample_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace ebc;
namespace fs = std::filesystem;

// Fresh scratch file per test case, removed on scope exit.
struct ScratchFile {
    fs::path path;
    explicit ScratchFile(const std::string& name)
        : path(fs::temp_directory_path() / ("ebc_cli_support_" + name)) {
        std::error_code ec;
        fs::remove(path, ec);
    }
    ~ScratchFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
    void put(const std::string& text) const {
        std::ofstream f(path, std::ios::trunc);
        f << text;
    }
    std::string get() const {
        std::ifstream f(path);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};

static double fixed_clock() { return 1.0; }

// ---- select_action() ----

TEST_CASE("No action flag means monitor") {
    Action a = Action::ChargeCv;
    CHECK(select_action(ActionFlags{}, a) == Error::None);
    CHECK(a == Action::Monitor);
}

TEST_CASE("A single action flag is selected") {
    ActionFlags f;
    f.discharge_cp = true;
    Action a = Action::Monitor;
    CHECK(select_action(f, a) == Error::None);
    CHECK(a == Action::DischargeCp);
}

TEST_CASE("Two action flags are rejected with exit code 2") {
    ActionFlags f;
    f.charge_cccv  = true;
    f.discharge_cc = true;
    Action a = Action::Monitor;
    const Error e = select_action(f, a);
    CHECK(e == Error::ConflictingActions);
    CHECK(exit_code_for(e) == 2);
    CHECK(std::string(to_string(e)) == "need_at_most_one_action");

    ActionFlags g;
    g.monitor = true;
    g.charge  = true;
    CHECK(select_action(g, a) == Error::ConflictingActions);
}

// ---- output_policy() ----

TEST_CASE("Append wins over force") {
    CHECK(output_policy(false, false) == OutputPolicy::Refuse);
    CHECK(output_policy(true, false) == OutputPolicy::Overwrite);
    CHECK(output_policy(false, true) == OutputPolicy::Append);
    CHECK(output_policy(true, true) == OutputPolicy::Append);
}

// ---- open_output() ----

TEST_CASE("New file is created with a header") {
    ScratchFile f("new.csv");
    std::ofstream out;
    bool header = false;
    CHECK(open_output(f.path.string(), OutputPolicy::Refuse, out, header) == Error::None);
    CHECK(header);
    CHECK(out.is_open());
}

TEST_CASE("Existing file is left alone without -f or -a, exit code 1") {
    ScratchFile f("exists.csv");
    f.put("old data\n");
    std::ofstream out;
    bool header = true;
    const Error e = open_output(f.path.string(), OutputPolicy::Refuse, out, header);
    CHECK(e == Error::OutputExists);
    CHECK(exit_code_for(e) == 1);
    CHECK(!out.is_open());
    CHECK(f.get() == "old data\n");
}

TEST_CASE("Overwrite truncates and writes a header") {
    ScratchFile f("overwrite.csv");
    f.put("old data\n");
    std::ofstream out;
    bool header = false;
    CHECK(open_output(f.path.string(), OutputPolicy::Overwrite, out, header) == Error::None);
    CHECK(header);
    out.close();
    CHECK(f.get().empty());
}

TEST_CASE("Appending to a non-empty file keeps it and skips the second header") {
    ScratchFile f("append.csv");
    {
        std::ofstream out;
        bool header = false;
        REQUIRE(open_output(f.path.string(), OutputPolicy::Refuse, out, header) == Error::None);
        CsvSampleWriter w(out, header, fixed_clock);
        w.on_measurement(Measurement{});
    }
    {
        std::ofstream out;
        bool header = true;
        REQUIRE(open_output(f.path.string(), OutputPolicy::Append, out, header) == Error::None);
        CHECK(!header);
        CsvSampleWriter w(out, header, fixed_clock);
        w.on_measurement(Measurement{});
    }

    const std::string text = f.get();
    std::size_t headers = 0;
    for (std::size_t pos = text.find("time,regime"); pos != std::string::npos;
         pos = text.find("time,regime", pos + 1))
        ++headers;
    CHECK(headers == 1);
    CHECK(text.rfind("time,regime", 0) == 0);
    CHECK(text.find("1.000000,00,D_CC,IDLE") != text.rfind("1.000000,00,D_CC,IDLE"));
}

TEST_CASE("Appending to an empty or missing file still writes a header") {
    ScratchFile empty("append_empty.csv");
    empty.put("");
    std::ofstream out;
    bool header = false;
    CHECK(open_output(empty.path.string(), OutputPolicy::Append, out, header) == Error::None);
    CHECK(header);

    ScratchFile missing("append_missing.csv");
    std::ofstream out2;
    header = false;
    CHECK(open_output(missing.path.string(), OutputPolicy::Append, out2, header) == Error::None);
    CHECK(header);
}

TEST_CASE("Unwritable location is OutputOpenFailed") {
    const fs::path p = fs::temp_directory_path() / "ebc_cli_support_no_such_dir" / "x.csv";
    std::ofstream out;
    bool header = false;
    const Error e = open_output(p.string(), OutputPolicy::Overwrite, out, header);
    CHECK(e == Error::OutputOpenFailed);
    CHECK(exit_code_for(e) == 1);
}

// ---- exit_code_for() ----

TEST_CASE("Exit codes") {
    CHECK(exit_code_for(Error::None) == 0);
    CHECK(exit_code_for(Error::Interrupted) == 0);
    CHECK(exit_code_for(Error::OutOfRange) == 2);
    CHECK(exit_code_for(Error::InvalidMode) == 2);
    CHECK(exit_code_for(Error::ConnectionError) == 1);
    CHECK(exit_code_for(Error::CommunicationError) == 1);
}
