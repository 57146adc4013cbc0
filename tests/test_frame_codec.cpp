#include <doctest/doctest.h>
#include "fakes.hpp"

#include "ebc/frame_codec.hpp"

using namespace ebc;
using ebc::test::Bytes;
using ebc::test::CapturingLogger;
using ebc::test::Reading;
using ebc::test::make_response;

// ---- build_command() ----

TEST_CASE("CONNECT frame is FA 05 00.. 05 F8") {
    Bytes out;
    REQUIRE(build_command(MODE_SYS, CMD_CONNECT, {}, out) == Error::None);
    const Bytes want = {0xFA, 0x05, 0, 0, 0, 0, 0, 0, 0x05, 0xF8};
    CHECK(out == want);
}

TEST_CASE("Command byte packs mode high, command low") {
    Bytes out;
    REQUIRE(build_command(MODE_C_CCCV, CMD_ADJUST, {}, out) == Error::None);
    CHECK(out[1] == 0x77);
    REQUIRE(build_command(MODE_D_CP, CMD_START, {}, out) == Error::None);
    CHECK(out[1] == 0x11);
    REQUIRE(build_command(15, 15, {}, out) == Error::None);
    CHECK(out[1] == 0xFF);
}

TEST_CASE("Short payload is zero padded, long payload is truncated") {
    Bytes out;
    REQUIRE(build_command(MODE_D_CC, CMD_START, {0x12, 0x34}, out) == Error::None);
    REQUIRE(out.size() == COMMAND_LENGTH);
    CHECK(out[2] == 0x12);
    CHECK(out[3] == 0x34);
    for (int i = 4; i < 8; ++i) CHECK(out[i] == 0x00);

    REQUIRE(build_command(MODE_D_CC, CMD_START, {1, 2, 3, 4, 5, 6, 7, 8}, out) == Error::None);
    REQUIRE(out.size() == COMMAND_LENGTH);
    CHECK(out[7] == 6);
    CHECK(out[8] == (0x01 ^ 1 ^ 2 ^ 3 ^ 4 ^ 5 ^ 6));
    CHECK(out[9] == END_BYTE);
}

TEST_CASE("Checksum covers command byte and payload only") {
    Bytes out;
    REQUIRE(build_command(MODE_C_LIPO, CMD_START, {0x04, 0x28, 0x00, 0x02, 0x00, 0x3C}, out) == Error::None);
    CHECK(out[8] == xor_checksum(&out[1], 7));
    CHECK(out[8] == (0x41 ^ 0x04 ^ 0x28 ^ 0x02 ^ 0x3C));
}

TEST_CASE("Mode or command outside one nibble is rejected") {
    Bytes out = {0xAA};
    CHECK(build_command(16, CMD_START, {}, out) == Error::InvalidNibble);
    CHECK(out.empty());
    CHECK(build_command(MODE_D_CC, 16, {}, out) == Error::InvalidNibble);
    CHECK(build_command(-1, CMD_START, {}, out) == Error::InvalidNibble);
    CHECK(build_command(MODE_D_CC, -3, {}, out) == Error::InvalidNibble);
}

// ---- parse_response() ----

TEST_CASE("Well-formed response decodes every field") {
    Reading r;
    r.regime   = 17;          // WORKING, C_CCCV
    r.i_ma     = 1234;
    r.u_mv     = 4150;
    r.charge   = 321;
    r.i_set_ma = 1000;
    r.u_cut    = 420;
    r.max_time = 90;
    r.ident    = 0x06;

    CapturingLogger log;
    auto m = parse_response(make_response(r), log);
    REQUIRE(m);
    CHECK(m->regime == 17);
    CHECK(m->mode == MODE_C_CCCV);
    CHECK(m->state == STATE_WORKING);
    CHECK(m->mode_str() == "C_CCCV");
    CHECK(m->state_str() == "WORKING");
    CHECK(m->i_measured == doctest::Approx(1.234));
    CHECK(m->u_measured == doctest::Approx(4.150));
    CHECK(m->stored_charge == 321);
    CHECK(m->i_setting == doctest::Approx(1.0));
    CHECK(m->u_cutoff == doctest::Approx(4.20));
    CHECK(m->max_time == 90);
    CHECK(m->ident == 0x06);
    CHECK(m->ident_hex() == "06");
    CHECK(m->regime_hex() == "11");
    CHECK(m->unk1 == "0000");
    CHECK(m->raw.size() == 2 * RESPONSE_LENGTH);
    CHECK(m->raw.substr(0, 4) == "fa11");
    CHECK(!m->is_terminal());
    CHECK(log.lines.empty());
}

TEST_CASE("IDLE and COMPLETED are terminal") {
    CapturingLogger log;
    CHECK(parse_response(ebc::test::frame(STATE_IDLE, MODE_D_CC, 3700), log)->is_terminal());
    CHECK(parse_response(ebc::test::frame(STATE_COMPLETED, MODE_C_LIPO, 4200), log)->is_terminal());
    CHECK(!parse_response(ebc::test::frame(STATE_WORKING, MODE_D_CP, 3900), log)->is_terminal());
}

TEST_CASE("Empty read is a silent timeout") {
    CapturingLogger log;
    CHECK(!parse_response({}, log));
    CHECK(log.lines.empty());
}

TEST_CASE("Wrong length is rejected and logged") {
    CapturingLogger log;
    Bytes f = make_response(Reading{});
    f.pop_back();
    CHECK(!parse_response(f, log));
    CHECK(log.count(LogLevel::Error) == 1);

    f = make_response(Reading{});
    f.push_back(0x00);
    CHECK(!parse_response(f, log));
    CHECK(log.count(LogLevel::Error) == 2);
}

TEST_CASE("Wrong sentinels are rejected") {
    CapturingLogger log;
    Bytes f = make_response(Reading{});
    f[0] = 0xFB;
    CHECK(!parse_response(f, log));

    f = make_response(Reading{});
    f[18] = 0x00;
    CHECK(!parse_response(f, log));
    CHECK(log.count(LogLevel::Error) == 2);
}

TEST_CASE("Checksum mismatch only warns; the frame is still used") {
    CapturingLogger log;
    Reading r;
    r.regime = 20;
    r.u_mv   = 3333;
    auto m = parse_response(make_response(r, /*bad_checksum=*/true), log);
    REQUIRE(m);
    CHECK(m->u_measured == doctest::Approx(3.333));
    CHECK(m->state_str() == "COMPLETED");
    CHECK(log.count(LogLevel::Warning) == 1);
    CHECK(log.count(LogLevel::Error) == 0);
}

TEST_CASE("Unknown regime digits get UNKNOWN_ names") {
    CapturingLogger log;
    Reading r;
    r.regime = 99;
    auto m = parse_response(make_response(r), log);
    REQUIRE(m);
    CHECK(m->mode_str() == "UNKNOWN_9");
    CHECK(m->state_str() == "UNKNOWN_9");
    CHECK(!m->is_terminal());
    CHECK(mode_name(MODE_D_CC) == "D_CC");
}

TEST_CASE("fields() keeps wire order") {
    CapturingLogger log;
    Reading r;
    r.regime   = 10;
    r.u_cut    = 420;
    r.i_set_ma = 500;
    auto m = parse_response(make_response(r), log);
    REQUIRE(m);
    const auto f = m->fields();
    const char* names[] = {"regime", "mode", "state", "i_measured", "u_measured", "stored_charge",
                           "i_setting", "u_cutoff", "max_time", "ident", "unk1", "raw_data"};
    REQUIRE(f.size() == 12);
    for (std::size_t i = 0; i < f.size(); ++i) CHECK(f[i].first == names[i]);
    CHECK(f[0].second == "0a");
    CHECK(f[1].second == "D_CC");
    CHECK(f[2].second == "WORKING");
    CHECK(f[6].second == "0.5");
    CHECK(f[7].second == "4.2");
}
