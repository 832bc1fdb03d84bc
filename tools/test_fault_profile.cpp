// test_fault_profile.cpp - Fault profile presets, overrides and validation
//
// Tests:
// 1. Built-in presets
// 2. Overrides on top of a preset
// 3. Validation rejects out-of-range fields
// 4. Curve files
// 5. RSSI synthesizer shaping
// 6. Scripted random source

#include "peripheral/fault_profile.hpp"
#include "peripheral/rssi_synth.hpp"
#include "common/random_source.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace gattbench;
using namespace gattbench::peripheral;

namespace {

std::string writeTempFile(const std::string& content) {
    char path[] = "/tmp/gattbench_curveXXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        return "";
    }
    close(fd);
    std::ofstream out(path);
    out << content;
    return path;
}

bool throwsConfigError(const FaultProfile& p) {
    try {
        validateFaultProfile(p);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== Fault Profile Tests ===\n\n";
    setLogLevel(LogLevel::WARN);

    int pass = 0, fail = 0;
    auto check = [&](bool ok, const std::string& what) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << "\n";
        if (ok) pass++; else fail++;
    };

    // ========================================================================
    // TEST 1: Built-in presets
    // ========================================================================
    std::cout << "TEST 1: Built-in presets\n";
    {
        check(presetNames().size() == 5, "five presets");
        for (const auto& name : presetNames()) {
            bool ok = true;
            try {
                FaultProfile p = presetProfile(name);
                validateFaultProfile(p);
                ok = p.name == name;
            } catch (const ConfigError&) {
                ok = false;
            }
            check(ok, "preset '" + name + "' resolves and validates");
        }

        FaultProfile best = presetProfile("best");
        check(!best.hasImpairments(), "best has no impairments");
        check(best.drop_percent == 0.0 && best.disconnect_chance == 0.0, "best never drops or disconnects");

        FaultProfile worst = presetProfile("worst");
        check(worst.hasImpairments(), "worst has impairments");
        check(worst.drop_percent > presetProfile("typical").drop_percent, "worst drops more than typical");
        check(worst.disconnect_chance > 0.0, "worst can disconnect");

        bool threw = false;
        try {
            presetProfile("garage");
        } catch (const ConfigError&) {
            threw = true;
        }
        check(threw, "unknown preset throws ConfigError");
        check(isPresetName("pocket") && !isPresetName("phone_in_pocket"), "isPresetName() matches preset names only");
    }

    // ========================================================================
    // TEST 2: Overrides
    // ========================================================================
    std::cout << "\nTEST 2: Overrides on top of a preset\n";
    {
        FaultOverrides none;
        check(none.empty(), "default overrides are empty");
        FaultProfile plain = resolveFaultProfile("typical", none);
        check(plain.name == "typical", "no overrides keeps the preset name");

        FaultOverrides o;
        o.drop_percent = 12.5;
        o.phy_profile = PhyProfile::VARYING;
        o.drop_curve = std::vector<double>{0.0, 0.5};
        check(!o.empty(), "overrides with values are not empty");

        FaultProfile p = resolveFaultProfile("typical", o);
        FaultProfile base = presetProfile("typical");
        check(p.drop_percent == 12.5, "drop_percent overridden");
        check(p.phy_profile == PhyProfile::VARYING, "phy_profile overridden");
        check(p.drop_curve.size() == 2, "drop_curve overridden");
        check(p.interval_jitter_ms == base.interval_jitter_ms, "unset fields keep the preset value");
        check(p.name == "typical+custom", "name marks the profile as customized");

        FaultOverrides bad;
        bad.malformed_chance = 140.0;
        bool threw = false;
        try {
            resolveFaultProfile("best", bad);
        } catch (const ConfigError&) {
            threw = true;
        }
        check(threw, "out-of-range override rejected at resolution");

        PhyProfile parsed = PhyProfile::FIXED;
        check(parsePhyProfile("varying", parsed) && parsed == PhyProfile::VARYING, "parsePhyProfile(varying)");
        check(!parsePhyProfile("wobbly", parsed), "parsePhyProfile rejects unknown names");
    }

    // ========================================================================
    // TEST 3: Validation
    // ========================================================================
    std::cout << "\nTEST 3: Validation\n";
    {
        FaultProfile p;
        p.drop_percent = 101.0;
        check(throwsConfigError(p), "drop_percent > 100 rejected");

        p = FaultProfile{};
        p.drop_percent = -1.0;
        check(throwsConfigError(p), "negative drop_percent rejected");

        p = FaultProfile{};
        p.disconnect_chance = NAN;
        check(throwsConfigError(p), "NaN probability rejected");

        p = FaultProfile{};
        p.interval_jitter_ms = -3;
        check(throwsConfigError(p), "negative jitter rejected");

        p = FaultProfile{};
        p.interval_curve_ms = {25, 0, 25};
        check(throwsConfigError(p), "non-positive interval curve entry rejected");

        p = FaultProfile{};
        p.drop_curve = {0.1, 1.5};
        check(throwsConfigError(p), "drop curve probability > 1 rejected");

        p = FaultProfile{};
        p.drop_percent = 100.0;
        p.command_ignore_chance = 0.0;
        check(!throwsConfigError(p), "boundary values 0 and 100 accepted");
    }

    // ========================================================================
    // TEST 4: Curve files
    // ========================================================================
    std::cout << "\nTEST 4: Curve files\n";
    {
        std::string good = writeTempFile("[25, 30, 40.5]\n");
        std::vector<double> curve;
        bool ok = true;
        try {
            curve = loadCurveFile(good);
        } catch (const ConfigError&) {
            ok = false;
        }
        check(ok && curve.size() == 3 && curve[2] == 40.5, "JSON array loaded");

        auto rejects = [](const std::string& path) {
            try {
                loadCurveFile(path);
            } catch (const ConfigError&) {
                return true;
            }
            return false;
        };
        std::string not_json = writeTempFile("25, 30, 40");
        std::string empty = writeTempFile("[]");
        std::string mixed = writeTempFile("[25, \"fast\"]");
        check(rejects(not_json), "invalid JSON rejected");
        check(rejects(empty), "empty array rejected");
        check(rejects(mixed), "non-numeric entry rejected");
        check(rejects("/nonexistent/curve.json"), "missing file rejected");

        for (const auto& path : {good, not_json, empty, mixed}) {
            std::remove(path.c_str());
        }
    }

    // ========================================================================
    // TEST 5: RSSI synthesizer
    // ========================================================================
    std::cout << "\nTEST 5: RSSI synthesizer shaping\n";
    {
        MtRandomSource rng(7);
        RssiSynthesizer synth(rng);

        FaultProfile p;
        p.rssi_base_dbm = -60.0;
        p.rssi_drift_dbm = -1.0;
        synth.setProfile(p);
        check(synth.level(0) == -60, "base level at t=0");
        check(synth.level(10000) == -70, "linear drift of -1 dBm/s over 10 s");
        synth.restart(10000);
        check(synth.level(10000) == -60 && synth.level(15000) == -65, "drift measured from the restart origin");
        synth.setProfile(p, 20000);
        check(synth.level(20000) == -60 && synth.level(5000) == -60, "no drift before the origin");

        p = FaultProfile{};
        p.rssi_base_dbm = -60.0;
        p.rssi_wave_amplitude = 6.0;
        p.rssi_wave_period_s = 4.0;
        synth.setProfile(p);
        check(synth.level(1000) == -54, "wave peak a quarter period in");
        check(synth.level(3000) == -66, "wave trough three quarters in");

        p = FaultProfile{};
        p.rssi_curve_dbm = {-50, -60, -70};
        synth.setProfile(p);
        int a = synth.read(0), b = synth.read(0), c = synth.read(0), d = synth.read(0);
        check(a == -50 && b == -60 && c == -70 && d == -50, "curve replayed cyclically per read");

        p = FaultProfile{};
        p.rssi_base_dbm = -200.0;
        synth.setProfile(p);
        check(synth.level(0) == RSSI_MIN_DBM, "level clamped to the valid range");

        synth.setHardwareReading(-42);
        check(synth.read(0) == -42, "hardware reading wins over synthesis");
    }

    // ========================================================================
    // TEST 6: Scripted random source
    // ========================================================================
    std::cout << "\nTEST 6: Scripted random source\n";
    {
        ScriptedRandomSource once({0.1, 0.2}, 0.75);
        double a = once.uniform(), b = once.uniform(), c = once.uniform(), d = once.uniform();
        check(a == 0.1 && b == 0.2, "script replayed in order");
        check(c == 0.75 && d == 0.75, "fallback once the script is exhausted");

        ScriptedRandomSource looped({0.1, 0.2});
        looped.setWrap(true);
        looped.uniform();
        looped.uniform();
        check(looped.uniform() == 0.1, "setWrap(true) starts the script over");

        ScriptedRandomSource counted({0.5});
        bool never = counted.chancePercent(0.0);
        bool always = counted.chancePercent(100.0);
        check(!never && always && counted.drawCount() == 0, "certain outcomes consume no draw");
        check(counted.chancePercent(60.0) && counted.drawCount() == 1, "0.5 falls under 60%");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All fault profile tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
