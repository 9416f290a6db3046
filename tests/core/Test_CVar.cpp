#include <doctest/doctest.h>
#include "mmdv/app/ViewerConfig.hpp"
#include "mmdv/core/cvar.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace mmdv;

namespace {
    AUTO_CVAR_INT(test_counter, "Counter used by the CVar tests", 3, core::CVarFlags::save);
    AUTO_CVAR_FLOAT(test_scale, "Scale used by the CVar tests", 1.5f);
    AUTO_CVAR_STRING(test_locked, "Read-only CVar", "fixed", core::CVarFlags::read_only);

    // Restores a CVar's text value at scope exit
    struct CVarRestore {
        explicit CVarRestore(const char* name) : cvar(core::CVarSystem::find(name)), saved(cvar->toString()) {}
        ~CVarRestore() { cvar->setFromString(saved); }

        core::ICVar* cvar;
        std::string saved;
    };
}

TEST_CASE("CVar registry") {
    REQUIRE(core::CVarSystem::find("test_counter") != nullptr);
    CHECK(core::CVarSystem::find("no_such_cvar") == nullptr);
    CHECK(test_counter.get() == 3);

    SUBCASE("String round trip") {
        CVarRestore restore("test_scale");
        core::CVarSystem::find("test_scale")->setFromString("2.25");
        CHECK(test_scale.get() == doctest::Approx(2.25f));
    }

    SUBCASE("Loading an ini file") {
        CVarRestore counter("test_counter");
        CVarRestore scale("test_scale");
        const auto path = std::filesystem::temp_directory_path() / "mmdv_cvar_test.ini";
        {
            std::ofstream out(path, std::ios::trunc);
            out << "; comment\n"
                << "test_counter = 12\n"
                << "test_scale=not-a-number\n"
                << "test_locked=changed\n"
                << "unknown_cvar=1\n";
        }

        CHECK(core::CVarSystem::loadFromIni(path) == 1);
        CHECK(test_counter.get() == 12);
        CHECK(test_scale.get() == doctest::Approx(1.5f));
        CHECK(test_locked.get() == "fixed");
        std::filesystem::remove(path);
    }

    SUBCASE("Saving writes only persistent CVars") {
        CVarRestore counter("test_counter");
        const auto path = std::filesystem::temp_directory_path() / "mmdv_cvar_saved.ini";
        core::CVarSystem::saveToIni(path);

        std::ifstream in(path);
        const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(text.find("test_counter=3") != std::string::npos);
        CHECK(text.find("; Counter used by the CVar tests") != std::string::npos);
        CHECK(text.find("test_scale=") == std::string::npos);
        CHECK(text.find("test_locked=") == std::string::npos);

        test_counter.set(99);
        CHECK(core::CVarSystem::loadFromIni(path) > 0);
        CHECK(test_counter.get() == 3);
        std::filesystem::remove(path);
    }

    SUBCASE("Missing ini file") {
        CHECK(core::CVarSystem::loadFromIni("/nonexistent/mmdv.ini") == 0);
    }
}

TEST_CASE("Viewer settings") {
    SUBCASE("Defaults") {
        auto settings = app::readViewerSettings();
        REQUIRE(settings.has_value());
        CHECK(settings->modelPath == "assets/sour_miku_black.pmx");
        CHECK(settings->cameraMotionPath == "assets/GimmeGimmeC.vmd");
        CHECK(settings->evaluationMode == runtime::EvaluationMode::Parallel);
        CHECK(settings->vr.locomotion == xr::LocomotionMode::Free);
        CHECK(settings->vr.movementSensitivity == doctest::Approx(0.1f));
        CHECK(settings->shadowMapSize == 4096);
        CHECK(settings->samples == 4);
    }

    SUBCASE("Teleport locomotion") {
        CVarRestore restore("xr_locomotion");
        core::CVarSystem::find("xr_locomotion")->setFromString("teleport");
        auto settings = app::readViewerSettings();
        REQUIRE(settings.has_value());
        CHECK(settings->vr.locomotion == xr::LocomotionMode::Teleport);
    }

    SUBCASE("Unknown modes are rejected") {
        CVarRestore restore("evaluation_mode");
        core::CVarSystem::find("evaluation_mode")->setFromString("gpu");
        CHECK_FALSE(app::readViewerSettings().has_value());
    }

    SUBCASE("Non-positive sizes are rejected") {
        CVarRestore restore("r_shadow_map_size");
        core::CVarSystem::find("r_shadow_map_size")->setFromString("0");
        CHECK_FALSE(app::readViewerSettings().has_value());
    }
}
