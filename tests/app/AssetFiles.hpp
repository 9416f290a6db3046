#pragma once

#include "mmdv/assets/ModelData.hpp"
#include "mmdv/assets/VmdFile.hpp"
#include "../TestBytes.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace mmdv::test {

    inline void writeFile(const std::filesystem::path& path, const ByteWriter& w) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(w.bytes().data()), static_cast<std::streamsize>(w.size()));
    }

    // "center" slides along x over one second
    inline ByteWriter danceMotion() {
        ByteWriter w;
        w.fixed("Vocaloid Motion Data 0002", assets::kVmdHeaderSize).fixed("Probe", assets::kVmdModelNameSize);
        w.u32(2);
        for (uint32_t frame : {0u, 30u}) {
            w.fixed("center", 15).u32(frame).vec3(static_cast<float>(frame), 0.0f, 0.0f);
            w.f32(0.0f).f32(0.0f).f32(0.0f).f32(1.0f).zeros(64);
        }
        w.u32(0);
        return w;
    }

    inline ByteWriter cameraMotion() {
        ByteWriter w;
        w.fixed("Vocaloid Motion Data 0002", assets::kVmdHeaderSize).fixed("camera", assets::kVmdModelNameSize);
        w.u32(0).u32(0).u32(2);
        for (uint32_t frame : {0u, 60u}) {
            w.u32(frame).f32(-45.0f).vec3(0.0f, 10.0f, 0.0f).vec3(0.0f, 0.0f, 0.0f);
            for (int i = 0; i < 6; ++i) {
                w.u8(20).u8(107).u8(20).u8(107);
            }
            w.u32(30).u8(0);
        }
        return w;
    }

    // One triangle, one material, one bone; the texture file does not exist
    inline ByteWriter singleBoneModel() {
        ByteWriter w;
        w.fixed("PMX ", 4).f32(2.0f).u8(8);
        w.u8(1).u8(0).u8(1).u8(1).u8(1).u8(1).u8(1).u8(1);
        w.text("Probe").text("").text("").text("");
        w.i32(3);
        for (int i = 0; i < 3; ++i) {
            w.vec3(static_cast<float>(i), 0.0f, 0.0f).vec3(0.0f, 0.0f, -1.0f).f32(0.0f).f32(0.0f);
            w.u8(0).u8(0).f32(1.0f);
        }
        w.i32(3).u8(0).u8(1).u8(2);
        w.i32(1).text("missing.bmp");
        w.i32(1).text("body").text("");
        w.f32(1.0f).f32(1.0f).f32(1.0f).f32(1.0f);
        w.vec3(0.0f, 0.0f, 0.0f).f32(5.0f).vec3(0.5f, 0.5f, 0.5f);
        w.u8(0).f32(0.0f).f32(0.0f).f32(0.0f).f32(1.0f).f32(1.0f);
        w.u8(0).u8(0xFF).u8(0).u8(1).u8(0);
        w.text("").i32(3);
        w.i32(1);
        w.text("center").text("").vec3(0.0f, 8.0f, 0.0f).u8(0xFF).i32(0);
        w.u16(assets::bone_flags::Rotatable | assets::bone_flags::Translatable).vec3(0.0f, 1.0f, 0.0f);
        return w;
    }

    // Temporary directory holding dance.vmd, camera.vmd and probe.pmx
    struct StageFiles {
        explicit StageFiles(const std::string& name)
            : dir(std::filesystem::temp_directory_path() / name) {
            std::filesystem::create_directories(dir);
            writeFile(motion(), danceMotion());
            writeFile(camera(), cameraMotion());
            writeFile(model(), singleBoneModel());
        }

        ~StageFiles() {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
        }

        StageFiles(const StageFiles&) = delete;
        StageFiles& operator=(const StageFiles&) = delete;

        [[nodiscard]] std::filesystem::path motion() const { return dir / "dance.vmd"; }
        [[nodiscard]] std::filesystem::path camera() const { return dir / "camera.vmd"; }
        [[nodiscard]] std::filesystem::path model() const { return dir / "probe.pmx"; }

        std::filesystem::path dir;
    };

}
