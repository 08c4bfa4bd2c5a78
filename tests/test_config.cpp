/**
 * Jewelry Config Test
 *
 * Parses YAML item configs (both key spellings), checks defaults and
 * verifies that invalid configs are rejected with ConfigError before a
 * session starts.
 *
 * Usage:
 *   build/bin/test_config
 */

#include "config/JewelryConfig.h"
#include "landmarks/LandmarkSet.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <cmath>

using namespace jewelry_tryon;

static const char* kFullConfig =
    "item_id: NK-204\n"
    "name: Pearl Drop\n"
    "type: necklace\n"
    "ar_config:\n"
    "  landmarks: [152, 148, 377]\n"
    "  size: 42\n"
    "  color: \"#F0EAD6\"\n"
    "  position_offset: {x: 4, y: -6}\n"
    "  material: {type: pearl, opacity: 0.7}\n"
    "  physics: {enabled: false, damping: 0.5, stiffness: 0.3}\n"
    "  auto_scale: true\n"
    "calibration:\n"
    "  reference_face_width_px: 200\n"
    "  mirror: false\n";

/**
 * True if validate() or parsing throws ConfigError
 */
template <typename Fn>
static bool rejects(Fn fn) {
    try {
        fn();
    } catch (const ConfigError& e) {
        std::cout << "    rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    bool all_passed = true;

    // Test 1: Full document
    std::cout << "\n--- Test 1: Full config ---" << std::endl;
    {
        JewelryConfig c = JewelryConfig::loadFromString(kFullConfig);
        bool ok = c.item_id == "NK-204" && c.name == "Pearl Drop" &&
                  c.type == JewelryType::Necklace &&
                  c.landmark_indices == std::vector<int>({152, 148, 377}) &&
                  c.size == 42.0 && c.color == "#F0EAD6" &&
                  c.position_offset == Eigen::Vector2d(4.0, -6.0) &&
                  c.material.type == "pearl" && c.material.has_opacity && c.material.opacity == 0.7 &&
                  !c.physics.enabled && c.physics.damping == 0.5 && c.physics.stiffness == 0.3 &&
                  c.auto_scale &&
                  c.calibration.reference_face_width_px == 200.0 && !c.calibration.mirror &&
                  c.calibration.perspective_shift_px == 10.0;
        if (ok) {
            std::cout << "  PASS: every field read" << std::endl;
        } else {
            std::cerr << "  FAIL: parsed config does not match the document" << std::endl;
            all_passed = false;
        }
    }

    // Test 2: Defaults
    std::cout << "\n--- Test 2: Defaults ---" << std::endl;
    {
        JewelryConfig c = JewelryConfig::loadFromString("type: earrings\n");
        bool ok = c.type == JewelryType::Earrings && c.landmark_indices.empty() &&
                  c.size == 30.0 && c.color == "#FFD700" && c.material.type == "gold" &&
                  !c.material.has_opacity && c.physics.enabled &&
                  c.physics.stiffness == 0.15 && c.physics.damping == 0.85 &&
                  !c.auto_scale && c.calibration.mirror;
        std::vector<int> pair = c.landmarkPair();
        if (ok && pair == std::vector<int>({face_mesh::kLeftFaceEdge, face_mesh::kRightFaceEdge})) {
            std::cout << "  PASS: defaults and ear pair 234/454" << std::endl;
        } else {
            std::cerr << "  FAIL: unexpected defaults" << std::endl;
            all_passed = false;
        }

        c.landmark_indices = {132};
        pair = c.landmarkPair();
        if (pair == std::vector<int>({132, face_mesh::kRightFaceEdge})) {
            std::cout << "  PASS: missing second index falls back to 454" << std::endl;
        } else {
            std::cerr << "  FAIL: pair " << pair[0] << ", " << pair[1] << std::endl;
            all_passed = false;
        }
    }

    // Test 3: Client spelling
    std::cout << "\n--- Test 3: camelCase keys ---" << std::endl;
    {
        JewelryConfig c = JewelryConfig::loadFromString(
            "type: Earrings\n"
            "ar_config:\n"
            "  landmarkIndices: [234, 454]\n"
            "  autoScale: true\n"
            "  material: silver\n");
        if (c.landmark_indices.size() == 2 && c.auto_scale && c.material.type == "silver") {
            std::cout << "  PASS: landmarkIndices, autoScale and scalar material" << std::endl;
        } else {
            std::cerr << "  FAIL: camelCase keys not read" << std::endl;
            all_passed = false;
        }
    }

    // Test 4: Parse errors
    std::cout << "\n--- Test 4: Rejected documents ---" << std::endl;
    {
        bool ok = true;
        ok &= rejects([] { JewelryConfig::loadFromString("type: ring\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("type: bracelet\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("type: tiara\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("ar_config: [1, 2\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("ar_config: 5\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("ar_config:\n  size: large\n"); });
        ok &= rejects([] { JewelryConfig::loadFromString("- just\n- a list\n"); });
        if (ok) {
            std::cout << "  PASS: unsupported types and malformed YAML raise ConfigError" << std::endl;
        } else {
            std::cerr << "  FAIL: a bad document was accepted" << std::endl;
            all_passed = false;
        }
    }

    // Test 5: Validation against the landmark index space
    std::cout << "\n--- Test 5: Validation ---" << std::endl;
    {
        JewelryConfig good;
        bool ok = !rejects([&] { good.validate(face_mesh::kLandmarkCountWithIris); });

        JewelryConfig iris = good;
        iris.landmark_indices = {470, 475};
        ok &= !rejects([&] { iris.validate(face_mesh::kLandmarkCountWithIris); });
        ok &= rejects([&] { iris.validate(face_mesh::kLandmarkCount); });

        JewelryConfig c = good;
        c.landmark_indices = {234, 999};
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.landmark_indices = {-1, 454};
        ok &= rejects([&] { c.validate(478); });

        ok &= rejects([&] { good.validate(300); });   // Reference landmarks missing
        ok &= rejects([&] { good.validate(0); });

        c = good;
        c.size = 5.0;
        ok &= rejects([&] { c.validate(478); });
        c.size = 150.0;
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.color = "gold";
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.material.opacity = 1.5;
        c.material.has_opacity = true;
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.physics.stiffness = 0.0;
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.physics.damping = 1.0;
        ok &= rejects([&] { c.validate(478); });

        c = good;
        c.calibration.reference_ear_width = 0.0;
        ok &= rejects([&] { c.validate(478); });

        if (ok) {
            std::cout << "  PASS: out-of-range indices and values rejected" << std::endl;
        } else {
            std::cerr << "  FAIL: validation outcome mismatch" << std::endl;
            all_passed = false;
        }
    }

    // Test 6: Files
    std::cout << "\n--- Test 6: Load from file ---" << std::endl;
    {
        const std::string path = "test_config_item.yaml";
        {
            std::ofstream out(path);
            out << kFullConfig;
        }
        JewelryConfig c = JewelryConfig::loadFromFile(path);
        std::remove(path.c_str());

        bool ok = c.item_id == "NK-204" && c.material.type == "pearl";
        ok &= rejects([] { JewelryConfig::loadFromFile("does/not/exist.yaml"); });
        if (ok) {
            std::cout << "  PASS: file loaded, missing file rejected" << std::endl;
        } else {
            std::cerr << "  FAIL: file loading" << std::endl;
            all_passed = false;
        }
    }

    // Test 7: Colours
    std::cout << "\n--- Test 7: Hex colours ---" << std::endl;
    {
        Eigen::Vector3d rgb;
        bool ok = parseHexColor("#FFF", rgb) && rgb.isApprox(Eigen::Vector3d::Ones());
        ok &= parseHexColor("#FFD700", rgb) && std::abs(rgb.y() - 215.0 / 255.0) < 1e-12 && rgb.z() == 0.0;
        ok &= !parseHexColor("FFD700", rgb);
        ok &= !parseHexColor("#GGGGGG", rgb);
        ok &= !parseHexColor("#FFD70", rgb);
        if (ok) {
            std::cout << "  PASS: #RGB and #RRGGBB parsed, malformed strings rejected" << std::endl;
        } else {
            std::cerr << "  FAIL: colour parsing" << std::endl;
            all_passed = false;
        }
    }

    std::cout << "\n" << (all_passed ? "RESULT: PASS" : "RESULT: FAIL") << std::endl;
    return all_passed ? 0 : 1;
}
